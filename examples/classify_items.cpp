#include "stockwise/classification/item_classifier.hpp"
#include "stockwise/core/errors.hpp"
#include "stockwise/core/labels.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace stockwise;
using namespace stockwise::core;

// Helper to build an item record with precomputed features
ItemMetrics createItem(const std::string& code, const std::string& name, double annual_qty, double annual_value,
                       double stock, double stock_value, double age, double days_since_sale,
                       double velocity, double turnover, double consistency, double variability) {
    ItemMetrics item;
    item.item_code = code;
    item.item_name = name;
    item.uom = "PCS";
    item.annual_sales_qty = annual_qty;
    item.annual_sales_value = annual_value;
    item.current_stock = stock;
    item.stock_value = stock_value;
    item.item_age_days = age;
    item.days_since_last_sale = days_since_sale;
    item.sales_velocity = velocity;
    item.turnover_ratio = turnover;
    item.consistency_score = consistency;
    item.demand_variability = variability;
    return item;
}

void printBatch(const ClassificationBatch& batch) {
    std::cout << std::left << std::setw(10) << "Item" << std::setw(12) << "Class" << std::setw(8) << "Conf"
              << std::setw(18) << "Action" << std::setw(6) << "Prio" << "Reason\n";
    std::cout << std::string(90, '-') << "\n";
    for (const auto& result : batch.results) {
        std::cout << std::left << std::setw(10) << result.item_code << std::setw(12) << toString(result.classification)
                  << std::setw(8) << (std::to_string(result.confidence) + "%") << std::setw(18)
                  << toString(result.recommended_action) << std::setw(6) << result.action_priority << result.reason
                  << "\n";
    }
    std::cout << "\nExcluded: " << batch.excluded << "  Errors: " << batch.errorCount()
              << "  Fallbacks: " << batch.fallbacks;
    if (batch.silhouette) {
        std::cout << "  Silhouette: " << std::fixed << std::setprecision(3) << *batch.silhouette;
    }
    std::cout << "\n";
}

int main() {
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║           Inventory Item Classification - Example            ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n\n";

    std::vector<ItemMetrics> items = {
        createItem("HYD-001", "Pump A", 2500, 125000, 200, 10000, 400, 2, 6.8, 12.5, 85, 15),
        createItem("HYD-002", "Valve B", 150, 15000, 100, 10000, 200, 60, 0.41, 1.5, 70, 25),
        createItem("HYD-003", "Filter C", 800, 24000, 150, 4500, 600, 200, 2.19, 5.3, 50, 45),
        createItem("HYD-004", "Seal D", 50, 5000, 500, 25000, 30, 350, 0.14, 0.1, 20, 80),
        createItem("HYD-005", "Gasket E", 1200, 36000, 300, 9000, 25, 1, 3.29, 4.0, 80, 20),
    };

    classification::ItemClassifier classifier;

    for (const std::string method : {"rule_based", "dbscan", "kmeans", "hybrid"}) {
        std::cout << "\n" << std::string(70, '=') << "\n";
        std::cout << "Method: " << method << "\n";
        std::cout << std::string(70, '=') << "\n\n";

        try {
            printBatch(classifier.classify(items, method));
        } catch (const ConfigurationError& e) {
            std::cerr << "Configuration error: " << e.what() << "\n";
            return 1;
        }
    }

    return 0;
}
