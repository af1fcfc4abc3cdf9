#include "stockwise/core/labels.hpp"
#include "stockwise/health/health_scorer.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace stockwise;
using namespace stockwise::health;

NewItemMetrics createNewItem(const std::string& code, const std::string& name, double age, double actual,
                             double target, int unique, int repeat, double stock, double stock_value,
                             double avg_monthly, double last_week, double prior_week) {
    NewItemMetrics item;
    item.item_code = code;
    item.item_name = name;
    item.item_age_days = age;
    item.actual_sales_qty = actual;
    item.target_sales_qty = target;
    item.unique_customers = unique;
    item.repeat_customers = repeat;
    item.current_stock = stock;
    item.stock_value = stock_value;
    item.avg_monthly_sales = avg_monthly;
    item.sales_last_week = last_week;
    item.sales_prior_week = prior_week;
    return item;
}

void printComponent(const std::string& label, const ComponentScore& component) {
    std::cout << "  " << std::left << std::setw(10) << label << std::right << std::setw(4) << component.score
              << "/100 - " << component.reason << "\n";
}

int main() {
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║              New Item Health Scoring - Example               ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n\n";

    std::vector<NewItemMetrics> items = {
        createNewItem("HYD-001", "Pump A", 15, 500, 400, 35, 15, 200, 50000, 150, 60, 55),
        createNewItem("HYD-002", "Valve B", 45, 280, 350, 22, 5, 350, 35000, 100, 20, 35),
        createNewItem("HYD-003", "Filter C", 120, 400, 500, 45, 20, 800, 80000, 200, 50, 48),
        createNewItem("HYD-004", "Seal D", 200, 800, 1000, 65, 45, 1200, 120000, 300, 120, 110),
    };

    HealthScorer scorer;
    const auto batch = scorer.scoreAll(items);

    for (const auto& result : batch.results) {
        std::cout << std::string(70, '=') << "\n";
        std::cout << result.item_code << " - " << result.item_name << " (" << std::fixed << std::setprecision(0)
                  << result.item_age_days << " days, " << core::toString(result.life_stage) << ")\n";
        std::cout << std::string(70, '=') << "\n";
        std::cout << "Health score: " << result.health_score << "/100 [" << core::toString(result.health_status)
                  << "]\n";

        printComponent("Sales", result.sales_performance);
        printComponent("Customers", result.customer_acquisition);
        printComponent("Stock", result.stock_adequacy);
        printComponent("Growth", result.growth_trend);

        std::cout << "Action: " << core::toString(result.recommendation.action) << " [priority "
                  << result.recommendation.priority << "]\n";
        for (const auto& metric : result.recommendation.key_metrics) {
            std::cout << "  - " << metric << "\n";
        }
        for (const auto& warning : result.recommendation.warning_flags) {
            std::cout << "  ! " << warning << "\n";
        }
        std::cout << "\n";
    }

    for (const auto& error : batch.errors) {
        std::cerr << "Skipped " << error.item_code << ": " << error.message << "\n";
    }

    return batch.errors.empty() ? 0 : 1;
}
