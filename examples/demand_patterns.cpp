#include "stockwise/core/labels.hpp"
#include "stockwise/demand/demand_pattern_classifier.hpp"

#include <iomanip>
#include <iostream>
#include <vector>

using namespace stockwise;
using namespace stockwise::demand;

int main() {
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║         Demand Pattern Classification (SBC) - Example        ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n\n";

    std::vector<DemandSeries> series = {
        {"HYD-001", "Pump A", {100, 110, 105, 120, 95, 115, 108, 112, 100, 110, 105, 115}},
        {"HYD-002", "Valve B", {50, 45, 55, 48, 52, 49, 51, 50, 48, 52, 49, 51}},
        {"HYD-003", "Filter C", {0, 20, 0, 0, 35, 0, 0, 0, 25, 0, 30, 0}},
        {"HYD-004", "Seal D", {10, 0, 50, 0, 0, 80, 0, 0, 120, 0, 0, 30}},
    };

    DemandPatternClassifier classifier;
    const auto batch = classifier.analyzeAll(series);

    for (const auto& result : batch.results) {
        std::cout << std::string(70, '=') << "\n";
        std::cout << result.item_code << " - " << result.item_name << "\n";
        std::cout << std::string(70, '=') << "\n";

        std::cout << std::fixed << std::setprecision(2);
        std::cout << "Pattern:        " << core::toString(result.classification.pattern)
                  << " (ADI " << result.classification.adi << ", CV2 " << result.classification.cv_squared << ")\n";
        std::cout << "Avg monthly:    " << result.avg_monthly_demand << " (variability "
                  << std::setprecision(1) << result.demand_variability << "%)\n";
        std::cout << std::setprecision(2);
        std::cout << "Forecast 30d:   " << result.forecast.value << " [" << result.forecast.lower << ", "
                  << result.forecast.upper << "] via " << core::toString(result.forecast.method) << "\n";
        std::cout << "Reorder point:  " << result.reorder.reorder_point << " (safety stock "
                  << result.reorder.safety_stock << ")\n";
        std::cout << "EOQ:            " << result.reorder.economic_order_qty << " ("
                  << result.reorder.order_frequency << " orders/year)\n";
        std::cout << "Action:         " << result.recommendation.action << " [priority "
                  << result.recommendation.priority << "]\n";
        for (const auto& line : result.recommendation.guidance) {
            std::cout << "  - " << line << "\n";
        }
        std::cout << "\n";
    }

    for (const auto& error : batch.errors) {
        std::cerr << "Skipped " << error.item_code << ": " << error.message << "\n";
    }

    return batch.errors.empty() ? 0 : 1;
}
