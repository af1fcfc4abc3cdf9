#pragma once

#include "stockwise/classification/classification_config.hpp"
#include "stockwise/classification/strategy.hpp"
#include "stockwise/core/item_metrics.hpp"

namespace stockwise::classification {

/// Action, priority (1-10) and expected monetary impact for a classification.
struct ActionRecommendation {
	core::InventoryAction action = core::InventoryAction::MaintainStock;
	int priority = 1;
	double impact = 0.0;
};

/**
 * @class ResultBuilder
 * @brief Turns a strategy label into a full ClassificationResult: holding
 * cost, days of stock, ABC category, dormancy, new-item status and the
 * recommended action.
 */
class ResultBuilder {
public:
	explicit ResultBuilder(const ClassificationConfig &config);

	core::ClassificationResult build(const core::PreparedItem &item, const Classification &classification) const;

	ActionRecommendation recommend(const core::PreparedItem &item, core::ItemClass label) const;

	double holdingCost(const core::PreparedItem &item) const;

	/// current stock / daily velocity; 0 without sales velocity.
	static double daysOfStock(const core::PreparedItem &item);
	static core::AbcCategory abcCategory(double annual_sales_value);
	static core::DormancyStatus dormancyStatus(double days_since_last_sale);
	static core::LifeStage newItemStatus(double item_age_days);

	/// Truncates a percentage to an integer in [0, 100].
	static int reportedConfidence(double confidence);

private:
	double holding_cost_pct_;
	std::string model_version_;
};

} // namespace stockwise::classification
