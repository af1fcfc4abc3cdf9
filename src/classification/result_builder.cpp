#include "stockwise/classification/result_builder.hpp"

#include "stockwise/utils/stats.hpp"

#include <cmath>

using stockwise::core::AbcCategory;
using stockwise::core::ClassificationResult;
using stockwise::core::DormancyStatus;
using stockwise::core::InventoryAction;
using stockwise::core::ItemClass;
using stockwise::core::LifeStage;
using stockwise::core::PreparedItem;

namespace stockwise::classification {

namespace {

constexpr double kAbcAThreshold = 100000.0;
constexpr double kAbcBThreshold = 20000.0;
constexpr double kOverstockDays = 180.0;

} // namespace

ResultBuilder::ResultBuilder(const ClassificationConfig &config)
    : holding_cost_pct_(config.holding_cost_pct_per_year), model_version_(config.model_version) {
}

double ResultBuilder::holdingCost(const PreparedItem &item) const {
	return item.stock_value * holding_cost_pct_;
}

double ResultBuilder::daysOfStock(const PreparedItem &item) {
	if (item.sales_velocity > 0.0) {
		return item.current_stock / item.sales_velocity;
	}
	return 0.0;
}

AbcCategory ResultBuilder::abcCategory(double annual_sales_value) {
	if (annual_sales_value > kAbcAThreshold) {
		return AbcCategory::A;
	}
	if (annual_sales_value > kAbcBThreshold) {
		return AbcCategory::B;
	}
	return AbcCategory::C;
}

DormancyStatus ResultBuilder::dormancyStatus(double days_since_last_sale) {
	if (days_since_last_sale < 90.0) {
		return DormancyStatus::Active;
	}
	if (days_since_last_sale < 180.0) {
		return DormancyStatus::Sleepy;
	}
	if (days_since_last_sale < 365.0) {
		return DormancyStatus::Dormant;
	}
	return DormancyStatus::Dead;
}

LifeStage ResultBuilder::newItemStatus(double item_age_days) {
	if (item_age_days < 30.0) {
		return LifeStage::Launch;
	}
	if (item_age_days < 90.0) {
		return LifeStage::Learning;
	}
	if (item_age_days < 180.0) {
		return LifeStage::Graduation;
	}
	return LifeStage::Established;
}

int ResultBuilder::reportedConfidence(double confidence) {
	if (!std::isfinite(confidence)) {
		return 0;
	}
	// The epsilon keeps 0.99 * 100 from truncating to 98.
	return static_cast<int>(utils::clamp(confidence, 0.0, 100.0) + 1e-9);
}

ActionRecommendation ResultBuilder::recommend(const PreparedItem &item, ItemClass label) const {
	switch (label) {
	case ItemClass::Fast:
		return {InventoryAction::IncreaseStock, 8, item.annual_sales_value * 0.10};
	case ItemClass::Slow:
		if (daysOfStock(item) > kOverstockDays) {
			return {InventoryAction::ReduceStock, 5, -holdingCost(item) * 0.5};
		}
		return {InventoryAction::MaintainStock, 2, 0.0};
	case ItemClass::DeadStock:
		return {InventoryAction::Liquidation, 10, item.stock_value * 0.30};
	case ItemClass::NewItem:
		return {InventoryAction::MarketMore, 7, item.annual_sales_value * 0.20};
	case ItemClass::Medium:
		break;
	}
	return {InventoryAction::MaintainStock, 1, 0.0};
}

ClassificationResult ResultBuilder::build(const PreparedItem &item, const Classification &classification) const {
	ClassificationResult result;
	result.item_code = item.item_code;
	result.item_name = item.item_name;
	result.uom = item.uom;

	result.classification = classification.label;
	result.confidence = reportedConfidence(classification.confidence);
	result.method = classification.method;
	result.reason = classification.reason;

	result.annual_sales_qty = item.annual_sales_qty;
	result.annual_sales_value = item.annual_sales_value;
	result.sales_velocity = item.sales_velocity;
	result.turnover_ratio = item.turnover_ratio;
	result.holding_cost_annually = holdingCost(item);
	result.current_stock = item.current_stock;
	result.stock_value = item.stock_value;
	result.days_of_stock = daysOfStock(item);
	result.abc_category = abcCategory(item.annual_sales_value);
	result.consistency_score = item.consistency_score;
	result.demand_variability = item.demand_variability;
	result.days_since_last_sale = item.days_since_last_sale;
	result.item_age_days = item.item_age_days;
	result.dormancy_status = dormancyStatus(item.days_since_last_sale);
	result.new_item_status = newItemStatus(item.item_age_days);

	const auto recommendation = recommend(item, classification.label);
	result.recommended_action = recommendation.action;
	result.action_priority = recommendation.priority;
	result.expected_impact = recommendation.impact;

	result.model_version = model_version_;
	return result;
}

} // namespace stockwise::classification
