#pragma once

#include "stockwise/core/labels.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace stockwise::core {

/**
 * @struct ItemMetrics
 * @brief Raw per-item inventory metrics fed to the item classifier.
 *
 * Required numeric fields are optional so that records with gaps can be
 * represented; the feature preparer substitutes 0 and logs a warning.
 */
struct ItemMetrics {
	std::string item_code;
	std::string item_name;
	std::string uom;
	std::optional<std::string> created_date;

	std::optional<double> annual_sales_qty;
	std::optional<double> annual_sales_value;
	std::optional<double> current_stock;
	std::optional<double> stock_value;
	std::optional<double> item_age_days;
	std::optional<double> days_since_last_sale;

	// Precomputed features; derived when absent.
	std::optional<double> sales_velocity;
	std::optional<double> turnover_ratio;
	std::optional<double> consistency_score;
	std::optional<double> demand_variability;
};

/**
 * @struct PreparedItem
 * @brief Cleaned item with every feature filled in.
 */
struct PreparedItem {
	std::string item_code;
	std::string item_name;
	std::string uom;
	std::string created_date;

	double annual_sales_qty = 0.0;
	double annual_sales_value = 0.0;
	double current_stock = 0.0;
	double stock_value = 0.0;
	double item_age_days = 0.0;
	double days_since_last_sale = 0.0;

	double sales_velocity = 0.0;
	double turnover_ratio = 0.0;
	double consistency_score = 0.0;
	double demand_variability = 0.0;

	/// Items with no positive annual sales are excluded from clustering strategies.
	bool isMlEligible() const noexcept {
		return annual_sales_qty > 0.0;
	}
};

/**
 * @struct ClassificationResult
 * @brief Enriched classification of one item. Produced fresh on every call.
 */
struct ClassificationResult {
	std::string item_code;
	std::string item_name;
	std::string uom;

	ItemClass classification = ItemClass::Medium;
	int confidence = 0; ///< Percentage in [0, 100].
	ClassificationMethod method = ClassificationMethod::RuleBased;
	std::string reason;

	double annual_sales_qty = 0.0;
	double annual_sales_value = 0.0;
	double sales_velocity = 0.0;
	double turnover_ratio = 0.0;
	double holding_cost_annually = 0.0;
	double current_stock = 0.0;
	double stock_value = 0.0;
	double days_of_stock = 0.0;
	AbcCategory abc_category = AbcCategory::C;
	double consistency_score = 0.0;
	double demand_variability = 0.0;
	double days_since_last_sale = 0.0;
	double item_age_days = 0.0;
	DormancyStatus dormancy_status = DormancyStatus::Active;
	LifeStage new_item_status = LifeStage::Established;

	InventoryAction recommended_action = InventoryAction::MaintainStock;
	int action_priority = 1;
	double expected_impact = 0.0;

	std::string model_version;
};

/// An item dropped from a batch, with the reason it was dropped.
struct ItemError {
	std::string item_code;
	std::string message;
};

/**
 * @struct ClassificationBatch
 * @brief Output of one classify call: results in input order plus the
 * bookkeeping a caller needs to account for items that produced no result.
 */
struct ClassificationBatch {
	ClassificationMethod method = ClassificationMethod::RuleBased;
	std::vector<ClassificationResult> results;

	/// ML-ineligible items left out of a clustering or hybrid run.
	std::size_t excluded = 0;
	/// Items whose preparation or classification threw.
	std::vector<ItemError> errors;
	/// Items classified RULE_BASED because the requested model could not run.
	std::size_t fallbacks = 0;

	/// Mean silhouette of the k-means partition, when it is defined.
	std::optional<double> silhouette;

	std::size_t errorCount() const noexcept {
		return errors.size();
	}
	std::size_t skipped() const noexcept {
		return excluded + errors.size();
	}
};

} // namespace stockwise::core
