#pragma once

#include "stockwise/core/item_metrics.hpp"
#include "stockwise/core/labels.hpp"

#include <string>
#include <vector>

namespace stockwise::health {

/**
 * @struct NewItemMetrics
 * @brief Launch metrics of a recently introduced item.
 */
struct NewItemMetrics {
	std::string item_code;
	std::string item_name;
	double item_age_days = 0.0;

	double actual_sales_qty = 0.0;
	double target_sales_qty = 0.0;

	int unique_customers = 0;
	int repeat_customers = 0;

	double current_stock = 0.0;
	double stock_value = 0.0;
	double avg_monthly_sales = 0.0;

	double sales_last_week = 0.0;
	double sales_prior_week = 0.0;
};

/// One banded sub-score. `value` feeds the composite; `score` is the reported integer.
struct ComponentScore {
	double value = 0.0;
	int score = 0;
	std::string reason;
};

struct HealthRecommendation {
	core::HealthAction action = core::HealthAction::MaintainCurrentStrategy;
	int priority = 2;
	std::vector<std::string> key_metrics;
	std::vector<std::string> warning_flags;
};

/**
 * @struct HealthScoreResult
 * @brief Composite health score of a new item with its components, derived
 * metrics and the recommended action.
 */
struct HealthScoreResult {
	std::string item_code;
	std::string item_name;

	int health_score = 0; ///< In [0, 100].
	core::HealthStatus health_status = core::HealthStatus::Critical;
	core::LifeStage life_stage = core::LifeStage::Launch;
	double item_age_days = 0.0;

	ComponentScore sales_performance;
	ComponentScore customer_acquisition;
	ComponentScore stock_adequacy;
	ComponentScore growth_trend;

	int total_customers = 0;
	double repeat_customers_pct = 0.0;
	double sales_vs_target_pct = 0.0;
	double stock_adequacy_dos = 0.0;
	double growth_trend_pct = 0.0; ///< Week-over-week growth as a fraction.
	double stock_value = 0.0;

	HealthRecommendation recommendation;
};

struct HealthBatch {
	std::vector<HealthScoreResult> results;
	std::vector<core::ItemError> errors;
};

} // namespace stockwise::health
