#pragma once

#include "stockwise/utils/params.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace stockwise::classification {

/**
 * @struct RuleThresholds
 * @brief Thresholds of the ordered business-rule list. Overridden as a unit.
 */
struct RuleThresholds {
	double new_item_max_age_days = 90.0;
	double dead_stock_min_days_no_sales = 180.0;
	double dead_stock_max_annual_sales = 10.0;
	double fast_min_sales_velocity = 2.7;
	double fast_min_turnover_ratio = 0.7;
	double slow_max_sales_velocity = 0.5;
	double slow_max_days_since_last_sale = 60.0;
};

/**
 * @struct ClassificationConfig
 * @brief Item classifier configuration with the documented default thresholds.
 */
struct ClassificationConfig {
	RuleThresholds rules;

	/// Cluster mean velocity above this (and not FAST) is MEDIUM.
	double medium_min_cluster_velocity = 1.0;

	double dbscan_eps = 0.5;
	std::size_t dbscan_min_samples = 3;
	double dbscan_outlier_dead_days = 150.0;
	double dbscan_outlier_fast_multiplier = 1.5;

	std::size_t kmeans_n_clusters = 3;
	std::size_t kmeans_max_iterations = 300;
	std::size_t kmeans_n_init = 10;
	std::uint32_t kmeans_seed = 42;

	double holding_cost_pct_per_year = 0.20;
	double default_consistency_score = 50.0;

	double hybrid_rule_weight = 0.5;
	double hybrid_dbscan_weight = 0.35;
	double hybrid_fast_bonus = 0.15;
	double hybrid_rule_accept_confidence = 0.90;
	/// 0 keeps the per-item singleton DBSCAN vote; 1 votes with the full-batch DBSCAN label.
	bool hybrid_full_batch_dbscan = false;

	std::size_t worker_threads = 1;

	std::string model_version = "1.0.0";

	/// @throws core::ConfigurationError when a value is out of range.
	void validate() const;

	/**
	 * @brief Defaults overridden by @p params.
	 * @throws core::ConfigurationError for unknown keys or invalid values.
	 */
	static ClassificationConfig fromParams(const utils::ParamMap &params);

	utils::ParamMap toParams() const;
};

} // namespace stockwise::classification
