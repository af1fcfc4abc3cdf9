#include "stockwise/classification/classification_config.hpp"

#include "stockwise/core/errors.hpp"

using stockwise::core::ConfigurationError;
using stockwise::utils::ParamMap;
using stockwise::utils::ParamReader;
using stockwise::utils::requireInRange;
using stockwise::utils::requirePositive;

namespace stockwise::classification {

void ClassificationConfig::validate() const {
	requirePositive("new_item_max_age_days", rules.new_item_max_age_days);
	requirePositive("dead_stock_min_days_no_sales", rules.dead_stock_min_days_no_sales);
	requireInRange("dead_stock_max_annual_sales", rules.dead_stock_max_annual_sales, 0.0, 1e12);
	requirePositive("fast_min_sales_velocity", rules.fast_min_sales_velocity);
	requireInRange("fast_min_turnover_ratio", rules.fast_min_turnover_ratio, 0.0, 1e12);
	requireInRange("slow_max_sales_velocity", rules.slow_max_sales_velocity, 0.0, 1e12);
	requirePositive("slow_max_days_since_last_sale", rules.slow_max_days_since_last_sale);
	requireInRange("medium_min_cluster_velocity", medium_min_cluster_velocity, 0.0, 1e12);

	requirePositive("dbscan_eps", dbscan_eps);
	if (dbscan_min_samples < 1) {
		throw ConfigurationError("Parameter 'dbscan_min_samples' must be at least 1");
	}
	requireInRange("dbscan_outlier_dead_days", dbscan_outlier_dead_days, 0.0, 1e12);
	requirePositive("dbscan_outlier_fast_multiplier", dbscan_outlier_fast_multiplier);

	if (kmeans_n_clusters < 2) {
		throw ConfigurationError("Parameter 'kmeans_n_clusters' must be at least 2");
	}
	if (kmeans_max_iterations < 1 || kmeans_n_init < 1) {
		throw ConfigurationError("Parameters 'kmeans_max_iterations' and 'kmeans_n_init' must be at least 1");
	}

	requireInRange("holding_cost_pct_per_year", holding_cost_pct_per_year, 0.0, 1.0);
	requireInRange("default_consistency_score", default_consistency_score, 0.0, 100.0);

	requireInRange("hybrid_rule_weight", hybrid_rule_weight, 0.0, 1.0);
	requireInRange("hybrid_dbscan_weight", hybrid_dbscan_weight, 0.0, 1.0);
	requireInRange("hybrid_fast_bonus", hybrid_fast_bonus, 0.0, 1.0);
	requireInRange("hybrid_rule_accept_confidence", hybrid_rule_accept_confidence, 0.0, 1.0);

	if (worker_threads < 1) {
		throw ConfigurationError("Parameter 'worker_threads' must be at least 1");
	}
}

ClassificationConfig ClassificationConfig::fromParams(const ParamMap &params) {
	ClassificationConfig config;
	ParamReader reader(params);

	reader.read("new_item_max_age_days", config.rules.new_item_max_age_days);
	reader.read("dead_stock_min_days_no_sales", config.rules.dead_stock_min_days_no_sales);
	reader.read("dead_stock_max_annual_sales", config.rules.dead_stock_max_annual_sales);
	reader.read("fast_min_sales_velocity", config.rules.fast_min_sales_velocity);
	reader.read("fast_min_turnover_ratio", config.rules.fast_min_turnover_ratio);
	reader.read("slow_max_sales_velocity", config.rules.slow_max_sales_velocity);
	reader.read("slow_max_days_since_last_sale", config.rules.slow_max_days_since_last_sale);
	reader.read("medium_min_cluster_velocity", config.medium_min_cluster_velocity);

	reader.read("dbscan_eps", config.dbscan_eps);
	reader.read("dbscan_min_samples", config.dbscan_min_samples);
	reader.read("dbscan_outlier_dead_days", config.dbscan_outlier_dead_days);
	reader.read("dbscan_outlier_fast_multiplier", config.dbscan_outlier_fast_multiplier);

	reader.read("kmeans_n_clusters", config.kmeans_n_clusters);
	reader.read("kmeans_max_iterations", config.kmeans_max_iterations);
	reader.read("kmeans_n_init", config.kmeans_n_init);
	reader.read("kmeans_seed", config.kmeans_seed);

	reader.read("holding_cost_pct_per_year", config.holding_cost_pct_per_year);
	reader.read("default_consistency_score", config.default_consistency_score);

	reader.read("hybrid_rule_weight", config.hybrid_rule_weight);
	reader.read("hybrid_dbscan_weight", config.hybrid_dbscan_weight);
	reader.read("hybrid_fast_bonus", config.hybrid_fast_bonus);
	reader.read("hybrid_rule_accept_confidence", config.hybrid_rule_accept_confidence);
	reader.read("hybrid_full_batch_dbscan", config.hybrid_full_batch_dbscan);

	reader.read("worker_threads", config.worker_threads);

	reader.rejectUnknown("ItemClassifier");
	config.validate();
	return config;
}

ParamMap ClassificationConfig::toParams() const {
	return {
	    {"new_item_max_age_days", rules.new_item_max_age_days},
	    {"dead_stock_min_days_no_sales", rules.dead_stock_min_days_no_sales},
	    {"dead_stock_max_annual_sales", rules.dead_stock_max_annual_sales},
	    {"fast_min_sales_velocity", rules.fast_min_sales_velocity},
	    {"fast_min_turnover_ratio", rules.fast_min_turnover_ratio},
	    {"slow_max_sales_velocity", rules.slow_max_sales_velocity},
	    {"slow_max_days_since_last_sale", rules.slow_max_days_since_last_sale},
	    {"medium_min_cluster_velocity", medium_min_cluster_velocity},
	    {"dbscan_eps", dbscan_eps},
	    {"dbscan_min_samples", static_cast<double>(dbscan_min_samples)},
	    {"dbscan_outlier_dead_days", dbscan_outlier_dead_days},
	    {"dbscan_outlier_fast_multiplier", dbscan_outlier_fast_multiplier},
	    {"kmeans_n_clusters", static_cast<double>(kmeans_n_clusters)},
	    {"kmeans_max_iterations", static_cast<double>(kmeans_max_iterations)},
	    {"kmeans_n_init", static_cast<double>(kmeans_n_init)},
	    {"kmeans_seed", static_cast<double>(kmeans_seed)},
	    {"holding_cost_pct_per_year", holding_cost_pct_per_year},
	    {"default_consistency_score", default_consistency_score},
	    {"hybrid_rule_weight", hybrid_rule_weight},
	    {"hybrid_dbscan_weight", hybrid_dbscan_weight},
	    {"hybrid_fast_bonus", hybrid_fast_bonus},
	    {"hybrid_rule_accept_confidence", hybrid_rule_accept_confidence},
	    {"hybrid_full_batch_dbscan", hybrid_full_batch_dbscan ? 1.0 : 0.0},
	    {"worker_threads", static_cast<double>(worker_threads)},
	};
}

} // namespace stockwise::classification
