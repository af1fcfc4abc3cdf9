#include "stockwise/health/health_config.hpp"

#include "stockwise/core/errors.hpp"

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

using stockwise::core::ConfigurationError;
using stockwise::utils::ParamMap;
using stockwise::utils::ParamReader;
using stockwise::utils::requireInRange;
using stockwise::utils::requirePositive;

namespace stockwise::health {

namespace {

constexpr double kWeightTolerance = 1e-6;

void requireDescending(const std::string &group, const std::vector<double> &bands) {
	for (std::size_t i = 1; i < bands.size(); ++i) {
		if (!(bands[i] < bands[i - 1])) {
			throw ConfigurationError("Health bands for '" + group + "' must be strictly decreasing");
		}
	}
}

} // namespace

void HealthScoringConfig::validate() const {
	requireInRange("weight_sales_performance", weight_sales_performance, 0.0, 1.0);
	requireInRange("weight_customer_acquisition", weight_customer_acquisition, 0.0, 1.0);
	requireInRange("weight_stock_adequacy", weight_stock_adequacy, 0.0, 1.0);
	requireInRange("weight_growth_trend", weight_growth_trend, 0.0, 1.0);

	const double total =
	    weight_sales_performance + weight_customer_acquisition + weight_stock_adequacy + weight_growth_trend;
	if (std::abs(total - 1.0) > kWeightTolerance) {
		std::ostringstream message;
		message << "Health score weights must sum to 1.0, got " << total;
		throw ConfigurationError(message.str());
	}

	requireDescending("target_sales_pct", {target_sales_pct_excellent, target_sales_pct_good, target_sales_pct_fair,
	                                       target_sales_pct_poor, target_sales_pct_critical});
	requireDescending("min_customers",
	                  {min_customers_excellent, min_customers_good, min_customers_fair, min_customers_poor});
	requireInRange("customer_retention_ratio", customer_retention_ratio, 0.0, 1.0);
	requireInRange("customer_retention_bonus", customer_retention_bonus, 0.0, 100.0);

	requirePositive("dos_optimal_min", dos_optimal_min);
	requireDescending("dos", {dos_critical_max, dos_warning_max, dos_optimal_max, dos_optimal_min});
	requireDescending("growth", {growth_excellent, growth_good, growth_fair, growth_poor, growth_critical});
	requireDescending("life_stage", {graduation_max_days, learning_max_days, launch_max_days});
	requireDescending("health_status", {health_healthy_min, health_at_risk_max, health_critical_max});
	requirePositive("epsilon", epsilon);
}

HealthScoringConfig HealthScoringConfig::fromParams(const ParamMap &params) {
	HealthScoringConfig config;
	ParamReader reader(params);

	reader.read("weight_sales_performance", config.weight_sales_performance);
	reader.read("weight_customer_acquisition", config.weight_customer_acquisition);
	reader.read("weight_stock_adequacy", config.weight_stock_adequacy);
	reader.read("weight_growth_trend", config.weight_growth_trend);

	reader.read("target_sales_pct_excellent", config.target_sales_pct_excellent);
	reader.read("target_sales_pct_good", config.target_sales_pct_good);
	reader.read("target_sales_pct_fair", config.target_sales_pct_fair);
	reader.read("target_sales_pct_poor", config.target_sales_pct_poor);
	reader.read("target_sales_pct_critical", config.target_sales_pct_critical);

	reader.read("min_customers_excellent", config.min_customers_excellent);
	reader.read("min_customers_good", config.min_customers_good);
	reader.read("min_customers_fair", config.min_customers_fair);
	reader.read("min_customers_poor", config.min_customers_poor);
	reader.read("customer_retention_ratio", config.customer_retention_ratio);
	reader.read("customer_retention_bonus", config.customer_retention_bonus);

	reader.read("dos_optimal_min", config.dos_optimal_min);
	reader.read("dos_optimal_max", config.dos_optimal_max);
	reader.read("dos_warning_max", config.dos_warning_max);
	reader.read("dos_critical_max", config.dos_critical_max);

	reader.read("growth_excellent", config.growth_excellent);
	reader.read("growth_good", config.growth_good);
	reader.read("growth_fair", config.growth_fair);
	reader.read("growth_poor", config.growth_poor);
	reader.read("growth_critical", config.growth_critical);

	reader.read("launch_max_days", config.launch_max_days);
	reader.read("learning_max_days", config.learning_max_days);
	reader.read("graduation_max_days", config.graduation_max_days);

	reader.read("health_critical_max", config.health_critical_max);
	reader.read("health_at_risk_max", config.health_at_risk_max);
	reader.read("health_healthy_min", config.health_healthy_min);

	reader.read("epsilon", config.epsilon);

	reader.rejectUnknown("HealthScorer");
	config.validate();
	return config;
}

ParamMap HealthScoringConfig::toParams() const {
	return {
	    {"weight_sales_performance", weight_sales_performance},
	    {"weight_customer_acquisition", weight_customer_acquisition},
	    {"weight_stock_adequacy", weight_stock_adequacy},
	    {"weight_growth_trend", weight_growth_trend},
	    {"target_sales_pct_excellent", target_sales_pct_excellent},
	    {"target_sales_pct_good", target_sales_pct_good},
	    {"target_sales_pct_fair", target_sales_pct_fair},
	    {"target_sales_pct_poor", target_sales_pct_poor},
	    {"target_sales_pct_critical", target_sales_pct_critical},
	    {"min_customers_excellent", min_customers_excellent},
	    {"min_customers_good", min_customers_good},
	    {"min_customers_fair", min_customers_fair},
	    {"min_customers_poor", min_customers_poor},
	    {"customer_retention_ratio", customer_retention_ratio},
	    {"customer_retention_bonus", customer_retention_bonus},
	    {"dos_optimal_min", dos_optimal_min},
	    {"dos_optimal_max", dos_optimal_max},
	    {"dos_warning_max", dos_warning_max},
	    {"dos_critical_max", dos_critical_max},
	    {"growth_excellent", growth_excellent},
	    {"growth_good", growth_good},
	    {"growth_fair", growth_fair},
	    {"growth_poor", growth_poor},
	    {"growth_critical", growth_critical},
	    {"launch_max_days", launch_max_days},
	    {"learning_max_days", learning_max_days},
	    {"graduation_max_days", graduation_max_days},
	    {"health_critical_max", health_critical_max},
	    {"health_at_risk_max", health_at_risk_max},
	    {"health_healthy_min", health_healthy_min},
	    {"epsilon", epsilon},
	};
}

} // namespace stockwise::health
