#pragma once

#include "stockwise/utils/params.hpp"

namespace stockwise::health {

/**
 * @struct HealthScoringConfig
 * @brief Component weights and threshold bands of the new-item health score.
 *
 * The four weights must sum to 1; validate() enforces it.
 */
struct HealthScoringConfig {
	double weight_sales_performance = 0.40;
	double weight_customer_acquisition = 0.30;
	double weight_stock_adequacy = 0.20;
	double weight_growth_trend = 0.10;

	// Actual / target sales ratio bands.
	double target_sales_pct_excellent = 1.20;
	double target_sales_pct_good = 0.95;
	double target_sales_pct_fair = 0.70;
	double target_sales_pct_poor = 0.50;
	double target_sales_pct_critical = 0.30;

	// Unique customer count bands.
	double min_customers_excellent = 50.0;
	double min_customers_good = 30.0;
	double min_customers_fair = 15.0;
	double min_customers_poor = 5.0;
	double customer_retention_ratio = 0.5;
	double customer_retention_bonus = 15.0;

	// Days of stock.
	double dos_optimal_min = 7.0;
	double dos_optimal_max = 60.0;
	double dos_warning_max = 90.0;
	double dos_critical_max = 180.0;

	// Week-over-week growth bands.
	double growth_excellent = 0.20;
	double growth_good = 0.10;
	double growth_fair = 0.00;
	double growth_poor = -0.10;
	double growth_critical = -0.20;

	double launch_max_days = 30.0;
	double learning_max_days = 90.0;
	double graduation_max_days = 180.0;

	double health_critical_max = 30.0;
	double health_at_risk_max = 60.0;
	double health_healthy_min = 80.0;

	/// Floor for the average monthly sales denominator.
	double epsilon = 1e-9;

	/// @throws core::ConfigurationError when the weights do not sum to 1 or a band is out of order.
	void validate() const;

	/// @throws core::ConfigurationError for unknown keys or invalid values.
	static HealthScoringConfig fromParams(const utils::ParamMap &params);

	utils::ParamMap toParams() const;
};

} // namespace stockwise::health
