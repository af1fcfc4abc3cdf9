#pragma once

#include "stockwise/core/item_metrics.hpp"
#include "stockwise/core/labels.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace stockwise::demand {

inline constexpr std::size_t kMonthsPerYear = 12;

/// Twelve monthly demand quantities, oldest first.
using MonthlySeries = std::array<double, kMonthsPerYear>;

/**
 * @brief Validates and converts a monthly series.
 * @throws core::DataError unless @p values has exactly 12 finite, non-negative entries.
 */
MonthlySeries toMonthlySeries(const std::vector<double> &values);

/// ADI, CV^2 and the SBC label derived from them.
struct PatternClassification {
	double adi = 0.0;
	double cv_squared = 0.0;
	core::DemandPattern pattern = core::DemandPattern::Lumpy;
};

struct DemandForecast {
	double value = 0.0;
	double lower = 0.0;
	double upper = 0.0;
	core::ForecastMethod method = core::ForecastMethod::MovingAverage;
};

struct ReorderParameters {
	double avg_daily_demand = 0.0;
	double demand_during_lead_time = 0.0;
	double z_score = 0.0;
	double safety_stock = 0.0;
	double reorder_point = 0.0;
	double economic_order_qty = 0.0;
	double recommended_order_qty = 0.0;
	double order_frequency = 0.0; ///< Orders per year.
};

struct PatternRecommendation {
	std::string action;
	int priority = 5;
	std::vector<std::string> guidance;
};

/**
 * @struct DemandPatternResult
 * @brief Full demand analysis of one item: SBC metrics, summary statistics,
 * the 30-day forecast, reorder parameters and the ordering recommendation.
 */
struct DemandPatternResult {
	std::string item_code;
	std::string item_name;

	PatternClassification classification;

	double avg_monthly_demand = 0.0;
	double std_dev_demand = 0.0;
	double demand_variability = 0.0; ///< std / mean x 100.

	DemandForecast forecast;
	ReorderParameters reorder;
	PatternRecommendation recommendation;
};

/// Monthly demand history of one item as supplied by the caller.
struct DemandSeries {
	std::string item_code;
	std::string item_name;
	std::vector<double> monthly;
};

struct DemandBatch {
	std::vector<DemandPatternResult> results;
	std::vector<core::ItemError> errors;
};

} // namespace stockwise::demand
