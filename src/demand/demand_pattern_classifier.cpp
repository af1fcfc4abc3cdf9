#include "stockwise/demand/demand_pattern_classifier.hpp"

#include "stockwise/core/errors.hpp"
#include "stockwise/demand/intermittent.hpp"
#include "stockwise/utils/logging.hpp"
#include "stockwise/utils/stats.hpp"

#include <algorithm>
#include <cmath>

using stockwise::core::DemandPattern;
using stockwise::core::ForecastMethod;

namespace stockwise::demand {

namespace {

constexpr double kDaysPerMonth = 30.0;

std::vector<double> toVector(const MonthlySeries &monthly) {
	return std::vector<double>(monthly.begin(), monthly.end());
}

// Mean of the months with demand; a series without demand counts as 1 per month.
double averageMonthlyDemand(const std::vector<double> &values) {
	const auto demand = intermittent::extractDemand(values);
	return demand.empty() ? 1.0 : utils::mean(demand);
}

} // namespace

DemandPatternClassifier::DemandPatternClassifier(DemandPatternConfig config) : config_(config) {
	config_.validate();
}

PatternClassification DemandPatternClassifier::classifyPattern(const MonthlySeries &monthly) const {
	const auto values = toVector(monthly);
	PatternClassification result;
	if (intermittent::extractDemand(values).empty()) {
		return result;
	}

	result.adi = intermittent::averageDemandInterval(values);
	result.cv_squared = intermittent::squaredCoefficientOfVariation(values);

	const bool frequent = result.adi <= config_.adi_threshold;
	const bool stable = result.cv_squared <= config_.cv2_threshold;
	if (frequent) {
		result.pattern = stable ? DemandPattern::Smooth : DemandPattern::Erratic;
	} else {
		result.pattern = stable ? DemandPattern::Intermittent : DemandPattern::Lumpy;
	}
	return result;
}

DemandForecast DemandPatternClassifier::forecast(const MonthlySeries &monthly, DemandPattern pattern) const {
	const auto values = toVector(monthly);
	const double avg_monthly = averageMonthlyDemand(values);

	DemandForecast result;
	switch (pattern) {
	case DemandPattern::Smooth: {
		const double spread = config_.interval_z * utils::populationStdDev(values);
		result.method = ForecastMethod::MovingAverage;
		result.value = avg_monthly;
		result.lower = std::max(0.0, avg_monthly - spread);
		result.upper = avg_monthly + spread;
		break;
	}
	case DemandPattern::Erratic:
		result.method = ForecastMethod::WeightedAverage;
		result.value = intermittent::recentWeightedAverage(values, {0.5, 0.3, 0.2});
		result.lower = result.value * 0.5;
		result.upper = result.value * 1.5;
		break;
	case DemandPattern::Intermittent: {
		// Croston-style rate: mean demand size spread over the demand occurrences.
		const auto demand = intermittent::extractDemand(values);
		result.method = ForecastMethod::Crostons;
		if (!demand.empty()) {
			result.value = utils::mean(demand) / static_cast<double>(demand.size()) * kDaysPerMonth;
		}
		result.lower = 0.0;
		result.upper = result.value * 2.0;
		break;
	}
	case DemandPattern::Lumpy:
		result.method = ForecastMethod::ExponentialSmoothing;
		result.value = avg_monthly;
		result.lower = 0.0;
		result.upper = avg_monthly * 3.0;
		break;
	}

	// Forecasts above are for a 30-day horizon.
	const double horizon = config_.forecast_days / kDaysPerMonth;
	result.value *= horizon;
	result.lower *= horizon;
	result.upper *= horizon;
	return result;
}

ReorderParameters DemandPatternClassifier::calculateRop(const MonthlySeries &monthly, DemandPattern pattern) const {
	return calculateRop(monthly, pattern, config_.lead_time_days);
}

ReorderParameters DemandPatternClassifier::calculateRop(const MonthlySeries &monthly, DemandPattern pattern,
                                                        double lead_time_days) const {
	if (!std::isfinite(lead_time_days) || lead_time_days < 0.0) {
		throw core::ConfigurationError("Lead time must be a non-negative number of days");
	}

	const auto values = toVector(monthly);
	const double avg_monthly = averageMonthlyDemand(values);

	ReorderParameters rop;
	rop.avg_daily_demand = avg_monthly / kDaysPerMonth;
	rop.demand_during_lead_time = rop.avg_daily_demand * lead_time_days;
	rop.z_score = config_.zScore(pattern);
	rop.safety_stock = rop.z_score * utils::populationStdDev(values) * std::sqrt(lead_time_days);
	rop.reorder_point = rop.demand_during_lead_time + rop.safety_stock;

	const double annual_demand = avg_monthly * static_cast<double>(kMonthsPerYear);
	if (annual_demand > 0.0) {
		rop.economic_order_qty = std::sqrt(2.0 * annual_demand * config_.ordering_cost / config_.holding_cost_rate);
	}
	if (avg_monthly > 0.0) {
		rop.order_frequency = rop.economic_order_qty > 0.0 ? annual_demand / rop.economic_order_qty
		                                                   : static_cast<double>(kMonthsPerYear);
	}
	rop.recommended_order_qty = std::max(rop.economic_order_qty, rop.reorder_point);
	return rop;
}

PatternRecommendation DemandPatternClassifier::recommend(DemandPattern pattern) {
	switch (pattern) {
	case DemandPattern::Smooth:
		return {"REGULAR_ORDERING - Implement standard reorder cycle",
		        2,
		        {"Stable demand allows for predictable ordering", "Use ROP-based ordering system",
		         "Can negotiate long-term contracts with suppliers"}};
	case DemandPattern::Erratic:
		return {"FLEXIBLE_ORDERING - Increase safety stock by 20-30%",
		        5,
		        {"High demand variability requires buffer inventory", "Monitor demand trends closely (weekly)",
		         "Consider multiple suppliers for flexibility"}};
	case DemandPattern::Intermittent:
		return {"PERIODIC_ORDERING - Use time-based ordering",
		        4,
		        {"Sporadic demand but low variability", "Implement periodic review ordering (every 4 weeks)",
		         "Keep minimum safety stock levels"}};
	case DemandPattern::Lumpy:
		return {"SPECIAL_ORDERING - Collaborate on demand planning",
		        8,
		        {"Highly unpredictable demand", "Work with sales team on forecasts",
		         "Maintain high safety stock (40-50% above average)", "Consider drop-shipping or make-to-order"}};
	}
	return {"MAINTAIN_STOCK", 5, {}};
}

DemandPatternResult DemandPatternClassifier::analyze(const DemandSeries &series) const {
	const auto monthly = toMonthlySeries(series.monthly);
	const auto values = toVector(monthly);

	DemandPatternResult result;
	result.item_code = series.item_code;
	result.item_name = series.item_name;
	result.classification = classifyPattern(monthly);

	result.avg_monthly_demand = utils::mean(values);
	result.std_dev_demand = utils::populationStdDev(values);
	if (result.avg_monthly_demand > 0.0) {
		result.demand_variability = result.std_dev_demand / result.avg_monthly_demand * 100.0;
	}

	const auto pattern = result.classification.pattern;
	result.forecast = forecast(monthly, pattern);
	result.reorder = calculateRop(monthly, pattern);
	result.recommendation = recommend(pattern);

	STOCKWISE_DEBUG("Item {}: ADI={:.3f} CV2={:.3f} -> {}", series.item_code, result.classification.adi,
	                result.classification.cv_squared, core::toString(pattern));
	return result;
}

DemandBatch DemandPatternClassifier::analyzeAll(const std::vector<DemandSeries> &series) const {
	STOCKWISE_INFO("Starting demand pattern classification using SBC method ({} items)", series.size());

	DemandBatch batch;
	batch.results.reserve(series.size());
	for (const auto &item : series) {
		try {
			batch.results.push_back(analyze(item));
		} catch (const std::exception &e) {
			STOCKWISE_WARN("Item {}: demand analysis failed: {}", item.item_code, e.what());
			batch.errors.push_back({item.item_code, e.what()});
		}
	}

	STOCKWISE_INFO("Analyzed {} demand series ({} errors)", batch.results.size(), batch.errors.size());
	return batch;
}

} // namespace stockwise::demand
