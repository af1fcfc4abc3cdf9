#include "stockwise/health/health_scorer.hpp"

#include "stockwise/core/errors.hpp"
#include "stockwise/utils/logging.hpp"
#include "stockwise/utils/stats.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

using stockwise::core::HealthAction;
using stockwise::core::HealthStatus;
using stockwise::core::LifeStage;

namespace stockwise::health {

namespace {

constexpr double kDaysPerMonth = 30.0;

std::string percent(double ratio, int precision = 0) {
	std::ostringstream out;
	out << std::fixed << std::setprecision(precision) << ratio * 100.0 << "%";
	return out.str();
}

std::string whole(double value) {
	std::ostringstream out;
	out << std::fixed << std::setprecision(0) << value;
	return out.str();
}

ComponentScore component(double value, std::string reason) {
	return ComponentScore {value, static_cast<int>(std::lround(value)), std::move(reason)};
}

void requireValid(const char *field, double value) {
	if (!std::isfinite(value) || value < 0.0) {
		throw core::DataError(std::string("Field '") + field + "' must be a finite, non-negative value");
	}
}

void validate(const NewItemMetrics &metrics) {
	requireValid("item_age_days", metrics.item_age_days);
	requireValid("actual_sales_qty", metrics.actual_sales_qty);
	requireValid("target_sales_qty", metrics.target_sales_qty);
	requireValid("unique_customers", metrics.unique_customers);
	requireValid("repeat_customers", metrics.repeat_customers);
	requireValid("current_stock", metrics.current_stock);
	requireValid("stock_value", metrics.stock_value);
	requireValid("avg_monthly_sales", metrics.avg_monthly_sales);
	requireValid("sales_last_week", metrics.sales_last_week);
	requireValid("sales_prior_week", metrics.sales_prior_week);
}

} // namespace

HealthScorer::HealthScorer(HealthScoringConfig config) : config_(config) {
	config_.validate();
}

ComponentScore HealthScorer::salesPerformance(const NewItemMetrics &metrics) const {
	const double ratio = metrics.actual_sales_qty / std::max(metrics.target_sales_qty, 1.0);
	const auto &c = config_;
	const std::string achieved = percent(ratio) + " of target";

	if (ratio >= c.target_sales_pct_excellent) {
		return component(100.0, "Excellent: " + achieved + " (>" + percent(c.target_sales_pct_excellent) + ")");
	}
	if (ratio >= c.target_sales_pct_good) {
		return component(85.0, "Good: " + achieved + " (" + percent(c.target_sales_pct_good) + "-" +
		                           percent(c.target_sales_pct_excellent) + ")");
	}
	if (ratio >= c.target_sales_pct_fair) {
		return component(60.0, "Fair: " + achieved + " (" + percent(c.target_sales_pct_fair) + "-" +
		                           percent(c.target_sales_pct_good) + ")");
	}
	if (ratio >= c.target_sales_pct_poor) {
		return component(35.0, "Poor: " + achieved + " (" + percent(c.target_sales_pct_poor) + "-" +
		                           percent(c.target_sales_pct_fair) + ")");
	}
	if (ratio >= c.target_sales_pct_critical) {
		return component(15.0, "Critical: " + achieved + " (" + percent(c.target_sales_pct_critical) + "-" +
		                           percent(c.target_sales_pct_poor) + ")");
	}
	return component(0.0, "Failing: " + achieved + " (<" + percent(c.target_sales_pct_critical) + ")");
}

ComponentScore HealthScorer::customerAcquisition(const NewItemMetrics &metrics) const {
	const double customers = metrics.unique_customers;
	const auto &c = config_;
	const std::string count = std::to_string(metrics.unique_customers) + " unique customers";

	double value = 15.0;
	std::string reason = "Critical: " + count + " (<" + whole(c.min_customers_poor) + ")";
	if (customers >= c.min_customers_excellent) {
		value = 100.0;
		reason = "Excellent: " + count + " (>" + whole(c.min_customers_excellent) + ")";
	} else if (customers >= c.min_customers_good) {
		value = 85.0;
		reason = "Good: " + count;
	} else if (customers >= c.min_customers_fair) {
		value = 60.0;
		reason = "Fair: " + count;
	} else if (customers >= c.min_customers_poor) {
		value = 35.0;
		reason = "Poor: " + count;
	}

	if (metrics.unique_customers > 0) {
		const double retention = static_cast<double>(metrics.repeat_customers) / customers;
		if (retention > c.customer_retention_ratio) {
			value = std::min(100.0, value + c.customer_retention_bonus);
			reason += " | " + percent(retention) + " repeat customers (retention bonus)";
		}
	}
	return component(value, std::move(reason));
}

double HealthScorer::daysOfStock(const NewItemMetrics &metrics) const {
	return metrics.current_stock / std::max(metrics.avg_monthly_sales, config_.epsilon) * kDaysPerMonth;
}

ComponentScore HealthScorer::stockAdequacy(const NewItemMetrics &metrics) const {
	const double dos = daysOfStock(metrics);
	const auto &c = config_;
	const std::string days = whole(dos) + " days";

	if (dos >= c.dos_optimal_min && dos <= c.dos_optimal_max) {
		return component(100.0, "Optimal: " + days + " of stock (" + whole(c.dos_optimal_min) + "-" +
		                            whole(c.dos_optimal_max) + " day range)");
	}
	if (dos < c.dos_optimal_min) {
		const double shortfall_pct = (c.dos_optimal_min - dos) / c.dos_optimal_min * 100.0;
		return component(std::max(30.0, 100.0 - 2.0 * shortfall_pct),
		                 "Low Stock: " + days + " (<" + whole(c.dos_optimal_min) + " days) - stockout risk");
	}
	if (dos <= c.dos_warning_max) {
		return component(75.0, "Caution: " + days + " of stock (" + whole(c.dos_optimal_max) + "-" +
		                           whole(c.dos_warning_max) + " day range)");
	}
	if (dos <= c.dos_critical_max) {
		return component(45.0, "High Stock: " + days + " (" + whole(c.dos_warning_max) + "-" +
		                           whole(c.dos_critical_max) + " days) - high holding cost");
	}
	return component(15.0,
	                 "Excessive: " + days + " (>" + whole(c.dos_critical_max) + " days) - excess inventory risk");
}

double HealthScorer::weekOverWeekGrowth(const NewItemMetrics &metrics) {
	return (metrics.sales_last_week - metrics.sales_prior_week) / std::max(metrics.sales_prior_week, 1.0);
}

ComponentScore HealthScorer::growthTrend(const NewItemMetrics &metrics) const {
	const double growth = weekOverWeekGrowth(metrics);
	const auto &c = config_;
	const std::string wow = percent(growth, 1) + " WoW growth";

	if (growth >= c.growth_excellent) {
		return component(100.0, "Excellent: +" + wow + " (>" + percent(c.growth_excellent) + ")");
	}
	if (growth >= c.growth_good) {
		return component(85.0, "Good: +" + wow);
	}
	if (growth >= c.growth_fair) {
		return component(70.0, "Stable: " + wow + " (0-" + percent(c.growth_good) + ")");
	}
	if (growth >= c.growth_poor) {
		return component(45.0, "Declining: " + wow + " (" + percent(c.growth_poor) + "-0%)");
	}
	if (growth >= c.growth_critical) {
		return component(20.0, "Steep Decline: " + wow);
	}
	return component(5.0, "Collapsing: " + wow + " (<" + percent(c.growth_critical) + ")");
}

HealthStatus HealthScorer::status(double health_score) const {
	if (health_score <= config_.health_critical_max) {
		return HealthStatus::Critical;
	}
	if (health_score <= config_.health_at_risk_max) {
		return HealthStatus::AtRisk;
	}
	if (health_score < config_.health_healthy_min) {
		return HealthStatus::Caution;
	}
	return HealthStatus::Healthy;
}

LifeStage HealthScorer::lifeStage(double item_age_days) const {
	if (item_age_days <= config_.launch_max_days) {
		return LifeStage::Launch;
	}
	if (item_age_days <= config_.learning_max_days) {
		return LifeStage::Learning;
	}
	if (item_age_days <= config_.graduation_max_days) {
		return LifeStage::Graduation;
	}
	return LifeStage::Established;
}

HealthRecommendation HealthScorer::recommend(HealthStatus status, LifeStage stage) {
	HealthRecommendation rec;
	switch (status) {
	case HealthStatus::Critical:
		rec.action = HealthAction::UrgentIntervention;
		rec.priority = 10;
		rec.warning_flags = {"Health score < 30 - item may fail", "Review launch strategy and market positioning",
		                     "Consider product adjustments or discontinuation"};
		break;
	case HealthStatus::AtRisk:
		rec.action = HealthAction::CloseMonitoring;
		rec.priority = 8;
		rec.warning_flags = {"Health score 30-60 - monitor closely", "Increase marketing efforts",
		                     "Gather customer feedback for improvements"};
		break;
	case HealthStatus::Caution:
		rec.action = HealthAction::OptimizeInventory;
		rec.priority = 5;
		rec.warning_flags = {"Health score 60-80 - needs optimization"};
		break;
	case HealthStatus::Healthy:
		rec.action = HealthAction::MaintainCurrentStrategy;
		rec.priority = 2;
		break;
	}

	// Life stage may replace the action but only ever raises the priority.
	switch (stage) {
	case LifeStage::Launch:
		rec.action = HealthAction::AggressiveMarketing;
		rec.priority = std::max(rec.priority, 7);
		rec.key_metrics = {"Focus on customer acquisition", "Expected: 20-30% weekly growth"};
		break;
	case LifeStage::Learning:
		rec.action = HealthAction::MarketExpansion;
		rec.priority = std::max(rec.priority, 6);
		rec.key_metrics = {"Scale marketing campaigns", "Target new customer segments"};
		break;
	case LifeStage::Graduation:
		rec.action = HealthAction::OptimizeSupplyChain;
		rec.priority = std::max(rec.priority, 4);
		rec.key_metrics = {"Optimize ordering and inventory", "Stabilize supply from suppliers"};
		break;
	case LifeStage::Established:
		rec.key_metrics = {"Monitor for market changes", "Maintain competitive pricing"};
		break;
	}
	return rec;
}

HealthScoreResult HealthScorer::score(const NewItemMetrics &metrics) const {
	validate(metrics);

	HealthScoreResult result;
	result.item_code = metrics.item_code;
	result.item_name = metrics.item_name;
	result.item_age_days = metrics.item_age_days;

	result.sales_performance = salesPerformance(metrics);
	result.customer_acquisition = customerAcquisition(metrics);
	result.stock_adequacy = stockAdequacy(metrics);
	result.growth_trend = growthTrend(metrics);

	const double composite = result.sales_performance.value * config_.weight_sales_performance +
	                         result.customer_acquisition.value * config_.weight_customer_acquisition +
	                         result.stock_adequacy.value * config_.weight_stock_adequacy +
	                         result.growth_trend.value * config_.weight_growth_trend;
	// Bands apply to the unrounded composite; only the reported score is rounded.
	const double bounded = utils::clamp(composite, 0.0, 100.0);
	result.health_score = static_cast<int>(std::lround(bounded));
	result.health_status = status(bounded);
	result.life_stage = lifeStage(metrics.item_age_days);

	result.total_customers = metrics.unique_customers;
	result.repeat_customers_pct =
	    static_cast<double>(metrics.repeat_customers) / std::max(metrics.unique_customers, 1) * 100.0;
	result.sales_vs_target_pct = metrics.actual_sales_qty / std::max(metrics.target_sales_qty, 1.0) * 100.0;
	result.stock_adequacy_dos = daysOfStock(metrics);
	result.growth_trend_pct = weekOverWeekGrowth(metrics);
	result.stock_value = metrics.stock_value;

	result.recommendation = recommend(result.health_status, result.life_stage);

	STOCKWISE_DEBUG("Item {}: health score {} ({}, {})", metrics.item_code, result.health_score,
	                core::toString(result.health_status), core::toString(result.life_stage));
	return result;
}

HealthBatch HealthScorer::scoreAll(const std::vector<NewItemMetrics> &items) const {
	STOCKWISE_INFO("Calculating health scores for {} new items", items.size());

	HealthBatch batch;
	batch.results.reserve(items.size());
	for (const auto &item : items) {
		try {
			batch.results.push_back(score(item));
		} catch (const std::exception &e) {
			STOCKWISE_WARN("Item {}: health scoring failed: {}", item.item_code, e.what());
			batch.errors.push_back({item.item_code, e.what()});
		}
	}

	STOCKWISE_INFO("Scored {} items ({} errors)", batch.results.size(), batch.errors.size());
	return batch;
}

} // namespace stockwise::health
