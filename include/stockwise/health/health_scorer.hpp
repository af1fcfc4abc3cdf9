#pragma once

#include "stockwise/health/health_config.hpp"
#include "stockwise/health/health_types.hpp"

#include <vector>

namespace stockwise::health {

/**
 * @class HealthScorer
 * @brief Weighted 0-100 health score of a new item from four banded
 * components: sales vs target, customer acquisition, stock adequacy and
 * week-over-week growth.
 *
 * Zero denominators are floored (target and prior week to 1, average monthly
 * sales to `epsilon`) so every valid item produces a result.
 */
class HealthScorer {
public:
	/// @throws core::ConfigurationError when the weights do not sum to 1.
	explicit HealthScorer(HealthScoringConfig config = {});

	/// @throws core::DataError for negative or non-finite metrics.
	HealthScoreResult score(const NewItemMetrics &metrics) const;

	/// Scores every item; failing items are logged and reported in HealthBatch::errors.
	HealthBatch scoreAll(const std::vector<NewItemMetrics> &items) const;

	ComponentScore salesPerformance(const NewItemMetrics &metrics) const;
	ComponentScore customerAcquisition(const NewItemMetrics &metrics) const;
	ComponentScore stockAdequacy(const NewItemMetrics &metrics) const;
	ComponentScore growthTrend(const NewItemMetrics &metrics) const;

	double daysOfStock(const NewItemMetrics &metrics) const;
	static double weekOverWeekGrowth(const NewItemMetrics &metrics);

	core::HealthStatus status(double health_score) const;
	core::LifeStage lifeStage(double item_age_days) const;
	static HealthRecommendation recommend(core::HealthStatus status, core::LifeStage stage);

	const HealthScoringConfig &config() const noexcept {
		return config_;
	}

private:
	HealthScoringConfig config_;
};

} // namespace stockwise::health
