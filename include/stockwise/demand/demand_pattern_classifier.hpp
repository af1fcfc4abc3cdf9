#pragma once

#include "stockwise/demand/demand_config.hpp"
#include "stockwise/demand/demand_types.hpp"

#include <vector>

namespace stockwise::demand {

/**
 * @class DemandPatternClassifier
 * @brief Syntetos-Boylan-Croston classification of a 12-month demand history
 * into SMOOTH, ERRATIC, INTERMITTENT or LUMPY, with a pattern-specific
 * forecast, reorder point, EOQ and ordering recommendation.
 *
 * All operations are pure functions of the series and the configuration.
 *
 * @example
 * ```cpp
 * DemandPatternClassifier classifier;
 * auto result = classifier.analyze({"HYD-001", "Pump A", {100, 110, ...}});
 * ```
 */
class DemandPatternClassifier {
public:
	/// @throws core::ConfigurationError for an invalid configuration.
	explicit DemandPatternClassifier(DemandPatternConfig config = {});

	/// ADI = 12 / months with demand, CV^2 over the non-zero months. All-zero series are LUMPY.
	PatternClassification classifyPattern(const MonthlySeries &monthly) const;

	DemandForecast forecast(const MonthlySeries &monthly, core::DemandPattern pattern) const;

	/// Reorder point for the configured lead time.
	ReorderParameters calculateRop(const MonthlySeries &monthly, core::DemandPattern pattern) const;

	/// @throws core::ConfigurationError for a negative or non-finite lead time.
	ReorderParameters calculateRop(const MonthlySeries &monthly, core::DemandPattern pattern,
	                               double lead_time_days) const;

	static PatternRecommendation recommend(core::DemandPattern pattern);

	/// @throws core::DataError for a malformed monthly series.
	DemandPatternResult analyze(const DemandSeries &series) const;

	/// Analyzes every series; malformed ones are logged and reported in DemandBatch::errors.
	DemandBatch analyzeAll(const std::vector<DemandSeries> &series) const;

	const DemandPatternConfig &config() const noexcept {
		return config_;
	}

private:
	DemandPatternConfig config_;
};

} // namespace stockwise::demand
