#pragma once

#include "stockwise/core/labels.hpp"
#include "stockwise/utils/params.hpp"

namespace stockwise::demand {

/**
 * @struct DemandPatternConfig
 * @brief SBC thresholds, forecast horizon, safety-stock z-scores and EOQ cost
 * assumptions of the demand pattern classifier.
 */
struct DemandPatternConfig {
	double adi_threshold = 1.32;
	double cv2_threshold = 0.49;

	double lead_time_days = 7.0;
	double forecast_days = 30.0;
	/// Width multiplier of the SMOOTH forecast interval.
	double interval_z = 1.96;

	double z_smooth = 1.65;
	double z_erratic = 2.33;
	double z_intermittent = 2.33;
	double z_lumpy = 2.58;

	double ordering_cost = 50.0;
	double holding_cost_rate = 0.20;

	/// Safety-stock z-score for @p pattern.
	double zScore(core::DemandPattern pattern) const;

	/// @throws core::ConfigurationError when a value is out of range.
	void validate() const;

	/// @throws core::ConfigurationError for unknown keys or invalid values.
	static DemandPatternConfig fromParams(const utils::ParamMap &params);

	utils::ParamMap toParams() const;
};

} // namespace stockwise::demand
