#include "stockwise/demand/demand_config.hpp"

using stockwise::utils::ParamMap;
using stockwise::utils::ParamReader;
using stockwise::utils::requireInRange;
using stockwise::utils::requirePositive;

namespace stockwise::demand {

double DemandPatternConfig::zScore(core::DemandPattern pattern) const {
	switch (pattern) {
	case core::DemandPattern::Smooth:
		return z_smooth;
	case core::DemandPattern::Erratic:
		return z_erratic;
	case core::DemandPattern::Intermittent:
		return z_intermittent;
	case core::DemandPattern::Lumpy:
		return z_lumpy;
	}
	return z_smooth;
}

void DemandPatternConfig::validate() const {
	requirePositive("adi_threshold", adi_threshold);
	requireInRange("cv2_threshold", cv2_threshold, 0.0, 1e6);
	requireInRange("lead_time_days", lead_time_days, 0.0, 3650.0);
	requirePositive("forecast_days", forecast_days);
	requireInRange("interval_z", interval_z, 0.0, 10.0);
	requireInRange("z_smooth", z_smooth, 0.0, 10.0);
	requireInRange("z_erratic", z_erratic, 0.0, 10.0);
	requireInRange("z_intermittent", z_intermittent, 0.0, 10.0);
	requireInRange("z_lumpy", z_lumpy, 0.0, 10.0);
	requireInRange("ordering_cost", ordering_cost, 0.0, 1e12);
	requirePositive("holding_cost_rate", holding_cost_rate);
}

DemandPatternConfig DemandPatternConfig::fromParams(const ParamMap &params) {
	DemandPatternConfig config;
	ParamReader reader(params);

	reader.read("adi_threshold", config.adi_threshold);
	reader.read("cv2_threshold", config.cv2_threshold);
	reader.read("lead_time_days", config.lead_time_days);
	reader.read("forecast_days", config.forecast_days);
	reader.read("interval_z", config.interval_z);
	reader.read("z_smooth", config.z_smooth);
	reader.read("z_erratic", config.z_erratic);
	reader.read("z_intermittent", config.z_intermittent);
	reader.read("z_lumpy", config.z_lumpy);
	reader.read("ordering_cost", config.ordering_cost);
	reader.read("holding_cost_rate", config.holding_cost_rate);

	reader.rejectUnknown("DemandPatternClassifier");
	config.validate();
	return config;
}

ParamMap DemandPatternConfig::toParams() const {
	return {
	    {"adi_threshold", adi_threshold},   {"cv2_threshold", cv2_threshold},
	    {"lead_time_days", lead_time_days}, {"forecast_days", forecast_days},
	    {"interval_z", interval_z},         {"z_smooth", z_smooth},
	    {"z_erratic", z_erratic},           {"z_intermittent", z_intermittent},
	    {"z_lumpy", z_lumpy},               {"ordering_cost", ordering_cost},
	    {"holding_cost_rate", holding_cost_rate},
	};
}

} // namespace stockwise::demand
