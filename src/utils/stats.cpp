#include "stockwise/utils/stats.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace stockwise::utils {

double mean(const std::vector<double> &values) {
	if (values.empty()) {
		return 0.0;
	}
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double populationStdDev(const std::vector<double> &values) {
	if (values.empty()) {
		return 0.0;
	}
	const double avg = mean(values);
	double sum_sq = 0.0;
	for (double value : values) {
		const double diff = value - avg;
		sum_sq += diff * diff;
	}
	return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

double clamp(double value, double lower, double upper) {
	return std::max(lower, std::min(upper, value));
}

} // namespace stockwise::utils
