#include "stockwise/demand/intermittent.hpp"

#include "stockwise/utils/stats.hpp"

namespace stockwise::demand::intermittent {

std::vector<double> extractDemand(const std::vector<double> &y) {
	std::vector<double> demand;
	demand.reserve(y.size());

	for (double val : y) {
		if (val > 0.0) {
			demand.push_back(val);
		}
	}

	return demand;
}

std::vector<double> computeIntervals(const std::vector<double> &y) {
	std::vector<double> intervals;
	std::size_t previous = 0;

	for (std::size_t i = 0; i < y.size(); ++i) {
		if (y[i] > 0.0) {
			intervals.push_back(static_cast<double>(i + 1 - previous));
			previous = i + 1;
		}
	}

	return intervals;
}

double averageDemandInterval(const std::vector<double> &y) {
	const auto periods_with_demand = computeIntervals(y).size();
	if (periods_with_demand == 0) {
		return 0.0;
	}
	return static_cast<double>(y.size()) / static_cast<double>(periods_with_demand);
}

double squaredCoefficientOfVariation(const std::vector<double> &y) {
	const auto demand = extractDemand(y);
	const double mean_demand = utils::mean(demand);
	if (mean_demand <= 0.0) {
		return 0.0;
	}
	const double cv = utils::populationStdDev(demand) / mean_demand;
	return cv * cv;
}

double recentWeightedAverage(const std::vector<double> &y, const std::vector<double> &weights) {
	double total = 0.0;
	for (std::size_t i = 0; i < weights.size() && i < y.size(); ++i) {
		total += weights[i] * y[y.size() - 1 - i];
	}
	return total;
}

} // namespace stockwise::demand::intermittent
