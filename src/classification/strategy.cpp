#include "stockwise/classification/strategy.hpp"

#include <stdexcept>

namespace stockwise::classification {

core::ItemClass clusterVelocityBand(double mean_velocity, const ClassificationConfig &config) {
	if (mean_velocity > config.rules.fast_min_sales_velocity) {
		return core::ItemClass::Fast;
	}
	if (mean_velocity > config.medium_min_cluster_velocity) {
		return core::ItemClass::Medium;
	}
	return core::ItemClass::Slow;
}

std::map<int, double> meanVelocityByCluster(const std::vector<core::PreparedItem> &items,
                                            const std::vector<int> &labels) {
	if (items.size() != labels.size()) {
		throw std::invalid_argument("meanVelocityByCluster: label count does not match item count");
	}
	std::map<int, std::pair<double, std::size_t>> sums;
	for (std::size_t i = 0; i < items.size(); ++i) {
		if (labels[i] < 0) {
			continue;
		}
		auto &entry = sums[labels[i]];
		entry.first += items[i].sales_velocity;
		++entry.second;
	}
	std::map<int, double> means;
	for (const auto &[cluster, entry] : sums) {
		means[cluster] = entry.first / static_cast<double>(entry.second);
	}
	return means;
}

} // namespace stockwise::classification
