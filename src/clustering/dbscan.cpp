#include "stockwise/clustering/dbscan.hpp"

#include "stockwise/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>

using stockwise::core::DistanceMatrix;

namespace stockwise::clustering {

std::size_t DbscanResult::outlierCount() const {
	return static_cast<std::size_t>(std::count(roles.begin(), roles.end(), PointRole::Outlier));
}

std::size_t DbscanResult::borderCount() const {
	return static_cast<std::size_t>(std::count(roles.begin(), roles.end(), PointRole::Border));
}

std::vector<std::size_t> DbscanResult::outliers() const {
	std::vector<std::size_t> indices;
	for (std::size_t i = 0; i < roles.size(); ++i) {
		if (roles[i] == PointRole::Outlier) {
			indices.push_back(i);
		}
	}
	return indices;
}

std::map<int, std::vector<std::size_t>> DbscanResult::members() const {
	std::map<int, std::vector<std::size_t>> groups;
	for (std::size_t i = 0; i < labels.size(); ++i) {
		if (labels[i] != kNoise) {
			groups[labels[i]].push_back(i);
		}
	}
	return groups;
}

DbscanClusterer::DbscanClusterer(double epsilon, std::size_t min_samples)
    : epsilon_(epsilon), min_samples_(min_samples) {
}

std::vector<std::size_t> DbscanClusterer::neighbourhood(std::size_t point, const DistanceMatrix::Row &distances) const {
	std::vector<std::size_t> region;
	for (std::size_t j = 0; j < distances.size(); ++j) {
		if (j == point || distances[j] <= epsilon_) {
			region.push_back(j);
		}
	}
	return region;
}

DbscanResult DbscanClusterer::cluster(const DistanceMatrix &matrix) const {
	const auto n = matrix.size();
	STOCKWISE_TRACE("DBSCAN start: epsilon={} min_samples={} points={}", epsilon_, min_samples_, n);

	// Pass 1: neighbourhoods and core points.
	std::vector<std::vector<std::size_t>> regions(n);
	std::vector<bool> core(n, false);
	for (std::size_t i = 0; i < n; ++i) {
		regions[i] = neighbourhood(i, matrix[i]);
		core[i] = regions[i].size() >= min_samples_;
	}

	DbscanResult result;
	result.labels.assign(n, kNoise);
	result.roles.assign(n, PointRole::Outlier);

	// Pass 2: grow a cluster from every core point not yet reached.
	std::vector<std::size_t> frontier;
	for (std::size_t seed = 0; seed < n; ++seed) {
		if (!core[seed] || result.labels[seed] != kNoise) {
			continue;
		}

		const int id = static_cast<int>(result.cluster_count++);
		std::size_t size = 1;
		result.labels[seed] = id;
		frontier.assign(1, seed);
		while (!frontier.empty()) {
			const auto point = frontier.back();
			frontier.pop_back();
			for (auto neighbour : regions[point]) {
				if (result.labels[neighbour] != kNoise) {
					continue;
				}
				result.labels[neighbour] = id;
				++size;
				if (core[neighbour]) {
					frontier.push_back(neighbour);
				}
			}
		}
		STOCKWISE_TRACE("DBSCAN cluster {} grown from point {} ({} points)", id, seed, size);
	}

	for (std::size_t i = 0; i < n; ++i) {
		if (core[i]) {
			result.roles[i] = PointRole::Core;
		} else if (result.labels[i] != kNoise) {
			result.roles[i] = PointRole::Border;
		}
	}

	STOCKWISE_TRACE("DBSCAN done: clusters={} border={} outliers={}", result.cluster_count, result.borderCount(),
	                result.outlierCount());
	return result;
}

DbscanBuilder &DbscanBuilder::withEpsilon(double epsilon) {
	if (epsilon < 0.0) {
		throw std::invalid_argument("epsilon must be non-negative");
	}
	epsilon_ = epsilon;
	return *this;
}

DbscanBuilder &DbscanBuilder::withMinSamples(std::size_t min_samples) {
	if (min_samples < 1) {
		throw std::invalid_argument("min_samples must be at least 1");
	}
	min_samples_ = min_samples;
	return *this;
}

std::unique_ptr<DbscanClusterer> DbscanBuilder::build() const {
	return std::unique_ptr<DbscanClusterer>(new DbscanClusterer(epsilon_, min_samples_));
}

} // namespace stockwise::clustering
