#pragma once

#include "stockwise/core/distance_matrix.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <vector>

namespace stockwise::clustering {

/// Label given to points that belong to no dense cluster.
inline constexpr int kNoise = -1;

/**
 * @brief Density role of a point.
 *
 * Core points have at least `min_samples` points (themselves included) within
 * `epsilon`. Border points are not core but lie within `epsilon` of a core
 * point. Outliers are neither.
 */
enum class PointRole { Core, Border, Outlier };

/**
 * @struct DbscanResult
 * @brief Cluster label and density role per point (0-based cluster ids,
 * kNoise for outliers).
 */
struct DbscanResult {
	std::vector<int> labels;
	std::vector<PointRole> roles;
	std::size_t cluster_count = 0;

	bool isOutlier(std::size_t point) const {
		return roles.at(point) == PointRole::Outlier;
	}

	std::size_t outlierCount() const;
	std::size_t borderCount() const;

	/// Indices of the outliers in input order.
	std::vector<std::size_t> outliers() const;

	/// Member indices per cluster id, outliers excluded.
	std::map<int, std::vector<std::size_t>> members() const;
};

/**
 * @class DbscanClusterer
 * @brief Density-based clustering over a precomputed distance matrix.
 *
 * Runs in two passes: every point's epsilon-neighbourhood is collected first
 * and core points are marked, then clusters are grown from unassigned core
 * points in index order. A border point joins the first cluster that reaches it.
 */
class DbscanClusterer {
public:
	friend class DbscanBuilder;

	DbscanClusterer(const DbscanClusterer &) = delete;
	DbscanClusterer &operator=(const DbscanClusterer &) = delete;
	DbscanClusterer(DbscanClusterer &&) noexcept = default;
	DbscanClusterer &operator=(DbscanClusterer &&) noexcept = default;

	[[nodiscard]] DbscanResult cluster(const core::DistanceMatrix &matrix) const;

	double epsilon() const noexcept {
		return epsilon_;
	}

	std::size_t minSamples() const noexcept {
		return min_samples_;
	}

private:
	DbscanClusterer(double epsilon, std::size_t min_samples);

	/// Points within epsilon of @p point, @p point itself included.
	std::vector<std::size_t> neighbourhood(std::size_t point, const core::DistanceMatrix::Row &distances) const;

	double epsilon_;
	std::size_t min_samples_;
};

/**
 * @class DbscanBuilder
 * @brief Fluent builder for DbscanClusterer.
 */
class DbscanBuilder {
public:
	DbscanBuilder &withEpsilon(double epsilon);
	DbscanBuilder &withMinSamples(std::size_t min_samples);

	std::unique_ptr<DbscanClusterer> build() const;

private:
	double epsilon_ = 0.5;
	std::size_t min_samples_ = 3;
};

} // namespace stockwise::clustering
