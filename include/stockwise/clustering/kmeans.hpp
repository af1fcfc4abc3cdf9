#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace stockwise::clustering {

/**
 * @struct KMeansResult
 * @brief Partition of the input rows into k clusters.
 */
struct KMeansResult {
	std::vector<int> labels;
	Eigen::MatrixXd centroids;
	double inertia = 0.0;
	std::size_t iterations = 0;

	std::size_t clusterCount() const noexcept {
		return static_cast<std::size_t>(centroids.rows());
	}
};

/**
 * @class KMeansClusterer
 * @brief Lloyd's k-means with k-means++ seeding.
 *
 * Runs `n_init` seeded restarts and keeps the partition with the lowest
 * inertia, so equal inputs always give equal labels.
 */
class KMeansClusterer {
public:
	friend class KMeansBuilder;

	KMeansClusterer(const KMeansClusterer &) = delete;
	KMeansClusterer &operator=(const KMeansClusterer &) = delete;
	KMeansClusterer(KMeansClusterer &&) noexcept = default;
	KMeansClusterer &operator=(KMeansClusterer &&) noexcept = default;

	/**
	 * @brief Cluster the rows of @p points.
	 *
	 * When there are fewer rows than clusters, k is reduced to the row count.
	 * @throws std::invalid_argument if @p points has no rows.
	 */
	[[nodiscard]] KMeansResult cluster(const Eigen::MatrixXd &points) const;

	std::size_t clusters() const noexcept {
		return clusters_;
	}

private:
	KMeansClusterer(std::size_t clusters, std::size_t max_iterations, std::size_t n_init, std::uint32_t seed,
	                double tolerance);

	KMeansResult runOnce(const Eigen::MatrixXd &points, std::size_t k, std::uint32_t seed) const;

	std::size_t clusters_;
	std::size_t max_iterations_;
	std::size_t n_init_;
	std::uint32_t seed_;
	double tolerance_;
};

class KMeansBuilder {
public:
	KMeansBuilder &withClusters(std::size_t clusters);
	KMeansBuilder &withMaxIterations(std::size_t max_iterations);
	KMeansBuilder &withRestarts(std::size_t n_init);
	KMeansBuilder &withSeed(std::uint32_t seed);
	KMeansBuilder &withTolerance(double tolerance);

	std::unique_ptr<KMeansClusterer> build() const;

private:
	std::size_t clusters_ = 3;
	std::size_t max_iterations_ = 300;
	std::size_t n_init_ = 10;
	std::uint32_t seed_ = 42;
	double tolerance_ = 1e-4;
};

/**
 * @brief Mean silhouette coefficient of a labelling.
 *
 * Undefined (nullopt) unless there are at least two distinct labels and fewer
 * labels than points.
 */
std::optional<double> silhouetteScore(const Eigen::MatrixXd &points, const std::vector<int> &labels);

} // namespace stockwise::clustering
