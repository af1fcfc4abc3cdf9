#include "stockwise/clustering/kmeans.hpp"

#include "stockwise/utils/logging.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <random>
#include <set>
#include <stdexcept>

namespace stockwise::clustering {

namespace {

Eigen::MatrixXd seedCentroids(const Eigen::MatrixXd &points, std::size_t k, std::mt19937 &rng) {
	const auto n = static_cast<std::size_t>(points.rows());
	Eigen::MatrixXd centroids(static_cast<Eigen::Index>(k), points.cols());

	std::uniform_int_distribution<std::size_t> first(0, n - 1);
	centroids.row(0) = points.row(static_cast<Eigen::Index>(first(rng)));

	std::vector<double> closest(n, std::numeric_limits<double>::max());
	for (std::size_t c = 1; c < k; ++c) {
		double total = 0.0;
		for (std::size_t i = 0; i < n; ++i) {
			const double d =
			    (points.row(static_cast<Eigen::Index>(i)) - centroids.row(static_cast<Eigen::Index>(c - 1))).squaredNorm();
			closest[i] = std::min(closest[i], d);
			total += closest[i];
		}

		std::size_t chosen = n - 1;
		if (total > 0.0) {
			std::uniform_real_distribution<double> pick(0.0, total);
			double target = pick(rng);
			for (std::size_t i = 0; i < n; ++i) {
				target -= closest[i];
				if (target <= 0.0) {
					chosen = i;
					break;
				}
			}
		} else {
			chosen = c % n;
		}
		centroids.row(static_cast<Eigen::Index>(c)) = points.row(static_cast<Eigen::Index>(chosen));
	}
	return centroids;
}

} // namespace

KMeansClusterer::KMeansClusterer(std::size_t clusters, std::size_t max_iterations, std::size_t n_init,
                                 std::uint32_t seed, double tolerance)
    : clusters_(clusters), max_iterations_(max_iterations), n_init_(n_init), seed_(seed), tolerance_(tolerance) {
}

KMeansResult KMeansClusterer::cluster(const Eigen::MatrixXd &points) const {
	if (points.rows() == 0) {
		throw std::invalid_argument("Cannot run k-means on an empty matrix");
	}
	const std::size_t k = std::min(clusters_, static_cast<std::size_t>(points.rows()));

	KMeansResult best;
	best.inertia = std::numeric_limits<double>::max();
	for (std::size_t run = 0; run < n_init_; ++run) {
		auto candidate = runOnce(points, k, seed_ + static_cast<std::uint32_t>(run));
		if (candidate.inertia < best.inertia) {
			best = std::move(candidate);
		}
	}

	STOCKWISE_DEBUG("k-means: k={} restarts={} inertia={:.4f} iterations={}", k, n_init_, best.inertia,
	                best.iterations);
	return best;
}

KMeansResult KMeansClusterer::runOnce(const Eigen::MatrixXd &points, std::size_t k, std::uint32_t seed) const {
	const auto n = static_cast<std::size_t>(points.rows());
	std::mt19937 rng(seed);

	KMeansResult result;
	result.centroids = seedCentroids(points, k, rng);
	result.labels.assign(n, 0);

	for (std::size_t iteration = 0; iteration < max_iterations_; ++iteration) {
		result.iterations = iteration + 1;
		for (std::size_t i = 0; i < n; ++i) {
			Eigen::Index nearest = 0;
			(result.centroids.rowwise() - points.row(static_cast<Eigen::Index>(i))).rowwise().squaredNorm().minCoeff(&nearest);
			result.labels[i] = static_cast<int>(nearest);
		}

		Eigen::MatrixXd updated = Eigen::MatrixXd::Zero(result.centroids.rows(), points.cols());
		std::vector<std::size_t> counts(k, 0);
		for (std::size_t i = 0; i < n; ++i) {
			updated.row(result.labels[i]) += points.row(static_cast<Eigen::Index>(i));
			++counts[static_cast<std::size_t>(result.labels[i])];
		}
		for (std::size_t c = 0; c < k; ++c) {
			if (counts[c] == 0) {
				// Empty cluster keeps its previous centroid.
				updated.row(static_cast<Eigen::Index>(c)) = result.centroids.row(static_cast<Eigen::Index>(c));
			} else {
				updated.row(static_cast<Eigen::Index>(c)) /= static_cast<double>(counts[c]);
			}
		}

		const double shift = (updated - result.centroids).squaredNorm();
		result.centroids = std::move(updated);
		if (shift <= tolerance_) {
			break;
		}
	}

	result.inertia = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		result.inertia += (points.row(static_cast<Eigen::Index>(i)) - result.centroids.row(result.labels[i])).squaredNorm();
	}
	return result;
}

KMeansBuilder &KMeansBuilder::withClusters(std::size_t clusters) {
	if (clusters < 1) {
		throw std::invalid_argument("k-means requires at least one cluster");
	}
	clusters_ = clusters;
	return *this;
}

KMeansBuilder &KMeansBuilder::withMaxIterations(std::size_t max_iterations) {
	if (max_iterations < 1) {
		throw std::invalid_argument("max_iterations must be at least 1");
	}
	max_iterations_ = max_iterations;
	return *this;
}

KMeansBuilder &KMeansBuilder::withRestarts(std::size_t n_init) {
	if (n_init < 1) {
		throw std::invalid_argument("n_init must be at least 1");
	}
	n_init_ = n_init;
	return *this;
}

KMeansBuilder &KMeansBuilder::withSeed(std::uint32_t seed) {
	seed_ = seed;
	return *this;
}

KMeansBuilder &KMeansBuilder::withTolerance(double tolerance) {
	if (tolerance < 0.0) {
		throw std::invalid_argument("tolerance must be non-negative");
	}
	tolerance_ = tolerance;
	return *this;
}

std::unique_ptr<KMeansClusterer> KMeansBuilder::build() const {
	return std::unique_ptr<KMeansClusterer>(new KMeansClusterer(clusters_, max_iterations_, n_init_, seed_, tolerance_));
}

std::optional<double> silhouetteScore(const Eigen::MatrixXd &points, const std::vector<int> &labels) {
	const auto n = labels.size();
	if (static_cast<std::size_t>(points.rows()) != n) {
		throw std::invalid_argument("silhouetteScore: label count does not match point count");
	}
	const std::set<int> distinct(labels.begin(), labels.end());
	if (distinct.size() < 2 || distinct.size() >= n) {
		return std::nullopt;
	}

	double total = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		std::map<int, std::pair<double, std::size_t>> per_cluster;
		for (std::size_t j = 0; j < n; ++j) {
			if (i == j) {
				continue;
			}
			auto &entry = per_cluster[labels[j]];
			entry.first += (points.row(static_cast<Eigen::Index>(i)) - points.row(static_cast<Eigen::Index>(j))).norm();
			++entry.second;
		}

		const auto own = per_cluster.find(labels[i]);
		if (own == per_cluster.end() || own->second.second == 0) {
			// Singleton cluster: silhouette is 0 by convention.
			continue;
		}
		const double a = own->second.first / static_cast<double>(own->second.second);
		double b = std::numeric_limits<double>::max();
		for (const auto &[label, entry] : per_cluster) {
			if (label != labels[i] && entry.second > 0) {
				b = std::min(b, entry.first / static_cast<double>(entry.second));
			}
		}
		const double denom = std::max(a, b);
		if (denom > 0.0) {
			total += (b - a) / denom;
		}
	}
	return total / static_cast<double>(n);
}

} // namespace stockwise::clustering
