#pragma once

#include "stockwise/classification/classification_config.hpp"
#include "stockwise/clustering/dbscan.hpp"
#include "stockwise/core/item_metrics.hpp"
#include "stockwise/features/scaler.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stockwise::classification {

/**
 * @struct Classification
 * @brief Label assigned by a strategy, before enrichment.
 */
struct Classification {
	core::ItemClass label = core::ItemClass::Medium;
	double confidence = 0.0; ///< Percentage in [0, 100].
	std::string reason;
	core::ClassificationMethod method = core::ClassificationMethod::RuleBased;
};

/**
 * @struct BatchModel
 * @brief Everything a strategy fits over a whole batch before classifying
 * individual items. Immutable once fit() returns.
 */
struct BatchModel {
	std::optional<features::ScalerParams> scaler;
	/// Cluster id per batch index; -1 marks an outlier.
	std::vector<int> cluster_labels;
	/// Density role per batch index; empty for centroid clustering.
	std::vector<clustering::PointRole> point_roles;
	std::map<int, double> cluster_mean_velocity;
	std::optional<double> silhouette;
};

/**
 * @class ClassificationStrategy
 * @brief Interface of the interchangeable item classification strategies.
 *
 * fit() runs once per batch; classify() is then called independently for each
 * item of the same batch and must not mutate shared state.
 */
class ClassificationStrategy {
public:
	virtual ~ClassificationStrategy() = default;

	virtual core::ClassificationMethod method() const = 0;

	/// Strategies that cluster only see the ML-eligible subset of a batch.
	virtual bool requiresEligibleItems() const = 0;

	virtual BatchModel fit(const std::vector<core::PreparedItem> &items) const = 0;

	virtual Classification classify(const BatchModel &model, std::size_t index,
	                                 const core::PreparedItem &item) const = 0;
};

/**
 * @brief Velocity band of a cluster: above the FAST velocity threshold is FAST,
 * above `medium_min_cluster_velocity` is MEDIUM, anything else SLOW.
 */
core::ItemClass clusterVelocityBand(double mean_velocity, const ClassificationConfig &config);

/// Mean sales velocity per cluster id (outliers excluded).
std::map<int, double> meanVelocityByCluster(const std::vector<core::PreparedItem> &items,
                                            const std::vector<int> &labels);

} // namespace stockwise::classification
