#include "stockwise/classification/kmeans_strategy.hpp"

#include "stockwise/clustering/kmeans.hpp"
#include "stockwise/utils/logging.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using stockwise::core::ItemClass;
using stockwise::core::PreparedItem;
using stockwise::features::FeatureColumn;

namespace stockwise::classification {

KMeansStrategy::KMeansStrategy(ClassificationConfig config) : config_(std::move(config)) {
}

const std::vector<FeatureColumn> &KMeansStrategy::featureColumns() {
	static const std::vector<FeatureColumn> columns = {FeatureColumn::SalesVelocity, FeatureColumn::TurnoverRatio,
	                                                   FeatureColumn::AnnualSalesValue};
	return columns;
}

BatchModel KMeansStrategy::fit(const std::vector<PreparedItem> &items) const {
	BatchModel model;
	if (items.empty()) {
		return model;
	}

	model.scaler = features::fitScaler(items, featureColumns());
	const auto scaled = features::standardize(*model.scaler, items);

	auto clusterer = clustering::KMeansBuilder()
	                     .withClusters(config_.kmeans_n_clusters)
	                     .withMaxIterations(config_.kmeans_max_iterations)
	                     .withRestarts(config_.kmeans_n_init)
	                     .withSeed(config_.kmeans_seed)
	                     .build();
	auto result = clusterer->cluster(scaled);

	model.silhouette = clustering::silhouetteScore(scaled, result.labels);
	if (model.silhouette) {
		STOCKWISE_INFO("KMeans silhouette score: {:.3f}", *model.silhouette);
	} else {
		STOCKWISE_INFO("KMeans silhouette score undefined for {} items in {} clusters", items.size(),
		               result.clusterCount());
	}

	model.cluster_mean_velocity = meanVelocityByCluster(items, result.labels);
	model.cluster_labels = std::move(result.labels);
	return model;
}

Classification KMeansStrategy::classify(const BatchModel &model, std::size_t index, const PreparedItem &) const {
	if (index >= model.cluster_labels.size()) {
		throw std::out_of_range("KMeansStrategy: item index outside the fitted batch");
	}

	const int cluster = model.cluster_labels[index];
	const double mean_velocity = model.cluster_mean_velocity.at(cluster);

	Classification classification;
	classification.method = core::ClassificationMethod::KmeansClustering;
	classification.label = clusterVelocityBand(mean_velocity, config_);
	classification.confidence = classification.label == ItemClass::Fast
	                                ? std::min(kMaxFastConfidence, 70.0 + mean_velocity / 10.0)
	                                : kFlatConfidence;

	std::ostringstream reason;
	reason << std::fixed << std::setprecision(2) << "KMeans cluster " << cluster << ": mean velocity "
	       << mean_velocity << " units/day";
	classification.reason = reason.str();
	return classification;
}

} // namespace stockwise::classification
