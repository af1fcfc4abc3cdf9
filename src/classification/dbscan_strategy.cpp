#include "stockwise/classification/dbscan_strategy.hpp"

#include "stockwise/clustering/dbscan.hpp"
#include "stockwise/core/distance_matrix.hpp"
#include "stockwise/utils/logging.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

using stockwise::core::ItemClass;
using stockwise::core::PreparedItem;
using stockwise::features::FeatureColumn;

namespace stockwise::classification {

DbscanStrategy::DbscanStrategy(ClassificationConfig config) : config_(std::move(config)) {
}

const std::vector<FeatureColumn> &DbscanStrategy::featureColumns() {
	static const std::vector<FeatureColumn> columns = {FeatureColumn::SalesVelocity, FeatureColumn::TurnoverRatio,
	                                                   FeatureColumn::DaysSinceLastSale,
	                                                   FeatureColumn::AnnualSalesValue};
	return columns;
}

BatchModel DbscanStrategy::fit(const std::vector<PreparedItem> &items) const {
	BatchModel model;
	if (items.empty()) {
		return model;
	}

	model.scaler = features::fitScaler(items, featureColumns());
	const auto scaled = features::standardize(*model.scaler, items);
	const auto distances = core::DistanceMatrix::euclidean(scaled);

	auto clusterer =
	    clustering::DbscanBuilder().withEpsilon(config_.dbscan_eps).withMinSamples(config_.dbscan_min_samples).build();
	auto result = clusterer->cluster(distances);

	STOCKWISE_DEBUG("DBSCAN: {} items, {} clusters, {} border points, {} outliers", items.size(),
	                result.cluster_count, result.borderCount(), result.outlierCount());

	model.cluster_mean_velocity = meanVelocityByCluster(items, result.labels);
	model.cluster_labels = std::move(result.labels);
	model.point_roles = std::move(result.roles);
	return model;
}

Classification DbscanStrategy::classify(const BatchModel &model, std::size_t index, const PreparedItem &item) const {
	if (index >= model.cluster_labels.size()) {
		throw std::out_of_range("DbscanStrategy: item index outside the fitted batch");
	}

	Classification classification;
	classification.method = core::ClassificationMethod::DbscanClustering;
	classification.confidence = kConfidence;

	std::ostringstream reason;
	reason << std::fixed << std::setprecision(2);

	const int cluster = model.cluster_labels[index];
	if (cluster == clustering::kNoise) {
		if (item.days_since_last_sale > config_.dbscan_outlier_dead_days) {
			classification.label = ItemClass::DeadStock;
		} else if (item.sales_velocity > config_.rules.fast_min_sales_velocity * config_.dbscan_outlier_fast_multiplier) {
			classification.label = ItemClass::Fast;
		} else {
			classification.label = ItemClass::Slow;
		}
		reason << "DBSCAN outlier: velocity " << item.sales_velocity << " units/day, last sale "
		       << item.days_since_last_sale << " days ago";
	} else {
		const double mean_velocity = model.cluster_mean_velocity.at(cluster);
		classification.label = clusterVelocityBand(mean_velocity, config_);
		reason << "DBSCAN cluster " << cluster;
		if (index < model.point_roles.size()) {
			reason << (model.point_roles[index] == clustering::PointRole::Core ? " (core)" : " (border)");
		}
		reason << ": mean velocity " << mean_velocity << " units/day";
	}
	classification.reason = reason.str();
	return classification;
}

} // namespace stockwise::classification
