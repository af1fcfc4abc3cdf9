#pragma once

#include "stockwise/classification/strategy.hpp"

namespace stockwise::classification {

/**
 * @class KMeansStrategy
 * @brief Centroid clustering on standardized {velocity, turnover, annual sales
 * value}; members take the velocity band of their cluster mean.
 *
 * The silhouette of the partition is reported as a diagnostic only.
 */
class KMeansStrategy final : public ClassificationStrategy {
public:
	static constexpr double kFlatConfidence = 75.0;
	static constexpr double kMaxFastConfidence = 95.0;

	explicit KMeansStrategy(ClassificationConfig config);

	core::ClassificationMethod method() const override {
		return core::ClassificationMethod::KmeansClustering;
	}

	bool requiresEligibleItems() const override {
		return true;
	}

	BatchModel fit(const std::vector<core::PreparedItem> &items) const override;

	Classification classify(const BatchModel &model, std::size_t index,
	                        const core::PreparedItem &item) const override;

	static const std::vector<features::FeatureColumn> &featureColumns();

private:
	ClassificationConfig config_;
};

} // namespace stockwise::classification
