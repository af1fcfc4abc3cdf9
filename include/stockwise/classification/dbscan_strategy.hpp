#pragma once

#include "stockwise/classification/strategy.hpp"

namespace stockwise::classification {

/**
 * @class DbscanStrategy
 * @brief Density clustering on standardized {velocity, turnover,
 * days since last sale, annual sales value}.
 *
 * Outliers: long-dormant items are DEAD_STOCK, very fast items FAST, the rest
 * SLOW. Cluster members take the velocity band of their cluster mean.
 */
class DbscanStrategy final : public ClassificationStrategy {
public:
	static constexpr double kConfidence = 75.0;

	explicit DbscanStrategy(ClassificationConfig config);

	core::ClassificationMethod method() const override {
		return core::ClassificationMethod::DbscanClustering;
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
