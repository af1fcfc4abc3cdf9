#pragma once

#include "stockwise/classification/classification_config.hpp"
#include "stockwise/classification/result_builder.hpp"
#include "stockwise/classification/strategy.hpp"
#include "stockwise/core/item_metrics.hpp"
#include "stockwise/features/feature_preparer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace stockwise::classification {

/**
 * @class ItemClassifier
 * @brief Classifies a batch of items as FAST, SLOW, MEDIUM, NEW_ITEM or
 * DEAD_STOCK with one of four strategies.
 *
 * The classifier holds only its configuration; every call prepares features,
 * fits the strategy's batch model once, then classifies items independently
 * (optionally on `worker_threads` tasks). Items that fail are logged and
 * reported in ClassificationBatch::errors. When a clustering model cannot be
 * fit, the batch is classified with the business rules instead.
 *
 * @example
 * ```cpp
 * ItemClassifier classifier;
 * auto batch = classifier.classify(items, "hybrid");
 * for (const auto &result : batch.results) { ... }
 * ```
 */
class ItemClassifier {
public:
	/// @throws core::ConfigurationError for an invalid configuration.
	explicit ItemClassifier(ClassificationConfig config = {});

	core::ClassificationBatch classify(const std::vector<core::ItemMetrics> &items,
	                                   core::ClassificationMethod method) const;

	/// @throws core::ConfigurationError for an unknown strategy name.
	core::ClassificationBatch classify(const std::vector<core::ItemMetrics> &items, const std::string &method) const;

	/// Runs a caller-supplied strategy through the same pipeline.
	core::ClassificationBatch classify(const std::vector<core::ItemMetrics> &items,
	                                   const ClassificationStrategy &strategy) const;

	static std::unique_ptr<ClassificationStrategy> makeStrategy(core::ClassificationMethod method,
	                                                            const ClassificationConfig &config);

	const ClassificationConfig &config() const noexcept {
		return config_;
	}

private:
	struct ItemSlot {
		std::optional<core::ClassificationResult> result;
		std::optional<core::ItemError> error;
	};

	void classifyRange(const ClassificationStrategy &strategy, const BatchModel &model,
	                   const std::vector<core::PreparedItem> &items, std::size_t begin, std::size_t end,
	                   std::vector<ItemSlot> &slots) const;

	ClassificationConfig config_;
	features::FeaturePreparer preparer_;
	ResultBuilder builder_;
};

} // namespace stockwise::classification
