#include "stockwise/classification/item_classifier.hpp"

#include "stockwise/classification/dbscan_strategy.hpp"
#include "stockwise/classification/hybrid_strategy.hpp"
#include "stockwise/classification/kmeans_strategy.hpp"
#include "stockwise/classification/rule_based_strategy.hpp"
#include "stockwise/core/errors.hpp"
#include "stockwise/utils/logging.hpp"

#include <algorithm>
#include <future>

using stockwise::core::ClassificationBatch;
using stockwise::core::ClassificationMethod;
using stockwise::core::ItemError;
using stockwise::core::ItemMetrics;
using stockwise::core::PreparedItem;

namespace stockwise::classification {

ItemClassifier::ItemClassifier(ClassificationConfig config)
    : config_(std::move(config)), preparer_(config_.default_consistency_score), builder_(config_) {
	config_.validate();
}

std::unique_ptr<ClassificationStrategy> ItemClassifier::makeStrategy(ClassificationMethod method,
                                                                     const ClassificationConfig &config) {
	switch (method) {
	case ClassificationMethod::RuleBased:
		return std::make_unique<RuleBasedStrategy>(config.rules);
	case ClassificationMethod::DbscanClustering:
		return std::make_unique<DbscanStrategy>(config);
	case ClassificationMethod::KmeansClustering:
		return std::make_unique<KMeansStrategy>(config);
	case ClassificationMethod::Hybrid:
		return std::make_unique<HybridStrategy>(config);
	}
	throw core::ConfigurationError("Unknown classification method");
}

ClassificationBatch ItemClassifier::classify(const std::vector<ItemMetrics> &items, ClassificationMethod method) const {
	const auto strategy = makeStrategy(method, config_);
	return classify(items, *strategy);
}

ClassificationBatch ItemClassifier::classify(const std::vector<ItemMetrics> &items, const std::string &method) const {
	return classify(items, core::parseClassificationMethod(method));
}

ClassificationBatch ItemClassifier::classify(const std::vector<ItemMetrics> &items,
                                             const ClassificationStrategy &strategy) const {
	STOCKWISE_INFO("Starting item classification using {} method ({} items)", core::toString(strategy.method()),
	               items.size());

	ClassificationBatch batch;
	batch.method = strategy.method();
	if (items.empty()) {
		return batch;
	}

	auto prepared = preparer_.prepareBatch(items);
	batch.errors = std::move(prepared.errors);

	std::vector<PreparedItem> working;
	if (strategy.requiresEligibleItems()) {
		working = features::FeaturePreparer::mlEligible(prepared.items);
		batch.excluded = prepared.items.size() - working.size();
	} else {
		working = std::move(prepared.items);
	}

	if (working.empty()) {
		STOCKWISE_WARN("No valid items to classify");
		return batch;
	}

	// Batch-wide fit completes before any item is classified.
	const RuleBasedStrategy fallback(config_.rules);
	const ClassificationStrategy *active = &strategy;
	BatchModel model;
	try {
		model = strategy.fit(working);
	} catch (const core::ConfigurationError &) {
		throw;
	} catch (const std::exception &e) {
		STOCKWISE_WARN("{} model unavailable ({}); falling back to RULE_BASED for {} items",
		               core::toString(strategy.method()), e.what(), working.size());
		active = &fallback;
		batch.fallbacks = working.size();
		model = BatchModel {};
	}
	batch.silhouette = model.silhouette;

	std::vector<ItemSlot> slots(working.size());
	const std::size_t workers = std::min(config_.worker_threads, working.size());
	if (workers <= 1) {
		classifyRange(*active, model, working, 0, working.size(), slots);
	} else {
		const std::size_t chunk = (working.size() + workers - 1) / workers;
		std::vector<std::future<void>> tasks;
		tasks.reserve(workers);
		for (std::size_t begin = 0; begin < working.size(); begin += chunk) {
			const std::size_t end = std::min(begin + chunk, working.size());
			tasks.push_back(std::async(std::launch::async, [this, active, &model, &working, begin, end, &slots]() {
				classifyRange(*active, model, working, begin, end, slots);
			}));
		}
		for (auto &task : tasks) {
			task.get();
		}
	}

	// Items a clustering strategy degraded to the rules on its own.
	const bool count_degraded = active == &strategy && strategy.method() != ClassificationMethod::RuleBased;

	batch.results.reserve(working.size());
	for (auto &slot : slots) {
		if (slot.result) {
			if (count_degraded && slot.result->method == ClassificationMethod::RuleBased) {
				++batch.fallbacks;
			}
			batch.results.push_back(std::move(*slot.result));
		} else if (slot.error) {
			batch.errors.push_back(std::move(*slot.error));
		}
	}

	STOCKWISE_INFO("Classified {} items ({} excluded, {} errors, {} fallbacks)", batch.results.size(), batch.excluded,
	               batch.errors.size(), batch.fallbacks);
	return batch;
}

void ItemClassifier::classifyRange(const ClassificationStrategy &strategy, const BatchModel &model,
                                   const std::vector<PreparedItem> &items, std::size_t begin, std::size_t end,
                                   std::vector<ItemSlot> &slots) const {
	for (std::size_t i = begin; i < end; ++i) {
		try {
			slots[i].result = builder_.build(items[i], strategy.classify(model, i, items[i]));
		} catch (const std::exception &e) {
			STOCKWISE_WARN("Item {}: classification failed: {}", items[i].item_code, e.what());
			slots[i].error = ItemError {items[i].item_code, e.what()};
		}
	}
}

} // namespace stockwise::classification
