#include <catch2/catch_test_macros.hpp>

#include "common/inventory_fixtures.hpp"
#include "stockwise/classification/hybrid_strategy.hpp"
#include "stockwise/classification/item_classifier.hpp"
#include "stockwise/classification/rule_based_strategy.hpp"
#include "stockwise/core/errors.hpp"

#include <stdexcept>

using namespace stockwise::classification;
using stockwise::core::ClassificationMethod;
using stockwise::core::ConfigurationError;
using stockwise::core::InventoryAction;
using stockwise::core::ItemClass;
using stockwise::core::PreparedItem;
using tests::fixtures::makeItem;
using tests::fixtures::sampleItems;
using tests::fixtures::withFeatures;

namespace {

/// Clustering stand-in whose model can never be built.
class UnavailableStrategy final : public ClassificationStrategy {
public:
	ClassificationMethod method() const override {
		return ClassificationMethod::KmeansClustering;
	}
	bool requiresEligibleItems() const override {
		return true;
	}
	BatchModel fit(const std::vector<PreparedItem> &) const override {
		throw std::runtime_error("clustering backend unavailable");
	}
	Classification classify(const BatchModel &, std::size_t, const PreparedItem &) const override {
		throw std::logic_error("classify without a model");
	}
};

class MisconfiguredStrategy final : public ClassificationStrategy {
public:
	ClassificationMethod method() const override {
		return ClassificationMethod::DbscanClustering;
	}
	bool requiresEligibleItems() const override {
		return true;
	}
	BatchModel fit(const std::vector<PreparedItem> &) const override {
		throw ConfigurationError("bad clustering parameters");
	}
	Classification classify(const BatchModel &, std::size_t, const PreparedItem &) const override {
		return {};
	}
};

/// Rule strategy that fails on one item code.
class FlakyStrategy final : public ClassificationStrategy {
public:
	explicit FlakyStrategy(std::string failing_code) : failing_code_(std::move(failing_code)) {
	}
	ClassificationMethod method() const override {
		return ClassificationMethod::RuleBased;
	}
	bool requiresEligibleItems() const override {
		return false;
	}
	BatchModel fit(const std::vector<PreparedItem> &items) const override {
		return rules_.fit(items);
	}
	Classification classify(const BatchModel &model, std::size_t index, const PreparedItem &item) const override {
		if (item.item_code == failing_code_) {
			throw std::runtime_error("corrupt record");
		}
		return rules_.classify(model, index, item);
	}

private:
	std::string failing_code_;
	RuleBasedStrategy rules_;
};

/// Full-batch hybrid whose clustering only covers the first item of the batch.
class PartialHybridStrategy final : public ClassificationStrategy {
public:
	PartialHybridStrategy() : hybrid_(fullBatchConfig()) {
	}
	ClassificationMethod method() const override {
		return ClassificationMethod::Hybrid;
	}
	bool requiresEligibleItems() const override {
		return true;
	}
	BatchModel fit(const std::vector<PreparedItem> &items) const override {
		auto model = hybrid_.fit(items);
		model.cluster_labels.resize(1);
		model.point_roles.resize(1);
		return model;
	}
	Classification classify(const BatchModel &model, std::size_t index, const PreparedItem &item) const override {
		return hybrid_.classify(model, index, item);
	}

private:
	static ClassificationConfig fullBatchConfig() {
		ClassificationConfig config;
		config.hybrid_full_batch_dbscan = true;
		return config;
	}

	HybridStrategy hybrid_;
};

} // namespace

TEST_CASE("Rule based classification of the sample batch", "[classification][classifier]") {
	ItemClassifier classifier;
	const auto batch = classifier.classify(sampleItems(), ClassificationMethod::RuleBased);

	REQUIRE(batch.method == ClassificationMethod::RuleBased);
	REQUIRE(batch.results.size() == 5);
	REQUIRE(batch.skipped() == 0);
	REQUIRE(batch.results[0].classification == ItemClass::Fast);
	REQUIRE(batch.results[1].classification == ItemClass::Medium);
	REQUIRE(batch.results[2].classification == ItemClass::DeadStock);
	REQUIRE(batch.results[3].classification == ItemClass::NewItem);
	REQUIRE(batch.results[4].classification == ItemClass::NewItem);
}

TEST_CASE("Fast moving pump gets more stock", "[classification][classifier][e2e]") {
	auto pump = withFeatures(makeItem("HYD-001", 2500, 125000, 200, 10000, 400, 2), 6.8, 12.5, 85, 15);
	ItemClassifier classifier;
	const auto batch = classifier.classify({pump}, "rule_based");

	REQUIRE(batch.results.size() == 1);
	const auto &result = batch.results.front();
	REQUIRE(result.classification == ItemClass::Fast);
	REQUIRE(result.action_priority == 8);
	REQUIRE(result.recommended_action == InventoryAction::IncreaseStock);
	REQUIRE(result.confidence == 99);
	REQUIRE(result.method == ClassificationMethod::RuleBased);
}

TEST_CASE("Young items are NEW_ITEM even when dormant", "[classification][classifier][precedence]") {
	ItemClassifier classifier;
	const auto batch = classifier.classify({makeItem("YOUNG", 5, 100, 50, 500, 10, 300)}, "rule_based");
	REQUIRE(batch.results.front().classification == ItemClass::NewItem);
}

TEST_CASE("Repeated classification is deterministic", "[classification][classifier][determinism]") {
	ItemClassifier classifier;
	const auto items = sampleItems();
	for (auto method : {ClassificationMethod::RuleBased, ClassificationMethod::DbscanClustering,
	                    ClassificationMethod::KmeansClustering, ClassificationMethod::Hybrid}) {
		const auto first = classifier.classify(items, method);
		const auto second = classifier.classify(items, method);
		REQUIRE(first.results.size() == second.results.size());
		for (std::size_t i = 0; i < first.results.size(); ++i) {
			REQUIRE(first.results[i].item_code == second.results[i].item_code);
			REQUIRE(first.results[i].classification == second.results[i].classification);
			REQUIRE(first.results[i].confidence == second.results[i].confidence);
			REQUIRE(first.results[i].reason == second.results[i].reason);
			REQUIRE(first.results[i].expected_impact == second.results[i].expected_impact);
		}
	}
}

TEST_CASE("Every strategy yields bounded confidences and valid labels", "[classification][classifier]") {
	ItemClassifier classifier;
	for (const std::string method : {"rule_based", "dbscan", "kmeans", "hybrid"}) {
		const auto batch = classifier.classify(sampleItems(), method);
		REQUIRE(batch.results.size() == 5);
		for (const auto &result : batch.results) {
			REQUIRE(result.confidence >= 0);
			REQUIRE(result.confidence <= 100);
			REQUIRE(result.action_priority >= 1);
			REQUIRE(result.action_priority <= 10);
		}
	}
}

TEST_CASE("Unknown strategy names fail immediately", "[classification][classifier][errors]") {
	ItemClassifier classifier;
	REQUIRE_THROWS_AS(classifier.classify(sampleItems(), "xgboost"), ConfigurationError);
}

TEST_CASE("Invalid configuration is rejected at construction", "[classification][classifier][errors]") {
	ClassificationConfig config;
	config.hybrid_rule_weight = 1.5;
	REQUIRE_THROWS_AS(ItemClassifier(config), ConfigurationError);
}

TEST_CASE("Clustering strategies skip items without sales", "[classification][classifier][eligibility]") {
	ItemClassifier classifier;
	auto items = sampleItems();
	items.push_back(makeItem("IDLE", 0, 0, 40, 400, 500, 400));

	const auto clustered = classifier.classify(items, ClassificationMethod::DbscanClustering);
	REQUIRE(clustered.results.size() == 5);
	REQUIRE(clustered.excluded == 1);
	REQUIRE(clustered.skipped() == 1);

	const auto rules = classifier.classify(items, ClassificationMethod::RuleBased);
	REQUIRE(rules.results.size() == 6);
	REQUIRE(rules.excluded == 0);
	REQUIRE(rules.results.back().classification == ItemClass::DeadStock);
}

TEST_CASE("Malformed items are reported, not fatal", "[classification][classifier][errors]") {
	ItemClassifier classifier;
	auto items = sampleItems();
	items[1].annual_sales_qty = -10.0;

	const auto batch = classifier.classify(items, ClassificationMethod::Hybrid);
	REQUIRE(batch.results.size() == 4);
	REQUIRE(batch.errorCount() == 1);
	REQUIRE(batch.errors.front().item_code == "HYD-002");
}

TEST_CASE("Per-item failures are isolated", "[classification][classifier][errors]") {
	ItemClassifier classifier;
	const auto batch = classifier.classify(sampleItems(), FlakyStrategy("HYD-003"));

	REQUIRE(batch.results.size() == 4);
	REQUIRE(batch.errorCount() == 1);
	REQUIRE(batch.errors.front().item_code == "HYD-003");
	REQUIRE(batch.errors.front().message == "corrupt record");
	REQUIRE(batch.results[2].item_code == "HYD-004");
}

TEST_CASE("Unavailable models fall back to the business rules", "[classification][classifier][fallback]") {
	ItemClassifier classifier;
	const auto batch = classifier.classify(sampleItems(), UnavailableStrategy());

	REQUIRE(batch.method == ClassificationMethod::KmeansClustering);
	REQUIRE(batch.fallbacks == 5);
	REQUIRE(batch.results.size() == 5);
	REQUIRE_FALSE(batch.silhouette.has_value());
	for (const auto &result : batch.results) {
		REQUIRE(result.method == ClassificationMethod::RuleBased);
	}
	REQUIRE(batch.results[0].classification == ItemClass::Fast);
}

TEST_CASE("Configuration errors from a strategy propagate", "[classification][classifier][errors]") {
	ItemClassifier classifier;
	REQUIRE_THROWS_AS(classifier.classify(sampleItems(), MisconfiguredStrategy()), ConfigurationError);
}

TEST_CASE("Parallel workers preserve input order", "[classification][classifier][parallel]") {
	std::vector<stockwise::core::ItemMetrics> items;
	for (int i = 0; i < 40; ++i) {
		auto base = sampleItems()[static_cast<std::size_t>(i % 5)];
		base.item_code = "ITEM-" + std::to_string(i);
		items.push_back(base);
	}

	ClassificationConfig parallel_config;
	parallel_config.worker_threads = 4;
	const auto serial = ItemClassifier().classify(items, ClassificationMethod::Hybrid);
	const auto parallel = ItemClassifier(parallel_config).classify(items, ClassificationMethod::Hybrid);

	REQUIRE(parallel.results.size() == items.size());
	for (std::size_t i = 0; i < items.size(); ++i) {
		REQUIRE(parallel.results[i].item_code == items[i].item_code);
		REQUIRE(parallel.results[i].classification == serial.results[i].classification);
		REQUIRE(parallel.results[i].confidence == serial.results[i].confidence);
	}
}

TEST_CASE("k-means runs report the silhouette diagnostic", "[classification][classifier][kmeans]") {
	ItemClassifier classifier;
	const auto batch = classifier.classify(sampleItems(), ClassificationMethod::KmeansClustering);
	REQUIRE(batch.silhouette.has_value());
	for (const auto &result : batch.results) {
		REQUIRE(result.method == ClassificationMethod::KmeansClustering);
	}
}

TEST_CASE("Empty batches produce empty results", "[classification][classifier]") {
	ItemClassifier classifier;
	const auto batch = classifier.classify({}, ClassificationMethod::Hybrid);
	REQUIRE(batch.results.empty());
	REQUIRE(batch.skipped() == 0);
}

TEST_CASE("Strategy factory maps every method", "[classification][classifier]") {
	ClassificationConfig config;
	for (auto method : {ClassificationMethod::RuleBased, ClassificationMethod::DbscanClustering,
	                    ClassificationMethod::KmeansClustering, ClassificationMethod::Hybrid}) {
		REQUIRE(ItemClassifier::makeStrategy(method, config)->method() == method);
	}
}

TEST_CASE("Items without a clustering vote are counted as fallbacks", "[classification][classifier][fallback]") {
	ItemClassifier classifier;
	const auto batch = classifier.classify(sampleItems(), PartialHybridStrategy());

	// Only Valve B (MEDIUM at 75%) needs the clustering vote; the rest are confident rule outcomes.
	REQUIRE(batch.results.size() == 5);
	REQUIRE(batch.errorCount() == 0);
	REQUIRE(batch.fallbacks == 1);
	REQUIRE(batch.results[1].method == ClassificationMethod::RuleBased);
	REQUIRE(batch.results[1].classification == ItemClass::Medium);
	REQUIRE(batch.results[1].confidence == 75);
	REQUIRE(batch.results[0].method == ClassificationMethod::Hybrid);
}
