#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/inventory_fixtures.hpp"
#include "stockwise/classification/rule_engine.hpp"
#include "stockwise/features/feature_preparer.hpp"

using stockwise::classification::RuleEngine;
using stockwise::classification::RuleThresholds;
using stockwise::core::ItemClass;
using stockwise::core::PreparedItem;
using stockwise::features::FeaturePreparer;
using tests::fixtures::makeItem;
using tests::fixtures::sampleItems;
using tests::fixtures::withFeatures;

namespace {

PreparedItem prepare(const stockwise::core::ItemMetrics &item) {
	return FeaturePreparer().prepare(item);
}

} // namespace

TEST_CASE("Rules are listed in precedence order", "[classification][rules]") {
	RuleEngine engine;
	const auto &rules = engine.rules();
	REQUIRE(rules.size() == 5);
	REQUIRE(rules[0].name == "new_item");
	REQUIRE(rules[1].name == "dead_stock");
	REQUIRE(rules[2].name == "fast");
	REQUIRE(rules[3].name == "slow");
	REQUIRE(rules[4].name == "medium");
}

TEST_CASE("New item rule precedes dead stock rule", "[classification][rules][precedence]") {
	RuleEngine engine;
	const auto outcome = engine.evaluate(prepare(makeItem("NEW", 5, 100, 50, 500, 10, 300)));
	REQUIRE(outcome.label == ItemClass::NewItem);
	REQUIRE(outcome.rule == "new_item");
	REQUIRE(outcome.confidence == Catch::Approx(0.99));
}

TEST_CASE("Sample items follow the business rules", "[classification][rules]") {
	RuleEngine engine;
	const auto items = sampleItems();

	const auto pump = engine.evaluate(prepare(items[0]));
	REQUIRE(pump.label == ItemClass::Fast);
	REQUIRE(pump.confidence == Catch::Approx(0.99));
	REQUIRE(pump.reason == "Velocity 6.80 units/day, Turnover 12.50");

	REQUIRE(engine.evaluate(prepare(items[1])).label == ItemClass::Medium);
	REQUIRE(engine.evaluate(prepare(items[2])).label == ItemClass::DeadStock);
	REQUIRE(engine.evaluate(prepare(items[3])).label == ItemClass::NewItem);
	REQUIRE(engine.evaluate(prepare(items[4])).label == ItemClass::NewItem);
}

TEST_CASE("Dead stock also covers negligible annual sales", "[classification][rules]") {
	RuleEngine engine;
	const auto outcome = engine.evaluate(prepare(makeItem("LOW", 5, 50, 20, 200, 400, 10)));
	REQUIRE(outcome.label == ItemClass::DeadStock);
	REQUIRE(outcome.confidence == Catch::Approx(0.95));
}

TEST_CASE("FAST confidence grows with velocity and turnover", "[classification][rules]") {
	RuleEngine engine;
	auto item = withFeatures(makeItem("F", 1100, 11000, 1000, 5000, 400, 3), 3.0, 1.1, 50, 0);
	const auto outcome = engine.evaluate(prepare(item));
	REQUIRE(outcome.label == ItemClass::Fast);
	REQUIRE(outcome.confidence == Catch::Approx((70.0 + 15.0 + 11.0) / 100.0));
}

TEST_CASE("SLOW requires both low velocity and a recent sale", "[classification][rules]") {
	RuleEngine engine;
	auto slow = withFeatures(makeItem("S", 100, 1000, 50, 500, 400, 20), 0.27, 2.0, 50, 0);
	REQUIRE(engine.evaluate(prepare(slow)).label == ItemClass::Slow);
	REQUIRE(engine.evaluate(prepare(slow)).confidence == Catch::Approx(0.85));

	auto stale = withFeatures(makeItem("M", 100, 1000, 50, 500, 400, 90), 0.27, 2.0, 50, 0);
	REQUIRE(engine.evaluate(prepare(stale)).label == ItemClass::Medium);
}

TEST_CASE("Custom thresholds change the rule boundaries", "[classification][rules]") {
	RuleThresholds thresholds;
	thresholds.new_item_max_age_days = 5.0;
	RuleEngine engine(thresholds);
	const auto outcome = engine.evaluate(prepare(makeItem("NEW", 5, 100, 50, 500, 10, 300)));
	REQUIRE(outcome.label == ItemClass::DeadStock);
}
