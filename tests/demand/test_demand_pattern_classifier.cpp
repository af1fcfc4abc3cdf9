#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "common/inventory_fixtures.hpp"
#include "stockwise/core/errors.hpp"
#include "stockwise/demand/demand_pattern_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

using namespace stockwise::demand;
using stockwise::core::ConfigurationError;
using stockwise::core::DataError;
using stockwise::core::DemandPattern;
using stockwise::core::ForecastMethod;
using tests::fixtures::sampleDemand;

namespace {

const MonthlySeries kPumpA {100, 110, 105, 120, 95, 115, 108, 112, 100, 110, 105, 115};
const MonthlySeries kNineOfTwelve {10, 10, 10, 0, 10, 10, 0, 10, 10, 0, 10, 10};
const MonthlySeries kErratic {100, 5, 100, 5, 100, 5, 100, 5, 100, 60, 30, 10};
const MonthlySeries kLumpy {0, 0, 0, 0, 0, 200, 0, 0, 0, 0, 0, 5};
const MonthlySeries kNoDemand {};

double populationStd(const MonthlySeries &series) {
	double mean = 0.0;
	for (double v : series) {
		mean += v;
	}
	mean /= 12.0;
	double sum_sq = 0.0;
	for (double v : series) {
		sum_sq += (v - mean) * (v - mean);
	}
	return std::sqrt(sum_sq / 12.0);
}

} // namespace

TEST_CASE("Steady pump demand is SMOOTH", "[demand][sbc][e2e]") {
	DemandPatternClassifier classifier;
	const auto pattern = classifier.classifyPattern(kPumpA);
	REQUIRE(pattern.pattern == DemandPattern::Smooth);
	REQUIRE(pattern.adi == Catch::Approx(1.0));
	REQUIRE(pattern.cv_squared < 0.49);

	const auto forecast = classifier.forecast(kPumpA, pattern.pattern);
	REQUIRE(forecast.method == ForecastMethod::MovingAverage);
	REQUIRE(forecast.value == Catch::Approx(1295.0 / 12.0));
	REQUIRE_THAT(forecast.value, Catch::Matchers::WithinAbs(108.33, 0.5));

	const double spread = 1.96 * populationStd(kPumpA);
	REQUIRE(forecast.lower == Catch::Approx(1295.0 / 12.0 - spread));
	REQUIRE(forecast.upper == Catch::Approx(1295.0 / 12.0 + spread));
}

TEST_CASE("Nine equal months sit just past the ADI boundary", "[demand][sbc][boundary]") {
	DemandPatternClassifier classifier;
	const auto pattern = classifier.classifyPattern(kNineOfTwelve);
	REQUIRE(pattern.adi == Catch::Approx(12.0 / 9.0));
	REQUIRE(pattern.cv_squared == Catch::Approx(0.0));
	REQUIRE(pattern.pattern == DemandPattern::Intermittent);

	const auto forecast = classifier.forecast(kNineOfTwelve, pattern.pattern);
	REQUIRE(forecast.method == ForecastMethod::Crostons);
	REQUIRE(forecast.value == Catch::Approx(10.0 / 9.0 * 30.0));
	REQUIRE(forecast.lower == 0.0);
	REQUIRE(forecast.upper == Catch::Approx(2.0 * 10.0 / 9.0 * 30.0));
}

TEST_CASE("Volatile frequent demand is ERRATIC", "[demand][sbc]") {
	DemandPatternClassifier classifier;
	const auto pattern = classifier.classifyPattern(kErratic);
	REQUIRE(pattern.pattern == DemandPattern::Erratic);

	const auto forecast = classifier.forecast(kErratic, pattern.pattern);
	REQUIRE(forecast.method == ForecastMethod::WeightedAverage);
	REQUIRE(forecast.value == Catch::Approx(26.0));
	REQUIRE(forecast.lower == Catch::Approx(13.0));
	REQUIRE(forecast.upper == Catch::Approx(39.0));
}

TEST_CASE("Rare spiky demand is LUMPY", "[demand][sbc]") {
	DemandPatternClassifier classifier;
	const auto pattern = classifier.classifyPattern(kLumpy);
	REQUIRE(pattern.pattern == DemandPattern::Lumpy);
	REQUIRE(pattern.adi == Catch::Approx(6.0));

	const auto forecast = classifier.forecast(kLumpy, pattern.pattern);
	REQUIRE(forecast.method == ForecastMethod::ExponentialSmoothing);
	REQUIRE(forecast.value == Catch::Approx(102.5));
	REQUIRE(forecast.upper == Catch::Approx(307.5));
}

TEST_CASE("A series without demand is LUMPY with unit demand", "[demand][sbc][edge]") {
	DemandPatternClassifier classifier;
	const auto pattern = classifier.classifyPattern(kNoDemand);
	REQUIRE(pattern.pattern == DemandPattern::Lumpy);
	REQUIRE(pattern.adi == 0.0);
	REQUIRE(pattern.cv_squared == 0.0);

	const auto forecast = classifier.forecast(kNoDemand, pattern.pattern);
	REQUIRE(forecast.value == Catch::Approx(1.0));
	REQUIRE(forecast.upper == Catch::Approx(3.0));

	const auto rop = classifier.calculateRop(kNoDemand, pattern.pattern);
	REQUIRE(rop.safety_stock == 0.0);
	REQUIRE(rop.reorder_point == Catch::Approx(7.0 / 30.0));
	REQUIRE(rop.economic_order_qty == Catch::Approx(std::sqrt(6000.0)));
}

TEST_CASE("Reorder point combines lead time demand and safety stock", "[demand][rop]") {
	DemandPatternClassifier classifier;
	const auto rop = classifier.calculateRop(kPumpA, DemandPattern::Smooth);

	const double avg_monthly = 1295.0 / 12.0;
	const double safety = 1.65 * populationStd(kPumpA) * std::sqrt(7.0);
	REQUIRE(rop.avg_daily_demand == Catch::Approx(avg_monthly / 30.0));
	REQUIRE(rop.demand_during_lead_time == Catch::Approx(avg_monthly / 30.0 * 7.0));
	REQUIRE(rop.z_score == 1.65);
	REQUIRE(rop.safety_stock == Catch::Approx(safety));
	REQUIRE(rop.reorder_point == Catch::Approx(avg_monthly / 30.0 * 7.0 + safety));

	const double eoq = std::sqrt(2.0 * avg_monthly * 12.0 * 50.0 / 0.20);
	REQUIRE(rop.economic_order_qty == Catch::Approx(eoq));
	REQUIRE(rop.order_frequency == Catch::Approx(avg_monthly * 12.0 / eoq));
	REQUIRE(rop.recommended_order_qty == Catch::Approx(std::max(eoq, rop.reorder_point)));
}

TEST_CASE("Safety stock z-score depends on the pattern", "[demand][rop]") {
	DemandPatternClassifier classifier;
	REQUIRE(classifier.calculateRop(kPumpA, DemandPattern::Erratic).z_score == 2.33);
	REQUIRE(classifier.calculateRop(kPumpA, DemandPattern::Intermittent).z_score == 2.33);
	REQUIRE(classifier.calculateRop(kPumpA, DemandPattern::Lumpy).z_score == 2.58);
}

TEST_CASE("Lead time can be supplied per call", "[demand][rop]") {
	DemandPatternClassifier classifier;
	const auto immediate = classifier.calculateRop(kPumpA, DemandPattern::Smooth, 0.0);
	REQUIRE(immediate.safety_stock == 0.0);
	REQUIRE(immediate.reorder_point == 0.0);

	const auto longer = classifier.calculateRop(kPumpA, DemandPattern::Smooth, 28.0);
	const auto standard = classifier.calculateRop(kPumpA, DemandPattern::Smooth);
	REQUIRE(longer.safety_stock == Catch::Approx(standard.safety_stock * 2.0));

	REQUIRE_THROWS_AS(classifier.calculateRop(kPumpA, DemandPattern::Smooth, -1.0), ConfigurationError);
}

TEST_CASE("Recommendations are fixed per pattern", "[demand][recommendation]") {
	const auto smooth = DemandPatternClassifier::recommend(DemandPattern::Smooth);
	REQUIRE(smooth.action == "REGULAR_ORDERING - Implement standard reorder cycle");
	REQUIRE(smooth.priority == 2);
	REQUIRE(smooth.guidance.size() == 3);

	REQUIRE(DemandPatternClassifier::recommend(DemandPattern::Erratic).priority == 5);
	REQUIRE(DemandPatternClassifier::recommend(DemandPattern::Intermittent).priority == 4);

	const auto lumpy = DemandPatternClassifier::recommend(DemandPattern::Lumpy);
	REQUIRE(lumpy.action == "SPECIAL_ORDERING - Collaborate on demand planning");
	REQUIRE(lumpy.priority == 8);
	REQUIRE(lumpy.guidance.size() == 4);
}

TEST_CASE("Monthly series must have twelve valid values", "[demand][validation]") {
	REQUIRE_THROWS_AS(toMonthlySeries(std::vector<double>(11, 1.0)), DataError);
	REQUIRE_THROWS_AS(toMonthlySeries(std::vector<double>(13, 1.0)), DataError);

	std::vector<double> negative(12, 1.0);
	negative[4] = -2.0;
	REQUIRE_THROWS_AS(toMonthlySeries(negative), DataError);

	std::vector<double> missing(12, 1.0);
	missing[0] = std::numeric_limits<double>::quiet_NaN();
	REQUIRE_THROWS_AS(toMonthlySeries(missing), DataError);

	REQUIRE(toMonthlySeries(std::vector<double>(12, 3.0))[11] == 3.0);
}

TEST_CASE("Analysis attaches identifiers and summary statistics", "[demand][analyze]") {
	DemandPatternClassifier classifier;
	const auto result = classifier.analyze(sampleDemand().front());

	REQUIRE(result.item_code == "HYD-001");
	REQUIRE(result.item_name == "Pump A");
	REQUIRE(result.classification.pattern == DemandPattern::Smooth);
	REQUIRE(result.avg_monthly_demand == Catch::Approx(1295.0 / 12.0));
	REQUIRE(result.std_dev_demand == Catch::Approx(populationStd(kPumpA)));
	REQUIRE(result.demand_variability == Catch::Approx(populationStd(kPumpA) / (1295.0 / 12.0) * 100.0));
	REQUIRE(result.recommendation.priority == 2);
}

TEST_CASE("Analysis of a series without demand has zero variability", "[demand][analyze][edge]") {
	DemandPatternClassifier classifier;
	const auto result = classifier.analyze({"NONE", "No demand", std::vector<double>(12, 0.0)});
	REQUIRE(result.avg_monthly_demand == 0.0);
	REQUIRE(result.demand_variability == 0.0);
	REQUIRE(result.recommendation.priority == 8);
}

TEST_CASE("Batch analysis isolates malformed series", "[demand][analyze][batch]") {
	DemandPatternClassifier classifier;
	auto series = sampleDemand();
	series.push_back({"SHORT", "Short history", {1, 2, 3}});

	const auto batch = classifier.analyzeAll(series);
	REQUIRE(batch.results.size() == 4);
	REQUIRE(batch.errors.size() == 1);
	REQUIRE(batch.errors.front().item_code == "SHORT");
	REQUIRE(batch.results[2].item_code == "HYD-003");
}

TEST_CASE("Demand configuration is read from flat parameters", "[demand][config]") {
	const auto config = DemandPatternConfig::fromParams({{"lead_time_days", 14.0}, {"forecast_days", 60.0}});
	REQUIRE(config.lead_time_days == 14.0);
	REQUIRE(config.adi_threshold == 1.32);
	REQUIRE(config.toParams().size() == 11);

	DemandPatternClassifier classifier(config);
	const auto forecast = classifier.forecast(kPumpA, DemandPattern::Smooth);
	REQUIRE(forecast.value == Catch::Approx(2.0 * 1295.0 / 12.0));

	REQUIRE_THROWS_AS(DemandPatternConfig::fromParams({{"service_level", 0.95}}), ConfigurationError);
	REQUIRE_THROWS_AS(DemandPatternConfig::fromParams({{"holding_cost_rate", 0.0}}), ConfigurationError);
}

TEST_CASE("Custom SBC thresholds move the boundary", "[demand][config]") {
	DemandPatternConfig config;
	config.adi_threshold = 1.4;
	DemandPatternClassifier classifier(config);
	REQUIRE(classifier.classifyPattern(kNineOfTwelve).pattern == DemandPattern::Smooth);
}
