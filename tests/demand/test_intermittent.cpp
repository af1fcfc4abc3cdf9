#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "stockwise/demand/intermittent.hpp"

#include <vector>

using namespace stockwise::demand::intermittent;

TEST_CASE("extractDemand filters zero values", "[demand][intermittent]") {
	std::vector<double> data {0.0, 1.0, 0.0, 2.0, 3.0, 0.0};
	auto demand = extractDemand(data);

	REQUIRE(demand.size() == 3);
	REQUIRE(demand[0] == 1.0);
	REQUIRE(demand[1] == 2.0);
	REQUIRE(demand[2] == 3.0);
	REQUIRE(extractDemand({0.0, 0.0}).empty());
}

TEST_CASE("computeIntervals calculates intervals correctly", "[demand][intermittent]") {
	std::vector<double> data {0.0, 1.0, 0.0, 0.0, 2.0, 0.0, 3.0};
	auto intervals = computeIntervals(data);

	REQUIRE(intervals.size() == 3);
	REQUIRE(intervals[0] == 2.0); // First nonzero at index 1 (1-based 2)
	REQUIRE(intervals[1] == 3.0);
	REQUIRE(intervals[2] == 2.0);
	REQUIRE(computeIntervals({0.0, 0.0, 0.0}).empty());
}

TEST_CASE("Average demand interval counts periods per demand", "[demand][intermittent]") {
	std::vector<double> nine_of_twelve {10, 10, 10, 0, 10, 10, 0, 10, 10, 0, 10, 10};
	REQUIRE(averageDemandInterval(nine_of_twelve) == Catch::Approx(12.0 / 9.0));
	REQUIRE(averageDemandInterval(std::vector<double>(12, 0.0)) == 0.0);
	REQUIRE(averageDemandInterval(std::vector<double>(12, 4.0)) == Catch::Approx(1.0));
}

TEST_CASE("Squared CV ignores zero periods", "[demand][intermittent]") {
	REQUIRE(squaredCoefficientOfVariation({10, 0, 10, 0, 10}) == Catch::Approx(0.0));
	// Sizes {10, 30}: mean 20, population std 10.
	REQUIRE(squaredCoefficientOfVariation({0, 10, 0, 30}) == Catch::Approx(0.25));
	REQUIRE(squaredCoefficientOfVariation({0, 0, 0}) == 0.0);
}

TEST_CASE("Recent weighted average applies weights newest first", "[demand][intermittent]") {
	std::vector<double> data {1, 2, 60, 30, 10};
	REQUIRE(recentWeightedAverage(data, {0.5, 0.3, 0.2}) == Catch::Approx(26.0));
	REQUIRE(recentWeightedAverage({10}, {0.5, 0.3, 0.2}) == Catch::Approx(5.0));
}
