#include <catch2/catch_test_macros.hpp>

#include "stockwise/clustering/dbscan.hpp"

#include <vector>

using stockwise::clustering::DbscanBuilder;
using stockwise::clustering::kNoise;
using stockwise::clustering::PointRole;
using stockwise::core::DistanceMatrix;

namespace {

DistanceMatrix makeSimpleMatrix() {
	DistanceMatrix::Matrix data {{0.0, 0.4, 0.5, 2.0},
	                             {0.4, 0.0, 0.6, 2.1},
	                             {0.5, 0.6, 0.0, 2.2},
	                             {2.0, 2.1, 2.2, 0.0}};
	return DistanceMatrix::fromSquare(std::move(data));
}

} // namespace

TEST_CASE("DBSCAN builder validates parameters", "[clustering][dbscan][builder]") {
	DbscanBuilder builder;
	REQUIRE_THROWS_AS(builder.withEpsilon(-1.0), std::invalid_argument);
	REQUIRE_THROWS_AS(builder.withMinSamples(0), std::invalid_argument);

	auto clusterer = builder.withEpsilon(0.5).withMinSamples(2).build();
	REQUIRE(clusterer->epsilon() == 0.5);
	REQUIRE(clusterer->minSamples() == 2);
}

TEST_CASE("DBSCAN clusters dense neighbourhoods", "[clustering][dbscan]") {
	auto matrix = makeSimpleMatrix();
	auto clusterer = DbscanBuilder().withEpsilon(0.7).withMinSamples(3).build();
	const auto result = clusterer->cluster(matrix);

	REQUIRE(result.labels.size() == 4);
	REQUIRE(result.cluster_count == 1);
	REQUIRE(result.labels[0] == result.labels[1]);
	REQUIRE(result.labels[1] == result.labels[2]);
	REQUIRE(result.isOutlier(3));
	REQUIRE(result.outlierCount() == 1);

	const auto members = result.members();
	REQUIRE(members.size() == 1);
	REQUIRE(members.at(result.labels[0]).size() == 3);
}

TEST_CASE("DBSCAN marks sparse points as noise", "[clustering][dbscan]") {
	auto matrix = makeSimpleMatrix();
	auto clusterer = DbscanBuilder().withEpsilon(0.1).withMinSamples(2).build();
	const auto result = clusterer->cluster(matrix);

	REQUIRE(result.cluster_count == 0);
	REQUIRE(result.outlierCount() == 4);
}

TEST_CASE("A single point is an outlier unless one sample suffices", "[clustering][dbscan]") {
	const auto single = DistanceMatrix::fromSquare({{0.0}});

	const auto default_result = DbscanBuilder().build()->cluster(single);
	REQUIRE(default_result.labels == std::vector<int> {kNoise});

	const auto permissive = DbscanBuilder().withMinSamples(1).build()->cluster(single);
	REQUIRE(permissive.labels == std::vector<int> {0});
}

TEST_CASE("DBSCAN border points join the reaching cluster", "[clustering][dbscan]") {
	// 0-1-2 form a chain; only 1 is a core point with min_samples=3.
	auto matrix = DistanceMatrix::fromSquare({{0.0, 1.0, 2.0}, {1.0, 0.0, 1.0}, {2.0, 1.0, 0.0}});
	const auto result = DbscanBuilder().withEpsilon(1.0).withMinSamples(3).build()->cluster(matrix);

	REQUIRE(result.cluster_count == 1);
	REQUIRE(result.outlierCount() == 0);
	REQUIRE(result.roles == std::vector<PointRole> {PointRole::Border, PointRole::Core, PointRole::Border});
	REQUIRE(result.borderCount() == 2);
}

TEST_CASE("DBSCAN reports the density role of every point", "[clustering][dbscan]") {
	auto matrix = makeSimpleMatrix();
	const auto result = DbscanBuilder().withEpsilon(0.7).withMinSamples(3).build()->cluster(matrix);

	REQUIRE(result.roles.size() == 4);
	REQUIRE(result.roles[0] == PointRole::Core);
	REQUIRE(result.roles[1] == PointRole::Core);
	REQUIRE(result.roles[2] == PointRole::Core);
	REQUIRE(result.roles[3] == PointRole::Outlier);
	REQUIRE(result.borderCount() == 0);
	REQUIRE(result.outliers() == std::vector<std::size_t> {3});
	REQUIRE(result.labels[3] == kNoise);
}
