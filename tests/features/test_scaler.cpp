#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/inventory_fixtures.hpp"
#include "stockwise/features/feature_preparer.hpp"
#include "stockwise/features/scaler.hpp"

using namespace stockwise::features;
using tests::fixtures::sampleItems;

namespace {

std::vector<stockwise::core::PreparedItem> preparedSample() {
	return FeaturePreparer().prepareBatch(sampleItems()).items;
}

} // namespace

TEST_CASE("Feature matrix follows the requested column order", "[features][scaler]") {
	const auto items = preparedSample();
	const auto matrix = featureMatrix(items, {FeatureColumn::TurnoverRatio, FeatureColumn::SalesVelocity});

	REQUIRE(matrix.rows() == 5);
	REQUIRE(matrix.cols() == 2);
	REQUIRE(matrix(0, 0) == Catch::Approx(12.5));
	REQUIRE(matrix(0, 1) == Catch::Approx(6.8));
}

TEST_CASE("Standardized columns have zero mean and unit variance", "[features][scaler]") {
	const auto items = preparedSample();
	const std::vector<FeatureColumn> columns {FeatureColumn::SalesVelocity, FeatureColumn::TurnoverRatio,
	                                          FeatureColumn::DaysSinceLastSale, FeatureColumn::AnnualSalesValue};
	const auto params = fitScaler(items, columns);
	const auto scaled = standardize(params, items);

	REQUIRE(params.dimensions() == 4);
	for (Eigen::Index col = 0; col < scaled.cols(); ++col) {
		const double mean = scaled.col(col).mean();
		const double variance = scaled.col(col).array().square().mean() - mean * mean;
		REQUIRE(mean == Catch::Approx(0.0).margin(1e-9));
		REQUIRE(variance == Catch::Approx(1.0));
	}
}

TEST_CASE("Constant columns keep a unit scale", "[features][scaler]") {
	auto items = preparedSample();
	items.resize(1);
	const auto params = fitScaler(items, {FeatureColumn::SalesVelocity, FeatureColumn::AnnualSalesValue});
	const auto scaled = standardize(params, items);

	REQUIRE(params.scale(0) == 1.0);
	REQUIRE(params.scale(1) == 1.0);
	REQUIRE(scaled.isZero());
}

TEST_CASE("Fitted parameters transform other matrices", "[features][scaler]") {
	const auto items = preparedSample();
	const auto params = fitScaler(items, {FeatureColumn::SalesVelocity});

	Eigen::MatrixXd sample(1, 1);
	sample << params.mean(0) + params.scale(0);
	REQUIRE(applyScaler(params, sample)(0, 0) == Catch::Approx(1.0));

	Eigen::MatrixXd wrong(1, 2);
	wrong.setZero();
	REQUIRE_THROWS_AS(applyScaler(params, wrong), std::invalid_argument);
}

TEST_CASE("Fitting an empty batch is rejected", "[features][scaler]") {
	REQUIRE_THROWS_AS(fitScaler({}, {FeatureColumn::SalesVelocity}), std::invalid_argument);
}
