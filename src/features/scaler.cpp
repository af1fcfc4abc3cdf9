#include "stockwise/features/scaler.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

using stockwise::core::PreparedItem;

namespace stockwise::features {

namespace {

double columnValue(const PreparedItem &item, FeatureColumn column) {
	switch (column) {
	case FeatureColumn::SalesVelocity:
		return item.sales_velocity;
	case FeatureColumn::TurnoverRatio:
		return item.turnover_ratio;
	case FeatureColumn::DaysSinceLastSale:
		return item.days_since_last_sale;
	case FeatureColumn::AnnualSalesValue:
		return item.annual_sales_value;
	}
	return 0.0;
}

} // namespace

Eigen::MatrixXd featureMatrix(const std::vector<PreparedItem> &items, const std::vector<FeatureColumn> &columns) {
	Eigen::MatrixXd matrix(static_cast<Eigen::Index>(items.size()), static_cast<Eigen::Index>(columns.size()));
	for (std::size_t row = 0; row < items.size(); ++row) {
		for (std::size_t col = 0; col < columns.size(); ++col) {
			matrix(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col)) = columnValue(items[row], columns[col]);
		}
	}
	return matrix;
}

ScalerParams fitScaler(const std::vector<PreparedItem> &items, const std::vector<FeatureColumn> &columns) {
	if (items.empty()) {
		throw std::invalid_argument("Cannot fit scaler on an empty batch");
	}
	if (columns.empty()) {
		throw std::invalid_argument("Cannot fit scaler without feature columns");
	}

	const Eigen::MatrixXd features = featureMatrix(items, columns);
	ScalerParams params;
	params.columns = columns;
	params.mean = features.colwise().mean();

	const Eigen::MatrixXd centered = features.rowwise() - params.mean;
	const double n = static_cast<double>(features.rows());
	const Eigen::RowVectorXd variance = (centered.array().square().colwise().sum() / n).matrix();
	params.scale = variance.array().sqrt().matrix();

	for (Eigen::Index col = 0; col < params.scale.size(); ++col) {
		if (params.scale(col) < std::numeric_limits<double>::epsilon()) {
			params.scale(col) = 1.0;
		}
	}
	return params;
}

Eigen::MatrixXd applyScaler(const ScalerParams &params, const Eigen::MatrixXd &features) {
	if (features.cols() != static_cast<Eigen::Index>(params.dimensions())) {
		throw std::invalid_argument("Feature matrix does not match scaler dimensions");
	}
	Eigen::MatrixXd scaled = features.rowwise() - params.mean;
	return (scaled.array().rowwise() / params.scale.array()).matrix();
}

Eigen::MatrixXd standardize(const ScalerParams &params, const std::vector<PreparedItem> &items) {
	return applyScaler(params, featureMatrix(items, params.columns));
}

} // namespace stockwise::features
