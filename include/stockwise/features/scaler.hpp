#pragma once

#include "stockwise/core/item_metrics.hpp"

#include <Eigen/Dense>

#include <vector>

namespace stockwise::features {

/// Numeric features that clustering strategies may select.
enum class FeatureColumn { SalesVelocity, TurnoverRatio, DaysSinceLastSale, AnnualSalesValue };

/**
 * @struct ScalerParams
 * @brief Per-column mean and population standard deviation fitted over one batch.
 *
 * The value is computed once per batch before any item is assigned to a
 * cluster and is then passed explicitly to every transform.
 */
struct ScalerParams {
	std::vector<FeatureColumn> columns;
	Eigen::RowVectorXd mean;
	Eigen::RowVectorXd scale;

	std::size_t dimensions() const noexcept {
		return columns.size();
	}
};

/// Builds the (items x columns) feature matrix.
Eigen::MatrixXd featureMatrix(const std::vector<core::PreparedItem> &items, const std::vector<FeatureColumn> &columns);

/**
 * @brief Fits zero-mean / unit-variance parameters over @p items.
 *
 * Columns with zero variance get a scale of 1, so a batch of one item
 * standardizes to the origin.
 * @throws std::invalid_argument if @p items or @p columns is empty.
 */
ScalerParams fitScaler(const std::vector<core::PreparedItem> &items, const std::vector<FeatureColumn> &columns);

/// Standardizes @p features with previously fitted parameters.
Eigen::MatrixXd applyScaler(const ScalerParams &params, const Eigen::MatrixXd &features);

/// featureMatrix followed by applyScaler.
Eigen::MatrixXd standardize(const ScalerParams &params, const std::vector<core::PreparedItem> &items);

} // namespace stockwise::features
