#pragma once

#include "stockwise/core/item_metrics.hpp"

#include <vector>

namespace stockwise::features {

/**
 * @brief Result of preparing a batch: cleaned items in input order and the
 * items that could not be prepared.
 */
struct PreparedBatch {
	std::vector<core::PreparedItem> items;
	std::vector<core::ItemError> errors;
};

/**
 * @class FeaturePreparer
 * @brief Cleans raw item metrics and derives velocity, turnover and consistency.
 *
 * Missing or non-finite required fields become 0 (with a warning). Negative
 * quantities, ages or day counts are rejected with core::DataError.
 */
class FeaturePreparer {
public:
	explicit FeaturePreparer(double default_consistency_score = 50.0);

	/// @throws core::DataError for negative stock, sales, age or dormancy values.
	core::PreparedItem prepare(const core::ItemMetrics &item) const;

	/// Prepares every item; failures are logged and collected, never thrown.
	PreparedBatch prepareBatch(const std::vector<core::ItemMetrics> &items) const;

	/// Splits prepared items into the ML-eligible subset (annual sales > 0).
	static std::vector<core::PreparedItem> mlEligible(const std::vector<core::PreparedItem> &items);

private:
	double default_consistency_score_;
};

} // namespace stockwise::features
