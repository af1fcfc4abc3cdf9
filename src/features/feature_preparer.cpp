#include "stockwise/features/feature_preparer.hpp"

#include "stockwise/core/errors.hpp"
#include "stockwise/utils/logging.hpp"

#include <cmath>
#include <optional>
#include <string>

using stockwise::core::DataError;
using stockwise::core::ItemError;
using stockwise::core::ItemMetrics;
using stockwise::core::PreparedItem;

namespace stockwise::features {

namespace {

constexpr double kDaysPerYear = 365.0;

double requiredField(const ItemMetrics &item, const std::optional<double> &value, const char *field) {
	if (!value.has_value() || !std::isfinite(*value)) {
		STOCKWISE_WARN("Item {}: missing field '{}', defaulting to 0", item.item_code, field);
		return 0.0;
	}
	if (*value < 0.0) {
		throw DataError("Item " + item.item_code + ": field '" + field + "' must be non-negative, got " +
		                std::to_string(*value));
	}
	return *value;
}

std::optional<double> optionalField(const std::optional<double> &value) {
	if (value.has_value() && std::isfinite(*value)) {
		return value;
	}
	return std::nullopt;
}

} // namespace

FeaturePreparer::FeaturePreparer(double default_consistency_score)
    : default_consistency_score_(default_consistency_score) {
}

PreparedItem FeaturePreparer::prepare(const ItemMetrics &item) const {
	PreparedItem prepared;
	prepared.item_code = item.item_code;
	prepared.item_name = item.item_name;
	prepared.uom = item.uom;
	if (item.created_date.has_value()) {
		prepared.created_date = *item.created_date;
	} else {
		STOCKWISE_WARN("Item {}: missing field 'created_date'", item.item_code);
	}

	prepared.annual_sales_qty = requiredField(item, item.annual_sales_qty, "annual_sales_qty");
	prepared.annual_sales_value = requiredField(item, item.annual_sales_value, "annual_sales_value");
	prepared.current_stock = requiredField(item, item.current_stock, "current_stock");
	prepared.stock_value = requiredField(item, item.stock_value, "stock_value");
	prepared.item_age_days = requiredField(item, item.item_age_days, "item_age_days");
	prepared.days_since_last_sale = requiredField(item, item.days_since_last_sale, "days_since_last_sale");

	if (auto velocity = optionalField(item.sales_velocity)) {
		prepared.sales_velocity = *velocity;
	} else {
		prepared.sales_velocity = prepared.annual_sales_qty / kDaysPerYear;
	}

	if (auto turnover = optionalField(item.turnover_ratio)) {
		prepared.turnover_ratio = *turnover;
	} else {
		prepared.turnover_ratio =
		    prepared.current_stock > 0.0 ? prepared.annual_sales_qty / prepared.current_stock : 0.0;
	}

	prepared.consistency_score = optionalField(item.consistency_score).value_or(default_consistency_score_);
	prepared.demand_variability = optionalField(item.demand_variability).value_or(0.0);
	return prepared;
}

PreparedBatch FeaturePreparer::prepareBatch(const std::vector<ItemMetrics> &items) const {
	PreparedBatch batch;
	batch.items.reserve(items.size());
	for (const auto &item : items) {
		try {
			batch.items.push_back(prepare(item));
		} catch (const std::exception &e) {
			STOCKWISE_WARN("Item {}: skipped during preparation: {}", item.item_code, e.what());
			batch.errors.push_back(ItemError {item.item_code, e.what()});
		}
	}
	return batch;
}

std::vector<PreparedItem> FeaturePreparer::mlEligible(const std::vector<PreparedItem> &items) {
	std::vector<PreparedItem> eligible;
	eligible.reserve(items.size());
	for (const auto &item : items) {
		if (item.isMlEligible()) {
			eligible.push_back(item);
		}
	}
	return eligible;
}

} // namespace stockwise::features
