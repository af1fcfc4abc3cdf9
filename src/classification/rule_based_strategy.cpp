#include "stockwise/classification/rule_based_strategy.hpp"

#include "stockwise/utils/logging.hpp"

namespace stockwise::classification {

RuleBasedStrategy::RuleBasedStrategy(RuleThresholds thresholds) : engine_(thresholds) {
}

BatchModel RuleBasedStrategy::fit(const std::vector<core::PreparedItem> &) const {
	return {};
}

Classification RuleBasedStrategy::classify(const BatchModel &, std::size_t, const core::PreparedItem &item) const {
	auto outcome = engine_.evaluate(item);
	STOCKWISE_TRACE("Item {}: rule '{}' -> {}", item.item_code, outcome.rule, core::toString(outcome.label));
	return Classification {outcome.label, outcome.confidence * 100.0, std::move(outcome.reason),
	                       core::ClassificationMethod::RuleBased};
}

} // namespace stockwise::classification
