#pragma once

#include "stockwise/classification/rule_engine.hpp"
#include "stockwise/classification/strategy.hpp"

namespace stockwise::classification {

/**
 * @class RuleBasedStrategy
 * @brief Deterministic classification with the ordered business rules. Sees
 * every prepared item, including items without sales.
 */
class RuleBasedStrategy final : public ClassificationStrategy {
public:
	explicit RuleBasedStrategy(RuleThresholds thresholds = {});

	core::ClassificationMethod method() const override {
		return core::ClassificationMethod::RuleBased;
	}

	bool requiresEligibleItems() const override {
		return false;
	}

	BatchModel fit(const std::vector<core::PreparedItem> &items) const override;

	Classification classify(const BatchModel &model, std::size_t index,
	                        const core::PreparedItem &item) const override;

private:
	RuleEngine engine_;
};

} // namespace stockwise::classification
