#pragma once

#include "stockwise/classification/classification_config.hpp"
#include "stockwise/core/item_metrics.hpp"

#include <functional>
#include <string>
#include <vector>

namespace stockwise::classification {

/// Outcome of the first matching rule. Confidence is a fraction in [0, 1].
struct RuleOutcome {
	core::ItemClass label = core::ItemClass::Medium;
	double confidence = 0.0;
	std::string reason;
	std::string rule;
};

/**
 * @struct BusinessRule
 * @brief One (predicate, outcome) entry of the ordered decision list.
 */
struct BusinessRule {
	std::string name;
	std::function<bool(const core::PreparedItem &, const RuleThresholds &)> matches;
	std::function<RuleOutcome(const core::PreparedItem &, const RuleThresholds &)> outcome;
};

/**
 * @class RuleEngine
 * @brief First-match evaluation of the business rules.
 *
 * Rules are evaluated strictly in list order; an earlier rule wins even when a
 * later one would also match. The last rule always matches.
 */
class RuleEngine {
public:
	explicit RuleEngine(RuleThresholds thresholds = {});

	RuleOutcome evaluate(const core::PreparedItem &item) const;

	const std::vector<BusinessRule> &rules() const noexcept {
		return rules_;
	}

	const RuleThresholds &thresholds() const noexcept {
		return thresholds_;
	}

	/// new_item, dead_stock, fast, slow, medium - in that order.
	static std::vector<BusinessRule> defaultRules();

private:
	RuleThresholds thresholds_;
	std::vector<BusinessRule> rules_;
};

} // namespace stockwise::classification
