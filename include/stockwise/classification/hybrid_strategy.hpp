#pragma once

#include "stockwise/classification/dbscan_strategy.hpp"
#include "stockwise/classification/rule_engine.hpp"
#include "stockwise/classification/strategy.hpp"

#include <array>
#include <optional>

namespace stockwise::classification {

/// Accumulated vote mass per item class, indexed by core::ItemClass.
using VoteTally = std::array<double, 5>;

/**
 * @class HybridStrategy
 * @brief Ensemble of the business rules and DBSCAN.
 *
 * A rule outcome above `hybrid_rule_accept_confidence` is returned as is.
 * Otherwise the rule label (weight x rule confidence), the DBSCAN label
 * (weight x DBSCAN confidence) and, for items above the FAST velocity
 * threshold, a flat bonus for FAST are accumulated; the label with the most
 * mass wins and its share of the total mass is the confidence.
 *
 * By default the DBSCAN vote comes from clustering the item on its own, which
 * always makes it an outlier unless `dbscan_min_samples` is 1. With
 * `hybrid_full_batch_dbscan` the vote uses the item's label from a DBSCAN run
 * over the whole eligible batch instead.
 *
 * When the DBSCAN vote cannot be computed for an item, the item keeps its rule
 * outcome and is tagged RULE_BASED.
 */
class HybridStrategy final : public ClassificationStrategy {
public:
	explicit HybridStrategy(ClassificationConfig config);

	core::ClassificationMethod method() const override {
		return core::ClassificationMethod::Hybrid;
	}

	bool requiresEligibleItems() const override {
		return true;
	}

	BatchModel fit(const std::vector<core::PreparedItem> &items) const override;

	Classification classify(const BatchModel &model, std::size_t index,
	                        const core::PreparedItem &item) const override;

	/**
	 * @brief Winner of a tally. Equal masses resolve by core::kItemClassPrecedence.
	 */
	static core::ItemClass winner(const VoteTally &votes);

private:
	/// nullopt when clustering fails for this item.
	std::optional<Classification> dbscanVote(const BatchModel &model, std::size_t index,
	                                         const core::PreparedItem &item) const;

	ClassificationConfig config_;
	RuleEngine engine_;
	DbscanStrategy dbscan_;
};

} // namespace stockwise::classification
