#include "stockwise/classification/hybrid_strategy.hpp"

#include "stockwise/core/errors.hpp"
#include "stockwise/utils/logging.hpp"

#include <cmath>
#include <numeric>
#include <sstream>

using stockwise::core::ItemClass;
using stockwise::core::PreparedItem;

namespace stockwise::classification {

namespace {

std::size_t slot(ItemClass label) {
	return static_cast<std::size_t>(label);
}

long percent(double fraction) {
	return std::lround(fraction * 100.0);
}

} // namespace

HybridStrategy::HybridStrategy(ClassificationConfig config)
    : config_(config), engine_(config.rules), dbscan_(std::move(config)) {
}

BatchModel HybridStrategy::fit(const std::vector<PreparedItem> &items) const {
	if (config_.hybrid_full_batch_dbscan) {
		return dbscan_.fit(items);
	}
	return {};
}

std::optional<Classification> HybridStrategy::dbscanVote(const BatchModel &model, std::size_t index,
                                                         const PreparedItem &item) const {
	try {
		if (config_.hybrid_full_batch_dbscan) {
			return dbscan_.classify(model, index, item);
		}
		const std::vector<PreparedItem> singleton {item};
		const auto singleton_model = dbscan_.fit(singleton);
		return dbscan_.classify(singleton_model, 0, item);
	} catch (const core::ConfigurationError &) {
		throw;
	} catch (const std::exception &e) {
		STOCKWISE_WARN("Item {}: DBSCAN vote unavailable ({}); using RULE_BASED", item.item_code, e.what());
		return std::nullopt;
	}
}

Classification HybridStrategy::classify(const BatchModel &model, std::size_t index, const PreparedItem &item) const {
	auto rule = engine_.evaluate(item);
	if (rule.confidence > config_.hybrid_rule_accept_confidence) {
		return Classification {rule.label, rule.confidence * 100.0, std::move(rule.reason),
		                       core::ClassificationMethod::Hybrid};
	}

	const auto dbscan = dbscanVote(model, index, item);
	if (!dbscan) {
		return Classification {rule.label, rule.confidence * 100.0, std::move(rule.reason),
		                       core::ClassificationMethod::RuleBased};
	}
	const double dbscan_confidence = dbscan->confidence / 100.0;

	VoteTally votes {};
	votes[slot(rule.label)] += rule.confidence * config_.hybrid_rule_weight;
	votes[slot(dbscan->label)] += dbscan_confidence * config_.hybrid_dbscan_weight;
	if (item.sales_velocity > config_.rules.fast_min_sales_velocity) {
		votes[slot(ItemClass::Fast)] += config_.hybrid_fast_bonus;
	}

	const auto final_label = winner(votes);
	const double total = std::accumulate(votes.begin(), votes.end(), 0.0);

	Classification classification;
	classification.label = final_label;
	classification.method = core::ClassificationMethod::Hybrid;
	classification.confidence = total > 0.0 ? votes[slot(final_label)] / total * 100.0 : 0.0;

	std::ostringstream reason;
	reason << "Ensemble: " << core::toString(rule.label) << "(" << percent(rule.confidence) << "%) + DBSCAN("
	       << percent(dbscan_confidence) << "%) -> " << core::toString(final_label);
	classification.reason = reason.str();
	return classification;
}

ItemClass HybridStrategy::winner(const VoteTally &votes) {
	ItemClass best = core::kItemClassPrecedence.front();
	double best_mass = votes[slot(best)];
	for (auto label : core::kItemClassPrecedence) {
		if (votes[slot(label)] > best_mass) {
			best = label;
			best_mass = votes[slot(label)];
		}
	}
	return best;
}

} // namespace stockwise::classification
