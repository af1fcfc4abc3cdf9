#include "stockwise/classification/rule_engine.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using stockwise::core::ItemClass;
using stockwise::core::PreparedItem;

namespace stockwise::classification {

namespace {

constexpr double kMaxFastConfidence = 99.0;

std::string fixed2(double value) {
	std::ostringstream out;
	out << std::fixed << std::setprecision(2) << value;
	return out.str();
}

std::string whole(double value) {
	std::ostringstream out;
	out << std::fixed << std::setprecision(0) << value;
	return out.str();
}

} // namespace

std::vector<BusinessRule> RuleEngine::defaultRules() {
	return {
	    {"new_item",
	     [](const PreparedItem &item, const RuleThresholds &t) { return item.item_age_days < t.new_item_max_age_days; },
	     [](const PreparedItem &item, const RuleThresholds &t) {
		     return RuleOutcome {ItemClass::NewItem, 0.99,
		                         "Item age " + whole(item.item_age_days) + " days < " + whole(t.new_item_max_age_days) +
		                             " threshold",
		                         "new_item"};
	     }},
	    {"dead_stock",
	     [](const PreparedItem &item, const RuleThresholds &t) {
		     return item.days_since_last_sale > t.dead_stock_min_days_no_sales ||
		            item.annual_sales_qty < t.dead_stock_max_annual_sales;
	     },
	     [](const PreparedItem &item, const RuleThresholds &t) {
		     return RuleOutcome {ItemClass::DeadStock, 0.95,
		                         "No sales for " + whole(item.days_since_last_sale) + " days (threshold: " +
		                             whole(t.dead_stock_min_days_no_sales) + ")",
		                         "dead_stock"};
	     }},
	    {"fast",
	     [](const PreparedItem &item, const RuleThresholds &t) {
		     return item.sales_velocity > t.fast_min_sales_velocity && item.turnover_ratio > t.fast_min_turnover_ratio;
	     },
	     [](const PreparedItem &item, const RuleThresholds &) {
		     const double confidence =
		         std::min(kMaxFastConfidence, 70.0 + item.sales_velocity * 5.0 + item.turnover_ratio * 10.0);
		     return RuleOutcome {ItemClass::Fast, confidence / 100.0,
		                         "Velocity " + fixed2(item.sales_velocity) + " units/day, Turnover " +
		                             fixed2(item.turnover_ratio),
		                         "fast"};
	     }},
	    {"slow",
	     [](const PreparedItem &item, const RuleThresholds &t) {
		     return item.sales_velocity < t.slow_max_sales_velocity &&
		            item.days_since_last_sale < t.slow_max_days_since_last_sale;
	     },
	     [](const PreparedItem &item, const RuleThresholds &) {
		     return RuleOutcome {ItemClass::Slow, 0.85,
		                         "Low velocity (" + fixed2(item.sales_velocity) +
		                             " units/day) but consistent (last sale " + whole(item.days_since_last_sale) +
		                             " days ago)",
		                         "slow"};
	     }},
	    {"medium", [](const PreparedItem &, const RuleThresholds &) { return true; },
	     [](const PreparedItem &, const RuleThresholds &) {
		     return RuleOutcome {ItemClass::Medium, 0.75, "Mid-range item characteristics", "medium"};
	     }},
	};
}

RuleEngine::RuleEngine(RuleThresholds thresholds) : thresholds_(thresholds), rules_(defaultRules()) {
}

RuleOutcome RuleEngine::evaluate(const PreparedItem &item) const {
	for (const auto &rule : rules_) {
		if (rule.matches(item, thresholds_)) {
			return rule.outcome(item, thresholds_);
		}
	}
	throw std::logic_error("RuleEngine: no rule matched item " + item.item_code);
}

} // namespace stockwise::classification
