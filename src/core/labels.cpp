#include "stockwise/core/labels.hpp"

#include "stockwise/core/errors.hpp"

#include <algorithm>
#include <cctype>

namespace stockwise::core {

std::string toString(ItemClass value) {
	switch (value) {
	case ItemClass::Fast:
		return "FAST";
	case ItemClass::Slow:
		return "SLOW";
	case ItemClass::Medium:
		return "MEDIUM";
	case ItemClass::NewItem:
		return "NEW_ITEM";
	case ItemClass::DeadStock:
		return "DEAD_STOCK";
	}
	return "UNKNOWN";
}

std::string toString(ClassificationMethod value) {
	switch (value) {
	case ClassificationMethod::RuleBased:
		return "RULE_BASED";
	case ClassificationMethod::DbscanClustering:
		return "DBSCAN_CLUSTERING";
	case ClassificationMethod::KmeansClustering:
		return "KMEANS_CLUSTERING";
	case ClassificationMethod::Hybrid:
		return "HYBRID";
	}
	return "UNKNOWN";
}

std::string toString(AbcCategory value) {
	switch (value) {
	case AbcCategory::A:
		return "A";
	case AbcCategory::B:
		return "B";
	case AbcCategory::C:
		return "C";
	}
	return "UNKNOWN";
}

std::string toString(DormancyStatus value) {
	switch (value) {
	case DormancyStatus::Active:
		return "ACTIVE";
	case DormancyStatus::Sleepy:
		return "SLEEPY";
	case DormancyStatus::Dormant:
		return "DORMANT";
	case DormancyStatus::Dead:
		return "DEAD";
	}
	return "UNKNOWN";
}

std::string toString(LifeStage value) {
	switch (value) {
	case LifeStage::Launch:
		return "LAUNCH";
	case LifeStage::Learning:
		return "LEARNING";
	case LifeStage::Graduation:
		return "GRADUATION";
	case LifeStage::Established:
		return "ESTABLISHED";
	}
	return "UNKNOWN";
}

std::string toString(InventoryAction value) {
	switch (value) {
	case InventoryAction::IncreaseStock:
		return "INCREASE_STOCK";
	case InventoryAction::ReduceStock:
		return "REDUCE_STOCK";
	case InventoryAction::MaintainStock:
		return "MAINTAIN_STOCK";
	case InventoryAction::Liquidation:
		return "LIQUIDATION";
	case InventoryAction::MarketMore:
		return "MARKET_MORE";
	}
	return "UNKNOWN";
}

std::string toString(DemandPattern value) {
	switch (value) {
	case DemandPattern::Smooth:
		return "SMOOTH";
	case DemandPattern::Erratic:
		return "ERRATIC";
	case DemandPattern::Intermittent:
		return "INTERMITTENT";
	case DemandPattern::Lumpy:
		return "LUMPY";
	}
	return "UNKNOWN";
}

std::string toString(ForecastMethod value) {
	switch (value) {
	case ForecastMethod::MovingAverage:
		return "MOVING_AVERAGE";
	case ForecastMethod::WeightedAverage:
		return "WEIGHTED_AVERAGE";
	case ForecastMethod::Crostons:
		return "CROSTONS";
	case ForecastMethod::ExponentialSmoothing:
		return "EXPONENTIAL_SMOOTHING";
	}
	return "UNKNOWN";
}

std::string toString(HealthStatus value) {
	switch (value) {
	case HealthStatus::Critical:
		return "CRITICAL";
	case HealthStatus::AtRisk:
		return "AT_RISK";
	case HealthStatus::Caution:
		return "CAUTION";
	case HealthStatus::Healthy:
		return "HEALTHY";
	}
	return "UNKNOWN";
}

std::string toString(HealthAction value) {
	switch (value) {
	case HealthAction::UrgentIntervention:
		return "URGENT_INTERVENTION_REQUIRED";
	case HealthAction::CloseMonitoring:
		return "CLOSE_MONITORING_REQUIRED";
	case HealthAction::OptimizeInventory:
		return "OPTIMIZE_INVENTORY";
	case HealthAction::MaintainCurrentStrategy:
		return "MAINTAIN_CURRENT_STRATEGY";
	case HealthAction::AggressiveMarketing:
		return "AGGRESSIVE_MARKETING";
	case HealthAction::MarketExpansion:
		return "MARKET_EXPANSION";
	case HealthAction::OptimizeSupplyChain:
		return "OPTIMIZE_SUPPLY_CHAIN";
	}
	return "UNKNOWN";
}

ClassificationMethod parseClassificationMethod(const std::string &name) {
	std::string lowered = name;
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (lowered == "rule_based") {
		return ClassificationMethod::RuleBased;
	}
	if (lowered == "dbscan") {
		return ClassificationMethod::DbscanClustering;
	}
	if (lowered == "kmeans") {
		return ClassificationMethod::KmeansClustering;
	}
	if (lowered == "hybrid") {
		return ClassificationMethod::Hybrid;
	}
	throw ConfigurationError("Unknown classification method: " + name +
	                         ". Must be one of: rule_based, dbscan, kmeans, hybrid");
}

} // namespace stockwise::core
