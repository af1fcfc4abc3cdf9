#pragma once

#include <array>
#include <string>

namespace stockwise::core {

enum class ItemClass { Fast, Slow, Medium, NewItem, DeadStock };

enum class ClassificationMethod { RuleBased, DbscanClustering, KmeansClustering, Hybrid };

enum class AbcCategory { A, B, C };

enum class DormancyStatus { Active, Sleepy, Dormant, Dead };

/// Age-based phase of an item; shared by the item classifier and the health scorer.
enum class LifeStage { Launch, Learning, Graduation, Established };

enum class InventoryAction { IncreaseStock, ReduceStock, MaintainStock, Liquidation, MarketMore };

enum class DemandPattern { Smooth, Erratic, Intermittent, Lumpy };

enum class ForecastMethod { MovingAverage, WeightedAverage, Crostons, ExponentialSmoothing };

enum class HealthStatus { Critical, AtRisk, Caution, Healthy };

enum class HealthAction {
	UrgentIntervention,
	CloseMonitoring,
	OptimizeInventory,
	MaintainCurrentStrategy,
	AggressiveMarketing,
	MarketExpansion,
	OptimizeSupplyChain
};

/// All item classes in hybrid tie-break order (earlier wins on equal vote mass).
inline constexpr std::array<ItemClass, 5> kItemClassPrecedence = {
    ItemClass::Fast, ItemClass::DeadStock, ItemClass::NewItem, ItemClass::Slow, ItemClass::Medium};

std::string toString(ItemClass value);
std::string toString(ClassificationMethod value);
std::string toString(AbcCategory value);
std::string toString(DormancyStatus value);
std::string toString(LifeStage value);
std::string toString(InventoryAction value);
std::string toString(DemandPattern value);
std::string toString(ForecastMethod value);
std::string toString(HealthStatus value);
std::string toString(HealthAction value);

/**
 * @brief Parse a strategy name (`rule_based`, `dbscan`, `kmeans`, `hybrid`), case-insensitive.
 * @throws ConfigurationError for any other name.
 */
ClassificationMethod parseClassificationMethod(const std::string &name);

} // namespace stockwise::core
