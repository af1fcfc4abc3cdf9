#pragma once

#include <vector>

namespace stockwise::demand {

/**
 * @brief Helpers for sparse demand series (many zero periods), used by the
 * SBC classification and the Croston-style forecast.
 */
namespace intermittent {

/**
 * @brief Extract non-zero values from a demand series (demand sizes)
 * @param y Input series
 * @return Vector containing only positive values
 */
std::vector<double> extractDemand(const std::vector<double> &y);

/**
 * @brief Compute intervals between non-zero periods
 * @param y Input series
 * @return Inter-demand intervals; the first is the 1-based index of the first demand
 */
std::vector<double> computeIntervals(const std::vector<double> &y);

/**
 * @brief Average demand interval: periods per period with demand
 * @return 0 when the series has no demand
 */
double averageDemandInterval(const std::vector<double> &y);

/**
 * @brief Squared coefficient of variation of the non-zero demand sizes
 * (population standard deviation)
 * @return 0 when the series has no demand
 */
double squaredCoefficientOfVariation(const std::vector<double> &y);

/**
 * @brief Weighted average of the most recent periods
 * @param weights Weights applied most-recent-first; periods missing from a short series count as 0
 */
double recentWeightedAverage(const std::vector<double> &y, const std::vector<double> &weights);

} // namespace intermittent
} // namespace stockwise::demand
