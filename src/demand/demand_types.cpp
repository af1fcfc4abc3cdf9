#include "stockwise/demand/demand_types.hpp"

#include "stockwise/core/errors.hpp"

#include <cmath>

namespace stockwise::demand {

MonthlySeries toMonthlySeries(const std::vector<double> &values) {
	if (values.size() != kMonthsPerYear) {
		throw core::DataError("Monthly demand series must have 12 values, got " + std::to_string(values.size()));
	}
	MonthlySeries monthly {};
	for (std::size_t i = 0; i < kMonthsPerYear; ++i) {
		if (!std::isfinite(values[i]) || values[i] < 0.0) {
			throw core::DataError("Monthly demand for month " + std::to_string(i + 1) +
			                      " must be a finite, non-negative value");
		}
		monthly[i] = values[i];
	}
	return monthly;
}

} // namespace stockwise::demand
