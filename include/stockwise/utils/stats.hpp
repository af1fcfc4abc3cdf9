#pragma once

#include <vector>

namespace stockwise::utils {

/// Arithmetic mean; 0 for an empty input.
double mean(const std::vector<double> &values);

/// Population standard deviation (divisor n); 0 for an empty input.
double populationStdDev(const std::vector<double> &values);

/// Clamp helper for confidences and scores.
double clamp(double value, double lower, double upper);

} // namespace stockwise::utils
