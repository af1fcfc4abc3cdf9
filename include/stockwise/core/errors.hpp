#pragma once

#include <stdexcept>
#include <string>

namespace stockwise::core {

/**
 * @brief Raised for invalid model configuration (unknown strategy name, unknown
 * parameter key, out-of-range threshold, weights that do not sum to one).
 *
 * Configuration errors are fatal for the call that detected them and are never
 * caught inside the models.
 */
class ConfigurationError : public std::invalid_argument {
public:
	explicit ConfigurationError(const std::string &message) : std::invalid_argument(message) {
	}
};

/**
 * @brief Raised for malformed input data (negative quantities, a monthly series
 * of the wrong length, non-finite values).
 *
 * Batch operations catch it per item, log it and skip the item.
 */
class DataError : public std::domain_error {
public:
	explicit DataError(const std::string &message) : std::domain_error(message) {
	}
};

} // namespace stockwise::core
