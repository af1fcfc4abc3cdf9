#include "stockwise/utils/params.hpp"

#include "stockwise/core/errors.hpp"

#include <cmath>
#include <limits>
#include <sstream>

using stockwise::core::ConfigurationError;

namespace stockwise::utils {

namespace {

template <typename Integer>
Integer toInteger(const std::string &key, double value) {
	using limits = std::numeric_limits<Integer>;
	// 2^digits is exact in a double, unlike max() for 64-bit types.
	const double upper = std::ldexp(1.0, limits::digits);
	if (std::floor(value) != value || value < static_cast<double>(limits::min()) || value >= upper) {
		std::ostringstream message;
		message << "Parameter '" << key << "' must be an integer in [" << limits::min() << ", " << limits::max()
		        << "], got: " << value;
		throw ConfigurationError(message.str());
	}
	return static_cast<Integer>(value);
}

} // namespace

ParamReader::ParamReader(const ParamMap &params) : params_(params) {
}

bool ParamReader::has(const std::string &key) const {
	return params_.find(key) != params_.end();
}

const double *ParamReader::lookup(const std::string &key) {
	auto it = params_.find(key);
	if (it == params_.end()) {
		return nullptr;
	}
	if (!std::isfinite(it->second)) {
		throw ConfigurationError("Parameter '" + key + "' must be finite");
	}
	consumed_.insert(key);
	return &it->second;
}

void ParamReader::read(const std::string &key, double &target) {
	if (const auto *value = lookup(key)) {
		target = *value;
	}
}

void ParamReader::read(const std::string &key, int &target) {
	if (const auto *value = lookup(key)) {
		target = toInteger<int>(key, *value);
	}
}

void ParamReader::read(const std::string &key, std::size_t &target) {
	if (const auto *value = lookup(key)) {
		target = toInteger<std::size_t>(key, *value);
	}
}

void ParamReader::read(const std::string &key, std::uint32_t &target) {
	if (const auto *value = lookup(key)) {
		target = toInteger<std::uint32_t>(key, *value);
	}
}

void ParamReader::read(const std::string &key, bool &target) {
	if (const auto *value = lookup(key)) {
		if (*value != 0.0 && *value != 1.0) {
			throw ConfigurationError("Parameter '" + key + "' must be 0 or 1");
		}
		target = *value != 0.0;
	}
}

void ParamReader::rejectUnknown(const std::string &model) const {
	std::ostringstream unknown;
	bool any = false;
	for (const auto &entry : params_) {
		if (consumed_.count(entry.first) == 0) {
			unknown << (any ? ", " : "") << entry.first;
			any = true;
		}
	}
	if (any) {
		throw ConfigurationError(model + ": unknown parameter(s): " + unknown.str());
	}
}

void requireInRange(const std::string &key, double value, double lower, double upper) {
	if (!std::isfinite(value) || value < lower || value > upper) {
		std::ostringstream message;
		message << "Parameter '" << key << "' must be in [" << lower << ", " << upper << "], got: " << value;
		throw ConfigurationError(message.str());
	}
}

void requirePositive(const std::string &key, double value) {
	if (!std::isfinite(value) || value <= 0.0) {
		std::ostringstream message;
		message << "Parameter '" << key << "' must be positive, got: " << value;
		throw ConfigurationError(message.str());
	}
}

} // namespace stockwise::utils
