#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace stockwise::utils {

/// Flat key -> value configuration surface shared by all models.
using ParamMap = std::map<std::string, double>;

/**
 * @brief Reads typed values out of a ParamMap and tracks which keys were used,
 * so that misspelled or unsupported keys can be rejected.
 */
class ParamReader {
public:
	explicit ParamReader(const ParamMap &params);

	bool has(const std::string &key) const;

	/// Overwrites @p target with the mapped value when @p key is present.
	void read(const std::string &key, double &target);
	/// Integer reads throw ConfigurationError unless the value is whole and fits the target type.
	void read(const std::string &key, int &target);
	void read(const std::string &key, std::size_t &target);
	void read(const std::string &key, std::uint32_t &target);
	void read(const std::string &key, bool &target);

	/**
	 * @brief Throws ConfigurationError naming every key that was never read.
	 * @param model Model name used in the error message.
	 */
	void rejectUnknown(const std::string &model) const;

private:
	const double *lookup(const std::string &key);

	const ParamMap &params_;
	std::set<std::string> consumed_;
};

/// Throws ConfigurationError unless @p value is finite and inside [lower, upper].
void requireInRange(const std::string &key, double value, double lower, double upper);

/// Throws ConfigurationError unless @p value is finite and strictly positive.
void requirePositive(const std::string &key, double value);

} // namespace stockwise::utils
