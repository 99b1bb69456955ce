#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace das_integrity {

/**
 * Strict structural comparison of two JSON values.
 *
 * Returns nullopt when the values are equal, otherwise one entry per difference,
 * joined by a blank line. `lhs` is the reference value, `rhs` the testing value.
 *
 *   json atom at path ".a[2]" is missing from lhs
 *   json atom at path ".b" is missing from rhs
 *   json atoms at path ".c" are not equal:
 *       lhs:
 *           1
 *       rhs:
 *           1.0
 *
 * Integers and floating point numbers are never equal to each other.
 */
std::optional<std::string> compare_json_strict(const nlohmann::json& lhs, const nlohmann::json& rhs);

/**
 * Erase every match of each regex from `diff`, in order.
 * Returns nullopt when nothing is left.
 */
std::optional<std::string> filter_diff(std::string diff, const std::vector<std::regex>& regexes);

} // namespace das_integrity
