#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line and config values to numeric types
 - Consistent error handling across the corpus tool

 Key functions:
 - SafeParseInt: Parse int with bounds checking
 - SafeParseUInt64: Parse uint64_t with bounds checking (seeds, counts)
 - SafeParseSize: Parse size_t with bounds checking (byte budgets)
 - SplitComponents: Split a comma-separated list (--debug=a,b)

 All parsers validate that the entire input is consumed (no leading
 whitespace, no trailing garbage, no sign on unsigned values) and return
 std::nullopt on any error. None of them throw.
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shapefuzz {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

/**
 * Parse unsigned 64-bit string with bounds checking
 *
 * Examples:
 *   SafeParseUInt64("18446744073709551615", 0, UINT64_MAX) -> UINT64_MAX
 *   SafeParseUInt64("-1", 0, 10) -> std::nullopt
 *   SafeParseUInt64("18446744073709551616", 0, UINT64_MAX) -> std::nullopt (overflow)
 */
std::optional<uint64_t> SafeParseUInt64(const std::string &str, uint64_t min, uint64_t max);

/**
 * Parse size_t string with bounds checking
 */
std::optional<size_t> SafeParseSize(const std::string &str, size_t min, size_t max);

/**
 * Split on commas, dropping empty items
 *
 * Example:
 *   SplitComponents("generate,,mutate") -> {"generate", "mutate"}
 */
std::vector<std::string> SplitComponents(const std::string &str);

} // namespace util
} // namespace shapefuzz
