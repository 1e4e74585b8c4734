// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line values to numeric types with validation
 - Consistent error handling: std::nullopt on any error, never throws

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParsePort: Parse port number (1-65535)
 - SplitList: Split a comma-separated option value
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ircguard {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * - Validates entire string is consumed (no trailing characters)
 * - Checks value is within [min, max] range
 * - Returns std::nullopt on any error (never throws)
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("6667") -> 6667
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 *   SafeParsePort("99999") -> std::nullopt (out of range)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

// Split "a,b,,c" into {"a", "b", "c"} (empty items dropped)
std::vector<std::string> SplitList(const std::string& str, char separator = ',');

} // namespace util
} // namespace ircguard
