// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of strings to numeric types with validation
 - Used for URI ports, config values and host:port strings

 All functions validate that the entire input is consumed and return
 std::nullopt on any parsing error (no exceptions thrown).
*/

#include <cstdint>
#include <optional>
#include <string>

namespace synclink {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

} // namespace util
} // namespace synclink
