// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings
 - Split and join "host:port" strings the same way for URIs, config entries
   and discovered external addresses

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - SplitHostPort: "host:port" / "[v6]:port" / "host" -> components
 - JoinHostPort: inverse of SplitHostPort, brackets IPv6 literals
*/

#include <cstdint>
#include <optional>
#include <string>

namespace synclink {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps boost::asio::ip::make_address() and normalizes IPv4-mapped IPv6
 * addresses to IPv4 format (::ffff:1.2.3.4 -> 1.2.3.4).
 *
 * @return Normalized IP address string, or std::nullopt if invalid
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

// Result of SplitHostPort
struct HostPort {
  std::string host;
  // "1.2.3.4" -> false; "1.2.3.4:" -> true with empty port
  bool has_port_separator{false};
  std::string port;
};

/**
 * Split a "host:port" string
 *
 * Accepted forms:
 * - "example.com:22000", "1.2.3.4:22000", "[2001:db8::1]:22000"
 * - "example.com", "1.2.3.4", "[2001:db8::1]" (no port)
 * - "1.2.3.4:" (port separator with empty port)
 * - "" (empty host, used for wildcard binds)
 *
 * The host is not resolved; hostnames are allowed. Unbracketed IPv6
 * literals with a port are rejected since they are ambiguous.
 *
 * @return std::nullopt on malformed input
 */
std::optional<HostPort> SplitHostPort(const std::string& address);

/**
 * Join host and port into "host:port", bracketing IPv6 literals
 */
std::string JoinHostPort(const std::string& host, uint16_t port);

} // namespace util
} // namespace synclink
