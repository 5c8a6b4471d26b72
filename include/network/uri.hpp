// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace synclink {
namespace network {

/**
 * Uri - listener/connection address of the form scheme://host[:port][rest]
 *
 * Only the parts a transport needs are modelled: the scheme selects the
 * transport, host and port select the socket, anything after the
 * authority (path or query) is carried through untouched.
 */
struct Uri {
  std::string scheme;
  std::string host;               // IPv6 literals are stored without brackets
  std::optional<uint16_t> port;   // nullopt for "host" and "host:"
  std::string rest;               // "/path?query" suffix, if any

  static std::optional<Uri> Parse(const std::string& text);

  std::string ToString() const;

  // "host:port" (port omitted when unset)
  std::string HostPort() const;

  // Copy with host and port replaced
  Uri WithHostPort(const std::string& new_host, uint16_t new_port) const;

  bool operator==(const Uri& other) const = default;
};

// Copy of uri with default_port applied when the port is missing or empty
Uri FixupPort(const Uri& uri, uint16_t default_port);

} // namespace network
} // namespace synclink
