// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#include "network/uri.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <cctype>

namespace synclink {
namespace network {

std::optional<Uri> Uri::Parse(const std::string& text) {
  size_t sep = text.find("://");
  if (sep == std::string::npos || sep == 0) {
    return std::nullopt;
  }

  Uri uri;
  uri.scheme = text.substr(0, sep);
  std::transform(uri.scheme.begin(), uri.scheme.end(), uri.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (!std::all_of(uri.scheme.begin(), uri.scheme.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
      })) {
    return std::nullopt;
  }

  std::string remainder = text.substr(sep + 3);
  size_t authority_end = remainder.find_first_of("/?#");
  std::string authority = remainder.substr(0, authority_end);
  if (authority_end != std::string::npos) {
    uri.rest = remainder.substr(authority_end);
  }

  auto host_port = util::SplitHostPort(authority);
  if (!host_port) {
    return std::nullopt;
  }
  uri.host = host_port->host;

  if (!host_port->port.empty()) {
    // Port 0 is allowed: it asks the OS for an ephemeral port
    auto port = util::SafeParseInt(host_port->port, 0, 65535);
    if (!port) {
      return std::nullopt;
    }
    uri.port = static_cast<uint16_t>(*port);
  }

  return uri;
}

std::string Uri::HostPort() const {
  if (port) {
    return util::JoinHostPort(host, *port);
  }
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]";
  }
  return host;
}

std::string Uri::ToString() const {
  return scheme + "://" + HostPort() + rest;
}

Uri Uri::WithHostPort(const std::string& new_host, uint16_t new_port) const {
  Uri copy = *this;
  copy.host = new_host;
  copy.port = new_port;
  return copy;
}

Uri FixupPort(const Uri& uri, uint16_t default_port) {
  Uri copy = uri;
  if (!copy.port) {
    copy.port = default_port;
  }
  return copy;
}

} // namespace network
} // namespace synclink
