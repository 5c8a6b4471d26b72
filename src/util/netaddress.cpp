// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#include "util/netaddress.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <boost/asio/ip/address.hpp>

namespace synclink {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(address, ec);
  if (ec) {
    return std::nullopt;
  }

  // ::ffff:192.168.1.1 -> 192.168.1.1
  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    auto v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, ip.to_v6());
    return v4.to_string();
  }

  return ip.to_string();
}

std::optional<HostPort> SplitHostPort(const std::string& address) {
  HostPort result;

  if (address.empty()) {
    return result;
  }

  // "[IPv6]" or "[IPv6]:port"
  if (address[0] == '[') {
    size_t bracket_end = address.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return std::nullopt;
    }
    result.host = address.substr(1, bracket_end - 1);

    if (bracket_end + 1 == address.size()) {
      return result;
    }
    if (address[bracket_end + 1] != ':') {
      return std::nullopt;
    }
    result.has_port_separator = true;
    result.port = address.substr(bracket_end + 2);
    return result;
  }

  auto colons = std::count(address.begin(), address.end(), ':');
  if (colons == 0) {
    result.host = address;
    return result;
  }

  if (colons > 1) {
    // Bare IPv6 literal without port; anything else is ambiguous
    if (!ValidateAndNormalizeIP(address)) {
      LOG_TRACE("SplitHostPort: rejecting ambiguous address '{}'", address);
      return std::nullopt;
    }
    result.host = address;
    return result;
  }

  size_t colon = address.find(':');
  result.host = address.substr(0, colon);
  result.has_port_separator = true;
  result.port = address.substr(colon + 1);
  return result;
}

std::string JoinHostPort(const std::string& host, uint16_t port) {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

} // namespace util
} // namespace synclink
