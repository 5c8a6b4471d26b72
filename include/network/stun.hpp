// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include "network/packet_conn.hpp"
#include <boost/system/error_code.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace synclink {
namespace network {

/**
 * NAT classification as reported by a STUN discovery exchange
 * (RFC 3489 style tests).
 */
enum class NatType {
  ERROR,              // the test itself failed
  UNKNOWN,            // unexpected response from the server
  NONE,               // not behind a NAT
  BLOCKED,            // UDP is blocked
  FULL,               // full cone
  SYMMETRIC,
  RESTRICTED,
  PORT_RESTRICTED,
  SYMMETRIC_UDP_FIREWALL,
};

std::string NatTypeAsString(NatType type);

// NAT types for which keeping a mapping alive lets peers reach us
bool IsPunchable(NatType type);

// Outcome of a discovery or keepalive exchange
struct StunResult {
  NatType nat_type{NatType::UNKNOWN};
  // Externally observed address; absent if the server did not report one
  std::optional<UdpEndpoint> external;
  boost::system::error_code error;
};

/**
 * StunClient - discovery protocol client bound to one packet connection
 *
 * The wire encoding lives with the implementation; the listener only
 * drives the exchange. All calls block the discovery thread and are
 * unblocked by closing the underlying PacketConn.
 */
class StunClient {
public:
  virtual ~StunClient() = default;

  virtual void SetServerAddress(const UdpEndpoint &server) = 0;

  // SOFTWARE attribute value sent with requests ("" omits it)
  virtual void SetSoftwareName(const std::string &name) = 0;

  // Run the NAT classification tests against the current server
  virtual StunResult Discover() = 0;

  // Refresh the mapping with a binding request; reports the external address
  virtual StunResult Keepalive() = 0;
};

// Builds a client on top of the listener's discovery connection
using StunClientFactory = std::function<std::unique_ptr<StunClient>(PacketConnPtr)>;

} // namespace network
} // namespace synclink
