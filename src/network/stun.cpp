// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#include "network/stun.hpp"

namespace synclink {
namespace network {

std::string NatTypeAsString(NatType type) {
  switch (type) {
  case NatType::ERROR:
    return "Test failed";
  case NatType::UNKNOWN:
    return "Unexpected response from the STUN server";
  case NatType::NONE:
    return "Not behind a NAT";
  case NatType::BLOCKED:
    return "UDP is blocked";
  case NatType::FULL:
    return "Full cone NAT";
  case NatType::SYMMETRIC:
    return "Symmetric NAT";
  case NatType::RESTRICTED:
    return "Restricted NAT";
  case NatType::PORT_RESTRICTED:
    return "Port restricted NAT";
  case NatType::SYMMETRIC_UDP_FIREWALL:
    return "Symmetric UDP firewall";
  }
  return "Unknown";
}

bool IsPunchable(NatType type) {
  return type == NatType::NONE || type == NatType::PORT_RESTRICTED ||
         type == NatType::RESTRICTED || type == NatType::FULL;
}

} // namespace network
} // namespace synclink
