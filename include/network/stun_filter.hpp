// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include "network/packet_demultiplexer.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>

namespace synclink {
namespace network {

constexpr uint32_t STUN_MAGIC_COOKIE = 0x2112A442;
constexpr size_t STUN_HEADER_SIZE = 20;

using StunTransactionId = std::array<uint8_t, 12>;

// True if the datagram looks like a STUN message: at least a full header,
// the two most significant bits clear and the RFC 5389 magic cookie.
bool IsStunPayload(const std::vector<uint8_t> &data);

// Transaction ID of a STUN payload (caller checks IsStunPayload first)
StunTransactionId StunTransactionIdOf(const std::vector<uint8_t> &data);

/**
 * StunFilter - claims inbound STUN responses for outstanding requests
 *
 * Every outgoing STUN payload registers its transaction ID with an expiry.
 * An inbound packet is claimed only if it is a STUN payload carrying one of
 * the registered, unexpired IDs; everything else is left for the next
 * virtual connection (the secure transport).
 *
 * The ID set is capacity bounded: when full, the entry closest to expiry
 * is evicted. Expired entries are reaped on every lookup and registration.
 */
class StunFilter : public PacketFilter {
public:
  static constexpr std::chrono::seconds DEFAULT_EXPIRY{60};
  static constexpr size_t DEFAULT_CAPACITY = 1024;

  explicit StunFilter(std::chrono::seconds expiry = DEFAULT_EXPIRY,
                      size_t capacity = DEFAULT_CAPACITY);

  bool ClaimIncoming(const std::vector<uint8_t> &data, const UdpEndpoint &from) override;
  void Outgoing(const std::vector<uint8_t> &data, const UdpEndpoint &to) override;

  // Number of tracked (unexpired as of the last reap) transaction IDs
  size_t TrackedCount() const;

private:
  // Caller must hold mutex_
  void Reap(std::chrono::steady_clock::time_point now);

  const std::chrono::seconds expiry_;
  const size_t capacity_;

  mutable std::mutex mutex_;
  std::map<StunTransactionId, std::chrono::steady_clock::time_point> ids_;
};

} // namespace network
} // namespace synclink
