// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#include "network/stun_filter.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>

namespace synclink {
namespace network {

bool IsStunPayload(const std::vector<uint8_t> &data) {
  if (data.size() < STUN_HEADER_SIZE) {
    return false;
  }
  if ((data[0] & 0xC0) != 0) {
    return false;
  }
  uint32_t cookie = (static_cast<uint32_t>(data[4]) << 24) |
                    (static_cast<uint32_t>(data[5]) << 16) |
                    (static_cast<uint32_t>(data[6]) << 8) |
                    static_cast<uint32_t>(data[7]);
  return cookie == STUN_MAGIC_COOKIE;
}

StunTransactionId StunTransactionIdOf(const std::vector<uint8_t> &data) {
  StunTransactionId id{};
  std::copy(data.begin() + 8, data.begin() + STUN_HEADER_SIZE, id.begin());
  return id;
}

StunFilter::StunFilter(std::chrono::seconds expiry, size_t capacity)
    : expiry_(expiry), capacity_(capacity == 0 ? 1 : capacity) {}

bool StunFilter::ClaimIncoming(const std::vector<uint8_t> &data,
                               const UdpEndpoint &from) {
  if (!IsStunPayload(data)) {
    return false;
  }
  auto id = StunTransactionIdOf(data);

  std::lock_guard<std::mutex> lock(mutex_);
  Reap(util::GetSteadyTime());
  bool claimed = ids_.count(id) > 0;
  if (!claimed) {
    LOG_NET_TRACE("unsolicited STUN payload from {}:{} left for transport",
                  from.address().to_string(), from.port());
  }
  return claimed;
}

void StunFilter::Outgoing(const std::vector<uint8_t> &data, const UdpEndpoint &) {
  // The discovery client only ever writes STUN messages on its connection
  if (!IsStunPayload(data)) {
    LOG_NET_TRACE("non-STUN payload written on discovery connection");
    return;
  }
  auto id = StunTransactionIdOf(data);
  auto now = util::GetSteadyTime();

  std::lock_guard<std::mutex> lock(mutex_);
  Reap(now);
  if (ids_.count(id) == 0 && ids_.size() >= capacity_) {
    auto oldest = std::min_element(
        ids_.begin(), ids_.end(),
        [](const auto &a, const auto &b) { return a.second < b.second; });
    ids_.erase(oldest);
  }
  ids_[id] = now + expiry_;
}

size_t StunFilter::TrackedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ids_.size();
}

void StunFilter::Reap(std::chrono::steady_clock::time_point now) {
  for (auto it = ids_.begin(); it != ids_.end();) {
    if (it->second < now) {
      it = ids_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace network
} // namespace synclink
