// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#include "network/registry.hpp"
#include <algorithm>

namespace synclink {
namespace network {

void PacketConnRegistry::Register(const std::string &scheme, PacketConnPtr conn) {
  std::lock_guard<std::mutex> lock(mutex_);
  conns_[scheme].push_back(std::move(conn));
}

void PacketConnRegistry::Unregister(const std::string &scheme,
                                    const PacketConnPtr &conn) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = conns_.find(scheme);
  if (it == conns_.end()) {
    return;
  }
  auto &list = it->second;
  auto pos = std::find(list.begin(), list.end(), conn);
  if (pos != list.end()) {
    list.erase(pos);
  }
  if (list.empty()) {
    conns_.erase(it);
  }
}

std::vector<PacketConnPtr> PacketConnRegistry::Get(const std::string &scheme) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = conns_.find(scheme);
  if (it == conns_.end()) {
    return {};
  }
  return it->second;
}

PacketConnRegistry &PacketConnRegistry::Default() {
  static PacketConnRegistry instance;
  return instance;
}

} // namespace network
} // namespace synclink
