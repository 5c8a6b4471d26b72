// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include "network/packet_conn.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace synclink {
namespace network {

/**
 * PacketConnRegistry - which packet connections are live, per scheme
 *
 * Listeners register the transport side of their socket while serving so
 * dialers and diagnostics can find a socket already bound for a scheme.
 * Registration holds a reference until Unregister().
 */
class PacketConnRegistry {
public:
  PacketConnRegistry() = default;
  PacketConnRegistry(const PacketConnRegistry &) = delete;
  PacketConnRegistry &operator=(const PacketConnRegistry &) = delete;

  void Register(const std::string &scheme, PacketConnPtr conn);

  // Removes one registration of `conn` under `scheme`; no-op if absent
  void Unregister(const std::string &scheme, const PacketConnPtr &conn);

  // Connections registered under `scheme`, oldest first
  std::vector<PacketConnPtr> Get(const std::string &scheme) const;

  // Process-wide instance used by listeners
  static PacketConnRegistry &Default();

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::vector<PacketConnPtr>> conns_;
};

} // namespace network
} // namespace synclink
