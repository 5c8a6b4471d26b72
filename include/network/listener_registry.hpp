// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include "network/quic_listener.hpp"
#include <memory>
#include <string>
#include <vector>

namespace synclink {
namespace network {

/**
 * ListenerRegistry - the fixed set of listener schemes this build supports
 *
 * Maps each scheme to the factory that serves it. The set is decided at
 * construction; nothing registers at runtime.
 *
 * Usage:
 *   ListenerRegistry listeners(transport, stun_clients);
 *   auto uri = Uri::Parse("quic://0.0.0.0:22000");
 *   if (auto *factory = listeners.GetFactory(uri->scheme)) {
 *     auto listener = factory->New(*uri, cfg, tls, intake, nullptr);
 *   }
 */
class ListenerRegistry {
public:
  ListenerRegistry(std::shared_ptr<SecureTransport> transport, StunClientFactory stun_clients,
                   PacketConnRegistry &conn_registry = PacketConnRegistry::Default());

  ListenerRegistry(const ListenerRegistry &) = delete;
  ListenerRegistry &operator=(const ListenerRegistry &) = delete;

  // Factory for `scheme`, or nullptr if the scheme is not supported
  ListenerFactory *GetFactory(const std::string &scheme) const;

  // Supported schemes, sorted
  std::vector<std::string> Schemes() const;

  /**
   * Build listeners for every configured listen address
   *
   * Addresses that do not parse, use an unsupported scheme, or whose
   * factory is not enabled are skipped with a log line.
   */
  std::vector<GenericListenerPtr> CreateListeners(
      std::shared_ptr<config::ConfigWrapper> cfg, TlsConfig tls,
      std::shared_ptr<IntakeChannel> conns,
      std::shared_ptr<nat::Service> nat_service = nullptr) const;

private:
  std::unique_ptr<QuicListenerFactory> quic_;
};

} // namespace network
} // namespace synclink
