// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#include "network/listener_registry.hpp"
#include "util/logging.hpp"

namespace synclink {
namespace network {

namespace {
const std::vector<std::string> kQuicSchemes = {"quic", "quic4", "quic6"};
} // namespace

ListenerRegistry::ListenerRegistry(std::shared_ptr<SecureTransport> transport,
                                   StunClientFactory stun_clients,
                                   PacketConnRegistry &conn_registry)
    : quic_(std::make_unique<QuicListenerFactory>(std::move(transport),
                                                  std::move(stun_clients), conn_registry)) {}

ListenerFactory *ListenerRegistry::GetFactory(const std::string &scheme) const {
  for (const auto &s : kQuicSchemes) {
    if (s == scheme) {
      return quic_.get();
    }
  }
  return nullptr;
}

std::vector<std::string> ListenerRegistry::Schemes() const { return kQuicSchemes; }

std::vector<GenericListenerPtr>
ListenerRegistry::CreateListeners(std::shared_ptr<config::ConfigWrapper> cfg, TlsConfig tls,
                                  std::shared_ptr<IntakeChannel> conns,
                                  std::shared_ptr<nat::Service> nat_service) const {
  std::vector<GenericListenerPtr> listeners;
  const config::Options opts = cfg->GetOptions();

  for (const auto &address : opts.listen_addresses) {
    auto uri = Uri::Parse(address);
    if (!uri) {
      LOG_NET_WARN("Skipping unparseable listen address {}", address);
      continue;
    }
    ListenerFactory *factory = GetFactory(uri->scheme);
    if (!factory) {
      LOG_NET_WARN("Skipping listen address {}: unsupported scheme", address);
      continue;
    }
    std::string error;
    if (!factory->Valid(opts, error)) {
      LOG_NET_WARN("Skipping listen address {}: {}", address, error);
      continue;
    }
    if (!factory->Enabled(opts)) {
      LOG_NET_DEBUG("Skipping listen address {}: transport disabled", address);
      continue;
    }
    listeners.push_back(factory->New(*uri, cfg, tls, conns, nat_service));
  }
  return listeners;
}

} // namespace network
} // namespace synclink
