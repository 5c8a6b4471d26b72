// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include "config/options.hpp"
#include "network/connection_types.hpp"
#include "network/notifications.hpp"
#include "network/secure_transport.hpp"
#include "network/uri.hpp"
#include <memory>
#include <string>
#include <vector>

namespace synclink {

namespace nat {
// Port-mapping service (UPnP/NAT-PMP) owned by the connection service.
// Part of the uniform factory signature; UDP transports do not use it.
class Service;
} // namespace nat

namespace network {

enum class ListenerState {
  IDLE,     // constructed, Serve() not called yet
  BINDING,  // opening the socket and the secure transport
  SERVING,  // accept loop and discovery loop running
  STOPPED,  // Serve() returned (stopped, or bind/listen failed)
};

std::string ListenerStateAsString(ListenerState state);

class ListenerFactory;

/**
 * GenericListener - shape shared by every transport listener so the
 * connection service can treat them uniformly
 *
 * Serve() blocks the calling thread until Stop() is called or binding
 * fails; all query methods are safe to call concurrently with Serve().
 */
class GenericListener {
public:
  virtual ~GenericListener() = default;

  virtual void Serve() = 0;
  virtual void Stop() = 0;

  virtual Uri URI() const = 0;

  // Addresses to advertise to peers outside the LAN
  virtual std::vector<Uri> WANAddresses() const = 0;
  // Addresses to advertise on the local network
  virtual std::vector<Uri> LANAddresses() const = 0;

  // Last bind/listen error ("" when none)
  virtual std::string Error() const = 0;

  virtual std::string String() const = 0;
  virtual const ListenerFactory &Factory() const = 0;

  // Human-readable NAT classification, or "unknown"
  virtual std::string NATType() const = 0;

  virtual ListenerState GetState() const = 0;

  virtual AddressChangeNotifier &Notifier() = 0;
};

using GenericListenerPtr = std::shared_ptr<GenericListener>;

class ListenerFactory {
public:
  virtual ~ListenerFactory() = default;

  virtual GenericListenerPtr New(const Uri &uri,
                                 std::shared_ptr<config::ConfigWrapper> cfg,
                                 TlsConfig tls,
                                 std::shared_ptr<IntakeChannel> conns,
                                 std::shared_ptr<nat::Service> nat_service) = 0;

  // Whether the configuration allows this transport at all; `error`
  // explains a false return
  virtual bool Valid(const config::Options &options, std::string &error) const = 0;

  virtual bool Enabled(const config::Options &options) const = 0;
};

} // namespace network
} // namespace synclink
