// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include "network/listener.hpp"
#include "network/registry.hpp"
#include "network/stun.hpp"
#include "util/stop_signal.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace synclink {
namespace network {

class QuicListenerFactory;

/**
 * QuicListener - accepts secure sessions on one UDP socket and keeps the
 * socket's external mapping alive with STUN on the same socket
 *
 * Serve() binds the socket, splits it with a PacketDemultiplexer into a
 * STUN connection (priority 10, transaction-ID filter) and a transport
 * connection (priority 100, everything else), then runs:
 *
 *   - the accept loop on the calling thread. Every accepted session gets
 *     a bounded window to open its first stream; the (session, stream)
 *     pair is then sent to the intake channel as a QUIC_SERVER connection.
 *   - the discovery loop on its own thread. It classifies the NAT through
 *     the configured STUN servers, keeps a punchable mapping alive and
 *     publishes the external address, abandoning servers whose answers
 *     flap.
 *   - a stop watcher that closes the session listener and any session
 *     still waiting for its first stream when Stop() is called.
 *
 * Error, external address and NAT type are guarded by one shared mutex;
 * address-change notifications are sent with it released.
 */
class QuicListener : public GenericListener {
public:
  static constexpr std::chrono::seconds STREAM_ACCEPT_TIMEOUT{10};
  static constexpr std::chrono::minutes STUN_RETRY_INTERVAL{5};
  static constexpr std::chrono::seconds DISABLED_POLL_INTERVAL{1};

  // Demultiplexer priorities; lower is offered packets first
  static constexpr int STUN_FILTER_PRIORITY = 10;
  static constexpr int TRANSPORT_FILTER_PRIORITY = 100;

  // How often a STUN server lookup in progress checks for Stop()
  static constexpr std::chrono::milliseconds RESOLVE_SLICE{50};

  QuicListener(const Uri &uri, std::shared_ptr<config::ConfigWrapper> cfg,
               TlsConfig tls, std::shared_ptr<IntakeChannel> conns,
               const QuicListenerFactory &factory);
  ~QuicListener() override = default;

  QuicListener(const QuicListener &) = delete;
  QuicListener &operator=(const QuicListener &) = delete;

  void Serve() override;
  void Stop() override;

  Uri URI() const override { return uri_; }
  std::vector<Uri> WANAddresses() const override;
  std::vector<Uri> LANAddresses() const override;
  std::string Error() const override;
  std::string String() const override { return uri_.ToString(); }
  const ListenerFactory &Factory() const override;
  std::string NATType() const override;
  ListenerState GetState() const override { return state_.load(); }
  AddressChangeNotifier &Notifier() override { return notifier_; }

  // Socket network for a listener scheme ("quic4" -> "udp4")
  static std::string NetworkForScheme(const std::string &scheme);

  /**
   * Resolve a "host:port" STUN server for a socket bound to `local`
   *
   * A result in the socket's address family is preferred; an IPv4 result
   * is mapped into IPv6 for a dual-stack socket. Gives up with
   * operation_aborted once `stop` is closed, even mid-lookup.
   */
  static std::optional<UdpEndpoint> ResolveStunServer(const std::string &server,
                                                      const UdpEndpoint &local,
                                                      const util::StopSignal &stop,
                                                      boost::system::error_code &ec);

#ifdef SYNCLINK_TESTS
  static void SetStreamAcceptTimeoutForTest(std::chrono::milliseconds timeout);
  static void ResetStreamAcceptTimeoutForTest();
  static void SetStunRetryIntervalForTest(std::chrono::milliseconds interval);
  static void ResetStunRetryIntervalForTest();
  static void SetDisabledPollIntervalForTest(std::chrono::milliseconds interval);
  static void ResetDisabledPollIntervalForTest();
  // Duration of one stun_keepalive_s unit (one second by default)
  static void SetKeepaliveUnitForTest(std::chrono::milliseconds unit);
  static void ResetKeepaliveUnitForTest();
#endif

private:
  // How a pass over one STUN server ended
  enum class ServerOutcome {
    NEXT_SERVER, // try the next configured server
    EXHAUSTED,   // stop iterating servers and wait for the retry interval
    DISABLED,    // discovery got disabled; re-check immediately
    STOPPED,
  };

  void AcceptLoop(SessionListener &session_listener, boost::asio::io_context &timer_io);
  void HandleSession(SecureSessionPtr session, boost::asio::io_context &timer_io);
  void CloseOnStop(SessionListener &session_listener);

  void StunRenewal(PacketConnPtr stun_conn);
  ServerOutcome RunServer(StunClient &client, const UdpEndpoint &local,
                          const std::string &server, NatType &old_type);
  // Forget NAT type and address; true if anything was published before
  bool ClearDiscovered();

  void SetError(const std::string &message);

  static std::chrono::milliseconds StreamAcceptTimeout();
  static std::chrono::milliseconds StunRetryInterval();
  static std::chrono::milliseconds DisabledPollInterval();
  static std::chrono::milliseconds KeepaliveUnit();

  const Uri uri_;
  const std::shared_ptr<config::ConfigWrapper> cfg_;
  const TlsConfig tls_;
  const std::shared_ptr<IntakeChannel> conns_;
  const QuicListenerFactory &factory_;

  util::StopSignal stop_;
  std::atomic<ListenerState> state_{ListenerState::IDLE};
  AddressChangeNotifier notifier_;

  mutable std::shared_mutex mutex_;
  std::string err_;
  std::optional<Uri> address_;
  NatType nat_type_{NatType::UNKNOWN};

  // Session accepted but still waiting for its first stream
  std::mutex pending_mutex_;
  SecureSessionPtr pending_session_;

  static std::atomic<std::chrono::milliseconds> stream_accept_timeout_override_;
  static std::atomic<std::chrono::milliseconds> stun_retry_interval_override_;
  static std::atomic<std::chrono::milliseconds> disabled_poll_interval_override_;
  static std::atomic<std::chrono::milliseconds> keepalive_unit_override_;
};

/**
 * QuicListenerFactory - builds QuicListeners for the quic, quic4 and quic6
 * schemes
 *
 * Holds the collaborators every listener shares: the secure transport
 * that performs handshakes, the STUN client constructor and the registry
 * the transport connection is published in while serving. Must outlive
 * the listeners it creates.
 */
class QuicListenerFactory : public ListenerFactory {
public:
  QuicListenerFactory(std::shared_ptr<SecureTransport> transport,
                      StunClientFactory stun_clients,
                      PacketConnRegistry &registry = PacketConnRegistry::Default());

  // Applies the default port when the URI has none. Throws
  // std::invalid_argument for a scheme other than quic, quic4 or quic6.
  GenericListenerPtr New(const Uri &uri, std::shared_ptr<config::ConfigWrapper> cfg,
                         TlsConfig tls, std::shared_ptr<IntakeChannel> conns,
                         std::shared_ptr<nat::Service> nat_service) override;

  bool Valid(const config::Options &options, std::string &error) const override;
  bool Enabled(const config::Options &options) const override;

  SecureTransport &transport() const { return *transport_; }
  const StunClientFactory &stun_clients() const { return stun_clients_; }
  PacketConnRegistry &registry() const { return registry_; }

private:
  std::shared_ptr<SecureTransport> transport_;
  StunClientFactory stun_clients_;
  PacketConnRegistry &registry_;
};

} // namespace network
} // namespace synclink
