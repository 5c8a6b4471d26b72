// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#include "network/quic_listener.hpp"
#include "network/packet_demultiplexer.hpp"
#include "network/stun_filter.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/address_v6.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace synclink {
namespace network {

namespace {

// Outcome of a STUN server lookup, shared with the thread running it
struct ResolveState {
  std::mutex mutex;
  std::condition_variable cv;
  bool done{false};
  boost::system::error_code ec;
  boost::asio::ip::udp::resolver::results_type results;
};

std::string EndpointString(const UdpEndpoint &endpoint) {
  return util::JoinHostPort(endpoint.address().to_string(), endpoint.port());
}

// External address as published: IPv4-mapped addresses are unmapped
std::string ExternalHost(const UdpEndpoint &endpoint) {
  auto normalized = util::ValidateAndNormalizeIP(endpoint.address().to_string());
  return normalized ? *normalized : endpoint.address().to_string();
}

} // namespace

std::atomic<std::chrono::milliseconds>
    QuicListener::stream_accept_timeout_override_{std::chrono::milliseconds{0}};
std::atomic<std::chrono::milliseconds>
    QuicListener::stun_retry_interval_override_{std::chrono::milliseconds{0}};
std::atomic<std::chrono::milliseconds>
    QuicListener::disabled_poll_interval_override_{std::chrono::milliseconds{0}};
std::atomic<std::chrono::milliseconds>
    QuicListener::keepalive_unit_override_{std::chrono::milliseconds{0}};

QuicListener::QuicListener(const Uri &uri, std::shared_ptr<config::ConfigWrapper> cfg,
                           TlsConfig tls, std::shared_ptr<IntakeChannel> conns,
                           const QuicListenerFactory &factory)
    : uri_(uri), cfg_(std::move(cfg)), tls_(std::move(tls)), conns_(std::move(conns)),
      factory_(factory) {}

std::optional<UdpEndpoint> QuicListener::ResolveStunServer(const std::string &server,
                                                           const UdpEndpoint &local,
                                                           const util::StopSignal &stop,
                                                           boost::system::error_code &ec) {
  auto split = util::SplitHostPort(server);
  if (!split || split->host.empty() || split->port.empty() ||
      !util::SafeParsePort(split->port)) {
    ec = boost::asio::error::invalid_argument;
    return std::nullopt;
  }

  if (stop.IsClosed()) {
    ec = boost::asio::error::operation_aborted;
    return std::nullopt;
  }

  // getaddrinfo cannot be interrupted, so the lookup runs on its own
  // thread and we stop waiting for it once `stop` closes. The thread
  // shares ownership of the result and finishes in the background.
  auto lookup = std::make_shared<ResolveState>();
  std::thread([lookup, host = split->host, port = split->port]() {
    boost::asio::io_context io;
    boost::asio::ip::udp::resolver resolver(io);
    boost::system::error_code resolve_ec;
    auto resolved = resolver.resolve(host, port, resolve_ec);

    std::lock_guard<std::mutex> lock(lookup->mutex);
    lookup->ec = resolve_ec;
    lookup->results = std::move(resolved);
    lookup->done = true;
    lookup->cv.notify_all();
  }).detach();

  boost::asio::ip::udp::resolver::results_type results;
  {
    std::unique_lock<std::mutex> lock(lookup->mutex);
    while (!lookup->cv.wait_for(lock, RESOLVE_SLICE, [&lookup]() { return lookup->done; })) {
      if (stop.IsClosed()) {
        ec = boost::asio::error::operation_aborted;
        return std::nullopt;
      }
    }
    ec = lookup->ec;
    results = lookup->results;
  }
  if (ec) {
    return std::nullopt;
  }
  if (results.empty()) {
    ec = boost::asio::error::host_not_found;
    return std::nullopt;
  }

  for (const auto &entry : results) {
    if (entry.endpoint().protocol() == local.protocol()) {
      return entry.endpoint();
    }
  }
  UdpEndpoint first = results.begin()->endpoint();
  if (local.address().is_v6() && first.address().is_v4()) {
    return UdpEndpoint(boost::asio::ip::make_address_v6(boost::asio::ip::v4_mapped,
                                                        first.address().to_v4()),
                       first.port());
  }
  return first;
}

std::string QuicListener::NetworkForScheme(const std::string &scheme) {
  std::string network = scheme;
  auto pos = network.find("quic");
  if (pos != std::string::npos) {
    network.replace(pos, 4, "udp");
  }
  return network;
}

// ============================================================================
// Serve / Stop
// ============================================================================

void QuicListener::Serve() {
  state_ = ListenerState::BINDING;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    err_.clear();
  }

  const std::string network = NetworkForScheme(uri_.scheme);
  boost::system::error_code ec;
  auto demux = PacketDemultiplexer::Bind(network, uri_.host,
                                         uri_.port.value_or(config::DEFAULT_QUIC_PORT), ec);
  if (!demux) {
    LOG_NET_INFO("Listen ({}): {}", uri_.ToString(), ec.message());
    SetError(ec.message());
    state_ = ListenerState::STOPPED;
    return;
  }

  auto stun_conn = demux->NewConn(STUN_FILTER_PRIORITY, std::make_unique<StunFilter>());
  auto quic_conn = demux->NewConn(TRANSPORT_FILTER_PRIORITY, nullptr);
  demux->Start();

  PacketConnRegistry &registry = factory_.registry();
  registry.Register(uri_.scheme, quic_conn);

  auto session_listener = factory_.transport().Listen(quic_conn, tls_, ec);
  if (!session_listener) {
    const std::string message = ec ? ec.message() : "secure transport did not listen";
    LOG_NET_INFO("Listen ({}): {}", uri_.ToString(), message);
    SetError(message);
    registry.Unregister(uri_.scheme, quic_conn);
    demux->Close();
    state_ = ListenerState::STOPPED;
    return;
  }

  state_ = ListenerState::SERVING;
  LOG_NET_INFO("QUIC listener ({}) starting on {}", uri_.ToString(),
               EndpointString(demux->LocalEndpoint()));

  boost::asio::io_context timer_io;
  auto work = boost::asio::make_work_guard(timer_io);
  std::thread timer_thread([&timer_io]() { timer_io.run(); });
  std::thread stun_thread([this, stun_conn]() { StunRenewal(stun_conn); });
  std::thread watcher([this, &session_listener]() { CloseOnStop(*session_listener); });

  AcceptLoop(*session_listener, timer_io);

  // Closing the socket unblocks any STUN exchange in flight
  watcher.join();
  demux->Close();
  stun_thread.join();

  work.reset();
  timer_io.stop();
  timer_thread.join();

  registry.Unregister(uri_.scheme, quic_conn);
  state_ = ListenerState::STOPPED;
  LOG_NET_INFO("QUIC listener ({}) shutting down", uri_.ToString());
}

void QuicListener::Stop() { stop_.Close(); }

void QuicListener::CloseOnStop(SessionListener &session_listener) {
  stop_.Wait();
  session_listener.Close();

  SecureSessionPtr pending;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending = pending_session_;
  }
  if (pending) {
    pending->Close();
  }
}

// ============================================================================
// Accept pipeline
// ============================================================================

void QuicListener::AcceptLoop(SessionListener &session_listener,
                              boost::asio::io_context &timer_io) {
  while (!stop_.IsClosed()) {
    boost::system::error_code ec;
    SecureSessionPtr session = session_listener.Accept(ec);

    if (stop_.IsClosed()) {
      if (session) {
        session->Close();
      }
      return;
    }

    if (!session) {
      if (ec && ec != boost::asio::error::timed_out) {
        LOG_NET_WARN("Listen ({}): Accepting connection: {}", uri_.ToString(), ec.message());
      }
      continue;
    }

    HandleSession(std::move(session), timer_io);
  }
}

void QuicListener::HandleSession(SecureSessionPtr session, boost::asio::io_context &timer_io) {
  const std::string peer = EndpointString(session->RemoteEndpoint());
  const std::string uri_str = uri_.ToString();

  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (stop_.IsClosed()) {
      session->Close();
      return;
    }
    pending_session_ = session;
  }
  LOG_NET_DEBUG("{}: session from {} awaiting first stream", uri_str, peer);

  // Whoever flips `settled` first decides the session's fate: the stream
  // accept below, or the timer closing the session
  auto settled = std::make_shared<std::atomic<bool>>(false);
  auto timer = std::make_shared<boost::asio::steady_timer>(timer_io);
  const auto timeout = StreamAcceptTimeout();

  // The timer is only touched on the timer thread
  boost::asio::post(timer_io, [timer, settled, session, timeout, peer, uri_str]() {
    timer->expires_after(timeout);
    timer->async_wait([settled, session, timeout, peer, uri_str](const boost::system::error_code &ec) {
      if (ec || settled->exchange(true)) {
        return;
      }
      LOG_NET_DEBUG("{}: no stream from {} within {}ms, closing session", uri_str, peer,
                    timeout.count());
      session->Close();
    });
  });

  boost::system::error_code ec;
  SecureStreamPtr stream = session->AcceptStream(ec);
  const bool timed_out = settled->exchange(true);
  boost::asio::post(timer_io, [timer]() { timer->cancel(); });

  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_session_.reset();
  }

  if (timed_out || stop_.IsClosed() || !stream) {
    if (!timed_out && !stop_.IsClosed()) {
      LOG_NET_DEBUG("{}: accepting stream from {}: {}", uri_str, peer, ec.message());
    }
    if (stream) {
      stream->Close();
    }
    session->Close();
    return;
  }

  InternalConnection conn{std::make_shared<QuicTlsConnection>(session, stream),
                          ConnectionType::QUIC_SERVER, QUIC_PRIORITY};
  if (!conns_->Send(conn, stop_)) {
    LOG_NET_DEBUG("{}: stopped before connection from {} was taken", uri_str, peer);
    conn.conn->Close();
    return;
  }
  LOG_NET_DEBUG("{}: accepted connection from {}", uri_str, peer);
}

// ============================================================================
// NAT discovery and keepalive
// ============================================================================

void QuicListener::StunRenewal(PacketConnPtr stun_conn) {
  std::unique_ptr<StunClient> client = factory_.stun_clients()(stun_conn);
  client->SetSoftwareName("");
  const UdpEndpoint local = stun_conn->LocalEndpoint();

  NatType old_type = NatType::UNKNOWN;

  while (!stop_.IsClosed()) {
    const config::Options opts = cfg_->GetOptions();
    if (opts.stun_keepalive_s < 1 || !opts.nat_enabled) {
      old_type = NatType::UNKNOWN;
      if (ClearDiscovered()) {
        notifier_.NotifyAddressesChanged(*this);
      }
      if (stop_.WaitFor(DisabledPollInterval())) {
        return;
      }
      continue;
    }

    bool disabled = false;
    for (const auto &server : cfg_->StunServers()) {
      const ServerOutcome outcome = RunServer(*client, local, server, old_type);
      if (outcome == ServerOutcome::STOPPED) {
        return;
      }
      if (outcome == ServerOutcome::DISABLED) {
        disabled = true;
        break;
      }
      if (outcome == ServerOutcome::EXHAUSTED) {
        break;
      }
    }
    if (disabled) {
      continue;
    }

    // All servers failed or the NAT cannot be punched; wait for a better day
    LOG_NAT_DEBUG("{}: no usable STUN mapping, retrying in {}ms", uri_.ToString(),
                  StunRetryInterval().count());
    if (stop_.WaitFor(StunRetryInterval())) {
      return;
    }
  }
}

QuicListener::ServerOutcome QuicListener::RunServer(StunClient &client,
                                                    const UdpEndpoint &local,
                                                    const std::string &server,
                                                    NatType &old_type) {
  if (stop_.IsClosed()) {
    return ServerOutcome::STOPPED;
  }
  const std::string uri_str = uri_.ToString();

  // Resolve once so a server advertising several IPs keeps hitting the
  // same one; otherwise the mapping flips between them
  boost::system::error_code ec;
  auto server_endpoint = ResolveStunServer(server, local, stop_, ec);
  if (stop_.IsClosed()) {
    return ServerOutcome::STOPPED;
  }
  if (!server_endpoint) {
    LOG_NAT_DEBUG("{} stun addr resolution on {}: {}", uri_str, server, ec.message());
    return ServerOutcome::NEXT_SERVER;
  }
  client.SetServerAddress(*server_endpoint);

  StunResult result = client.Discover();
  if (stop_.IsClosed()) {
    return ServerOutcome::STOPPED;
  }
  if (result.error || !result.external) {
    LOG_NAT_DEBUG("{} stun discovery on {}: {}", uri_str, server,
                  result.error ? result.error.message() : "no external address");
    return ServerOutcome::NEXT_SERVER;
  }

  const NatType nat_type = result.nat_type;
  if (nat_type == NatType::ERROR || nat_type == NatType::UNKNOWN ||
      nat_type == NatType::BLOCKED) {
    LOG_NAT_DEBUG("{} stun discovery on {} resolved to {}", uri_str, server,
                  NatTypeAsString(nat_type));
    return ServerOutcome::NEXT_SERVER;
  }

  bool notify_pending = false;
  if (nat_type != old_type) {
    LOG_NAT_INFO("{} detected NAT type: {}", uri_str, NatTypeAsString(nat_type));
    {
      std::unique_lock<std::shared_mutex> lock(mutex_);
      nat_type_ = nat_type;
    }
    old_type = nat_type;
    notify_pending = true;
  }

  if (!IsPunchable(nat_type)) {
    if (notify_pending) {
      notifier_.NotifyAddressesChanged(*this);
    }
    return ServerOutcome::EXHAUSTED;
  }

  UdpEndpoint external = *result.external;
  int address_changes = 1;
  for (int loops = 1;; ++loops) {
    const Uri external_uri = uri_.WithHostPort(ExternalHost(external), external.port());
    bool changed = false;
    {
      std::unique_lock<std::shared_mutex> lock(mutex_);
      if (!address_ || *address_ != external_uri) {
        address_ = external_uri;
        changed = true;
        ++address_changes;
      }
    }
    if (changed) {
      LOG_NAT_INFO("{} resolved external address {} (via {})", uri_str,
                   external_uri.ToString(), server);
    }

    // Subscribers read WANAddresses(), so this runs with mutex_ released
    if (changed || notify_pending) {
      notify_pending = false;
      notifier_.NotifyAddressesChanged(*this);
    }

    // Changing address on every other round means the server or the
    // router is misbehaving
    if (loops > 3 && loops / address_changes < 2) {
      LOG_NAT_DEBUG("{} external address via {} changed {} times in {} rounds, dropping server",
                    uri_str, server, address_changes - 1, loops);
      return ServerOutcome::NEXT_SERVER;
    }

    config::Options opts = cfg_->GetOptions();
    if (opts.stun_keepalive_s < 1 || !opts.nat_enabled) {
      return ServerOutcome::DISABLED;
    }
    if (stop_.WaitFor(opts.stun_keepalive_s * KeepaliveUnit())) {
      return ServerOutcome::STOPPED;
    }
    opts = cfg_->GetOptions();
    if (opts.stun_keepalive_s < 1 || !opts.nat_enabled) {
      return ServerOutcome::DISABLED;
    }

    result = client.Keepalive();
    if (stop_.IsClosed()) {
      return ServerOutcome::STOPPED;
    }
    if (result.error || !result.external) {
      LOG_NAT_DEBUG("{} stun keepalive on {}: {}", uri_str, server,
                    result.error ? result.error.message() : "no external address");
      return ServerOutcome::NEXT_SERVER;
    }
    external = *result.external;
  }
}

bool QuicListener::ClearDiscovered() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const bool had_state = address_.has_value() || nat_type_ != NatType::UNKNOWN;
  address_.reset();
  nat_type_ = NatType::UNKNOWN;
  return had_state;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<Uri> QuicListener::WANAddresses() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<Uri> addrs{uri_};
  if (address_) {
    addrs.push_back(*address_);
  }
  return addrs;
}

std::vector<Uri> QuicListener::LANAddresses() const { return {uri_}; }

std::string QuicListener::Error() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return err_;
}

const ListenerFactory &QuicListener::Factory() const { return factory_; }

std::string QuicListener::NATType() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (nat_type_ == NatType::UNKNOWN || nat_type_ == NatType::ERROR) {
    return "unknown";
  }
  return NatTypeAsString(nat_type_);
}

void QuicListener::SetError(const std::string &message) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  err_ = message;
}

// ============================================================================
// Timings
// ============================================================================

std::chrono::milliseconds QuicListener::StreamAcceptTimeout() {
  auto ms = stream_accept_timeout_override_.load(std::memory_order_relaxed);
  if (ms.count() > 0) return ms;
  return std::chrono::duration_cast<std::chrono::milliseconds>(STREAM_ACCEPT_TIMEOUT);
}

std::chrono::milliseconds QuicListener::StunRetryInterval() {
  auto ms = stun_retry_interval_override_.load(std::memory_order_relaxed);
  if (ms.count() > 0) return ms;
  return std::chrono::duration_cast<std::chrono::milliseconds>(STUN_RETRY_INTERVAL);
}

std::chrono::milliseconds QuicListener::DisabledPollInterval() {
  auto ms = disabled_poll_interval_override_.load(std::memory_order_relaxed);
  if (ms.count() > 0) return ms;
  return std::chrono::duration_cast<std::chrono::milliseconds>(DISABLED_POLL_INTERVAL);
}

std::chrono::milliseconds QuicListener::KeepaliveUnit() {
  auto ms = keepalive_unit_override_.load(std::memory_order_relaxed);
  if (ms.count() > 0) return ms;
  return std::chrono::seconds(1);
}

#ifdef SYNCLINK_TESTS
void QuicListener::SetStreamAcceptTimeoutForTest(std::chrono::milliseconds timeout) {
  stream_accept_timeout_override_.store(timeout, std::memory_order_relaxed);
}

void QuicListener::ResetStreamAcceptTimeoutForTest() {
  stream_accept_timeout_override_.store(std::chrono::milliseconds{0}, std::memory_order_relaxed);
}

void QuicListener::SetStunRetryIntervalForTest(std::chrono::milliseconds interval) {
  stun_retry_interval_override_.store(interval, std::memory_order_relaxed);
}

void QuicListener::ResetStunRetryIntervalForTest() {
  stun_retry_interval_override_.store(std::chrono::milliseconds{0}, std::memory_order_relaxed);
}

void QuicListener::SetDisabledPollIntervalForTest(std::chrono::milliseconds interval) {
  disabled_poll_interval_override_.store(interval, std::memory_order_relaxed);
}

void QuicListener::ResetDisabledPollIntervalForTest() {
  disabled_poll_interval_override_.store(std::chrono::milliseconds{0}, std::memory_order_relaxed);
}

void QuicListener::SetKeepaliveUnitForTest(std::chrono::milliseconds unit) {
  keepalive_unit_override_.store(unit, std::memory_order_relaxed);
}

void QuicListener::ResetKeepaliveUnitForTest() {
  keepalive_unit_override_.store(std::chrono::milliseconds{0}, std::memory_order_relaxed);
}
#endif

// ============================================================================
// QuicListenerFactory
// ============================================================================

QuicListenerFactory::QuicListenerFactory(std::shared_ptr<SecureTransport> transport,
                                         StunClientFactory stun_clients,
                                         PacketConnRegistry &registry)
    : transport_(std::move(transport)), stun_clients_(std::move(stun_clients)),
      registry_(registry) {
  if (!transport_ || !stun_clients_) {
    throw std::invalid_argument("QuicListenerFactory requires a transport and a STUN client factory");
  }
}

GenericListenerPtr QuicListenerFactory::New(const Uri &uri,
                                            std::shared_ptr<config::ConfigWrapper> cfg,
                                            TlsConfig tls,
                                            std::shared_ptr<IntakeChannel> conns,
                                            std::shared_ptr<nat::Service> /*nat_service*/) {
  if (uri.scheme != "quic" && uri.scheme != "quic4" && uri.scheme != "quic6") {
    throw std::invalid_argument("QuicListenerFactory cannot serve scheme " + uri.scheme);
  }
  return std::make_shared<QuicListener>(FixupPort(uri, config::DEFAULT_QUIC_PORT),
                                        std::move(cfg), std::move(tls), std::move(conns),
                                        *this);
}

bool QuicListenerFactory::Valid(const config::Options & /*options*/, std::string &error) const {
  error.clear();
  return true;
}

bool QuicListenerFactory::Enabled(const config::Options & /*options*/) const { return true; }

} // namespace network
} // namespace synclink
