// Copyright (c) 2025 The Synclink Authors
// Packet demultiplexer: one UDP socket, several virtual packet connections

#include "network/packet_demultiplexer.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <boost/asio/ip/v6_only.hpp>
#include <boost/asio/post.hpp>
#include <condition_variable>
#include <deque>
#include <future>
#include <utility>

namespace synclink {
namespace network {

// ============================================================================
// FilteredConn
// ============================================================================

class FilteredConn : public PacketConn {
public:
  FilteredConn(std::weak_ptr<PacketDemultiplexer> owner, int priority,
               std::unique_ptr<PacketFilter> filter, size_t backlog,
               UdpEndpoint local)
      : owner_(std::move(owner)), priority_(priority), filter_(std::move(filter)),
        backlog_(backlog), local_(std::move(local)) {}

  int priority() const { return priority_; }

  // Called on the demultiplexer's io thread
  bool Claims(const std::vector<uint8_t> &data, const UdpEndpoint &from) {
    if (IsClosed()) {
      return false;
    }
    return !filter_ || filter_->ClaimIncoming(data, from);
  }

  // Returns false if the backlog is full
  bool Deliver(std::vector<uint8_t> data, const UdpEndpoint &from) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return true;
      }
      if (queue_.size() >= backlog_) {
        return false;
      }
      queue_.emplace_back(std::move(data), from);
    }
    cv_.notify_one();
    return true;
  }

  size_t ReadFrom(std::vector<uint8_t> &buffer, UdpEndpoint &from,
                  std::chrono::milliseconds timeout,
                  boost::system::error_code &ec) override {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this]() { return closed_ || !queue_.empty(); };
    if (timeout.count() > 0) {
      cv_.wait_for(lock, timeout, ready);
    } else {
      cv_.wait(lock, ready);
    }

    if (closed_) {
      ec = boost::asio::error::operation_aborted;
      return 0;
    }
    if (queue_.empty()) {
      ec = boost::asio::error::timed_out;
      return 0;
    }

    ec.clear();
    buffer = std::move(queue_.front().first);
    from = queue_.front().second;
    queue_.pop_front();
    return buffer.size();
  }

  size_t WriteTo(const std::vector<uint8_t> &data, const UdpEndpoint &to,
                 boost::system::error_code &ec) override {
    if (IsClosed()) {
      ec = boost::asio::error::operation_aborted;
      return 0;
    }
    if (filter_) {
      filter_->Outgoing(data, to);
    }
    auto owner = owner_.lock();
    if (!owner) {
      ec = boost::asio::error::operation_aborted;
      return 0;
    }
    return owner->SendTo(data, to, ec);
  }

  void Close() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      queue_.clear();
    }
    cv_.notify_all();
  }

  bool IsClosed() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  UdpEndpoint LocalEndpoint() const override { return local_; }

private:
  std::weak_ptr<PacketDemultiplexer> owner_;
  const int priority_;
  std::unique_ptr<PacketFilter> filter_;
  const size_t backlog_;
  const UdpEndpoint local_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::pair<std::vector<uint8_t>, UdpEndpoint>> queue_;
  bool closed_{false};
};

// ============================================================================
// PacketDemultiplexer
// ============================================================================

PacketDemultiplexer::PacketDemultiplexer() : socket_(io_context_) {}

PacketDemultiplexer::~PacketDemultiplexer() { Close(); }

std::shared_ptr<PacketDemultiplexer>
PacketDemultiplexer::Bind(const std::string &network, const std::string &host,
                          uint16_t port, boost::system::error_code &ec) {
  using boost::asio::ip::udp;
  ec.clear();

  const bool want_v4 = network == "udp4";
  const bool want_v6 = network == "udp6";
  if (!want_v4 && !want_v6 && network != "udp") {
    ec = boost::asio::error::address_family_not_supported;
    return nullptr;
  }

  auto demux = std::shared_ptr<PacketDemultiplexer>(new PacketDemultiplexer());

  UdpEndpoint endpoint;
  if (host.empty()) {
    endpoint = UdpEndpoint(want_v4 ? udp::v4() : udp::v6(), port);
  } else {
    udp::resolver resolver(demux->io_context_);
    auto results = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
      return nullptr;
    }
    bool found = false;
    for (const auto &entry : results) {
      const auto &candidate = entry.endpoint();
      if ((want_v4 && !candidate.address().is_v4()) ||
          (want_v6 && !candidate.address().is_v6())) {
        continue;
      }
      endpoint = candidate;
      found = true;
      break;
    }
    if (!found) {
      ec = boost::asio::error::address_family_not_supported;
      return nullptr;
    }
  }

  demux->socket_.open(endpoint.protocol(), ec);
  if (ec) {
    return nullptr;
  }

  if (network == "udp" && endpoint.address().is_v6()) {
    // Dual-stack wildcard like the other "udp" listeners (best-effort)
    boost::system::error_code opt_ec;
    demux->socket_.set_option(boost::asio::ip::v6_only(false), opt_ec);
  }

  demux->socket_.bind(endpoint, ec);
  if (ec) {
    return nullptr;
  }

  demux->local_endpoint_ = demux->socket_.local_endpoint(ec);
  if (ec) {
    return nullptr;
  }

  demux->work_guard_ = std::make_unique<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      demux->io_context_.get_executor());
  demux->io_thread_ = std::thread([raw = demux.get()]() { raw->io_context_.run(); });

  LOG_NET_TRACE("packet demultiplexer bound to {}:{}",
                demux->local_endpoint_.address().to_string(),
                demux->local_endpoint_.port());
  return demux;
}

PacketConnPtr PacketDemultiplexer::NewConn(int priority,
                                           std::unique_ptr<PacketFilter> filter,
                                           size_t backlog) {
  auto conn = std::make_shared<FilteredConn>(weak_from_this(), priority,
                                             std::move(filter), backlog,
                                             local_endpoint_);
  if (closed_) {
    conn->Close();
    return conn;
  }

  std::lock_guard<std::mutex> lock(conns_mutex_);
  auto pos = std::upper_bound(
      conns_.begin(), conns_.end(), priority,
      [](int p, const std::shared_ptr<FilteredConn> &c) { return p < c->priority(); });
  conns_.insert(pos, conn);
  return conn;
}

void PacketDemultiplexer::Start() {
  if (closed_ || started_.exchange(true)) {
    return;
  }
  boost::asio::post(io_context_, [this]() { StartReceive(); });
}

void PacketDemultiplexer::Close() {
  {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (closed_.exchange(true)) {
      return;
    }
  }

  std::vector<std::shared_ptr<FilteredConn>> conns;
  {
    std::lock_guard<std::mutex> lock(conns_mutex_);
    conns = conns_;
  }
  for (auto &conn : conns) {
    conn->Close();
  }

  // Closing on the io thread cancels the pending receive; once that handler
  // has run the io_context runs out of work and the thread exits.
  boost::asio::post(io_context_, [this]() {
    boost::system::error_code ignored;
    socket_.close(ignored);
  });
  work_guard_.reset();

  if (io_thread_.joinable()) {
    if (io_thread_.get_id() == std::this_thread::get_id()) {
      io_thread_.detach();
    } else {
      io_thread_.join();
    }
  }

  LOG_NET_TRACE("packet demultiplexer on port {} closed (dropped={}, overflow={})",
                local_endpoint_.port(), dropped_.load(), overflow_.load());
}

size_t PacketDemultiplexer::SendTo(const std::vector<uint8_t> &data,
                                   const UdpEndpoint &to,
                                   boost::system::error_code &ec) {
  std::promise<std::pair<size_t, boost::system::error_code>> done;
  auto result = done.get_future();

  {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (closed_) {
      ec = boost::asio::error::operation_aborted;
      return 0;
    }
    boost::asio::post(io_context_, [this, &data, &to, &done]() {
      boost::system::error_code send_ec;
      size_t sent = socket_.send_to(boost::asio::buffer(data), to, 0, send_ec);
      done.set_value({sent, send_ec});
    });
  }

  auto [sent, send_ec] = result.get();
  ec = send_ec;
  return sent;
}

void PacketDemultiplexer::StartReceive() {
  if (closed_) {
    return;
  }

  socket_.async_receive_from(
      boost::asio::buffer(recv_buffer_), recv_from_,
      [this](const boost::system::error_code &ec, size_t bytes) {
        if (ec == boost::asio::error::operation_aborted || closed_) {
          return;
        }
        if (ec) {
          // e.g. ICMP port unreachable reported on the socket; keep reading
          LOG_NET_TRACE("packet demultiplexer receive error: {}", ec.message());
        } else {
          Dispatch(std::vector<uint8_t>(recv_buffer_.begin(), recv_buffer_.begin() + bytes),
                   recv_from_);
        }
        StartReceive();
      });
}

void PacketDemultiplexer::Dispatch(std::vector<uint8_t> packet, const UdpEndpoint &from) {
  std::lock_guard<std::mutex> lock(conns_mutex_);
  for (auto &conn : conns_) {
    if (!conn->Claims(packet, from)) {
      continue;
    }
    if (!conn->Deliver(std::move(packet), from)) {
      ++overflow_;
    }
    return;
  }
  ++dropped_;
}

} // namespace network
} // namespace synclink
