// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include "network/packet_conn.hpp"
#include <array>
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace synclink {
namespace network {

// PacketFilter - decides which virtual connection owns an inbound packet
//
// ClaimIncoming() runs on the demultiplexer's I/O thread for every inbound
// packet; Outgoing() runs on the writer's thread before each send so a
// filter can learn what replies to expect. Implementations must be
// thread-safe.
class PacketFilter {
public:
  virtual ~PacketFilter() = default;
  virtual bool ClaimIncoming(const std::vector<uint8_t> &data, const UdpEndpoint &from) = 0;
  virtual void Outgoing(const std::vector<uint8_t> &data, const UdpEndpoint &to) = 0;
};

class FilteredConn;

/**
 * PacketDemultiplexer - shares one bound UDP socket between several
 * virtual packet connections
 *
 * Each virtual connection is created with a priority and an optional
 * filter. Inbound packets are offered to the connections in ascending
 * priority order; the first one whose filter claims the packet (a
 * connection without a filter claims everything) receives it exclusively.
 * Packets nobody claims are dropped, packets for a connection whose
 * backlog is full are discarded as overflow.
 *
 * Threading: a single owned io_context thread does all socket I/O. Writes
 * from virtual connections are posted onto that thread and the writer
 * waits for the result, so the socket is only ever touched by one thread.
 *
 * Usage:
 *   boost::system::error_code ec;
 *   auto demux = PacketDemultiplexer::Bind("udp4", "0.0.0.0", 22000, ec);
 *   auto stun = demux->NewConn(10, std::make_unique<StunFilter>());
 *   auto quic = demux->NewConn(100, nullptr);
 *   demux->Start();
 *   ...
 *   demux->Close();  // closes both virtual connections and the socket
 */
class PacketDemultiplexer : public std::enable_shared_from_this<PacketDemultiplexer> {
public:
  static constexpr size_t DEFAULT_BACKLOG = 256;
  static constexpr size_t MAX_DATAGRAM_SIZE = 65536;

  /**
   * Open and bind the UDP socket
   *
   * @param network "udp", "udp4" or "udp6"
   * @param host    Literal address, hostname or empty for the wildcard address
   * @param port    Port to bind (0 = ephemeral)
   * @return nullptr with `ec` set on failure
   */
  static std::shared_ptr<PacketDemultiplexer> Bind(const std::string &network,
                                                   const std::string &host,
                                                   uint16_t port,
                                                   boost::system::error_code &ec);

  ~PacketDemultiplexer();

  PacketDemultiplexer(const PacketDemultiplexer &) = delete;
  PacketDemultiplexer &operator=(const PacketDemultiplexer &) = delete;

  // Create a virtual connection. A null filter claims every packet.
  PacketConnPtr NewConn(int priority, std::unique_ptr<PacketFilter> filter,
                        size_t backlog = DEFAULT_BACKLOG);

  // Begin reading from the socket and dispatching packets
  void Start();

  // Close all virtual connections and the socket. Idempotent.
  void Close();

  bool IsClosed() const { return closed_; }

  UdpEndpoint LocalEndpoint() const { return local_endpoint_; }

  // Packets no virtual connection claimed
  uint64_t DroppedCount() const { return dropped_; }
  // Packets discarded because the claiming connection's backlog was full
  uint64_t OverflowCount() const { return overflow_; }

private:
  friend class FilteredConn;

  PacketDemultiplexer();

  size_t SendTo(const std::vector<uint8_t> &data, const UdpEndpoint &to,
                boost::system::error_code &ec);

  // Must run on the io thread
  void StartReceive();
  void Dispatch(std::vector<uint8_t> packet, const UdpEndpoint &from);

  boost::asio::io_context io_context_;
  boost::asio::ip::udp::socket socket_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread io_thread_;
  UdpEndpoint local_endpoint_;

  // Accessed only on the io thread
  std::array<uint8_t, MAX_DATAGRAM_SIZE> recv_buffer_{};
  UdpEndpoint recv_from_;

  // Sorted by ascending priority
  std::mutex conns_mutex_;
  std::vector<std::shared_ptr<FilteredConn>> conns_;

  // Serializes "check closed_ then post a send" against Close(), so every
  // posted send runs before the io thread exits
  std::mutex send_mutex_;

  std::atomic<bool> started_{false};
  std::atomic<bool> closed_{false};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> overflow_{0};
};

} // namespace network
} // namespace synclink
