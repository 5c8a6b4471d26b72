// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include <boost/asio/ip/udp.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace synclink {
namespace network {

using UdpEndpoint = boost::asio::ip::udp::endpoint;

// PacketConn - datagram socket abstraction
//
// Implemented by the virtual connections handed out by PacketDemultiplexer.
// Consumers (the secure transport, the STUN client) use it exactly like a
// plain UDP socket. All methods are safe to call from any thread; Close()
// unblocks pending ReadFrom() calls.
class PacketConn {
public:
  virtual ~PacketConn() = default;

  // Block until a packet arrives, the timeout elapses or the connection is
  // closed. A zero timeout waits indefinitely. On success `buffer` holds
  // the packet and the packet size is returned.
  // Errors: boost::asio::error::timed_out, boost::asio::error::operation_aborted (closed)
  virtual size_t ReadFrom(std::vector<uint8_t> &buffer, UdpEndpoint &from,
                          std::chrono::milliseconds timeout,
                          boost::system::error_code &ec) = 0;

  virtual size_t WriteTo(const std::vector<uint8_t> &data, const UdpEndpoint &to,
                         boost::system::error_code &ec) = 0;

  virtual void Close() = 0;
  virtual bool IsClosed() const = 0;
  virtual UdpEndpoint LocalEndpoint() const = 0;
};

using PacketConnPtr = std::shared_ptr<PacketConn>;

} // namespace network
} // namespace synclink
