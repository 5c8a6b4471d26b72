// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include "network/packet_conn.hpp"
#include <boost/asio/ssl/context.hpp>
#include <boost/system/error_code.hpp>
#include <memory>
#include <string>
#include <vector>

namespace synclink {
namespace network {

// Abstract secure transport (QUIC-style: TLS 1.3 sessions carrying
// multiplexed streams over a datagram socket).
//
// The handshake and record layer are supplied by an implementation outside
// this library; listeners only drive accept loops through these interfaces.
// Test doubles live in test/network/infra/.

// Ready-to-use TLS configuration (certificates, ALPN, verification
// callbacks already installed by the credential manager)
using TlsConfig = std::shared_ptr<boost::asio::ssl::context>;

class SecureStream;
class SecureSession;
class SessionListener;
using SecureStreamPtr = std::shared_ptr<SecureStream>;
using SecureSessionPtr = std::shared_ptr<SecureSession>;

// One bidirectional stream inside a session
class SecureStream {
public:
  virtual ~SecureStream() = default;

  // Blocking read; returns 0 with ec set at end of stream or on error
  virtual size_t Read(std::vector<uint8_t> &buffer, boost::system::error_code &ec) = 0;
  virtual size_t Write(const std::vector<uint8_t> &data, boost::system::error_code &ec) = 0;
  virtual void Close() = 0;
};

// An established secure session
//
// Close() may be called from any thread and must unblock a pending
// AcceptStream() with an error.
class SecureSession {
public:
  virtual ~SecureSession() = default;

  // Block until the peer opens a stream. Has no timeout of its own.
  virtual SecureStreamPtr AcceptStream(boost::system::error_code &ec) = 0;

  virtual void Close() = 0;

  virtual UdpEndpoint RemoteEndpoint() const = 0;
  virtual UdpEndpoint LocalEndpoint() const = 0;
};

// Accepts sessions arriving on a packet connection
//
// Close() may be called from any thread and must unblock a pending
// Accept() with an error.
class SessionListener {
public:
  virtual ~SessionListener() = default;

  // Block until a handshake completes. Timeouts are reported as
  // boost::asio::error::timed_out.
  virtual SecureSessionPtr Accept(boost::system::error_code &ec) = 0;

  virtual void Close() = 0;
};

class SecureTransport {
public:
  virtual ~SecureTransport() = default;

  // Start accepting sessions on `conn`. Returns nullptr with ec set on failure.
  virtual std::unique_ptr<SessionListener> Listen(PacketConnPtr conn,
                                                  const TlsConfig &tls,
                                                  boost::system::error_code &ec) = 0;
};

} // namespace network
} // namespace synclink
