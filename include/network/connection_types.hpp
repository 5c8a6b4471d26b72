// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include "network/secure_transport.hpp"
#include "util/channel.hpp"
#include <memory>
#include <string>

namespace synclink {
namespace network {

/**
 * How a connection came to be. Downstream connection arbitration uses it
 * together with the priority to pick between duplicate connections to the
 * same device.
 */
enum class ConnectionType {
  // We dialed the peer over QUIC
  QUIC_CLIENT,

  // The peer dialed us and our QUIC listener accepted it
  QUIC_SERVER,
};

std::string ConnectionTypeAsString(ConnectionType conn_type);

// Lower is better when two connections to the same device compete
constexpr int QUIC_PRIORITY = 100;

/**
 * QuicTlsConnection - a secure session together with its first stream,
 * presented as one stream-oriented connection
 *
 * Read/Write go to the stream. Close() closes the stream, then the
 * session; it is safe to call more than once.
 */
class QuicTlsConnection {
public:
  QuicTlsConnection(SecureSessionPtr session, SecureStreamPtr stream);

  QuicTlsConnection(const QuicTlsConnection &) = delete;
  QuicTlsConnection &operator=(const QuicTlsConnection &) = delete;

  size_t Read(std::vector<uint8_t> &buffer, boost::system::error_code &ec);
  size_t Write(const std::vector<uint8_t> &data, boost::system::error_code &ec);
  void Close();

  UdpEndpoint RemoteEndpoint() const { return session_->RemoteEndpoint(); }
  UdpEndpoint LocalEndpoint() const { return session_->LocalEndpoint(); }

  const SecureSessionPtr &session() const { return session_; }
  const SecureStreamPtr &stream() const { return stream_; }

private:
  SecureSessionPtr session_;
  SecureStreamPtr stream_;
};

// A fully accepted connection handed to the rest of the system
struct InternalConnection {
  std::shared_ptr<QuicTlsConnection> conn;
  ConnectionType type{ConnectionType::QUIC_SERVER};
  int priority{QUIC_PRIORITY};
};

// Shared intake of accepted connections. Listeners only send; the
// connection service drains it.
using IntakeChannel = util::BoundedChannel<InternalConnection>;

} // namespace network
} // namespace synclink
