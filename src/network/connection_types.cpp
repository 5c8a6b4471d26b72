// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#include "network/connection_types.hpp"

namespace synclink {
namespace network {

std::string ConnectionTypeAsString(ConnectionType conn_type) {
  switch (conn_type) {
  case ConnectionType::QUIC_CLIENT:
    return "quic-client";
  case ConnectionType::QUIC_SERVER:
    return "quic-server";
  }
  return "unknown";
}

QuicTlsConnection::QuicTlsConnection(SecureSessionPtr session, SecureStreamPtr stream)
    : session_(std::move(session)), stream_(std::move(stream)) {}

size_t QuicTlsConnection::Read(std::vector<uint8_t> &buffer,
                               boost::system::error_code &ec) {
  return stream_->Read(buffer, ec);
}

size_t QuicTlsConnection::Write(const std::vector<uint8_t> &data,
                                boost::system::error_code &ec) {
  return stream_->Write(data, ec);
}

void QuicTlsConnection::Close() {
  stream_->Close();
  session_->Close();
}

} // namespace network
} // namespace synclink
