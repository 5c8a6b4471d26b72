// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#include "network/listener.hpp"

namespace synclink {
namespace network {

std::string ListenerStateAsString(ListenerState state) {
  switch (state) {
  case ListenerState::IDLE:
    return "idle";
  case ListenerState::BINDING:
    return "binding";
  case ListenerState::SERVING:
    return "serving";
  case ListenerState::STOPPED:
    return "stopped";
  }
  return "unknown";
}

} // namespace network
} // namespace synclink
