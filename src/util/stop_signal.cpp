// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#include "util/stop_signal.hpp"

namespace synclink {
namespace util {

void StopSignal::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
  }
  cv_.notify_all();
}

bool StopSignal::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

void StopSignal::Wait() const {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]() { return closed_; });
}

bool StopSignal::WaitFor(std::chrono::steady_clock::duration timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return closed_; });
}

} // namespace util
} // namespace synclink
