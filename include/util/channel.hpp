// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include "util/stop_signal.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>

namespace synclink {
namespace util {

/**
 * BoundedChannel - capacity-bounded multi-producer/multi-consumer handoff
 *
 * Producers block in Send() while the channel is full, which is the
 * backpressure point between a producer loop and a slow consumer. A
 * producer never closes the channel; instead each Send() is raced against
 * the producer's own StopSignal so a stopping producer can give up.
 *
 * Usage:
 *   BoundedChannel<Conn> intake(64);
 *   // producer
 *   if (!intake.Send(std::move(conn), stop)) { conn.Close(); }
 *   // consumer
 *   Conn c;
 *   if (intake.Receive(c, std::chrono::seconds(1))) { ... }
 */
template <typename T>
class BoundedChannel {
public:
  explicit BoundedChannel(size_t capacity) : capacity_(capacity) {
    if (capacity == 0) {
      throw std::invalid_argument("BoundedChannel capacity must be greater than 0");
    }
  }

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;
  BoundedChannel(BoundedChannel&&) = delete;
  BoundedChannel& operator=(BoundedChannel&&) = delete;

  /**
   * Send an item, blocking while the channel is full
   *
   * Returns false without enqueuing if `stop` is closed before space frees
   * up. The item is left untouched in that case so the caller can dispose
   * of it.
   */
  bool Send(T& item, const StopSignal& stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (queue_.size() >= capacity_) {
      if (stop.IsClosed()) {
        return false;
      }
      // StopSignal has its own condition variable, so poll it at a short
      // interval while waiting for a consumer.
      not_full_.wait_for(lock, kStopPollInterval);
    }
    if (stop.IsClosed()) {
      return false;
    }
    queue_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  // Blocks until an item is available or the timeout elapses
  bool Receive(T& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_empty_.wait_for(lock, timeout, [this]() { return !queue_.empty(); })) {
      return false;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return true;
  }

  bool TryReceive(T& out) {
    return Receive(out, std::chrono::milliseconds(0));
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  size_t Capacity() const { return capacity_; }

private:
  static constexpr std::chrono::milliseconds kStopPollInterval{50};

  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> queue_;
};

} // namespace util
} // namespace synclink
