// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace synclink {
namespace util {

/**
 * StopSignal - one-shot cancellation primitive shared by cooperating threads
 *
 * Once closed it stays closed. Every blocking wait in a loop that must
 * terminate on shutdown goes through WaitFor() (or is raced against it by
 * a watcher thread).
 */
class StopSignal {
public:
  StopSignal() = default;

  StopSignal(const StopSignal&) = delete;
  StopSignal& operator=(const StopSignal&) = delete;

  // Close the signal and wake all waiters. Safe to call more than once.
  void Close();

  bool IsClosed() const;

  // Block until closed
  void Wait() const;

  // Block until closed or the timeout elapses; returns true if closed
  bool WaitFor(std::chrono::steady_clock::duration timeout) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool closed_{false};
};

} // namespace util
} // namespace synclink
