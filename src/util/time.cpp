// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <mutex>

namespace synclink {
namespace util {

// 0 means mock time is disabled (use real time)
static std::atomic<int64_t> g_mock_time{0};

// Steady clock reference captured the first time mock time is read, so the
// simulated clock keeps moving forward from a real time point.
// Protected by g_steady_mutex
static std::mutex g_steady_mutex;
static std::chrono::steady_clock::time_point g_real_steady_reference;
static int64_t g_mock_steady_reference{0};
static bool g_steady_initialized{false};

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);

    if (!g_steady_initialized) {
      g_real_steady_reference = std::chrono::steady_clock::now();
      g_mock_steady_reference = mock;
      g_steady_initialized = true;
    }

    int64_t seconds_offset = mock - g_mock_steady_reference;
    return g_real_steady_reference + std::chrono::seconds(seconds_offset);
  }

  return std::chrono::steady_clock::now();
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);

  // Disabling mock time drops the reference so the next mocked run starts
  // from a fresh real time point. Changing between mock values keeps it,
  // which is what lets a test advance the simulated clock.
  if (time == 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    g_steady_initialized = false;
  }
}

int64_t GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

} // namespace util
} // namespace synclink
