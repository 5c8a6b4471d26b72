// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace synclink {
namespace util {

/**
 * Mockable steady clock for testing
 *
 * Production code that keeps expiry deadlines (e.g. the discovery
 * transaction tracker) calls GetSteadyTime() instead of
 * std::chrono::steady_clock::now() so tests can move time forward
 * without sleeping.
 */

/**
 * Get current time as steady clock time point
 * Returns simulated time if mock time is set, otherwise real steady clock time
 */
std::chrono::steady_clock::time_point GetSteadyTime();

/**
 * Set mock time for testing
 *
 * @param time Mock time in seconds (0 to disable mocking)
 *
 * While mock time is set, GetSteadyTime() advances only when tests call
 * SetMockTime() again with a larger value.
 */
void SetMockTime(int64_t time);

/**
 * Get current mock time setting
 * Returns 0 if mock time is disabled
 */
int64_t GetMockTime();

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
  MockTimeScope(MockTimeScope&&) = delete;
  MockTimeScope& operator=(MockTimeScope&&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace synclink
