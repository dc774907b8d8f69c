// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_UTIL_TIME_HPP
#define TIMECHUNK_UTIL_TIME_HPP

#include <cstdint>
#include <string>

namespace timechunk {
namespace util {

/**
 * Mockable clock
 *
 * Production code calls GetTime() instead of reading the system clock
 * directly, so that tests can pin "now" with SetMockTime() or MockTimeScope.
 * When mock time is 0 (default), GetTime() returns real system time.
 */

/**
 * Get current time as Unix timestamp (seconds since epoch)
 * Returns mock time if set, otherwise returns real system time
 */
int64_t GetTime();

/**
 * Set mock time for testing
 *
 * @param time Unix timestamp in seconds (0 to disable mocking)
 *
 * Time does not advance automatically while mocked.
 */
void SetMockTime(int64_t time);

/**
 * Get current mock time setting
 * Returns 0 if mock time is disabled (using real time)
 */
int64_t GetMockTime();

// Format a Unix timestamp as "YYYY-MM-DD HH:MM:SS UTC"
std::string FormatTime(int64_t unix_time);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;

private:
  int64_t previous_time_;
};

} // namespace util
} // namespace timechunk

#endif // TIMECHUNK_UTIL_TIME_HPP
