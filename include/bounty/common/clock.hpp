#pragma once

#include <bounty/schema/primitives.hpp>

#include <chrono>
#include <functional>

namespace bounty::common {

/// Source of wall-clock time in Unix milliseconds.
using clock_t = std::function<bounty::schema::timestamp_milliseconds_t()>;

inline bounty::schema::timestamp_milliseconds_t system_now() {
  return static_cast<bounty::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

inline constexpr bounty::schema::duration_milliseconds_t hours(
    const uint64_t value) {
  return value * 60u * 60u * 1000u;
}

inline constexpr bounty::schema::duration_milliseconds_t seconds(
    const uint64_t value) {
  return value * 1000u;
}

}  // namespace bounty::common
