#pragma once

#include <bounty/common/clock.hpp>
#include <bounty/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace bounty::testing {

inline constexpr auto kStartTime =
    bounty::schema::timestamp_milliseconds_t{1'700'000'000'000};

inline bounty::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = bounty::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Clock that only moves when told to. Copies of `as_clock()` share state.
class manual_clock final {
 public:
  explicit manual_clock(
      const bounty::schema::timestamp_milliseconds_t start = kStartTime)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  bounty::common::clock_t as_clock() const {
    return [now = now_] { return now->load(); };
  }

  bounty::schema::timestamp_milliseconds_t now() const { return now_->load(); }
  void set(const bounty::schema::timestamp_milliseconds_t value) {
    now_->store(value);
  }
  void advance(const bounty::schema::duration_milliseconds_t delta) {
    now_->fetch_add(delta);
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

}  // namespace bounty::testing
