#pragma once

#include <bounty/schema/primitives.hpp>
#include <algorithm>
#include <array>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <mutex>
#include <vector>

namespace bounty::execution {

/// Striped row locks keyed by 32-byte ids.
///
/// Locking several ids acquires their stripes in ascending order, each stripe
/// once, so any two callers agree on the acquisition order.
class wager_lock_table final {
 public:
  static constexpr size_t kStripeCount = 64;

  class guard final {
   public:
    guard() = default;
    guard(guard&&) noexcept = default;
    guard& operator=(guard&&) noexcept = default;
    guard(const guard&) = delete;
    guard& operator=(const guard&) = delete;

   private:
    friend class wager_lock_table;
    std::vector<std::unique_lock<std::mutex>> locks_;
  };

  guard lock(std::initializer_list<bounty::schema::hash32_t> ids) {
    auto stripes = std::vector<size_t>{};
    stripes.reserve(ids.size());
    for (const auto& id : ids) {
      stripes.push_back(stripe_of(id));
    }
    std::sort(std::begin(stripes), std::end(stripes));
    stripes.erase(std::unique(std::begin(stripes), std::end(stripes)),
                  std::end(stripes));

    auto result = guard{};
    result.locks_.reserve(stripes.size());
    for (auto stripe : stripes) {
      result.locks_.emplace_back(stripes_[stripe]);
    }
    return result;
  }

  static size_t stripe_of(const bounty::schema::hash32_t& id) {
    // Ids are BLAKE3 digests or opaque account hashes; leading bytes are
    // uniformly distributed.
    auto value = size_t{};
    for (size_t i = 0; i < sizeof(uint32_t); ++i) {
      value = (value << 8) | id[i];
    }
    return value % kStripeCount;
  }

 private:
  std::array<std::mutex, kStripeCount> stripes_;
};

}  // namespace bounty::execution
