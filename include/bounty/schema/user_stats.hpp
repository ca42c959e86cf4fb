#pragma once
#include <bounty/schema/primitives.hpp>
#include <cstdint>

namespace bounty::schema {

template <uint16_t Version>
struct user_stats;

template <>
struct user_stats<1> final {
  uint16_t version{1};
  uint64_t created_count{};
  uint64_t accepted_count{};
  uint64_t won_count{};
  uint64_t lost_count{};
  // Percent of completed wagers with a winner that this user won, one decimal.
  double win_rate{};
  amount_t total_earnings{};
  amount_t total_wagered{};
};

using user_stats_t = user_stats<1>;

}  // namespace bounty::schema
