#pragma once

#include <bounty/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// How a wager reached its terminal ledger state.
namespace bounty::schema {

enum class settlement_outcome_t : uint8_t {
  agreed = 0,
  confirmed_by_opponent = 1,
  default_by_inaction = 2,
  dispute_confirmed = 3,
  dispute_reversed = 4,
  dispute_voided = 5,
  cancelled = 6,
  expired = 7
};

inline constexpr auto kSettlementOutcomeMappings =
    std::array{std::pair<std::string_view, settlement_outcome_t>{
                   "agreed", settlement_outcome_t::agreed},
               std::pair<std::string_view, settlement_outcome_t>{
                   "confirmed_by_opponent",
                   settlement_outcome_t::confirmed_by_opponent},
               std::pair<std::string_view, settlement_outcome_t>{
                   "default_by_inaction",
                   settlement_outcome_t::default_by_inaction},
               std::pair<std::string_view, settlement_outcome_t>{
                   "dispute_confirmed",
                   settlement_outcome_t::dispute_confirmed},
               std::pair<std::string_view, settlement_outcome_t>{
                   "dispute_reversed", settlement_outcome_t::dispute_reversed},
               std::pair<std::string_view, settlement_outcome_t>{
                   "dispute_voided", settlement_outcome_t::dispute_voided},
               std::pair<std::string_view, settlement_outcome_t>{
                   "cancelled", settlement_outcome_t::cancelled},
               std::pair<std::string_view, settlement_outcome_t>{
                   "expired", settlement_outcome_t::expired}};

template <>
inline std::optional<settlement_outcome_t>
try_from_string<settlement_outcome_t>(const std::string_view value) {
  return from_string(value, kSettlementOutcomeMappings);
}

inline constexpr std::string_view to_string(const settlement_outcome_t value) {
  return to_string(value, kSettlementOutcomeMappings).value_or("unknown");
}

/// Outcomes that pay a winner (as opposed to refunding the creator).
inline constexpr bool has_winner(const settlement_outcome_t value) {
  using enum settlement_outcome_t;
  return value == agreed || value == confirmed_by_opponent ||
         value == default_by_inaction || value == dispute_confirmed ||
         value == dispute_reversed;
}

}  // namespace bounty::schema
