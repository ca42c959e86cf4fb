#pragma once

#include <bounty/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Moderator decision on a disputed wager.
namespace bounty::schema {

enum class dispute_outcome_t : uint8_t {
  confirm_original = 0,
  reverse = 1,
  void_wager = 2
};

inline constexpr auto kDisputeOutcomeMappings =
    std::array{std::pair<std::string_view, dispute_outcome_t>{
                   "confirm_original", dispute_outcome_t::confirm_original},
               std::pair<std::string_view, dispute_outcome_t>{
                   "reverse", dispute_outcome_t::reverse},
               std::pair<std::string_view, dispute_outcome_t>{
                   "void", dispute_outcome_t::void_wager}};

template <>
inline std::optional<dispute_outcome_t> try_from_string<dispute_outcome_t>(
    const std::string_view value) {
  return from_string(value, kDisputeOutcomeMappings);
}

inline constexpr std::string_view to_string(const dispute_outcome_t value) {
  return to_string(value, kDisputeOutcomeMappings).value_or("unknown");
}

}  // namespace bounty::schema
