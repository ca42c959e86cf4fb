#pragma once

#include <bounty/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Domain events emitted to the notification boundary.
namespace bounty::schema {

enum class wager_event_type_t : uint8_t {
  wager_created = 0,
  wager_accepted = 1,
  wager_started = 2,
  proof_submitted = 3,
  dispute_opened = 4,
  moderator_assigned = 5,
  wager_settled = 6,
  wager_cancelled = 7,
  wager_expired = 8
};

inline constexpr auto kWagerEventTypeMappings =
    std::array{std::pair<std::string_view, wager_event_type_t>{
                   "WagerCreated", wager_event_type_t::wager_created},
               std::pair<std::string_view, wager_event_type_t>{
                   "WagerAccepted", wager_event_type_t::wager_accepted},
               std::pair<std::string_view, wager_event_type_t>{
                   "WagerStarted", wager_event_type_t::wager_started},
               std::pair<std::string_view, wager_event_type_t>{
                   "ProofSubmitted", wager_event_type_t::proof_submitted},
               std::pair<std::string_view, wager_event_type_t>{
                   "DisputeOpened", wager_event_type_t::dispute_opened},
               std::pair<std::string_view, wager_event_type_t>{
                   "ModeratorAssigned", wager_event_type_t::moderator_assigned},
               std::pair<std::string_view, wager_event_type_t>{
                   "WagerSettled", wager_event_type_t::wager_settled},
               std::pair<std::string_view, wager_event_type_t>{
                   "WagerCancelled", wager_event_type_t::wager_cancelled},
               std::pair<std::string_view, wager_event_type_t>{
                   "WagerExpired", wager_event_type_t::wager_expired}};

template <>
inline std::optional<wager_event_type_t> try_from_string<wager_event_type_t>(
    const std::string_view value) {
  return from_string(value, kWagerEventTypeMappings);
}

inline constexpr std::string_view to_string(const wager_event_type_t value) {
  return to_string(value, kWagerEventTypeMappings).value_or("unknown");
}

}  // namespace bounty::schema
