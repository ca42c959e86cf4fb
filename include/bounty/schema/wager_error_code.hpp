#pragma once

#include <bounty/schema/enum_string.hpp>
#include <bounty/schema/error_category.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Result codes. 0 is success; ranges select the error category:
// 1-19 validation, 20-39 state conflict, 40-59 escrow, 60+ not found.
namespace bounty::schema {

enum class wager_error_code : uint32_t {
  ok = 0,
  invalid_stake = 1,
  self_challenge = 2,
  target_mismatch = 3,
  malformed_proof = 4,
  not_participant = 5,
  invalid_claimed_winner = 6,
  dispute_reason_too_short = 7,
  not_creator = 8,
  dispute_not_eligible = 9,
  rate_limited = 10,
  active_limit_reached = 11,
  invalid_request = 12,
  moderator_is_participant = 13,
  invalid_transition = 20,
  already_accepted = 21,
  wager_expired = 22,
  wager_not_expired = 23,
  duplicate_proof = 24,
  dispute_window_closed = 25,
  dispute_window_open = 26,
  dispute_exists = 27,
  dispute_already_resolved = 28,
  concurrent_modification = 29,
  escrow_hold_failed = 40,
  ledger_unavailable = 41,
  wager_missing = 60,
  dispute_missing = 61,
};

inline constexpr auto kWagerErrorCodeMappings = std::array{
    std::pair<std::string_view, wager_error_code>{"ok", wager_error_code::ok},
    std::pair<std::string_view, wager_error_code>{
        "invalid_stake", wager_error_code::invalid_stake},
    std::pair<std::string_view, wager_error_code>{
        "self_challenge", wager_error_code::self_challenge},
    std::pair<std::string_view, wager_error_code>{
        "target_mismatch", wager_error_code::target_mismatch},
    std::pair<std::string_view, wager_error_code>{
        "malformed_proof", wager_error_code::malformed_proof},
    std::pair<std::string_view, wager_error_code>{
        "not_participant", wager_error_code::not_participant},
    std::pair<std::string_view, wager_error_code>{
        "invalid_claimed_winner", wager_error_code::invalid_claimed_winner},
    std::pair<std::string_view, wager_error_code>{
        "dispute_reason_too_short", wager_error_code::dispute_reason_too_short},
    std::pair<std::string_view, wager_error_code>{
        "not_creator", wager_error_code::not_creator},
    std::pair<std::string_view, wager_error_code>{
        "dispute_not_eligible", wager_error_code::dispute_not_eligible},
    std::pair<std::string_view, wager_error_code>{
        "rate_limited", wager_error_code::rate_limited},
    std::pair<std::string_view, wager_error_code>{
        "active_limit_reached", wager_error_code::active_limit_reached},
    std::pair<std::string_view, wager_error_code>{
        "invalid_request", wager_error_code::invalid_request},
    std::pair<std::string_view, wager_error_code>{
        "moderator_is_participant", wager_error_code::moderator_is_participant},
    std::pair<std::string_view, wager_error_code>{
        "invalid_transition", wager_error_code::invalid_transition},
    std::pair<std::string_view, wager_error_code>{
        "already_accepted", wager_error_code::already_accepted},
    std::pair<std::string_view, wager_error_code>{
        "wager_expired", wager_error_code::wager_expired},
    std::pair<std::string_view, wager_error_code>{
        "wager_not_expired", wager_error_code::wager_not_expired},
    std::pair<std::string_view, wager_error_code>{
        "duplicate_proof", wager_error_code::duplicate_proof},
    std::pair<std::string_view, wager_error_code>{
        "dispute_window_closed", wager_error_code::dispute_window_closed},
    std::pair<std::string_view, wager_error_code>{
        "dispute_window_open", wager_error_code::dispute_window_open},
    std::pair<std::string_view, wager_error_code>{
        "dispute_exists", wager_error_code::dispute_exists},
    std::pair<std::string_view, wager_error_code>{
        "dispute_already_resolved", wager_error_code::dispute_already_resolved},
    std::pair<std::string_view, wager_error_code>{
        "concurrent_modification", wager_error_code::concurrent_modification},
    std::pair<std::string_view, wager_error_code>{
        "escrow_hold_failed", wager_error_code::escrow_hold_failed},
    std::pair<std::string_view, wager_error_code>{
        "ledger_unavailable", wager_error_code::ledger_unavailable},
    std::pair<std::string_view, wager_error_code>{
        "wager_missing", wager_error_code::wager_missing},
    std::pair<std::string_view, wager_error_code>{
        "dispute_missing", wager_error_code::dispute_missing}};

inline constexpr std::string_view to_string(const wager_error_code value) {
  return to_string(value, kWagerErrorCodeMappings).value_or("unknown");
}

inline constexpr error_category_t category_of(const wager_error_code value) {
  const auto code = static_cast<uint32_t>(value);
  if (code == 0) {
    return error_category_t::none;
  }
  if (code < 20) {
    return error_category_t::validation;
  }
  if (code < 40) {
    return error_category_t::state_conflict;
  }
  if (code < 60) {
    return error_category_t::escrow;
  }
  return error_category_t::not_found;
}

}  // namespace bounty::schema
