#pragma once

#include <bounty/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Outbox state of an escrow journal entry.
namespace bounty::schema {

enum class escrow_entry_state_t : uint8_t { pending = 0, applied = 1 };

inline constexpr auto kEscrowEntryStateMappings = std::array{
    std::pair<std::string_view, escrow_entry_state_t>{
        "pending", escrow_entry_state_t::pending},
    std::pair<std::string_view, escrow_entry_state_t>{
        "applied", escrow_entry_state_t::applied}};

template <>
inline std::optional<escrow_entry_state_t>
try_from_string<escrow_entry_state_t>(const std::string_view value) {
  return from_string(value, kEscrowEntryStateMappings);
}

inline constexpr std::string_view to_string(const escrow_entry_state_t value) {
  return to_string(value, kEscrowEntryStateMappings).value_or("unknown");
}

}  // namespace bounty::schema
