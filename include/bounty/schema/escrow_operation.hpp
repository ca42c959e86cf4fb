#pragma once

#include <bounty/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Ledger call kinds. At most one of each per wager.
namespace bounty::schema {

enum class escrow_operation_t : uint8_t {
  hold = 0,
  release = 1,
  collect = 2,
  refund = 3
};

inline constexpr auto kEscrowOperationMappings = std::array{
    std::pair<std::string_view, escrow_operation_t>{"hold",
                                                    escrow_operation_t::hold},
    std::pair<std::string_view, escrow_operation_t>{
        "release", escrow_operation_t::release},
    std::pair<std::string_view, escrow_operation_t>{
        "collect", escrow_operation_t::collect},
    std::pair<std::string_view, escrow_operation_t>{
        "refund", escrow_operation_t::refund}};

template <>
inline std::optional<escrow_operation_t> try_from_string<escrow_operation_t>(
    const std::string_view value) {
  return from_string(value, kEscrowOperationMappings);
}

inline constexpr std::string_view to_string(const escrow_operation_t value) {
  return to_string(value, kEscrowOperationMappings).value_or("unknown");
}

}  // namespace bounty::schema
