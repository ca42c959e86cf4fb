#pragma once

#include <bounty/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bounty::schema {

enum class dispute_status_t : uint8_t {
  open = 0,
  under_review = 1,
  resolved_confirm = 2,
  resolved_reverse = 3,
  resolved_void = 4
};

inline constexpr auto kDisputeStatusMappings =
    std::array{std::pair<std::string_view, dispute_status_t>{
                   "open", dispute_status_t::open},
               std::pair<std::string_view, dispute_status_t>{
                   "under_review", dispute_status_t::under_review},
               std::pair<std::string_view, dispute_status_t>{
                   "resolved_confirm", dispute_status_t::resolved_confirm},
               std::pair<std::string_view, dispute_status_t>{
                   "resolved_reverse", dispute_status_t::resolved_reverse},
               std::pair<std::string_view, dispute_status_t>{
                   "resolved_void", dispute_status_t::resolved_void}};

template <>
inline std::optional<dispute_status_t> try_from_string<dispute_status_t>(
    const std::string_view value) {
  return from_string(value, kDisputeStatusMappings);
}

inline constexpr std::string_view to_string(const dispute_status_t value) {
  return to_string(value, kDisputeStatusMappings).value_or("unknown");
}

inline constexpr bool is_resolved(const dispute_status_t value) {
  return value == dispute_status_t::resolved_confirm ||
         value == dispute_status_t::resolved_reverse ||
         value == dispute_status_t::resolved_void;
}

}  // namespace bounty::schema
