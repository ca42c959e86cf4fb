#pragma once

#include <bounty/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Wager lifecycle. COMPLETED, EXPIRED and CANCELLED are absorbing.
namespace bounty::schema {

enum class wager_status_t : uint8_t {
  open = 0,
  accepted = 1,
  in_progress = 2,
  pending_result = 3,
  disputed = 4,
  completed = 5,
  expired = 6,
  cancelled = 7
};

inline constexpr auto kWagerStatusMappings = std::array{
    std::pair<std::string_view, wager_status_t>{"open", wager_status_t::open},
    std::pair<std::string_view, wager_status_t>{"accepted",
                                                wager_status_t::accepted},
    std::pair<std::string_view, wager_status_t>{"in_progress",
                                                wager_status_t::in_progress},
    std::pair<std::string_view, wager_status_t>{
        "pending_result", wager_status_t::pending_result},
    std::pair<std::string_view, wager_status_t>{"disputed",
                                                wager_status_t::disputed},
    std::pair<std::string_view, wager_status_t>{"completed",
                                                wager_status_t::completed},
    std::pair<std::string_view, wager_status_t>{"expired",
                                                wager_status_t::expired},
    std::pair<std::string_view, wager_status_t>{"cancelled",
                                                wager_status_t::cancelled}};

inline constexpr auto kActiveWagerStatuses =
    std::array{wager_status_t::open, wager_status_t::accepted,
               wager_status_t::in_progress, wager_status_t::pending_result,
               wager_status_t::disputed};

inline constexpr auto kClosedWagerStatuses =
    std::array{wager_status_t::completed, wager_status_t::expired,
               wager_status_t::cancelled};

template <>
inline std::optional<wager_status_t> try_from_string<wager_status_t>(
    const std::string_view value) {
  return from_string(value, kWagerStatusMappings);
}

inline constexpr std::string_view to_string(const wager_status_t value) {
  return to_string(value, kWagerStatusMappings).value_or("unknown");
}

inline constexpr bool is_terminal(const wager_status_t value) {
  return value == wager_status_t::completed ||
         value == wager_status_t::expired ||
         value == wager_status_t::cancelled;
}

/// True when `from -> to` is an edge of the wager lifecycle graph.
inline constexpr bool is_legal_transition(const wager_status_t from,
                                          const wager_status_t to) {
  using enum wager_status_t;
  switch (from) {
    case open:
      return to == accepted || to == cancelled || to == expired;
    case accepted:
      return to == in_progress;
    case in_progress:
      return to == pending_result;
    case pending_result:
      return to == disputed || to == completed;
    case disputed:
      return to == completed;
    case completed:
    case expired:
    case cancelled:
    default:
      return false;
  }
}

}  // namespace bounty::schema
