#pragma once
#include <bounty/schema/primitives.hpp>
#include <bounty/schema/settlement_outcome.hpp>
#include <bounty/schema/wager_event_type.hpp>
#include <functional>
#include <optional>

namespace bounty::schema {

template <uint16_t Version>
struct wager_event;

template <>
struct wager_event<1> final {
  uint16_t version{1};
  wager_event_type_t type{};
  wager_id_t wager_id{};
  std::optional<account_id_t> actor;
  std::optional<settlement_outcome_t> outcome;
  timestamp_milliseconds_t at{};
};

using wager_event_t = wager_event<1>;

/// Notification boundary. Invoked after the emitting operation committed.
using event_sink_t = std::function<void(const wager_event_t&)>;

}  // namespace bounty::schema
