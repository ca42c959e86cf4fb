#pragma once

#include <bounty/schema/error_category.hpp>
#include <bounty/schema/wager_error_code.hpp>
#include <bounty/schema/wager_event.hpp>
#include <bounty/schema/wager_snapshot.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bounty::schema {

template <uint16_t Version>
struct wager_result;

template <>
struct wager_result<1> final {
  uint16_t version{1};
  wager_error_code code{wager_error_code::ok};
  error_category_t category{error_category_t::none};
  std::string log;
  // Present on success and on state conflicts (for caller resync).
  std::optional<wager_snapshot_t> snapshot;
  std::vector<wager_event_t> events;

  bool ok() const { return code == wager_error_code::ok; }
  std::string_view reason() const { return to_string(code); }
};

using wager_result_t = wager_result<1>;

}  // namespace bounty::schema
