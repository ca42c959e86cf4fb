#pragma once

#include <bounty/common/clock.hpp>
#include <bounty/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace bounty::config {

/// Tunables of the wager state machine.
struct engine_config final {
  bounty::schema::amount_t min_stake{100};
  bounty::schema::amount_t max_stake{50000};
  bounty::schema::duration_milliseconds_t acceptance_window{
      bounty::common::hours(72)};
  bounty::schema::duration_milliseconds_t dispute_window{
      bounty::common::hours(24)};
  // 500 bp = 5 %.
  uint32_t fee_basis_points{500};
  uint32_t max_created_per_window{10};
  bounty::schema::duration_milliseconds_t rate_window{
      bounty::common::hours(24)};
  uint32_t max_active_accepted{3};
  uint32_t min_dispute_reason{50};
};

/// Returns a description of the first problem, or std::nullopt when valid.
std::optional<std::string> validate(const engine_config& config);

}  // namespace bounty::config
