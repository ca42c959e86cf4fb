#pragma once
#include <bounty/schema/acceptance_record.hpp>
#include <bounty/schema/dispute_record.hpp>
#include <bounty/schema/proof_record.hpp>
#include <bounty/schema/wager_state.hpp>
#include <optional>
#include <vector>

// Schema type: wager snapshot.
// Read model returned by every API call. The derived fields are computed
// from the persisted timestamps at read time and never stored.
namespace bounty::schema {

template <uint16_t Version>
struct wager_snapshot;

template <>
struct wager_snapshot<1> final {
  uint16_t version{1};
  wager_state_t wager;
  std::optional<acceptance_record_t> acceptance;
  std::vector<proof_record_t> proofs;
  std::optional<dispute_record_t> dispute;
  bool is_expired{};
  bool can_dispute{};
  std::optional<timestamp_milliseconds_t> dispute_deadline;
};

using wager_snapshot_t = wager_snapshot<1>;

}  // namespace bounty::schema
