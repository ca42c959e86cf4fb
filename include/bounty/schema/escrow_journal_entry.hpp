#pragma once
#include <bounty/schema/escrow_entry_state.hpp>
#include <bounty/schema/escrow_operation.hpp>
#include <bounty/schema/primitives.hpp>
#include <optional>

// Schema type: escrow journal entry.
// Settlement calls are recorded `pending` together with the wager write that
// decided them and flipped to `applied` once the wallet accepted the call.
// Holds are recorded already applied.
namespace bounty::schema {

template <uint16_t Version>
struct escrow_journal_entry;

template <>
struct escrow_journal_entry<1> final {
  uint16_t version{1};
  wager_id_t wager_id{};
  escrow_operation_t operation{};
  idempotency_key_t idempotency_key{};
  std::optional<account_id_t> from;
  std::optional<account_id_t> to;
  amount_t amount{};
  escrow_entry_state_t state{escrow_entry_state_t::pending};
  timestamp_milliseconds_t recorded_at{};
  std::optional<timestamp_milliseconds_t> applied_at;
};

using escrow_journal_entry_t = escrow_journal_entry<1>;

}  // namespace bounty::schema
