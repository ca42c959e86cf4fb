#pragma once
#include <bounty/schema/primitives.hpp>
#include <bounty/schema/settlement_outcome.hpp>
#include <bounty/schema/wager_status.hpp>
#include <optional>
#include <string>

// Schema type: wager state.
// Root record of the engine. Nullable identity/settlement fields must agree
// with `status`: acceptor is set from ACCEPTED on, winner only once a
// settlement with a winner is recorded. A recorded settlement on a
// non-terminal wager is waiting for its ledger calls.
namespace bounty::schema {

struct wager_parties_t final {
  account_id_t creator{};
  std::optional<account_id_t> acceptor;
  // Restricts who may accept when set.
  std::optional<account_id_t> target_user;
  std::optional<account_id_t> winner;
};

struct wager_timeline_t final {
  timestamp_milliseconds_t created_at{};
  std::optional<timestamp_milliseconds_t> accepted_at;
  std::optional<timestamp_milliseconds_t> started_at;
  std::optional<timestamp_milliseconds_t> result_submitted_at;
  std::optional<timestamp_milliseconds_t> completed_at;
  // Only meaningful while the wager is open.
  timestamp_milliseconds_t expires_at{};
};

/// Terminal ledger effect. payout + fee + refunded == stake.
struct wager_settlement_t final {
  settlement_outcome_t outcome{};
  amount_t payout_amount{};
  amount_t platform_fee{};
  amount_t refunded_amount{};
};

template <uint16_t Version>
struct wager_state;

template <>
struct wager_state<1> final {
  uint16_t version{1};
  wager_id_t wager_id{};
  wager_parties_t parties;
  std::string game;
  std::string title;
  std::string description;
  amount_t stake_amount{};
  wager_status_t status{wager_status_t::open};
  wager_timeline_t timeline;
  std::optional<wager_settlement_t> settlement;
};

using wager_state_t = wager_state<1>;

/// A settlement was recorded but its ledger calls have not all been applied
/// yet; the status still names the pre-settlement state.
inline bool has_pending_settlement(const wager_state_t& wager) {
  return wager.settlement.has_value() && !is_terminal(wager.status);
}

inline bool is_participant(const wager_state_t& wager,
                           const account_id_t& user) {
  return wager.parties.creator == user ||
         (wager.parties.acceptor.has_value() &&
          *wager.parties.acceptor == user);
}

/// The participant on the other side of `user`, when both are known.
inline std::optional<account_id_t> opponent_of(const wager_state_t& wager,
                                               const account_id_t& user) {
  if (!wager.parties.acceptor.has_value()) {
    return std::nullopt;
  }
  if (user == wager.parties.creator) {
    return wager.parties.acceptor;
  }
  if (user == *wager.parties.acceptor) {
    return wager.parties.creator;
  }
  return std::nullopt;
}

}  // namespace bounty::schema
