#pragma once

#include <bounty/schema/primitives.hpp>
#include <bounty/schema/proof_record.hpp>
#include <bounty/schema/settlement_outcome.hpp>
#include <optional>
#include <variant>
#include <vector>

// Pure decision logic over the proof set of a wager. No I/O.
namespace bounty::settlement {

struct no_proof_t final {};

struct awaiting_second_proof_t final {
  bounty::schema::account_id_t claimed_winner{};
};

struct agreed_t final {
  bounty::schema::account_id_t winner{};
};

struct conflicting_t final {
  bounty::schema::account_id_t first_claimed_winner{};
};

using proof_decision_t = std::variant<no_proof_t,
                                      awaiting_second_proof_t,
                                      agreed_t,
                                      conflicting_t>;

/// Classify the proofs (submission order) of a wager.
proof_decision_t evaluate(
    const std::vector<bounty::schema::proof_record_t>& proofs);

/// Winner by inaction: the first submission's claimed winner.
std::optional<bounty::schema::account_id_t> default_winner(
    const std::vector<bounty::schema::proof_record_t>& proofs);

/// Split of a stake for a paid-out settlement.
struct payout_split_t final {
  bounty::schema::amount_t payout_amount{};
  bounty::schema::amount_t platform_fee{};
};

/// payout = floor(stake * (10000 - fee_basis_points) / 10000),
/// fee = stake - payout.
payout_split_t split_stake(bounty::schema::amount_t stake,
                           uint32_t fee_basis_points);

}  // namespace bounty::settlement
