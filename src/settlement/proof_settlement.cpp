#include <bounty/settlement/proof_settlement.hpp>

namespace bounty::settlement {

proof_decision_t evaluate(
    const std::vector<bounty::schema::proof_record_t>& proofs) {
  if (proofs.empty()) {
    return no_proof_t{};
  }
  const auto& first = proofs.front();
  if (proofs.size() == 1) {
    return awaiting_second_proof_t{.claimed_winner = first.claimed_winner};
  }
  const auto& second = proofs[1];
  if (second.claimed_winner == first.claimed_winner) {
    return agreed_t{.winner = first.claimed_winner};
  }
  return conflicting_t{.first_claimed_winner = first.claimed_winner};
}

std::optional<bounty::schema::account_id_t> default_winner(
    const std::vector<bounty::schema::proof_record_t>& proofs) {
  if (proofs.empty()) {
    return std::nullopt;
  }
  return proofs.front().claimed_winner;
}

payout_split_t split_stake(const bounty::schema::amount_t stake,
                           const uint32_t fee_basis_points) {
  // 128-bit intermediate; stake * 10000 can exceed 64 bits.
  auto scaled = static_cast<unsigned __int128>(stake) *
                (10000u - fee_basis_points);
  auto payout = static_cast<bounty::schema::amount_t>(scaled / 10000u);
  return payout_split_t{.payout_amount = payout,
                        .platform_fee = stake - payout};
}

}  // namespace bounty::settlement
