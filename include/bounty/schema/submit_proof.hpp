#pragma once
#include <bounty/schema/primitives.hpp>
#include <bounty/schema/proof_record.hpp>

namespace bounty::schema {

template <uint16_t Version>
struct submit_proof;

template <>
struct submit_proof<1> final {
  uint16_t version{1};
  wager_id_t wager_id{};
  account_id_t submitter{};
  account_id_t claimed_winner{};
  proof_evidence_t evidence;
};

using submit_proof_t = submit_proof<1>;

}  // namespace bounty::schema
