#pragma once
#include <bounty/schema/primitives.hpp>
#include <bounty/schema/proof_type.hpp>
#include <string>

// Schema type: proof record.
// Append-only result submission; at most one per participant.
namespace bounty::schema {

struct proof_evidence_t final {
  std::string url;
  proof_type_t type{proof_type_t::screenshot};
  std::string description;
};

template <uint16_t Version>
struct proof_record;

template <>
struct proof_record<1> final {
  uint16_t version{1};
  wager_id_t wager_id{};
  // Submission order within the wager, starting at 0.
  uint32_t sequence{};
  account_id_t submitter{};
  account_id_t claimed_winner{};
  proof_evidence_t evidence;
  timestamp_milliseconds_t submitted_at{};
};

using proof_record_t = proof_record<1>;

}  // namespace bounty::schema
