#include <bounty/schema/encoding/scale/proof_record.hpp>
#include <bounty/schema/encoding/scale/proof_type.hpp>

namespace bounty::schema {

void encode(const proof_evidence_t& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.url, encoder);
  ::scale::encode(o.type, encoder);
  ::scale::encode(o.description, encoder);
}

void decode(proof_evidence_t& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.url, decoder);
  ::scale::decode(o.type, decoder);
  ::scale::decode(o.description, decoder);
}

void encode(const proof_record<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.wager_id, encoder);
  ::scale::encode(o.sequence, encoder);
  ::scale::encode(o.submitter, encoder);
  ::scale::encode(o.claimed_winner, encoder);
  encode(o.evidence, encoder);
  ::scale::encode(o.submitted_at, encoder);
}

void decode(proof_record<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.wager_id, decoder);
  ::scale::decode(o.sequence, decoder);
  ::scale::decode(o.submitter, decoder);
  ::scale::decode(o.claimed_winner, decoder);
  decode(o.evidence, decoder);
  ::scale::decode(o.submitted_at, decoder);
}

}  // namespace bounty::schema
