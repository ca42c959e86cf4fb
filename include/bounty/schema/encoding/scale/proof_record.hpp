#pragma once
#include <bounty/schema/proof_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace bounty::schema {

void encode(const proof_evidence_t& o, ::scale::Encoder& encoder);
void decode(proof_evidence_t& o, ::scale::Decoder& decoder);
void encode(const proof_record<1>& o, ::scale::Encoder& encoder);
void decode(proof_record<1>& o, ::scale::Decoder& decoder);

}  // namespace bounty::schema
