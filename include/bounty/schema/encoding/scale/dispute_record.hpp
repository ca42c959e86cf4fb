#pragma once
#include <bounty/schema/dispute_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace bounty::schema {

void encode(const dispute_resolution_t& o, ::scale::Encoder& encoder);
void decode(dispute_resolution_t& o, ::scale::Decoder& decoder);
void encode(const dispute_record<1>& o, ::scale::Encoder& encoder);
void decode(dispute_record<1>& o, ::scale::Decoder& decoder);

}  // namespace bounty::schema
