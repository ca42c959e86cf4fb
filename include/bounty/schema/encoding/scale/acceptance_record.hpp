#pragma once
#include <bounty/schema/acceptance_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace bounty::schema {

void encode(const acceptance_record<1>& o, ::scale::Encoder& encoder);
void decode(acceptance_record<1>& o, ::scale::Decoder& decoder);

}  // namespace bounty::schema
