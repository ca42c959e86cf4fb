#pragma once
#include <bounty/schema/escrow_journal_entry.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace bounty::schema {

void encode(const escrow_journal_entry<1>& o, ::scale::Encoder& encoder);
void decode(escrow_journal_entry<1>& o, ::scale::Decoder& decoder);

}  // namespace bounty::schema
