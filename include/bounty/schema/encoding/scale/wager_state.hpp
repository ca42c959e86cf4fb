#pragma once
#include <bounty/schema/wager_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace bounty::schema {

void encode(const wager_parties_t& o, ::scale::Encoder& encoder);
void decode(wager_parties_t& o, ::scale::Decoder& decoder);
void encode(const wager_timeline_t& o, ::scale::Encoder& encoder);
void decode(wager_timeline_t& o, ::scale::Decoder& decoder);
void encode(const wager_settlement_t& o, ::scale::Encoder& encoder);
void decode(wager_settlement_t& o, ::scale::Decoder& decoder);
void encode(const wager_state<1>& o, ::scale::Encoder& encoder);
void decode(wager_state<1>& o, ::scale::Decoder& decoder);

}  // namespace bounty::schema
