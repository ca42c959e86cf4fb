#include <bounty/schema/encoding/scale/settlement_outcome.hpp>
#include <bounty/schema/encoding/scale/wager_state.hpp>
#include <bounty/schema/encoding/scale/wager_status.hpp>

namespace bounty::schema {

void encode(const wager_parties_t& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.creator, encoder);
  ::scale::encode(o.acceptor, encoder);
  ::scale::encode(o.target_user, encoder);
  ::scale::encode(o.winner, encoder);
}

void decode(wager_parties_t& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.creator, decoder);
  ::scale::decode(o.acceptor, decoder);
  ::scale::decode(o.target_user, decoder);
  ::scale::decode(o.winner, decoder);
}

void encode(const wager_timeline_t& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.created_at, encoder);
  ::scale::encode(o.accepted_at, encoder);
  ::scale::encode(o.started_at, encoder);
  ::scale::encode(o.result_submitted_at, encoder);
  ::scale::encode(o.completed_at, encoder);
  ::scale::encode(o.expires_at, encoder);
}

void decode(wager_timeline_t& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.created_at, decoder);
  ::scale::decode(o.accepted_at, decoder);
  ::scale::decode(o.started_at, decoder);
  ::scale::decode(o.result_submitted_at, decoder);
  ::scale::decode(o.completed_at, decoder);
  ::scale::decode(o.expires_at, decoder);
}

void encode(const wager_settlement_t& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.outcome, encoder);
  ::scale::encode(o.payout_amount, encoder);
  ::scale::encode(o.platform_fee, encoder);
  ::scale::encode(o.refunded_amount, encoder);
}

void decode(wager_settlement_t& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.outcome, decoder);
  ::scale::decode(o.payout_amount, decoder);
  ::scale::decode(o.platform_fee, decoder);
  ::scale::decode(o.refunded_amount, decoder);
}

void encode(const wager_state<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.wager_id, encoder);
  encode(o.parties, encoder);
  ::scale::encode(o.game, encoder);
  ::scale::encode(o.title, encoder);
  ::scale::encode(o.description, encoder);
  ::scale::encode(o.stake_amount, encoder);
  ::scale::encode(o.status, encoder);
  encode(o.timeline, encoder);
  ::scale::encode(o.settlement, encoder);
}

void decode(wager_state<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.wager_id, decoder);
  decode(o.parties, decoder);
  ::scale::decode(o.game, decoder);
  ::scale::decode(o.title, decoder);
  ::scale::decode(o.description, decoder);
  ::scale::decode(o.stake_amount, decoder);
  ::scale::decode(o.status, decoder);
  decode(o.timeline, decoder);
  ::scale::decode(o.settlement, decoder);
}

}  // namespace bounty::schema
