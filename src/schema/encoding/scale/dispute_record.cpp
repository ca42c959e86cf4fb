#include <bounty/schema/encoding/scale/dispute_outcome.hpp>
#include <bounty/schema/encoding/scale/dispute_record.hpp>
#include <bounty/schema/encoding/scale/dispute_status.hpp>

namespace bounty::schema {

void encode(const dispute_resolution_t& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.outcome, encoder);
  ::scale::encode(o.resolved_by, encoder);
  ::scale::encode(o.note, encoder);
  ::scale::encode(o.resolved_at, encoder);
}

void decode(dispute_resolution_t& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.outcome, decoder);
  ::scale::decode(o.resolved_by, decoder);
  ::scale::decode(o.note, decoder);
  ::scale::decode(o.resolved_at, decoder);
}

void encode(const dispute_record<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.dispute_id, encoder);
  ::scale::encode(o.wager_id, encoder);
  ::scale::encode(o.disputer, encoder);
  ::scale::encode(o.contested_winner, encoder);
  ::scale::encode(o.reason, encoder);
  ::scale::encode(o.status, encoder);
  ::scale::encode(o.assigned_moderator, encoder);
  ::scale::encode(o.resolution, encoder);
  ::scale::encode(o.opened_at, encoder);
}

void decode(dispute_record<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.dispute_id, decoder);
  ::scale::decode(o.wager_id, decoder);
  ::scale::decode(o.disputer, decoder);
  ::scale::decode(o.contested_winner, decoder);
  ::scale::decode(o.reason, decoder);
  ::scale::decode(o.status, decoder);
  ::scale::decode(o.assigned_moderator, decoder);
  ::scale::decode(o.resolution, decoder);
  ::scale::decode(o.opened_at, decoder);
}

}  // namespace bounty::schema
