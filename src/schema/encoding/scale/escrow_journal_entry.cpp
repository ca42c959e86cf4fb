#include <bounty/schema/encoding/scale/escrow_entry_state.hpp>
#include <bounty/schema/encoding/scale/escrow_journal_entry.hpp>
#include <bounty/schema/encoding/scale/escrow_operation.hpp>

namespace bounty::schema {

void encode(const escrow_journal_entry<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.wager_id, encoder);
  ::scale::encode(o.operation, encoder);
  ::scale::encode(o.idempotency_key, encoder);
  ::scale::encode(o.from, encoder);
  ::scale::encode(o.to, encoder);
  ::scale::encode(o.amount, encoder);
  ::scale::encode(o.state, encoder);
  ::scale::encode(o.recorded_at, encoder);
  ::scale::encode(o.applied_at, encoder);
}

void decode(escrow_journal_entry<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.wager_id, decoder);
  ::scale::decode(o.operation, decoder);
  ::scale::decode(o.idempotency_key, decoder);
  ::scale::decode(o.from, decoder);
  ::scale::decode(o.to, decoder);
  ::scale::decode(o.amount, decoder);
  ::scale::decode(o.state, decoder);
  ::scale::decode(o.recorded_at, decoder);
  ::scale::decode(o.applied_at, decoder);
}

}  // namespace bounty::schema
