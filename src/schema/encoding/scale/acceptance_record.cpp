#include <bounty/schema/encoding/scale/acceptance_record.hpp>

namespace bounty::schema {

void encode(const acceptance_record<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.wager_id, encoder);
  ::scale::encode(o.acceptor, encoder);
  ::scale::encode(o.accepted_at, encoder);
}

void decode(acceptance_record<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.wager_id, decoder);
  ::scale::decode(o.acceptor, decoder);
  ::scale::decode(o.accepted_at, decoder);
}

}  // namespace bounty::schema
