#pragma once
#include <bounty/schema/primitives.hpp>

// Schema type: acceptance record.
// Written once when a wager leaves OPEN; never mutated afterwards.
namespace bounty::schema {

template <uint16_t Version>
struct acceptance_record;

template <>
struct acceptance_record<1> final {
  uint16_t version{1};
  wager_id_t wager_id{};
  account_id_t acceptor{};
  timestamp_milliseconds_t accepted_at{};
};

using acceptance_record_t = acceptance_record<1>;

}  // namespace bounty::schema
