#pragma once
#include <bounty/common/critical.hpp>
#include <bounty/schema/encoding/encoder.hpp>
#include <bounty/schema/encoding/scale/acceptance_record.hpp>
#include <bounty/schema/encoding/scale/dispute_outcome.hpp>
#include <bounty/schema/encoding/scale/dispute_record.hpp>
#include <bounty/schema/encoding/scale/dispute_status.hpp>
#include <bounty/schema/encoding/scale/escrow_entry_state.hpp>
#include <bounty/schema/encoding/scale/escrow_journal_entry.hpp>
#include <bounty/schema/encoding/scale/escrow_operation.hpp>
#include <bounty/schema/encoding/scale/proof_record.hpp>
#include <bounty/schema/encoding/scale/proof_type.hpp>
#include <bounty/schema/encoding/scale/settlement_outcome.hpp>
#include <bounty/schema/encoding/scale/wager_state.hpp>
#include <bounty/schema/encoding/scale/wager_status.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace bounty::schema::encoding {

struct scale_encoder_tag {};

// Stored records have explicit field-by-field codecs under scale/; enums
// are constrained to their declared value lists.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  bounty::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, bounty::schema::bytes_t& out);

  template <typename T>
  T decode(const bounty::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const bounty::schema::bytes_view_t& bytes);
};

template <typename T>
bounty::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    bounty::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        bounty::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const bounty::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    bounty::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const bounty::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace bounty::schema::encoding
