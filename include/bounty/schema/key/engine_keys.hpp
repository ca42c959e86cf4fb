#pragma once

#include <bounty/schema/escrow_operation.hpp>
#include <bounty/schema/primitives.hpp>
#include <bounty/schema/wager_status.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for wager state, child records, the
// escrow journal and secondary indexes.
namespace bounty::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kWagerKeyPrefix{"SYS|STATE|WAGER|"};
inline constexpr std::string_view kAcceptanceKeyPrefix{
    "SYS|STATE|ACCEPTANCE|"};
inline constexpr std::string_view kProofKeyPrefix{"SYS|STATE|PROOF|"};
inline constexpr std::string_view kDisputeKeyPrefix{"SYS|STATE|DISPUTE|"};
inline constexpr std::string_view kDisputeIdKeyPrefix{"SYS|STATE|DISPUTE_ID|"};
inline constexpr std::string_view kEscrowKeyPrefix{"SYS|STATE|ESCROW|"};
inline constexpr std::string_view kWagerSequenceKey{"SYS|STATE|WAGER_SEQ"};
inline constexpr std::string_view kStatusIndexPrefix{"SYS|INDEX|STATUS|"};
inline constexpr std::string_view kUserIndexPrefix{"SYS|INDEX|USER|"};

inline const std::array<std::string_view, 9> kEngineKeyspaces{
    kWagerKeyPrefix,     kAcceptanceKeyPrefix, kProofKeyPrefix,
    kDisputeKeyPrefix,   kDisputeIdKeyPrefix,  kEscrowKeyPrefix,
    kWagerSequenceKey,   kStatusIndexPrefix,   kUserIndexPrefix};

template <typename Encoder, typename T>
bounty::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
bounty::schema::bytes_t make_prefix_key(Encoder& encoder,
                                        std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
bounty::schema::bytes_t make_wager_key(
    Encoder& encoder,
    const bounty::schema::wager_id_t& wager_id) {
  return make_prefixed_key(encoder, kWagerKeyPrefix, wager_id);
}

template <typename Encoder>
bounty::schema::bytes_t make_acceptance_key(
    Encoder& encoder,
    const bounty::schema::wager_id_t& wager_id) {
  return make_prefixed_key(encoder, kAcceptanceKeyPrefix, wager_id);
}

template <typename Encoder>
bounty::schema::bytes_t make_proof_key(
    Encoder& encoder,
    const bounty::schema::wager_id_t& wager_id,
    const bounty::schema::account_id_t& submitter) {
  return make_prefixed_key(encoder, kProofKeyPrefix,
                           std::tuple{wager_id, submitter});
}

template <typename Encoder>
bounty::schema::bytes_t make_proof_prefix_key(
    Encoder& encoder,
    const bounty::schema::wager_id_t& wager_id) {
  return make_prefixed_key(encoder, kProofKeyPrefix, wager_id);
}

template <typename Encoder>
bounty::schema::bytes_t make_dispute_key(
    Encoder& encoder,
    const bounty::schema::wager_id_t& wager_id) {
  return make_prefixed_key(encoder, kDisputeKeyPrefix, wager_id);
}

template <typename Encoder>
bounty::schema::bytes_t make_dispute_id_key(
    Encoder& encoder,
    const bounty::schema::dispute_id_t& dispute_id) {
  return make_prefixed_key(encoder, kDisputeIdKeyPrefix, dispute_id);
}

template <typename Encoder>
bounty::schema::bytes_t make_escrow_key(
    Encoder& encoder,
    const bounty::schema::wager_id_t& wager_id,
    const bounty::schema::escrow_operation_t operation) {
  return make_prefixed_key(encoder, kEscrowKeyPrefix,
                           std::tuple{wager_id, operation});
}

template <typename Encoder>
bounty::schema::bytes_t make_escrow_prefix_key(
    Encoder& encoder,
    const bounty::schema::wager_id_t& wager_id) {
  return make_prefixed_key(encoder, kEscrowKeyPrefix, wager_id);
}

template <typename Encoder>
bounty::schema::bytes_t make_status_index_key(
    Encoder& encoder,
    const bounty::schema::wager_status_t status,
    const bounty::schema::wager_id_t& wager_id) {
  return make_prefixed_key(encoder, kStatusIndexPrefix,
                           std::tuple{status, wager_id});
}

template <typename Encoder>
bounty::schema::bytes_t make_status_index_prefix_key(
    Encoder& encoder,
    const bounty::schema::wager_status_t status) {
  return make_prefixed_key(encoder, kStatusIndexPrefix, status);
}

template <typename Encoder>
bounty::schema::bytes_t make_user_index_key(
    Encoder& encoder,
    const bounty::schema::account_id_t& user,
    const bounty::schema::wager_id_t& wager_id) {
  return make_prefixed_key(encoder, kUserIndexPrefix,
                           std::tuple{user, wager_id});
}

template <typename Encoder>
bounty::schema::bytes_t make_user_index_prefix_key(
    Encoder& encoder,
    const bounty::schema::account_id_t& user) {
  return make_prefixed_key(encoder, kUserIndexPrefix, user);
}

}  // namespace bounty::schema::key
