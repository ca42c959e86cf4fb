#pragma once

#include <bounty/escrow/wallet_service.hpp>
#include <bounty/schema/escrow_operation.hpp>
#include <bounty/schema/primitives.hpp>
#include <bounty/schema/wager_error_code.hpp>
#include <bounty/store/wager_store.hpp>

namespace bounty::escrow {

/// Idempotency key for one ledger call: BLAKE3(wager_id || operation name).
bounty::schema::idempotency_key_t make_idempotency_key(
    const bounty::schema::wager_id_t& wager_id,
    bounty::schema::escrow_operation_t operation);

/// The only component that moves money.
///
/// `hold` calls the wallet immediately and stages an applied journal entry,
/// so a failed hold leaves nothing behind. Settlement calls go through an
/// outbox: `release`, `collect` and `refund` only stage pending entries in
/// the transaction that records the settlement, and `dispatch` sends the
/// committed pending entries of a wager to the wallet in operation order,
/// marking each one applied as soon as the wallet accepts it. Recipients
/// and amounts therefore never change between the first attempt and a
/// retry.
class escrow_ledger final {
 public:
  escrow_ledger(wallet_service& wallet, bounty::store::wager_store& store);

  bounty::schema::wager_error_code hold(
      bounty::store::wager_store::transaction& tx,
      const bounty::schema::wager_id_t& wager_id,
      const bounty::schema::account_id_t& user,
      bounty::schema::amount_t amount,
      bounty::schema::timestamp_milliseconds_t now);

  void release(bounty::store::wager_store::transaction& tx,
               const bounty::schema::wager_id_t& wager_id,
               const bounty::schema::account_id_t& from,
               const bounty::schema::account_id_t& to,
               bounty::schema::amount_t amount,
               bounty::schema::timestamp_milliseconds_t now);

  void collect(bounty::store::wager_store::transaction& tx,
               const bounty::schema::wager_id_t& wager_id,
               const bounty::schema::account_id_t& from,
               bounty::schema::amount_t amount,
               bounty::schema::timestamp_milliseconds_t now);

  void refund(bounty::store::wager_store::transaction& tx,
              const bounty::schema::wager_id_t& wager_id,
              const bounty::schema::account_id_t& user,
              bounty::schema::amount_t amount,
              bounty::schema::timestamp_milliseconds_t now);

  /// Apply every committed pending entry of the wager. Stops at the first
  /// wallet failure; entries applied before it stay applied.
  bounty::schema::wager_error_code dispatch(
      const bounty::schema::wager_id_t& wager_id,
      bounty::schema::timestamp_milliseconds_t now);

 private:
  bool already_recorded(const bounty::store::wager_store::transaction& tx,
                        const bounty::schema::wager_id_t& wager_id,
                        bounty::schema::escrow_operation_t operation) const;
  void stage(bounty::store::wager_store::transaction& tx,
             const bounty::schema::escrow_journal_entry_t& entry);
  wallet_status_t send(const bounty::schema::escrow_journal_entry_t& entry);

  wallet_service& wallet_;
  bounty::store::wager_store& store_;
};

}  // namespace bounty::escrow
