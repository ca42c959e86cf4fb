#pragma once

#include <bounty/schema/acceptance_record.hpp>
#include <bounty/schema/dispute_record.hpp>
#include <bounty/schema/encoding/encoder.hpp>
#include <bounty/schema/encoding/scale/encoder.hpp>
#include <bounty/schema/escrow_journal_entry.hpp>
#include <bounty/schema/escrow_operation.hpp>
#include <bounty/schema/primitives.hpp>
#include <bounty/schema/proof_record.hpp>
#include <bounty/schema/wager_state.hpp>
#include <bounty/schema/wager_status.hpp>
#include <bounty/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace bounty::store {

/// Outcome of `wager_store::commit`. Anything other than `committed` means
/// nothing from the transaction was written.
enum class commit_status_t : uint8_t {
  committed = 0,
  status_mismatch = 1,
  duplicate_wager = 2,
  duplicate_acceptance = 3,
  duplicate_proof = 4,
  duplicate_dispute = 5,
  duplicate_escrow_operation = 6
};

std::string_view to_string(commit_status_t value);

/// Persistence for wagers and their child records.
///
/// Every mutation is staged in a `transaction` and written as one storage
/// batch. Commit re-checks the expected wager status and the 1:1 uniqueness
/// rules under the store mutex, so a stale writer can never overwrite a
/// newer state.
class wager_store final {
 public:
  using encoder_t = bounty::schema::encoding::encoder<
      bounty::schema::encoding::scale_encoder_tag>;
  using storage_t =
      bounty::storage::storage<bounty::storage::rocksdb_storage_tag>;

  class transaction final {
   public:
    /// Stage a wager write. `expected_status` is the status the stored row
    /// must still have at commit time; std::nullopt requires that no row
    /// exists yet.
    void put_wager(const bounty::schema::wager_state_t& wager,
                   std::optional<bounty::schema::wager_status_t>
                       expected_status);
    void put_acceptance(const bounty::schema::acceptance_record_t& acceptance);
    void append_proof(const bounty::schema::proof_record_t& proof);
    /// Stage a dispute write. New disputes must not exist yet; updates
    /// require the row to exist.
    void put_dispute(const bounty::schema::dispute_record_t& dispute,
                     bool is_new);
    /// Stage a new journal entry; one per `(wager, operation)`.
    void add_journal_entry(
        const bounty::schema::escrow_journal_entry_t& entry);
    /// Stage an update of a committed journal entry.
    void update_journal_entry(
        const bounty::schema::escrow_journal_entry_t& entry);

    bool has_journal_entry(
        const bounty::schema::wager_id_t& wager_id,
        bounty::schema::escrow_operation_t operation) const;
    std::vector<bounty::schema::escrow_journal_entry_t> journal_entries()
        const;
    bool empty() const;

   private:
    friend class wager_store;

    struct wager_write final {
      bounty::schema::wager_state_t wager;
      std::optional<bounty::schema::wager_status_t> expected_status;
    };

    struct dispute_write final {
      bounty::schema::dispute_record_t dispute;
      bool is_new{};
    };

    struct journal_write final {
      bounty::schema::escrow_journal_entry_t entry;
      bool is_new{};
    };

    std::vector<wager_write> wagers_;
    std::vector<bounty::schema::acceptance_record_t> acceptances_;
    std::vector<bounty::schema::proof_record_t> proofs_;
    std::vector<dispute_write> disputes_;
    std::vector<journal_write> journal_;
  };

  wager_store(encoder_t& encoder, storage_t& storage);

  std::optional<bounty::schema::wager_state_t> load_wager(
      const bounty::schema::wager_id_t& wager_id) const;
  std::optional<bounty::schema::acceptance_record_t> load_acceptance(
      const bounty::schema::wager_id_t& wager_id) const;
  /// Proofs in submission order.
  std::vector<bounty::schema::proof_record_t> load_proofs(
      const bounty::schema::wager_id_t& wager_id) const;
  std::optional<bounty::schema::dispute_record_t> load_dispute(
      const bounty::schema::wager_id_t& wager_id) const;
  std::optional<bounty::schema::wager_id_t> find_wager_for_dispute(
      const bounty::schema::dispute_id_t& dispute_id) const;
  std::optional<bounty::schema::escrow_journal_entry_t> load_journal_entry(
      const bounty::schema::wager_id_t& wager_id,
      bounty::schema::escrow_operation_t operation) const;
  /// Journal of the wager in operation order (hold, release, collect,
  /// refund).
  std::vector<bounty::schema::escrow_journal_entry_t> load_journal(
      const bounty::schema::wager_id_t& wager_id) const;

  std::vector<bounty::schema::wager_id_t> list_wager_ids_by_status(
      bounty::schema::wager_status_t status) const;
  /// Wagers the user created or accepted.
  std::vector<bounty::schema::wager_id_t> list_wager_ids_for_user(
      const bounty::schema::account_id_t& user) const;

  /// Allocate the next value of the persisted wager sequence.
  uint64_t next_wager_sequence();

  commit_status_t commit(const transaction& tx);

 private:
  commit_status_t precheck(const transaction& tx) const;
  std::vector<bounty::schema::wager_id_t> list_index(
      const bounty::schema::bytes_t& prefix) const;

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace bounty::store
