#include <spdlog/spdlog.h>
#include <algorithm>
#include <bounty/schema/key/engine_keys.hpp>
#include <bounty/store/wager_store.hpp>
#include <iterator>
#include <set>
#include <tuple>

using namespace bounty::schema;

namespace bounty::store {

std::string_view to_string(const commit_status_t value) {
  switch (value) {
    case commit_status_t::committed:
      return "committed";
    case commit_status_t::status_mismatch:
      return "status_mismatch";
    case commit_status_t::duplicate_wager:
      return "duplicate_wager";
    case commit_status_t::duplicate_acceptance:
      return "duplicate_acceptance";
    case commit_status_t::duplicate_proof:
      return "duplicate_proof";
    case commit_status_t::duplicate_dispute:
      return "duplicate_dispute";
    case commit_status_t::duplicate_escrow_operation:
      return "duplicate_escrow_operation";
  }
  return "unknown";
}

void wager_store::transaction::put_wager(
    const wager_state_t& wager,
    std::optional<wager_status_t> expected_status) {
  wagers_.push_back(wager_write{.wager = wager,
                                .expected_status = expected_status});
}

void wager_store::transaction::put_acceptance(
    const acceptance_record_t& acceptance) {
  acceptances_.push_back(acceptance);
}

void wager_store::transaction::append_proof(const proof_record_t& proof) {
  proofs_.push_back(proof);
}

void wager_store::transaction::put_dispute(const dispute_record_t& dispute,
                                           const bool is_new) {
  disputes_.push_back(dispute_write{.dispute = dispute, .is_new = is_new});
}

void wager_store::transaction::add_journal_entry(
    const escrow_journal_entry_t& entry) {
  journal_.push_back(journal_write{.entry = entry, .is_new = true});
}

void wager_store::transaction::update_journal_entry(
    const escrow_journal_entry_t& entry) {
  journal_.push_back(journal_write{.entry = entry, .is_new = false});
}

bool wager_store::transaction::has_journal_entry(
    const wager_id_t& wager_id,
    const escrow_operation_t operation) const {
  return std::any_of(std::begin(journal_), std::end(journal_),
                     [&](const auto& write) {
                       return write.entry.wager_id == wager_id &&
                              write.entry.operation == operation;
                     });
}

std::vector<escrow_journal_entry_t>
wager_store::transaction::journal_entries() const {
  auto entries = std::vector<escrow_journal_entry_t>{};
  entries.reserve(journal_.size());
  for (const auto& write : journal_) {
    entries.push_back(write.entry);
  }
  return entries;
}

bool wager_store::transaction::empty() const {
  return wagers_.empty() && acceptances_.empty() && proofs_.empty() &&
         disputes_.empty() && journal_.empty();
}

wager_store::wager_store(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<wager_state_t> wager_store::load_wager(
    const wager_id_t& wager_id) const {
  auto key = key::make_wager_key(encoder_, wager_id);
  return storage_.get<wager_state_t>(encoder_, make_bytes_view(key));
}

std::optional<acceptance_record_t> wager_store::load_acceptance(
    const wager_id_t& wager_id) const {
  auto key = key::make_acceptance_key(encoder_, wager_id);
  return storage_.get<acceptance_record_t>(encoder_, make_bytes_view(key));
}

std::vector<proof_record_t> wager_store::load_proofs(
    const wager_id_t& wager_id) const {
  auto prefix = key::make_proof_prefix_key(encoder_, wager_id);
  auto proofs = std::vector<proof_record_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    proofs.push_back(encoder_.decode<proof_record_t>(make_bytes_view(value)));
  }
  std::sort(std::begin(proofs), std::end(proofs),
            [](const auto& lhs, const auto& rhs) {
              return lhs.sequence < rhs.sequence;
            });
  return proofs;
}

std::optional<dispute_record_t> wager_store::load_dispute(
    const wager_id_t& wager_id) const {
  auto key = key::make_dispute_key(encoder_, wager_id);
  return storage_.get<dispute_record_t>(encoder_, make_bytes_view(key));
}

std::optional<wager_id_t> wager_store::find_wager_for_dispute(
    const dispute_id_t& dispute_id) const {
  auto key = key::make_dispute_id_key(encoder_, dispute_id);
  return storage_.get<wager_id_t>(encoder_, make_bytes_view(key));
}

std::optional<escrow_journal_entry_t> wager_store::load_journal_entry(
    const wager_id_t& wager_id,
    const escrow_operation_t operation) const {
  auto key = key::make_escrow_key(encoder_, wager_id, operation);
  return storage_.get<escrow_journal_entry_t>(encoder_,
                                              make_bytes_view(key));
}

std::vector<escrow_journal_entry_t> wager_store::load_journal(
    const wager_id_t& wager_id) const {
  auto prefix = key::make_escrow_prefix_key(encoder_, wager_id);
  auto entries = std::vector<escrow_journal_entry_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    entries.push_back(
        encoder_.decode<escrow_journal_entry_t>(make_bytes_view(value)));
  }
  return entries;
}

std::vector<wager_id_t> wager_store::list_wager_ids_by_status(
    const wager_status_t status) const {
  return list_index(key::make_status_index_prefix_key(encoder_, status));
}

std::vector<wager_id_t> wager_store::list_wager_ids_for_user(
    const account_id_t& user) const {
  return list_index(key::make_user_index_prefix_key(encoder_, user));
}

std::vector<wager_id_t> wager_store::list_index(const bytes_t& prefix) const {
  auto ids = std::vector<wager_id_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    ids.push_back(encoder_.decode<wager_id_t>(make_bytes_view(value)));
  }
  return ids;
}

uint64_t wager_store::next_wager_sequence() {
  auto lock = std::scoped_lock{mutex_};
  auto key = encoder_.encode(key::kWagerSequenceKey);
  auto current =
      storage_.get<uint64_t>(encoder_, make_bytes_view(key)).value_or(0);
  auto next = current + 1;
  storage_.put(encoder_, make_bytes_view(key), next);
  return current;
}

commit_status_t wager_store::precheck(const transaction& tx) const {
  for (const auto& write : tx.wagers_) {
    auto stored = load_wager(write.wager.wager_id);
    if (!write.expected_status.has_value()) {
      if (stored.has_value()) {
        return commit_status_t::duplicate_wager;
      }
      continue;
    }
    if (!stored.has_value() || stored->status != *write.expected_status) {
      return commit_status_t::status_mismatch;
    }
  }

  for (const auto& acceptance : tx.acceptances_) {
    if (storage_.contains(make_bytes_view(
            key::make_acceptance_key(encoder_, acceptance.wager_id)))) {
      return commit_status_t::duplicate_acceptance;
    }
  }

  auto staged_proofs = std::set<std::tuple<wager_id_t, account_id_t>>{};
  for (const auto& proof : tx.proofs_) {
    auto inserted =
        staged_proofs.emplace(proof.wager_id, proof.submitter).second;
    if (!inserted ||
        storage_.contains(make_bytes_view(key::make_proof_key(
            encoder_, proof.wager_id, proof.submitter)))) {
      return commit_status_t::duplicate_proof;
    }
  }

  for (const auto& write : tx.disputes_) {
    auto exists = storage_.contains(make_bytes_view(
        key::make_dispute_key(encoder_, write.dispute.wager_id)));
    if (write.is_new && exists) {
      return commit_status_t::duplicate_dispute;
    }
    if (!write.is_new && !exists) {
      return commit_status_t::status_mismatch;
    }
  }

  auto staged_operations =
      std::set<std::tuple<wager_id_t, escrow_operation_t>>{};
  for (const auto& write : tx.journal_) {
    const auto& entry = write.entry;
    auto inserted =
        staged_operations.emplace(entry.wager_id, entry.operation).second;
    if (!inserted) {
      return commit_status_t::duplicate_escrow_operation;
    }
    auto exists = storage_.contains(make_bytes_view(
        key::make_escrow_key(encoder_, entry.wager_id, entry.operation)));
    if (write.is_new && exists) {
      return commit_status_t::duplicate_escrow_operation;
    }
    if (!write.is_new && !exists) {
      return commit_status_t::status_mismatch;
    }
  }

  return commit_status_t::committed;
}

commit_status_t wager_store::commit(const transaction& tx) {
  auto lock = std::scoped_lock{mutex_};

  auto status = precheck(tx);
  if (status != commit_status_t::committed) {
    spdlog::debug("Store commit rejected: {}", to_string(status));
    return status;
  }

  auto batch = bounty::storage::write_batch{};
  for (const auto& write : tx.wagers_) {
    const auto& wager = write.wager;
    batch.put(key::make_wager_key(encoder_, wager.wager_id),
              encoder_.encode(wager));

    auto encoded_id = encoder_.encode(wager.wager_id);
    if (!write.expected_status.has_value()) {
      batch.put(
          key::make_user_index_key(encoder_, wager.parties.creator,
                                   wager.wager_id),
          encoded_id);
    } else if (*write.expected_status != wager.status) {
      batch.erase(key::make_status_index_key(
          encoder_, *write.expected_status, wager.wager_id));
    }
    if (write.expected_status != wager.status) {
      batch.put(key::make_status_index_key(encoder_, wager.status,
                                           wager.wager_id),
                encoded_id);
    }
  }

  for (const auto& acceptance : tx.acceptances_) {
    batch.put(key::make_acceptance_key(encoder_, acceptance.wager_id),
              encoder_.encode(acceptance));
    batch.put(key::make_user_index_key(encoder_, acceptance.acceptor,
                                       acceptance.wager_id),
              encoder_.encode(acceptance.wager_id));
  }

  for (const auto& proof : tx.proofs_) {
    batch.put(key::make_proof_key(encoder_, proof.wager_id, proof.submitter),
              encoder_.encode(proof));
  }

  for (const auto& write : tx.disputes_) {
    const auto& dispute = write.dispute;
    batch.put(key::make_dispute_key(encoder_, dispute.wager_id),
              encoder_.encode(dispute));
    if (write.is_new) {
      batch.put(key::make_dispute_id_key(encoder_, dispute.dispute_id),
                encoder_.encode(dispute.wager_id));
    }
  }

  for (const auto& write : tx.journal_) {
    const auto& entry = write.entry;
    batch.put(key::make_escrow_key(encoder_, entry.wager_id, entry.operation),
              encoder_.encode(entry));
  }

  storage_.commit(batch);
  return commit_status_t::committed;
}

}  // namespace bounty::store
