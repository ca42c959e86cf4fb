#include <spdlog/spdlog.h>
#include <bounty/blake3/hash.hpp>
#include <bounty/escrow/escrow_ledger.hpp>
#include <iterator>

using namespace bounty::schema;

namespace {

wager_error_code to_error_code(const bounty::escrow::wallet_status_t status) {
  switch (status) {
    case bounty::escrow::wallet_status_t::ok:
      return wager_error_code::ok;
    case bounty::escrow::wallet_status_t::insufficient_funds:
      return wager_error_code::escrow_hold_failed;
    case bounty::escrow::wallet_status_t::unavailable:
      return wager_error_code::ledger_unavailable;
  }
  return wager_error_code::ledger_unavailable;
}

escrow_journal_entry_t make_entry(const wager_id_t& wager_id,
                                  const escrow_operation_t operation,
                                  std::optional<account_id_t> from,
                                  std::optional<account_id_t> to,
                                  const amount_t amount,
                                  const timestamp_milliseconds_t now) {
  return escrow_journal_entry_t{
      .wager_id = wager_id,
      .operation = operation,
      .idempotency_key =
          bounty::escrow::make_idempotency_key(wager_id, operation),
      .from = std::move(from),
      .to = std::move(to),
      .amount = amount,
      .state = escrow_entry_state_t::pending,
      .recorded_at = now};
}

}  // namespace

namespace bounty::escrow {

idempotency_key_t make_idempotency_key(const wager_id_t& wager_id,
                                       const escrow_operation_t operation) {
  auto material = bytes_t{std::begin(wager_id), std::end(wager_id)};
  auto name = to_string(operation);
  material.insert(std::end(material), std::begin(name), std::end(name));
  return bounty::blake3::hash(bytes_view_t{material.data(), material.size()});
}

escrow_ledger::escrow_ledger(wallet_service& wallet,
                             bounty::store::wager_store& store)
    : wallet_{wallet}, store_{store} {}

bool escrow_ledger::already_recorded(
    const bounty::store::wager_store::transaction& tx,
    const wager_id_t& wager_id,
    const escrow_operation_t operation) const {
  return tx.has_journal_entry(wager_id, operation) ||
         store_.load_journal_entry(wager_id, operation).has_value();
}

void escrow_ledger::stage(bounty::store::wager_store::transaction& tx,
                          const escrow_journal_entry_t& entry) {
  if (already_recorded(tx, entry.wager_id, entry.operation)) {
    return;
  }
  tx.add_journal_entry(entry);
}

wager_error_code escrow_ledger::hold(
    bounty::store::wager_store::transaction& tx,
    const wager_id_t& wager_id,
    const account_id_t& user,
    const amount_t amount,
    const timestamp_milliseconds_t now) {
  if (already_recorded(tx, wager_id, escrow_operation_t::hold)) {
    return wager_error_code::ok;
  }
  auto entry = make_entry(wager_id, escrow_operation_t::hold, user,
                          std::nullopt, amount, now);
  auto status = send(entry);
  if (status != wallet_status_t::ok) {
    spdlog::warn("Escrow hold of {} for {} failed: {}", amount,
                 to_hex(user), to_string(status));
    return to_error_code(status);
  }
  entry.state = escrow_entry_state_t::applied;
  entry.applied_at = now;
  tx.add_journal_entry(entry);
  return wager_error_code::ok;
}

void escrow_ledger::release(bounty::store::wager_store::transaction& tx,
                            const wager_id_t& wager_id,
                            const account_id_t& from,
                            const account_id_t& to,
                            const amount_t amount,
                            const timestamp_milliseconds_t now) {
  stage(tx, make_entry(wager_id, escrow_operation_t::release, from, to,
                       amount, now));
}

void escrow_ledger::collect(bounty::store::wager_store::transaction& tx,
                            const wager_id_t& wager_id,
                            const account_id_t& from,
                            const amount_t amount,
                            const timestamp_milliseconds_t now) {
  stage(tx, make_entry(wager_id, escrow_operation_t::collect, from,
                       std::nullopt, amount, now));
}

void escrow_ledger::refund(bounty::store::wager_store::transaction& tx,
                           const wager_id_t& wager_id,
                           const account_id_t& user,
                           const amount_t amount,
                           const timestamp_milliseconds_t now) {
  stage(tx, make_entry(wager_id, escrow_operation_t::refund, std::nullopt,
                       user, amount, now));
}

wallet_status_t escrow_ledger::send(const escrow_journal_entry_t& entry) {
  switch (entry.operation) {
    case escrow_operation_t::hold:
      return wallet_.hold(entry.idempotency_key,
                          entry.from.value_or(account_id_t{}), entry.amount);
    case escrow_operation_t::release:
      return wallet_.release(entry.idempotency_key,
                             entry.from.value_or(account_id_t{}),
                             entry.to.value_or(account_id_t{}), entry.amount);
    case escrow_operation_t::collect:
      return wallet_.collect(entry.idempotency_key,
                             entry.from.value_or(account_id_t{}),
                             entry.amount);
    case escrow_operation_t::refund:
      return wallet_.refund(entry.idempotency_key,
                            entry.to.value_or(account_id_t{}), entry.amount);
  }
  return wallet_status_t::unavailable;
}

wager_error_code escrow_ledger::dispatch(const wager_id_t& wager_id,
                                         const timestamp_milliseconds_t now) {
  for (auto entry : store_.load_journal(wager_id)) {
    if (entry.state != escrow_entry_state_t::pending) {
      continue;
    }
    auto status = send(entry);
    if (status != wallet_status_t::ok) {
      spdlog::warn("Escrow {} of {} for wager {} failed: {}",
                   to_string(entry.operation), entry.amount, to_hex(wager_id),
                   to_string(status));
      return wager_error_code::ledger_unavailable;
    }
    entry.state = escrow_entry_state_t::applied;
    entry.applied_at = now;
    auto tx = bounty::store::wager_store::transaction{};
    tx.update_journal_entry(entry);
    auto committed = store_.commit(tx);
    if (committed != bounty::store::commit_status_t::committed) {
      spdlog::error("Escrow {} for wager {} applied but not marked: {}",
                    to_string(entry.operation), to_hex(wager_id),
                    bounty::store::to_string(committed));
      return wager_error_code::concurrent_modification;
    }
  }
  return wager_error_code::ok;
}

}  // namespace bounty::escrow
