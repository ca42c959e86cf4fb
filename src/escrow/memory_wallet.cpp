#include <spdlog/spdlog.h>
#include <bounty/escrow/memory_wallet.hpp>

namespace bounty::escrow {

bool memory_wallet::is_duplicate(
    const bounty::schema::idempotency_key_t& key) const {
  return processed_.contains(key);
}

wallet_status_t memory_wallet::debit_escrow(
    const bounty::schema::account_id_t& user,
    const bounty::schema::amount_t amount) {
  auto& balance = balances_[user];
  if (balance.escrow < amount) {
    spdlog::error("Escrow of {} holds {} but {} was requested",
                  bounty::schema::to_hex(user), balance.escrow, amount);
    return wallet_status_t::insufficient_funds;
  }
  balance.escrow -= amount;
  return wallet_status_t::ok;
}

wallet_status_t memory_wallet::hold(
    const bounty::schema::idempotency_key_t& key,
    const bounty::schema::account_id_t& user,
    const bounty::schema::amount_t amount) {
  if (!available_) {
    return wallet_status_t::unavailable;
  }
  auto lock = std::scoped_lock{mutex_};
  if (is_duplicate(key)) {
    return wallet_status_t::ok;
  }
  auto& balance = balances_[user];
  if (balance.available < amount) {
    return wallet_status_t::insufficient_funds;
  }
  balance.available -= amount;
  balance.escrow += amount;
  processed_.insert(key);
  return wallet_status_t::ok;
}

wallet_status_t memory_wallet::release(
    const bounty::schema::idempotency_key_t& key,
    const bounty::schema::account_id_t& from,
    const bounty::schema::account_id_t& to,
    const bounty::schema::amount_t amount) {
  if (!available_) {
    return wallet_status_t::unavailable;
  }
  auto lock = std::scoped_lock{mutex_};
  if (is_duplicate(key)) {
    return wallet_status_t::ok;
  }
  auto status = debit_escrow(from, amount);
  if (status != wallet_status_t::ok) {
    return status;
  }
  balances_[to].available += amount;
  processed_.insert(key);
  return wallet_status_t::ok;
}

wallet_status_t memory_wallet::collect(
    const bounty::schema::idempotency_key_t& key,
    const bounty::schema::account_id_t& from,
    const bounty::schema::amount_t amount) {
  if (!available_) {
    return wallet_status_t::unavailable;
  }
  auto lock = std::scoped_lock{mutex_};
  if (is_duplicate(key)) {
    return wallet_status_t::ok;
  }
  auto status = debit_escrow(from, amount);
  if (status != wallet_status_t::ok) {
    return status;
  }
  platform_balance_ += amount;
  processed_.insert(key);
  return wallet_status_t::ok;
}

wallet_status_t memory_wallet::refund(
    const bounty::schema::idempotency_key_t& key,
    const bounty::schema::account_id_t& user,
    const bounty::schema::amount_t amount) {
  if (!available_) {
    return wallet_status_t::unavailable;
  }
  auto lock = std::scoped_lock{mutex_};
  if (is_duplicate(key)) {
    return wallet_status_t::ok;
  }
  auto status = debit_escrow(user, amount);
  if (status != wallet_status_t::ok) {
    return status;
  }
  balances_[user].available += amount;
  processed_.insert(key);
  return wallet_status_t::ok;
}

void memory_wallet::deposit(const bounty::schema::account_id_t& user,
                            const bounty::schema::amount_t amount) {
  auto lock = std::scoped_lock{mutex_};
  balances_[user].available += amount;
}

wallet_balance_t memory_wallet::balance(
    const bounty::schema::account_id_t& user) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = balances_.find(user);
  if (it == std::end(balances_)) {
    return {};
  }
  return it->second;
}

bounty::schema::amount_t memory_wallet::platform_balance() const {
  auto lock = std::scoped_lock{mutex_};
  return platform_balance_;
}

size_t memory_wallet::processed_operations() const {
  auto lock = std::scoped_lock{mutex_};
  return processed_.size();
}

void memory_wallet::set_available(const bool available) {
  available_ = available;
}

}  // namespace bounty::escrow
