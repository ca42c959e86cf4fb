#pragma once

#include <bounty/escrow/memory_wallet.hpp>
#include <bounty/escrow/wallet_service.hpp>
#include <bounty/schema/escrow_operation.hpp>

#include <atomic>
#include <optional>

namespace bounty::testing {

/// Forwards to a `memory_wallet` but reports `unavailable` for one chosen
/// operation, without moving money, until `heal` is called.
class flaky_wallet final : public bounty::escrow::wallet_service {
 public:
  explicit flaky_wallet(bounty::escrow::memory_wallet& wallet)
      : wallet_{wallet} {}

  void fail(const bounty::schema::escrow_operation_t operation) {
    failing_ = static_cast<int>(operation);
  }
  void heal() { failing_ = -1; }
  size_t rejected_calls() const { return rejected_; }

  bounty::escrow::wallet_status_t hold(
      const bounty::schema::idempotency_key_t& key,
      const bounty::schema::account_id_t& user,
      const bounty::schema::amount_t amount) override {
    if (is_failing(bounty::schema::escrow_operation_t::hold)) {
      return bounty::escrow::wallet_status_t::unavailable;
    }
    return wallet_.hold(key, user, amount);
  }

  bounty::escrow::wallet_status_t release(
      const bounty::schema::idempotency_key_t& key,
      const bounty::schema::account_id_t& from,
      const bounty::schema::account_id_t& to,
      const bounty::schema::amount_t amount) override {
    if (is_failing(bounty::schema::escrow_operation_t::release)) {
      return bounty::escrow::wallet_status_t::unavailable;
    }
    return wallet_.release(key, from, to, amount);
  }

  bounty::escrow::wallet_status_t collect(
      const bounty::schema::idempotency_key_t& key,
      const bounty::schema::account_id_t& from,
      const bounty::schema::amount_t amount) override {
    if (is_failing(bounty::schema::escrow_operation_t::collect)) {
      return bounty::escrow::wallet_status_t::unavailable;
    }
    return wallet_.collect(key, from, amount);
  }

  bounty::escrow::wallet_status_t refund(
      const bounty::schema::idempotency_key_t& key,
      const bounty::schema::account_id_t& user,
      const bounty::schema::amount_t amount) override {
    if (is_failing(bounty::schema::escrow_operation_t::refund)) {
      return bounty::escrow::wallet_status_t::unavailable;
    }
    return wallet_.refund(key, user, amount);
  }

 private:
  bool is_failing(const bounty::schema::escrow_operation_t operation) {
    if (failing_ != static_cast<int>(operation)) {
      return false;
    }
    ++rejected_;
    return true;
  }

  bounty::escrow::memory_wallet& wallet_;
  std::atomic<int> failing_{-1};
  std::atomic<size_t> rejected_{};
};

}  // namespace bounty::testing
