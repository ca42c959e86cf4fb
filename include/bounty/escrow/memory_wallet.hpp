#pragma once

#include <bounty/escrow/wallet_service.hpp>
#include <atomic>
#include <map>
#include <mutex>
#include <set>

namespace bounty::escrow {

struct wallet_balance_t final {
  bounty::schema::amount_t available{};
  bounty::schema::amount_t escrow{};
};

/// In-process wallet used by the daemon and the tests.
class memory_wallet final : public wallet_service {
 public:
  wallet_status_t hold(const bounty::schema::idempotency_key_t& key,
                       const bounty::schema::account_id_t& user,
                       bounty::schema::amount_t amount) override;
  wallet_status_t release(const bounty::schema::idempotency_key_t& key,
                          const bounty::schema::account_id_t& from,
                          const bounty::schema::account_id_t& to,
                          bounty::schema::amount_t amount) override;
  wallet_status_t collect(const bounty::schema::idempotency_key_t& key,
                          const bounty::schema::account_id_t& from,
                          bounty::schema::amount_t amount) override;
  wallet_status_t refund(const bounty::schema::idempotency_key_t& key,
                         const bounty::schema::account_id_t& user,
                         bounty::schema::amount_t amount) override;

  void deposit(const bounty::schema::account_id_t& user,
               bounty::schema::amount_t amount);
  wallet_balance_t balance(const bounty::schema::account_id_t& user) const;
  bounty::schema::amount_t platform_balance() const;
  /// Number of distinct idempotency keys that moved money.
  size_t processed_operations() const;

  /// While false every call fails with `unavailable` and moves nothing.
  void set_available(bool available);

 private:
  bool is_duplicate(const bounty::schema::idempotency_key_t& key) const;
  wallet_status_t debit_escrow(const bounty::schema::account_id_t& user,
                               bounty::schema::amount_t amount);

  mutable std::mutex mutex_;
  std::atomic<bool> available_{true};
  std::map<bounty::schema::account_id_t, wallet_balance_t> balances_;
  std::set<bounty::schema::idempotency_key_t> processed_;
  bounty::schema::amount_t platform_balance_{};
};

}  // namespace bounty::escrow
