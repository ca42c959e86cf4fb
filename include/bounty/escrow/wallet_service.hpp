#pragma once

#include <bounty/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

namespace bounty::escrow {

enum class wallet_status_t : uint8_t {
  ok = 0,
  insufficient_funds = 1,
  unavailable = 2
};

inline constexpr std::string_view to_string(const wallet_status_t value) {
  switch (value) {
    case wallet_status_t::ok:
      return "ok";
    case wallet_status_t::insufficient_funds:
      return "insufficient_funds";
    case wallet_status_t::unavailable:
      return "unavailable";
  }
  return "unknown";
}

/// External wallet boundary. Balances are owned by the implementation, which
/// must serialize per account and treat a repeated idempotency key as a
/// successful no-op.
class wallet_service {
 public:
  virtual ~wallet_service() = default;

  /// Move `amount` from the user's available balance into escrow.
  virtual wallet_status_t hold(const bounty::schema::idempotency_key_t& key,
                               const bounty::schema::account_id_t& user,
                               bounty::schema::amount_t amount) = 0;

  /// Move `amount` out of `from`'s escrow into `to`'s available balance.
  virtual wallet_status_t release(
      const bounty::schema::idempotency_key_t& key,
      const bounty::schema::account_id_t& from,
      const bounty::schema::account_id_t& to,
      bounty::schema::amount_t amount) = 0;

  /// Move `amount` out of `from`'s escrow into the platform account.
  virtual wallet_status_t collect(const bounty::schema::idempotency_key_t& key,
                                  const bounty::schema::account_id_t& from,
                                  bounty::schema::amount_t amount) = 0;

  /// Return `amount` from the user's escrow to their available balance.
  virtual wallet_status_t refund(const bounty::schema::idempotency_key_t& key,
                                 const bounty::schema::account_id_t& user,
                                 bounty::schema::amount_t amount) = 0;
};

}  // namespace bounty::escrow
