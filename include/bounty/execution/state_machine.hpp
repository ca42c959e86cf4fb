#pragma once

#include <bounty/common/clock.hpp>
#include <bounty/config/engine_config.hpp>
#include <bounty/escrow/escrow_ledger.hpp>
#include <bounty/execution/wager_lock_table.hpp>
#include <bounty/schema/create_wager.hpp>
#include <bounty/schema/dispute_outcome.hpp>
#include <bounty/schema/primitives.hpp>
#include <bounty/schema/submit_proof.hpp>
#include <bounty/schema/user_stats.hpp>
#include <bounty/schema/wager_event.hpp>
#include <bounty/schema/wager_result.hpp>
#include <bounty/schema/wager_snapshot.hpp>
#include <bounty/store/wager_store.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bounty::execution {

/// Wager lifecycle engine.
///
/// Every transition of every wager goes through this class, whether it is
/// requested by a client, by dispute arbitration or by the expiry sweeper.
/// Mutations hold the row lock of the wager for their whole duration and
/// stage the wager write, child records and escrow journal in one store
/// transaction. A settlement is committed together with its pending journal
/// rows before any wallet call; the rows are then dispatched one by one and
/// the terminal status is written once all of them are applied. A wager left
/// with a recorded settlement and a non-terminal status is completed by the
/// next mutation that reaches it.
///
/// Events are handed to the sink after the row lock is released, so a sink
/// may call back into the machine.
///
/// Domain failures are reported through `wager_result_t::code`; nothing here
/// throws for a rejected request.
class state_machine final {
 public:
  state_machine(bounty::store::wager_store& store,
                bounty::escrow::escrow_ledger& ledger,
                bounty::config::engine_config config,
                bounty::common::clock_t clock,
                bounty::schema::event_sink_t event_sink = {});

  /// Validate, hold the creator's stake and persist a new OPEN wager.
  bounty::schema::wager_result_t create(
      const bounty::schema::create_wager_t& request);

  /// OPEN -> ACCEPTED. Repeating with the same acceptor returns the
  /// existing acceptance.
  bounty::schema::wager_result_t accept(
      const bounty::schema::wager_id_t& wager_id,
      const bounty::schema::account_id_t& acceptor);

  /// ACCEPTED -> IN_PROGRESS.
  bounty::schema::wager_result_t start(
      const bounty::schema::wager_id_t& wager_id,
      const bounty::schema::account_id_t& actor);

  /// Record a participant's result claim. The first proof opens the dispute
  /// window; an agreeing second proof settles immediately.
  bounty::schema::wager_result_t submit_proof(
      const bounty::schema::submit_proof_t& request);

  /// The opponent of the first submitter accepts the claimed result.
  bounty::schema::wager_result_t confirm_result(
      const bounty::schema::wager_id_t& wager_id,
      const bounty::schema::account_id_t& actor);

  /// PENDING_RESULT -> DISPUTED, inside the dispute window only.
  bounty::schema::wager_result_t open_dispute(
      const bounty::schema::wager_id_t& wager_id,
      const bounty::schema::account_id_t& disputer,
      const std::string& reason);

  bounty::schema::wager_result_t assign_moderator(
      const bounty::schema::dispute_id_t& dispute_id,
      const bounty::schema::account_id_t& moderator);

  /// DISPUTED -> COMPLETED with the settlement chosen by `outcome`.
  bounty::schema::wager_result_t resolve_dispute(
      const bounty::schema::dispute_id_t& dispute_id,
      const bounty::schema::account_id_t& moderator,
      bounty::schema::dispute_outcome_t outcome,
      const std::string& note);

  /// OPEN -> CANCELLED by the creator, with a full refund.
  bounty::schema::wager_result_t cancel(
      const bounty::schema::wager_id_t& wager_id,
      const bounty::schema::account_id_t& actor);

  /// OPEN -> EXPIRED once `now > expires_at`. No-op on an EXPIRED wager.
  bounty::schema::wager_result_t expire(
      const bounty::schema::wager_id_t& wager_id);

  /// Settle an undisputed PENDING_RESULT wager whose dispute window has
  /// closed in favour of the first claimed winner, or complete any recorded
  /// settlement whose ledger calls are still pending. No-op on a COMPLETED
  /// wager.
  bounty::schema::wager_result_t finalize(
      const bounty::schema::wager_id_t& wager_id);

  bounty::schema::wager_result_t get(
      const bounty::schema::wager_id_t& wager_id) const;

  /// Wagers in OPEN..DISPUTED the user created or accepted, newest first.
  std::vector<bounty::schema::wager_snapshot_t> list_active(
      const bounty::schema::account_id_t& user) const;

  /// COMPLETED, EXPIRED and CANCELLED wagers of the user, newest first.
  std::vector<bounty::schema::wager_snapshot_t> list_completed(
      const bounty::schema::account_id_t& user) const;

  bounty::schema::user_stats_t user_stats(
      const bounty::schema::account_id_t& user) const;

  std::optional<bounty::schema::wager_id_t> find_wager_for_dispute(
      const bounty::schema::dispute_id_t& dispute_id) const;

  bounty::schema::timestamp_milliseconds_t now() const;
  const bounty::config::engine_config& config() const { return config_; }

 private:
  using transaction_t = bounty::store::wager_store::transaction;

  bounty::schema::wager_snapshot_t make_snapshot(
      const bounty::schema::wager_state_t& wager,
      bounty::schema::timestamp_milliseconds_t now) const;
  std::vector<bounty::schema::wager_snapshot_t> list_for_user(
      const bounty::schema::account_id_t& user,
      bool active) const;

  bool dispute_window_closed(
      const bounty::schema::wager_state_t& wager,
      bounty::schema::timestamp_milliseconds_t now) const;

  /// Record the settlement of `outcome` on `wager` and stage its pending
  /// ledger calls. The status is left unchanged.
  bounty::schema::wager_error_code settle(
      transaction_t& tx,
      bounty::schema::wager_state_t& wager,
      bounty::schema::settlement_outcome_t outcome,
      std::optional<bounty::schema::account_id_t> winner,
      bounty::schema::timestamp_milliseconds_t now);

  /// Refund and move a stale OPEN wager to EXPIRED. Caller holds the lock.
  bounty::schema::wager_result_t expire_locked(
      bounty::schema::wager_state_t wager,
      bounty::schema::timestamp_milliseconds_t now);

  /// Default win for an undisputed wager past its dispute window. Caller
  /// holds the lock.
  bounty::schema::wager_result_t finalize_by_inaction_locked(
      bounty::schema::wager_state_t wager,
      bounty::schema::timestamp_milliseconds_t now);

  /// Commit `tx` and attach `events` to the result.
  bounty::schema::wager_result_t commit(
      const transaction_t& tx,
      const bounty::schema::wager_id_t& wager_id,
      std::vector<bounty::schema::wager_event_t> events,
      bounty::schema::timestamp_milliseconds_t now);

  /// Commit a transaction carrying a settlement, then apply it.
  bounty::schema::wager_result_t record_settlement(
      const transaction_t& tx,
      const bounty::schema::wager_state_t& wager,
      std::vector<bounty::schema::wager_event_t> events,
      bounty::schema::timestamp_milliseconds_t now);

  /// Dispatch the pending journal rows of a recorded settlement and move the
  /// wager to its terminal status.
  bounty::schema::wager_result_t apply_settlement(
      bounty::schema::wager_state_t wager,
      std::vector<bounty::schema::wager_event_t> events,
      bounty::schema::timestamp_milliseconds_t now);

  /// Finish a pending settlement on behalf of another request. A successful
  /// resume reports `code_after`.
  bounty::schema::wager_result_t resume_settlement(
      const bounty::schema::wager_state_t& wager,
      bounty::schema::wager_error_code code_after,
      bounty::schema::timestamp_milliseconds_t now);

  bounty::schema::wager_result_t success(
      const bounty::schema::wager_state_t& wager,
      bounty::schema::timestamp_milliseconds_t now) const;
  bounty::schema::wager_result_t reject(
      bounty::schema::wager_error_code code,
      std::string log,
      const std::optional<bounty::schema::wager_state_t>& wager,
      bounty::schema::timestamp_milliseconds_t now) const;

  bounty::schema::wager_result_t publish(
      bounty::schema::wager_result_t result) const;

  bounty::schema::wager_result_t execute_create(
      const bounty::schema::create_wager_t& request);
  bounty::schema::wager_result_t execute_accept(
      const bounty::schema::wager_id_t& wager_id,
      const bounty::schema::account_id_t& acceptor);
  bounty::schema::wager_result_t execute_start(
      const bounty::schema::wager_id_t& wager_id,
      const bounty::schema::account_id_t& actor);
  bounty::schema::wager_result_t execute_submit_proof(
      const bounty::schema::submit_proof_t& request);
  bounty::schema::wager_result_t execute_confirm_result(
      const bounty::schema::wager_id_t& wager_id,
      const bounty::schema::account_id_t& actor);
  bounty::schema::wager_result_t execute_open_dispute(
      const bounty::schema::wager_id_t& wager_id,
      const bounty::schema::account_id_t& disputer,
      const std::string& reason);
  bounty::schema::wager_result_t execute_assign_moderator(
      const bounty::schema::dispute_id_t& dispute_id,
      const bounty::schema::account_id_t& moderator);
  bounty::schema::wager_result_t execute_resolve_dispute(
      const bounty::schema::dispute_id_t& dispute_id,
      const bounty::schema::account_id_t& moderator,
      bounty::schema::dispute_outcome_t outcome,
      const std::string& note);
  bounty::schema::wager_result_t execute_cancel(
      const bounty::schema::wager_id_t& wager_id,
      const bounty::schema::account_id_t& actor);
  bounty::schema::wager_result_t execute_expire(
      const bounty::schema::wager_id_t& wager_id);
  bounty::schema::wager_result_t execute_finalize(
      const bounty::schema::wager_id_t& wager_id);

  bounty::store::wager_store& store_;
  bounty::escrow::escrow_ledger& ledger_;
  bounty::config::engine_config config_;
  bounty::common::clock_t clock_;
  bounty::schema::event_sink_t event_sink_;
  wager_lock_table locks_;
};

}  // namespace bounty::execution
