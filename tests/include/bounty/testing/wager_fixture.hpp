#pragma once

#include <bounty/config/engine_config.hpp>
#include <bounty/escrow/escrow_ledger.hpp>
#include <bounty/escrow/memory_wallet.hpp>
#include <bounty/execution/state_machine.hpp>
#include <bounty/schema/primitives.hpp>
#include <bounty/storage/rocksdb/storage.hpp>
#include <bounty/store/wager_store.hpp>
#include <bounty/testing/common.hpp>
#include <bounty/testing/flaky_wallet.hpp>

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bounty::testing {

inline const auto kCreator = make_hash(1);
inline const auto kAcceptor = make_hash(50);
inline const auto kOutsider = make_hash(100);
inline const auto kModerator = make_hash(150);
inline constexpr auto kInitialBalance = bounty::schema::amount_t{100'000};

/// Fresh database, funded in-process wallet, ledger and state machine. The
/// ledger talks to the wallet through a `flaky_wallet` that passes every call
/// through until told to fail one operation.
class wager_fixture final {
 public:
  explicit wager_fixture(
      const std::string_view db_prefix,
      bounty::config::engine_config config = bounty::config::engine_config{})
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{bounty::storage::make_storage<
            bounty::storage::rocksdb_storage_tag>(db_path_)},
        store_{encoder_, storage_},
        flaky_{wallet_},
        ledger_{flaky_, store_},
        machine_{store_, ledger_, config, clock_.as_clock(),
                 [this](const bounty::schema::wager_event_t& event) {
                   {
                     auto lock = std::scoped_lock{events_mutex_};
                     published_.push_back(event);
                   }
                   if (on_event_) {
                     on_event_(event);
                   }
                 }} {
    wallet_.deposit(kCreator, kInitialBalance);
    wallet_.deposit(kAcceptor, kInitialBalance);
  }

  wager_fixture(const wager_fixture&) = delete;
  wager_fixture& operator=(const wager_fixture&) = delete;
  wager_fixture(wager_fixture&&) = delete;
  wager_fixture& operator=(wager_fixture&&) = delete;

  ~wager_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  manual_clock& clock() { return clock_; }
  bounty::store::wager_store& store() { return store_; }
  bounty::escrow::memory_wallet& wallet() { return wallet_; }
  flaky_wallet& flaky() { return flaky_; }
  bounty::escrow::escrow_ledger& ledger() { return ledger_; }
  bounty::execution::state_machine& machine() { return machine_; }

  /// Extra sink callback, run after the event is recorded.
  void on_event(
      std::function<void(const bounty::schema::wager_event_t&)> callback) {
    on_event_ = std::move(callback);
  }

  std::vector<bounty::schema::wager_event_t> published() {
    auto lock = std::scoped_lock{events_mutex_};
    return published_;
  }

  bounty::schema::create_wager_t make_request(
      const bounty::schema::amount_t stake = 1000,
      std::optional<bounty::schema::account_id_t> target = std::nullopt) const {
    return bounty::schema::create_wager_t{
        .creator = kCreator,
        .stake_amount = stake,
        .game = "valorant",
        .target_user = target,
        .title = "1v1 aim duel",
        .description = "first to 13 rounds"};
  }

  bounty::schema::wager_id_t create_open(
      const bounty::schema::amount_t stake = 1000) {
    auto result = machine_.create(make_request(stake));
    return result.snapshot->wager.wager_id;
  }

  bounty::schema::wager_id_t create_in_progress(
      const bounty::schema::amount_t stake = 1000) {
    auto wager_id = create_open(stake);
    machine_.accept(wager_id, kAcceptor);
    machine_.start(wager_id, kCreator);
    return wager_id;
  }

  bounty::schema::wager_result_t submit(
      const bounty::schema::wager_id_t& wager_id,
      const bounty::schema::account_id_t& submitter,
      const bounty::schema::account_id_t& claimed_winner) {
    return machine_.submit_proof(bounty::schema::submit_proof_t{
        .wager_id = wager_id,
        .submitter = submitter,
        .claimed_winner = claimed_winner,
        .evidence = bounty::schema::proof_evidence_t{
            .url = "https://clips.example.com/match/42",
            .type = bounty::schema::proof_type_t::video,
            .description = "final round"}});
  }

  /// Wager in PENDING_RESULT with the creator claiming victory.
  bounty::schema::wager_id_t create_pending_result(
      const bounty::schema::amount_t stake = 1000) {
    auto wager_id = create_in_progress(stake);
    submit(wager_id, kCreator, kCreator);
    return wager_id;
  }

  static std::string long_reason() {
    return "The final scoreboard screenshot was edited; the replay shows "
           "the acceptor winning the deciding round.";
  }

 private:
  std::string db_path_;
  manual_clock clock_;
  bounty::store::wager_store::encoder_t encoder_;
  bounty::storage::storage<bounty::storage::rocksdb_storage_tag> storage_;
  bounty::store::wager_store store_;
  bounty::escrow::memory_wallet wallet_;
  flaky_wallet flaky_;
  bounty::escrow::escrow_ledger ledger_;
  std::mutex events_mutex_;
  std::vector<bounty::schema::wager_event_t> published_;
  std::function<void(const bounty::schema::wager_event_t&)> on_event_;
  bounty::execution::state_machine machine_;
};

}  // namespace bounty::testing
