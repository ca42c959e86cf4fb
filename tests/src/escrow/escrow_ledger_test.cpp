#include <bounty/escrow/escrow_ledger.hpp>
#include <bounty/escrow/memory_wallet.hpp>
#include <bounty/testing/common.hpp>
#include <bounty/testing/flaky_wallet.hpp>
#include <gtest/gtest.h>

#include <string>

using namespace bounty::schema;
using namespace bounty::testing;
using bounty::escrow::escrow_ledger;
using bounty::escrow::memory_wallet;
using bounty::escrow::wallet_status_t;
using bounty::store::wager_store;

namespace {

class ledger_fixture final {
 public:
  explicit ledger_fixture(const std::string_view prefix)
      : db_path_{make_db_path(prefix)},
        storage_{bounty::storage::make_storage<
            bounty::storage::rocksdb_storage_tag>(db_path_)},
        store_{encoder_, storage_},
        ledger_{wallet_, store_} {
    wallet_.deposit(make_hash(1), 10'000);
  }
  ~ledger_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  wager_store& store() { return store_; }
  memory_wallet& wallet() { return wallet_; }
  escrow_ledger& ledger() { return ledger_; }

 private:
  std::string db_path_;
  wager_store::encoder_t encoder_;
  wager_store::storage_t storage_;
  wager_store store_;
  memory_wallet wallet_;
  escrow_ledger ledger_;
};

const auto kWager = make_hash(10);
const auto kHolder = make_hash(1);
const auto kWinner = make_hash(50);

}  // namespace

TEST(escrow_ledger, idempotency_key_depends_on_wager_and_operation) {
  auto hold = bounty::escrow::make_idempotency_key(kWager,
                                                   escrow_operation_t::hold);
  EXPECT_EQ(hold, bounty::escrow::make_idempotency_key(
                      kWager, escrow_operation_t::hold));
  EXPECT_NE(hold, bounty::escrow::make_idempotency_key(
                      kWager, escrow_operation_t::refund));
  EXPECT_NE(hold, bounty::escrow::make_idempotency_key(
                      make_hash(11), escrow_operation_t::hold));
}

TEST(escrow_ledger, hold_stages_journal_entry) {
  auto fixture = ledger_fixture{"bounty_ledger_hold"};
  auto tx = wager_store::transaction{};
  ASSERT_EQ(fixture.ledger().hold(tx, kWager, kHolder, 1000, kStartTime),
            wager_error_code::ok);

  auto entries = tx.journal_entries();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].operation, escrow_operation_t::hold);
  EXPECT_EQ(entries[0].amount, 1000u);
  EXPECT_EQ(entries[0].from, kHolder);
  EXPECT_EQ(entries[0].state, escrow_entry_state_t::applied);
  EXPECT_EQ(entries[0].recorded_at, kStartTime);
  EXPECT_EQ(entries[0].applied_at, kStartTime);
  EXPECT_EQ(entries[0].idempotency_key,
            bounty::escrow::make_idempotency_key(kWager,
                                                 escrow_operation_t::hold));
  EXPECT_EQ(fixture.wallet().balance(kHolder).escrow, 1000u);

  // Not yet committed, but the transaction already records it.
  ASSERT_EQ(fixture.ledger().hold(tx, kWager, kHolder, 1000, kStartTime),
            wager_error_code::ok);
  EXPECT_EQ(tx.journal_entries().size(), 1u);
  EXPECT_EQ(fixture.wallet().balance(kHolder).escrow, 1000u);
}

TEST(escrow_ledger, settlement_calls_wait_for_dispatch) {
  auto fixture = ledger_fixture{"bounty_ledger_outbox"};
  auto hold = wager_store::transaction{};
  ASSERT_EQ(fixture.ledger().hold(hold, kWager, kHolder, 1000, kStartTime),
            wager_error_code::ok);
  ASSERT_EQ(fixture.store().commit(hold),
            bounty::store::commit_status_t::committed);

  auto tx = wager_store::transaction{};
  fixture.ledger().refund(tx, kWager, kHolder, 1000, kStartTime);
  auto entries = tx.journal_entries();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].state, escrow_entry_state_t::pending);
  EXPECT_FALSE(entries[0].applied_at.has_value());
  EXPECT_EQ(fixture.wallet().balance(kHolder).escrow, 1000u);

  // Nothing committed yet, so there is nothing to send.
  EXPECT_EQ(fixture.ledger().dispatch(kWager, kStartTime + 5),
            wager_error_code::ok);
  EXPECT_EQ(fixture.wallet().processed_operations(), 1u);

  ASSERT_EQ(fixture.store().commit(tx),
            bounty::store::commit_status_t::committed);
  EXPECT_EQ(fixture.ledger().dispatch(kWager, kStartTime + 5),
            wager_error_code::ok);
  EXPECT_EQ(fixture.wallet().balance(kHolder).available, 10'000u);

  auto stored =
      fixture.store().load_journal_entry(kWager, escrow_operation_t::refund);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->state, escrow_entry_state_t::applied);
  EXPECT_EQ(stored->applied_at, kStartTime + 5);
}

TEST(escrow_ledger, committed_operation_is_never_repeated) {
  auto fixture = ledger_fixture{"bounty_ledger_committed"};
  auto hold = wager_store::transaction{};
  ASSERT_EQ(fixture.ledger().hold(hold, kWager, kHolder, 1000, kStartTime),
            wager_error_code::ok);
  ASSERT_EQ(fixture.store().commit(hold),
            bounty::store::commit_status_t::committed);

  auto refund = wager_store::transaction{};
  fixture.ledger().refund(refund, kWager, kHolder, 1000, kStartTime);
  ASSERT_EQ(fixture.store().commit(refund),
            bounty::store::commit_status_t::committed);
  ASSERT_EQ(fixture.ledger().dispatch(kWager, kStartTime),
            wager_error_code::ok);

  auto retry = wager_store::transaction{};
  fixture.ledger().refund(retry, kWager, kHolder, 1000, kStartTime);
  EXPECT_TRUE(retry.empty());
  ASSERT_EQ(fixture.ledger().dispatch(kWager, kStartTime),
            wager_error_code::ok);
  EXPECT_EQ(fixture.wallet().balance(kHolder).available, 10'000u);
  EXPECT_EQ(fixture.wallet().processed_operations(), 2u);
}

TEST(escrow_ledger, release_and_collect_split_the_escrow) {
  auto fixture = ledger_fixture{"bounty_ledger_release"};
  auto tx = wager_store::transaction{};
  ASSERT_EQ(fixture.ledger().hold(tx, kWager, kHolder, 1000, kStartTime),
            wager_error_code::ok);
  fixture.ledger().release(tx, kWager, kHolder, kWinner, 950, kStartTime);
  fixture.ledger().collect(tx, kWager, kHolder, 50, kStartTime);

  auto entries = tx.journal_entries();
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[1].to, kWinner);
  ASSERT_EQ(fixture.store().commit(tx),
            bounty::store::commit_status_t::committed);
  ASSERT_EQ(fixture.ledger().dispatch(kWager, kStartTime),
            wager_error_code::ok);

  EXPECT_EQ(fixture.wallet().balance(kHolder).escrow, 0u);
  EXPECT_EQ(fixture.wallet().balance(kHolder).available, 9000u);
  EXPECT_EQ(fixture.wallet().balance(kWinner).available, 950u);
  EXPECT_EQ(fixture.wallet().platform_balance(), 50u);
  for (const auto& entry : fixture.store().load_journal(kWager)) {
    EXPECT_EQ(entry.state, escrow_entry_state_t::applied);
  }
}

TEST(escrow_ledger, dispatch_resumes_after_a_failed_call) {
  auto fixture = ledger_fixture{"bounty_ledger_resume"};
  auto flaky = flaky_wallet{fixture.wallet()};
  auto ledger = escrow_ledger{flaky, fixture.store()};

  auto tx = wager_store::transaction{};
  ASSERT_EQ(ledger.hold(tx, kWager, kHolder, 1000, kStartTime),
            wager_error_code::ok);
  ledger.release(tx, kWager, kHolder, kWinner, 950, kStartTime);
  ledger.collect(tx, kWager, kHolder, 50, kStartTime);
  ASSERT_EQ(fixture.store().commit(tx),
            bounty::store::commit_status_t::committed);

  flaky.fail(escrow_operation_t::collect);
  EXPECT_EQ(ledger.dispatch(kWager, kStartTime + 1),
            wager_error_code::ledger_unavailable);
  EXPECT_EQ(fixture.wallet().balance(kWinner).available, 950u);
  EXPECT_EQ(fixture.wallet().platform_balance(), 0u);
  EXPECT_EQ(fixture.store()
                .load_journal_entry(kWager, escrow_operation_t::release)
                ->state,
            escrow_entry_state_t::applied);
  EXPECT_EQ(fixture.store()
                .load_journal_entry(kWager, escrow_operation_t::collect)
                ->state,
            escrow_entry_state_t::pending);

  flaky.heal();
  EXPECT_EQ(ledger.dispatch(kWager, kStartTime + 2), wager_error_code::ok);
  EXPECT_EQ(fixture.wallet().balance(kWinner).available, 950u);
  EXPECT_EQ(fixture.wallet().platform_balance(), 50u);
  EXPECT_EQ(fixture.wallet().processed_operations(), 3u);
  EXPECT_EQ(flaky.rejected_calls(), 1u);
}

TEST(escrow_ledger, wallet_failures_map_to_escrow_errors) {
  auto fixture = ledger_fixture{"bounty_ledger_failures"};
  auto tx = wager_store::transaction{};
  EXPECT_EQ(fixture.ledger().hold(tx, kWager, kWinner, 1000, kStartTime),
            wager_error_code::escrow_hold_failed);
  EXPECT_TRUE(tx.empty());

  fixture.wallet().set_available(false);
  EXPECT_EQ(fixture.ledger().hold(tx, kWager, kHolder, 1000, kStartTime),
            wager_error_code::ledger_unavailable);
  EXPECT_TRUE(tx.empty());
  EXPECT_EQ(fixture.wallet().balance(kHolder).available, 10'000u);

  fixture.wallet().set_available(true);
  ASSERT_EQ(fixture.ledger().hold(tx, kWager, kHolder, 1000, kStartTime),
            wager_error_code::ok);
  fixture.ledger().refund(tx, kWager, kHolder, 1000, kStartTime);
  ASSERT_EQ(fixture.store().commit(tx),
            bounty::store::commit_status_t::committed);
  fixture.wallet().set_available(false);
  EXPECT_EQ(fixture.ledger().dispatch(kWager, kStartTime),
            wager_error_code::ledger_unavailable);
  EXPECT_EQ(fixture.wallet().balance(kHolder).escrow, 1000u);
}

TEST(memory_wallet, repeated_key_moves_money_once) {
  auto wallet = memory_wallet{};
  wallet.deposit(kHolder, 500);
  auto key = make_hash(99);
  EXPECT_EQ(wallet.hold(key, kHolder, 300), wallet_status_t::ok);
  EXPECT_EQ(wallet.hold(key, kHolder, 300), wallet_status_t::ok);
  EXPECT_EQ(wallet.balance(kHolder).available, 200u);
  EXPECT_EQ(wallet.balance(kHolder).escrow, 300u);
  EXPECT_EQ(wallet.processed_operations(), 1u);

  EXPECT_EQ(wallet.hold(make_hash(98), kHolder, 300),
            wallet_status_t::insufficient_funds);
  EXPECT_EQ(wallet.balance(make_hash(77)).available, 0u);
  EXPECT_EQ(bounty::escrow::to_string(wallet_status_t::insufficient_funds),
            "insufficient_funds");
}
