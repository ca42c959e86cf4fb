#include <bounty/schema/wager_error_code.hpp>
#include <bounty/testing/wager_fixture.hpp>
#include <gtest/gtest.h>

#include <optional>

using namespace bounty::schema;
using namespace bounty::testing;

TEST(state_machine, create_holds_stake_and_persists_open_wager) {
  auto fixture = wager_fixture{"bounty_sm_create"};
  auto result = fixture.machine().create(fixture.make_request(1000));

  ASSERT_TRUE(result.ok()) << result.log;
  ASSERT_TRUE(result.snapshot.has_value());
  const auto& wager = result.snapshot->wager;
  EXPECT_EQ(wager.status, wager_status_t::open);
  EXPECT_EQ(wager.parties.creator, kCreator);
  EXPECT_FALSE(wager.parties.acceptor.has_value());
  EXPECT_FALSE(wager.parties.winner.has_value());
  EXPECT_FALSE(wager.settlement.has_value());
  EXPECT_EQ(wager.timeline.created_at, kStartTime);
  EXPECT_EQ(wager.timeline.expires_at,
            kStartTime + bounty::common::hours(72));
  EXPECT_FALSE(result.snapshot->is_expired);
  EXPECT_FALSE(result.snapshot->can_dispute);

  auto balance = fixture.wallet().balance(kCreator);
  EXPECT_EQ(balance.available, kInitialBalance - 1000);
  EXPECT_EQ(balance.escrow, 1000u);

  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, wager_event_type_t::wager_created);
  EXPECT_EQ(fixture.published().size(), 1u);

  auto journal = fixture.store().load_journal(wager.wager_id);
  ASSERT_EQ(journal.size(), 1u);
  EXPECT_EQ(journal[0].operation, escrow_operation_t::hold);
  EXPECT_EQ(journal[0].amount, 1000u);
}

TEST(state_machine, create_assigns_distinct_ids) {
  auto fixture = wager_fixture{"bounty_sm_ids"};
  auto first = fixture.create_open();
  auto second = fixture.create_open();
  EXPECT_NE(first, second);
}

TEST(state_machine, create_rejects_stake_outside_bounds) {
  auto fixture = wager_fixture{"bounty_sm_stake"};

  auto low = fixture.machine().create(fixture.make_request(99));
  EXPECT_EQ(low.code, wager_error_code::invalid_stake);
  EXPECT_EQ(low.category, error_category_t::validation);
  EXPECT_FALSE(low.snapshot.has_value());

  auto high = fixture.machine().create(fixture.make_request(50001));
  EXPECT_EQ(high.code, wager_error_code::invalid_stake);

  EXPECT_TRUE(fixture.machine().create(fixture.make_request(100)).ok());
  EXPECT_TRUE(fixture.machine().create(fixture.make_request(50000)).ok());

  EXPECT_EQ(fixture.wallet().balance(kCreator).escrow, 50100u);
}

TEST(state_machine, create_rejects_challenge_targeting_creator) {
  auto fixture = wager_fixture{"bounty_sm_self"};
  auto result = fixture.machine().create(fixture.make_request(1000, kCreator));
  EXPECT_EQ(result.code, wager_error_code::self_challenge);
  EXPECT_EQ(fixture.wallet().balance(kCreator).available, kInitialBalance);
}

TEST(state_machine, create_requires_game_and_title) {
  auto fixture = wager_fixture{"bounty_sm_title"};
  auto request = fixture.make_request();
  request.title.clear();
  EXPECT_EQ(fixture.machine().create(request).code,
            wager_error_code::invalid_request);
}

TEST(state_machine, create_without_funds_leaves_no_wager) {
  auto fixture = wager_fixture{"bounty_sm_funds"};
  auto request = fixture.make_request(1000);
  request.creator = kOutsider;

  auto result = fixture.machine().create(request);
  EXPECT_EQ(result.code, wager_error_code::escrow_hold_failed);
  EXPECT_EQ(result.category, error_category_t::escrow);
  EXPECT_TRUE(fixture.machine().list_active(kOutsider).empty());
  EXPECT_TRUE(
      fixture.store().list_wager_ids_by_status(wager_status_t::open).empty());
  EXPECT_TRUE(fixture.published().empty());
}

TEST(state_machine, create_reports_unavailable_ledger) {
  auto fixture = wager_fixture{"bounty_sm_ledger_down"};
  fixture.wallet().set_available(false);
  auto result = fixture.machine().create(fixture.make_request());
  EXPECT_EQ(result.code, wager_error_code::ledger_unavailable);
  EXPECT_EQ(result.category, error_category_t::escrow);
}

TEST(state_machine, create_enforces_rate_limit_per_window) {
  auto config = bounty::config::engine_config{};
  config.max_created_per_window = 2;
  auto fixture = wager_fixture{"bounty_sm_rate", config};

  EXPECT_TRUE(fixture.machine().create(fixture.make_request()).ok());
  EXPECT_TRUE(fixture.machine().create(fixture.make_request()).ok());
  EXPECT_EQ(fixture.machine().create(fixture.make_request()).code,
            wager_error_code::rate_limited);

  // A wager created exactly one window ago still counts.
  fixture.clock().advance(bounty::common::hours(24));
  EXPECT_EQ(fixture.machine().create(fixture.make_request()).code,
            wager_error_code::rate_limited);

  fixture.clock().advance(1);
  EXPECT_TRUE(fixture.machine().create(fixture.make_request()).ok());
}

TEST(state_machine, accept_records_acceptance) {
  auto fixture = wager_fixture{"bounty_sm_accept"};
  auto wager_id = fixture.create_open();
  fixture.clock().advance(1000);

  auto result = fixture.machine().accept(wager_id, kAcceptor);
  ASSERT_TRUE(result.ok()) << result.log;
  const auto& snapshot = *result.snapshot;
  EXPECT_EQ(snapshot.wager.status, wager_status_t::accepted);
  EXPECT_EQ(snapshot.wager.parties.acceptor, kAcceptor);
  EXPECT_EQ(snapshot.wager.timeline.accepted_at, kStartTime + 1000);
  ASSERT_TRUE(snapshot.acceptance.has_value());
  EXPECT_EQ(snapshot.acceptance->acceptor, kAcceptor);
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, wager_event_type_t::wager_accepted);
}

TEST(state_machine, accept_twice_by_same_user_is_a_no_op) {
  auto fixture = wager_fixture{"bounty_sm_accept_twice"};
  auto wager_id = fixture.create_open();
  ASSERT_TRUE(fixture.machine().accept(wager_id, kAcceptor).ok());
  fixture.clock().advance(5000);

  auto again = fixture.machine().accept(wager_id, kAcceptor);
  ASSERT_TRUE(again.ok());
  EXPECT_TRUE(again.events.empty());
  EXPECT_EQ(again.snapshot->wager.timeline.accepted_at, kStartTime);
  EXPECT_EQ(fixture.store().load_acceptance(wager_id)->accepted_at,
            kStartTime);
}

TEST(state_machine, accept_by_second_user_conflicts) {
  auto fixture = wager_fixture{"bounty_sm_accept_other"};
  auto wager_id = fixture.create_open();
  ASSERT_TRUE(fixture.machine().accept(wager_id, kAcceptor).ok());

  auto result = fixture.machine().accept(wager_id, kOutsider);
  EXPECT_EQ(result.code, wager_error_code::already_accepted);
  EXPECT_EQ(result.category, error_category_t::state_conflict);
  ASSERT_TRUE(result.snapshot.has_value());
  EXPECT_EQ(result.snapshot->wager.parties.acceptor, kAcceptor);
}

TEST(state_machine, accept_rejects_creator_and_foreign_target) {
  auto fixture = wager_fixture{"bounty_sm_accept_target"};
  auto open = fixture.create_open();
  EXPECT_EQ(fixture.machine().accept(open, kCreator).code,
            wager_error_code::self_challenge);

  auto targeted =
      fixture.machine().create(fixture.make_request(1000, kAcceptor));
  auto targeted_id = targeted.snapshot->wager.wager_id;
  EXPECT_EQ(fixture.machine().accept(targeted_id, kOutsider).code,
            wager_error_code::target_mismatch);
  EXPECT_TRUE(fixture.machine().accept(targeted_id, kAcceptor).ok());
}

TEST(state_machine, accept_enforces_active_limit) {
  auto config = bounty::config::engine_config{};
  config.max_active_accepted = 1;
  auto fixture = wager_fixture{"bounty_sm_active", config};
  auto first = fixture.create_open();
  auto second = fixture.create_open();

  ASSERT_TRUE(fixture.machine().accept(first, kAcceptor).ok());
  EXPECT_EQ(fixture.machine().accept(second, kAcceptor).code,
            wager_error_code::active_limit_reached);

  ASSERT_TRUE(fixture.machine().start(first, kCreator).ok());
  EXPECT_EQ(fixture.machine().accept(second, kAcceptor).code,
            wager_error_code::active_limit_reached);
  ASSERT_TRUE(fixture.submit(first, kCreator, kCreator).ok());
  EXPECT_EQ(fixture.machine().accept(second, kAcceptor).code,
            wager_error_code::active_limit_reached);

  // A disputed wager no longer counts against the acceptor.
  ASSERT_TRUE(fixture.machine()
                  .open_dispute(first, kAcceptor, wager_fixture::long_reason())
                  .ok());
  ASSERT_EQ(fixture.store().load_wager(first)->status,
            wager_status_t::disputed);
  EXPECT_TRUE(fixture.machine().accept(second, kAcceptor).ok());
}

TEST(state_machine, event_sink_may_call_back_into_the_machine) {
  auto fixture = wager_fixture{"bounty_sm_reentrant_sink"};
  auto seen = std::optional<wager_status_t>{};
  auto started = std::optional<wager_error_code>{};
  fixture.on_event([&](const wager_event_t& event) {
    if (event.type != wager_event_type_t::wager_accepted) {
      return;
    }
    seen = fixture.machine().get(event.wager_id).snapshot->wager.status;
    started = fixture.machine().start(event.wager_id, kCreator).code;
  });

  auto wager_id = fixture.create_open();
  auto accepted = fixture.machine().accept(wager_id, kAcceptor);
  ASSERT_TRUE(accepted.ok()) << accepted.log;
  EXPECT_EQ(accepted.snapshot->wager.status, wager_status_t::accepted);
  EXPECT_EQ(seen, wager_status_t::accepted);
  EXPECT_EQ(started, wager_error_code::ok);
  EXPECT_EQ(fixture.store().load_wager(wager_id)->status,
            wager_status_t::in_progress);
  EXPECT_EQ(fixture.published().back().type,
            wager_event_type_t::wager_started);
}

TEST(state_machine, unknown_ids_report_not_found) {
  auto fixture = wager_fixture{"bounty_sm_missing"};
  auto unknown = make_hash(200);
  auto accept = fixture.machine().accept(unknown, kAcceptor);
  EXPECT_EQ(accept.code, wager_error_code::wager_missing);
  EXPECT_EQ(accept.category, error_category_t::not_found);
  EXPECT_EQ(fixture.machine().get(unknown).code,
            wager_error_code::wager_missing);
  EXPECT_EQ(fixture.machine()
                .resolve_dispute(unknown, kModerator,
                                 dispute_outcome_t::void_wager, "")
                .code,
            wager_error_code::dispute_missing);
}

TEST(state_machine, start_moves_accepted_wager_in_progress) {
  auto fixture = wager_fixture{"bounty_sm_start"};
  auto wager_id = fixture.create_open();
  EXPECT_EQ(fixture.machine().start(wager_id, kCreator).code,
            wager_error_code::invalid_transition);

  ASSERT_TRUE(fixture.machine().accept(wager_id, kAcceptor).ok());
  EXPECT_EQ(fixture.machine().start(wager_id, kOutsider).code,
            wager_error_code::not_participant);

  fixture.clock().advance(2000);
  auto result = fixture.machine().start(wager_id, kAcceptor);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.snapshot->wager.status, wager_status_t::in_progress);
  EXPECT_EQ(result.snapshot->wager.timeline.started_at, kStartTime + 2000);
  EXPECT_EQ(fixture.wallet().balance(kCreator).escrow, 1000u);
}

TEST(state_machine, cancel_refunds_creator) {
  auto fixture = wager_fixture{"bounty_sm_cancel"};
  auto wager_id = fixture.create_open(500);

  EXPECT_EQ(fixture.machine().cancel(wager_id, kAcceptor).code,
            wager_error_code::not_creator);

  auto result = fixture.machine().cancel(wager_id, kCreator);
  ASSERT_TRUE(result.ok()) << result.log;
  const auto& wager = result.snapshot->wager;
  EXPECT_EQ(wager.status, wager_status_t::cancelled);
  ASSERT_TRUE(wager.settlement.has_value());
  EXPECT_EQ(wager.settlement->outcome, settlement_outcome_t::cancelled);
  EXPECT_EQ(wager.settlement->refunded_amount, 500u);
  EXPECT_EQ(wager.settlement->payout_amount, 0u);
  EXPECT_EQ(wager.settlement->platform_fee, 0u);
  EXPECT_EQ(wager.timeline.completed_at, kStartTime);

  auto balance = fixture.wallet().balance(kCreator);
  EXPECT_EQ(balance.available, kInitialBalance);
  EXPECT_EQ(balance.escrow, 0u);
  EXPECT_EQ(fixture.wallet().platform_balance(), 0u);
}

TEST(state_machine, cancel_after_acceptance_conflicts) {
  auto fixture = wager_fixture{"bounty_sm_cancel_late"};
  auto wager_id = fixture.create_open();
  ASSERT_TRUE(fixture.machine().accept(wager_id, kAcceptor).ok());

  auto result = fixture.machine().cancel(wager_id, kCreator);
  EXPECT_EQ(result.code, wager_error_code::invalid_transition);
  ASSERT_TRUE(result.snapshot.has_value());
  EXPECT_EQ(result.snapshot->wager.status, wager_status_t::accepted);
  EXPECT_EQ(fixture.wallet().balance(kCreator).escrow, 1000u);
}

TEST(state_machine, expire_uses_strict_deadline) {
  auto fixture = wager_fixture{"bounty_sm_expire"};
  auto wager_id = fixture.create_open();

  fixture.clock().advance(bounty::common::hours(72));
  EXPECT_EQ(fixture.machine().expire(wager_id).code,
            wager_error_code::wager_not_expired);

  fixture.clock().advance(1);
  auto result = fixture.machine().expire(wager_id);
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(result.snapshot->wager.status, wager_status_t::expired);
  EXPECT_EQ(result.snapshot->wager.settlement->outcome,
            settlement_outcome_t::expired);
  EXPECT_TRUE(result.snapshot->is_expired);
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, wager_event_type_t::wager_expired);
}

TEST(state_machine, expire_twice_refunds_once) {
  auto fixture = wager_fixture{"bounty_sm_expire_twice"};
  auto wager_id = fixture.create_open();
  fixture.clock().advance(bounty::common::hours(72) + 1);

  ASSERT_TRUE(fixture.machine().expire(wager_id).ok());
  auto again = fixture.machine().expire(wager_id);
  ASSERT_TRUE(again.ok());
  EXPECT_TRUE(again.events.empty());

  EXPECT_EQ(fixture.wallet().balance(kCreator).available, kInitialBalance);
  // hold + refund
  EXPECT_EQ(fixture.wallet().processed_operations(), 2u);
}

TEST(state_machine, reads_report_staleness_without_mutating) {
  auto fixture = wager_fixture{"bounty_sm_reads"};
  auto wager_id = fixture.create_open();
  fixture.clock().advance(bounty::common::hours(72) + 1);

  auto result = fixture.machine().get(wager_id);
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.snapshot->is_expired);
  EXPECT_EQ(result.snapshot->wager.status, wager_status_t::open);
  EXPECT_EQ(fixture.store().load_wager(wager_id)->status,
            wager_status_t::open);
  EXPECT_EQ(fixture.wallet().balance(kCreator).escrow, 1000u);
}

TEST(state_machine, lazy_expiry_on_accept) {
  auto fixture = wager_fixture{"bounty_sm_lazy_accept"};
  auto wager_id = fixture.create_open();
  fixture.clock().advance(bounty::common::hours(72) + 1);

  auto result = fixture.machine().accept(wager_id, kAcceptor);
  EXPECT_EQ(result.code, wager_error_code::wager_expired);
  EXPECT_EQ(result.category, error_category_t::state_conflict);
  ASSERT_TRUE(result.snapshot.has_value());
  EXPECT_EQ(result.snapshot->wager.status, wager_status_t::expired);
  EXPECT_FALSE(result.snapshot->wager.parties.acceptor.has_value());
  EXPECT_FALSE(fixture.store().load_acceptance(wager_id).has_value());
  EXPECT_EQ(fixture.wallet().balance(kCreator).available, kInitialBalance);

  auto again = fixture.machine().accept(wager_id, kAcceptor);
  EXPECT_EQ(again.code, wager_error_code::wager_expired);
  EXPECT_TRUE(again.events.empty());
}

TEST(state_machine, lazy_expiry_on_cancel) {
  auto fixture = wager_fixture{"bounty_sm_lazy_cancel"};
  auto wager_id = fixture.create_open();
  fixture.clock().advance(bounty::common::hours(72) + 1);

  auto result = fixture.machine().cancel(wager_id, kCreator);
  EXPECT_EQ(result.code, wager_error_code::wager_expired);
  EXPECT_EQ(result.snapshot->wager.status, wager_status_t::expired);
  EXPECT_EQ(result.snapshot->wager.settlement->outcome,
            settlement_outcome_t::expired);
}

TEST(state_machine, submit_proof_validates_inputs) {
  auto fixture = wager_fixture{"bounty_sm_proof_inputs"};
  auto wager_id = fixture.create_in_progress();

  auto bad_url = submit_proof_t{.wager_id = wager_id,
                                .submitter = kCreator,
                                .claimed_winner = kCreator,
                                .evidence = proof_evidence_t{
                                    .url = "ftp://example.com/clip"}};
  EXPECT_EQ(fixture.machine().submit_proof(bad_url).code,
            wager_error_code::malformed_proof);

  EXPECT_EQ(fixture.submit(wager_id, kOutsider, kCreator).code,
            wager_error_code::not_participant);
  EXPECT_EQ(fixture.submit(wager_id, kCreator, kOutsider).code,
            wager_error_code::invalid_claimed_winner);
  EXPECT_EQ(fixture.store().load_wager(wager_id)->status,
            wager_status_t::in_progress);
}

TEST(state_machine, submit_proof_requires_started_wager) {
  auto fixture = wager_fixture{"bounty_sm_proof_state"};
  auto wager_id = fixture.create_open();
  ASSERT_TRUE(fixture.machine().accept(wager_id, kAcceptor).ok());

  auto result = fixture.submit(wager_id, kCreator, kCreator);
  EXPECT_EQ(result.code, wager_error_code::invalid_transition);
  EXPECT_EQ(result.snapshot->wager.status, wager_status_t::accepted);
}

TEST(state_machine, first_proof_opens_dispute_window) {
  auto fixture = wager_fixture{"bounty_sm_first_proof"};
  auto wager_id = fixture.create_in_progress();
  fixture.clock().advance(10'000);

  auto result = fixture.submit(wager_id, kCreator, kCreator);
  ASSERT_TRUE(result.ok()) << result.log;
  const auto& snapshot = *result.snapshot;
  EXPECT_EQ(snapshot.wager.status, wager_status_t::pending_result);
  EXPECT_EQ(snapshot.wager.timeline.result_submitted_at, kStartTime + 10'000);
  EXPECT_EQ(snapshot.dispute_deadline,
            kStartTime + 10'000 + bounty::common::hours(24));
  EXPECT_TRUE(snapshot.can_dispute);
  ASSERT_EQ(snapshot.proofs.size(), 1u);
  EXPECT_EQ(snapshot.proofs[0].sequence, 0u);
  EXPECT_FALSE(snapshot.wager.parties.winner.has_value());
}

TEST(state_machine, second_proof_from_same_participant_is_rejected) {
  auto fixture = wager_fixture{"bounty_sm_dup_proof"};
  auto wager_id = fixture.create_pending_result();

  auto result = fixture.submit(wager_id, kCreator, kAcceptor);
  EXPECT_EQ(result.code, wager_error_code::duplicate_proof);
  EXPECT_EQ(result.category, error_category_t::state_conflict);
  EXPECT_EQ(fixture.store().load_proofs(wager_id).size(), 1u);
}

TEST(state_machine, illegal_edges_leave_state_unchanged) {
  auto fixture = wager_fixture{"bounty_sm_edges"};
  auto wager_id = fixture.create_in_progress();

  auto confirm = fixture.machine().confirm_result(wager_id, kAcceptor);
  EXPECT_EQ(confirm.code, wager_error_code::invalid_transition);
  auto dispute = fixture.machine().open_dispute(wager_id, kAcceptor,
                                                wager_fixture::long_reason());
  EXPECT_EQ(dispute.code, wager_error_code::invalid_transition);
  auto start = fixture.machine().start(wager_id, kCreator);
  EXPECT_EQ(start.code, wager_error_code::invalid_transition);
  auto cancel = fixture.machine().cancel(wager_id, kCreator);
  EXPECT_EQ(cancel.code, wager_error_code::invalid_transition);
  auto expire = fixture.machine().expire(wager_id);
  EXPECT_EQ(expire.code, wager_error_code::invalid_transition);
  auto finalize = fixture.machine().finalize(wager_id);
  EXPECT_EQ(finalize.code, wager_error_code::invalid_transition);

  for (const auto& result : {confirm, dispute, start, cancel, expire, finalize}) {
    EXPECT_EQ(result.category, error_category_t::state_conflict);
    ASSERT_TRUE(result.snapshot.has_value());
    EXPECT_EQ(result.snapshot->wager.status, wager_status_t::in_progress);
  }
  EXPECT_EQ(fixture.store().load_wager(wager_id)->status,
            wager_status_t::in_progress);
}
