#include <spdlog/spdlog.h>
#include <algorithm>
#include <bounty/blake3/hash.hpp>
#include <bounty/execution/state_machine.hpp>
#include <bounty/schema/encoding/scale/encoder.hpp>
#include <bounty/settlement/proof_settlement.hpp>
#include <cmath>
#include <iterator>
#include <tuple>
#include <utility>

using namespace bounty::schema;

namespace {

using encoder_t =
    bounty::schema::encoding::encoder<bounty::schema::encoding::scale_encoder_tag>;

wager_id_t make_wager_id(const account_id_t& creator,
                         const timestamp_milliseconds_t created_at,
                         const uint64_t sequence) {
  auto material = bytes_t{std::begin(creator), std::end(creator)};
  auto encoder = encoder_t{};
  encoder.encode(std::tuple{created_at, sequence}, material);
  return bounty::blake3::hash(bytes_view_t{material.data(), material.size()});
}

dispute_id_t make_dispute_id(const wager_id_t& wager_id) {
  auto material = make_bytes(std::string_view{"dispute"});
  material.insert(std::end(material), std::begin(wager_id), std::end(wager_id));
  return bounty::blake3::hash(bytes_view_t{material.data(), material.size()});
}

wager_event_t make_event(const wager_event_type_t type,
                         const wager_id_t& wager_id,
                         std::optional<account_id_t> actor,
                         std::optional<settlement_outcome_t> outcome,
                         const timestamp_milliseconds_t at) {
  return wager_event_t{.type = type,
                       .wager_id = wager_id,
                       .actor = std::move(actor),
                       .outcome = outcome,
                       .at = at};
}

bool is_valid_evidence_url(const std::string& url) {
  auto view = std::string_view{url};
  for (auto scheme : {std::string_view{"http://"}, std::string_view{"https://"}}) {
    if (view.starts_with(scheme) && view.size() > scheme.size()) {
      return true;
    }
  }
  return false;
}

size_t trimmed_length(const std::string& value) {
  constexpr auto kWhitespace = std::string_view{" \t\r\n"};
  auto first = value.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return 0;
  }
  auto last = value.find_last_not_of(kWhitespace);
  return last - first + 1;
}

wager_status_t terminal_status_for(const settlement_outcome_t outcome) {
  switch (outcome) {
    case settlement_outcome_t::cancelled:
      return wager_status_t::cancelled;
    case settlement_outcome_t::expired:
      return wager_status_t::expired;
    default:
      return wager_status_t::completed;
  }
}

wager_event_type_t settlement_event_for(const settlement_outcome_t outcome) {
  switch (outcome) {
    case settlement_outcome_t::cancelled:
      return wager_event_type_t::wager_cancelled;
    case settlement_outcome_t::expired:
      return wager_event_type_t::wager_expired;
    default:
      return wager_event_type_t::wager_settled;
  }
}

wager_error_code to_error_code(const bounty::store::commit_status_t status) {
  switch (status) {
    case bounty::store::commit_status_t::committed:
      return wager_error_code::ok;
    case bounty::store::commit_status_t::duplicate_acceptance:
      return wager_error_code::already_accepted;
    case bounty::store::commit_status_t::duplicate_proof:
      return wager_error_code::duplicate_proof;
    case bounty::store::commit_status_t::duplicate_dispute:
      return wager_error_code::dispute_exists;
    default:
      return wager_error_code::concurrent_modification;
  }
}

}  // namespace

namespace bounty::execution {

state_machine::state_machine(bounty::store::wager_store& store,
                             bounty::escrow::escrow_ledger& ledger,
                             bounty::config::engine_config config,
                             bounty::common::clock_t clock,
                             event_sink_t event_sink)
    : store_{store},
      ledger_{ledger},
      config_{std::move(config)},
      clock_{std::move(clock)},
      event_sink_{std::move(event_sink)} {
  if (!clock_) {
    clock_ = bounty::common::system_now;
  }
}

timestamp_milliseconds_t state_machine::now() const {
  return clock_();
}

std::optional<wager_id_t> state_machine::find_wager_for_dispute(
    const dispute_id_t& dispute_id) const {
  return store_.find_wager_for_dispute(dispute_id);
}

bool state_machine::dispute_window_closed(
    const wager_state_t& wager,
    const timestamp_milliseconds_t now) const {
  return wager.timeline.result_submitted_at.has_value() &&
         now > *wager.timeline.result_submitted_at + config_.dispute_window;
}

wager_snapshot_t state_machine::make_snapshot(
    const wager_state_t& wager,
    const timestamp_milliseconds_t now) const {
  auto snapshot = wager_snapshot_t{};
  snapshot.wager = wager;
  snapshot.acceptance = store_.load_acceptance(wager.wager_id);
  snapshot.proofs = store_.load_proofs(wager.wager_id);
  snapshot.dispute = store_.load_dispute(wager.wager_id);
  snapshot.is_expired =
      wager.status == wager_status_t::expired ||
      (wager.status == wager_status_t::open && now > wager.timeline.expires_at);
  if (wager.timeline.result_submitted_at.has_value()) {
    snapshot.dispute_deadline =
        *wager.timeline.result_submitted_at + config_.dispute_window;
  }
  snapshot.can_dispute = wager.status == wager_status_t::pending_result &&
                         !has_pending_settlement(wager) &&
                         !snapshot.dispute.has_value() &&
                         !dispute_window_closed(wager, now);
  return snapshot;
}

wager_result_t state_machine::success(
    const wager_state_t& wager,
    const timestamp_milliseconds_t now) const {
  auto result = wager_result_t{};
  result.snapshot = make_snapshot(wager, now);
  return result;
}

wager_result_t state_machine::reject(
    const wager_error_code code,
    std::string log,
    const std::optional<wager_state_t>& wager,
    const timestamp_milliseconds_t now) const {
  auto result = wager_result_t{};
  result.code = code;
  result.category = category_of(code);
  result.log = std::move(log);
  if (result.category == error_category_t::state_conflict &&
      wager.has_value()) {
    result.snapshot = make_snapshot(*wager, now);
  }
  if (result.category == error_category_t::escrow) {
    spdlog::warn("Rejected with {}: {}", to_string(code), result.log);
  } else {
    spdlog::debug("Rejected with {}: {}", to_string(code), result.log);
  }
  return result;
}

wager_result_t state_machine::publish(wager_result_t result) const {
  if (event_sink_) {
    for (const auto& event : result.events) {
      event_sink_(event);
    }
  }
  return result;
}

wager_result_t state_machine::commit(const transaction_t& tx,
                                     const wager_id_t& wager_id,
                                     std::vector<wager_event_t> events,
                                     const timestamp_milliseconds_t now) {
  auto status = store_.commit(tx);
  auto stored = store_.load_wager(wager_id);
  if (status != bounty::store::commit_status_t::committed) {
    return reject(to_error_code(status),
                  "store rejected the write: " +
                      std::string{bounty::store::to_string(status)},
                  stored, now);
  }
  if (!stored) {
    bounty::common::critical("committed wager could not be read back");
  }
  for (const auto& event : events) {
    spdlog::info("{} wager={} status={}", to_string(event.type),
                 to_hex(wager_id), to_string(stored->status));
  }
  auto result = success(*stored, now);
  result.events = std::move(events);
  return result;
}

wager_error_code state_machine::settle(
    transaction_t& tx,
    wager_state_t& wager,
    const settlement_outcome_t outcome,
    std::optional<account_id_t> winner,
    const timestamp_milliseconds_t now) {
  if (!is_legal_transition(wager.status, terminal_status_for(outcome))) {
    return wager_error_code::invalid_transition;
  }

  auto settlement = wager_settlement_t{.outcome = outcome};
  if (has_winner(outcome)) {
    if (!winner.has_value() || !is_participant(wager, *winner)) {
      return wager_error_code::invalid_claimed_winner;
    }
    auto split = bounty::settlement::split_stake(wager.stake_amount,
                                                 config_.fee_basis_points);
    ledger_.release(tx, wager.wager_id, wager.parties.creator, *winner,
                    split.payout_amount, now);
    if (split.platform_fee > 0) {
      ledger_.collect(tx, wager.wager_id, wager.parties.creator,
                      split.platform_fee, now);
    }
    settlement.payout_amount = split.payout_amount;
    settlement.platform_fee = split.platform_fee;
    wager.parties.winner = winner;
  } else {
    ledger_.refund(tx, wager.wager_id, wager.parties.creator,
                   wager.stake_amount, now);
    settlement.refunded_amount = wager.stake_amount;
  }
  wager.settlement = settlement;
  return wager_error_code::ok;
}

wager_result_t state_machine::record_settlement(
    const transaction_t& tx,
    const wager_state_t& wager,
    std::vector<wager_event_t> events,
    const timestamp_milliseconds_t now) {
  auto status = store_.commit(tx);
  if (status != bounty::store::commit_status_t::committed) {
    return reject(to_error_code(status),
                  "store rejected the settlement: " +
                      std::string{bounty::store::to_string(status)},
                  store_.load_wager(wager.wager_id), now);
  }
  return apply_settlement(wager, std::move(events), now);
}

wager_result_t state_machine::apply_settlement(
    wager_state_t wager,
    std::vector<wager_event_t> events,
    const timestamp_milliseconds_t now) {
  auto code = ledger_.dispatch(wager.wager_id, now);
  if (code != wager_error_code::ok) {
    return reject(code,
                  fmt::format("{} settlement recorded, ledger calls pending",
                              to_string(wager.settlement->outcome)),
                  wager, now);
  }
  auto previous = wager.status;
  wager.status = terminal_status_for(wager.settlement->outcome);
  wager.timeline.completed_at = now;

  auto tx = transaction_t{};
  tx.put_wager(wager, previous);
  return commit(tx, wager.wager_id, std::move(events), now);
}

wager_result_t state_machine::resume_settlement(
    const wager_state_t& wager,
    const wager_error_code code_after,
    const timestamp_milliseconds_t now) {
  auto outcome = wager.settlement->outcome;
  spdlog::info("Resuming {} settlement of wager {}", to_string(outcome),
               to_hex(wager.wager_id));
  auto result = apply_settlement(
      wager,
      {make_event(settlement_event_for(outcome), wager.wager_id, std::nullopt,
                  outcome, now)},
      now);
  if (!result.ok() || code_after == wager_error_code::ok) {
    return result;
  }
  result.code = code_after;
  result.category = category_of(code_after);
  result.log = fmt::format("wager was settled as {}", to_string(outcome));
  return result;
}

wager_result_t state_machine::expire_locked(
    wager_state_t wager,
    const timestamp_milliseconds_t now) {
  auto tx = transaction_t{};
  auto code = settle(tx, wager, settlement_outcome_t::expired, std::nullopt,
                     now);
  if (code != wager_error_code::ok) {
    return reject(code, "expiry refund failed", store_.load_wager(wager.wager_id),
                  now);
  }
  tx.put_wager(wager, wager_status_t::open);
  return record_settlement(
      tx, wager,
      {make_event(wager_event_type_t::wager_expired, wager.wager_id,
                  std::nullopt, settlement_outcome_t::expired, now)},
      now);
}

wager_result_t state_machine::finalize_by_inaction_locked(
    wager_state_t wager,
    const timestamp_milliseconds_t now) {
  auto proofs = store_.load_proofs(wager.wager_id);
  auto winner = bounty::settlement::default_winner(proofs);
  if (!winner) {
    return reject(wager_error_code::invalid_transition,
                  "pending result without a proof", wager, now);
  }
  auto tx = transaction_t{};
  auto code = settle(tx, wager, settlement_outcome_t::default_by_inaction,
                     winner, now);
  if (code != wager_error_code::ok) {
    return reject(code, "default settlement failed",
                  store_.load_wager(wager.wager_id), now);
  }
  tx.put_wager(wager, wager.status);
  return record_settlement(
      tx, wager,
      {make_event(wager_event_type_t::wager_settled, wager.wager_id,
                  std::nullopt, settlement_outcome_t::default_by_inaction,
                  now)},
      now);
}

wager_result_t state_machine::create(const create_wager_t& request) {
  return publish(execute_create(request));
}

wager_result_t state_machine::accept(const wager_id_t& wager_id,
                                     const account_id_t& acceptor) {
  return publish(execute_accept(wager_id, acceptor));
}

wager_result_t state_machine::start(const wager_id_t& wager_id,
                                    const account_id_t& actor) {
  return publish(execute_start(wager_id, actor));
}

wager_result_t state_machine::submit_proof(const submit_proof_t& request) {
  return publish(execute_submit_proof(request));
}

wager_result_t state_machine::confirm_result(const wager_id_t& wager_id,
                                             const account_id_t& actor) {
  return publish(execute_confirm_result(wager_id, actor));
}

wager_result_t state_machine::open_dispute(const wager_id_t& wager_id,
                                           const account_id_t& disputer,
                                           const std::string& reason) {
  return publish(execute_open_dispute(wager_id, disputer, reason));
}

wager_result_t state_machine::assign_moderator(const dispute_id_t& dispute_id,
                                               const account_id_t& moderator) {
  return publish(execute_assign_moderator(dispute_id, moderator));
}

wager_result_t state_machine::resolve_dispute(const dispute_id_t& dispute_id,
                                              const account_id_t& moderator,
                                              const dispute_outcome_t outcome,
                                              const std::string& note) {
  return publish(execute_resolve_dispute(dispute_id, moderator, outcome, note));
}

wager_result_t state_machine::cancel(const wager_id_t& wager_id,
                                     const account_id_t& actor) {
  return publish(execute_cancel(wager_id, actor));
}

wager_result_t state_machine::expire(const wager_id_t& wager_id) {
  return publish(execute_expire(wager_id));
}

wager_result_t state_machine::finalize(const wager_id_t& wager_id) {
  return publish(execute_finalize(wager_id));
}

wager_result_t state_machine::execute_create(const create_wager_t& request) {
  auto now = clock_();
  if (request.stake_amount < config_.min_stake ||
      request.stake_amount > config_.max_stake) {
    return reject(wager_error_code::invalid_stake,
                  fmt::format("stake must be within [{}, {}]",
                              config_.min_stake, config_.max_stake),
                  std::nullopt, now);
  }
  if (request.target_user.has_value() &&
      *request.target_user == request.creator) {
    return reject(wager_error_code::self_challenge,
                  "target user must differ from the creator", std::nullopt,
                  now);
  }
  if (request.game.empty() || request.title.empty()) {
    return reject(wager_error_code::invalid_request,
                  "game and title are required", std::nullopt, now);
  }

  auto guard = locks_.lock({request.creator});

  auto recent = uint32_t{};
  for (const auto& id : store_.list_wager_ids_for_user(request.creator)) {
    auto existing = store_.load_wager(id);
    if (existing && existing->parties.creator == request.creator &&
        existing->timeline.created_at + config_.rate_window >= now) {
      ++recent;
    }
  }
  if (recent >= config_.max_created_per_window) {
    return reject(wager_error_code::rate_limited,
                  fmt::format("at most {} wagers per window",
                              config_.max_created_per_window),
                  std::nullopt, now);
  }

  auto wager = wager_state_t{};
  wager.wager_id =
      make_wager_id(request.creator, now, store_.next_wager_sequence());
  wager.parties.creator = request.creator;
  wager.parties.target_user = request.target_user;
  wager.game = request.game;
  wager.title = request.title;
  wager.description = request.description;
  wager.stake_amount = request.stake_amount;
  wager.status = wager_status_t::open;
  wager.timeline.created_at = now;
  wager.timeline.expires_at = now + config_.acceptance_window;

  auto tx = transaction_t{};
  auto code = ledger_.hold(tx, wager.wager_id, request.creator,
                           request.stake_amount, now);
  if (code != wager_error_code::ok) {
    return reject(code, "stake could not be held", std::nullopt, now);
  }
  tx.put_wager(wager, std::nullopt);
  return commit(tx, wager.wager_id,
                {make_event(wager_event_type_t::wager_created, wager.wager_id,
                            request.creator, std::nullopt, now)},
                now);
}

wager_result_t state_machine::execute_accept(const wager_id_t& wager_id,
                                             const account_id_t& acceptor) {
  auto guard = locks_.lock({wager_id, acceptor});
  auto now = clock_();
  auto wager = store_.load_wager(wager_id);
  if (!wager) {
    return reject(wager_error_code::wager_missing, "unknown wager",
                  std::nullopt, now);
  }
  if (acceptor == wager->parties.creator) {
    return reject(wager_error_code::self_challenge,
                  "creator cannot accept their own wager", std::nullopt, now);
  }
  if (wager->parties.target_user.has_value() &&
      *wager->parties.target_user != acceptor) {
    return reject(wager_error_code::target_mismatch,
                  "wager is reserved for another user", std::nullopt, now);
  }

  if (has_pending_settlement(*wager)) {
    return resume_settlement(
        *wager,
        wager->settlement->outcome == settlement_outcome_t::expired
            ? wager_error_code::wager_expired
            : wager_error_code::invalid_transition,
        now);
  }
  if (wager->parties.acceptor.has_value()) {
    if (*wager->parties.acceptor == acceptor) {
      return success(*wager, now);
    }
    return reject(wager_error_code::already_accepted,
                  "wager was accepted by another user", wager, now);
  }
  if (wager->status == wager_status_t::open &&
      now > wager->timeline.expires_at) {
    auto result = expire_locked(*wager, now);
    if (!result.ok()) {
      return result;
    }
    result.code = wager_error_code::wager_expired;
    result.category = category_of(result.code);
    result.log = "acceptance window has closed";
    return result;
  }
  if (wager->status != wager_status_t::open) {
    return reject(wager->status == wager_status_t::expired
                      ? wager_error_code::wager_expired
                      : wager_error_code::invalid_transition,
                  fmt::format("cannot accept a {} wager",
                              to_string(wager->status)),
                  wager, now);
  }

  auto active = uint32_t{};
  for (const auto& id : store_.list_wager_ids_for_user(acceptor)) {
    auto existing = store_.load_wager(id);
    if (existing && existing->parties.acceptor == acceptor &&
        (existing->status == wager_status_t::accepted ||
         existing->status == wager_status_t::in_progress ||
         existing->status == wager_status_t::pending_result)) {
      ++active;
    }
  }
  if (active >= config_.max_active_accepted) {
    return reject(wager_error_code::active_limit_reached,
                  fmt::format("at most {} active accepted wagers",
                              config_.max_active_accepted),
                  std::nullopt, now);
  }

  auto updated = *wager;
  updated.parties.acceptor = acceptor;
  updated.timeline.accepted_at = now;
  updated.status = wager_status_t::accepted;

  auto tx = transaction_t{};
  tx.put_acceptance(acceptance_record_t{
      .wager_id = wager_id, .acceptor = acceptor, .accepted_at = now});
  tx.put_wager(updated, wager_status_t::open);
  return commit(tx, wager_id,
                {make_event(wager_event_type_t::wager_accepted, wager_id,
                            acceptor, std::nullopt, now)},
                now);
}

wager_result_t state_machine::execute_start(const wager_id_t& wager_id,
                                            const account_id_t& actor) {
  auto guard = locks_.lock({wager_id});
  auto now = clock_();
  auto wager = store_.load_wager(wager_id);
  if (!wager) {
    return reject(wager_error_code::wager_missing, "unknown wager",
                  std::nullopt, now);
  }
  if (!is_participant(*wager, actor)) {
    return reject(wager_error_code::not_participant,
                  "only participants may start a wager", std::nullopt, now);
  }
  if (has_pending_settlement(*wager)) {
    return resume_settlement(*wager, wager_error_code::invalid_transition,
                             now);
  }
  if (!is_legal_transition(wager->status, wager_status_t::in_progress)) {
    return reject(wager_error_code::invalid_transition,
                  fmt::format("cannot start a {} wager",
                              to_string(wager->status)),
                  wager, now);
  }

  auto updated = *wager;
  updated.timeline.started_at = now;
  updated.status = wager_status_t::in_progress;

  auto tx = transaction_t{};
  tx.put_wager(updated, wager->status);
  return commit(tx, wager_id,
                {make_event(wager_event_type_t::wager_started, wager_id, actor,
                            std::nullopt, now)},
                now);
}

wager_result_t state_machine::execute_submit_proof(
    const submit_proof_t& request) {
  auto guard = locks_.lock({request.wager_id});
  auto now = clock_();
  auto wager = store_.load_wager(request.wager_id);
  if (!wager) {
    return reject(wager_error_code::wager_missing, "unknown wager",
                  std::nullopt, now);
  }
  if (!is_valid_evidence_url(request.evidence.url)) {
    return reject(wager_error_code::malformed_proof,
                  "evidence url must be an http(s) url", std::nullopt, now);
  }
  if (!is_participant(*wager, request.submitter)) {
    return reject(wager_error_code::not_participant,
                  "only participants may submit proof", std::nullopt, now);
  }
  if (!is_participant(*wager, request.claimed_winner)) {
    return reject(wager_error_code::invalid_claimed_winner,
                  "claimed winner must be a participant", std::nullopt, now);
  }
  if (has_pending_settlement(*wager)) {
    auto code_after = wager_error_code::invalid_transition;
    if (wager->settlement->outcome ==
        settlement_outcome_t::default_by_inaction) {
      code_after = wager_error_code::dispute_window_closed;
    } else if (wager->settlement->outcome == settlement_outcome_t::agreed) {
      // A retried agreeing proof completes its own settlement.
      auto proofs = store_.load_proofs(request.wager_id);
      auto same = std::any_of(
          std::begin(proofs), std::end(proofs), [&](const auto& proof) {
            return proof.submitter == request.submitter &&
                   proof.claimed_winner == request.claimed_winner;
          });
      if (same) {
        code_after = wager_error_code::ok;
      }
    }
    return resume_settlement(*wager, code_after, now);
  }

  if (wager->status == wager_status_t::pending_result &&
      dispute_window_closed(*wager, now)) {
    auto result = finalize_by_inaction_locked(*wager, now);
    if (!result.ok()) {
      return result;
    }
    result.code = wager_error_code::dispute_window_closed;
    result.category = category_of(result.code);
    result.log = "dispute window closed; first claim stands";
    return result;
  }
  if (wager->status != wager_status_t::in_progress &&
      wager->status != wager_status_t::pending_result) {
    return reject(wager_error_code::invalid_transition,
                  fmt::format("cannot submit proof for a {} wager",
                              to_string(wager->status)),
                  wager, now);
  }

  auto proofs = store_.load_proofs(request.wager_id);
  auto duplicate = std::any_of(
      std::begin(proofs), std::end(proofs), [&](const auto& proof) {
        return proof.submitter == request.submitter;
      });
  if (duplicate) {
    return reject(wager_error_code::duplicate_proof,
                  "participant already submitted proof", wager, now);
  }

  auto proof = proof_record_t{};
  proof.wager_id = request.wager_id;
  proof.sequence = static_cast<uint32_t>(proofs.size());
  proof.submitter = request.submitter;
  proof.claimed_winner = request.claimed_winner;
  proof.evidence = request.evidence;
  proof.submitted_at = now;
  proofs.push_back(proof);

  auto updated = *wager;
  auto tx = transaction_t{};
  tx.append_proof(proof);
  auto events = std::vector<wager_event_t>{
      make_event(wager_event_type_t::proof_submitted, request.wager_id,
                 request.submitter, std::nullopt, now)};

  auto decision = bounty::settlement::evaluate(proofs);
  auto code = std::visit(
      overloaded{
          [&](const bounty::settlement::no_proof_t&) {
            return wager_error_code::invalid_request;
          },
          [&](const bounty::settlement::awaiting_second_proof_t&) {
            updated.status = wager_status_t::pending_result;
            updated.timeline.result_submitted_at = now;
            return wager_error_code::ok;
          },
          [&](const bounty::settlement::agreed_t& agreed) {
            auto settled = settle(tx, updated, settlement_outcome_t::agreed,
                                  agreed.winner, now);
            if (settled == wager_error_code::ok) {
              events.push_back(make_event(
                  wager_event_type_t::wager_settled, request.wager_id,
                  std::nullopt, settlement_outcome_t::agreed, now));
            }
            return settled;
          },
          [&](const bounty::settlement::conflicting_t&) {
            // Stays PENDING_RESULT until a dispute or the window closes.
            return wager_error_code::ok;
          }},
      decision);
  if (code != wager_error_code::ok) {
    return reject(code, "proof could not be applied",
                  store_.load_wager(request.wager_id), now);
  }

  tx.put_wager(updated, wager->status);
  if (updated.settlement.has_value()) {
    return record_settlement(tx, updated, std::move(events), now);
  }
  return commit(tx, request.wager_id, std::move(events), now);
}

wager_result_t state_machine::execute_confirm_result(
    const wager_id_t& wager_id,
    const account_id_t& actor) {
  auto guard = locks_.lock({wager_id});
  auto now = clock_();
  auto wager = store_.load_wager(wager_id);
  if (!wager) {
    return reject(wager_error_code::wager_missing, "unknown wager",
                  std::nullopt, now);
  }
  if (!is_participant(*wager, actor)) {
    return reject(wager_error_code::not_participant,
                  "only participants may confirm a result", std::nullopt,
                  now);
  }
  if (has_pending_settlement(*wager)) {
    auto outcome = wager->settlement->outcome;
    return resume_settlement(
        *wager,
        outcome == settlement_outcome_t::confirmed_by_opponent ||
                outcome == settlement_outcome_t::default_by_inaction
            ? wager_error_code::ok
            : wager_error_code::invalid_transition,
        now);
  }
  if (wager->status != wager_status_t::pending_result) {
    return reject(wager_error_code::invalid_transition,
                  fmt::format("cannot confirm a {} wager",
                              to_string(wager->status)),
                  wager, now);
  }
  auto proofs = store_.load_proofs(wager_id);
  if (proofs.empty()) {
    return reject(wager_error_code::invalid_transition,
                  "no result to confirm", wager, now);
  }
  if (proofs.front().submitter == actor) {
    return reject(wager_error_code::invalid_request,
                  "the submitter cannot confirm their own claim",
                  std::nullopt, now);
  }
  if (dispute_window_closed(*wager, now)) {
    return finalize_by_inaction_locked(*wager, now);
  }

  auto updated = *wager;
  auto tx = transaction_t{};
  auto code = settle(tx, updated, settlement_outcome_t::confirmed_by_opponent,
                     proofs.front().claimed_winner, now);
  if (code != wager_error_code::ok) {
    return reject(code, "settlement failed", wager, now);
  }
  tx.put_wager(updated, wager->status);
  return record_settlement(
      tx, updated,
      {make_event(wager_event_type_t::wager_settled, wager_id, actor,
                  settlement_outcome_t::confirmed_by_opponent, now)},
      now);
}

wager_result_t state_machine::execute_open_dispute(
    const wager_id_t& wager_id,
    const account_id_t& disputer,
    const std::string& reason) {
  auto guard = locks_.lock({wager_id});
  auto now = clock_();
  auto wager = store_.load_wager(wager_id);
  if (!wager) {
    return reject(wager_error_code::wager_missing, "unknown wager",
                  std::nullopt, now);
  }
  if (!is_participant(*wager, disputer)) {
    return reject(wager_error_code::not_participant,
                  "only participants may dispute", std::nullopt, now);
  }
  if (trimmed_length(reason) < config_.min_dispute_reason) {
    return reject(wager_error_code::dispute_reason_too_short,
                  fmt::format("reason must have at least {} characters",
                              config_.min_dispute_reason),
                  std::nullopt, now);
  }
  if (has_pending_settlement(*wager)) {
    return resume_settlement(
        *wager,
        wager->settlement->outcome == settlement_outcome_t::default_by_inaction
            ? wager_error_code::dispute_window_closed
            : wager_error_code::invalid_transition,
        now);
  }
  if (wager->status == wager_status_t::disputed) {
    return reject(wager_error_code::dispute_exists,
                  "wager is already disputed", wager, now);
  }
  if (wager->status != wager_status_t::pending_result) {
    return reject(wager_error_code::invalid_transition,
                  fmt::format("cannot dispute a {} wager",
                              to_string(wager->status)),
                  wager, now);
  }
  auto proofs = store_.load_proofs(wager_id);
  if (proofs.empty()) {
    return reject(wager_error_code::invalid_transition,
                  "no result to dispute", wager, now);
  }
  const auto& contested = proofs.front();
  if (contested.submitter == disputer) {
    return reject(wager_error_code::dispute_not_eligible,
                  "the submitter cannot dispute their own claim",
                  std::nullopt, now);
  }
  if (dispute_window_closed(*wager, now)) {
    auto result = finalize_by_inaction_locked(*wager, now);
    if (!result.ok()) {
      return result;
    }
    result.code = wager_error_code::dispute_window_closed;
    result.category = category_of(result.code);
    result.log = "dispute window closed; first claim stands";
    return result;
  }
  if (store_.load_dispute(wager_id).has_value()) {
    return reject(wager_error_code::dispute_exists, "dispute already exists",
                  wager, now);
  }

  auto dispute = dispute_record_t{};
  dispute.dispute_id = make_dispute_id(wager_id);
  dispute.wager_id = wager_id;
  dispute.disputer = disputer;
  dispute.contested_winner = contested.claimed_winner;
  dispute.reason = reason;
  dispute.status = dispute_status_t::open;
  dispute.opened_at = now;

  auto updated = *wager;
  updated.status = wager_status_t::disputed;

  auto tx = transaction_t{};
  tx.put_dispute(dispute, true);
  tx.put_wager(updated, wager_status_t::pending_result);
  return commit(tx, wager_id,
                {make_event(wager_event_type_t::dispute_opened, wager_id,
                            disputer, std::nullopt, now)},
                now);
}

wager_result_t state_machine::execute_assign_moderator(
    const dispute_id_t& dispute_id,
    const account_id_t& moderator) {
  auto wager_id = store_.find_wager_for_dispute(dispute_id);
  if (!wager_id) {
    return reject(wager_error_code::dispute_missing, "unknown dispute",
                  std::nullopt, clock_());
  }
  auto guard = locks_.lock({*wager_id});
  auto now = clock_();
  auto wager = store_.load_wager(*wager_id);
  auto dispute = store_.load_dispute(*wager_id);
  if (!wager || !dispute) {
    bounty::common::critical("dispute index points at a missing record");
  }
  if (is_participant(*wager, moderator)) {
    return reject(wager_error_code::moderator_is_participant,
                  "moderator must not be a participant", std::nullopt, now);
  }
  if (has_pending_settlement(*wager)) {
    return resume_settlement(*wager,
                             wager_error_code::dispute_already_resolved, now);
  }
  if (is_resolved(dispute->status)) {
    return reject(wager_error_code::dispute_already_resolved,
                  "dispute is already resolved", wager, now);
  }

  dispute->assigned_moderator = moderator;
  dispute->status = dispute_status_t::under_review;

  auto tx = transaction_t{};
  tx.put_dispute(*dispute, false);
  tx.put_wager(*wager, wager_status_t::disputed);
  return commit(tx, *wager_id,
                {make_event(wager_event_type_t::moderator_assigned, *wager_id,
                            moderator, std::nullopt, now)},
                now);
}

wager_result_t state_machine::execute_resolve_dispute(
    const dispute_id_t& dispute_id,
    const account_id_t& moderator,
    const dispute_outcome_t outcome,
    const std::string& note) {
  auto wager_id = store_.find_wager_for_dispute(dispute_id);
  if (!wager_id) {
    return reject(wager_error_code::dispute_missing, "unknown dispute",
                  std::nullopt, clock_());
  }
  auto guard = locks_.lock({*wager_id});
  auto now = clock_();
  auto wager = store_.load_wager(*wager_id);
  auto dispute = store_.load_dispute(*wager_id);
  if (!wager || !dispute) {
    bounty::common::critical("dispute index points at a missing record");
  }
  if (is_participant(*wager, moderator)) {
    return reject(wager_error_code::moderator_is_participant,
                  "moderator must not be a participant", std::nullopt, now);
  }
  if (has_pending_settlement(*wager)) {
    auto same_outcome = dispute->resolution.has_value() &&
                        dispute->resolution->outcome == outcome;
    return resume_settlement(*wager,
                             same_outcome
                                 ? wager_error_code::ok
                                 : wager_error_code::dispute_already_resolved,
                             now);
  }
  if (is_resolved(dispute->status)) {
    return reject(wager_error_code::dispute_already_resolved,
                  "dispute is already resolved", wager, now);
  }
  if (wager->status != wager_status_t::disputed) {
    return reject(wager_error_code::invalid_transition,
                  fmt::format("cannot resolve a {} wager",
                              to_string(wager->status)),
                  wager, now);
  }
  if (dispute->assigned_moderator.has_value() &&
      *dispute->assigned_moderator != moderator) {
    spdlog::info("Dispute {} assigned to {} resolved by {}",
                 to_hex(dispute_id), to_hex(*dispute->assigned_moderator),
                 to_hex(moderator));
  }

  auto settlement_outcome = settlement_outcome_t::dispute_voided;
  auto winner = std::optional<account_id_t>{};
  switch (outcome) {
    case dispute_outcome_t::confirm_original:
      settlement_outcome = settlement_outcome_t::dispute_confirmed;
      winner = dispute->contested_winner;
      dispute->status = dispute_status_t::resolved_confirm;
      break;
    case dispute_outcome_t::reverse:
      settlement_outcome = settlement_outcome_t::dispute_reversed;
      winner = opponent_of(*wager, dispute->contested_winner);
      dispute->status = dispute_status_t::resolved_reverse;
      break;
    case dispute_outcome_t::void_wager:
      dispute->status = dispute_status_t::resolved_void;
      break;
  }
  dispute->resolution = dispute_resolution_t{
      .outcome = outcome,
      .resolved_by = moderator,
      .note = note,
      .resolved_at = now};

  auto updated = *wager;
  auto tx = transaction_t{};
  auto code = settle(tx, updated, settlement_outcome, winner, now);
  if (code != wager_error_code::ok) {
    return reject(code, "dispute settlement failed", wager, now);
  }
  tx.put_dispute(*dispute, false);
  tx.put_wager(updated, wager_status_t::disputed);
  return record_settlement(
      tx, updated,
      {make_event(wager_event_type_t::wager_settled, *wager_id, moderator,
                  settlement_outcome, now)},
      now);
}

wager_result_t state_machine::execute_cancel(const wager_id_t& wager_id,
                                             const account_id_t& actor) {
  auto guard = locks_.lock({wager_id});
  auto now = clock_();
  auto wager = store_.load_wager(wager_id);
  if (!wager) {
    return reject(wager_error_code::wager_missing, "unknown wager",
                  std::nullopt, now);
  }
  if (actor != wager->parties.creator) {
    return reject(wager_error_code::not_creator,
                  "only the creator may cancel", std::nullopt, now);
  }
  if (has_pending_settlement(*wager)) {
    auto code_after = wager_error_code::invalid_transition;
    if (wager->settlement->outcome == settlement_outcome_t::cancelled) {
      code_after = wager_error_code::ok;
    } else if (wager->settlement->outcome == settlement_outcome_t::expired) {
      code_after = wager_error_code::wager_expired;
    }
    return resume_settlement(*wager, code_after, now);
  }
  if (wager->status == wager_status_t::open &&
      now > wager->timeline.expires_at) {
    auto result = expire_locked(*wager, now);
    if (!result.ok()) {
      return result;
    }
    result.code = wager_error_code::wager_expired;
    result.category = category_of(result.code);
    result.log = "acceptance window has closed";
    return result;
  }
  if (wager->status != wager_status_t::open) {
    return reject(wager->status == wager_status_t::expired
                      ? wager_error_code::wager_expired
                      : wager_error_code::invalid_transition,
                  fmt::format("cannot cancel a {} wager",
                              to_string(wager->status)),
                  wager, now);
  }

  auto updated = *wager;
  auto tx = transaction_t{};
  auto code =
      settle(tx, updated, settlement_outcome_t::cancelled, std::nullopt, now);
  if (code != wager_error_code::ok) {
    return reject(code, "cancellation refund failed", wager, now);
  }
  tx.put_wager(updated, wager_status_t::open);
  return record_settlement(
      tx, updated,
      {make_event(wager_event_type_t::wager_cancelled, wager_id, actor,
                  settlement_outcome_t::cancelled, now)},
      now);
}

wager_result_t state_machine::execute_expire(const wager_id_t& wager_id) {
  auto guard = locks_.lock({wager_id});
  auto now = clock_();
  auto wager = store_.load_wager(wager_id);
  if (!wager) {
    return reject(wager_error_code::wager_missing, "unknown wager",
                  std::nullopt, now);
  }
  if (wager->status == wager_status_t::expired) {
    return success(*wager, now);
  }
  if (has_pending_settlement(*wager)) {
    return resume_settlement(
        *wager,
        wager->settlement->outcome == settlement_outcome_t::expired
            ? wager_error_code::ok
            : wager_error_code::invalid_transition,
        now);
  }
  if (wager->status != wager_status_t::open) {
    return reject(wager_error_code::invalid_transition,
                  fmt::format("cannot expire a {} wager",
                              to_string(wager->status)),
                  wager, now);
  }
  if (now <= wager->timeline.expires_at) {
    return reject(wager_error_code::wager_not_expired,
                  "acceptance window is still open", wager, now);
  }
  return expire_locked(*wager, now);
}

wager_result_t state_machine::execute_finalize(const wager_id_t& wager_id) {
  auto guard = locks_.lock({wager_id});
  auto now = clock_();
  auto wager = store_.load_wager(wager_id);
  if (!wager) {
    return reject(wager_error_code::wager_missing, "unknown wager",
                  std::nullopt, now);
  }
  if (wager->status == wager_status_t::completed) {
    return success(*wager, now);
  }
  if (has_pending_settlement(*wager)) {
    return resume_settlement(*wager, wager_error_code::ok, now);
  }
  if (wager->status != wager_status_t::pending_result) {
    return reject(wager_error_code::invalid_transition,
                  fmt::format("cannot finalize a {} wager",
                              to_string(wager->status)),
                  wager, now);
  }
  if (!dispute_window_closed(*wager, now)) {
    return reject(wager_error_code::dispute_window_open,
                  "dispute window is still open", wager, now);
  }
  return finalize_by_inaction_locked(*wager, now);
}

wager_result_t state_machine::get(const wager_id_t& wager_id) const {
  auto now = clock_();
  auto wager = store_.load_wager(wager_id);
  if (!wager) {
    return reject(wager_error_code::wager_missing, "unknown wager",
                  std::nullopt, now);
  }
  return success(*wager, now);
}

std::vector<wager_snapshot_t> state_machine::list_for_user(
    const account_id_t& user,
    const bool active) const {
  auto now = clock_();
  auto snapshots = std::vector<wager_snapshot_t>{};
  for (const auto& id : store_.list_wager_ids_for_user(user)) {
    auto wager = store_.load_wager(id);
    if (!wager || is_terminal(wager->status) == active) {
      continue;
    }
    snapshots.push_back(make_snapshot(*wager, now));
  }
  std::sort(std::begin(snapshots), std::end(snapshots),
            [](const auto& lhs, const auto& rhs) {
              return std::tie(rhs.wager.timeline.created_at,
                              rhs.wager.wager_id) <
                     std::tie(lhs.wager.timeline.created_at,
                              lhs.wager.wager_id);
            });
  return snapshots;
}

std::vector<wager_snapshot_t> state_machine::list_active(
    const account_id_t& user) const {
  return list_for_user(user, true);
}

std::vector<wager_snapshot_t> state_machine::list_completed(
    const account_id_t& user) const {
  return list_for_user(user, false);
}

user_stats_t state_machine::user_stats(const account_id_t& user) const {
  auto stats = user_stats_t{};
  for (const auto& id : store_.list_wager_ids_for_user(user)) {
    auto wager = store_.load_wager(id);
    if (!wager) {
      continue;
    }
    if (wager->parties.creator == user) {
      ++stats.created_count;
      stats.total_wagered += wager->stake_amount;
    }
    if (wager->parties.acceptor == user) {
      ++stats.accepted_count;
    }
    if (wager->status != wager_status_t::completed ||
        !wager->parties.winner.has_value()) {
      continue;
    }
    if (*wager->parties.winner == user) {
      ++stats.won_count;
      if (wager->settlement.has_value()) {
        stats.total_earnings += wager->settlement->payout_amount;
      }
    } else {
      ++stats.lost_count;
    }
  }
  auto decided = stats.won_count + stats.lost_count;
  if (decided > 0) {
    stats.win_rate =
        std::round(static_cast<double>(stats.won_count) * 1000.0 /
                   static_cast<double>(decided)) /
        10.0;
  }
  return stats;
}

}  // namespace bounty::execution
