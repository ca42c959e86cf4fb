#include <bounty/rpc/server.hpp>
#include <optional>
#include <string>

using namespace bounty::rpc;
using namespace bounty::schema;

namespace {

std::string hex_or_empty(const std::optional<hash32_t>& value) {
  if (!value) {
    return {};
  }
  return to_hex(*value);
}

wager_result_t make_invalid_request(std::string log) {
  auto result = wager_result_t{};
  result.code = wager_error_code::invalid_request;
  result.category = category_of(result.code);
  result.log = std::move(log);
  return result;
}

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

grpc::ServerUnaryReactor* finish_rejected(grpc::CallbackServerContext* context,
                                          const wager_result_t& result) {
  context->AddTrailingMetadata("x-bounty-reason",
                               std::string{result.reason()});
  context->AddTrailingMetadata("x-bounty-category",
                               std::string{to_string(result.category)});
  if (result.snapshot) {
    context->AddTrailingMetadata(
        "x-bounty-state",
        std::string{to_string(result.snapshot->wager.status)});
  }
  return finish(context, make_status(result));
}

grpc::ServerUnaryReactor* finish_result(grpc::CallbackServerContext* context,
                                        const wager_result_t& result,
                                        bounty::v1::WagerReply* response) {
  if (!result.ok()) {
    return finish_rejected(context, result);
  }
  if (result.snapshot) {
    populate_snapshot(*result.snapshot, response->mutable_wager());
  }
  for (const auto& event : result.events) {
    auto* destination = response->add_events();
    destination->set_type(std::string{to_string(event.type)});
    destination->set_actor(hex_or_empty(event.actor));
    if (event.outcome) {
      destination->set_outcome(std::string{to_string(*event.outcome)});
    }
    destination->set_at(event.at);
  }
  return finish(context, grpc::Status::OK);
}

proof_type_t map_proof_type(const bounty::v1::ProofType type) {
  switch (type) {
    case bounty::v1::PROOF_TYPE_VIDEO:
      return proof_type_t::video;
    case bounty::v1::PROOF_TYPE_REPLAY:
      return proof_type_t::replay;
    case bounty::v1::PROOF_TYPE_OTHER:
      return proof_type_t::other;
    case bounty::v1::PROOF_TYPE_SCREENSHOT:
    default:
      return proof_type_t::screenshot;
  }
}

bounty::v1::ProofType map_proof_type(const proof_type_t type) {
  switch (type) {
    case proof_type_t::video:
      return bounty::v1::PROOF_TYPE_VIDEO;
    case proof_type_t::replay:
      return bounty::v1::PROOF_TYPE_REPLAY;
    case proof_type_t::other:
      return bounty::v1::PROOF_TYPE_OTHER;
    case proof_type_t::screenshot:
    default:
      return bounty::v1::PROOF_TYPE_SCREENSHOT;
  }
}

std::optional<dispute_outcome_t> map_outcome(
    const bounty::v1::DisputeOutcome outcome) {
  switch (outcome) {
    case bounty::v1::DISPUTE_OUTCOME_CONFIRM_ORIGINAL:
      return dispute_outcome_t::confirm_original;
    case bounty::v1::DISPUTE_OUTCOME_REVERSE:
      return dispute_outcome_t::reverse;
    case bounty::v1::DISPUTE_OUTCOME_VOID:
      return dispute_outcome_t::void_wager;
    default:
      return std::nullopt;
  }
}

}  // namespace

namespace bounty::rpc {

grpc::Status make_status(const wager_result_t& result) {
  if (result.ok()) {
    return grpc::Status::OK;
  }
  auto message = std::string{result.reason()} + ": " + result.log;
  switch (result.category) {
    case error_category_t::validation:
      return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, message};
    case error_category_t::state_conflict:
      return grpc::Status{grpc::StatusCode::FAILED_PRECONDITION, message};
    case error_category_t::escrow:
      return grpc::Status{grpc::StatusCode::UNAVAILABLE, message};
    case error_category_t::not_found:
      return grpc::Status{grpc::StatusCode::NOT_FOUND, message};
    case error_category_t::none:
    default:
      return grpc::Status{grpc::StatusCode::INTERNAL, message};
  }
}

void populate_snapshot(const wager_snapshot_t& source,
                       bounty::v1::WagerSnapshot* destination) {
  const auto& wager = source.wager;
  destination->set_wager_id(to_hex(wager.wager_id));
  destination->set_creator(to_hex(wager.parties.creator));
  destination->set_acceptor(hex_or_empty(wager.parties.acceptor));
  destination->set_target_user(hex_or_empty(wager.parties.target_user));
  destination->set_winner(hex_or_empty(wager.parties.winner));
  destination->set_game(wager.game);
  destination->set_title(wager.title);
  destination->set_description(wager.description);
  destination->set_stake_amount(wager.stake_amount);
  destination->set_state(std::string{to_string(wager.status)});
  destination->set_created_at(wager.timeline.created_at);
  destination->set_accepted_at(wager.timeline.accepted_at.value_or(0));
  destination->set_started_at(wager.timeline.started_at.value_or(0));
  destination->set_result_submitted_at(
      wager.timeline.result_submitted_at.value_or(0));
  destination->set_completed_at(wager.timeline.completed_at.value_or(0));
  destination->set_expires_at(wager.timeline.expires_at);
  if (wager.settlement) {
    auto* settlement = destination->mutable_settlement();
    settlement->set_outcome(std::string{to_string(wager.settlement->outcome)});
    settlement->set_payout_amount(wager.settlement->payout_amount);
    settlement->set_platform_fee(wager.settlement->platform_fee);
    settlement->set_refunded_amount(wager.settlement->refunded_amount);
  }
  for (const auto& proof : source.proofs) {
    auto* entry = destination->add_proofs();
    entry->set_submitter(to_hex(proof.submitter));
    entry->set_claimed_winner(to_hex(proof.claimed_winner));
    entry->mutable_evidence()->set_url(proof.evidence.url);
    entry->mutable_evidence()->set_type(map_proof_type(proof.evidence.type));
    entry->mutable_evidence()->set_description(proof.evidence.description);
    entry->set_submitted_at(proof.submitted_at);
  }
  if (source.dispute) {
    const auto& dispute = *source.dispute;
    auto* entry = destination->mutable_dispute();
    entry->set_dispute_id(to_hex(dispute.dispute_id));
    entry->set_disputer(to_hex(dispute.disputer));
    entry->set_contested_winner(to_hex(dispute.contested_winner));
    entry->set_reason(dispute.reason);
    entry->set_status(std::string{to_string(dispute.status)});
    entry->set_assigned_moderator(hex_or_empty(dispute.assigned_moderator));
    entry->set_opened_at(dispute.opened_at);
    if (dispute.resolution) {
      entry->set_resolution(std::string{to_string(dispute.resolution->outcome)});
      entry->set_resolved_by(to_hex(dispute.resolution->resolved_by));
      entry->set_resolution_note(dispute.resolution->note);
      entry->set_resolved_at(dispute.resolution->resolved_at);
    }
  }
  destination->set_is_expired(source.is_expired);
  destination->set_can_dispute(source.can_dispute);
  destination->set_dispute_deadline(source.dispute_deadline.value_or(0));
}

listener::listener(bounty::execution::state_machine& machine,
                   bounty::arbitration::dispute_arbitration& arbitration)
    : machine_{machine}, arbitration_{arbitration} {}

grpc::ServerUnaryReactor* listener::CreateWager(
    grpc::CallbackServerContext* context,
    const bounty::v1::CreateWagerRequest* request,
    bounty::v1::WagerReply* response) {
  auto creator = try_make_hash32(request->creator());
  if (!creator) {
    return finish_rejected(context, make_invalid_request("invalid creator"));
  }
  auto create = create_wager_t{};
  create.creator = *creator;
  create.stake_amount = request->stake_amount();
  create.game = request->game();
  create.title = request->title();
  create.description = request->description();
  if (!request->target_user().empty()) {
    create.target_user = try_make_hash32(request->target_user());
    if (!create.target_user) {
      return finish_rejected(context,
                             make_invalid_request("invalid target user"));
    }
  }
  return finish_result(context, machine_.create(create), response);
}

grpc::ServerUnaryReactor* listener::AcceptWager(
    grpc::CallbackServerContext* context,
    const bounty::v1::AcceptWagerRequest* request,
    bounty::v1::WagerReply* response) {
  auto wager_id = try_make_hash32(request->wager_id());
  auto acceptor = try_make_hash32(request->acceptor());
  if (!wager_id || !acceptor) {
    return finish_rejected(
        context, make_invalid_request("invalid wager id or acceptor"));
  }
  return finish_result(context, machine_.accept(*wager_id, *acceptor),
                       response);
}

grpc::ServerUnaryReactor* listener::StartWager(
    grpc::CallbackServerContext* context,
    const bounty::v1::StartWagerRequest* request,
    bounty::v1::WagerReply* response) {
  auto wager_id = try_make_hash32(request->wager_id());
  auto actor = try_make_hash32(request->actor());
  if (!wager_id || !actor) {
    return finish_rejected(context,
                           make_invalid_request("invalid wager id or actor"));
  }
  return finish_result(context, machine_.start(*wager_id, *actor), response);
}

grpc::ServerUnaryReactor* listener::SubmitProof(
    grpc::CallbackServerContext* context,
    const bounty::v1::SubmitProofRequest* request,
    bounty::v1::WagerReply* response) {
  auto wager_id = try_make_hash32(request->wager_id());
  auto submitter = try_make_hash32(request->submitter());
  auto claimed_winner = try_make_hash32(request->claimed_winner());
  if (!wager_id || !submitter || !claimed_winner) {
    return finish_rejected(
        context,
        make_invalid_request("invalid wager id, submitter or claimed winner"));
  }
  auto submit = submit_proof_t{};
  submit.wager_id = *wager_id;
  submit.submitter = *submitter;
  submit.claimed_winner = *claimed_winner;
  submit.evidence.url = request->evidence().url();
  submit.evidence.type = map_proof_type(request->evidence().type());
  submit.evidence.description = request->evidence().description();
  return finish_result(context, machine_.submit_proof(submit), response);
}

grpc::ServerUnaryReactor* listener::ConfirmResult(
    grpc::CallbackServerContext* context,
    const bounty::v1::ConfirmResultRequest* request,
    bounty::v1::WagerReply* response) {
  auto wager_id = try_make_hash32(request->wager_id());
  auto actor = try_make_hash32(request->actor());
  if (!wager_id || !actor) {
    return finish_rejected(context,
                           make_invalid_request("invalid wager id or actor"));
  }
  return finish_result(context, machine_.confirm_result(*wager_id, *actor),
                       response);
}

grpc::ServerUnaryReactor* listener::OpenDispute(
    grpc::CallbackServerContext* context,
    const bounty::v1::OpenDisputeRequest* request,
    bounty::v1::WagerReply* response) {
  auto wager_id = try_make_hash32(request->wager_id());
  auto disputer = try_make_hash32(request->disputer());
  if (!wager_id || !disputer) {
    return finish_rejected(
        context, make_invalid_request("invalid wager id or disputer"));
  }
  return finish_result(
      context, machine_.open_dispute(*wager_id, *disputer, request->reason()),
      response);
}

grpc::ServerUnaryReactor* listener::AssignModerator(
    grpc::CallbackServerContext* context,
    const bounty::v1::AssignModeratorRequest* request,
    bounty::v1::WagerReply* response) {
  auto dispute_id = try_make_hash32(request->dispute_id());
  if (!dispute_id) {
    return finish_rejected(context, make_invalid_request("invalid dispute id"));
  }
  auto moderator = std::optional<account_id_t>{};
  if (!request->moderator().empty()) {
    moderator = try_make_hash32(request->moderator());
    if (!moderator) {
      return finish_rejected(context,
                             make_invalid_request("invalid moderator"));
    }
  }
  return finish_result(context, arbitration_.assign(*dispute_id, moderator),
                       response);
}

grpc::ServerUnaryReactor* listener::ResolveDispute(
    grpc::CallbackServerContext* context,
    const bounty::v1::ResolveDisputeRequest* request,
    bounty::v1::WagerReply* response) {
  auto dispute_id = try_make_hash32(request->dispute_id());
  auto moderator = try_make_hash32(request->moderator());
  auto outcome = map_outcome(request->outcome());
  if (!dispute_id || !moderator || !outcome) {
    return finish_rejected(
        context,
        make_invalid_request("invalid dispute id, moderator or outcome"));
  }
  return finish_result(context,
                       arbitration_.resolve(*dispute_id, *moderator, *outcome,
                                            request->note()),
                       response);
}

grpc::ServerUnaryReactor* listener::CancelWager(
    grpc::CallbackServerContext* context,
    const bounty::v1::CancelWagerRequest* request,
    bounty::v1::WagerReply* response) {
  auto wager_id = try_make_hash32(request->wager_id());
  auto actor = try_make_hash32(request->actor());
  if (!wager_id || !actor) {
    return finish_rejected(context,
                           make_invalid_request("invalid wager id or actor"));
  }
  return finish_result(context, machine_.cancel(*wager_id, *actor), response);
}

grpc::ServerUnaryReactor* listener::GetWager(
    grpc::CallbackServerContext* context,
    const bounty::v1::GetWagerRequest* request,
    bounty::v1::WagerReply* response) {
  auto wager_id = try_make_hash32(request->wager_id());
  if (!wager_id) {
    return finish_rejected(context, make_invalid_request("invalid wager id"));
  }
  return finish_result(context, machine_.get(*wager_id), response);
}

grpc::ServerUnaryReactor* listener::ListActiveWagers(
    grpc::CallbackServerContext* context,
    const bounty::v1::ListWagersRequest* request,
    bounty::v1::WagerList* response) {
  auto user = try_make_hash32(request->user());
  if (!user) {
    return finish_rejected(context, make_invalid_request("invalid user"));
  }
  for (const auto& snapshot : machine_.list_active(*user)) {
    populate_snapshot(snapshot, response->add_wagers());
  }
  return finish(context, grpc::Status::OK);
}

grpc::ServerUnaryReactor* listener::ListCompletedWagers(
    grpc::CallbackServerContext* context,
    const bounty::v1::ListWagersRequest* request,
    bounty::v1::WagerList* response) {
  auto user = try_make_hash32(request->user());
  if (!user) {
    return finish_rejected(context, make_invalid_request("invalid user"));
  }
  for (const auto& snapshot : machine_.list_completed(*user)) {
    populate_snapshot(snapshot, response->add_wagers());
  }
  return finish(context, grpc::Status::OK);
}

grpc::ServerUnaryReactor* listener::GetUserStats(
    grpc::CallbackServerContext* context,
    const bounty::v1::GetUserStatsRequest* request,
    bounty::v1::UserStats* response) {
  auto user = try_make_hash32(request->user());
  if (!user) {
    return finish_rejected(context, make_invalid_request("invalid user"));
  }
  auto stats = machine_.user_stats(*user);
  response->set_created_count(stats.created_count);
  response->set_accepted_count(stats.accepted_count);
  response->set_won_count(stats.won_count);
  response->set_lost_count(stats.lost_count);
  response->set_win_rate(stats.win_rate);
  response->set_total_earnings(stats.total_earnings);
  response->set_total_wagered(stats.total_wagered);
  return finish(context, grpc::Status::OK);
}

}  // namespace bounty::rpc
