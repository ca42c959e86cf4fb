#pragma once

#include <bounty/v1/wager.grpc.pb.h>
#include <grpcpp/grpcpp.h>
#include <bounty/arbitration/dispute_arbitration.hpp>
#include <bounty/execution/state_machine.hpp>
#include <bounty/schema/wager_result.hpp>

namespace bounty::rpc {

/// Map a result category onto a gRPC status. The message is
/// `reason: log`.
grpc::Status make_status(const bounty::schema::wager_result_t& result);

void populate_snapshot(const bounty::schema::wager_snapshot_t& source,
                       bounty::v1::WagerSnapshot* destination);

/// Callback listener for `bounty.v1.WagerService`.
///
/// Caller identity is taken from the request fields. Rejections carry the
/// trailing metadata `x-bounty-reason`, `x-bounty-category` and, when the
/// wager is known, `x-bounty-state`.
struct listener final : public bounty::v1::WagerService::CallbackService {
  listener(bounty::execution::state_machine& machine,
           bounty::arbitration::dispute_arbitration& arbitration);

  virtual grpc::ServerUnaryReactor* CreateWager(
      grpc::CallbackServerContext* context,
      const bounty::v1::CreateWagerRequest* request,
      bounty::v1::WagerReply* response) override final;

  virtual grpc::ServerUnaryReactor* AcceptWager(
      grpc::CallbackServerContext* context,
      const bounty::v1::AcceptWagerRequest* request,
      bounty::v1::WagerReply* response) override final;

  virtual grpc::ServerUnaryReactor* StartWager(
      grpc::CallbackServerContext* context,
      const bounty::v1::StartWagerRequest* request,
      bounty::v1::WagerReply* response) override final;

  virtual grpc::ServerUnaryReactor* SubmitProof(
      grpc::CallbackServerContext* context,
      const bounty::v1::SubmitProofRequest* request,
      bounty::v1::WagerReply* response) override final;

  virtual grpc::ServerUnaryReactor* ConfirmResult(
      grpc::CallbackServerContext* context,
      const bounty::v1::ConfirmResultRequest* request,
      bounty::v1::WagerReply* response) override final;

  virtual grpc::ServerUnaryReactor* OpenDispute(
      grpc::CallbackServerContext* context,
      const bounty::v1::OpenDisputeRequest* request,
      bounty::v1::WagerReply* response) override final;

  /// Empty `moderator` assigns round-robin from the configured pool.
  virtual grpc::ServerUnaryReactor* AssignModerator(
      grpc::CallbackServerContext* context,
      const bounty::v1::AssignModeratorRequest* request,
      bounty::v1::WagerReply* response) override final;

  virtual grpc::ServerUnaryReactor* ResolveDispute(
      grpc::CallbackServerContext* context,
      const bounty::v1::ResolveDisputeRequest* request,
      bounty::v1::WagerReply* response) override final;

  virtual grpc::ServerUnaryReactor* CancelWager(
      grpc::CallbackServerContext* context,
      const bounty::v1::CancelWagerRequest* request,
      bounty::v1::WagerReply* response) override final;

  virtual grpc::ServerUnaryReactor* GetWager(
      grpc::CallbackServerContext* context,
      const bounty::v1::GetWagerRequest* request,
      bounty::v1::WagerReply* response) override final;

  virtual grpc::ServerUnaryReactor* ListActiveWagers(
      grpc::CallbackServerContext* context,
      const bounty::v1::ListWagersRequest* request,
      bounty::v1::WagerList* response) override final;

  virtual grpc::ServerUnaryReactor* ListCompletedWagers(
      grpc::CallbackServerContext* context,
      const bounty::v1::ListWagersRequest* request,
      bounty::v1::WagerList* response) override final;

  virtual grpc::ServerUnaryReactor* GetUserStats(
      grpc::CallbackServerContext* context,
      const bounty::v1::GetUserStatsRequest* request,
      bounty::v1::UserStats* response) override final;

  bounty::execution::state_machine& machine_;
  bounty::arbitration::dispute_arbitration& arbitration_;
};

}  // namespace bounty::rpc
