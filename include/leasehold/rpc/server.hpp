#pragma once

#include <leasehold/router/access_router.hpp>
#include <leasehold/v1/router.grpc.pb.h>

namespace leasehold::rpc {

/// Callback gRPC listener exposing the access router to the host.
///
/// Quick reference:
/// - State changing calls carry an Authorization block. The listener rebuilds
///   the typed router request from the message and hands it to
///   `access_router::submit`, which recovers the signer and checks its nonce.
/// - Execute: role resolution, policy validation, vault forward, commit.
/// - SetOperatorWithPermit: relayed off-line signed delegation.
/// - GetEntity/ListEvents/GetRequestNonce: read only views over committed
///   state.
///
/// Malformed requests (wrong address, amount or signature width, unknown
/// policy type) finish with INVALID_ARGUMENT; router rejections, failed
/// authentication included, finish OK with a non-zero `code`.
struct listener final : public leasehold::v1::LeaseRouter::CallbackService {
  explicit listener(leasehold::router::access_router& router);

  virtual grpc::ServerUnaryReactor* MintEntity(
      grpc::CallbackServerContext* context,
      const leasehold::v1::MintEntityRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* TransferEntity(
      grpc::CallbackServerContext* context,
      const leasehold::v1::TransferEntityRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* Pause(
      grpc::CallbackServerContext* context,
      const leasehold::v1::EntityCommandRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* Unpause(
      grpc::CallbackServerContext* context,
      const leasehold::v1::EntityCommandRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* Terminate(
      grpc::CallbackServerContext* context,
      const leasehold::v1::EntityCommandRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* AssignLease(
      grpc::CallbackServerContext* context,
      const leasehold::v1::AssignLeaseRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* ExtendLease(
      grpc::CallbackServerContext* context,
      const leasehold::v1::ExtendLeaseRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* SetOperator(
      grpc::CallbackServerContext* context,
      const leasehold::v1::SetOperatorRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* SetOperatorWithPermit(
      grpc::CallbackServerContext* context,
      const leasehold::v1::SetOperatorWithPermitRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* ClearOperator(
      grpc::CallbackServerContext* context,
      const leasehold::v1::EntityCommandRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* RegisterTemplate(
      grpc::CallbackServerContext* context,
      const leasehold::v1::EntityCommandRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* MintInstance(
      grpc::CallbackServerContext* context,
      const leasehold::v1::MintInstanceRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* Deposit(
      grpc::CallbackServerContext* context,
      const leasehold::v1::DepositRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* Withdraw(
      grpc::CallbackServerContext* context,
      const leasehold::v1::WithdrawRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* Execute(
      grpc::CallbackServerContext* context,
      const leasehold::v1::ExecuteRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* SetPluginApproval(
      grpc::CallbackServerContext* context,
      const leasehold::v1::SetPluginApprovalRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* UpdatePolicyList(
      grpc::CallbackServerContext* context,
      const leasehold::v1::UpdatePolicyListRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* UpdateWhitelist(
      grpc::CallbackServerContext* context,
      const leasehold::v1::UpdateWhitelistRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* SetSpendLimits(
      grpc::CallbackServerContext* context,
      const leasehold::v1::SetSpendLimitsRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* SetCooldown(
      grpc::CallbackServerContext* context,
      const leasehold::v1::SetCooldownRequest* request,
      leasehold::v1::OperationResult* response) override final;

  virtual grpc::ServerUnaryReactor* GetEntity(
      grpc::CallbackServerContext* context,
      const leasehold::v1::GetEntityRequest* request,
      leasehold::v1::GetEntityResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListEvents(
      grpc::CallbackServerContext* context,
      const leasehold::v1::ListEventsRequest* request,
      leasehold::v1::ListEventsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetRequestNonce(
      grpc::CallbackServerContext* context,
      const leasehold::v1::GetRequestNonceRequest* request,
      leasehold::v1::GetRequestNonceResponse* response) override final;

  leasehold::router::access_router& router_;
};

}  // namespace leasehold::rpc
