#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "escrow/ledger/services/v1/escrow_service.grpc.pb.h"
#include "internal/service/escrow_service.hpp"

namespace escrow::grpc {

class EscrowServer final : public escrow::ledger::v1::EscrowService::Service {
public:
  explicit EscrowServer(std::shared_ptr<escrow::service::EscrowService> svc);

  ::grpc::Status FundTask(::grpc::ServerContext*,
                     const escrow::ledger::v1::FundTaskRequest*,
                     escrow::ledger::v1::FundTaskResponse*) override;

  ::grpc::Status ApproveSubtask(::grpc::ServerContext*,
                     const escrow::ledger::v1::ApproveSubtaskRequest*,
                     escrow::ledger::v1::TaskMutationResponse*) override;

  ::grpc::Status CompleteTask(::grpc::ServerContext*,
                     const escrow::ledger::v1::CompleteTaskRequest*,
                     escrow::ledger::v1::TaskMutationResponse*) override;

  ::grpc::Status RaiseDispute(::grpc::ServerContext*,
                     const escrow::ledger::v1::RaiseDisputeRequest*,
                     escrow::ledger::v1::TaskMutationResponse*) override;

  ::grpc::Status ResolveDispute(::grpc::ServerContext*,
                     const escrow::ledger::v1::ResolveDisputeRequest*,
                     escrow::ledger::v1::TaskMutationResponse*) override;

  ::grpc::Status CancelTask(::grpc::ServerContext*,
                     const escrow::ledger::v1::CancelTaskRequest*,
                     escrow::ledger::v1::TaskMutationResponse*) override;

  ::grpc::Status GetTask(::grpc::ServerContext*,
                     const escrow::ledger::v1::GetTaskRequest*,
                     escrow::ledger::v1::GetTaskResponse*) override;

  ::grpc::Status GetSubtaskPayment(::grpc::ServerContext*,
                     const escrow::ledger::v1::GetSubtaskPaymentRequest*,
                     escrow::ledger::v1::GetSubtaskPaymentResponse*) override;

  ::grpc::Status GetBalance(::grpc::ServerContext*,
                     const escrow::ledger::v1::GetBalanceRequest*,
                     escrow::ledger::v1::GetBalanceResponse*) override;

  ::grpc::Status ListEvents(::grpc::ServerContext*,
                     const escrow::ledger::v1::ListEventsRequest*,
                     escrow::ledger::v1::ListEventsResponse*) override;

private:
  std::shared_ptr<escrow::service::EscrowService> service_;
};

}
