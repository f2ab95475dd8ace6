#pragma once

#include "escrow/ledger/services/v1/escrow_service.pb.h"
#include "service_context.hpp"
#include "escrow/ledger/v1.hpp"

namespace escrow::service {

class EscrowService {
public:
  explicit EscrowService(ServiceContext ctx);

  escrow::ledger::v1::FundTaskResponse
  FundTask(const escrow::ledger::v1::FundTaskRequest& req);

  escrow::ledger::v1::TaskMutationResponse
  ApproveSubtask(const escrow::ledger::v1::ApproveSubtaskRequest& req);

  escrow::ledger::v1::TaskMutationResponse
  CompleteTask(const escrow::ledger::v1::CompleteTaskRequest& req);

  escrow::ledger::v1::TaskMutationResponse
  RaiseDispute(const escrow::ledger::v1::RaiseDisputeRequest& req);

  escrow::ledger::v1::TaskMutationResponse
  ResolveDispute(const escrow::ledger::v1::ResolveDisputeRequest& req);

  escrow::ledger::v1::TaskMutationResponse
  CancelTask(const escrow::ledger::v1::CancelTaskRequest& req);

  escrow::ledger::v1::GetTaskResponse
  GetTask(const escrow::ledger::v1::GetTaskRequest& req);

  escrow::ledger::v1::GetSubtaskPaymentResponse
  GetSubtaskPayment(const escrow::ledger::v1::GetSubtaskPaymentRequest& req);

  escrow::ledger::v1::GetBalanceResponse
  GetBalance(const escrow::ledger::v1::GetBalanceRequest& req);

  escrow::ledger::v1::ListEventsResponse
  ListEvents(const escrow::ledger::v1::ListEventsRequest& req);

private:
  ServiceContext ctx_;
};

}
