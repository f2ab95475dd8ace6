#include "escrow_service.hpp"

#include "internal/core/escrow_manager.hpp"
#include "internal/service/observe_rpc.hpp"
#include "escrow/ledger/v1.hpp"

namespace escrow::service {

using namespace escrow::ledger::v1;

namespace {

// FundTaskResponse and TaskMutationResponse share the task + event shape.
template <typename Response = TaskMutationResponse>
Response ToResponse(std::string_view route, core::TaskMutation mutation) {
  LogLedgerEvent(route, mutation.event);

  Response resp;
  *resp.mutable_task()  = std::move(mutation.task);
  *resp.mutable_event() = std::move(mutation.event);
  return resp;
}

} // namespace

EscrowService::EscrowService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

FundTaskResponse EscrowService::FundTask(const FundTaskRequest& req) {
  return ObserveRpc("EscrowService.FundTask", [&] {
    return ToResponse<FundTaskResponse>("EscrowService.FundTask", ctx_.manager->FundTask(req.caller(), req.amount()));
  });
}

TaskMutationResponse EscrowService::ApproveSubtask(const ApproveSubtaskRequest& req) {
  return ObserveRpc("EscrowService.ApproveSubtask", [&] {
    return ToResponse("EscrowService.ApproveSubtask",
                      ctx_.manager->ApproveSubtask(req.caller(), req.task_id(), req.subtask_index(), req.worker(), req.amount()));
  });
}

TaskMutationResponse EscrowService::CompleteTask(const CompleteTaskRequest& req) {
  return ObserveRpc("EscrowService.CompleteTask", [&] {
    return ToResponse("EscrowService.CompleteTask", ctx_.manager->CompleteTask(req.caller(), req.task_id()));
  });
}

TaskMutationResponse EscrowService::RaiseDispute(const RaiseDisputeRequest& req) {
  return ObserveRpc("EscrowService.RaiseDispute", [&] {
    return ToResponse("EscrowService.RaiseDispute", ctx_.manager->RaiseDispute(req.caller(), req.task_id()));
  });
}

TaskMutationResponse EscrowService::ResolveDispute(const ResolveDisputeRequest& req) {
  return ObserveRpc("EscrowService.ResolveDispute", [&] {
    return ToResponse("EscrowService.ResolveDispute",
                      ctx_.manager->ResolveDispute(req.caller(), req.task_id(), req.winner(), req.winner_amount()));
  });
}

TaskMutationResponse EscrowService::CancelTask(const CancelTaskRequest& req) {
  return ObserveRpc("EscrowService.CancelTask", [&] {
    return ToResponse("EscrowService.CancelTask", ctx_.manager->CancelTask(req.caller(), req.task_id()));
  });
}

GetTaskResponse EscrowService::GetTask(const GetTaskRequest& req) {
  return ObserveRpc("EscrowService.GetTask", [&] {
    GetTaskResponse resp;
    *resp.mutable_task() = ctx_.manager->GetTask(req.task_id());
    return resp;
  });
}

GetSubtaskPaymentResponse EscrowService::GetSubtaskPayment(const GetSubtaskPaymentRequest& req) {
  return ObserveRpc("EscrowService.GetSubtaskPayment", [&] {
    GetSubtaskPaymentResponse resp;
    *resp.mutable_payment() = ctx_.manager->GetSubtaskPayment(req.task_id(), req.subtask_index());
    return resp;
  });
}

GetBalanceResponse EscrowService::GetBalance(const GetBalanceRequest& req) {
  return ObserveRpc("EscrowService.GetBalance", [&] {
    GetBalanceResponse resp;
    resp.set_account(req.account());
    resp.set_balance(ctx_.manager->BalanceOf(req.account()));
    return resp;
  });
}

ListEventsResponse EscrowService::ListEvents(const ListEventsRequest& req) {
  return ObserveRpc("EscrowService.ListEvents", [&] {
    ListEventsResponse resp;
    for (auto& event : ctx_.manager->ListEvents(req.after_sequence(), req.max_events())) {
      *resp.add_events() = std::move(event);
    }
    resp.set_last_sequence(ctx_.manager->LastEventSequence());
    return resp;
  });
}

} // namespace escrow::service
