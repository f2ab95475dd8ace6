#include "admin_service.hpp"

#include "internal/core/escrow_manager.hpp"
#include "internal/service/observe_rpc.hpp"
#include "escrow/ledger/v1.hpp"

namespace escrow::service {

using namespace escrow::ledger::v1;

namespace {

FeePolicyResponse ToResponse(std::string_view route, core::FeePolicyChange change) {
  LogLedgerEvent(route, change.event);

  FeePolicyResponse resp;
  *resp.mutable_policy() = std::move(change.policy);
  *resp.mutable_event()  = std::move(change.event);
  return resp;
}

AdminMembershipResponse ToResponse(std::string_view route, const std::string& account, bool is_admin,
                                   std::optional<LedgerEvent> event) {
  AdminMembershipResponse resp;
  resp.set_account(account);
  resp.set_is_admin(is_admin);
  if (event) {
    LogLedgerEvent(route, *event);
    *resp.mutable_event() = std::move(*event);
  }
  return resp;
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

FeePolicyResponse AdminService::SetFee(const SetFeeRequest& req) {
  return ObserveRpc("AdminService.SetFee", [&] {
    return ToResponse("AdminService.SetFee", ctx_.manager->SetFee(req.caller(), req.platform_fee_bps()));
  });
}

FeePolicyResponse AdminService::SetFeeRecipient(const SetFeeRecipientRequest& req) {
  return ObserveRpc("AdminService.SetFeeRecipient", [&] {
    return ToResponse("AdminService.SetFeeRecipient", ctx_.manager->SetFeeRecipient(req.caller(), req.fee_recipient()));
  });
}

FeePolicyResponse AdminService::GetFeePolicy(const GetFeePolicyRequest&) {
  return ObserveRpc("AdminService.GetFeePolicy", [&] {
    FeePolicyResponse resp;
    *resp.mutable_policy() = ctx_.manager->GetFeePolicy();
    return resp;
  });
}

AdminMembershipResponse AdminService::GrantAdmin(const GrantAdminRequest& req) {
  return ObserveRpc("AdminService.GrantAdmin", [&] {
    auto event = ctx_.manager->GrantAdmin(req.caller(), req.account());
    return ToResponse("AdminService.GrantAdmin", req.account(), true, std::move(event));
  });
}

AdminMembershipResponse AdminService::RevokeAdmin(const RevokeAdminRequest& req) {
  return ObserveRpc("AdminService.RevokeAdmin", [&] {
    auto event = ctx_.manager->RevokeAdmin(req.caller(), req.account());
    return ToResponse("AdminService.RevokeAdmin", req.account(), false, std::move(event));
  });
}

AdminMembershipResponse AdminService::IsAdmin(const IsAdminRequest& req) {
  return ObserveRpc("AdminService.IsAdmin", [&] {
    return ToResponse("AdminService.IsAdmin", req.account(), ctx_.manager->IsAdmin(req.account()), std::nullopt);
  });
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", [&] {
    const auto stats = ctx_.manager->Stats();

    StatsResponse resp;
    resp.set_task_counter(stats.task_counter);
    resp.set_tasks_funded(stats.tasks_funded);
    resp.set_tasks_in_progress(stats.tasks_in_progress);
    resp.set_tasks_completed(stats.tasks_completed);
    resp.set_tasks_disputed(stats.tasks_disputed);
    resp.set_tasks_cancelled(stats.tasks_cancelled);
    resp.set_tasks_resolved(stats.tasks_resolved);
    resp.set_value_locked(stats.value_locked);
    resp.set_custody_balance(stats.custody_balance);
    resp.set_event_count(stats.event_count);
    return resp;
  });
}

} // namespace escrow::service
