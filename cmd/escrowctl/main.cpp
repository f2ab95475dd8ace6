#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "escrow/ledger/services/v1/escrow_admin_service.grpc.pb.h"
#include "escrow/ledger/services/v1/escrow_service.grpc.pb.h"
#include "escrow/ledger/v1.hpp"

using namespace escrow::ledger::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  escrowctl <addr> fund <caller> <amount>\n"
            << "  escrowctl <addr> approve <caller> <task_id> <subtask_index> <worker> <amount>\n"
            << "  escrowctl <addr> complete <caller> <task_id>\n"
            << "  escrowctl <addr> dispute <caller> <task_id>\n"
            << "  escrowctl <addr> resolve <caller> <task_id> <winner> <winner_amount>\n"
            << "  escrowctl <addr> cancel <caller> <task_id>\n"
            << "  escrowctl <addr> task <task_id>\n"
            << "  escrowctl <addr> subtask <task_id> <subtask_index>\n"
            << "  escrowctl <addr> fee\n"
            << "  escrowctl <addr> set-fee <caller> <bps>\n"
            << "  escrowctl <addr> set-fee-recipient <caller> <recipient>\n"
            << "  escrowctl <addr> grant-admin <caller> <account>\n"
            << "  escrowctl <addr> revoke-admin <caller> <account>\n"
            << "  escrowctl <addr> is-admin <account>\n"
            << "  escrowctl <addr> balance <account>\n"
            << "  escrowctl <addr> events [after_sequence] [max_events]\n"
            << "  escrowctl <addr> stats\n";
}

static std::optional<uint64_t> ParseU64(const std::string& s) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return std::stoull(s);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

// Prints the response as JSON, or the status (prefixed with its ledger
// error name) on failure.
static int Report(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << "error (grpc code " << status.error_code() << "): " << status.error_message() << "\n";
    return 2;
  }

  std::string                                json;
  google::protobuf::util::JsonPrintOptions   options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  auto print_status                     = google::protobuf::util::MessageToJsonString(resp, &json, options);
  if (!print_status.ok()) {
    std::cerr << "failed to render response: " << print_status.message() << "\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  // Positional argument i (0-based, after the command).
  auto arg = [&](int i) -> std::string { return argv[3 + i]; };
  auto num = [&](int i) -> uint64_t {
    auto parsed = ParseU64(arg(i));
    if (!parsed) {
      std::cerr << "not an unsigned integer: " << arg(i) << "\n";
      std::exit(1);
    }
    return *parsed;
  };
  auto need = [&](int count) {
    if (argc < 3 + count) {
      Usage();
      std::exit(1);
    }
  };

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto escrow_stub = EscrowService::NewStub(channel);
  auto admin_stub  = EscrowAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------
  // Task lifecycle
  // ------------------------------------------------------------

  if (cmd == "fund") {
    need(2);
    FundTaskRequest req;
    req.set_caller(arg(0));
    req.set_amount(num(1));
    FundTaskResponse resp;
    return Report(escrow_stub->FundTask(&ctx, req, &resp), resp);
  }

  if (cmd == "approve") {
    need(5);
    ApproveSubtaskRequest req;
    req.set_caller(arg(0));
    req.set_task_id(num(1));
    req.set_subtask_index(num(2));
    req.set_worker(arg(3));
    req.set_amount(num(4));
    TaskMutationResponse resp;
    return Report(escrow_stub->ApproveSubtask(&ctx, req, &resp), resp);
  }

  if (cmd == "complete") {
    need(2);
    CompleteTaskRequest req;
    req.set_caller(arg(0));
    req.set_task_id(num(1));
    TaskMutationResponse resp;
    return Report(escrow_stub->CompleteTask(&ctx, req, &resp), resp);
  }

  if (cmd == "dispute") {
    need(2);
    RaiseDisputeRequest req;
    req.set_caller(arg(0));
    req.set_task_id(num(1));
    TaskMutationResponse resp;
    return Report(escrow_stub->RaiseDispute(&ctx, req, &resp), resp);
  }

  if (cmd == "resolve") {
    need(4);
    ResolveDisputeRequest req;
    req.set_caller(arg(0));
    req.set_task_id(num(1));
    req.set_winner(arg(2));
    req.set_winner_amount(num(3));
    TaskMutationResponse resp;
    return Report(escrow_stub->ResolveDispute(&ctx, req, &resp), resp);
  }

  if (cmd == "cancel") {
    need(2);
    CancelTaskRequest req;
    req.set_caller(arg(0));
    req.set_task_id(num(1));
    TaskMutationResponse resp;
    return Report(escrow_stub->CancelTask(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------
  // Queries
  // ------------------------------------------------------------

  if (cmd == "task") {
    need(1);
    GetTaskRequest req;
    req.set_task_id(num(0));
    GetTaskResponse resp;
    return Report(escrow_stub->GetTask(&ctx, req, &resp), resp);
  }

  if (cmd == "subtask") {
    need(2);
    GetSubtaskPaymentRequest req;
    req.set_task_id(num(0));
    req.set_subtask_index(num(1));
    GetSubtaskPaymentResponse resp;
    return Report(escrow_stub->GetSubtaskPayment(&ctx, req, &resp), resp);
  }

  if (cmd == "balance") {
    need(1);
    GetBalanceRequest req;
    req.set_account(arg(0));
    GetBalanceResponse resp;
    return Report(escrow_stub->GetBalance(&ctx, req, &resp), resp);
  }

  if (cmd == "events") {
    ListEventsRequest req;
    if (argc >= 4) req.set_after_sequence(num(0));
    if (argc >= 5) req.set_max_events(num(1));
    ListEventsResponse resp;
    return Report(escrow_stub->ListEvents(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------
  // Administration
  // ------------------------------------------------------------

  if (cmd == "fee") {
    GetFeePolicyRequest req;
    FeePolicyResponse   resp;
    return Report(admin_stub->GetFeePolicy(&ctx, req, &resp), resp);
  }

  if (cmd == "set-fee") {
    need(2);
    const auto bps = num(1);
    if (bps > UINT32_MAX) {
      std::cerr << "bps out of range: " << bps << "\n";
      return 1;
    }
    SetFeeRequest req;
    req.set_caller(arg(0));
    req.set_platform_fee_bps(static_cast<uint32_t>(bps));
    FeePolicyResponse resp;
    return Report(admin_stub->SetFee(&ctx, req, &resp), resp);
  }

  if (cmd == "set-fee-recipient") {
    need(2);
    SetFeeRecipientRequest req;
    req.set_caller(arg(0));
    req.set_fee_recipient(arg(1));
    FeePolicyResponse resp;
    return Report(admin_stub->SetFeeRecipient(&ctx, req, &resp), resp);
  }

  if (cmd == "grant-admin") {
    need(2);
    GrantAdminRequest req;
    req.set_caller(arg(0));
    req.set_account(arg(1));
    AdminMembershipResponse resp;
    return Report(admin_stub->GrantAdmin(&ctx, req, &resp), resp);
  }

  if (cmd == "revoke-admin") {
    need(2);
    RevokeAdminRequest req;
    req.set_caller(arg(0));
    req.set_account(arg(1));
    AdminMembershipResponse resp;
    return Report(admin_stub->RevokeAdmin(&ctx, req, &resp), resp);
  }

  if (cmd == "is-admin") {
    need(1);
    IsAdminRequest req;
    req.set_account(arg(0));
    AdminMembershipResponse resp;
    return Report(admin_stub->IsAdmin(&ctx, req, &resp), resp);
  }

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;
    return Report(admin_stub->Stats(&ctx, req, &resp), resp);
  }

  Usage();
  return 1;
}
