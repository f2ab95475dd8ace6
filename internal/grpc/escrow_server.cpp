#include "escrow_server.hpp"

#include "grpc_error.hpp"
#include "escrow/ledger/v1.hpp"

namespace escrow::grpc {

EscrowServer::EscrowServer(std::shared_ptr<escrow::service::EscrowService> svc) : service_(std::move(svc)) {
}

::grpc::Status EscrowServer::FundTask(::grpc::ServerContext*, const escrow::ledger::v1::FundTaskRequest* req, escrow::ledger::v1::FundTaskResponse* resp) {
  try {
    *resp = service_->FundTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EscrowServer::ApproveSubtask(::grpc::ServerContext*, const escrow::ledger::v1::ApproveSubtaskRequest* req, escrow::ledger::v1::TaskMutationResponse* resp) {
  try {
    *resp = service_->ApproveSubtask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EscrowServer::CompleteTask(::grpc::ServerContext*, const escrow::ledger::v1::CompleteTaskRequest* req, escrow::ledger::v1::TaskMutationResponse* resp) {
  try {
    *resp = service_->CompleteTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EscrowServer::RaiseDispute(::grpc::ServerContext*, const escrow::ledger::v1::RaiseDisputeRequest* req, escrow::ledger::v1::TaskMutationResponse* resp) {
  try {
    *resp = service_->RaiseDispute(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EscrowServer::ResolveDispute(::grpc::ServerContext*, const escrow::ledger::v1::ResolveDisputeRequest* req, escrow::ledger::v1::TaskMutationResponse* resp) {
  try {
    *resp = service_->ResolveDispute(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EscrowServer::CancelTask(::grpc::ServerContext*, const escrow::ledger::v1::CancelTaskRequest* req, escrow::ledger::v1::TaskMutationResponse* resp) {
  try {
    *resp = service_->CancelTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EscrowServer::GetTask(::grpc::ServerContext*, const escrow::ledger::v1::GetTaskRequest* req, escrow::ledger::v1::GetTaskResponse* resp) {
  try {
    *resp = service_->GetTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EscrowServer::GetSubtaskPayment(::grpc::ServerContext*, const escrow::ledger::v1::GetSubtaskPaymentRequest* req, escrow::ledger::v1::GetSubtaskPaymentResponse* resp) {
  try {
    *resp = service_->GetSubtaskPayment(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EscrowServer::GetBalance(::grpc::ServerContext*, const escrow::ledger::v1::GetBalanceRequest* req, escrow::ledger::v1::GetBalanceResponse* resp) {
  try {
    *resp = service_->GetBalance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EscrowServer::ListEvents(::grpc::ServerContext*, const escrow::ledger::v1::ListEventsRequest* req, escrow::ledger::v1::ListEventsResponse* resp) {
  try {
    *resp = service_->ListEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace escrow::grpc
