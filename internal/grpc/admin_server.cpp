#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "escrow/ledger/v1.hpp"

namespace escrow::grpc {

AdminServer::AdminServer(std::shared_ptr<escrow::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::SetFee(::grpc::ServerContext*, const escrow::ledger::v1::SetFeeRequest* req, escrow::ledger::v1::FeePolicyResponse* resp) {
  try {
    *resp = service_->SetFee(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::SetFeeRecipient(::grpc::ServerContext*, const escrow::ledger::v1::SetFeeRecipientRequest* req, escrow::ledger::v1::FeePolicyResponse* resp) {
  try {
    *resp = service_->SetFeeRecipient(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetFeePolicy(::grpc::ServerContext*, const escrow::ledger::v1::GetFeePolicyRequest* req, escrow::ledger::v1::FeePolicyResponse* resp) {
  try {
    *resp = service_->GetFeePolicy(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GrantAdmin(::grpc::ServerContext*, const escrow::ledger::v1::GrantAdminRequest* req, escrow::ledger::v1::AdminMembershipResponse* resp) {
  try {
    *resp = service_->GrantAdmin(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RevokeAdmin(::grpc::ServerContext*, const escrow::ledger::v1::RevokeAdminRequest* req, escrow::ledger::v1::AdminMembershipResponse* resp) {
  try {
    *resp = service_->RevokeAdmin(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::IsAdmin(::grpc::ServerContext*, const escrow::ledger::v1::IsAdminRequest* req, escrow::ledger::v1::AdminMembershipResponse* resp) {
  try {
    *resp = service_->IsAdmin(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const escrow::ledger::v1::StatsRequest* req, escrow::ledger::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace escrow::grpc
