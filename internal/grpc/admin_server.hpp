#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "escrow/ledger/services/v1/escrow_admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace escrow::grpc {

class AdminServer final : public escrow::ledger::v1::EscrowAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<escrow::service::AdminService> svc);

  ::grpc::Status SetFee(::grpc::ServerContext*,
                     const escrow::ledger::v1::SetFeeRequest*,
                     escrow::ledger::v1::FeePolicyResponse*) override;

  ::grpc::Status SetFeeRecipient(::grpc::ServerContext*,
                     const escrow::ledger::v1::SetFeeRecipientRequest*,
                     escrow::ledger::v1::FeePolicyResponse*) override;

  ::grpc::Status GetFeePolicy(::grpc::ServerContext*,
                     const escrow::ledger::v1::GetFeePolicyRequest*,
                     escrow::ledger::v1::FeePolicyResponse*) override;

  ::grpc::Status GrantAdmin(::grpc::ServerContext*,
                     const escrow::ledger::v1::GrantAdminRequest*,
                     escrow::ledger::v1::AdminMembershipResponse*) override;

  ::grpc::Status RevokeAdmin(::grpc::ServerContext*,
                     const escrow::ledger::v1::RevokeAdminRequest*,
                     escrow::ledger::v1::AdminMembershipResponse*) override;

  ::grpc::Status IsAdmin(::grpc::ServerContext*,
                     const escrow::ledger::v1::IsAdminRequest*,
                     escrow::ledger::v1::AdminMembershipResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*,
                     const escrow::ledger::v1::StatsRequest*,
                     escrow::ledger::v1::StatsResponse*) override;

private:
  std::shared_ptr<escrow::service::AdminService> service_;
};

}
