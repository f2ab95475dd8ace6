#pragma once

#include "escrow/ledger/services/v1/escrow_admin_service.pb.h"
#include "service_context.hpp"
#include "escrow/ledger/v1.hpp"

namespace escrow::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  escrow::ledger::v1::FeePolicyResponse
  SetFee(const escrow::ledger::v1::SetFeeRequest& req);

  escrow::ledger::v1::FeePolicyResponse
  SetFeeRecipient(const escrow::ledger::v1::SetFeeRecipientRequest& req);

  escrow::ledger::v1::FeePolicyResponse
  GetFeePolicy(const escrow::ledger::v1::GetFeePolicyRequest& req);

  escrow::ledger::v1::AdminMembershipResponse
  GrantAdmin(const escrow::ledger::v1::GrantAdminRequest& req);

  escrow::ledger::v1::AdminMembershipResponse
  RevokeAdmin(const escrow::ledger::v1::RevokeAdminRequest& req);

  escrow::ledger::v1::AdminMembershipResponse
  IsAdmin(const escrow::ledger::v1::IsAdminRequest& req);

  escrow::ledger::v1::StatsResponse
  Stats(const escrow::ledger::v1::StatsRequest& req);

private:
  ServiceContext ctx_;
};

}
