#include "internal/fee/fee_policy.hpp"

#include <stdexcept>

#include "internal/util/address.hpp"
#include "internal/util/errors.hpp"

namespace escrow::fee {

FeePolicy::FeePolicy(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("FeePolicy requires a repository");
  }
}

FeeSplit FeePolicy::Split(uint64_t amount, uint32_t bps) {
  // (q*D + r) * bps / D == q*bps + r*bps/D, and neither term can overflow
  // while bps <= D
  const uint64_t q   = amount / kBasisPointsDenominator;
  const uint64_t r   = amount % kBasisPointsDenominator;
  const uint64_t fee = q * bps + (r * bps) / kBasisPointsDenominator;
  return {fee, amount - fee};
}

void FeePolicy::ValidateRate(uint32_t bps) {
  if (bps > kMaxPlatformFeeBps) {
    throw util::FeeTooHigh("platform fee " + std::to_string(bps) + " bps exceeds ceiling of " +
                           std::to_string(kMaxPlatformFeeBps) + " bps");
  }
}

void FeePolicy::ValidateRecipient(const std::string& recipient) {
  if (!util::IsValidAddress(recipient)) {
    throw util::InvalidAddress("fee recipient '" + recipient + "' is not a valid address");
  }
}

bool FeePolicy::Bootstrap(db::Transaction& tx, uint32_t bps, const std::string& recipient) {
  if (repository_->GetFeePolicy(tx)) {
    return false;
  }
  ValidateRate(bps);
  ValidateRecipient(recipient);
  Store(tx, {bps, recipient});
  return true;
}

db::model::FeePolicyRecord FeePolicy::Current(db::Transaction& tx) {
  auto record = repository_->GetFeePolicy(tx);
  if (!record) {
    throw std::runtime_error("fee policy not initialised");
  }
  return *record;
}

db::model::FeePolicyRecord FeePolicy::SetRate(db::Transaction& tx, uint32_t bps) {
  ValidateRate(bps);
  auto record             = Current(tx);
  record.platform_fee_bps = bps;
  Store(tx, record);
  return record;
}

db::model::FeePolicyRecord FeePolicy::SetRecipient(db::Transaction& tx, const std::string& recipient) {
  ValidateRecipient(recipient);
  auto record          = Current(tx);
  record.fee_recipient = recipient;
  Store(tx, record);
  return record;
}

void FeePolicy::Store(db::Transaction& tx, const db::model::FeePolicyRecord& record) {
  db::ThrowIfError(repository_->PutFeePolicy(tx, record), "store fee policy");
}

} // namespace escrow::fee
