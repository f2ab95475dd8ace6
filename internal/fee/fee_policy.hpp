#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace escrow::fee {

constexpr uint64_t kBasisPointsDenominator = 10000;
constexpr uint32_t kMaxPlatformFeeBps      = 2000;

struct FeeSplit {
  uint64_t fee           = 0;
  uint64_t worker_amount = 0;
};

/*
  Platform fee configuration persisted as a single row.

  Split() is floor(amount * bps / 10000) computed without a 128-bit
  intermediate, so it is exact for every 64-bit amount.
*/
class FeePolicy {
 public:
  explicit FeePolicy(std::shared_ptr<db::Repository> repository);

  static FeeSplit Split(uint64_t amount, uint32_t bps);

  // Throws util::FeeTooHigh / util::InvalidAddress.
  static void ValidateRate(uint32_t bps);
  static void ValidateRecipient(const std::string& recipient);

  // Writes the initial policy if none is stored. Returns true when written.
  bool Bootstrap(db::Transaction& tx, uint32_t bps, const std::string& recipient);

  // Throws std::runtime_error if the ledger was never initialised.
  db::model::FeePolicyRecord Current(db::Transaction& tx);

  db::model::FeePolicyRecord SetRate(db::Transaction& tx, uint32_t bps);
  db::model::FeePolicyRecord SetRecipient(db::Transaction& tx, const std::string& recipient);

 private:
  void Store(db::Transaction& tx, const db::model::FeePolicyRecord& record);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace escrow::fee
