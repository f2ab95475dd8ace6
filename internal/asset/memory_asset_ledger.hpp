#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/asset/asset_ledger.hpp"

namespace escrow::asset {

/*
  In-process token balances.

  Thread safety:
    - every balance access takes mutex_
    - a transaction applies moves immediately and keeps an undo journal
*/

class MemoryAssetLedger final : public AssetLedger {
 public:
  explicit MemoryAssetLedger(std::string custody_account);

  std::unique_ptr<AssetTransaction> Begin() override;

  uint64_t BalanceOf(const std::string& account) override;

  const std::string& CustodyAccount() const override {
    return custody_account_;
  }

  // Creates value out of thin air. Only used for seeding balances.
  void Mint(const std::string& account, uint64_t amount);

 private:
  friend class MemoryAssetTransaction;

  // Caller holds mutex_.
  bool MoveLocked(const std::string& from, const std::string& to, uint64_t amount);

  std::mutex                                mutex_;
  std::string                               custody_account_;
  std::unordered_map<std::string, uint64_t> balances_;
};

class MemoryAssetTransaction final : public AssetTransaction {
 public:
  explicit MemoryAssetTransaction(MemoryAssetLedger& ledger);
  ~MemoryAssetTransaction() override;

  bool DebitFrom(const std::string& payer, uint64_t amount) override;
  bool CreditTo(const std::string& recipient, uint64_t amount) override;

  void Commit() override;
  void Rollback() override;

 private:
  struct Move {
    std::string from;
    std::string to;
    uint64_t    amount;
  };

  bool Apply(const std::string& from, const std::string& to, uint64_t amount);

  MemoryAssetLedger& ledger_;
  std::vector<Move>  journal_;
  bool               finished_ = false;
};

} // namespace escrow::asset
