#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace escrow::asset {

/*
  Fungible asset abstraction.

  The escrow only ever moves value between an external account and its own
  custody account:

    DebitFrom  payer     → custody
    CreditTo   custody   → recipient

  Both return false when the source balance is insufficient (or the move
  cannot be applied); they never throw for a business-level refusal.

  Moves made through one AssetTransaction become final on Commit(). A
  transaction destroyed without Commit() reverses every move it made.
*/

class AssetTransaction {
 public:
  virtual ~AssetTransaction() = default;

  virtual bool DebitFrom(const std::string& payer, uint64_t amount) = 0;

  virtual bool CreditTo(const std::string& recipient, uint64_t amount) = 0;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;
};

class AssetLedger {
 public:
  virtual ~AssetLedger() = default;

  virtual std::unique_ptr<AssetTransaction> Begin() = 0;

  virtual uint64_t BalanceOf(const std::string& account) = 0;

  virtual const std::string& CustodyAccount() const = 0;
};

using AssetLedgerPtr = std::shared_ptr<AssetLedger>;

} // namespace escrow::asset
