#include "internal/asset/memory_asset_ledger.hpp"

#include <limits>
#include <stdexcept>

namespace escrow::asset {

MemoryAssetLedger::MemoryAssetLedger(std::string custody_account) : custody_account_(std::move(custody_account)) {
  if (custody_account_.empty()) {
    throw std::invalid_argument("custody account must not be empty");
  }
}

std::unique_ptr<AssetTransaction> MemoryAssetLedger::Begin() {
  return std::make_unique<MemoryAssetTransaction>(*this);
}

uint64_t MemoryAssetLedger::BalanceOf(const std::string& account) {
  std::lock_guard lock(mutex_);
  auto            it = balances_.find(account);
  return it == balances_.end() ? 0 : it->second;
}

void MemoryAssetLedger::Mint(const std::string& account, uint64_t amount) {
  std::lock_guard lock(mutex_);
  auto&           balance = balances_[account];
  if (balance > std::numeric_limits<uint64_t>::max() - amount) {
    throw std::overflow_error("mint overflows balance of " + account);
  }
  balance += amount;
}

bool MemoryAssetLedger::MoveLocked(const std::string& from, const std::string& to, uint64_t amount) {
  // a self-move would report success while no value changes hands
  if (from == to) {
    return false;
  }
  auto src = balances_.find(from);
  if (src == balances_.end() || src->second < amount) {
    return false;
  }
  auto& dst = balances_[to];
  if (dst > std::numeric_limits<uint64_t>::max() - amount) {
    return false;
  }
  // balances_[to] may rehash and invalidate src
  balances_[from] -= amount;
  dst += amount;
  return true;
}

MemoryAssetTransaction::MemoryAssetTransaction(MemoryAssetLedger& ledger) : ledger_(ledger) {
}

MemoryAssetTransaction::~MemoryAssetTransaction() {
  if (!finished_) {
    Rollback();
  }
}

bool MemoryAssetTransaction::DebitFrom(const std::string& payer, uint64_t amount) {
  return Apply(payer, ledger_.custody_account_, amount);
}

bool MemoryAssetTransaction::CreditTo(const std::string& recipient, uint64_t amount) {
  return Apply(ledger_.custody_account_, recipient, amount);
}

bool MemoryAssetTransaction::Apply(const std::string& from, const std::string& to, uint64_t amount) {
  if (finished_) {
    throw std::runtime_error("asset transaction already finished");
  }
  std::lock_guard lock(ledger_.mutex_);
  if (!ledger_.MoveLocked(from, to, amount)) {
    return false;
  }
  journal_.push_back({from, to, amount});
  return true;
}

void MemoryAssetTransaction::Commit() {
  if (finished_) {
    throw std::runtime_error("asset transaction already finished");
  }
  journal_.clear();
  finished_ = true;
}

void MemoryAssetTransaction::Rollback() {
  if (finished_) {
    return;
  }
  std::lock_guard lock(ledger_.mutex_);
  // undo newest first; each reversed move was valid when applied, so the
  // destination still holds at least that amount
  for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
    ledger_.balances_[it->to] -= it->amount;
    ledger_.balances_[it->from] += it->amount;
  }
  journal_.clear();
  finished_ = true;
}

} // namespace escrow::asset
