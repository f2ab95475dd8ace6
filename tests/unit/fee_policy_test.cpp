#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/fee/fee_policy.hpp"
#include "internal/util/errors.hpp"

namespace {

using escrow::fee::FeePolicy;

template <typename E, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const E&) {
    threw = true;
  }
  assert(threw);
}

uint64_t ReferenceFee(uint64_t amount, uint32_t bps) {
  return static_cast<uint64_t>(static_cast<unsigned __int128>(amount) * bps / 10000);
}

void TestSplitMatchesFloorDivision() {
  auto split = FeePolicy::Split(20000, 1000);
  assert(split.fee == 2000);
  assert(split.worker_amount == 18000);

  // 9999 * 250 / 10000 = 249.975
  split = FeePolicy::Split(9999, 250);
  assert(split.fee == 249);
  assert(split.worker_amount == 9750);

  split = FeePolicy::Split(1, 2000);
  assert(split.fee == 0);
  assert(split.worker_amount == 1);

  split = FeePolicy::Split(12345, 0);
  assert(split.fee == 0);
  assert(split.worker_amount == 12345);
}

void TestSplitIsExactForLargeAmounts() {
  const uint64_t amounts[] = {
      std::numeric_limits<uint64_t>::max(),
      std::numeric_limits<uint64_t>::max() - 1,
      (uint64_t{1} << 63) + 12345,
      9'223'372'036'854'775'807ULL,
      10'000'000'000'000'000'000ULL,
  };
  const uint32_t rates[] = {0, 1, 250, 1999, 2000};

  for (auto amount : amounts) {
    for (auto bps : rates) {
      const auto split = FeePolicy::Split(amount, bps);
      assert(split.fee == ReferenceFee(amount, bps));
      assert(split.fee + split.worker_amount == amount);
    }
  }
}

void TestRateAndRecipientValidation() {
  FeePolicy::ValidateRate(0);
  FeePolicy::ValidateRate(escrow::fee::kMaxPlatformFeeBps);
  ExpectThrows<escrow::util::FeeTooHigh>([] { FeePolicy::ValidateRate(2001); });
  ExpectThrows<escrow::util::FeeTooHigh>([] { FeePolicy::ValidateRate(10000); });

  FeePolicy::ValidateRecipient("platform");
  ExpectThrows<escrow::util::InvalidAddress>([] { FeePolicy::ValidateRecipient(""); });
  ExpectThrows<escrow::util::InvalidAddress>([] { FeePolicy::ValidateRecipient("0x0000000000000000000000000000000000000000"); });
}

void TestPersistedPolicyUpdates() {
  auto      repository = std::make_shared<escrow::db::memory::MemoryRepository>();
  FeePolicy policy(repository);

  {
    auto tx = repository->Begin();
    assert(policy.Bootstrap(*tx, 250, "platform"));
    // second bootstrap keeps the stored policy
    assert(!policy.Bootstrap(*tx, 500, "other"));
    tx->Commit();
  }

  auto tx      = repository->Begin();
  auto current = policy.Current(*tx);
  assert(current.platform_fee_bps == 250);
  assert(current.fee_recipient == "platform");

  auto updated = policy.SetRate(*tx, 2000);
  assert(updated.platform_fee_bps == 2000);
  assert(updated.fee_recipient == "platform");

  ExpectThrows<escrow::util::FeeTooHigh>([&] { policy.SetRate(*tx, 2001); });
  ExpectThrows<escrow::util::InvalidAddress>([&] { policy.SetRecipient(*tx, ""); });
  assert(policy.Current(*tx).platform_fee_bps == 2000);

  updated = policy.SetRecipient(*tx, "treasury");
  assert(updated.fee_recipient == "treasury");
  tx->Commit();

  auto read_tx = repository->Begin();
  assert(policy.Current(*read_tx).fee_recipient == "treasury");
  read_tx->Commit();
}

void TestUninitialisedPolicyIsAnError() {
  auto      repository = std::make_shared<escrow::db::memory::MemoryRepository>();
  FeePolicy policy(repository);
  auto      tx = repository->Begin();
  ExpectThrows<std::runtime_error>([&] { policy.Current(*tx); });
}

} // namespace

int main() {
  TestSplitMatchesFloorDivision();
  TestSplitIsExactForLargeAmounts();
  TestRateAndRecipientValidation();
  TestPersistedPolicyUpdates();
  TestUninitialisedPolicyIsAnError();

  std::cout << "escrow_ledger_unit_fee_policy: pass\n";
  return 0;
}
