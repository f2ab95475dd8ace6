#include <cassert>
#include <iostream>

#include "internal/util/address.hpp"

int main() {
  using escrow::util::IsValidAddress;

  assert(IsValidAddress("alice"));
  assert(IsValidAddress("0x1111111111111111111111111111111111111111"));
  assert(IsValidAddress("0x01"));

  assert(!IsValidAddress(""));
  assert(!IsValidAddress("0x0000000000000000000000000000000000000000"));
  assert(!IsValidAddress("0x0"));
  assert(!IsValidAddress("two words"));
  assert(!IsValidAddress("tab\there"));
  assert(!IsValidAddress("trailing\n"));

  std::cout << "escrow_ledger_unit_address: pass\n";
  return 0;
}
