#pragma once

#include <string>

namespace escrow::util {

/*
  Account identities are opaque strings (wallet addresses in production,
  plain names in tests). An identity is valid when it is non-empty, carries
  no whitespace and is not the zero address ("0x" followed only by zeros).
*/
bool IsValidAddress(const std::string& address);

} // namespace escrow::util
