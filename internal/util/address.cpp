#include "address.hpp"

#include <algorithm>
#include <cctype>

namespace escrow::util {

namespace {

bool IsZeroAddress(const std::string& address) {
  if (address.size() < 3 || address[0] != '0' || (address[1] != 'x' && address[1] != 'X')) {
    return false;
  }
  return std::all_of(address.begin() + 2, address.end(), [](char c) { return c == '0'; });
}

} // namespace

bool IsValidAddress(const std::string& address) {
  if (address.empty()) {
    return false;
  }
  const bool has_space = std::any_of(address.begin(), address.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  if (has_space) {
    return false;
  }
  return !IsZeroAddress(address);
}

} // namespace escrow::util
