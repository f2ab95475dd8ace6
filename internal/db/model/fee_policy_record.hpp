#pragma once

#include <cstdint>
#include <string>

namespace escrow::db::model {

struct FeePolicyRecord {
  uint32_t    platform_fee_bps = 0;
  std::string fee_recipient;
};

} // namespace escrow::db::model
