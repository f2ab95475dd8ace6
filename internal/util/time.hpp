#pragma once

#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace escrow::util {

/*
  Ledger clock.

  Records store unix milliseconds as plain integers so both backends keep
  them exactly; the wire carries google.protobuf.Timestamp.
*/

uint64_t NowMillis();

google::protobuf::Timestamp MillisToTimestamp(uint64_t ms);

} // namespace escrow::util
