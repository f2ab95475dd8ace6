#include "time.hpp"

#include <chrono>

#include <google/protobuf/util/time_util.h>

namespace escrow::util {

uint64_t NowMillis() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

google::protobuf::Timestamp MillisToTimestamp(uint64_t ms) {
  return google::protobuf::util::TimeUtil::MillisecondsToTimestamp(static_cast<int64_t>(ms));
}

} // namespace escrow::util
