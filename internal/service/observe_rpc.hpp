#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <string_view>

#include "escrow/ledger/core/v1/events.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace escrow::service {

inline std::int64_t ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
}

/*
  Runs one RPC body. Ledger rejections are expected traffic and log at warn
  with their taxonomy code; anything else is a server fault and logs at
  error. The exception always propagates to the transport layer.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto response = fn();
    ESCROW_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::IntField("latency_ms", ElapsedMs(started_at))});
    return response;
  } catch (const util::EscrowError& ex) {
    ESCROW_LOG_WARN("RPC rejected", {observability::StringField("route", route),
                                     observability::StringField("code", util::ToString(ex.code())),
                                     observability::StringField("error", ex.what()),
                                     observability::IntField("latency_ms", ElapsedMs(started_at))});
    throw;
  } catch (const std::exception& ex) {
    ESCROW_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                    observability::IntField("latency_ms", ElapsedMs(started_at))});
    throw;
  }
}

// One info line per committed ledger event.
inline void LogLedgerEvent(std::string_view route, const escrow::ledger::core::v1::LedgerEvent& event) {
  ESCROW_LOG_INFO("ledger event", {observability::StringField("route", route),
                                   observability::UintField("sequence", event.sequence()),
                                   observability::StringField("type", escrow::ledger::core::v1::LedgerEventType_Name(event.type())),
                                   observability::UintField("task_id", event.task_id()),
                                   observability::StringField("actor", event.actor()),
                                   observability::StringField("counterparty", event.counterparty()),
                                   observability::UintField("amount", event.amount()),
                                   observability::UintField("fee", event.fee()),
                                   observability::UintField("refund", event.refund())});
}

} // namespace escrow::service
