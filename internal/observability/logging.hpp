#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace escrow::runtime::config {
class RuntimeConfig;
}

namespace escrow::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Structured logging on top of spdlog.

  Lines read "<message> key=value ...". Level and pattern come from
  ESCROW_LOG_LEVEL / ESCROW_LOG_PATTERN, then logging.level /
  logging.pattern in the config. An unknown level name throws.
*/
void InitializeLogging(const escrow::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace escrow::observability

#define ESCROW_LOG_DEBUG(message, ...) ::escrow::observability::LogDebug((message), ##__VA_ARGS__)
#define ESCROW_LOG_INFO(message, ...) ::escrow::observability::LogInfo((message), ##__VA_ARGS__)
#define ESCROW_LOG_WARN(message, ...) ::escrow::observability::LogWarn((message), ##__VA_ARGS__)
#define ESCROW_LOG_ERROR(message, ...) ::escrow::observability::LogError((message), ##__VA_ARGS__)
