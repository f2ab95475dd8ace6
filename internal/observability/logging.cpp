#include "internal/observability/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace escrow::observability {
namespace {

constexpr const char* kLoggerName     = "escrow-ledger";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

std::string FromEnvOr(const char* variable, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(variable); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  // from_str maps anything it does not know to "off"
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    throw std::runtime_error("unknown log level '" + name + "'");
  }
  return level;
}

bool NeedsQuoting(const std::string& value) {
  return value.empty() || std::any_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) || c == '"'; });
}

void AppendField(std::string& out, const LogField& field) {
  out += field.key;
  out += '=';
  if (!NeedsQuoting(field.value)) {
    out += field.value;
    return;
  }
  out += '"';
  for (char c : field.value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const escrow::runtime::config::RuntimeConfig& config) {
  const auto level   = ParseLevel(FromEnvOr("ESCROW_LOG_LEVEL", config.logging().level(), "info"));
  const auto pattern = FromEnvOr("ESCROW_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  // tests and embedders may initialise more than once
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  // rejected and failed ledger calls reach the sink before the reply does
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }
  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    AppendField(line, field);
  }
  spdlog::log(level, "{}", line);
}

} // namespace escrow::observability
