#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace relaynorm::observability {
namespace {

constexpr const char* kLoggerName = "relaynorm";

std::string ResolveLevel(const relaynorm::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("RELAYNORM_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const relaynorm::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("RELAYNORM_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";
}

// values with spaces are quoted so the line stays key=value parseable
std::string QuoteIfNeeded(const std::string& value) {
  if (!value.empty() && value.find_first_of(" \t\"=") == std::string::npos) {
    return value;
  }
  std::ostringstream out;
  out << std::quoted(value);
  return out.str();
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << QuoteIfNeeded(field.value);
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const relaynorm::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace relaynorm::observability
