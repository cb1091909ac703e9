#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace fleet::runtime::config {
class LoggingConfig;
}

namespace fleet::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationMsField(std::string_view key, double milliseconds);

/*
  Installs the process-wide "fleet-registry" logger.

  Precedence for level and pattern:
    FLEET_LOG_LEVEL / FLEET_LOG_PATTERN environment variables,
    then the logging section of the config, then built-in defaults.
*/
void InitializeLogging(const fleet::runtime::config::LoggingConfig& config);
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

} // namespace fleet::observability

#define FLEET_LOG_DEBUG(message, ...) ::fleet::observability::LogDebug((message), ##__VA_ARGS__)
#define FLEET_LOG_INFO(message, ...) ::fleet::observability::LogInfo((message), ##__VA_ARGS__)
#define FLEET_LOG_WARN(message, ...) ::fleet::observability::LogWarn((message), ##__VA_ARGS__)
#define FLEET_LOG_ERROR(message, ...) ::fleet::observability::LogError((message), ##__VA_ARGS__)
