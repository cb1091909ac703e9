#include "internal/observability/logging.hpp"

#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace fleet::observability {
namespace {

constexpr const char* kLoggerName     = "fleet-registry";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string ResolveLevel(const fleet::runtime::config::LoggingConfig& config) {
  if (const char* level = std::getenv("FLEET_LOG_LEVEL")) {
    return level;
  }

  if (!config.level().empty()) {
    return config.level();
  }

  return "info";
}

std::string ResolvePattern(const fleet::runtime::config::LoggingConfig& config) {
  if (const char* pattern = std::getenv("FLEET_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.pattern().empty()) {
    return config.pattern();
  }

  return kDefaultPattern;
}

bool g_include_trace_context{false};

// Values containing spaces are quoted so the line stays splittable on ' '.
std::string FormatValue(const std::string& value) {
  if (value.find(' ') == std::string::npos && !value.empty()) {
    return value;
  }
  return '"' + value + '"';
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << FormatValue(field.value);
  }
  return out.str();
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DurationMsField(std::string_view key, double milliseconds) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.1f", milliseconds);
  return {std::string(key), buffer};
}

void InitializeLogging(const fleet::runtime::config::LoggingConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (const char* include_trace = std::getenv("FLEET_LOG_INCLUDE_TRACE_CONTEXT")) {
    g_include_trace_context = std::string(include_trace) == "1" || std::string(include_trace) == "true";
  } else {
    g_include_trace_context = config.include_trace_context();
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto line        = std::string(message);
  auto serialized  = SerializeFields(fields);
  auto trace_field = TraceContextFields();

  if (!serialized.empty()) {
    line += ' ';
    line += serialized;
  }
  if (!trace_field.empty()) {
    line += ' ';
    line += trace_field;
  }
  spdlog::log(level, "{}", line);
}

} // namespace fleet::observability
