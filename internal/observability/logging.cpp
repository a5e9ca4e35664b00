#include "internal/observability/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

#include "config/config.pb.h"

#ifdef HEARTBEAT_ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace heartbeat::observability {
namespace {

constexpr char kLoggerName[]     = "heartbeat-monitor";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

const char* EnvOrNull(const char* name) {
  const char* value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

std::string ResolveLevelName(const heartbeat::runtime::config::LoggingConfig& logging) {
  if (const char* level = EnvOrNull("HEARTBEAT_LOG_LEVEL")) {
    return level;
  }
  return logging.level().empty() ? "info" : logging.level();
}

std::string ResolvePattern(const heartbeat::runtime::config::LoggingConfig& logging) {
  if (const char* pattern = EnvOrNull("HEARTBEAT_LOG_PATTERN")) {
    return pattern;
  }
  return logging.pattern().empty() ? kDefaultPattern : logging.pattern();
}

bool ResolveTraceContextEnabled(const heartbeat::runtime::config::LoggingConfig& logging) {
  if (const char* include_trace = EnvOrNull("HEARTBEAT_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include_trace);
    return value == "1" || value == "true";
  }
  return logging.include_trace_context();
}

// spdlog maps unknown names to "off"; only an explicit "off" may silence the logger.
bool ParseLevel(const std::string& name, spdlog::level::level_enum* level) {
  *level = spdlog::level::from_str(name);
  return *level != spdlog::level::off || name == "off";
}

// User agents and error messages carry spaces; quote so key=value stays parseable.
void AppendValue(std::string& out, const std::string& value) {
  const bool needs_quotes = value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
  if (!needs_quotes) {
    out += value;
    return;
  }

  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out += '\\';
    }
    out += c;
  }
  out += '"';
}

#ifdef HEARTBEAT_ENABLE_OTEL
void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);

  out += " trace_id=";
  out.append(trace_id, sizeof(trace_id));
  out += " span_id=";
  out.append(span_id, sizeof(span_id));
}
#else
void AppendTraceContext(std::string&) {
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

void InitializeLogging(const heartbeat::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }

  const auto level_name = ResolveLevelName(logging);
  auto       level      = spdlog::level::info;
  const bool level_ok   = ParseLevel(level_name, &level);

  logger->set_pattern(ResolvePattern(logging));
  logger->set_level(level_ok ? level : spdlog::level::info);
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(logging);

  if (!level_ok) {
    LogWarn("unknown log level, using info", {StringField("level", level_name)});
  }
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
    line += field.key;
    line += '=';
    AppendValue(line, field.value);
  }
  AppendTraceContext(line);

  spdlog::log(level, "{}", line);
}

} // namespace heartbeat::observability
