#include "internal/observability/logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace streamctl::observability {
namespace {

constexpr const char* kLoggerName = "streamctl";

bool g_include_trace_context{false};

bool NeedsQuoting(std::string_view value) {
  return value.empty() || value.find_first_of(" \t\"=") != std::string_view::npos;
}

void AppendField(std::string& line, std::string_view key, std::string_view value) {
  line.push_back(' ');
  line.append(key);
  line.push_back('=');
  if (!NeedsQuoting(value)) {
    line.append(value);
    return;
  }
  line.push_back('"');
  for (const char c : value) {
    if (c == '"' || c == '\\') {
      line.push_back('\\');
    }
    line.push_back(c);
  }
  line.push_back('"');
}

#ifdef ENABLE_OTEL
void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) {
    return;
  }

  const auto context = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent())->GetContext();
  if (!context.IsValid()) {
    return;
  }

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  AppendField(line, "trace_id", std::string_view(trace_id, sizeof(trace_id)));
  AppendField(line, "span_id", std::string_view(span_id, sizeof(span_id)));
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

LogSettings ResolveLogSettings(const streamctl::runtime::config::RuntimeConfig& config) {
  LogSettings settings;
  const auto& logging = config.logging();

  if (const char* level = std::getenv("STREAMCTL_LOG_LEVEL")) {
    settings.level = level;
  } else if (!logging.level().empty()) {
    settings.level = logging.level();
  }

  if (const char* pattern = std::getenv("STREAMCTL_LOG_PATTERN")) {
    settings.pattern = pattern;
  } else if (!logging.pattern().empty()) {
    settings.pattern = logging.pattern();
  }

  settings.include_trace_context = logging.include_trace_context();
  if (const char* flag = std::getenv("STREAMCTL_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(flag);
    settings.include_trace_context = value == "1" || value == "true";
  }
  return settings;
}

std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field.key, field.value);
  }

  const auto stream_id = CurrentStreamId();
  if (!stream_id.empty() && std::none_of(fields.begin(), fields.end(), [](const LogField& f) { return f.key == "stream_id"; })) {
    AppendField(line, "stream_id", stream_id);
  }

  AppendTraceContext(line);
  return line;
}

void InitializeLogging(const streamctl::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveLogSettings(config);

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(spdlog::level::from_str(settings.level));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context = settings.include_trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  const auto logger = spdlog::default_logger();
  if (!logger || !logger->should_log(level)) {
    return;
  }
  logger->log(level, "{}", FormatLine(message, fields));
}

} // namespace streamctl::observability
