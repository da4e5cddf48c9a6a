#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace streamctl::runtime::config {
class RuntimeConfig;
}

namespace streamctl::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

struct LogSettings {
  std::string level{"info"};
  std::string pattern{"%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"};
  bool        include_trace_context{false};
};

// Logging section of the config with STREAMCTL_LOG_LEVEL, STREAMCTL_LOG_PATTERN
// and STREAMCTL_LOG_INCLUDE_TRACE_CONTEXT applied on top.
LogSettings ResolveLogSettings(const streamctl::runtime::config::RuntimeConfig& config);

/*
  Renders "message key=value ...". Values that are empty or contain
  spaces, quotes or '=' are double-quoted. When a RequestSpan is open on
  this thread and no stream_id field was given, its stream id is appended.
*/
std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields);

void InitializeLogging(const streamctl::runtime::config::RuntimeConfig& config);
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

} // namespace streamctl::observability

#define STREAMCTL_LOG_DEBUG(message, ...) ::streamctl::observability::LogDebug((message), ##__VA_ARGS__)
#define STREAMCTL_LOG_INFO(message, ...) ::streamctl::observability::LogInfo((message), ##__VA_ARGS__)
#define STREAMCTL_LOG_WARN(message, ...) ::streamctl::observability::LogWarn((message), ##__VA_ARGS__)
#define STREAMCTL_LOG_ERROR(message, ...) ::streamctl::observability::LogError((message), ##__VA_ARGS__)
