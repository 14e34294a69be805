#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace alo::runtime::config {
class RuntimeConfig;
}

namespace alo::observability {

// key=value pair appended to a log line
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the process logger. Level and pattern come from the config,
  overridden by ALO_LOG_LEVEL / ALO_LOG_PATTERN /
  ALO_LOG_INCLUDE_TRACE_CONTEXT. Safe to call more than once.
*/
void InitializeLogging(const alo::runtime::config::RuntimeConfig& config);
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

} // namespace alo::observability

#define ALO_LOG_DEBUG(message, ...) ::alo::observability::LogDebug((message), ##__VA_ARGS__)
#define ALO_LOG_INFO(message, ...) ::alo::observability::LogInfo((message), ##__VA_ARGS__)
#define ALO_LOG_WARN(message, ...) ::alo::observability::LogWarn((message), ##__VA_ARGS__)
#define ALO_LOG_ERROR(message, ...) ::alo::observability::LogError((message), ##__VA_ARGS__)
