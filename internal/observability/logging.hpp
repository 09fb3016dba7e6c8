#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace availability::runtime::config {
class RuntimeConfig;
}

namespace availability::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DateField(std::string_view key, std::chrono::sys_days value);

// Level and pattern from config, overridden by AVAILABILITY_LOG_LEVEL and
// AVAILABILITY_LOG_PATTERN.
void InitializeLogging(const availability::runtime::config::RuntimeConfig& config);
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

} // namespace availability::observability

#define AVAILABILITY_LOG_DEBUG(message, ...) ::availability::observability::LogDebug((message), ##__VA_ARGS__)
#define AVAILABILITY_LOG_INFO(message, ...) ::availability::observability::LogInfo((message), ##__VA_ARGS__)
#define AVAILABILITY_LOG_WARN(message, ...) ::availability::observability::LogWarn((message), ##__VA_ARGS__)
#define AVAILABILITY_LOG_ERROR(message, ...) ::availability::observability::LogError((message), ##__VA_ARGS__)
