#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace usagestat::runtime::config {
class RuntimeConfig;
}

namespace usagestat::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Operator log on stderr. Safe to skip: spdlog's default logger is used
// until this runs.
void InitializeLogging(const usagestat::runtime::config::RuntimeConfig& config);
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

} // namespace usagestat::observability

#define USAGESTAT_LOG_DEBUG(message, ...) ::usagestat::observability::LogDebug((message), ##__VA_ARGS__)
#define USAGESTAT_LOG_INFO(message, ...) ::usagestat::observability::LogInfo((message), ##__VA_ARGS__)
#define USAGESTAT_LOG_WARN(message, ...) ::usagestat::observability::LogWarn((message), ##__VA_ARGS__)
#define USAGESTAT_LOG_ERROR(message, ...) ::usagestat::observability::LogError((message), ##__VA_ARGS__)
