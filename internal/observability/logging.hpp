#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace pointzilla::runtime::config {
class LoggingConfig;
}

namespace pointzilla::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const pointzilla::runtime::config::LoggingConfig& config);
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

} // namespace pointzilla::observability

#define POINTZILLA_LOG_DEBUG(message, ...) ::pointzilla::observability::LogDebug((message), ##__VA_ARGS__)
#define POINTZILLA_LOG_INFO(message, ...) ::pointzilla::observability::LogInfo((message), ##__VA_ARGS__)
#define POINTZILLA_LOG_WARN(message, ...) ::pointzilla::observability::LogWarn((message), ##__VA_ARGS__)
#define POINTZILLA_LOG_ERROR(message, ...) ::pointzilla::observability::LogError((message), ##__VA_ARGS__)
