#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace sessionkeeper::runtime::config {
class RuntimeConfig;
}

namespace sessionkeeper::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationMsField(std::string_view key, std::int64_t millis);

void InitializeLogging(const sessionkeeper::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Installs a stdout logger with defaults; used by tools and tests that never load a config.
void InitializeDefaultLogging(std::string_view level = "info");

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

} // namespace sessionkeeper::observability

#define SESSIONKEEPER_LOG_DEBUG(message, ...) ::sessionkeeper::observability::LogDebug((message), ##__VA_ARGS__)
#define SESSIONKEEPER_LOG_INFO(message, ...) ::sessionkeeper::observability::LogInfo((message), ##__VA_ARGS__)
#define SESSIONKEEPER_LOG_WARN(message, ...) ::sessionkeeper::observability::LogWarn((message), ##__VA_ARGS__)
#define SESSIONKEEPER_LOG_ERROR(message, ...) ::sessionkeeper::observability::LogError((message), ##__VA_ARGS__)
