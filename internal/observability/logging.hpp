#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>

namespace rnaflow::config {
class LoggingConfig;
}

namespace rnaflow::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const rnaflow::config::LoggingConfig& config, bool verbose = false);
// Mirrors every subsequent record into `path` (parent directories are created).
void AttachLogFile(const std::filesystem::path& path);
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

} // namespace rnaflow::observability

#define RNAFLOW_LOG_DEBUG(message, ...) ::rnaflow::observability::LogDebug((message), ##__VA_ARGS__)
#define RNAFLOW_LOG_INFO(message, ...) ::rnaflow::observability::LogInfo((message), ##__VA_ARGS__)
#define RNAFLOW_LOG_WARN(message, ...) ::rnaflow::observability::LogWarn((message), ##__VA_ARGS__)
#define RNAFLOW_LOG_ERROR(message, ...) ::rnaflow::observability::LogError((message), ##__VA_ARGS__)
