#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace wfrun::runtime::config {
class LoggingConfig;
}

namespace wfrun::observability {

// One key=value pair appended to a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

/*
  Installs the "wfrun" logger as the spdlog default.

  Lines go to stderr; wfrunctl keeps stdout for run JSON. The level comes
  from WFRUN_LOG_LEVEL when set, else from config; names spdlog does not
  know fall back to info. Safe to call again, the last call wins.
*/
void InitializeLogging(const wfrun::runtime::config::LoggingConfig& config);
void ShutdownLogging();

// Values containing spaces, quotes or '=' are written quoted.
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace wfrun::observability

#define WFRUN_LOG_DEBUG(message, ...) ::wfrun::observability::Log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define WFRUN_LOG_INFO(message, ...) ::wfrun::observability::Log(spdlog::level::info, (message), ##__VA_ARGS__)
#define WFRUN_LOG_WARN(message, ...) ::wfrun::observability::Log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define WFRUN_LOG_ERROR(message, ...) ::wfrun::observability::Log(spdlog::level::err, (message), ##__VA_ARGS__)
