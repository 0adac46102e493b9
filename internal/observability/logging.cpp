#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/span_context.h>
#endif

namespace wfrun::observability {
namespace {

constexpr const char* kLoggerName     = "wfrun";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_trace_ids = false;

spdlog::level::level_enum ResolveLevel(const wfrun::runtime::config::LoggingConfig& config) {
  std::string name = config.level();
  if (const char* env = std::getenv("WFRUN_LOG_LEVEL"); env != nullptr && *env != '\0') {
    name = env;
  }
  if (name.empty()) {
    return spdlog::level::info;
  }

  // from_str maps unknown names to off
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    return spdlog::level::info;
  }
  return level;
}

void AppendValue(std::string& line, std::string_view value) {
  if (!value.empty() && value.find_first_of(" \"=") == std::string_view::npos) {
    line.append(value);
    return;
  }
  line.push_back('"');
  for (const char c : value) {
    if (c == '"' || c == '\\') line.push_back('\\');
    line.push_back(c);
  }
  line.push_back('"');
}

#ifdef ENABLE_OTEL
// ids of the span opened by the engine operation in progress, if any
void AppendTraceIds(std::string& line) {
  auto       span    = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  line.append(" trace_id=").append(trace_id, sizeof(trace_id));
  line.append(" span_id=").append(span_id, sizeof(span_id));
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

void InitializeLogging(const wfrun::runtime::config::LoggingConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }
  logger->set_pattern(config.pattern().empty() ? kDefaultPattern : config.pattern());
  logger->set_level(ResolveLevel(config));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);

  g_trace_ids = config.include_trace_context();
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    line.push_back(' ');
    line.append(field.key);
    line.push_back('=');
    AppendValue(line, field.value);
  }
#ifdef ENABLE_OTEL
  if (g_trace_ids) {
    AppendTraceIds(line);
  }
#endif
  logger->log(level, "{}", line);
}

} // namespace wfrun::observability
