#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace {

using wfrun::observability::IntField;
using wfrun::observability::StringField;

// Routes the default logger into a string with the bare message pattern.
std::shared_ptr<spdlog::logger> CaptureInto(std::ostringstream& out, spdlog::level::level_enum level) {
  auto logger = std::make_shared<spdlog::logger>("capture", std::make_shared<spdlog::sinks::ostream_sink_st>(out));
  logger->set_pattern("%v");
  logger->set_level(level);
  spdlog::set_default_logger(logger);
  return logger;
}

void TestFieldsAreKeyValuePairs() {
  std::ostringstream out;
  auto               logger = CaptureInto(out, spdlog::level::info);

  WFRUN_LOG_INFO("workflow run created", {StringField("project", "PROJ"), IntField("run_id", 42)});
  logger->flush();
  assert(out.str() == "workflow run created project=PROJ run_id=42\n");
}

void TestValuesWithSpacesAreQuoted() {
  std::ostringstream out;
  auto               logger = CaptureInto(out, spdlog::level::info);

  WFRUN_LOG_ERROR("engine operation failed", {StringField("error", R"(run 7 is "locked")"), StringField("actor", "")});
  logger->flush();
  assert(out.str() == R"(engine operation failed error="run 7 is \"locked\"" actor="")"
                      "\n");
}

void TestBelowLevelIsDropped() {
  std::ostringstream out;
  auto               logger = CaptureInto(out, spdlog::level::info);

  WFRUN_LOG_DEBUG("run locked by another mutation", {IntField("run_id", 1)});
  logger->flush();
  assert(out.str().empty());
}

void TestLevelResolution() {
  wfrun::runtime::config::LoggingConfig config;

  config.set_level("verbose-ish");
  unsetenv("WFRUN_LOG_LEVEL");
  wfrun::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->name() == "wfrun");
  assert(spdlog::default_logger()->level() == spdlog::level::info);

  config.set_level("warn");
  wfrun::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::warn);

  setenv("WFRUN_LOG_LEVEL", "debug", 1);
  wfrun::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::debug);
  unsetenv("WFRUN_LOG_LEVEL");
}

} // namespace

int main() {
  TestFieldsAreKeyValuePairs();
  TestValuesWithSpacesAreQuoted();
  TestBelowLevelIsDropped();
  TestLevelResolution();

  std::cout << "wfrun_unit_logging: pass\n";
  return 0;
}
