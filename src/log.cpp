#include "fogmap/core/log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace fogmap {

namespace {

constexpr const char* kLoggerName = "fogmap";

}  // namespace

std::shared_ptr<spdlog::logger> Logger() {
  std::shared_ptr<spdlog::logger> logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
  }
  return logger;
}

bool ParseLogLevel(const std::string& text, spdlog::level::level_enum* outLevel) {
  if (outLevel == nullptr) {
    return false;
  }
  if (text == "debug") {
    *outLevel = spdlog::level::debug;
    return true;
  }
  if (text == "info") {
    *outLevel = spdlog::level::info;
    return true;
  }
  if (text == "warn") {
    *outLevel = spdlog::level::warn;
    return true;
  }
  if (text == "error") {
    *outLevel = spdlog::level::err;
    return true;
  }
  if (text == "off") {
    *outLevel = spdlog::level::off;
    return true;
  }
  return false;
}

const char* ToString(spdlog::level::level_enum level) {
  switch (level) {
    case spdlog::level::trace: return "debug";
    case spdlog::level::debug: return "debug";
    case spdlog::level::info: return "info";
    case spdlog::level::warn: return "warn";
    case spdlog::level::err: return "error";
    case spdlog::level::critical: return "error";
    case spdlog::level::off: return "off";
    default: break;
  }
  return "info";
}

}  // namespace fogmap
