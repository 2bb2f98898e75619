#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace fogmap {

// Library-wide logger named "fogmap", created on first use (stderr, colored).
std::shared_ptr<spdlog::logger> Logger();

bool ParseLogLevel(const std::string& text, spdlog::level::level_enum* outLevel);
const char* ToString(spdlog::level::level_enum level);

}  // namespace fogmap
