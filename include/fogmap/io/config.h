#pragma once

#include <cstddef>
#include <string>

#include <spdlog/spdlog.h>

#include "fogmap/edit/erase_session.h"

namespace fogmap {

struct EditorConfig {
  int eraserSize = 5;  // brush diameter in global pixels
  BrushShape eraserShape = BrushShape::Circle;
  size_t exportYieldInterval = 50;
  bool skipAntimeridianSegments = true;
  size_t historyLimit = 100;
  spdlog::level::level_enum logLevel = spdlog::level::info;
  std::string syncFolder = "Sync";
};

// Missing keys keep their defaults; present keys are type and range checked.
bool LoadEditorConfig(const std::string& path, EditorConfig* outConfig, std::string* outError);
bool ParseEditorConfig(const std::string& text, EditorConfig* outConfig, std::string* outError);
bool SaveEditorConfig(const std::string& path, const EditorConfig& config, std::string* outError);

// Applies logLevel to the library logger.
void ApplyLogLevel(const EditorConfig& config);

}  // namespace fogmap
