#include "fogmap/io/config.h"

#include "fogmap/core/log.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace fogmap {

namespace {

bool Fail(const std::string& message, std::string* outError) {
  if (outError != nullptr) {
    *outError = message;
  }
  return false;
}

bool ReadPositiveInt(const nlohmann::json& doc, const char* key, long long* outValue,
                     std::string* outError) {
  if (!doc.contains(key)) {
    return true;
  }
  const nlohmann::json& value = doc[key];
  if (!value.is_number_integer()) {
    return Fail(std::string("Config key '") + key + "' must be an integer", outError);
  }
  const long long parsed = value.get<long long>();
  if (parsed <= 0) {
    return Fail(std::string("Config key '") + key + "' must be positive", outError);
  }
  *outValue = parsed;
  return true;
}

bool ReadString(const nlohmann::json& doc, const char* key, std::string* outValue,
                std::string* outError) {
  if (!doc.contains(key)) {
    return true;
  }
  if (!doc[key].is_string()) {
    return Fail(std::string("Config key '") + key + "' must be a string", outError);
  }
  *outValue = doc[key].get<std::string>();
  return true;
}

}  // namespace

bool ParseEditorConfig(const std::string& text, EditorConfig* outConfig, std::string* outError) {
  if (outConfig == nullptr) {
    return Fail("outConfig must not be null", outError);
  }

  const nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
  if (doc.is_discarded()) {
    return Fail("Failed to parse config JSON", outError);
  }
  if (!doc.is_object()) {
    return Fail("Config JSON must be an object", outError);
  }

  EditorConfig config;

  long long eraserSize = config.eraserSize;
  if (!ReadPositiveInt(doc, "eraserSize", &eraserSize, outError)) {
    return false;
  }
  if (eraserSize > 1024) {
    return Fail("Config key 'eraserSize' must be at most 1024", outError);
  }
  config.eraserSize = static_cast<int>(eraserSize);

  std::string shape = ToString(config.eraserShape);
  if (!ReadString(doc, "eraserShape", &shape, outError)) {
    return false;
  }
  if (!ParseBrushShape(shape, &config.eraserShape)) {
    return Fail("Config key 'eraserShape' must be \"circle\" or \"square\"", outError);
  }

  long long yieldInterval = static_cast<long long>(config.exportYieldInterval);
  if (!ReadPositiveInt(doc, "exportYieldInterval", &yieldInterval, outError)) {
    return false;
  }
  config.exportYieldInterval = static_cast<size_t>(yieldInterval);

  if (doc.contains("skipAntimeridianSegments")) {
    if (!doc["skipAntimeridianSegments"].is_boolean()) {
      return Fail("Config key 'skipAntimeridianSegments' must be a boolean", outError);
    }
    config.skipAntimeridianSegments = doc["skipAntimeridianSegments"].get<bool>();
  }

  long long historyLimit = static_cast<long long>(config.historyLimit);
  if (!ReadPositiveInt(doc, "historyLimit", &historyLimit, outError)) {
    return false;
  }
  config.historyLimit = static_cast<size_t>(historyLimit);

  std::string level = ToString(config.logLevel);
  if (!ReadString(doc, "logLevel", &level, outError)) {
    return false;
  }
  if (!ParseLogLevel(level, &config.logLevel)) {
    return Fail("Config key 'logLevel' has unknown level \"" + level + "\"", outError);
  }

  if (!ReadString(doc, "syncFolder", &config.syncFolder, outError)) {
    return false;
  }
  if (config.syncFolder.empty() || config.syncFolder.find_first_of("/\\") != std::string::npos) {
    return Fail("Config key 'syncFolder' must be a single non-empty folder name", outError);
  }

  *outConfig = config;
  return true;
}

bool LoadEditorConfig(const std::string& path, EditorConfig* outConfig, std::string* outError) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Fail("Failed to open config: " + path, outError);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();

  std::string error;
  if (!ParseEditorConfig(buffer.str(), outConfig, &error)) {
    return Fail(path + ": " + error, outError);
  }
  return true;
}

bool SaveEditorConfig(const std::string& path, const EditorConfig& config, std::string* outError) {
  nlohmann::json doc;
  doc["eraserSize"] = config.eraserSize;
  doc["eraserShape"] = ToString(config.eraserShape);
  doc["exportYieldInterval"] = config.exportYieldInterval;
  doc["skipAntimeridianSegments"] = config.skipAntimeridianSegments;
  doc["historyLimit"] = config.historyLimit;
  doc["logLevel"] = ToString(config.logLevel);
  doc["syncFolder"] = config.syncFolder;

  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Fail("Failed to open config for writing: " + path, outError);
  }
  file << doc.dump(2) << "\n";
  if (!file.good()) {
    return Fail("Failed to write config: " + path, outError);
  }
  return true;
}

void ApplyLogLevel(const EditorConfig& config) {
  Logger()->set_level(config.logLevel);
}

}  // namespace fogmap
