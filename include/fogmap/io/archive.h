#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "fogmap/core/fog_map.h"

namespace fogmap {

enum class ArchiveErrorCode {
  kNone,
  kNotFound,
  kEmptyArchive,
  kNoMatchingFile,
  kInvalidFormat,
  kIoError,
  kCancelled,
};

struct ArchiveError {
  ArchiveErrorCode code = ArchiveErrorCode::kNone;
  std::string message;
};

const char* ToString(ArchiveErrorCode code);

struct ExportOptions {
  // (processed, total) tiles; called every `yieldInterval` tiles and once at the end.
  std::function<void(size_t, size_t)> progress;
  // Cooperative suspension point, called next to `progress`.
  std::function<void()> yield;
  // Checked at each yield point; returning true aborts with kCancelled.
  std::function<bool()> shouldCancel;
  size_t yieldInterval = 50;
  std::string syncFolder = "Sync";
};

// Every non-empty tile as <syncFolder>/<filename>.
bool ExportArchive(const FogMap& map, const ExportOptions& options,
                   std::vector<uint8_t>* outArchive, ArchiveError* outError);

// Dirty tiles only, tombstones included, so the receiver learns about removals.
bool ExportDirtyArchive(const FogMap& map, const ExportOptions& options,
                        std::vector<uint8_t>* outArchive, ArchiveError* outError);

bool WriteArchiveFile(const std::string& path, const std::vector<uint8_t>& archive,
                      ArchiveError* outError);

// Tile files are matched by basename; directory entries are ignored.
bool ImportFromZip(const std::vector<uint8_t>& archive, FogMap* outMap, ArchiveError* outError);
bool ImportFromFolder(const std::string& path, FogMap* outMap, ArchiveError* outError);
// Folder or .zip file, decided by what `path` is.
bool ImportFromPath(const std::string& path, FogMap* outMap, ArchiveError* outError);

// Picks the first entry whose name ends in `extension` (e.g. ".kml" in a KMZ).
bool FindFileInZip(const std::vector<uint8_t>& archive, const std::string& extension,
                   std::vector<uint8_t>* outData, ArchiveError* outError);

}  // namespace fogmap
