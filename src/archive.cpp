#include "fogmap/io/archive.h"

#include "fogmap/core/log.h"
#include "fogmap/io/file_io.h"
#include "fogmap/io/zip_container.h"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fogmap {

namespace {

bool Fail(ArchiveErrorCode code, const std::string& message, ArchiveError* outError) {
  if (outError != nullptr) {
    outError->code = code;
    outError->message = message;
  }
  return false;
}

bool ExportTiles(const std::vector<TilePtr>& tiles, bool includeTombstones,
                 const ExportOptions& options, std::vector<uint8_t>* outArchive,
                 ArchiveError* outError) {
  if (outArchive == nullptr) {
    return Fail(ArchiveErrorCode::kIoError, "outArchive must not be null", outError);
  }

  ZipWriter writer;
  std::string error;
  if (!writer.AddDirectory(options.syncFolder, &error)) {
    return Fail(ArchiveErrorCode::kIoError, error, outError);
  }

  const size_t total = tiles.size();
  size_t written = 0;
  for (size_t i = 0; i < total; ++i) {
    const TilePtr& tile = tiles[i];
    if (tile && (includeTombstones || !tile->IsTombstone())) {
      std::vector<uint8_t> bytes;
      if (!tile->Dump(&bytes, &error) ||
          !writer.AddFile(options.syncFolder + "/" + tile->Filename(), bytes, &error)) {
        Logger()->error("export failed at tile {}: {}", tile->Key().ToString(), error);
        return Fail(ArchiveErrorCode::kIoError, error, outError);
      }
      ++written;
    }

    if (options.yieldInterval > 0 && i % options.yieldInterval == 0) {
      if (options.progress) {
        options.progress(i + 1, total);
      }
      if (options.yield) {
        options.yield();
      }
      if (options.shouldCancel && options.shouldCancel()) {
        Logger()->info("export cancelled after {} of {} tiles", i + 1, total);
        return Fail(ArchiveErrorCode::kCancelled, "export cancelled", outError);
      }
    }
  }

  if (options.progress) {
    options.progress(total, total);
  }

  if (!writer.Finish(outArchive, &error)) {
    Logger()->error("export failed: {}", error);
    return Fail(ArchiveErrorCode::kIoError, error, outError);
  }
  Logger()->info("exported {} tiles ({} bytes)", written, outArchive->size());
  return true;
}

}  // namespace

const char* ToString(ArchiveErrorCode code) {
  switch (code) {
    case ArchiveErrorCode::kNone: return "none";
    case ArchiveErrorCode::kNotFound: return "not-found";
    case ArchiveErrorCode::kEmptyArchive: return "empty-archive";
    case ArchiveErrorCode::kNoMatchingFile: return "no-matching-file";
    case ArchiveErrorCode::kInvalidFormat: return "invalid-format";
    case ArchiveErrorCode::kIoError: return "io-error";
    case ArchiveErrorCode::kCancelled: return "cancelled";
  }
  return "unknown";
}

bool ExportArchive(const FogMap& map, const ExportOptions& options,
                   std::vector<uint8_t>* outArchive, ArchiveError* outError) {
  std::vector<TilePtr> tiles;
  tiles.reserve(map.TileCount());
  map.ForEachTile([&tiles](const TilePtr& tile) { tiles.push_back(tile); });
  return ExportTiles(tiles, false, options, outArchive, outError);
}

bool ExportDirtyArchive(const FogMap& map, const ExportOptions& options,
                        std::vector<uint8_t>* outArchive, ArchiveError* outError) {
  std::vector<TilePtr> tiles;
  tiles.reserve(map.GetDirtyTilesCount());
  map.ForEachDirtyTile([&tiles](const TileKey&, const TilePtr& tile) { tiles.push_back(tile); });
  return ExportTiles(tiles, true, options, outArchive, outError);
}

bool WriteArchiveFile(const std::string& path, const std::vector<uint8_t>& archive,
                      ArchiveError* outError) {
  std::string error;
  if (!WriteFileBytes(path, archive, &error)) {
    Logger()->error("{}", error);
    return Fail(ArchiveErrorCode::kIoError, error, outError);
  }
  return true;
}

bool ImportFromZip(const std::vector<uint8_t>& archive, FogMap* outMap, ArchiveError* outError) {
  if (outMap == nullptr) {
    return Fail(ArchiveErrorCode::kIoError, "outMap must not be null", outError);
  }

  ZipReader reader;
  std::string error;
  if (!reader.Open(archive, &error)) {
    return Fail(ArchiveErrorCode::kInvalidFormat, error, outError);
  }

  std::vector<TileFile> files;
  for (const ZipEntry& entry : reader.Entries()) {
    if (entry.IsDirectory()) {
      continue;
    }
    TileFile file;
    file.name = ZipBasename(entry.name);
    if (file.name.empty()) {
      continue;
    }
    if (!reader.Extract(entry, &file.bytes, &error)) {
      Logger()->warn("skipping archive entry: {}", error);
      continue;
    }
    files.push_back(std::move(file));
  }

  if (files.empty()) {
    return Fail(ArchiveErrorCode::kEmptyArchive, "archive contains no tile files", outError);
  }
  *outMap = FogMap::CreateFromFiles(files);
  return true;
}

bool ImportFromFolder(const std::string& path, FogMap* outMap, ArchiveError* outError) {
  if (outMap == nullptr) {
    return Fail(ArchiveErrorCode::kIoError, "outMap must not be null", outError);
  }

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Fail(ArchiveErrorCode::kNotFound, "no such folder: " + path, outError);
  }
  if (!std::filesystem::is_directory(path, ec)) {
    return Fail(ArchiveErrorCode::kInvalidFormat, "not a folder: " + path, outError);
  }

  // Tile files carry no extension.
  std::vector<std::filesystem::path> candidates;
  for (std::filesystem::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && !it->path().has_extension()) {
      candidates.push_back(it->path());
    }
  }
  if (ec) {
    return Fail(ArchiveErrorCode::kIoError, "failed to list " + path + ": " + ec.message(),
                outError);
  }
  std::sort(candidates.begin(), candidates.end());

  std::vector<TileFile> files;
  files.reserve(candidates.size());
  for (const std::filesystem::path& candidate : candidates) {
    TileFile file;
    file.name = candidate.filename().string();
    std::string error;
    if (!ReadFileBytes(candidate.string(), &file.bytes, &error)) {
      Logger()->warn("{}", error);
      continue;
    }
    files.push_back(std::move(file));
  }

  if (files.empty()) {
    return Fail(ArchiveErrorCode::kEmptyArchive, "folder contains no tile files: " + path,
                outError);
  }
  *outMap = FogMap::CreateFromFiles(files);
  return true;
}

bool ImportFromPath(const std::string& path, FogMap* outMap, ArchiveError* outError) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Fail(ArchiveErrorCode::kNotFound, "no such file or folder: " + path, outError);
  }
  if (std::filesystem::is_directory(path, ec)) {
    return ImportFromFolder(path, outMap, outError);
  }

  std::vector<uint8_t> bytes;
  std::string error;
  if (!ReadFileBytes(path, &bytes, &error)) {
    return Fail(ArchiveErrorCode::kIoError, error, outError);
  }
  return ImportFromZip(bytes, outMap, outError);
}

bool FindFileInZip(const std::vector<uint8_t>& archive, const std::string& extension,
                   std::vector<uint8_t>* outData, ArchiveError* outError) {
  if (outData == nullptr) {
    return Fail(ArchiveErrorCode::kIoError, "outData must not be null", outError);
  }

  ZipReader reader;
  std::string error;
  if (!reader.Open(archive, &error)) {
    return Fail(ArchiveErrorCode::kInvalidFormat, error, outError);
  }

  for (const ZipEntry& entry : reader.Entries()) {
    const std::string& name = entry.name;
    if (entry.IsDirectory() || name.size() < extension.size() ||
        name.compare(name.size() - extension.size(), extension.size(), extension) != 0) {
      continue;
    }
    if (!reader.Extract(entry, outData, &error)) {
      return Fail(ArchiveErrorCode::kInvalidFormat, error, outError);
    }
    return true;
  }
  return Fail(ArchiveErrorCode::kNoMatchingFile, "no " + extension + " file in archive",
              outError);
}

}  // namespace fogmap
