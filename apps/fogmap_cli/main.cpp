#include "fogmap/core/fog_map.h"
#include "fogmap/core/log.h"
#include "fogmap/edit/editor_controller.h"
#include "fogmap/edit/tracks.h"
#include "fogmap/io/archive.h"
#include "fogmap/io/config.h"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

enum class EditKind {
  Line,
  EraseLine,
  ClearBbox,
  RemoveBlocks,
  Undo,
  Redo,
};

struct EditOp {
  EditKind kind = EditKind::Line;
  double values[4] = {0.0, 0.0, 0.0, 0.0};
};

struct CliOptions {
  std::string configPath;
  std::string writeConfigPath;
  std::string importPath;
  std::vector<std::string> trackPaths;
  std::vector<EditOp> edits;
  std::string exportPath;
  std::string exportDirtyPath;
  bool stats = false;
};

void PrintUsage(const char* exe) {
  std::cout
      << "Usage: " << exe << " [options]\n"
      << "  --config <path>                  Load editor settings (JSON)\n"
      << "  --write-config <path>            Save the effective settings (JSON)\n"
      << "  --import <path>                  Import a Sync folder or .zip archive\n"
      << "  --track <path>                   Merge a JSON/GeoJSON track (or .zip); repeatable\n"
      << "  --line <lng1> <lat1> <lng2> <lat2>        Reveal a segment\n"
      << "  --erase-line <lng1> <lat1> <lng2> <lat2>  Erase along a segment with the brush\n"
      << "  --clear-bbox <west> <south> <east> <north>     Clear pixels in a box\n"
      << "  --remove-blocks <west> <south> <east> <north>  Remove whole blocks in a box\n"
      << "  --undo / --redo                  Step through edit history\n"
      << "  --stats                          Print tile/block counts\n"
      << "  --export <path>                  Write every tile as a Sync/ zip\n"
      << "  --export-dirty <path>            Write changed tiles only as a Sync/ zip\n"
      << "Edits run in the order given, after import and tracks.\n";
}

bool ParseDouble(const std::string& text, double* outValue) {
  if (outValue == nullptr || text.empty()) {
    return false;
  }
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0' || !std::isfinite(value)) {
    return false;
  }
  *outValue = value;
  return true;
}

bool ParseEditArgs(int argc, char** argv, int* index, const std::string& arg, EditKind kind,
                   CliOptions* options, std::string* outError) {
  if (*index + 4 >= argc) {
    if (outError != nullptr) {
      *outError = arg + " requires four numbers";
    }
    return false;
  }
  EditOp op;
  op.kind = kind;
  for (int k = 0; k < 4; ++k) {
    if (!ParseDouble(argv[*index + 1 + k], &op.values[k])) {
      if (outError != nullptr) {
        *outError = arg + " arguments must be valid numbers";
      }
      return false;
    }
  }
  *index += 4;
  options->edits.push_back(op);
  return true;
}

bool ParsePathArg(int argc, char** argv, int* index, const std::string& arg, std::string* outPath,
                  std::string* outError) {
  if (*index + 1 >= argc) {
    if (outError != nullptr) {
      *outError = arg + " requires a path";
    }
    return false;
  }
  *outPath = argv[++*index];
  return true;
}

bool ParseArgs(int argc, char** argv, CliOptions* outOptions, std::string* outError) {
  if (outOptions == nullptr) {
    if (outError != nullptr) {
      *outError = "internal argument parser error";
    }
    return false;
  }

  CliOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--line" || arg == "--erase-line" || arg == "--clear-bbox" ||
        arg == "--remove-blocks") {
      EditKind kind = EditKind::Line;
      if (arg == "--erase-line") {
        kind = EditKind::EraseLine;
      } else if (arg == "--clear-bbox") {
        kind = EditKind::ClearBbox;
      } else if (arg == "--remove-blocks") {
        kind = EditKind::RemoveBlocks;
      }
      if (!ParseEditArgs(argc, argv, &i, arg, kind, &options, outError)) {
        return false;
      }
      continue;
    }

    if (arg == "--undo" || arg == "--redo") {
      EditOp op;
      op.kind = arg == "--undo" ? EditKind::Undo : EditKind::Redo;
      options.edits.push_back(op);
      continue;
    }

    if (arg == "--track") {
      std::string path;
      if (!ParsePathArg(argc, argv, &i, arg, &path, outError)) {
        return false;
      }
      options.trackPaths.push_back(path);
      continue;
    }

    std::string* pathTarget = nullptr;
    if (arg == "--config") {
      pathTarget = &options.configPath;
    } else if (arg == "--write-config") {
      pathTarget = &options.writeConfigPath;
    } else if (arg == "--import") {
      pathTarget = &options.importPath;
    } else if (arg == "--export") {
      pathTarget = &options.exportPath;
    } else if (arg == "--export-dirty") {
      pathTarget = &options.exportDirtyPath;
    }
    if (pathTarget != nullptr) {
      if (!ParsePathArg(argc, argv, &i, arg, pathTarget, outError)) {
        return false;
      }
      continue;
    }

    if (arg == "--stats") {
      options.stats = true;
      continue;
    }

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return false;
    }

    if (outError != nullptr) {
      *outError = "unknown argument: " + arg;
    }
    return false;
  }

  *outOptions = options;
  return true;
}

// Headless display: records how much of the map would be repainted.
class ConsoleRenderSink : public fogmap::RenderSink {
 public:
  void RedrawArea(const fogmap::Bbox& area) override {
    ++areaRedraws_;
    fogmap::Logger()->debug("redraw [{:.5f}, {:.5f}, {:.5f}, {:.5f}]", area.west, area.south,
                            area.east, area.north);
  }

  void RedrawAll() override {
    ++fullRedraws_;
    fogmap::Logger()->debug("redraw all");
  }

  int AreaRedraws() const { return areaRedraws_; }
  int FullRedraws() const { return fullRedraws_; }

 private:
  int areaRedraws_ = 0;
  int fullRedraws_ = 0;
};

fogmap::Bbox BboxFromValues(const double values[4]) {
  return fogmap::Bbox::FromTwoPoints(fogmap::LngLat{values[0], values[1]},
                                     fogmap::LngLat{values[2], values[3]});
}

void RunEdit(const EditOp& op, fogmap::EditorController* controller) {
  const fogmap::LngLat from{op.values[0], op.values[1]};
  const fogmap::LngLat to{op.values[2], op.values[3]};
  switch (op.kind) {
    case EditKind::Line:
      controller->DrawLine(from, to, true);
      break;
    case EditKind::EraseLine:
      controller->BeginErase(from);
      controller->EraseTo(to);
      controller->EndErase();
      break;
    case EditKind::ClearBbox:
      controller->ClearBbox(BboxFromValues(op.values));
      break;
    case EditKind::RemoveBlocks: {
      fogmap::BlockSelection selection;
      for (const fogmap::BlockRef& ref : controller->Map().GetBlocks(BboxFromValues(op.values))) {
        selection[ref.tile].insert(ref.block);
      }
      controller->RemoveBlocks(selection);
      break;
    }
    case EditKind::Undo:
      if (!controller->Undo()) {
        std::cerr << "Nothing to undo\n";
      }
      break;
    case EditKind::Redo:
      if (!controller->Redo()) {
        std::cerr << "Nothing to redo\n";
      }
      break;
  }
}

void PrintStats(const fogmap::FogMap& map) {
  size_t tombstones = 0;
  map.ForEachTile([&tombstones](const fogmap::TilePtr& tile) {
    if (tile->IsTombstone()) {
      ++tombstones;
    }
  });
  std::cout << "tiles=" << map.TileCount() << " blocks=" << map.BlockCount()
            << " dirty=" << map.GetDirtyTilesCount() << " empty=" << tombstones << "\n";
}

bool WriteExport(const std::string& path, const std::vector<uint8_t>& archive) {
  fogmap::ArchiveError error;
  if (!fogmap::WriteArchiveFile(path, archive, &error)) {
    std::cerr << "Export error: " << error.message << "\n";
    return false;
  }
  std::cout << "Exported: " << path << " (" << archive.size() << " bytes)\n";
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions options;
  std::string parseError;
  if (!ParseArgs(argc, argv, &options, &parseError)) {
    if (!parseError.empty()) {
      std::cerr << "Argument error: " << parseError << "\n";
    }
    PrintUsage(argv[0]);
    return parseError.empty() ? 0 : 1;
  }

  fogmap::EditorConfig config;
  if (!options.configPath.empty()) {
    std::string error;
    if (!fogmap::LoadEditorConfig(options.configPath, &config, &error)) {
      std::cerr << "Config error: " << error << "\n";
      return 1;
    }
  }
  fogmap::ApplyLogLevel(config);

  if (!options.writeConfigPath.empty()) {
    std::string error;
    if (!fogmap::SaveEditorConfig(options.writeConfigPath, config, &error)) {
      std::cerr << "Config error: " << error << "\n";
      return 1;
    }
  }

  ConsoleRenderSink sink;
  fogmap::EditorController controller(&sink, config);

  if (!options.importPath.empty()) {
    fogmap::FogMap imported;
    fogmap::ArchiveError error;
    if (!fogmap::ImportFromPath(options.importPath, &imported, &error)) {
      std::cerr << "Import error (" << fogmap::ToString(error.code) << "): " << error.message
                << "\n";
      return 1;
    }
    controller.ReplaceFogMap(imported);
    std::cout << "Imported: " << options.importPath << " (tiles=" << imported.TileCount()
              << ", blocks=" << imported.BlockCount() << ")\n";
  }

  for (const std::string& trackPath : options.trackPaths) {
    std::vector<fogmap::Track> tracks;
    fogmap::ArchiveError error;
    if (!fogmap::LoadTrackFile(trackPath, &tracks, &error)) {
      std::cerr << "Track error (" << fogmap::ToString(error.code) << "): " << error.message
                << "\n";
      return 1;
    }
    fogmap::TrackImportResult result;
    controller.MergeTracks(tracks, &result);
    std::cout << "Merged track: " << trackPath << " (" << tracks.size() << " lines";
    if (result.firstCoordinate) {
      std::cout << ", starts at " << result.firstCoordinate->lng << "," << result.firstCoordinate->lat;
    }
    std::cout << ")\n";
  }

  for (const EditOp& op : options.edits) {
    RunEdit(op, &controller);
  }

  if (options.stats) {
    PrintStats(controller.Map());
  }

  const auto progress = [](size_t current, size_t total) {
    fogmap::Logger()->debug("exporting {}/{}", current, total);
  };

  if (!options.exportDirtyPath.empty()) {
    std::vector<uint8_t> archive;
    fogmap::ArchiveError error;
    if (!controller.ExportDirty(progress, &archive, &error)) {
      std::cerr << "Export error (" << fogmap::ToString(error.code) << "): " << error.message
                << "\n";
      return 1;
    }
    if (!WriteExport(options.exportDirtyPath, archive)) {
      return 1;
    }
  }

  if (!options.exportPath.empty()) {
    std::vector<uint8_t> archive;
    fogmap::ArchiveError error;
    if (!controller.ExportFull(progress, &archive, &error)) {
      std::cerr << "Export error (" << fogmap::ToString(error.code) << "): " << error.message
                << "\n";
      return 1;
    }
    if (!WriteExport(options.exportPath, archive)) {
      return 1;
    }
  }

  fogmap::Logger()->debug("redraws: {} areas, {} full", sink.AreaRedraws(), sink.FullRedraws());
  return 0;
}
