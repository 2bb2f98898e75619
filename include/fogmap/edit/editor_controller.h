#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "fogmap/core/coords.h"
#include "fogmap/core/fog_map.h"
#include "fogmap/edit/erase_session.h"
#include "fogmap/edit/history.h"
#include "fogmap/edit/tracks.h"
#include "fogmap/io/archive.h"
#include "fogmap/io/config.h"

namespace fogmap {

// Whatever displays the map; told which region to repaint after each change.
class RenderSink {
 public:
  virtual ~RenderSink() = default;

  virtual void RedrawArea(const Bbox& area) = 0;
  virtual void RedrawAll() = 0;
};

// Owns the current FogMap and its history and routes every edit through one
// update path: replace the map, notify the sink, record a snapshot.
class EditorController {
 public:
  using ProgressFn = std::function<void(size_t, size_t)>;

  // `sink` may be null when nothing is displayed; it must outlive the controller.
  EditorController(RenderSink* sink, EditorConfig config);

  const FogMap& Map() const { return map_; }
  const History& GetHistory() const { return history_; }
  const EditorConfig& Config() const { return config_; }

  // Starts a new document: history restarts from the empty map.
  void ReplaceFogMap(const FogMap& map);

  bool DrawLine(const LngLat& from, const LngLat& to, bool value = true);
  bool DrawTrack(const Track& track, bool value = true);
  bool ClearBbox(const Bbox& bbox);
  bool RemoveBlocks(const BlockSelection& selection);
  bool MergeTracks(const std::vector<Track>& tracks, TrackImportResult* outResult);

  // Pixel eraser gesture. EraseTo publishes after every segment but records
  // history only once, in EndErase.
  void BeginErase(const LngLat& start);
  bool EraseTo(const LngLat& point);
  void EndErase();
  bool IsErasing() const { return erase_.has_value(); }
  void SetEraserSize(int size);

  bool Undo();
  bool Redo();

  bool ExportFull(const ProgressFn& progress, std::vector<uint8_t>* outArchive,
                  ArchiveError* outError) const;
  // Clears the dirty set once the archive has been produced.
  bool ExportDirty(const ProgressFn& progress, std::vector<uint8_t>* outArchive,
                   ArchiveError* outError);

 private:
  bool UpdateFogMap(const FogMap& map, const AffectedArea& area, bool skipHistory = false);
  void ApplyFogMapUpdate(const FogMap& map, const AffectedArea& area);
  ExportOptions MakeExportOptions(const ProgressFn& progress) const;

  RenderSink* sink_ = nullptr;
  EditorConfig config_;
  FogMap map_;
  History history_;
  std::optional<EraseSession> erase_;
  LngLat lastErasePos_;
};

}  // namespace fogmap
