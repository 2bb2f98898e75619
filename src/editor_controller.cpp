#include "fogmap/edit/editor_controller.h"

#include "fogmap/core/log.h"

#include <utility>

namespace fogmap {

EditorController::EditorController(RenderSink* sink, EditorConfig config)
    : sink_(sink),
      config_(std::move(config)),
      map_(FogMap::Empty()),
      history_(FogMap::Empty(), config_.historyLimit) {}

void EditorController::ApplyFogMapUpdate(const FogMap& map, const AffectedArea& area) {
  map_ = map;
  if (sink_ == nullptr) {
    return;
  }
  if (area.all) {
    sink_->RedrawAll();
  } else {
    sink_->RedrawArea(area.bbox);
  }
}

bool EditorController::UpdateFogMap(const FogMap& map, const AffectedArea& area, bool skipHistory) {
  if (map.SharesStateWith(map_)) {
    return false;
  }
  if (!skipHistory) {
    history_.Append(map, area);
  }
  ApplyFogMapUpdate(map, area);
  return true;
}

void EditorController::ReplaceFogMap(const FogMap& map) {
  erase_.reset();
  history_.Reset(FogMap::Empty());
  if (!map.SharesStateWith(FogMap::Empty())) {
    history_.Append(map, AffectedArea::All());
  }
  ApplyFogMapUpdate(map, AffectedArea::All());
  Logger()->info("map replaced: {} tiles, {} blocks", map_.TileCount(), map_.BlockCount());
}

bool EditorController::DrawLine(const LngLat& from, const LngLat& to, bool value) {
  return UpdateFogMap(map_.AddLine(from.lng, from.lat, to.lng, to.lat, value),
                      AffectedArea::Of(Bbox::FromTwoPoints(from, to)));
}

bool EditorController::DrawTrack(const Track& track, bool value) {
  Bbox area;
  if (!Bbox::FromCoordinates(track, &area)) {
    return false;
  }
  return UpdateFogMap(
      fogmap::DrawTrack(map_, track, value, config_.skipAntimeridianSegments),
      AffectedArea::Of(area));
}

bool EditorController::ClearBbox(const Bbox& bbox) {
  return UpdateFogMap(map_.ClearBbox(bbox), AffectedArea::Of(bbox));
}

bool EditorController::RemoveBlocks(const BlockSelection& selection) {
  std::optional<Bbox> area;
  for (const auto& entry : selection) {
    const TileKey& tile = entry.first;
    for (const BlockKey& block : entry.second) {
      if (!map_.FindBlock(tile, block)) {
        continue;
      }
      const Bbox blockArea = BlockBbox(tile.x, tile.y, block.x, block.y);
      area = area ? Bbox::Merge(*area, blockArea) : blockArea;
    }
  }
  return UpdateFogMap(map_.RemoveBlocks(selection),
                      area ? AffectedArea::Of(*area) : AffectedArea::All());
}

bool EditorController::MergeTracks(const std::vector<Track>& tracks,
                                   TrackImportResult* outResult) {
  TrackImportResult result = BuildTrackMap(tracks, config_.skipAntimeridianSegments);
  const FogMap merged = MergeFogMaps(map_, result.map);
  const AffectedArea area = result.bbox ? AffectedArea::Of(*result.bbox) : AffectedArea::All();
  if (outResult != nullptr) {
    *outResult = std::move(result);
  }
  return UpdateFogMap(merged, area);
}

void EditorController::BeginErase(const LngLat& start) {
  erase_.emplace(map_, config_.eraserShape, config_.eraserSize);
  lastErasePos_ = start;
}

bool EditorController::EraseTo(const LngLat& point) {
  if (!erase_) {
    return false;
  }
  const EraseResult result = erase_->EraseSegment(lastErasePos_, point);
  lastErasePos_ = point;
  if (!result.changed) {
    return false;
  }
  return UpdateFogMap(erase_->Publish(map_), AffectedArea::Of(result.segmentBbox), true);
}

void EditorController::EndErase() {
  if (!erase_) {
    return;
  }
  if (erase_->ErasedArea()) {
    history_.Append(map_, AffectedArea::Of(*erase_->ErasedArea()));
  }
  erase_.reset();
}

void EditorController::SetEraserSize(int size) {
  if (size > 0) {
    config_.eraserSize = size;
  }
}

bool EditorController::Undo() {
  erase_.reset();
  return history_.Undo([this](const FogMap& map, const AffectedArea& area) {
    ApplyFogMapUpdate(map, area);
  });
}

bool EditorController::Redo() {
  erase_.reset();
  return history_.Redo([this](const FogMap& map, const AffectedArea& area) {
    ApplyFogMapUpdate(map, area);
  });
}

ExportOptions EditorController::MakeExportOptions(const ProgressFn& progress) const {
  ExportOptions options;
  options.progress = progress;
  options.yieldInterval = config_.exportYieldInterval;
  options.syncFolder = config_.syncFolder;
  return options;
}

bool EditorController::ExportFull(const ProgressFn& progress, std::vector<uint8_t>* outArchive,
                                  ArchiveError* outError) const {
  return ExportArchive(map_, MakeExportOptions(progress), outArchive, outError);
}

bool EditorController::ExportDirty(const ProgressFn& progress, std::vector<uint8_t>* outArchive,
                                   ArchiveError* outError) {
  if (!ExportDirtyArchive(map_, MakeExportOptions(progress), outArchive, outError)) {
    return false;
  }
  map_ = map_.ClearDirtyTiles();
  return true;
}

}  // namespace fogmap
