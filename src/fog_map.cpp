#include "fogmap/core/fog_map.h"

#include "fogmap/core/log.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace fogmap {

namespace {

// Keeps global pixel math well inside int64 range.
constexpr double kMaxTileUnitMagnitude = 1.0e6;

bool IsUsable(const TileUnit& unit) {
  return std::isfinite(unit.x) && std::isfinite(unit.y) &&
         std::fabs(unit.x) < kMaxTileUnitMagnitude && std::fabs(unit.y) < kMaxTileUnitMagnitude;
}

struct TileRange {
  int xMin = 0;
  int xMax = -1;
  int yMin = 0;
  int yMax = -1;
};

// Whole tiles touched by [nw, se], clamped to the world grid.
TileRange TilesCovering(const TileUnit& nw, const TileUnit& se) {
  TileRange range;
  range.xMin = std::max(static_cast<int>(std::floor(nw.x)), 0);
  range.xMax = std::min(static_cast<int>(std::floor(se.x)), kMapWidth - 1);
  range.yMin = std::max(static_cast<int>(std::floor(nw.y)), 0);
  range.yMax = std::min(static_cast<int>(std::floor(se.y)), kMapWidth - 1);
  return range;
}

constexpr int64_t kWorldPixels = static_cast<int64_t>(kMapWidth) << kAllOffset;

// Caps how many pixels Advance moves in one go so 2 * steps * delta fits int64.
constexpr int64_t kMaxAdvanceProduct = int64_t{1} << 60;

int64_t FloorDiv(int64_t a, int64_t b) {
  return a >= 0 ? a / b : -((-a + b - 1) / b);
}

struct LineCursor {
  int64_t x = 0;
  int64_t y = 0;
  int64_t p = 0;
};

// Moves the cursor `steps` pixels along the major axis in closed form, landing
// where Block::AddLine would after stepping one pixel at a time. The error term
// stays in [2*minor - 2*major, 2*minor) for x-major lines and in
// (2*minor - 2*major, 2*minor] for y-major ones, which fixes the number of
// minor-axis steps taken.
LineCursor Advance(LineCursor cursor, int64_t steps, const LineParams& line) {
  const int64_t major = line.xAxisDominant ? line.dx0 : line.dy0;
  const int64_t minor = line.xAxisDominant ? line.dy0 : line.dx0;
  if (major <= 0) {
    return cursor;
  }
  const int64_t sign = line.quadrants13 ? 1 : -1;
  const int64_t chunk = std::max<int64_t>(kMaxAdvanceProduct / major, 1);
  while (steps > 0) {
    const int64_t n = std::min(steps, chunk);
    const int64_t shifted = cursor.p + 2 * n * minor - 2 * minor;
    const int64_t minorSteps = line.xAxisDominant ? FloorDiv(shifted, 2 * major) + 1
                                                  : -FloorDiv(-shifted, 2 * major);
    cursor.p += 2 * n * minor - 2 * minorSteps * major;
    if (line.xAxisDominant) {
      cursor.x += n;
      cursor.y += sign * minorSteps;
    } else {
      cursor.y += n;
      cursor.x += sign * minorSteps;
    }
    steps -= n;
  }
  return cursor;
}

bool OnWorldGrid(const LineCursor& cursor) {
  return cursor.x >= 0 && cursor.y >= 0 && cursor.x < kWorldPixels && cursor.y < kWorldPixels;
}

// Past the near edges on both axes. Monotone along a line.
bool PastNearEdges(const LineCursor& cursor, const LineParams& line) {
  const int64_t major = line.xAxisDominant ? cursor.x : cursor.y;
  const int64_t minor = line.xAxisDominant ? cursor.y : cursor.x;
  if (major < 0) {
    return false;
  }
  return line.quadrants13 ? minor >= 0 : minor < kWorldPixels;
}

// Moves an off-grid cursor to the first pixel of the line inside the world
// grid. Returns false when the rest of the line stays outside.
bool SeekWorldGrid(LineCursor* cursor, int64_t end, const LineParams& line) {
  const int64_t position = line.xAxisDominant ? cursor->x : cursor->y;
  int64_t low = 0;
  int64_t high = end - position;
  if (!PastNearEdges(Advance(*cursor, high, line), line)) {
    return false;
  }
  while (low < high) {
    const int64_t mid = low + (high - low) / 2;
    if (PastNearEdges(Advance(*cursor, mid, line), line)) {
      high = mid;
    } else {
      low = mid + 1;
    }
  }
  const LineCursor entry = Advance(*cursor, low, line);
  if (!OnWorldGrid(entry)) {
    return false;
  }
  *cursor = entry;
  return true;
}

}  // namespace

FogMap::FogMap(TileMap tiles, DirtySet dirty) : tiles_(std::move(tiles)), dirty_(std::move(dirty)) {}

FogMap FogMap::CreateFromFiles(const std::vector<TileFile>& files) {
  if (files.empty()) {
    return Empty();
  }

  TileMap tiles;
  size_t skipped = 0;
  for (const TileFile& file : files) {
    TilePtr tile;
    std::string error;
    if (!Tile::Create(file.name, file.bytes, &tile, &error)) {
      Logger()->warn("{} is not a valid tile file: {}", file.name, error);
      ++skipped;
      continue;
    }
    if (tile->IsTombstone()) {
      Logger()->debug("{} holds no blocks, skipped", file.name);
      ++skipped;
      continue;
    }
    tiles = tiles.Set(tile->Id(), tile);
  }

  Logger()->info("imported {} tiles from {} files ({} skipped)", tiles.Size(), files.size(),
                 skipped);
  return FogMap(std::move(tiles), DirtySet());
}

// Bresenham over the global pixel grid, handed down tile by tile and block by
// block. Each level returns the cursor and error term where it stopped so the
// next tile or block resumes the same line.
FogMap FogMap::AddLine(double startLng, double startLat, double endLng, double endLat,
                       bool value) const {
  if (!IsUsable(LngLatToTileUnit(startLng, startLat)) ||
      !IsUsable(LngLatToTileUnit(endLng, endLat))) {
    Logger()->warn("ignoring line [{}, {}] -> [{}, {}]: coordinates out of range", startLng,
                   startLat, endLng, endLat);
    return *this;
  }

  const GlobalPixel p0 = LngLatToGlobalPixel(startLng, startLat);
  const GlobalPixel p1 = LngLatToGlobalPixel(endLng, endLat);
  const int64_t dx = p1.x - p0.x;
  const int64_t dy = p1.y - p0.y;

  LineParams line;
  line.dx0 = std::llabs(dx);
  line.dy0 = std::llabs(dy);
  line.xAxisDominant = line.dy0 <= line.dx0;
  line.quadrants13 = (dx < 0 && dy < 0) || (dx > 0 && dy > 0);
  line.value = value;

  int64_t x = 0;
  int64_t y = 0;
  int64_t end = 0;
  int64_t p = 0;
  if (line.xAxisDominant) {
    p = 2 * line.dy0 - line.dx0;
    const bool forward = dx >= 0;
    x = forward ? p0.x : p1.x;
    y = forward ? p0.y : p1.y;
    end = forward ? p1.x : p0.x;
  } else {
    p = 2 * line.dx0 - line.dy0;
    const bool forward = dy >= 0;
    x = forward ? p0.x : p1.x;
    y = forward ? p0.y : p1.y;
    end = forward ? p1.y : p0.y;
  }

  TileMap tiles = tiles_;
  DirtySet dirty = dirty_;
  // The visible part of a line is one contiguous run of pixels: skip ahead to
  // it, then stop once the cursor leaves the grid again.
  bool entered = false;
  while (line.xAxisDominant ? x < end : y < end) {
    if (!OnWorldGrid(LineCursor{x, y, p})) {
      LineCursor cursor{x, y, p};
      if (entered || !SeekWorldGrid(&cursor, end, line)) {
        Logger()->debug("line leaves the world grid at pixel ({}, {})", x, y);
        break;
      }
      Logger()->debug("line enters the world grid at pixel ({}, {})", cursor.x, cursor.y);
      x = cursor.x;
      y = cursor.y;
      p = cursor.p;
      continue;
    }
    entered = true;

    const int64_t tileX = FloorShift(x, kAllOffset);
    const int64_t tileY = FloorShift(y, kAllOffset);
    const TileKey key{static_cast<int>(tileX), static_cast<int>(tileY)};

    const TilePtr* found = tiles.Find(key.Index());
    const TilePtr source = found != nullptr ? *found : Tile::CreateEmpty(key.x, key.y);
    const int64_t originX = tileX << kAllOffset;
    const int64_t originY = tileY << kAllOffset;
    const int64_t localEnd = end - (line.xAxisDominant ? originX : originY);
    const TileLineResult step = source->AddLine(x - originX, y - originY, localEnd, p, line);
    x = step.x + originX;
    y = step.y + originY;
    p = step.p;

    if (step.tile == source) {
      continue;
    }
    Logger()->debug("line touched tile {}", key.ToString());
    tiles = tiles.Set(key.Index(), step.tile ? step.tile : Tile::CreateEmpty(key.x, key.y));
    dirty = dirty.Set(key.Index(), true);
  }

  if (tiles.SameRoot(tiles_)) {
    return *this;
  }
  return FogMap(std::move(tiles), std::move(dirty));
}

FogMap FogMap::UpdateBlocks(const MapPatch& patch) const {
  TileMap tiles = tiles_;
  DirtySet dirty = dirty_;

  for (const auto& entry : patch) {
    const TileKey& key = entry.first;
    if (!key.IsInWorld()) {
      Logger()->warn("ignoring block patch for tile {} outside the world grid", key.ToString());
      continue;
    }

    const TilePtr* found = tiles.Find(key.Index());
    TilePtr tile = found != nullptr ? *found : nullptr;
    if (!tile) {
      const bool addsBlocks =
          std::any_of(entry.second.begin(), entry.second.end(),
                      [](const BlockPatch::value_type& change) { return change.second != nullptr; });
      if (!addsBlocks) {
        continue;
      }
      tile = Tile::CreateEmpty(key.x, key.y);
    }

    TilePtr updated = tile->WithBlocks(entry.second);
    if (updated == tile) {
      continue;
    }
    tiles = tiles.Set(key.Index(), std::move(updated));
    dirty = dirty.Set(key.Index(), true);
  }

  if (tiles.SameRoot(tiles_)) {
    return *this;
  }
  return FogMap(std::move(tiles), std::move(dirty));
}

std::vector<BlockRef> FogMap::GetBlocks(const Bbox& bbox) const {
  const TileUnit nw = LngLatToTileUnit(bbox.west, bbox.north);
  const TileUnit se = LngLatToTileUnit(bbox.east, bbox.south);
  std::vector<BlockRef> result;
  if (!IsUsable(nw) || !IsUsable(se)) {
    return result;
  }

  const TileRange range = TilesCovering(nw, se);
  for (int tx = range.xMin; tx <= range.xMax; ++tx) {
    for (int ty = range.yMin; ty <= range.yMax; ++ty) {
      const TileKey key{tx, ty};
      const TilePtr* tile = tiles_.Find(key.Index());
      if (tile == nullptr) {
        continue;
      }
      for (const BlockKey& block : (*tile)->GetIntersectingBlocks(nw.x - tx, nw.y - ty,
                                                                  se.x - tx, se.y - ty)) {
        result.push_back(BlockRef{key, block});
      }
    }
  }
  return result;
}

FogMap FogMap::RemoveBlocks(const BlockSelection& selection) const {
  TileMap tiles = tiles_;
  DirtySet dirty = dirty_;

  for (const auto& entry : selection) {
    const TileKey& key = entry.first;
    const TilePtr* found = tiles.Find(key.Index());
    if (!key.IsInWorld() || found == nullptr) {
      continue;
    }
    const TilePtr tile = *found;
    const TilePtr updated = tile->RemoveBlocks(entry.second);
    if (updated == tile) {
      continue;
    }
    tiles = tiles.Set(key.Index(), updated ? updated : Tile::CreateEmpty(key.x, key.y));
    dirty = dirty.Set(key.Index(), true);
  }

  if (tiles.SameRoot(tiles_)) {
    return *this;
  }
  return FogMap(std::move(tiles), std::move(dirty));
}

FogMap FogMap::ClearBbox(const Bbox& bbox) const {
  const TileUnit nw = LngLatToTileUnit(bbox.west, bbox.north);
  const TileUnit se = LngLatToTileUnit(bbox.east, bbox.south);
  if (!IsUsable(nw) || !IsUsable(se)) {
    Logger()->warn("ignoring clear of a bbox with out-of-range coordinates");
    return *this;
  }

  TileMap tiles = tiles_;
  DirtySet dirty = dirty_;
  const TileRange range = TilesCovering(nw, se);
  for (int tx = range.xMin; tx <= range.xMax; ++tx) {
    for (int ty = range.yMin; ty <= range.yMax; ++ty) {
      const TileKey key{tx, ty};
      const TilePtr* found = tiles.Find(key.Index());
      if (found == nullptr) {
        continue;
      }
      const TilePtr tile = *found;
      const double xp0 = std::max(nw.x - tx, 0.0) * kTileWidth;
      const double yp0 = std::max(nw.y - ty, 0.0) * kTileWidth;
      const double xp1 = std::min(se.x - tx, 1.0) * kTileWidth;
      const double yp1 = std::min(se.y - ty, 1.0) * kTileWidth;
      const TilePtr updated = tile->ClearRect(xp0, yp0, xp1 - xp0, yp1 - yp0);
      if (updated == tile) {
        continue;
      }
      tiles = tiles.Set(key.Index(), updated ? updated : Tile::CreateEmpty(tx, ty));
      dirty = dirty.Set(key.Index(), true);
    }
  }

  if (tiles.SameRoot(tiles_)) {
    return *this;
  }
  return FogMap(std::move(tiles), std::move(dirty));
}

FogMap FogMap::ClearDirtyTiles() const {
  return FogMap(tiles_, DirtySet());
}

bool FogMap::IsDirty(const TileKey& key) const {
  return key.IsInWorld() && dirty_.Contains(key.Index());
}

TilePtr FogMap::FindTile(const TileKey& key) const {
  if (!key.IsInWorld()) {
    return nullptr;
  }
  const TilePtr* tile = tiles_.Find(key.Index());
  return tile != nullptr ? *tile : nullptr;
}

BlockPtr FogMap::FindBlock(const TileKey& tile, const BlockKey& block) const {
  const TilePtr found = FindTile(tile);
  return found ? found->FindBlock(block) : nullptr;
}

size_t FogMap::BlockCount() const {
  size_t count = 0;
  tiles_.ForEach([&count](uint32_t, const TilePtr& tile) { count += tile->BlockCount(); });
  return count;
}

}  // namespace fogmap
