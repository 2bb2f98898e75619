#pragma once

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <unordered_map>

#include "fogmap/core/block.h"
#include "fogmap/core/coords.h"
#include "fogmap/core/fog_map.h"
#include "fogmap/core/keys.h"

namespace fogmap {

enum class BrushShape {
  Circle,
  Square,
};

const char* ToString(BrushShape shape);
bool ParseBrushShape(const std::string& text, BrushShape* outShape);

// Integer Bresenham from (x0, y0) to (x1, y1), both ends included. `visit`
// is called once per traced pixel in order.
template <typename Fn>
void TraceLine(int64_t x0, int64_t y0, int64_t x1, int64_t y1, Fn&& visit) {
  const int64_t dx = std::llabs(x1 - x0);
  const int64_t dy = std::llabs(y1 - y0);
  const int64_t sx = x0 < x1 ? 1 : -1;
  const int64_t sy = y0 < y1 ? 1 : -1;
  int64_t err = dx - dy;
  int64_t x = x0;
  int64_t y = y0;
  while (true) {
    visit(x, y);
    if (x == x1 && y == y1) {
      break;
    }
    const int64_t e2 = 2 * err;
    if (e2 > -dy) {
      err -= dy;
      x += sx;
    }
    if (e2 < dx) {
      err += dx;
      y += sy;
    }
  }
}

enum class DraftState {
  kUnknown,  // not looked up yet
  kDeleted,  // every pixel erased; publishes as a block removal
  kPresent,  // draft holds the remaining pixels
};

struct EraseResult {
  bool changed = false;
  Bbox segmentBbox;
};

// Pixel eraser for one pointer gesture. Blocks touched by the brush are
// cloned from the base map into private drafts once per gesture; Publish()
// freezes them and merges them into the caller's current map.
class EraseSession {
 public:
  EraseSession(FogMap baseMap, BrushShape shape, int size);

  EraseResult EraseSegment(const LngLat& from, const LngLat& to);

  // Applies every draft to `current`. Drafts unchanged since the previous
  // publish are reused, so repeated publishes only touch new edits.
  FogMap Publish(const FogMap& current);

  const FogMap& BaseMap() const { return baseMap_; }
  BrushShape Shape() const { return shape_; }
  int Size() const { return size_; }

  // Merged bbox of every segment that erased something; empty if none did.
  const std::optional<Bbox>& ErasedArea() const { return erasedArea_; }

 private:
  struct DraftEntry {
    TileKey tile;
    DraftState state = DraftState::kUnknown;
    std::optional<BlockDraft> draft;
    BlockPtr frozen;  // cached Freeze() of `draft`, reset on every edit
  };

  DraftEntry* Lookup(const TileKey& tile, const BlockKey& block);
  bool ErasePixel(int64_t gx, int64_t gy);

  FogMap baseMap_;
  BrushShape shape_ = BrushShape::Circle;
  int size_ = 1;
  std::unordered_map<uint64_t, DraftEntry> entries_;
  std::optional<Bbox> erasedArea_;
};

}  // namespace fogmap
