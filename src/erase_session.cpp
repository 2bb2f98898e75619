#include "fogmap/edit/erase_session.h"

#include "fogmap/core/log.h"

#include <cmath>
#include <unordered_set>
#include <utility>

namespace fogmap {

namespace {

uint64_t EntryKey(const TileKey& tile, const BlockKey& block) {
  return (static_cast<uint64_t>(tile.Index()) << 14) | block.Index();
}

uint64_t PixelKey(int64_t gx, int64_t gy) {
  return (static_cast<uint64_t>(gx) << 32) | static_cast<uint32_t>(gy);
}

bool IsFinite(const LngLat& point) {
  return std::isfinite(point.lng) && std::isfinite(point.lat);
}

}  // namespace

const char* ToString(BrushShape shape) {
  switch (shape) {
    case BrushShape::Circle: return "circle";
    case BrushShape::Square: return "square";
  }
  return "circle";
}

bool ParseBrushShape(const std::string& text, BrushShape* outShape) {
  if (outShape == nullptr) {
    return false;
  }
  if (text == "circle") {
    *outShape = BrushShape::Circle;
    return true;
  }
  if (text == "square") {
    *outShape = BrushShape::Square;
    return true;
  }
  return false;
}

EraseSession::EraseSession(FogMap baseMap, BrushShape shape, int size)
    : baseMap_(std::move(baseMap)), shape_(shape), size_(size > 0 ? size : 1) {}

EraseSession::DraftEntry* EraseSession::Lookup(const TileKey& tile, const BlockKey& block) {
  const uint64_t key = EntryKey(tile, block);
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    return &it->second;
  }

  const BlockPtr original = baseMap_.FindBlock(tile, block);
  if (!original) {
    return nullptr;
  }
  DraftEntry entry;
  entry.tile = tile;
  entry.state = DraftState::kPresent;
  entry.draft = original->Draft();
  entry.frozen = original;
  return &entries_.emplace(key, std::move(entry)).first->second;
}

bool EraseSession::ErasePixel(int64_t gx, int64_t gy) {
  const int64_t tileX = FloorShift(gx, kAllOffset);
  const int64_t tileY = FloorShift(gy, kAllOffset);
  if (tileX < 0 || tileY < 0 || tileX >= kMapWidth || tileY >= kMapWidth) {
    return false;
  }
  const TileKey tile{static_cast<int>(tileX), static_cast<int>(tileY)};
  const BlockKey block{static_cast<int>((gx >> kBitmapWidthOffset) % kTileWidth),
                       static_cast<int>((gy >> kBitmapWidthOffset) % kTileWidth)};

  DraftEntry* entry = Lookup(tile, block);
  if (entry == nullptr || entry->state != DraftState::kPresent) {
    return false;
  }

  const int localX = static_cast<int>(gx % kBitmapWidth);
  const int localY = static_cast<int>(gy % kBitmapWidth);
  if (!entry->draft->Clear(localX, localY)) {
    return false;
  }
  entry->frozen = nullptr;
  if (entry->draft->IsEmpty()) {
    entry->state = DraftState::kDeleted;
    entry->draft.reset();
  }
  return true;
}

EraseResult EraseSession::EraseSegment(const LngLat& from, const LngLat& to) {
  EraseResult result;
  result.segmentBbox = Bbox::FromTwoPoints(from, to);
  if (!IsFinite(from) || !IsFinite(to)) {
    Logger()->warn("ignoring erase segment with non-finite coordinates");
    return result;
  }

  const GlobalPixel p0 = LngLatToGlobalPixel(from.lng, from.lat);
  const GlobalPixel p1 = LngLatToGlobalPixel(to.lng, to.lat);

  const double radius = size_ / 2.0;
  const double radiusSquared = radius * radius;
  const int offsetStart = -static_cast<int>(std::floor(radius));
  const int offsetEnd = static_cast<int>(std::ceil(radius));

  std::unordered_set<uint64_t> processed;
  TraceLine(p0.x, p0.y, p1.x, p1.y, [&](int64_t x, int64_t y) {
    for (int dx = offsetStart; dx < offsetEnd; ++dx) {
      for (int dy = offsetStart; dy < offsetEnd; ++dy) {
        if (shape_ == BrushShape::Circle && dx * dx + dy * dy > radiusSquared) {
          continue;
        }
        const int64_t gx = x + dx;
        const int64_t gy = y + dy;
        if (!processed.insert(PixelKey(gx, gy)).second) {
          continue;
        }
        if (ErasePixel(gx, gy)) {
          result.changed = true;
        }
      }
    }
  });

  if (result.changed) {
    erasedArea_ = erasedArea_ ? Bbox::Merge(*erasedArea_, result.segmentBbox)
                              : result.segmentBbox;
  }
  return result;
}

FogMap EraseSession::Publish(const FogMap& current) {
  MapPatch patch;
  for (auto& item : entries_) {
    DraftEntry& entry = item.second;
    const BlockKey block = BlockKey::FromIndex(static_cast<uint32_t>(item.first & 0x3FFF));
    if (entry.state == DraftState::kDeleted) {
      patch[entry.tile][block] = nullptr;
    } else if (entry.state == DraftState::kPresent) {
      if (!entry.frozen) {
        entry.frozen = entry.draft->Freeze();
      }
      patch[entry.tile][block] = entry.frozen;
    }
  }
  return current.UpdateBlocks(patch);
}

}  // namespace fogmap
