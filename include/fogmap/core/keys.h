#pragma once

#include <cstdint>
#include <string>

#include "fogmap/core/coords.h"

namespace fogmap {

// Tile coordinate in the 512x512 world grid. Index() is also the tile id.
struct TileKey {
  int x = 0;
  int y = 0;

  bool IsInWorld() const { return x >= 0 && y >= 0 && x < kMapWidth && y < kMapWidth; }
  uint32_t Index() const { return static_cast<uint32_t>(y) * kMapWidth + static_cast<uint32_t>(x); }
  static TileKey FromIndex(uint32_t index) {
    return TileKey{static_cast<int>(index % kMapWidth), static_cast<int>(index / kMapWidth)};
  }
  std::string ToString() const { return std::to_string(x) + "-" + std::to_string(y); }
};

// Block coordinate inside a tile. Index() is the tile header slot.
struct BlockKey {
  int x = 0;
  int y = 0;

  bool IsInTile() const { return x >= 0 && y >= 0 && x < kTileWidth && y < kTileWidth; }
  uint32_t Index() const { return static_cast<uint32_t>(x) + static_cast<uint32_t>(y) * kTileWidth; }
  static BlockKey FromIndex(uint32_t index) {
    return BlockKey{static_cast<int>(index % kTileWidth), static_cast<int>(index / kTileWidth)};
  }
  std::string ToString() const { return std::to_string(x) + "-" + std::to_string(y); }
};

inline bool operator==(const TileKey& a, const TileKey& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const TileKey& a, const TileKey& b) { return !(a == b); }
inline bool operator<(const TileKey& a, const TileKey& b) {
  return a.y != b.y ? a.y < b.y : a.x < b.x;
}

inline bool operator==(const BlockKey& a, const BlockKey& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const BlockKey& a, const BlockKey& b) { return !(a == b); }
inline bool operator<(const BlockKey& a, const BlockKey& b) {
  return a.y != b.y ? a.y < b.y : a.x < b.x;
}

struct BlockRef {
  TileKey tile;
  BlockKey block;
};

}  // namespace fogmap
