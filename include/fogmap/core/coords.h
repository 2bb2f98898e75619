#pragma once

#include <cstdint>
#include <vector>

namespace fogmap {

// World layout of the originating application's fog data.
constexpr int kMapWidth = 512;  // tiles per world side
constexpr int kTileWidthOffset = 7;
constexpr int kTileWidth = 1 << kTileWidthOffset;  // blocks per tile side
constexpr int kBitmapWidthOffset = 6;
constexpr int kBitmapWidth = 1 << kBitmapWidthOffset;  // pixels per block side
constexpr int kAllOffset = kTileWidthOffset + kBitmapWidthOffset;

constexpr int kBlockBitmapSize = 512;
constexpr int kBlockExtraData = 3;
constexpr int kBlockSize = kBlockBitmapSize + kBlockExtraData;
constexpr int kTileHeaderLen = kTileWidth * kTileWidth;
constexpr int kTileHeaderSize = kTileHeaderLen * 2;

struct LngLat {
  double lng = 0.0;
  double lat = 0.0;
};

struct GlobalPixel {
  int64_t x = 0;
  int64_t y = 0;
};

struct TileUnit {
  double x = 0.0;
  double y = 0.0;
};

// Axis-aligned lng/lat rectangle. Antimeridian wraparound is not modelled.
struct Bbox {
  double west = 0.0;
  double south = 0.0;
  double east = 0.0;
  double north = 0.0;

  static Bbox FromPoint(const LngLat& point);
  static Bbox FromTwoPoints(const LngLat& a, const LngLat& b);
  static Bbox Merge(const Bbox& a, const Bbox& b);
  static bool FromCoordinates(const std::vector<LngLat>& coords, Bbox* outBbox);

  void Extend(const LngLat& point);
  bool Overlaps(const Bbox& other) const;
};

// Floor division by 2^bits, well defined for negative values.
inline int64_t FloorShift(int64_t value, int bits) {
  if (value >= 0) {
    return value >> bits;
  }
  return -((-value - 1) >> bits) - 1;
}

GlobalPixel LngLatToGlobalPixel(double lng, double lat);

// Fractional tile units: one unit is one tile, the world spans [0, 512).
TileUnit LngLatToTileUnit(double lng, double lat);
LngLat TileUnitToLngLat(double x, double y);

Bbox TileBbox(int tileX, int tileY);
Bbox BlockBbox(int tileX, int tileY, int blockX, int blockY);

}  // namespace fogmap
