#include "fogmap/core/coords.h"

#include <algorithm>
#include <cmath>

namespace fogmap {

namespace {

constexpr double kPi = 3.14159265358979323846;

}  // namespace

Bbox Bbox::FromPoint(const LngLat& point) {
  return Bbox{point.lng, point.lat, point.lng, point.lat};
}

Bbox Bbox::FromTwoPoints(const LngLat& a, const LngLat& b) {
  return Bbox{std::min(a.lng, b.lng), std::min(a.lat, b.lat), std::max(a.lng, b.lng),
              std::max(a.lat, b.lat)};
}

Bbox Bbox::Merge(const Bbox& a, const Bbox& b) {
  return Bbox{std::min(a.west, b.west), std::min(a.south, b.south), std::max(a.east, b.east),
              std::max(a.north, b.north)};
}

bool Bbox::FromCoordinates(const std::vector<LngLat>& coords, Bbox* outBbox) {
  if (coords.empty() || outBbox == nullptr) {
    return false;
  }
  Bbox bbox = FromPoint(coords.front());
  for (const LngLat& point : coords) {
    bbox.Extend(point);
  }
  *outBbox = bbox;
  return true;
}

void Bbox::Extend(const LngLat& point) {
  west = std::min(west, point.lng);
  south = std::min(south, point.lat);
  east = std::max(east, point.lng);
  north = std::max(north, point.lat);
}

bool Bbox::Overlaps(const Bbox& other) const {
  return north >= other.south && other.north >= south && east >= other.west &&
         other.east >= west;
}

TileUnit LngLatToTileUnit(double lng, double lat) {
  const double x = ((lng + 180.0) / 360.0) * kMapWidth;
  const double y = ((kPi - std::asinh(std::tan((lat / 180.0) * kPi))) * kMapWidth) / (2.0 * kPi);
  return TileUnit{x, y};
}

GlobalPixel LngLatToGlobalPixel(double lng, double lat) {
  const TileUnit unit = LngLatToTileUnit(lng, lat);
  const double scale = static_cast<double>(kTileWidth * kBitmapWidth);
  return GlobalPixel{static_cast<int64_t>(std::floor(unit.x * scale)),
                     static_cast<int64_t>(std::floor(unit.y * scale))};
}

LngLat TileUnitToLngLat(double x, double y) {
  const double lng = (x / kMapWidth) * 360.0 - 180.0;
  const double lat = (std::atan(std::sinh(kPi - (2.0 * kPi * y) / kMapWidth)) * 180.0) / kPi;
  return LngLat{lng, lat};
}

Bbox TileBbox(int tileX, int tileY) {
  const LngLat southWest = TileUnitToLngLat(tileX, tileY + 1);
  const LngLat northEast = TileUnitToLngLat(tileX + 1, tileY);
  return Bbox{southWest.lng, southWest.lat, northEast.lng, northEast.lat};
}

Bbox BlockBbox(int tileX, int tileY, int blockX, int blockY) {
  const double x0 = tileX + static_cast<double>(blockX) / kTileWidth;
  const double y0 = tileY + static_cast<double>(blockY) / kTileWidth;
  const double x1 = tileX + static_cast<double>(blockX + 1) / kTileWidth;
  const double y1 = tileY + static_cast<double>(blockY + 1) / kTileWidth;
  const LngLat southWest = TileUnitToLngLat(x0, y1);
  const LngLat northEast = TileUnitToLngLat(x1, y0);
  return Bbox{southWest.lng, southWest.lat, northEast.lng, northEast.lat};
}

}  // namespace fogmap
