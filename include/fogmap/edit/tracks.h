#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fogmap/core/coords.h"
#include "fogmap/core/fog_map.h"
#include "fogmap/io/archive.h"

namespace fogmap {

using Track = std::vector<LngLat>;

struct TrackImportResult {
  FogMap map;
  std::optional<LngLat> firstCoordinate;
  std::optional<Bbox> bbox;
};

bool CrossesAntimeridian(double lng1, double lng2);

// Draws consecutive segments. Tracks with fewer than two points are ignored.
FogMap DrawTrack(const FogMap& map, const Track& track, bool value = true,
                 bool skipAntimeridianSegments = true);

TrackImportResult BuildTrackMap(const std::vector<Track>& tracks,
                                bool skipAntimeridianSegments = true);

// Union of both maps: blocks present in both are OR-ed, never replaced.
FogMap MergeFogMaps(const FogMap& base, const FogMap& other);

// Accepts [[lng, lat], ...], an array of those, or GeoJSON LineString,
// MultiLineString, Feature and FeatureCollection documents.
bool ParseTrackJson(const std::string& text, std::vector<Track>* outTracks, std::string* outError);

// JSON track file, or a .zip holding one (the first .json/.geojson entry).
bool LoadTrackFile(const std::string& path, std::vector<Track>* outTracks, ArchiveError* outError);

bool FindTrackInZip(const std::vector<uint8_t>& archive, const std::string& extension,
                    std::vector<uint8_t>* outData, ArchiveError* outError);

}  // namespace fogmap
