#include "fogmap/edit/tracks.h"

#include "fogmap/core/log.h"
#include "fogmap/io/file_io.h"

#include <cmath>
#include <filesystem>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace fogmap {

namespace {

bool Fail(const std::string& message, std::string* outError) {
  if (outError != nullptr) {
    *outError = message;
  }
  return false;
}

bool Fail(ArchiveErrorCode code, const std::string& message, ArchiveError* outError) {
  if (outError != nullptr) {
    outError->code = code;
    outError->message = message;
  }
  return false;
}

bool IsPosition(const nlohmann::json& value) {
  return value.is_array() && value.size() >= 2 && value[0].is_number() && value[1].is_number();
}

bool ReadLine(const nlohmann::json& value, Track* outTrack, std::string* outError) {
  if (!value.is_array()) {
    return Fail("track must be an array of positions", outError);
  }
  Track track;
  track.reserve(value.size());
  for (const auto& position : value) {
    if (!IsPosition(position)) {
      return Fail("track position must be [lng, lat]", outError);
    }
    track.push_back(LngLat{position[0].get<double>(), position[1].get<double>()});
  }
  *outTrack = std::move(track);
  return true;
}

bool ReadLines(const nlohmann::json& value, std::vector<Track>* outTracks, std::string* outError) {
  if (!value.is_array()) {
    return Fail("expected an array of tracks", outError);
  }
  for (const auto& line : value) {
    Track track;
    if (!ReadLine(line, &track, outError)) {
      return false;
    }
    outTracks->push_back(std::move(track));
  }
  return true;
}

bool ReadGeoJson(const nlohmann::json& doc, std::vector<Track>* outTracks, std::string* outError) {
  if (!doc.contains("type") || !doc["type"].is_string()) {
    return Fail("GeoJSON object without a type", outError);
  }
  const std::string type = doc["type"].get<std::string>();

  if (type == "FeatureCollection") {
    if (!doc.contains("features") || !doc["features"].is_array()) {
      return Fail("FeatureCollection without features", outError);
    }
    for (const auto& feature : doc["features"]) {
      if (!ReadGeoJson(feature, outTracks, outError)) {
        return false;
      }
    }
    return true;
  }
  if (type == "Feature") {
    if (!doc.contains("geometry") || doc["geometry"].is_null()) {
      return true;
    }
    return ReadGeoJson(doc["geometry"], outTracks, outError);
  }
  if (type == "LineString") {
    Track track;
    if (!doc.contains("coordinates") || !ReadLine(doc["coordinates"], &track, outError)) {
      return Fail("LineString without valid coordinates", outError);
    }
    outTracks->push_back(std::move(track));
    return true;
  }
  if (type == "MultiLineString") {
    if (!doc.contains("coordinates") || !ReadLines(doc["coordinates"], outTracks, outError)) {
      return Fail("MultiLineString without valid coordinates", outError);
    }
    return true;
  }

  Logger()->debug("ignoring GeoJSON {} geometry", type);
  return true;
}

}  // namespace

bool CrossesAntimeridian(double lng1, double lng2) {
  return std::fabs(lng2 - lng1) > 180.0;
}

FogMap DrawTrack(const FogMap& map, const Track& track, bool value,
                 bool skipAntimeridianSegments) {
  if (track.size() < 2) {
    return map;
  }
  FogMap result = map;
  for (size_t i = 0; i + 1 < track.size(); ++i) {
    const LngLat& a = track[i];
    const LngLat& b = track[i + 1];
    if (skipAntimeridianSegments && CrossesAntimeridian(a.lng, b.lng)) {
      continue;
    }
    result = result.AddLine(a.lng, a.lat, b.lng, b.lat, value);
  }
  return result;
}

TrackImportResult BuildTrackMap(const std::vector<Track>& tracks, bool skipAntimeridianSegments) {
  TrackImportResult result;
  for (const Track& track : tracks) {
    result.map = DrawTrack(result.map, track, true, skipAntimeridianSegments);

    Bbox trackBbox;
    if (!Bbox::FromCoordinates(track, &trackBbox)) {
      continue;
    }
    if (!result.firstCoordinate) {
      result.firstCoordinate = track.front();
    }
    result.bbox = result.bbox ? Bbox::Merge(*result.bbox, trackBbox) : trackBbox;
  }
  return result;
}

FogMap MergeFogMaps(const FogMap& base, const FogMap& other) {
  MapPatch patch;
  other.ForEachTile([&base, &patch](const TilePtr& tile) {
    const TileKey tileKey = tile->Key();
    tile->ForEachBlock([&](const BlockKey& blockKey, const BlockPtr& block) {
      const BlockPtr existing = base.FindBlock(tileKey, blockKey);
      patch[tileKey][blockKey] = existing ? existing->Union(*block) : block;
    });
  });
  return base.UpdateBlocks(patch);
}

bool ParseTrackJson(const std::string& text, std::vector<Track>* outTracks, std::string* outError) {
  if (outTracks == nullptr) {
    return Fail("outTracks must not be null", outError);
  }

  const nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
  if (doc.is_discarded()) {
    return Fail("Failed to parse track JSON", outError);
  }

  std::vector<Track> tracks;
  if (doc.is_object()) {
    if (!ReadGeoJson(doc, &tracks, outError)) {
      return false;
    }
  } else if (doc.is_array()) {
    const bool singleTrack = doc.empty() || IsPosition(doc[0]);
    if (singleTrack) {
      Track track;
      if (!ReadLine(doc, &track, outError)) {
        return false;
      }
      tracks.push_back(std::move(track));
    } else if (!ReadLines(doc, &tracks, outError)) {
      return false;
    }
  } else {
    return Fail("track JSON must be an array or a GeoJSON object", outError);
  }

  *outTracks = std::move(tracks);
  return true;
}

bool FindTrackInZip(const std::vector<uint8_t>& archive, const std::string& extension,
                    std::vector<uint8_t>* outData, ArchiveError* outError) {
  return FindFileInZip(archive, extension, outData, outError);
}

bool LoadTrackFile(const std::string& path, std::vector<Track>* outTracks, ArchiveError* outError) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return Fail(ArchiveErrorCode::kNotFound, "no such track file: " + path, outError);
  }

  std::vector<uint8_t> bytes;
  std::string error;
  if (!ReadFileBytes(path, &bytes, &error)) {
    return Fail(ArchiveErrorCode::kIoError, error, outError);
  }

  if (std::filesystem::path(path).extension() == ".zip") {
    std::vector<uint8_t> inner;
    ArchiveError findError;
    if (!FindTrackInZip(bytes, ".json", &inner, &findError)) {
      if (findError.code != ArchiveErrorCode::kNoMatchingFile ||
          !FindTrackInZip(bytes, ".geojson", &inner, &findError)) {
        if (outError != nullptr) {
          *outError = findError;
        }
        return false;
      }
    }
    bytes = std::move(inner);
  }

  const std::string text(bytes.begin(), bytes.end());
  if (!ParseTrackJson(text, outTracks, &error)) {
    return Fail(ArchiveErrorCode::kInvalidFormat, path + ": " + error, outError);
  }
  Logger()->info("loaded {} tracks from {}", outTracks->size(), path);
  return true;
}

}  // namespace fogmap
