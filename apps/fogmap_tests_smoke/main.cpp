#include "fogmap/core/block.h"
#include "fogmap/core/deflate.h"
#include "fogmap/core/filename_codec.h"
#include "fogmap/core/fog_map.h"
#include "fogmap/core/log.h"
#include "fogmap/core/tile.h"
#include "fogmap/edit/editor_controller.h"
#include "fogmap/edit/erase_session.h"
#include "fogmap/edit/history.h"
#include "fogmap/edit/tracks.h"
#include "fogmap/io/archive.h"
#include "fogmap/io/config.h"
#include "fogmap/io/file_io.h"
#include "fogmap/io/zip_container.h"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

void PrintFailure(const std::string& message) {
  std::cerr << message << '\n';
}

struct LineCase {
  double lng1;
  double lat1;
  double lng2;
  double lat2;
};

fogmap::FogMap DrawLines(const std::vector<LineCase>& lines) {
  fogmap::FogMap map = fogmap::FogMap::Empty();
  for (const LineCase& line : lines) {
    map = map.AddLine(line.lng1, line.lat1, line.lng2, line.lat2);
  }
  return map;
}

size_t VisitedPixels(const fogmap::FogMap& map) {
  size_t total = 0;
  map.ForEachTile([&total](const fogmap::TilePtr& tile) {
    tile->ForEachBlock([&total](const fogmap::BlockKey&, const fogmap::BlockPtr& block) {
      total += static_cast<size_t>(block->PopCount());
    });
  });
  return total;
}

// Same tiles, same block keys, same bitmaps.
bool SameContent(const fogmap::FogMap& a, const fogmap::FogMap& b, std::string* outDiff) {
  if (a.TileCount() != b.TileCount() || a.BlockCount() != b.BlockCount()) {
    *outDiff = "counts differ: " + std::to_string(a.TileCount()) + "/" +
               std::to_string(a.BlockCount()) + " vs " + std::to_string(b.TileCount()) + "/" +
               std::to_string(b.BlockCount());
    return false;
  }
  bool same = true;
  a.ForEachTile([&](const fogmap::TilePtr& tile) {
    tile->ForEachBlock([&](const fogmap::BlockKey& key, const fogmap::BlockPtr& block) {
      const fogmap::BlockPtr other = b.FindBlock(tile->Key(), key);
      if (same && (!other || other->GetBitmap() != block->GetBitmap())) {
        *outDiff = "block " + key.ToString() + " of tile " + tile->Key().ToString() + " differs";
        same = false;
      }
    });
  });
  return same;
}

// Every pixel visited in `inner` is visited in `outer`.
bool CoversPixels(const fogmap::FogMap& outer, const fogmap::FogMap& inner) {
  bool ok = true;
  inner.ForEachTile([&](const fogmap::TilePtr& tile) {
    tile->ForEachBlock([&](const fogmap::BlockKey& key, const fogmap::BlockPtr& block) {
      const fogmap::BlockPtr target = outer.FindBlock(tile->Key(), key);
      if (!ok || !target) {
        ok = false;
        return;
      }
      for (int x = 0; x < fogmap::kBitmapWidth && ok; ++x) {
        for (int y = 0; y < fogmap::kBitmapWidth; ++y) {
          if (block->IsVisited(x, y) && !target->IsVisited(x, y)) {
            ok = false;
            break;
          }
        }
      }
    });
  });
  return ok;
}

// Rewrites the uncompressed size of every central directory record.
size_t ForgeDeclaredSizes(std::vector<uint8_t>* archive, uint32_t size) {
  size_t patched = 0;
  for (size_t pos = 0; pos + 28 <= archive->size(); ++pos) {
    uint8_t* record = archive->data() + pos;
    if (record[0] != 0x50 || record[1] != 0x4b || record[2] != 0x01 || record[3] != 0x02) {
      continue;
    }
    for (int k = 0; k < 4; ++k) {
      record[24 + k] = static_cast<uint8_t>(size >> (8 * k));
    }
    ++patched;
  }
  return patched;
}

bool CheckCounts(const std::string& name, const fogmap::FogMap& map, size_t tiles, size_t blocks) {
  if (map.TileCount() != tiles || map.BlockCount() != blocks) {
    PrintFailure("FAIL " + name + ": expected " + std::to_string(tiles) + " tiles/" +
                 std::to_string(blocks) + " blocks, got " + std::to_string(map.TileCount()) +
                 "/" + std::to_string(map.BlockCount()));
    return false;
  }
  return true;
}

bool RunRasterization() {
  if (!CheckCounts("short line", DrawLines({{121.5, 25.0, 121.6, 25.1}}), 1, 39)) {
    return false;
  }
  if (!CheckCounts("one degree line", DrawLines({{121.0, 25.0, 122.0, 26.0}}), 4, 382)) {
    return false;
  }
  if (!CheckCounts("long line", DrawLines({{115.0, 20.0, 125.0, 30.0}}), 30, 3803)) {
    return false;
  }

  const std::vector<LineCase> diverse = {
      {120.0, 24.0, 121.0, 25.0},   {100.0, 30.0, 105.0, 30.5},   {115.0, 20.0, 125.0, 30.0},
      {121.5, 10.0, 121.8, 20.0},   {-5.0, 50.0, 5.0, 55.0},      {100.0, -10.0, 110.0, 10.0},
      {140.0, -30.0, 150.0, -20.0}, {-10.0, -10.0, 10.0, 10.0},   {80.0, 5.0, 82.0, 15.0},
      {50.0, 40.0, 70.0, 42.0},
  };
  if (!CheckCounts("diverse lines", DrawLines(diverse), 270, 33265)) {
    return false;
  }

  // Drawing in the opposite direction covers the same pixels.
  std::string diff;
  if (!SameContent(DrawLines({{121.6, 25.1, 121.5, 25.0}}), DrawLines({{121.5, 25.0, 121.6, 25.1}}),
                   &diff)) {
    PrintFailure("FAIL reversed line: " + diff);
    return false;
  }

  const fogmap::FogMap base = DrawLines({{121.5, 25.0, 121.6, 25.1}});
  if (!base.AddLine(121.5, 25.0, 121.6, 25.1).SharesStateWith(base)) {
    PrintFailure("FAIL redraw: drawing an existing line must not change the map");
    return false;
  }
  if (!base.AddLine(0.0, 0.0, 0.01, 0.01, false).SharesStateWith(base)) {
    PrintFailure("FAIL erase elsewhere: erasing unexplored area must not change the map");
    return false;
  }
  if (!base.AddLine(std::nan(""), 0.0, 1.0, 1.0).SharesStateWith(base)) {
    PrintFailure("FAIL non-finite line: map must be returned unchanged");
    return false;
  }

  const fogmap::FogMap erased = base.AddLine(121.5, 25.0, 121.6, 25.1, false);
  if (erased.BlockCount() != 0 || erased.TileCount() != 1) {
    PrintFailure("FAIL erase line: expected one empty tile, got " +
                 std::to_string(erased.TileCount()) + "/" + std::to_string(erased.BlockCount()));
    return false;
  }

  // Lines reaching in from beyond the Mercator limit or the antimeridian keep
  // their visible part.
  const fogmap::FogMap fromPole = DrawLines({{10.0, 86.0, 10.0, 80.0}});
  const fogmap::FogMap fromInside = DrawLines({{10.0, 84.0, 10.0, 80.0}});
  if (fromInside.BlockCount() == 0 || fromPole.BlockCount() < fromInside.BlockCount() ||
      !CoversPixels(fromPole, fromInside)) {
    PrintFailure("FAIL line from outside: expected the in-world part, got " +
                 std::to_string(fromPole.TileCount()) + "/" +
                 std::to_string(fromPole.BlockCount()));
    return false;
  }
  bool northEdgeHit = false;
  fromPole.ForEachTile([&northEdgeHit](const fogmap::TilePtr& tile) {
    northEdgeHit = northEdgeHit || tile->Y() == 0;
  });
  if (!northEdgeHit) {
    PrintFailure("FAIL line from outside: must reach the top row of tiles");
    return false;
  }

  const fogmap::FogMap acrossWest = DrawLines({{-190.0, 10.0, -175.0, 12.0}});
  bool westEdgeHit = false;
  bool onlyWestTiles = true;
  acrossWest.ForEachTile([&](const fogmap::TilePtr& tile) {
    westEdgeHit = westEdgeHit || tile->X() == 0;
    onlyWestTiles = onlyWestTiles && tile->X() < 32;
  });
  if (acrossWest.BlockCount() == 0 || !westEdgeHit || !onlyWestTiles) {
    PrintFailure("FAIL line from west of the map: expected tiles from the west edge only");
    return false;
  }
  if (!CoversPixels(DrawLines({{-190.0, 10.0, -170.0, 10.0}}),
                    DrawLines({{-179.0, 10.0, -170.0, 10.0}}))) {
    PrintFailure("FAIL line from west of the map: horizontal part lost pixels");
    return false;
  }
  if (!base.AddLine(-200.0, 10.0, -190.0, 12.0).SharesStateWith(base) ||
      !base.AddLine(10.0, 87.0, 20.0, 88.0).SharesStateWith(base)) {
    PrintFailure("FAIL line outside the map: must not change the map");
    return false;
  }

  std::cout << "PASS rasterization: line counts match\n";
  return true;
}

bool RunFilenameCodec() {
  struct NameCase {
    uint32_t id;
    const char* name;
  };
  const NameCase cases[] = {{117660, "23e4lltkkoke"}, {117659, "cd36lltksiwo"}, {0, "cfcdoe"}};
  for (const NameCase& item : cases) {
    const std::string encoded = fogmap::EncodeTileFilename(item.id);
    if (encoded != item.name) {
      PrintFailure("FAIL encode " + std::to_string(item.id) + ": got " + encoded);
      return false;
    }
    uint32_t decoded = 0;
    std::string error;
    if (!fogmap::DecodeTileFilename(encoded, &decoded, &error) || decoded != item.id) {
      PrintFailure("FAIL decode " + encoded + ": " + error);
      return false;
    }
  }

  for (uint32_t id : {7u, 42u, 511u, 262143u}) {
    uint32_t decoded = 0;
    std::string error;
    if (!fogmap::DecodeTileFilename(fogmap::EncodeTileFilename(id), &decoded, &error) ||
        decoded != id) {
      PrintFailure("FAIL decode(encode(" + std::to_string(id) + ")): " + error);
      return false;
    }
  }

  for (const char* bad : {"abc", "abcdzzzzzz", "0000wwwwwwwww"}) {
    uint32_t decoded = 0;
    std::string error;
    if (fogmap::DecodeTileFilename(bad, &decoded, &error) || error.empty()) {
      PrintFailure(std::string("FAIL decode should reject \"") + bad + "\"");
      return false;
    }
  }

  std::cout << "PASS filename_codec: ids and names agree\n";
  return true;
}

bool RunBlock() {
  fogmap::Block::Bitmap bitmap{};
  bitmap[0] = 0x80;  // pixel (0, 0)
  bitmap[9] = 0x01;  // pixel (15, 1)
  const fogmap::Block::ExtraData extraData = {0x08, 0x40, 0x00};
  const fogmap::BlockPtr block = fogmap::Block::FromParts(3, 4, bitmap, extraData);

  if (!block->IsVisited(0, 0) || !block->IsVisited(15, 1) || block->IsVisited(1, 0)) {
    PrintFailure("FAIL block bits: unexpected pixel layout");
    return false;
  }
  if (block->Region() != "@@") {
    PrintFailure("FAIL block region: got " + block->Region());
    return false;
  }
  if (block->Check()) {
    PrintFailure("FAIL block check: stale checksum must be reported");
    return false;
  }

  const fogmap::Block::Record record = block->Dump();
  if (record[fogmap::kBlockBitmapSize] != 0x08 || record[fogmap::kBlockBitmapSize + 1] != 0x40 ||
      record[fogmap::kBlockBitmapSize + 2] != 0x05) {
    PrintFailure("FAIL block dump: checksum bytes not recomputed");
    return false;
  }
  const fogmap::BlockPtr reloaded = fogmap::Block::Create(3, 4, record.data());
  if (!reloaded->Check() || reloaded->Count() != 2) {
    PrintFailure("FAIL block reload: checksum mismatch after dump");
    return false;
  }

  if (block->ClearRect(20, 20, 10, 10) != block) {
    PrintFailure("FAIL block clear: clearing empty pixels must return the same block");
    return false;
  }
  const fogmap::BlockPtr cleared = block->ClearRect(0, 0, 1, 1);
  if (!cleared || cleared->PopCount() != 1 || block->PopCount() != 2) {
    PrintFailure("FAIL block clear: expected one pixel left and original untouched");
    return false;
  }
  if (block->ClearRect(0, 0, 64, 64) != nullptr) {
    PrintFailure("FAIL block clear: clearing everything must drop the block");
    return false;
  }
  if (block->Union(*cleared) != block) {
    PrintFailure("FAIL block union: subset union must return the same block");
    return false;
  }

  fogmap::BlockDraft draft = block->Draft();
  if (!draft.Clear(0, 0) || draft.Clear(0, 0) || draft.Count() != 1) {
    PrintFailure("FAIL block draft: clear must report changes once");
    return false;
  }
  const fogmap::BlockPtr frozen = draft.Freeze();
  if (frozen->PopCount() != 1 || block->PopCount() != 2) {
    PrintFailure("FAIL block draft: freeze must not alias the source block");
    return false;
  }

  std::cout << "PASS block: bitmap, checksum and edits ok\n";
  return true;
}

bool RunTileCodec() {
  const fogmap::FogMap map = DrawLines({{121.0, 25.0, 122.0, 26.0}});
  size_t checked = 0;
  bool ok = true;
  map.ForEachTile([&](const fogmap::TilePtr& tile) {
    if (!ok) {
      return;
    }
    std::vector<uint8_t> bytes;
    std::string error;
    if (!tile->Dump(&bytes, &error)) {
      PrintFailure("FAIL tile dump " + tile->Filename() + ": " + error);
      ok = false;
      return;
    }
    if (tile->Filename() != fogmap::EncodeTileFilename(tile->Id())) {
      PrintFailure("FAIL tile filename " + tile->Filename());
      ok = false;
      return;
    }

    fogmap::TilePtr reloaded;
    if (!fogmap::Tile::Create(tile->Filename(), bytes, &reloaded, &error)) {
      PrintFailure("FAIL tile load " + tile->Filename() + ": " + error);
      ok = false;
      return;
    }
    if (reloaded->Key() != tile->Key() || reloaded->BlockCount() != tile->BlockCount()) {
      PrintFailure("FAIL tile reload " + tile->Filename() + ": key or block count differs");
      ok = false;
      return;
    }

    std::vector<uint8_t> again;
    std::vector<uint8_t> rawFirst;
    std::vector<uint8_t> rawSecond;
    if (!reloaded->Dump(&again, &error) ||
        !fogmap::InflateBytes(bytes.data(), bytes.size(), fogmap::DeflateFormat::Zlib, 0,
                              &rawFirst, &error) ||
        !fogmap::InflateBytes(again.data(), again.size(), fogmap::DeflateFormat::Zlib, 0,
                              &rawSecond, &error)) {
      PrintFailure("FAIL tile redump " + tile->Filename() + ": " + error);
      ok = false;
      return;
    }
    if (rawFirst != rawSecond) {
      PrintFailure("FAIL tile redump " + tile->Filename() + ": bytes differ");
      ok = false;
      return;
    }
    const size_t expectedSize = static_cast<size_t>(fogmap::kTileHeaderSize) +
                                tile->BlockCount() * static_cast<size_t>(fogmap::kBlockSize);
    if (rawFirst.size() != expectedSize) {
      PrintFailure("FAIL tile layout " + tile->Filename() + ": unexpected size " +
                   std::to_string(rawFirst.size()));
      ok = false;
      return;
    }
    const fogmap::Bbox lineArea =
        fogmap::Bbox::FromTwoPoints(fogmap::LngLat{121.0, 25.0}, fogmap::LngLat{122.0, 26.0});
    if (!tile->Bounds().Overlaps(lineArea)) {
      PrintFailure("FAIL tile bounds " + tile->Key().ToString() + ": outside the drawn line");
      ok = false;
      return;
    }
    ++checked;
  });
  if (!ok) {
    return false;
  }

  const std::vector<uint8_t> shortRaw(10, 0);
  std::vector<uint8_t> shortCompressed;
  std::string error;
  if (!fogmap::DeflateBytes(shortRaw.data(), shortRaw.size(), fogmap::DeflateFormat::Zlib,
                            &shortCompressed, &error)) {
    PrintFailure("FAIL deflate: " + error);
    return false;
  }
  fogmap::TilePtr bad;
  if (fogmap::Tile::Create("cfcdoe", shortCompressed, &bad, &error)) {
    PrintFailure("FAIL tile load: truncated data must be rejected");
    return false;
  }
  if (fogmap::Tile::Create("cfcdoe", {1, 2, 3, 4}, &bad, &error)) {
    PrintFailure("FAIL tile load: non-zlib data must be rejected");
    return false;
  }

  std::cout << "PASS tile_codec: " << checked << " tiles round-tripped\n";
  return true;
}

bool RunMapEdits() {
  const fogmap::FogMap drawn = DrawLines({{121.0, 25.0, 122.0, 26.0}});
  if (drawn.GetDirtyTilesCount() != drawn.TileCount()) {
    PrintFailure("FAIL dirty: every drawn tile must be dirty");
    return false;
  }
  const fogmap::FogMap clean = drawn.ClearDirtyTiles();
  if (clean.GetDirtyTilesCount() != 0 || clean.TileCount() != drawn.TileCount()) {
    PrintFailure("FAIL dirty: clear must keep tiles and drop the dirty set");
    return false;
  }

  bool allDirty = true;
  drawn.ForEachTile([&](const fogmap::TilePtr& tile) {
    allDirty = allDirty && drawn.IsDirty(tile->Key()) && !clean.IsDirty(tile->Key());
  });
  if (!allDirty || drawn.IsDirty(fogmap::TileKey{-1, 0})) {
    PrintFailure("FAIL dirty: per-tile dirty flags wrong");
    return false;
  }
  size_t dirtyVisited = 0;
  uint32_t previousIndex = 0;
  bool ascending = true;
  drawn.ForEachDirtyTile([&](const fogmap::TileKey& key, const fogmap::TilePtr& tile) {
    ascending = ascending && (dirtyVisited == 0 || key.Index() > previousIndex) && tile &&
                tile->Key() == key;
    previousIndex = key.Index();
    ++dirtyVisited;
  });
  if (dirtyVisited != drawn.GetDirtyTilesCount() || !ascending) {
    PrintFailure("FAIL dirty: dirty tiles must be visited once each in index order");
    return false;
  }

  const fogmap::FogMap redrawn = clean.AddLine(121.5, 25.0, 121.6, 25.1);
  if (redrawn.GetDirtyTilesCount() > 1) {
    PrintFailure("FAIL dirty: a short line must dirty at most one tile");
    return false;
  }

  const fogmap::Bbox world{-180.0, -85.0, 180.0, 85.0};
  const std::vector<fogmap::BlockRef> refs = clean.GetBlocks(world);
  if (refs.size() != clean.BlockCount()) {
    PrintFailure("FAIL get blocks: expected " + std::to_string(clean.BlockCount()) + ", got " +
                 std::to_string(refs.size()));
    return false;
  }
  fogmap::BlockSelection selection;
  for (const fogmap::BlockRef& ref : refs) {
    selection[ref.tile].insert(ref.block);
  }
  const fogmap::FogMap removed = clean.RemoveBlocks(selection);
  if (removed.BlockCount() != 0 || removed.TileCount() != clean.TileCount() ||
      removed.GetDirtyTilesCount() != clean.TileCount()) {
    PrintFailure("FAIL remove blocks: expected only dirty empty tiles to remain");
    return false;
  }
  if (clean.BlockCount() != 382) {
    PrintFailure("FAIL remove blocks: source map was modified");
    return false;
  }
  if (!clean.RemoveBlocks(fogmap::BlockSelection()).SharesStateWith(clean)) {
    PrintFailure("FAIL remove blocks: empty selection must not change the map");
    return false;
  }

  // Keys outside the tile or world grid stay distinct from the valid keys that
  // share their slot index.
  const std::set<fogmap::TileKey> tileKeys = {fogmap::TileKey{512, 0}, fogmap::TileKey{0, 1}};
  if (tileKeys.size() != 2) {
    PrintFailure("FAIL key order: off-grid tile key collided with a valid one");
    return false;
  }
  const fogmap::BlockRef* target = nullptr;
  for (const fogmap::BlockRef& ref : refs) {
    if (ref.block.y > 0) {
      target = &ref;
      break;
    }
  }
  if (target == nullptr) {
    PrintFailure("FAIL key order: no block away from the tile's top row");
    return false;
  }
  fogmap::BlockSelection aliased;
  aliased[target->tile].insert(fogmap::BlockKey{target->block.x + fogmap::kTileWidth,
                                                target->block.y - 1});
  aliased[target->tile].insert(target->block);
  const fogmap::FogMap trimmed = clean.RemoveBlocks(aliased);
  if (aliased[target->tile].size() != 2 || trimmed.BlockCount() + 1 != clean.BlockCount() ||
      trimmed.FindBlock(target->tile, target->block)) {
    PrintFailure("FAIL key order: selected block must be removed next to an off-tile key");
    return false;
  }

  const fogmap::FogMap shortLine = DrawLines({{121.5, 25.0, 121.6, 25.1}}).ClearDirtyTiles();
  const fogmap::FogMap wiped = shortLine.ClearBbox(fogmap::Bbox{121.4, 24.9, 121.7, 25.2});
  if (wiped.BlockCount() != 0 || wiped.TileCount() != 1 || wiped.GetDirtyTilesCount() != 1) {
    PrintFailure("FAIL clear bbox: expected one dirty empty tile");
    return false;
  }
  const fogmap::FogMap partial = shortLine.ClearBbox(fogmap::Bbox{121.5, 25.0, 121.55, 25.05});
  if (VisitedPixels(partial) == 0 || VisitedPixels(partial) >= VisitedPixels(shortLine)) {
    PrintFailure("FAIL clear bbox: partial clear must drop some but not all pixels");
    return false;
  }
  if (!shortLine.ClearBbox(fogmap::Bbox{0.0, 0.0, 1.0, 1.0}).SharesStateWith(shortLine)) {
    PrintFailure("FAIL clear bbox: clearing unexplored area must not change the map");
    return false;
  }

  fogmap::MapPatch patch;
  patch[fogmap::TileKey{600, 0}][fogmap::BlockKey{0, 0}] = nullptr;
  if (!shortLine.UpdateBlocks(patch).SharesStateWith(shortLine)) {
    PrintFailure("FAIL update blocks: keys outside the world must be ignored");
    return false;
  }

  std::cout << "PASS map_edits: dirty tracking, removal and clearing ok\n";
  return true;
}

bool RunMerge() {
  const fogmap::FogMap a = DrawLines({{121.0, 25.0, 122.0, 26.0}});
  const fogmap::FogMap b = DrawLines({{121.0, 26.0, 122.0, 25.0}});

  if (!fogmap::MergeFogMaps(a, a).SharesStateWith(a)) {
    PrintFailure("FAIL merge: merging a map into itself must not change it");
    return false;
  }

  const fogmap::FogMap merged = fogmap::MergeFogMaps(a, b);
  if (!CoversPixels(merged, a) || !CoversPixels(merged, b)) {
    PrintFailure("FAIL merge: merged map lost visited pixels");
    return false;
  }
  if (VisitedPixels(merged) >= VisitedPixels(a) + VisitedPixels(b)) {
    PrintFailure("FAIL merge: crossing lines must share at least one pixel");
    return false;
  }

  std::cout << "PASS merge: union keeps every pixel\n";
  return true;
}

bool RunZip() {
  fogmap::ZipWriter writer;
  std::string error;
  const std::string text = "[[121.5, 25.0], [121.6, 25.1]]";
  const std::vector<uint8_t> payload(text.begin(), text.end());
  std::vector<uint8_t> large(4096, 'a');
  if (!writer.AddDirectory("tracks", &error) || !writer.AddFile("tracks/a.json", payload, &error) ||
      !writer.AddFile("tracks/big.bin", large, &error)) {
    PrintFailure("FAIL zip write: " + error);
    return false;
  }
  std::vector<uint8_t> archive;
  if (!writer.Finish(&archive, &error)) {
    PrintFailure("FAIL zip finish: " + error);
    return false;
  }

  fogmap::ZipReader reader;
  if (!reader.Open(archive, &error)) {
    PrintFailure("FAIL zip open: " + error);
    return false;
  }
  if (writer.EntryCount() != 0 || reader.Entries().size() != 3 ||
      !reader.Entries()[0].IsDirectory()) {
    PrintFailure("FAIL zip entries: expected a directory and two files");
    return false;
  }
  for (const fogmap::ZipEntry& entry : reader.Entries()) {
    if (entry.IsDirectory()) {
      continue;
    }
    std::vector<uint8_t> data;
    if (!reader.Extract(entry, &data, &error)) {
      PrintFailure("FAIL zip extract " + entry.name + ": " + error);
      return false;
    }
    const std::vector<uint8_t>& expected = entry.name == "tracks/a.json" ? payload : large;
    if (data != expected) {
      PrintFailure("FAIL zip extract " + entry.name + ": content differs");
      return false;
    }
  }
  if (fogmap::ZipBasename("Sync/abc") != "abc" || fogmap::ZipBasename("a\\b\\c") != "c") {
    PrintFailure("FAIL zip basename");
    return false;
  }

  std::vector<uint8_t> found;
  fogmap::ArchiveError archiveError;
  if (!fogmap::FindFileInZip(archive, ".json", &found, &archiveError) || found != payload) {
    PrintFailure("FAIL find in zip: " + archiveError.message);
    return false;
  }
  if (fogmap::FindFileInZip(archive, ".kml", &found, &archiveError) ||
      archiveError.code != fogmap::ArchiveErrorCode::kNoMatchingFile) {
    PrintFailure("FAIL find in zip: missing extension must report no-matching-file");
    return false;
  }

  std::vector<uint8_t> inflated;
  std::vector<uint8_t> compressed;
  if (!fogmap::DeflateBytes(large.data(), large.size(), fogmap::DeflateFormat::Zlib, &compressed,
                            &error) ||
      !fogmap::InflateBytes(compressed.data(), compressed.size(), fogmap::DeflateFormat::Zlib,
                            SIZE_MAX / 2, &inflated, &error) ||
      inflated != large) {
    PrintFailure("FAIL inflate: an oversized hint must not be allocated up front: " + error);
    return false;
  }

  std::vector<uint8_t> forged = archive;
  if (ForgeDeclaredSizes(&forged, 0xFFFFFFF0u) != 3 || !reader.Open(forged, &error)) {
    PrintFailure("FAIL zip forged sizes: archive must still open");
    return false;
  }
  for (const fogmap::ZipEntry& entry : reader.Entries()) {
    std::vector<uint8_t> data;
    if (!entry.IsDirectory() && reader.Extract(entry, &data, &error)) {
      PrintFailure("FAIL zip forged sizes: " + entry.name + " must be rejected");
      return false;
    }
  }

  const std::vector<uint8_t> garbage(64, 0x5A);
  if (reader.Open(garbage, &error)) {
    PrintFailure("FAIL zip open: garbage must be rejected");
    return false;
  }

  std::cout << "PASS zip: container read/write ok\n";
  return true;
}

bool RunArchive(const fs::path& tempDir) {
  const fogmap::FogMap map = DrawLines({{121.0, 25.0, 122.0, 26.0}, {-5.0, 50.0, 5.0, 55.0}});

  size_t progressCalls = 0;
  size_t lastProcessed = 0;
  fogmap::ExportOptions options;
  options.yieldInterval = 2;
  options.progress = [&](size_t processed, size_t total) {
    ++progressCalls;
    lastProcessed = processed;
    if (total != map.TileCount()) {
      lastProcessed = 0;
    }
  };

  std::vector<uint8_t> archive;
  fogmap::ArchiveError error;
  if (!fogmap::ExportArchive(map, options, &archive, &error)) {
    PrintFailure("FAIL export: " + error.message);
    return false;
  }
  if (progressCalls < 2 || lastProcessed != map.TileCount()) {
    PrintFailure("FAIL export progress: expected periodic and final callbacks");
    return false;
  }

  fogmap::ZipReader reader;
  std::string zipError;
  if (!reader.Open(archive, &zipError) || reader.Entries().size() != map.TileCount() + 1 ||
      reader.Entries()[0].name != "Sync/") {
    PrintFailure("FAIL export layout: expected Sync/ plus one entry per tile");
    return false;
  }

  fogmap::FogMap imported;
  if (!fogmap::ImportFromZip(archive, &imported, &error)) {
    PrintFailure("FAIL import zip: " + error.message);
    return false;
  }
  std::string diff;
  if (!SameContent(map, imported, &diff)) {
    PrintFailure("FAIL import zip: " + diff);
    return false;
  }
  if (imported.GetDirtyTilesCount() != 0) {
    PrintFailure("FAIL import zip: imported tiles must not be dirty");
    return false;
  }

  std::vector<uint8_t> forged = archive;
  fogmap::FogMap fromForged;
  if (ForgeDeclaredSizes(&forged, 0xFFFFFFF0u) != map.TileCount() + 1 ||
      fogmap::ImportFromZip(forged, &fromForged, &error) ||
      error.code != fogmap::ArchiveErrorCode::kEmptyArchive) {
    PrintFailure("FAIL import zip: entries with forged sizes must be skipped");
    return false;
  }

  // Bad files are skipped one by one; the rest of the import goes through.
  std::vector<fogmap::TileFile> files;
  bool dumped = true;
  map.ForEachTile([&](const fogmap::TilePtr& tile) {
    fogmap::TileFile file;
    file.name = tile->Filename();
    std::string dumpError;
    dumped = dumped && tile->Dump(&file.bytes, &dumpError);
    files.push_back(std::move(file));
  });
  const fogmap::TilePtr stray = fogmap::Tile::CreateEmpty(300, 300);
  fogmap::TileFile corrupt;
  corrupt.name = fogmap::Tile::CreateEmpty(301, 300)->Filename();
  corrupt.bytes = {0x78, 0x9c, 0x01, 0x02, 0x03};
  fogmap::TileFile shortName;
  shortName.name = "abc";
  shortName.bytes = files.front().bytes;
  fogmap::TileFile emptied;
  emptied.name = stray->Filename();
  std::string dumpError;
  dumped = dumped && stray->Dump(&emptied.bytes, &dumpError);
  files.insert(files.begin() + 1, corrupt);
  files.push_back(shortName);
  files.push_back(emptied);
  if (!dumped) {
    PrintFailure("FAIL tile files: " + dumpError);
    return false;
  }
  const fogmap::FogMap partial = fogmap::FogMap::CreateFromFiles(files);
  if (!SameContent(map, partial, &diff)) {
    PrintFailure("FAIL partial import: " + diff);
    return false;
  }
  if (partial.GetDirtyTilesCount() != 0 || partial.FindTile(stray->Key()) != nullptr) {
    PrintFailure("FAIL partial import: expected clean tiles and no empty tile");
    return false;
  }

  fogmap::ExportOptions cancelling;
  cancelling.yieldInterval = 1;
  cancelling.shouldCancel = []() { return true; };
  if (fogmap::ExportArchive(map, cancelling, &archive, &error) ||
      error.code != fogmap::ArchiveErrorCode::kCancelled) {
    PrintFailure("FAIL export cancel: expected cancelled");
    return false;
  }

  // Differential export carries the emptied tile so the receiver drops it.
  const fogmap::FogMap wiped = imported.ClearBbox(fogmap::Bbox{120.9, 24.9, 122.1, 26.1});
  std::vector<uint8_t> dirtyArchive;
  if (!fogmap::ExportDirtyArchive(wiped, fogmap::ExportOptions(), &dirtyArchive, &error)) {
    PrintFailure("FAIL dirty export: " + error.message);
    return false;
  }
  if (!reader.Open(dirtyArchive, &zipError) ||
      reader.Entries().size() != wiped.GetDirtyTilesCount() + 1) {
    PrintFailure("FAIL dirty export: expected one entry per dirty tile");
    return false;
  }
  std::vector<uint8_t> fullAfterWipe;
  if (!fogmap::ExportArchive(wiped, fogmap::ExportOptions(), &fullAfterWipe, &error) ||
      !reader.Open(fullAfterWipe, &zipError) ||
      reader.Entries().size() >= map.TileCount() + 1) {
    PrintFailure("FAIL full export: empty tiles must be left out");
    return false;
  }

  fogmap::ZipWriter emptyWriter;
  std::vector<uint8_t> emptyArchive;
  if (!emptyWriter.AddDirectory("Sync", &zipError) || !emptyWriter.Finish(&emptyArchive, &zipError)) {
    PrintFailure("FAIL empty archive: " + zipError);
    return false;
  }
  if (fogmap::ImportFromZip(emptyArchive, &imported, &error) ||
      error.code != fogmap::ArchiveErrorCode::kEmptyArchive) {
    PrintFailure("FAIL empty archive: expected empty-archive");
    return false;
  }
  if (fogmap::ImportFromZip(std::vector<uint8_t>(32, 1), &imported, &error) ||
      error.code != fogmap::ArchiveErrorCode::kInvalidFormat) {
    PrintFailure("FAIL garbage archive: expected invalid-format");
    return false;
  }

  const fs::path syncDir = tempDir / "Sync";
  std::error_code ec;
  fs::create_directories(syncDir, ec);
  if (ec) {
    PrintFailure("FAIL mkdir " + syncDir.string() + ": " + ec.message());
    return false;
  }
  bool wrote = true;
  map.ForEachTile([&](const fogmap::TilePtr& tile) {
    std::vector<uint8_t> bytes;
    std::string writeError;
    if (!tile->Dump(&bytes, &writeError) ||
        !fogmap::WriteFileBytes((syncDir / tile->Filename()).string(), bytes, &writeError)) {
      PrintFailure("FAIL write tile: " + writeError);
      wrote = false;
    }
  });
  std::string writeError;
  const std::string note = "not a tile";
  if (!wrote || !fogmap::WriteFileBytes((syncDir / "readme.txt").string(),
                                        std::vector<uint8_t>(note.begin(), note.end()),
                                        &writeError)) {
    PrintFailure("FAIL write folder: " + writeError);
    return false;
  }

  fogmap::FogMap fromFolder;
  if (!fogmap::ImportFromPath(syncDir.string(), &fromFolder, &error)) {
    PrintFailure("FAIL import folder: " + error.message);
    return false;
  }
  if (!SameContent(map, fromFolder, &diff)) {
    PrintFailure("FAIL import folder: " + diff);
    return false;
  }

  const fs::path zipPath = tempDir / "export.zip";
  fogmap::FogMap fromFile;
  if (!fogmap::ExportArchive(map, fogmap::ExportOptions(), &archive, &error) ||
      !fogmap::WriteArchiveFile(zipPath.string(), archive, &error) ||
      !fogmap::ImportFromPath(zipPath.string(), &fromFile, &error)) {
    PrintFailure("FAIL import zip file: " + error.message);
    return false;
  }
  if (!SameContent(map, fromFile, &diff)) {
    PrintFailure("FAIL import zip file: " + diff);
    return false;
  }

  if (fogmap::ImportFromPath((tempDir / "missing").string(), &fromFile, &error) ||
      error.code != fogmap::ArchiveErrorCode::kNotFound) {
    PrintFailure("FAIL import missing: expected not-found");
    return false;
  }

  std::cout << "PASS archive: export/import round trip ok\n";
  return true;
}

bool RunEraseSession() {
  const fogmap::FogMap base = DrawLines({{121.5, 25.0, 121.6, 25.1}});
  const size_t before = VisitedPixels(base);

  fogmap::EraseSession session(base, fogmap::BrushShape::Circle, 5);
  if (session.Shape() != fogmap::BrushShape::Circle || session.Size() != 5 ||
      !session.BaseMap().SharesStateWith(base)) {
    PrintFailure("FAIL erase session: brush settings not kept");
    return false;
  }
  const fogmap::EraseResult miss =
      session.EraseSegment(fogmap::LngLat{0.0, 0.0}, fogmap::LngLat{0.001, 0.001});
  if (miss.changed || session.ErasedArea()) {
    PrintFailure("FAIL erase session: erasing unexplored area reported a change");
    return false;
  }
  if (!session.Publish(base).SharesStateWith(base)) {
    PrintFailure("FAIL erase session: publishing without edits must not change the map");
    return false;
  }

  const fogmap::EraseResult hit =
      session.EraseSegment(fogmap::LngLat{121.5, 25.0}, fogmap::LngLat{121.55, 25.05});
  if (!hit.changed || !session.ErasedArea()) {
    PrintFailure("FAIL erase session: brush over the line must erase pixels");
    return false;
  }
  if (VisitedPixels(base) != before) {
    PrintFailure("FAIL erase session: base map was modified");
    return false;
  }

  const fogmap::FogMap first = session.Publish(base);
  const size_t after = VisitedPixels(first);
  if (after >= before || after == 0) {
    PrintFailure("FAIL erase session: expected part of the line erased");
    return false;
  }
  if (!session.Publish(first).SharesStateWith(first)) {
    PrintFailure("FAIL erase session: republishing unchanged drafts must be a no-op");
    return false;
  }

  const fogmap::EraseResult rest =
      session.EraseSegment(fogmap::LngLat{121.55, 25.05}, fogmap::LngLat{121.6, 25.1});
  const fogmap::FogMap second = session.Publish(first);
  if (!rest.changed || VisitedPixels(second) >= after) {
    PrintFailure("FAIL erase session: second segment must erase more pixels");
    return false;
  }

  fogmap::EraseSession square(base, fogmap::BrushShape::Square, 1);
  if (square.EraseSegment(fogmap::LngLat{std::nan(""), 0.0}, fogmap::LngLat{1.0, 1.0}).changed) {
    PrintFailure("FAIL erase session: non-finite segment must be ignored");
    return false;
  }

  size_t traced = 0;
  fogmap::TraceLine(0, 0, 5, -3, [&traced](int64_t, int64_t) { ++traced; });
  if (traced != 6) {
    PrintFailure("FAIL trace line: expected 6 pixels, got " + std::to_string(traced));
    return false;
  }

  std::cout << "PASS erase_session: drafts publish incrementally\n";
  return true;
}

bool RunHistory() {
  const fogmap::FogMap a = DrawLines({{121.5, 25.0, 121.6, 25.1}});
  const fogmap::FogMap b = a.AddLine(121.0, 25.0, 122.0, 26.0);
  const fogmap::FogMap c = b.AddLine(-5.0, 50.0, 5.0, 55.0);

  fogmap::History history(fogmap::FogMap::Empty(), 2);
  if (history.Limit() != 2 || history.CanUndo() || history.CanRedo()) {
    PrintFailure("FAIL history: fresh history must have nothing to undo or redo");
    return false;
  }
  history.Append(a, fogmap::AffectedArea::All());
  history.Append(b, fogmap::AffectedArea::Of(fogmap::Bbox{121.0, 25.0, 122.0, 26.0}));
  history.Append(c, fogmap::AffectedArea::All());
  if (history.Size() != 3) {
    PrintFailure("FAIL history: limit 2 must keep 3 snapshots, got " +
                 std::to_string(history.Size()));
    return false;
  }

  fogmap::FogMap restored;
  bool wholeMap = false;
  const auto apply = [&](const fogmap::FogMap& map, const fogmap::AffectedArea& area) {
    restored = map;
    wholeMap = area.all;
  };
  if (!history.Undo(apply) || !restored.SharesStateWith(b) || !wholeMap) {
    PrintFailure("FAIL history undo: expected snapshot b with the area of c");
    return false;
  }
  if (!history.Undo(apply) || !restored.SharesStateWith(a) || wholeMap) {
    PrintFailure("FAIL history undo: expected snapshot a with the bbox of b");
    return false;
  }
  if (history.Undo(apply)) {
    PrintFailure("FAIL history undo: oldest snapshot was not evicted");
    return false;
  }
  if (!history.Redo(apply) || !restored.SharesStateWith(b)) {
    PrintFailure("FAIL history redo: expected snapshot b");
    return false;
  }

  history.Append(a, fogmap::AffectedArea::All());
  if (history.CanRedo() || !history.Current().SharesStateWith(a)) {
    PrintFailure("FAIL history: append must drop redo entries");
    return false;
  }

  history.Reset(c);
  if (history.Size() != 1 || history.CanUndo() || !history.Current().SharesStateWith(c)) {
    PrintFailure("FAIL history reset: expected a single snapshot");
    return false;
  }

  std::cout << "PASS history: undo/redo ok\n";
  return true;
}

bool RunConfig(const fs::path& tempDir) {
  fogmap::EditorConfig config;
  std::string error;
  if (!fogmap::ParseEditorConfig(
          R"({"eraserSize": 9, "eraserShape": "square", "historyLimit": 20,
              "logLevel": "warn", "skipAntimeridianSegments": false})",
          &config, &error)) {
    PrintFailure("FAIL config parse: " + error);
    return false;
  }
  if (config.eraserSize != 9 || config.eraserShape != fogmap::BrushShape::Square ||
      config.historyLimit != 20 || config.logLevel != spdlog::level::warn ||
      config.skipAntimeridianSegments || config.exportYieldInterval != 50 ||
      config.syncFolder != "Sync") {
    PrintFailure("FAIL config parse: values not applied");
    return false;
  }

  const char* invalid[] = {
      "[1, 2]",
      "{\"eraserSize\": -1}",
      "{\"eraserSize\": \"big\"}",
      "{\"eraserShape\": \"star\"}",
      "{\"logLevel\": \"loud\"}",
      "{\"syncFolder\": \"a/b\"}",
      "{not json",
  };
  for (const char* text : invalid) {
    fogmap::EditorConfig rejected;
    std::string rejectError;
    if (fogmap::ParseEditorConfig(text, &rejected, &rejectError) || rejectError.empty()) {
      PrintFailure(std::string("FAIL config parse should reject ") + text);
      return false;
    }
  }

  const fs::path path = tempDir / "editor.json";
  fogmap::EditorConfig reloaded;
  if (!fogmap::SaveEditorConfig(path.string(), config, &error) ||
      !fogmap::LoadEditorConfig(path.string(), &reloaded, &error)) {
    PrintFailure("FAIL config save/load: " + error);
    return false;
  }
  if (reloaded.eraserSize != config.eraserSize || reloaded.eraserShape != config.eraserShape ||
      reloaded.logLevel != config.logLevel) {
    PrintFailure("FAIL config save/load: values differ");
    return false;
  }

  std::cout << "PASS config: parse, validate and save ok\n";
  return true;
}

bool RunTracks(const fs::path& tempDir) {
  std::vector<fogmap::Track> tracks;
  std::string error;
  if (!fogmap::ParseTrackJson("[[121.5, 25.0], [121.6, 25.1]]", &tracks, &error) ||
      tracks.size() != 1 || tracks[0].size() != 2) {
    PrintFailure("FAIL track json: plain coordinate array " + error);
    return false;
  }

  const std::string geoJson = R"({
    "type": "FeatureCollection",
    "features": [
      {"type": "Feature", "properties": {},
       "geometry": {"type": "LineString", "coordinates": [[121.0, 25.0], [122.0, 26.0]]}},
      {"type": "Feature", "properties": {},
       "geometry": {"type": "MultiLineString",
                    "coordinates": [[[-5.0, 50.0], [5.0, 55.0]], [[10.0, 10.0], [10.1, 10.1]]]}}
    ]
  })";
  if (!fogmap::ParseTrackJson(geoJson, &tracks, &error) || tracks.size() != 3) {
    PrintFailure("FAIL track json: feature collection " + error);
    return false;
  }
  if (fogmap::ParseTrackJson("{\"type\": \"Point\", \"coordinates\": [1, 2]}", &tracks, &error) &&
      !tracks.empty()) {
    PrintFailure("FAIL track json: point geometry must not yield a track");
    return false;
  }
  if (fogmap::ParseTrackJson("[[1, 2], [3]]", &tracks, &error)) {
    PrintFailure("FAIL track json: short position must be rejected");
    return false;
  }

  if (!fogmap::CrossesAntimeridian(179.9, -179.9) || fogmap::CrossesAntimeridian(10.0, 20.0)) {
    PrintFailure("FAIL antimeridian detection");
    return false;
  }
  const fogmap::Track crossing = {{179.9, 10.0}, {-179.9, 10.0}};
  const fogmap::FogMap empty = fogmap::FogMap::Empty();
  if (!fogmap::DrawTrack(empty, crossing).SharesStateWith(empty)) {
    PrintFailure("FAIL draw track: antimeridian segment must be skipped");
    return false;
  }

  fogmap::Track line;
  line.push_back(fogmap::LngLat{121.5, 25.0});
  line.push_back(fogmap::LngLat{121.6, 25.1});
  fogmap::Track single;
  single.push_back(fogmap::LngLat{7.0, 7.0});
  const fogmap::TrackImportResult built = fogmap::BuildTrackMap(std::vector<fogmap::Track>{line, single});
  if (!CheckCounts("track map", built.map, 1, 39)) {
    return false;
  }
  if (!built.firstCoordinate || built.firstCoordinate->lng != 121.5 || !built.bbox ||
      built.bbox->west != 7.0 || built.bbox->east != 121.6) {
    PrintFailure("FAIL track map: first coordinate or bbox wrong");
    return false;
  }

  const fs::path jsonPath = tempDir / "track.geojson";
  const std::vector<uint8_t> geoBytes(geoJson.begin(), geoJson.end());
  if (!fogmap::WriteFileBytes(jsonPath.string(), geoBytes, &error)) {
    PrintFailure("FAIL write track: " + error);
    return false;
  }
  fogmap::ArchiveError archiveError;
  if (!fogmap::LoadTrackFile(jsonPath.string(), &tracks, &archiveError) || tracks.size() != 3) {
    PrintFailure("FAIL load track: " + archiveError.message);
    return false;
  }

  fogmap::ZipWriter writer;
  std::vector<uint8_t> archive;
  if (!writer.AddFile("doc/track.geojson", geoBytes, &error) || !writer.Finish(&archive, &error)) {
    PrintFailure("FAIL zip track: " + error);
    return false;
  }
  const fs::path zipPath = tempDir / "track.zip";
  if (!fogmap::WriteFileBytes(zipPath.string(), archive, &error) ||
      !fogmap::LoadTrackFile(zipPath.string(), &tracks, &archiveError) || tracks.size() != 3) {
    PrintFailure("FAIL load zipped track: " + error + archiveError.message);
    return false;
  }

  if (fogmap::LoadTrackFile((tempDir / "none.json").string(), &tracks, &archiveError) ||
      archiveError.code != fogmap::ArchiveErrorCode::kNotFound) {
    PrintFailure("FAIL load track: missing file must report not-found");
    return false;
  }

  std::cout << "PASS tracks: JSON and archive tracks ok\n";
  return true;
}

class CountingSink : public fogmap::RenderSink {
 public:
  void RedrawArea(const fogmap::Bbox&) override { ++areas; }
  void RedrawAll() override { ++full; }

  int areas = 0;
  int full = 0;
};

bool RunController() {
  CountingSink sink;
  fogmap::EditorConfig config;
  config.eraserSize = 5;
  fogmap::EditorController controller(&sink, config);

  const fogmap::LngLat from{121.5, 25.0};
  const fogmap::LngLat to{121.6, 25.1};
  if (!controller.DrawLine(from, to) || sink.areas != 1 || controller.GetHistory().Size() != 2) {
    PrintFailure("FAIL controller draw: expected one redraw and one history entry");
    return false;
  }
  if (controller.DrawLine(from, to) || sink.areas != 1 || controller.GetHistory().Size() != 2) {
    PrintFailure("FAIL controller draw: unchanged map must not be recorded");
    return false;
  }
  const fogmap::FogMap drawn = controller.Map();

  if (!controller.Undo() || controller.Map().TileCount() != 0 || !controller.Redo() ||
      !controller.Map().SharesStateWith(drawn)) {
    PrintFailure("FAIL controller undo/redo");
    return false;
  }

  controller.SetEraserSize(0);
  controller.SetEraserSize(7);
  if (controller.Config().eraserSize != 7) {
    PrintFailure("FAIL controller eraser size: expected 7, got " +
                 std::to_string(controller.Config().eraserSize));
    return false;
  }

  controller.BeginErase(from);
  const size_t historyBefore = controller.GetHistory().Size();
  if (!controller.IsErasing() || !controller.EraseTo(fogmap::LngLat{121.55, 25.05}) ||
      controller.GetHistory().Size() != historyBefore) {
    PrintFailure("FAIL controller erase: strokes must update the map without history");
    return false;
  }
  controller.EraseTo(to);
  controller.EndErase();
  if (controller.IsErasing() || controller.GetHistory().Size() != historyBefore + 1 ||
      VisitedPixels(controller.Map()) >= VisitedPixels(drawn)) {
    PrintFailure("FAIL controller erase: gesture must record one history entry");
    return false;
  }
  if (!controller.Undo() || !controller.Map().SharesStateWith(drawn)) {
    PrintFailure("FAIL controller erase: undo must restore the pre-gesture map");
    return false;
  }

  // Undo in the middle of a gesture ends it; later strokes must not resurrect
  // the map the gesture started from.
  controller.BeginErase(from);
  controller.EraseTo(fogmap::LngLat{121.55, 25.05});
  const size_t historyMidGesture = controller.GetHistory().Size();
  if (!controller.Undo() || controller.IsErasing()) {
    PrintFailure("FAIL controller erase: undo must end an active gesture");
    return false;
  }
  const fogmap::FogMap afterUndo = controller.Map();
  if (controller.EraseTo(to) || !controller.Map().SharesStateWith(afterUndo)) {
    PrintFailure("FAIL controller erase: strokes after undo must be ignored");
    return false;
  }
  controller.EndErase();
  if (controller.GetHistory().Size() != historyMidGesture) {
    PrintFailure("FAIL controller erase: ended gesture must not record history");
    return false;
  }
  if (!controller.Redo()) {
    PrintFailure("FAIL controller erase: redo after gesture undo");
    return false;
  }
  controller.BeginErase(from);
  if (!controller.Redo() || controller.IsErasing()) {
    PrintFailure("FAIL controller erase: redo must end an active gesture");
    return false;
  }
  if (!controller.Undo() || !controller.Map().SharesStateWith(drawn)) {
    PrintFailure("FAIL controller erase: history must still lead back to the drawn map");
    return false;
  }

  std::vector<uint8_t> archive;
  fogmap::ArchiveError error;
  if (!controller.ExportDirty(nullptr, &archive, &error) ||
      controller.Map().GetDirtyTilesCount() != 0) {
    PrintFailure("FAIL controller export dirty: " + error.message);
    return false;
  }

  fogmap::Track shortTrack;
  shortTrack.push_back(fogmap::LngLat{10.0, 10.0});
  shortTrack.push_back(fogmap::LngLat{10.1, 10.1});
  const int areasBefore = sink.areas;
  if (!controller.DrawTrack(shortTrack) || sink.areas != areasBefore + 1 ||
      controller.DrawTrack(fogmap::Track())) {
    PrintFailure("FAIL controller draw track");
    return false;
  }

  fogmap::Track europe;
  europe.push_back(fogmap::LngLat{-5.0, 50.0});
  europe.push_back(fogmap::LngLat{5.0, 55.0});
  fogmap::TrackImportResult merged;
  if (!controller.MergeTracks(std::vector<fogmap::Track>{europe}, &merged) ||
      !merged.firstCoordinate || controller.Map().TileCount() <= drawn.TileCount()) {
    PrintFailure("FAIL controller merge tracks");
    return false;
  }

  fogmap::BlockSelection selection;
  for (const fogmap::BlockRef& ref : controller.Map().GetBlocks(fogmap::Bbox{121.4, 24.9, 121.7, 25.2})) {
    selection[ref.tile].insert(ref.block);
  }
  if (!controller.RemoveBlocks(selection) ||
      !controller.Map().GetBlocks(fogmap::Bbox{121.4, 24.9, 121.7, 25.2}).empty()) {
    PrintFailure("FAIL controller remove blocks");
    return false;
  }

  const int fullBefore = sink.full;
  controller.ReplaceFogMap(fogmap::FogMap::Empty());
  if (sink.full != fullBefore + 1 || controller.GetHistory().CanUndo() ||
      controller.Map().TileCount() != 0) {
    PrintFailure("FAIL controller replace: expected a fresh document");
    return false;
  }

  std::cout << "PASS controller: edits, history and export ok\n";
  return true;
}

int RunSmoke() {
  std::error_code ec;
  fs::path tempDir = fs::temp_directory_path(ec);
  if (ec) {
    PrintFailure("FAIL tempdir: " + ec.message());
    return 1;
  }
  const auto nowTicks = std::chrono::steady_clock::now().time_since_epoch().count();
  tempDir /= "fogmap_smoke_" + std::to_string(nowTicks);
  fs::create_directories(tempDir, ec);
  if (ec) {
    PrintFailure("FAIL tempdir " + tempDir.string() + ": " + ec.message());
    return 1;
  }

  fogmap::Logger()->set_level(spdlog::level::err);

  const bool ok = RunRasterization() && RunFilenameCodec() && RunBlock() && RunTileCodec() &&
                  RunMapEdits() && RunMerge() && RunZip() && RunArchive(tempDir) &&
                  RunEraseSession() && RunHistory() && RunConfig(tempDir) &&
                  RunTracks(tempDir) && RunController();

  fs::remove_all(tempDir, ec);
  if (!ok) {
    return 1;
  }
  std::cout << "PASS fogmap_smoke: all checks ok\n";
  return 0;
}

}  // namespace

int main() {
  return RunSmoke();
}
