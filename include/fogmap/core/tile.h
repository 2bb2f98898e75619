#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "fogmap/core/block.h"
#include "fogmap/core/coords.h"
#include "fogmap/core/keys.h"
#include "fogmap/core/persistent_map.h"

namespace fogmap {

class Tile;
using TilePtr = std::shared_ptr<const Tile>;

// Blocks of one tile keyed by BlockKey::Index() (128 * 128 = 2^14 slots).
using BlockMap = PersistentIndexMap<BlockPtr, 14>;

// Local block edits; a null BlockPtr deletes the block.
using BlockPatch = std::map<BlockKey, BlockPtr>;

struct TileLineResult {
  TilePtr tile;  // null when the tile lost its last block
  int64_t x = 0;
  int64_t y = 0;
  int64_t p = 0;
};

// One 128x128-block region of the world, the unit of file storage.
// A Tile with no blocks is a tombstone: it only exists so that a differential
// export can tell the originating app the tile became empty.
class Tile : public std::enable_shared_from_this<Tile> {
 private:
  struct PrivateTag {};

 public:
  static TilePtr CreateEmpty(int x, int y);

  // Parses a compressed tile file. The id is recovered from `filename`.
  static bool Create(const std::string& filename, const std::vector<uint8_t>& compressed,
                     TilePtr* outTile, std::string* outError);

  Tile(PrivateTag, std::string filename, uint32_t id, BlockMap blocks);

  const std::string& Filename() const { return filename_; }
  uint32_t Id() const { return id_; }
  int X() const { return static_cast<int>(id_ % kMapWidth); }
  int Y() const { return static_cast<int>(id_ / kMapWidth); }
  TileKey Key() const { return TileKey::FromIndex(id_); }

  const BlockMap& Blocks() const { return blocks_; }
  size_t BlockCount() const { return blocks_.Size(); }
  bool IsTombstone() const { return blocks_.Empty(); }
  BlockPtr FindBlock(const BlockKey& key) const;

  template <typename Fn>
  void ForEachBlock(Fn&& fn) const {
    blocks_.ForEach([&fn](uint32_t index, const BlockPtr& block) {
      fn(BlockKey::FromIndex(index), block);
    });
  }

  // Tile-local pixel coordinates; see Block::AddLine.
  TileLineResult AddLine(int64_t x, int64_t y, int64_t end, int64_t p,
                         const LineParams& line) const;

  // Bounds are tile-local fractions of the tile (0..1 covers it).
  std::vector<BlockKey> GetIntersectingBlocks(double xMin, double yMin, double xMax,
                                              double yMax) const;

  TilePtr RemoveBlocks(const std::set<BlockKey>& keys) const;

  // Rectangle in block units (0..128 covers the tile).
  TilePtr ClearRect(double x, double y, double width, double height) const;

  // Never returns null: a patch that deletes every block yields a tombstone.
  TilePtr WithBlocks(const BlockPatch& patch) const;

  Bbox Bounds() const;

  bool Dump(std::vector<uint8_t>* outCompressed, std::string* outError) const;

 private:
  TilePtr Rebuilt(const BlockMap& blocks) const;

  std::string filename_;
  uint32_t id_ = 0;
  BlockMap blocks_;
};

}  // namespace fogmap
