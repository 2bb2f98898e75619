#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "fogmap/core/coords.h"
#include "fogmap/core/keys.h"
#include "fogmap/core/persistent_map.h"
#include "fogmap/core/tile.h"

namespace fogmap {

// Raw tile file as found in a folder or archive (basename + compressed bytes).
struct TileFile {
  std::string name;
  std::vector<uint8_t> bytes;
};

using MapPatch = std::map<TileKey, BlockPatch>;
using BlockSelection = std::map<TileKey, std::set<BlockKey>>;

// Worldwide explored-area map: a sparse grid of Tiles plus the set of tiles
// changed since the last checkpoint. FogMap is a cheap value; copies share all
// storage and every mutation returns a new value. When an operation changes
// nothing the result shares state with its input (see SharesStateWith).
class FogMap {
 public:
  // Tile index is y * 512 + x, below 2^18.
  using TileMap = PersistentIndexMap<TilePtr, 18>;
  using DirtySet = PersistentIndexMap<bool, 18>;

  FogMap() = default;

  static FogMap Empty() { return FogMap(); }

  // Invalid files are logged and skipped; imported tiles are not dirty.
  static FogMap CreateFromFiles(const std::vector<TileFile>& files);

  // Reveals (value = true) or erases the segment between two lng/lat points.
  FogMap AddLine(double startLng, double startLat, double endLng, double endLat,
                 bool value = true) const;

  FogMap UpdateBlocks(const MapPatch& patch) const;

  std::vector<BlockRef> GetBlocks(const Bbox& bbox) const;
  FogMap RemoveBlocks(const BlockSelection& selection) const;
  FogMap ClearBbox(const Bbox& bbox) const;

  FogMap ClearDirtyTiles() const;
  size_t GetDirtyTilesCount() const { return dirty_.Size(); }
  bool IsDirty(const TileKey& key) const;

  TilePtr FindTile(const TileKey& key) const;
  BlockPtr FindBlock(const TileKey& tile, const BlockKey& block) const;
  size_t TileCount() const { return tiles_.Size(); }
  size_t BlockCount() const;

  template <typename Fn>
  void ForEachTile(Fn&& fn) const {
    tiles_.ForEach([&fn](uint32_t, const TilePtr& tile) { fn(tile); });
  }

  // Visits dirty keys in index order; the tile is null if the key has none.
  template <typename Fn>
  void ForEachDirtyTile(Fn&& fn) const {
    dirty_.ForEach([this, &fn](uint32_t index, bool) {
      const TilePtr* tile = tiles_.Find(index);
      fn(TileKey::FromIndex(index), tile != nullptr ? *tile : TilePtr());
    });
  }

  bool SharesStateWith(const FogMap& other) const {
    return tiles_.SameRoot(other.tiles_) && dirty_.SameRoot(other.dirty_);
  }

 private:
  FogMap(TileMap tiles, DirtySet dirty);

  TileMap tiles_;
  DirtySet dirty_;
};

}  // namespace fogmap
