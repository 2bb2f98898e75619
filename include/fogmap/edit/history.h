#pragma once

#include <cstddef>
#include <deque>
#include <functional>

#include "fogmap/core/coords.h"
#include "fogmap/core/fog_map.h"

namespace fogmap {

// Region a map change touched: a bbox, or the whole map.
struct AffectedArea {
  bool all = true;
  Bbox bbox;

  static AffectedArea All() { return AffectedArea(); }
  static AffectedArea Of(const Bbox& area) {
    AffectedArea result;
    result.all = false;
    result.bbox = area;
    return result;
  }
};

// Bounded undo/redo list of FogMap snapshots. Snapshots share structure, so
// keeping many of them costs little more than the changed tiles.
class History {
 public:
  using ApplyFn = std::function<void(const FogMap&, const AffectedArea&)>;

  explicit History(FogMap initial = FogMap::Empty(), size_t limit = 100);

  // Drops any redo entries, then records `map` as the newest snapshot.
  void Append(const FogMap& map, const AffectedArea& area);

  bool CanUndo() const { return position_ > 0; }
  bool CanRedo() const { return position_ + 1 < entries_.size(); }

  // `apply` receives the snapshot to restore and the area that differs.
  bool Undo(const ApplyFn& apply);
  bool Redo(const ApplyFn& apply);

  void Reset(const FogMap& map);

  const FogMap& Current() const { return entries_[position_].map; }
  size_t Size() const { return entries_.size(); }
  size_t Limit() const { return limit_; }

 private:
  struct Entry {
    FogMap map;
    AffectedArea area;  // what changed relative to the previous entry
  };

  std::deque<Entry> entries_;
  size_t position_ = 0;
  size_t limit_ = 100;
};

}  // namespace fogmap
