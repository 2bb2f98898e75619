#include "fogmap/edit/history.h"

#include <utility>

namespace fogmap {

History::History(FogMap initial, size_t limit) : limit_(limit > 0 ? limit : 1) {
  entries_.push_back(Entry{std::move(initial), AffectedArea::All()});
}

void History::Append(const FogMap& map, const AffectedArea& area) {
  entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(position_ + 1), entries_.end());
  entries_.push_back(Entry{map, area});
  while (entries_.size() > limit_ + 1) {
    entries_.pop_front();
  }
  position_ = entries_.size() - 1;
}

bool History::Undo(const ApplyFn& apply) {
  if (!CanUndo()) {
    return false;
  }
  const AffectedArea area = entries_[position_].area;
  --position_;
  if (apply) {
    apply(entries_[position_].map, area);
  }
  return true;
}

bool History::Redo(const ApplyFn& apply) {
  if (!CanRedo()) {
    return false;
  }
  ++position_;
  if (apply) {
    apply(entries_[position_].map, entries_[position_].area);
  }
  return true;
}

void History::Reset(const FogMap& map) {
  entries_.clear();
  entries_.push_back(Entry{map, AffectedArea::All()});
  position_ = 0;
}

}  // namespace fogmap
