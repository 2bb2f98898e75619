#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>

#include "fogmap/core/coords.h"
#include "fogmap/core/keys.h"

namespace fogmap {

class Block;
class BlockDraft;
using BlockPtr = std::shared_ptr<const Block>;

// Bresenham state that stays constant while a line crosses blocks and tiles.
struct LineParams {
  int64_t dx0 = 0;
  int64_t dy0 = 0;
  bool xAxisDominant = true;
  bool quadrants13 = false;  // secondary axis increments when true
  bool value = true;         // reveal (true) or erase (false)
};

struct BlockLineResult {
  BlockPtr block;  // null when erasing left no set bit
  int64_t x = 0;
  int64_t y = 0;
  int64_t p = 0;
};

// 64x64 visitation bitmap plus 3 metadata bytes:
//   byte 0     region code, high bits
//   bytes 1-2  big-endian: 2 bits region code, 14 bits (count << 1) | 1
// Blocks are immutable once created; edits produce a new Block, or return the
// same pointer when no bit changed.
class Block : public std::enable_shared_from_this<Block> {
 private:
  struct PrivateTag {};

 public:
  using Bitmap = std::array<uint8_t, kBlockBitmapSize>;
  using ExtraData = std::array<uint8_t, kBlockExtraData>;
  using Record = std::array<uint8_t, kBlockSize>;

  // `data` points at a 515-byte record, or is null for an empty block.
  static BlockPtr Create(int x, int y, const uint8_t* data);
  static BlockPtr FromParts(int x, int y, const Bitmap& bitmap, const ExtraData& extraData);

  Block(PrivateTag, int x, int y, const Bitmap& bitmap, const ExtraData& extraData);

  int X() const { return x_; }
  int Y() const { return y_; }
  BlockKey Key() const { return BlockKey{x_, y_}; }
  const Bitmap& GetBitmap() const { return bitmap_; }
  const ExtraData& GetExtraData() const { return extraData_; }

  bool IsVisited(int x, int y) const;
  bool IsEmpty() const;

  // Visited-pixel count as cached in the metadata (may be stale until Dump()).
  int Count() const;
  int PopCount() const;
  std::string Region() const;

  // Compares the cached count with the bitmap; logs a warning on mismatch.
  bool Check() const;

  // Raw record with a freshly computed checksum field.
  Record Dump() const;

  BlockPtr ClearRect(int x, int y, int width, int height) const;
  BlockPtr Union(const Block& other) const;

  // Steps from (x, y) towards `end` on the dominant axis, stopping when the
  // cursor leaves the block. Coordinates are block local.
  BlockLineResult AddLine(int64_t x, int64_t y, int64_t end, int64_t p,
                          const LineParams& line) const;

  BlockDraft Draft() const;

 private:
  BlockPtr SelfOrNew(const Bitmap& bitmap) const;

  int x_ = 0;
  int y_ = 0;
  Bitmap bitmap_{};
  ExtraData extraData_{};
};

// Mutable working copy of a Block used by erase gestures. A draft is private
// to its owner; Freeze() produces the immutable Block that gets published.
class BlockDraft {
 public:
  BlockDraft(int x, int y, const Block::Bitmap& bitmap, const Block::ExtraData& extraData);

  BlockKey Key() const { return BlockKey{x_, y_}; }
  bool IsVisited(int x, int y) const;
  // Returns true when the bit actually changed.
  bool Set(int x, int y, bool value);
  bool Clear(int x, int y) { return Set(x, y, false); }
  int Count() const { return count_; }
  bool IsEmpty() const { return count_ == 0; }

  BlockPtr Freeze() const;

 private:
  int x_ = 0;
  int y_ = 0;
  Block::Bitmap bitmap_{};
  Block::ExtraData extraData_{};
  int count_ = 0;
};

}  // namespace fogmap
