#include "fogmap/core/block.h"

#include "fogmap/core/log.h"

#include <algorithm>
#include <cstring>

namespace fogmap {

namespace {

constexpr uint16_t kRegionBitsMask = 0xC000;
constexpr uint16_t kChecksumMask = 0x3FFF;

bool GetPoint(const Block::Bitmap& bitmap, int64_t x, int64_t y) {
  const int bitOffset = 7 - static_cast<int>(x % 8);
  const size_t index = static_cast<size_t>(x / 8 + y * 8);
  return (bitmap[index] & (1u << bitOffset)) != 0;
}

void SetPoint(Block::Bitmap* bitmap, int64_t x, int64_t y, bool value) {
  const int bitOffset = 7 - static_cast<int>(x % 8);
  const size_t index = static_cast<size_t>(x / 8 + y * 8);
  const uint8_t mask = static_cast<uint8_t>(1u << bitOffset);
  if (value) {
    (*bitmap)[index] = static_cast<uint8_t>((*bitmap)[index] | mask);
  } else {
    (*bitmap)[index] = static_cast<uint8_t>((*bitmap)[index] & ~mask);
  }
}

int CountBits(const Block::Bitmap& bitmap) {
  int count = 0;
  for (uint8_t byte : bitmap) {
    for (uint8_t rest = byte; rest != 0; rest = static_cast<uint8_t>(rest & (rest - 1))) {
      ++count;
    }
  }
  return count;
}

bool IsZero(const Block::Bitmap& bitmap) {
  return std::all_of(bitmap.begin(), bitmap.end(), [](uint8_t byte) { return byte == 0; });
}

uint16_t ReadChecksumField(const Block::ExtraData& extraData) {
  return static_cast<uint16_t>((static_cast<uint16_t>(extraData[1]) << 8) | extraData[2]);
}

}  // namespace

Block::Block(PrivateTag, int x, int y, const Bitmap& bitmap, const ExtraData& extraData)
    : x_(x), y_(y), bitmap_(bitmap), extraData_(extraData) {}

BlockPtr Block::Create(int x, int y, const uint8_t* data) {
  Bitmap bitmap{};
  ExtraData extraData{};
  if (data != nullptr) {
    std::memcpy(bitmap.data(), data, kBlockBitmapSize);
    std::memcpy(extraData.data(), data + kBlockBitmapSize, kBlockExtraData);
  }
  return std::make_shared<const Block>(PrivateTag{}, x, y, bitmap, extraData);
}

BlockPtr Block::FromParts(int x, int y, const Bitmap& bitmap, const ExtraData& extraData) {
  return std::make_shared<const Block>(PrivateTag{}, x, y, bitmap, extraData);
}

bool Block::IsVisited(int x, int y) const {
  return GetPoint(bitmap_, x, y);
}

bool Block::IsEmpty() const {
  return IsZero(bitmap_);
}

int Block::Count() const {
  return (ReadChecksumField(extraData_) & kChecksumMask) >> 1;
}

int Block::PopCount() const {
  return CountBits(bitmap_);
}

std::string Block::Region() const {
  std::string region(2, '?');
  region[0] = static_cast<char>((extraData_[0] >> 3) + '?');
  region[1] = static_cast<char>((((extraData_[0] & 0x7) << 2) | ((extraData_[1] & 0xC0) >> 6)) + '?');
  return region;
}

bool Block::Check() const {
  const int actual = PopCount();
  const int stored = Count();
  if (actual != stored) {
    Logger()->warn("block ({}, {}) checksum mismatch: stored {} actual {}", x_, y_, stored, actual);
    return false;
  }
  return true;
}

Block::Record Block::Dump() const {
  Record record{};
  std::copy(bitmap_.begin(), bitmap_.end(), record.begin());

  const uint16_t previous = ReadChecksumField(extraData_);
  const uint16_t field = static_cast<uint16_t>((previous & kRegionBitsMask) |
                                               ((PopCount() << 1) + 1));
  record[kBlockBitmapSize] = extraData_[0];
  record[kBlockBitmapSize + 1] = static_cast<uint8_t>(field >> 8);
  record[kBlockBitmapSize + 2] = static_cast<uint8_t>(field & 0xFF);
  return record;
}

BlockPtr Block::SelfOrNew(const Bitmap& bitmap) const {
  if (bitmap == bitmap_) {
    return shared_from_this();
  }
  return FromParts(x_, y_, bitmap, extraData_);
}

BlockPtr Block::ClearRect(int x, int y, int width, int height) const {
  const int x0 = std::max(x, 0);
  const int y0 = std::max(y, 0);
  const int x1 = std::min(x + width, kBitmapWidth);
  const int y1 = std::min(y + height, kBitmapWidth);

  Bitmap bitmap = bitmap_;
  for (int i = x0; i < x1; ++i) {
    for (int j = y0; j < y1; ++j) {
      SetPoint(&bitmap, i, j, false);
    }
  }
  if (bitmap == bitmap_) {
    return shared_from_this();
  }
  if (IsZero(bitmap)) {
    return nullptr;
  }
  return FromParts(x_, y_, bitmap, extraData_);
}

BlockPtr Block::Union(const Block& other) const {
  Bitmap bitmap = bitmap_;
  for (size_t i = 0; i < bitmap.size(); ++i) {
    bitmap[i] = static_cast<uint8_t>(bitmap[i] | other.bitmap_[i]);
  }
  return SelfOrNew(bitmap);
}

// Bresenham with the error term handed in by the caller, so a line split over
// many blocks matches one drawn on a single bitmap.
BlockLineResult Block::AddLine(int64_t x, int64_t y, int64_t end, int64_t p,
                               const LineParams& line) const {
  Bitmap bitmap = bitmap_;
  SetPoint(&bitmap, x, y, line.value);

  if (line.xAxisDominant) {
    while (x < end) {
      ++x;
      if (p < 0) {
        p += 2 * line.dy0;
      } else {
        y += line.quadrants13 ? 1 : -1;
        p += 2 * (line.dy0 - line.dx0);
      }
      if (x >= kBitmapWidth || y < 0 || y >= kBitmapWidth) {
        break;
      }
      SetPoint(&bitmap, x, y, line.value);
    }
  } else {
    while (y < end) {
      ++y;
      if (p <= 0) {
        p += 2 * line.dx0;
      } else {
        x += line.quadrants13 ? 1 : -1;
        p += 2 * (line.dx0 - line.dy0);
      }
      if (y >= kBitmapWidth || x < 0 || x >= kBitmapWidth) {
        break;
      }
      SetPoint(&bitmap, x, y, line.value);
    }
  }

  BlockLineResult result;
  result.x = x;
  result.y = y;
  result.p = p;
  if (!line.value && IsZero(bitmap)) {
    return result;
  }
  result.block = SelfOrNew(bitmap);
  return result;
}

BlockDraft Block::Draft() const {
  return BlockDraft(x_, y_, bitmap_, extraData_);
}

BlockDraft::BlockDraft(int x, int y, const Block::Bitmap& bitmap, const Block::ExtraData& extraData)
    : x_(x), y_(y), bitmap_(bitmap), extraData_(extraData), count_(CountBits(bitmap)) {}

bool BlockDraft::IsVisited(int x, int y) const {
  return GetPoint(bitmap_, x, y);
}

bool BlockDraft::Set(int x, int y, bool value) {
  if (x < 0 || y < 0 || x >= kBitmapWidth || y >= kBitmapWidth) {
    return false;
  }
  if (GetPoint(bitmap_, x, y) == value) {
    return false;
  }
  SetPoint(&bitmap_, x, y, value);
  count_ += value ? 1 : -1;
  return true;
}

BlockPtr BlockDraft::Freeze() const {
  return Block::FromParts(x_, y_, bitmap_, extraData_);
}

}  // namespace fogmap
