#include "fogmap/core/tile.h"

#include "fogmap/core/deflate.h"
#include "fogmap/core/filename_codec.h"
#include "fogmap/core/log.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace fogmap {

namespace {

// Halves round towards positive infinity.
int RoundHalfUp(double value) {
  return static_cast<int>(std::floor(value + 0.5));
}

bool Fail(const std::string& message, std::string* outError) {
  if (outError != nullptr) {
    *outError = message;
  }
  return false;
}

}  // namespace

Tile::Tile(PrivateTag, std::string filename, uint32_t id, BlockMap blocks)
    : filename_(std::move(filename)), id_(id), blocks_(std::move(blocks)) {}

TilePtr Tile::CreateEmpty(int x, int y) {
  const uint32_t id = TileKey{x, y}.Index();
  Logger()->debug("creating tile {} ({}, {})", id, x, y);
  return std::make_shared<const Tile>(PrivateTag{}, EncodeTileFilename(id), id, BlockMap());
}

bool Tile::Create(const std::string& filename, const std::vector<uint8_t>& compressed,
                  TilePtr* outTile, std::string* outError) {
  if (outTile == nullptr) {
    return Fail("outTile must not be null", outError);
  }

  uint32_t id = 0;
  std::string codecError;
  if (!DecodeTileFilename(filename, &id, &codecError)) {
    return Fail(codecError, outError);
  }

  std::vector<uint8_t> raw;
  std::string inflateError;
  if (!InflateBytes(compressed.data(), compressed.size(), DeflateFormat::Zlib, 0, &raw,
                    &inflateError)) {
    return Fail(filename + ": " + inflateError, outError);
  }
  if (raw.size() < static_cast<size_t>(kTileHeaderSize)) {
    return Fail(filename + ": tile data shorter than its header (" + std::to_string(raw.size()) +
                " bytes)", outError);
  }

  BlockMap blocks;
  for (uint32_t i = 0; i < static_cast<uint32_t>(kTileHeaderLen); ++i) {
    const uint16_t blockIdx =
        static_cast<uint16_t>(raw[i * 2] | (static_cast<uint16_t>(raw[i * 2 + 1]) << 8));
    if (blockIdx == 0) {
      continue;
    }
    const size_t start = static_cast<size_t>(kTileHeaderSize) +
                         static_cast<size_t>(blockIdx - 1) * kBlockSize;
    if (start + kBlockSize > raw.size()) {
      return Fail(filename + ": block record " + std::to_string(blockIdx) +
                  " lies outside the tile data", outError);
    }
    const BlockKey key = BlockKey::FromIndex(i);
    BlockPtr block = Block::Create(key.x, key.y, raw.data() + start);
    block->Check();
    blocks = blocks.Set(i, std::move(block));
  }

  Logger()->debug("loaded tile {} ({}, {}) with {} blocks", id, id % kMapWidth, id / kMapWidth,
                  blocks.Size());
  *outTile = std::make_shared<const Tile>(PrivateTag{}, filename, id, std::move(blocks));
  return true;
}

BlockPtr Tile::FindBlock(const BlockKey& key) const {
  if (!key.IsInTile()) {
    return nullptr;
  }
  const BlockPtr* found = blocks_.Find(key.Index());
  return found != nullptr ? *found : nullptr;
}

TilePtr Tile::Rebuilt(const BlockMap& blocks) const {
  return std::make_shared<const Tile>(PrivateTag{}, filename_, id_, blocks);
}

TileLineResult Tile::AddLine(int64_t x, int64_t y, int64_t end, int64_t p,
                             const LineParams& line) const {
  BlockMap blocks = blocks_;
  bool changed = false;

  while (line.xAxisDominant ? x < end : y < end) {
    const int64_t blockX = FloorShift(x, kBitmapWidthOffset);
    const int64_t blockY = FloorShift(y, kBitmapWidthOffset);
    if (blockX < 0 || blockY < 0 || blockX >= kTileWidth || blockY >= kTileWidth) {
      break;
    }

    const BlockKey key{static_cast<int>(blockX), static_cast<int>(blockY)};
    const BlockPtr* found = blocks.Find(key.Index());
    const BlockPtr existing = found != nullptr ? *found : nullptr;
    const BlockPtr source = existing ? existing : Block::Create(key.x, key.y, nullptr);

    const int64_t originX = blockX << kBitmapWidthOffset;
    const int64_t originY = blockY << kBitmapWidthOffset;
    const int64_t localEnd = end - (line.xAxisDominant ? originX : originY);
    const BlockLineResult step = source->AddLine(x - originX, y - originY, localEnd, p, line);
    x = step.x + originX;
    y = step.y + originY;
    p = step.p;

    if (!existing) {
      // Erasing over a missing block leaves nothing to record.
      if (step.block) {
        blocks = blocks.Set(key.Index(), step.block);
        changed = true;
      }
    } else if (step.block != existing) {
      blocks = step.block ? blocks.Set(key.Index(), step.block) : blocks.Erase(key.Index());
      changed = true;
    }
  }

  TileLineResult result;
  result.x = x;
  result.y = y;
  result.p = p;
  if (!changed) {
    result.tile = shared_from_this();
  } else if (!blocks.Empty()) {
    result.tile = Rebuilt(blocks);
  }
  return result;
}

std::vector<BlockKey> Tile::GetIntersectingBlocks(double xMin, double yMin, double xMax,
                                                  double yMax) const {
  const int bxMin = std::max(static_cast<int>(std::floor(xMin * kTileWidth)), 0);
  const int byMin = std::max(static_cast<int>(std::floor(yMin * kTileWidth)), 0);
  const int bxMax = std::min(static_cast<int>(std::ceil(xMax * kTileWidth)), kTileWidth);
  const int byMax = std::min(static_cast<int>(std::ceil(yMax * kTileWidth)), kTileWidth);

  std::vector<BlockKey> result;
  for (int x = bxMin; x < bxMax; ++x) {
    for (int y = byMin; y < byMax; ++y) {
      const BlockKey key{x, y};
      if (blocks_.Contains(key.Index())) {
        result.push_back(key);
      }
    }
  }
  return result;
}

TilePtr Tile::RemoveBlocks(const std::set<BlockKey>& keys) const {
  BlockMap blocks = blocks_;
  for (const BlockKey& key : keys) {
    if (key.IsInTile()) {
      blocks = blocks.Erase(key.Index());
    }
  }
  if (blocks.SameRoot(blocks_)) {
    return shared_from_this();
  }
  if (blocks.Empty()) {
    return nullptr;
  }
  return Rebuilt(blocks);
}

TilePtr Tile::ClearRect(double x, double y, double width, double height) const {
  const double xMin = x;
  const double yMin = y;
  const double xMax = x + width;
  const double yMax = y + height;

  const int xFrom = std::max(static_cast<int>(std::floor(xMin)), 0);
  const int xTo = std::min(static_cast<int>(std::floor(xMax)), kTileWidth - 1);
  const int yFrom = std::max(static_cast<int>(std::floor(yMin)), 0);
  const int yTo = std::min(static_cast<int>(std::floor(yMax)), kTileWidth - 1);

  BlockMap blocks = blocks_;
  for (int bx = xFrom; bx <= xTo; ++bx) {
    for (int by = yFrom; by <= yTo; ++by) {
      const uint32_t index = BlockKey{bx, by}.Index();
      const BlockPtr* found = blocks.Find(index);
      if (found == nullptr) {
        continue;
      }
      const BlockPtr block = *found;
      const int xp0 = RoundHalfUp(std::max(xMin - bx, 0.0) * kBitmapWidth);
      const int yp0 = RoundHalfUp(std::max(yMin - by, 0.0) * kBitmapWidth);
      const int xp1 = RoundHalfUp(std::min(xMax - bx, 1.0) * kBitmapWidth);
      const int yp1 = RoundHalfUp(std::min(yMax - by, 1.0) * kBitmapWidth);
      BlockPtr cleared = block->ClearRect(xp0, yp0, xp1 - xp0, yp1 - yp0);
      if (cleared == block) {
        continue;
      }
      blocks = cleared ? blocks.Set(index, std::move(cleared)) : blocks.Erase(index);
    }
  }

  if (blocks.SameRoot(blocks_)) {
    return shared_from_this();
  }
  if (blocks.Empty()) {
    return nullptr;
  }
  return Rebuilt(blocks);
}

TilePtr Tile::WithBlocks(const BlockPatch& patch) const {
  BlockMap blocks = blocks_;
  for (const auto& entry : patch) {
    const BlockKey& key = entry.first;
    if (!key.IsInTile()) {
      Logger()->warn("tile {} ignores block key {} outside the tile", Key().ToString(),
                     key.ToString());
      continue;
    }
    if (!entry.second) {
      blocks = blocks.Erase(key.Index());
      continue;
    }
    const BlockPtr* found = blocks.Find(key.Index());
    if (found != nullptr && *found == entry.second) {
      continue;
    }
    blocks = blocks.Set(key.Index(), entry.second);
  }
  if (blocks.SameRoot(blocks_)) {
    return shared_from_this();
  }
  return Rebuilt(blocks);
}

Bbox Tile::Bounds() const {
  return TileBbox(X(), Y());
}

bool Tile::Dump(std::vector<uint8_t>* outCompressed, std::string* outError) const {
  if (outCompressed == nullptr) {
    return Fail("outCompressed must not be null", outError);
  }

  std::vector<uint8_t> raw(static_cast<size_t>(kTileHeaderSize) + blocks_.Size() * kBlockSize, 0);
  uint16_t activeBlockIdx = 1;
  blocks_.ForEach([&raw, &activeBlockIdx](uint32_t index, const BlockPtr& block) {
    raw[index * 2] = static_cast<uint8_t>(activeBlockIdx & 0xFF);
    raw[index * 2 + 1] = static_cast<uint8_t>(activeBlockIdx >> 8);
    const Block::Record record = block->Dump();
    std::copy(record.begin(), record.end(),
              raw.begin() + kTileHeaderSize + static_cast<size_t>(activeBlockIdx - 1) * kBlockSize);
    ++activeBlockIdx;
  });

  std::string deflateError;
  if (!DeflateBytes(raw.data(), raw.size(), DeflateFormat::Zlib, outCompressed, &deflateError)) {
    return Fail(filename_ + ": " + deflateError, outError);
  }
  return true;
}

}  // namespace fogmap
