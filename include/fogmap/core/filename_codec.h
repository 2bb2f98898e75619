#pragma once

#include <cstdint>
#include <string>

namespace fogmap {

// On-disk tile naming of the originating application:
//   <first 4 hex chars of md5(id)><id digits via mask 1><last 2 id digits via mask 2>
// with id = tileY * 512 + tileX. Only the middle part is read back.
std::string EncodeTileFilename(uint32_t tileId);
bool DecodeTileFilename(const std::string& filename, uint32_t* outTileId, std::string* outError);

std::string Md5Hex(const std::string& text);

}  // namespace fogmap
