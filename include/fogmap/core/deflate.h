#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fogmap {

// Upper bound on how far one byte of a deflate stream can expand.
constexpr size_t kMaxDeflateRatio = 1032;

enum class DeflateFormat {
  Zlib,  // RFC 1950 wrapper, used by tile files
  Raw,   // bare RFC 1951 stream, used inside ZIP entries
};

bool DeflateBytes(const uint8_t* data, size_t size, DeflateFormat format,
                  std::vector<uint8_t>* outCompressed, std::string* outError);

// `sizeHint` pre-sizes the output, capped at what `size` bytes can inflate to;
// 0 lets the buffer grow on demand.
bool InflateBytes(const uint8_t* data, size_t size, DeflateFormat format, size_t sizeHint,
                  std::vector<uint8_t>* outRaw, std::string* outError);

uint32_t Crc32(const uint8_t* data, size_t size);

}  // namespace fogmap
