#include "fogmap/core/filename_codec.h"

#include "fogmap/core/coords.h"

#include <iomanip>
#include <sstream>

#include <openssl/evp.h>

namespace fogmap {

namespace {

constexpr char kFilenameMask1[] = "olhwjsktri";
constexpr char kFilenameMask2[] = "eizxdwknmo";
constexpr size_t kHashPrefixLength = 4;
constexpr size_t kSuffixLength = 2;
constexpr uint32_t kMaxTileId = static_cast<uint32_t>(kMapWidth) * kMapWidth;

int MaskValue(char ch) {
  for (int i = 0; i < 10; ++i) {
    if (kFilenameMask1[i] == ch) {
      return i;
    }
  }
  return -1;
}

bool Fail(const std::string& message, std::string* outError) {
  if (outError != nullptr) {
    *outError = message;
  }
  return false;
}

}  // namespace

std::string Md5Hex(const std::string& text) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLength = 0;
  if (EVP_Digest(text.data(), text.size(), digest, &digestLength, EVP_md5(), nullptr) != 1) {
    return std::string();
  }

  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < digestLength; ++i) {
    out << std::setw(2) << static_cast<int>(digest[i]);
  }
  return out.str();
}

std::string EncodeTileFilename(uint32_t tileId) {
  const std::string digits = std::to_string(tileId);

  std::string name1;
  std::string name2;
  name1.reserve(digits.size());
  name2.reserve(digits.size());
  for (char digit : digits) {
    const int d = digit - '0';
    name1.push_back(kFilenameMask1[d]);
    name2.push_back(kFilenameMask2[d]);
  }

  const std::string name0 = Md5Hex(digits).substr(0, kHashPrefixLength);
  const size_t tail = name2.size() > kSuffixLength ? name2.size() - kSuffixLength : 0;
  return name0 + name1 + name2.substr(tail);
}

bool DecodeTileFilename(const std::string& filename, uint32_t* outTileId, std::string* outError) {
  if (outTileId == nullptr) {
    return Fail("outTileId must not be null", outError);
  }
  if (filename.size() < kHashPrefixLength + 2) {
    return Fail("tile filename too short: \"" + filename + "\"", outError);
  }

  // A one-digit id carries a one-character suffix.
  const size_t encodedLength = filename.size() - kHashPrefixLength;
  const size_t digitCount = encodedLength == 2 ? 1 : encodedLength - kSuffixLength;
  if (digitCount == 0 || digitCount > 6) {
    return Fail("tile filename has unexpected length: \"" + filename + "\"", outError);
  }

  uint64_t id = 0;
  for (size_t i = 0; i < digitCount; ++i) {
    const int value = MaskValue(filename[kHashPrefixLength + i]);
    if (value < 0) {
      return Fail("tile filename has invalid character '" +
                  std::string(1, filename[kHashPrefixLength + i]) + "': \"" + filename + "\"",
                  outError);
    }
    id = id * 10 + static_cast<uint64_t>(value);
  }

  if (id >= kMaxTileId) {
    return Fail("tile id " + std::to_string(id) + " outside the world grid: \"" + filename + "\"",
                outError);
  }

  *outTileId = static_cast<uint32_t>(id);
  return true;
}

}  // namespace fogmap
