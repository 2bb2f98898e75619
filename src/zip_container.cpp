#include "fogmap/io/zip_container.h"

#include "fogmap/core/deflate.h"

#include <limits>
#include <utility>

namespace fogmap {

namespace {

constexpr uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSignature = 0x06054b50;
constexpr size_t kLocalHeaderSize = 30;
constexpr size_t kCentralHeaderSize = 46;
constexpr size_t kEndOfCentralDirSize = 22;
constexpr size_t kMaxCommentSize = 0xFFFF;

constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflated = 8;
constexpr uint16_t kVersionNeeded = 20;
constexpr uint16_t kFlagEncrypted = 0x0001;
constexpr uint16_t kFlagUtf8 = 0x0800;
// 1980-01-01 00:00, the earliest DOS timestamp.
constexpr uint16_t kDosTime = 0;
constexpr uint16_t kDosDate = (1 << 5) | 1;

bool Fail(const std::string& message, std::string* outError) {
  if (outError != nullptr) {
    *outError = message;
  }
  return false;
}

void Put16(std::vector<uint8_t>* out, uint16_t value) {
  out->push_back(static_cast<uint8_t>(value & 0xFF));
  out->push_back(static_cast<uint8_t>(value >> 8));
}

void Put32(std::vector<uint8_t>* out, uint32_t value) {
  Put16(out, static_cast<uint16_t>(value & 0xFFFF));
  Put16(out, static_cast<uint16_t>(value >> 16));
}

uint16_t Get16(const std::vector<uint8_t>& data, size_t offset) {
  return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

uint32_t Get32(const std::vector<uint8_t>& data, size_t offset) {
  return static_cast<uint32_t>(Get16(data, offset)) |
         (static_cast<uint32_t>(Get16(data, offset + 2)) << 16);
}

}  // namespace

std::string ZipBasename(const std::string& name) {
  const size_t slash = name.find_last_of("/\\");
  if (slash == std::string::npos) {
    return name;
  }
  return name.substr(slash + 1);
}

bool ZipWriter::AddDirectory(const std::string& name, std::string* outError) {
  const std::string directory = (!name.empty() && name.back() == '/') ? name : name + "/";
  return AddEntry(directory, std::vector<uint8_t>(), outError);
}

bool ZipWriter::AddFile(const std::string& name, const std::vector<uint8_t>& data,
                        std::string* outError) {
  if (name.empty() || name.back() == '/') {
    return Fail("zip file entry needs a file name: \"" + name + "\"", outError);
  }
  return AddEntry(name, data, outError);
}

bool ZipWriter::AddEntry(const std::string& name, const std::vector<uint8_t>& data,
                         std::string* outError) {
  if (name.size() > 0xFFFF) {
    return Fail("zip entry name too long", outError);
  }
  if (entries_.size() >= 0xFFFF) {
    return Fail("too many zip entries", outError);
  }
  if (data.size() >= std::numeric_limits<uint32_t>::max() ||
      buffer_.size() >= std::numeric_limits<uint32_t>::max()) {
    return Fail("zip archive exceeds 4 GiB", outError);
  }

  ZipEntry entry;
  entry.name = name;
  entry.flags = kFlagUtf8;
  entry.crc32 = Crc32(data.data(), data.size());
  entry.uncompressedSize = static_cast<uint32_t>(data.size());
  entry.localHeaderOffset = static_cast<uint32_t>(buffer_.size());

  std::vector<uint8_t> compressed;
  if (!data.empty()) {
    if (!DeflateBytes(data.data(), data.size(), DeflateFormat::Raw, &compressed, outError)) {
      return false;
    }
  }
  const bool store = data.empty() || compressed.size() >= data.size();
  const std::vector<uint8_t>& payload = store ? data : compressed;
  entry.method = store ? kMethodStored : kMethodDeflated;
  entry.compressedSize = static_cast<uint32_t>(payload.size());

  Put32(&buffer_, kLocalHeaderSignature);
  Put16(&buffer_, kVersionNeeded);
  Put16(&buffer_, entry.flags);
  Put16(&buffer_, entry.method);
  Put16(&buffer_, kDosTime);
  Put16(&buffer_, kDosDate);
  Put32(&buffer_, entry.crc32);
  Put32(&buffer_, entry.compressedSize);
  Put32(&buffer_, entry.uncompressedSize);
  Put16(&buffer_, static_cast<uint16_t>(name.size()));
  Put16(&buffer_, 0);
  buffer_.insert(buffer_.end(), name.begin(), name.end());
  buffer_.insert(buffer_.end(), payload.begin(), payload.end());

  entries_.push_back(std::move(entry));
  return true;
}

bool ZipWriter::Finish(std::vector<uint8_t>* outArchive, std::string* outError) {
  if (outArchive == nullptr) {
    return Fail("outArchive must not be null", outError);
  }
  if (buffer_.size() >= std::numeric_limits<uint32_t>::max()) {
    return Fail("zip archive exceeds 4 GiB", outError);
  }

  const uint32_t centralOffset = static_cast<uint32_t>(buffer_.size());
  for (const ZipEntry& entry : entries_) {
    Put32(&buffer_, kCentralHeaderSignature);
    Put16(&buffer_, kVersionNeeded);
    Put16(&buffer_, kVersionNeeded);
    Put16(&buffer_, entry.flags);
    Put16(&buffer_, entry.method);
    Put16(&buffer_, kDosTime);
    Put16(&buffer_, kDosDate);
    Put32(&buffer_, entry.crc32);
    Put32(&buffer_, entry.compressedSize);
    Put32(&buffer_, entry.uncompressedSize);
    Put16(&buffer_, static_cast<uint16_t>(entry.name.size()));
    Put16(&buffer_, 0);  // extra
    Put16(&buffer_, 0);  // comment
    Put16(&buffer_, 0);  // disk
    Put16(&buffer_, 0);  // internal attributes
    Put32(&buffer_, entry.IsDirectory() ? 0x10 : 0);
    Put32(&buffer_, entry.localHeaderOffset);
    buffer_.insert(buffer_.end(), entry.name.begin(), entry.name.end());
  }
  const uint32_t centralSize = static_cast<uint32_t>(buffer_.size() - centralOffset);

  Put32(&buffer_, kEndOfCentralDirSignature);
  Put16(&buffer_, 0);
  Put16(&buffer_, 0);
  Put16(&buffer_, static_cast<uint16_t>(entries_.size()));
  Put16(&buffer_, static_cast<uint16_t>(entries_.size()));
  Put32(&buffer_, centralSize);
  Put32(&buffer_, centralOffset);
  Put16(&buffer_, 0);

  *outArchive = std::move(buffer_);
  buffer_.clear();
  entries_.clear();
  return true;
}

bool ZipReader::Open(std::vector<uint8_t> archive, std::string* outError) {
  data_ = std::move(archive);
  entries_.clear();

  if (data_.size() < kEndOfCentralDirSize) {
    return Fail("not a zip archive: too short", outError);
  }

  // The end record sits at the tail, possibly followed by a comment.
  size_t eocd = std::string::npos;
  const size_t last = data_.size() - kEndOfCentralDirSize;
  const size_t first = last > kMaxCommentSize ? last - kMaxCommentSize : 0;
  for (size_t pos = last + 1; pos-- > first;) {
    if (Get32(data_, pos) == kEndOfCentralDirSignature) {
      eocd = pos;
      break;
    }
  }
  if (eocd == std::string::npos) {
    return Fail("not a zip archive: end of central directory not found", outError);
  }

  const uint16_t entryCount = Get16(data_, eocd + 10);
  const uint32_t centralSize = Get32(data_, eocd + 12);
  const uint32_t centralOffset = Get32(data_, eocd + 16);
  if (centralOffset == 0xFFFFFFFFu || entryCount == 0xFFFF) {
    return Fail("zip64 archives are not supported", outError);
  }
  if (static_cast<uint64_t>(centralOffset) + centralSize > eocd) {
    return Fail("corrupt zip archive: central directory out of bounds", outError);
  }

  size_t pos = centralOffset;
  entries_.reserve(entryCount);
  for (uint16_t i = 0; i < entryCount; ++i) {
    if (pos + kCentralHeaderSize > eocd || Get32(data_, pos) != kCentralHeaderSignature) {
      return Fail("corrupt zip archive: bad central directory entry " + std::to_string(i),
                  outError);
    }
    ZipEntry entry;
    entry.flags = Get16(data_, pos + 8);
    entry.method = Get16(data_, pos + 10);
    entry.crc32 = Get32(data_, pos + 16);
    entry.compressedSize = Get32(data_, pos + 20);
    entry.uncompressedSize = Get32(data_, pos + 24);
    const uint16_t nameLength = Get16(data_, pos + 28);
    const uint16_t extraLength = Get16(data_, pos + 30);
    const uint16_t commentLength = Get16(data_, pos + 32);
    entry.localHeaderOffset = Get32(data_, pos + 42);

    const size_t next = pos + kCentralHeaderSize + nameLength + extraLength + commentLength;
    if (next > eocd) {
      return Fail("corrupt zip archive: central directory entry overruns", outError);
    }
    entry.name.assign(reinterpret_cast<const char*>(data_.data() + pos + kCentralHeaderSize),
                      nameLength);
    entries_.push_back(std::move(entry));
    pos = next;
  }
  return true;
}

bool ZipReader::Extract(const ZipEntry& entry, std::vector<uint8_t>* outData,
                        std::string* outError) const {
  if (outData == nullptr) {
    return Fail("outData must not be null", outError);
  }
  if ((entry.flags & kFlagEncrypted) != 0) {
    return Fail(entry.name + ": encrypted entries are not supported", outError);
  }

  const size_t header = entry.localHeaderOffset;
  if (header + kLocalHeaderSize > data_.size() || Get32(data_, header) != kLocalHeaderSignature) {
    return Fail(entry.name + ": bad local header", outError);
  }
  const size_t payload = header + kLocalHeaderSize + Get16(data_, header + 26) +
                         Get16(data_, header + 28);
  if (payload + entry.compressedSize > data_.size()) {
    return Fail(entry.name + ": entry data out of bounds", outError);
  }

  const uint8_t* begin = data_.data() + payload;
  if (entry.method == kMethodStored) {
    outData->assign(begin, begin + entry.compressedSize);
  } else if (entry.method == kMethodDeflated) {
    if (entry.uncompressedSize / kMaxDeflateRatio > entry.compressedSize) {
      return Fail(entry.name + ": declared size " + std::to_string(entry.uncompressedSize) +
                      " exceeds what " + std::to_string(entry.compressedSize) +
                      " compressed bytes can hold",
                  outError);
    }
    std::string inflateError;
    if (!InflateBytes(begin, entry.compressedSize, DeflateFormat::Raw, entry.uncompressedSize,
                      outData, &inflateError)) {
      return Fail(entry.name + ": " + inflateError, outError);
    }
  } else {
    return Fail(entry.name + ": unsupported compression method " + std::to_string(entry.method),
                outError);
  }

  if (outData->size() != entry.uncompressedSize) {
    return Fail(entry.name + ": size mismatch", outError);
  }
  if (Crc32(outData->data(), outData->size()) != entry.crc32) {
    return Fail(entry.name + ": crc mismatch", outError);
  }
  return true;
}

}  // namespace fogmap
