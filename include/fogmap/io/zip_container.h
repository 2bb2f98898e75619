#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fogmap {

// Minimal PKZIP container: stored and deflated entries, no ZIP64, no
// encryption. Enough for Sync/ archives and compressed track files.

struct ZipEntry {
  std::string name;  // full path inside the archive, '/' separated
  uint16_t method = 0;
  uint16_t flags = 0;
  uint32_t crc32 = 0;
  uint32_t compressedSize = 0;
  uint32_t uncompressedSize = 0;
  uint32_t localHeaderOffset = 0;

  bool IsDirectory() const { return !name.empty() && name.back() == '/'; }
};

class ZipWriter {
 public:
  bool AddDirectory(const std::string& name, std::string* outError);
  bool AddFile(const std::string& name, const std::vector<uint8_t>& data, std::string* outError);

  // Appends the central directory and moves the archive out. The writer is
  // empty again afterwards.
  bool Finish(std::vector<uint8_t>* outArchive, std::string* outError);

  size_t EntryCount() const { return entries_.size(); }

 private:
  bool AddEntry(const std::string& name, const std::vector<uint8_t>& data, std::string* outError);

  std::vector<uint8_t> buffer_;
  std::vector<ZipEntry> entries_;
};

class ZipReader {
 public:
  bool Open(std::vector<uint8_t> archive, std::string* outError);

  const std::vector<ZipEntry>& Entries() const { return entries_; }
  bool Extract(const ZipEntry& entry, std::vector<uint8_t>* outData, std::string* outError) const;

 private:
  std::vector<uint8_t> data_;
  std::vector<ZipEntry> entries_;
};

// Last path component; handles both '/' and '\\' separators.
std::string ZipBasename(const std::string& name);

}  // namespace fogmap
