#include "fogmap/io/file_io.h"

#include <fstream>
#include <iterator>

namespace fogmap {

bool ReadFileBytes(const std::string& path, std::vector<uint8_t>* outBytes, std::string* outError) {
  if (outBytes == nullptr) {
    if (outError != nullptr) {
      *outError = "outBytes must not be null";
    }
    return false;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    if (outError != nullptr) {
      *outError = "Failed to open file for reading: " + path;
    }
    return false;
  }

  outBytes->assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    if (outError != nullptr) {
      *outError = "Failed to read file: " + path;
    }
    return false;
  }
  return true;
}

bool WriteFileBytes(const std::string& path, const std::vector<uint8_t>& bytes,
                    std::string* outError) {
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) {
    if (outError != nullptr) {
      *outError = "Failed to open file for writing: " + path;
    }
    return false;
  }

  file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!file.good()) {
    if (outError != nullptr) {
      *outError = "Failed to write file: " + path;
    }
    return false;
  }
  return true;
}

}  // namespace fogmap
