#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fogmap {

bool ReadFileBytes(const std::string& path, std::vector<uint8_t>* outBytes, std::string* outError);
bool WriteFileBytes(const std::string& path, const std::vector<uint8_t>& bytes,
                    std::string* outError);

}  // namespace fogmap
