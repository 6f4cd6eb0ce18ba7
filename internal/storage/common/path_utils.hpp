#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace sampledir::storage::common {

inline constexpr const char* kDefaultMetaFileName = "meta";

inline void ValidateMetaFileName(const std::string& name) {
  if (name.empty()) {
    throw std::invalid_argument("meta file name must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("meta file name contains invalid character");
    }
  }
  if (name == "." || name == "..") {
    throw std::invalid_argument("meta file name must not be a relative path component");
  }
}

inline std::filesystem::path MetaPath(const std::filesystem::path& dir, const std::string& meta_file_name) {
  ValidateMetaFileName(meta_file_name);
  return dir / meta_file_name;
}

} // namespace sampledir::storage::common
