#pragma once

#include <filesystem>

#include "internal/storage/atomic_rewriter.hpp"
#include "internal/storage/meta_store.hpp"

namespace sampledir::storage {

class FileMetaStore final : public MetaStore {
 public:
  explicit FileMetaStore(std::filesystem::path path, RewriteFaults faults = {});

  // A zero-length file is what a crash right after creating the sidecar
  // leaves behind; it loads as absent.
  std::optional<sampledir::v1::DirMeta> Load() override;

  void Store(const sampledir::v1::DirMeta& meta) override;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
  RewriteFaults         faults_;
};

} // namespace sampledir::storage
