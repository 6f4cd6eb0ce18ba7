#include "file_meta_store.hpp"

#include "internal/meta/meta_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sampledir::storage {

using sampledir::meta::kMetaBlockSize;

FileMetaStore::FileMetaStore(std::filesystem::path path, RewriteFaults faults)
    : path_(std::move(path)), faults_(std::move(faults)) {
}

std::optional<sampledir::v1::DirMeta> FileMetaStore::Load() {
  // One byte past the limit so oversized files are reported, not silently cut.
  auto block = ReadFileHead(path_, kMetaBlockSize + 1);
  if (!block.has_value()) {
    return std::nullopt;
  }
  if (block->empty()) {
    SAMPLEDIR_LOG_WARN("empty meta file treated as absent", {observability::PathField("path", path_)});
    return std::nullopt;
  }

  try {
    return sampledir::meta::Decode(*block);
  } catch (const sampledir::util::FormatError& e) {
    SAMPLEDIR_LOG_WARN("corrupt meta file", {observability::PathField("path", path_),
                                             observability::StringField("error", e.what())});
    throw sampledir::util::FormatError(path_.string() + ": " + e.what());
  }
}

void FileMetaStore::Store(const sampledir::v1::DirMeta& meta) {
  const auto block = sampledir::meta::Encode(meta);
  RewriteInPlace(path_, block, faults_);
}

} // namespace sampledir::storage
