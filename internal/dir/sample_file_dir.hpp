#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "internal/meta/open_tracker.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/meta_store.hpp"
#include "sampledir/v1.hpp"

namespace sampledir::dir {

/*
  A directory of recorded sample files plus its "meta" sidecar.

  Open() verifies the sidecar against the database's view before handing out a
  tracker, so no lifecycle transition can run against a misidentified
  directory.
*/
class SampleFileDir {
 public:
  // Creates `path` if needed and stores a record carrying only db_uuid/dir_uuid
  // from `identity`. Throws util::InvalidState if the directory already holds
  // anything but the sidecar or the sidecar records an open, and
  // util::ConsistencyMismatch if an existing sidecar names a different
  // directory. An unreadable sidecar is overwritten.
  static SampleFileDir Create(const std::filesystem::path& path, const sampledir::v1::DirMeta& identity,
                              const std::string& meta_file_name = storage::common::kDefaultMetaFileName);

  // `expected` is the database's DirMeta for this directory. A missing sidecar
  // reads as an empty record. Throws util::ConsistencyMismatch or util::FormatError.
  static SampleFileDir Open(const std::filesystem::path& path, const sampledir::v1::DirMeta& expected,
                            const std::string& meta_file_name = storage::common::kDefaultMetaFileName);

  // Loads the sidecar without any consistency check. For inspection only.
  static std::optional<sampledir::v1::DirMeta> ReadMeta(const std::filesystem::path& path,
                                                        const std::string& meta_file_name = storage::common::kDefaultMetaFileName);

  const std::filesystem::path& Path() const {
    return path_;
  }

  meta::OpenTracker& Tracker() {
    return *tracker_;
  }

  const meta::OpenTracker& Tracker() const {
    return *tracker_;
  }

  // True if anything other than the sidecar is present.
  bool HasSampleFiles() const;

  void BeginOpen(const sampledir::v1::DirMeta::Open& open);
  void CompleteOpen();

  // Refuses while sample files remain, then runs Stable -> Deleting -> Empty.
  void Delete();

 private:
  SampleFileDir(std::filesystem::path path, std::string meta_file_name, std::unique_ptr<meta::OpenTracker> tracker);

  static bool HasEntriesOtherThan(const std::filesystem::path& path, const std::string& meta_file_name);

  std::filesystem::path              path_;
  std::string                        meta_file_name_;
  std::unique_ptr<meta::OpenTracker> tracker_;
};

} // namespace sampledir::dir
