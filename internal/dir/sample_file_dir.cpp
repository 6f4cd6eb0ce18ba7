#include "sample_file_dir.hpp"

#include <system_error>

#include "internal/meta/identity_guard.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/file_meta_store.hpp"
#include "internal/util/errors.hpp"

namespace sampledir::dir {

using sampledir::observability::PathField;
using sampledir::observability::StringField;
using sampledir::observability::UuidField;
using sampledir::util::ConsistencyMismatch;
using sampledir::util::FormatError;
using sampledir::util::InvalidState;
using sampledir::util::IoError;
using sampledir::v1::DirMeta;

namespace {

void RequireUuid(const std::string& bytes, const char* field) {
  if (bytes.size() != 16) {
    throw std::invalid_argument(std::string(field) + " must be 16 bytes, got " + std::to_string(bytes.size()));
  }
}

} // namespace

SampleFileDir::SampleFileDir(std::filesystem::path path, std::string meta_file_name,
                             std::unique_ptr<meta::OpenTracker> tracker)
    : path_(std::move(path)), meta_file_name_(std::move(meta_file_name)), tracker_(std::move(tracker)) {
}

bool SampleFileDir::HasEntriesOtherThan(const std::filesystem::path& path, const std::string& meta_file_name) {
  std::error_code ec;
  for (std::filesystem::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->path().filename() != meta_file_name) {
      return true;
    }
  }
  if (ec) {
    throw IoError("list " + path.string() + ": " + ec.message());
  }
  return false;
}

SampleFileDir SampleFileDir::Create(const std::filesystem::path& path, const DirMeta& identity,
                                    const std::string& meta_file_name) {
  RequireUuid(identity.db_uuid(), "db uuid");
  RequireUuid(identity.dir_uuid(), "dir uuid");

  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    throw IoError("create " + path.string() + ": " + ec.message());
  }

  if (HasEntriesOtherThan(path, meta_file_name)) {
    throw InvalidState("can't create sample file dir at " + path.string() + ": directory is not empty");
  }

  auto store = std::make_shared<storage::FileMetaStore>(storage::common::MetaPath(path, meta_file_name));
  std::optional<DirMeta> existing;
  try {
    existing = store->Load();
  } catch (const FormatError& e) {
    // The directory holds no sample files here; an unreadable sidecar is replaced.
    SAMPLEDIR_LOG_WARN("overwriting unreadable meta file", {PathField("path", store->Path()),
                                                           StringField("error", e.what())});
  }
  if (existing.has_value()) {
    auto result = meta::Check(*existing, identity.db_uuid(), identity.dir_uuid());
    if (!result) {
      throw ConsistencyMismatch(result.kind, path.string() + ": " + result.message);
    }
    if (existing->has_last_complete_open() || existing->has_in_progress_open()) {
      throw InvalidState("can't create sample file dir at " + path.string() + ": meta file records open " +
                         std::to_string(existing->has_in_progress_open() ? existing->in_progress_open().id()
                                                                         : existing->last_complete_open().id()));
    }
  }

  DirMeta fresh;
  fresh.set_db_uuid(identity.db_uuid());
  fresh.set_dir_uuid(identity.dir_uuid());
  store->Store(fresh);

  SAMPLEDIR_LOG_INFO("created sample file dir", {PathField("path", path),
                                                 UuidField("dir_uuid", fresh.dir_uuid())});
  return SampleFileDir(path, meta_file_name, std::make_unique<meta::OpenTracker>(std::move(store), std::move(fresh)));
}

SampleFileDir SampleFileDir::Open(const std::filesystem::path& path, const DirMeta& expected,
                                  const std::string& meta_file_name) {
  auto store  = std::make_shared<storage::FileMetaStore>(storage::common::MetaPath(path, meta_file_name));
  auto record = store->Load().value_or(DirMeta{});

  auto result = meta::CheckAll(record, expected);
  if (!result) {
    SAMPLEDIR_LOG_ERROR("sample file dir metadata mismatch", {PathField("path", path),
                                                              StringField("kind", util::ToString(result.kind)),
                                                              StringField("detail", result.message)});
    throw ConsistencyMismatch(result.kind, path.string() + ": " + result.message);
  }

  auto tracker = std::make_unique<meta::OpenTracker>(std::move(store), std::move(record));
  SAMPLEDIR_LOG_INFO("opened sample file dir", {PathField("path", path),
                                                StringField("state", meta::ToString(tracker->State()))});
  return SampleFileDir(path, meta_file_name, std::move(tracker));
}

std::optional<DirMeta> SampleFileDir::ReadMeta(const std::filesystem::path& path, const std::string& meta_file_name) {
  storage::FileMetaStore store(storage::common::MetaPath(path, meta_file_name));
  return store.Load();
}

bool SampleFileDir::HasSampleFiles() const {
  return HasEntriesOtherThan(path_, meta_file_name_);
}

void SampleFileDir::BeginOpen(const DirMeta::Open& open) {
  tracker_->BeginOpen(open);
}

void SampleFileDir::CompleteOpen() {
  tracker_->CompleteOpen();
}

void SampleFileDir::Delete() {
  if (HasSampleFiles()) {
    throw InvalidState("can't delete sample file dir at " + path_.string() + ": sample files remain");
  }
  tracker_->BeginDelete();
  tracker_->FinishDelete();
  SAMPLEDIR_LOG_INFO("deleted sample file dir history", {PathField("path", path_)});
}

} // namespace sampledir::dir
