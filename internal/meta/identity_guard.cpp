#include "identity_guard.hpp"

#include "internal/meta/open_state.hpp"
#include "internal/util/uuid.hpp"

namespace sampledir::meta {

using sampledir::util::FormatBytes;
using sampledir::util::MismatchKind;
using sampledir::v1::DirMeta;

namespace {

std::string DescribeOpen(const DirMeta::Open& open) {
  return std::to_string(open.id()) + "/" + FormatBytes(open.uuid());
}

} // namespace

ConsistencyResult Check(const DirMeta& record, const std::string& expected_db_uuid, const std::string& expected_dir_uuid) {
  if (record.dir_uuid() != expected_dir_uuid) {
    return ConsistencyResult::Mismatch(MismatchKind::kDirectoryIdentity,
                                       "directory uuid mismatch: dir has " + FormatBytes(record.dir_uuid()) + ", db expects " +
                                           FormatBytes(expected_dir_uuid));
  }
  if (!record.db_uuid().empty() && record.db_uuid() != expected_db_uuid) {
    return ConsistencyResult::Mismatch(MismatchKind::kDatabaseIdentity,
                                       "database uuid mismatch: dir belongs to " + FormatBytes(record.db_uuid()) +
                                           ", db is " + FormatBytes(expected_db_uuid));
  }
  return ConsistencyResult::Consistent();
}

ConsistencyResult CheckOpens(const DirMeta& record, const DirMeta& expected) {
  if (expected.has_last_complete_open()) {
    const auto& db_open = expected.last_complete_open();
    const bool  matches_complete =
        record.has_last_complete_open() && SameOpen(record.last_complete_open(), db_open);
    const bool matches_in_progress = record.has_in_progress_open() && SameOpen(record.in_progress_open(), db_open);
    if (!matches_complete && !matches_in_progress) {
      return ConsistencyResult::Mismatch(MismatchKind::kOpenLifecycle,
                                         "db last complete open " + DescribeOpen(db_open) +
                                             " matches neither the dir's last complete nor in-progress open");
    }
    return ConsistencyResult::Consistent();
  }

  if (record.has_last_complete_open()) {
    return ConsistencyResult::Mismatch(MismatchKind::kOpenLifecycle,
                                       "dir claims completed open " + DescribeOpen(record.last_complete_open()) +
                                           " but db has none");
  }
  return ConsistencyResult::Consistent();
}

ConsistencyResult CheckAll(const DirMeta& record, const DirMeta& expected) {
  auto identity = Check(record, expected.db_uuid(), expected.dir_uuid());
  if (!identity) {
    return identity;
  }
  return CheckOpens(record, expected);
}

} // namespace sampledir::meta
