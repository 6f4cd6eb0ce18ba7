#pragma once

#include <string>

#include "internal/util/errors.hpp"
#include "sampledir/v1.hpp"

namespace sampledir::meta {

/*
  Result of comparing a directory's record with the database's view.
  Mismatches are reported, never repaired here.
*/
struct ConsistencyResult {
  util::MismatchKind kind = util::MismatchKind::kNone;
  std::string        message;

  static ConsistencyResult Consistent() {
    return {};
  }

  static ConsistencyResult Mismatch(util::MismatchKind k, std::string msg) {
    return {k, std::move(msg)};
  }

  explicit operator bool() const {
    return kind == util::MismatchKind::kNone;
  }
};

// Identity only. A differing dir uuid outranks a differing db uuid; an empty
// db uuid in the record is not compared.
ConsistencyResult Check(const sampledir::v1::DirMeta& record, const std::string& expected_db_uuid,
                        const std::string& expected_dir_uuid);

// Open history. The database's last completed open must be the record's last
// completed open or its in-progress open (a completion the sidecar had not yet
// caught up with). With no completed open in the database, the record must not
// claim one.
ConsistencyResult CheckOpens(const sampledir::v1::DirMeta& record, const sampledir::v1::DirMeta& expected);

// Check() then CheckOpens(), first mismatch wins.
ConsistencyResult CheckAll(const sampledir::v1::DirMeta& record, const sampledir::v1::DirMeta& expected);

} // namespace sampledir::meta
