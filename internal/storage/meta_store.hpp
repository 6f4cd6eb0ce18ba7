#pragma once

#include <memory>
#include <optional>

#include "sampledir/v1.hpp"

namespace sampledir::storage {

/*
  Persistence seam for a directory's DirMeta record.

  Implementations:
    FILE    → fixed 512-byte sidecar rewritten in place
    (tests) → in-memory and fault-injecting stores
*/

class MetaStore {
 public:
  virtual ~MetaStore() = default;

  // ------------------------------------------------------------------
  // Load
  // ------------------------------------------------------------------
  /*
    Returns nullopt when no record has ever been stored.
    A record that exists but cannot be decoded raises util::FormatError.
  */
  virtual std::optional<sampledir::v1::DirMeta> Load() = 0;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  /*
    Durably replaces the record. Returns only after the new record is synced.
    On failure (util::FormatError, util::IoError) the caller must assume
    the persisted record is either the old one or the new one.
  */
  virtual void Store(const sampledir::v1::DirMeta& meta) = 0;
};

using MetaStorePtr = std::shared_ptr<MetaStore>;

} // namespace sampledir::storage
