#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "internal/meta/open_state.hpp"
#include "internal/storage/meta_store.hpp"
#include "sampledir/v1.hpp"

namespace sampledir::meta {

/*
  OpenTracker

  Owns a directory's last_complete_open / in_progress_open pair.

  Every transition builds the next record, persists it through the MetaStore,
  and only then replaces the in-memory copy. If persisting throws, the tracker
  still reflects the last record that was stored successfully.

  Transitions on one tracker are serialized; concurrent callers queue.
  Holding the directory exclusively across processes is the caller's job.
*/
class OpenTracker {
 public:
  // `persisted` must be the record currently held by `store`.
  OpenTracker(std::shared_ptr<storage::MetaStore> store, sampledir::v1::DirMeta persisted);

  OpenState State() const;

  sampledir::v1::DirMeta Snapshot() const;

  // Empty|Stable|Opening -> Opening. `open.id` must be newer than any open on record.
  void BeginOpen(const sampledir::v1::DirMeta::Open& open);

  // Opening -> Stable. last_complete_open := in_progress_open.
  void CompleteOpen();

  // Stable -> Deleting. Only once every sample file of the directory is gone.
  // Also accepts Opening with no completed open, the shape a crash between
  // BeginDelete and FinishDelete leaves on disk; that adopts the record without
  // rewriting it.
  void BeginDelete();

  // Deleting -> Empty. Identity fields are kept.
  void FinishDelete();

 private:
  void Commit(OpenState next, sampledir::v1::DirMeta updated);
  void RequireTransition(OpenState next, const char* operation) const;

  mutable std::mutex mutex_;

  std::shared_ptr<storage::MetaStore> store_;
  sampledir::v1::DirMeta              meta_;
  OpenState                           state_;
};

} // namespace sampledir::meta
