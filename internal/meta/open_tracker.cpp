#include "open_tracker.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sampledir::meta {

using sampledir::observability::IntField;
using sampledir::observability::StringField;
using sampledir::observability::UuidField;
using sampledir::util::InvalidState;
using sampledir::v1::DirMeta;

OpenTracker::OpenTracker(std::shared_ptr<storage::MetaStore> store, DirMeta persisted)
    : store_(std::move(store)), meta_(std::move(persisted)), state_(DeriveState(meta_)) {
  if (!store_) {
    throw std::invalid_argument("open tracker requires a meta store");
  }
}

OpenState OpenTracker::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

DirMeta OpenTracker::Snapshot() const {
  std::lock_guard lock(mutex_);
  return meta_;
}

void OpenTracker::RequireTransition(OpenState next, const char* operation) const {
  if (!CanTransition(state_, next)) {
    throw InvalidState(std::string(operation) + ": illegal transition " + ToString(state_) + " -> " + ToString(next));
  }
}

void OpenTracker::Commit(OpenState next, DirMeta updated) {
  const auto previous = state_;
  try {
    store_->Store(updated);
  } catch (const std::exception& e) {
    SAMPLEDIR_LOG_ERROR("meta transition not persisted", {StringField("from", ToString(previous)), StringField("to", ToString(next)),
                                                          UuidField("dir_uuid", meta_.dir_uuid()),
                                                          StringField("error", e.what())});
    throw;
  }

  meta_  = std::move(updated);
  state_ = next;
  SAMPLEDIR_LOG_INFO("meta transition committed", {StringField("from", ToString(previous)), StringField("to", ToString(next)),
                                                   UuidField("dir_uuid", meta_.dir_uuid())});
}

void OpenTracker::BeginOpen(const DirMeta::Open& open) {
  std::lock_guard lock(mutex_);
  RequireTransition(OpenState::kOpening, "begin open");

  if (open.uuid().size() != 16) {
    throw std::invalid_argument("open uuid must be 16 bytes, got " + std::to_string(open.uuid().size()));
  }

  // Open ids come from the database and only grow.
  if (meta_.has_last_complete_open() && open.id() <= meta_.last_complete_open().id()) {
    throw InvalidState("begin open: open " + std::to_string(open.id()) + " is not newer than last complete open " +
                       std::to_string(meta_.last_complete_open().id()));
  }
  if (meta_.has_in_progress_open() && open.id() <= meta_.in_progress_open().id()) {
    throw InvalidState("begin open: open " + std::to_string(open.id()) + " is not newer than in-progress open " +
                       std::to_string(meta_.in_progress_open().id()));
  }

  if (state_ == OpenState::kOpening) {
    SAMPLEDIR_LOG_WARN("replacing abandoned in-progress open", {IntField("abandoned_open_id", meta_.in_progress_open().id()),
                                                               IntField("open_id", open.id())});
  }

  DirMeta updated = meta_;
  *updated.mutable_in_progress_open() = open;
  Commit(OpenState::kOpening, std::move(updated));
}

void OpenTracker::CompleteOpen() {
  std::lock_guard lock(mutex_);
  RequireTransition(OpenState::kStable, "complete open");

  DirMeta updated = meta_;
  *updated.mutable_last_complete_open() = meta_.in_progress_open();
  Commit(OpenState::kStable, std::move(updated));
}

void OpenTracker::BeginDelete() {
  std::lock_guard lock(mutex_);

  // A record stored between BeginDelete and FinishDelete reloads as Opening with
  // nothing complete. It already has the Deleting shape; adopt it as is.
  if (state_ == OpenState::kOpening && !meta_.has_last_complete_open()) {
    SAMPLEDIR_LOG_WARN("resuming interrupted delete", {IntField("in_progress_open_id", meta_.in_progress_open().id()),
                                                      UuidField("dir_uuid", meta_.dir_uuid())});
    state_ = OpenState::kDeleting;
    return;
  }
  RequireTransition(OpenState::kDeleting, "begin delete");

  // The one backward step: the completed open becomes "in progress" again and
  // nothing is recorded as complete.
  DirMeta updated = meta_;
  *updated.mutable_in_progress_open() = meta_.last_complete_open();
  updated.clear_last_complete_open();
  Commit(OpenState::kDeleting, std::move(updated));
}

void OpenTracker::FinishDelete() {
  std::lock_guard lock(mutex_);
  RequireTransition(OpenState::kEmpty, "finish delete");

  DirMeta updated = meta_;
  updated.clear_last_complete_open();
  updated.clear_in_progress_open();
  Commit(OpenState::kEmpty, std::move(updated));
}

} // namespace sampledir::meta
