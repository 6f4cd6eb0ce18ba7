#pragma once

#include <cstdint>

#include "sampledir/v1.hpp"

namespace sampledir::meta {

enum class OpenState : std::uint8_t {
  kEmpty    = 0,
  kOpening  = 1,
  kStable   = 2,
  kDeleting = 3,
};

constexpr const char* ToString(OpenState state) {
  switch (state) {
    case OpenState::kEmpty:
      return "empty";
    case OpenState::kOpening:
      return "opening";
    case OpenState::kStable:
      return "stable";
    case OpenState::kDeleting:
      return "deleting";
  }
  return "unknown";
}

/*
  Legal transitions:

    Empty    -> Opening
    Stable   -> Opening
    Opening  -> Opening   (replaces an open abandoned before completion)
    Opening  -> Stable
    Stable   -> Deleting
    Deleting -> Empty

  Deleting is the only state that moves open history backward.
*/
constexpr bool CanTransition(OpenState from, OpenState to) {
  switch (to) {
    case OpenState::kOpening:
      return from == OpenState::kEmpty || from == OpenState::kStable || from == OpenState::kOpening;
    case OpenState::kStable:
      return from == OpenState::kOpening;
    case OpenState::kDeleting:
      return from == OpenState::kStable;
    case OpenState::kEmpty:
      return from == OpenState::kDeleting;
  }
  return false;
}

inline bool SameOpen(const sampledir::v1::DirMeta::Open& a, const sampledir::v1::DirMeta::Open& b) {
  return a.id() == b.id() && a.uuid() == b.uuid();
}

/*
  State implied by a persisted record. Deleting cannot be told apart from
  Opening on disk, so a record saved mid-deletion reloads as Opening;
  OpenTracker::BeginDelete picks it back up from there.
*/
inline OpenState DeriveState(const sampledir::v1::DirMeta& meta) {
  const bool has_complete    = meta.has_last_complete_open();
  const bool has_in_progress = meta.has_in_progress_open();

  if (!has_complete && !has_in_progress) {
    return OpenState::kEmpty;
  }
  if (has_complete && (!has_in_progress || SameOpen(meta.last_complete_open(), meta.in_progress_open()))) {
    return OpenState::kStable;
  }
  return OpenState::kOpening;
}

} // namespace sampledir::meta
