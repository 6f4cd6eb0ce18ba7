#pragma once

#include <stdexcept>
#include <string>

namespace sampledir::util {

/*
  Central error types.

  FormatError and IoError come from the codec and the rewriter. The lifecycle
  tracker raises InvalidState for illegal transitions. ConsistencyMismatch is
  raised when a directory does not match what the database expects.
*/

class FormatError : public std::runtime_error {
 public:
  explicit FormatError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IoError : public std::runtime_error {
 public:
  explicit IoError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class MismatchKind {
  kNone = 0,
  // Diagnostic: the directory plausibly belongs to another database.
  kDatabaseIdentity,
  // Authoritative: this is not the directory the database expects.
  kDirectoryIdentity,
  kOpenLifecycle,
};

inline const char* ToString(MismatchKind kind) {
  switch (kind) {
    case MismatchKind::kNone:
      return "none";
    case MismatchKind::kDatabaseIdentity:
      return "database_identity";
    case MismatchKind::kDirectoryIdentity:
      return "directory_identity";
    case MismatchKind::kOpenLifecycle:
      return "open_lifecycle";
  }
  return "unknown";
}

class ConsistencyMismatch : public std::runtime_error {
 public:
  ConsistencyMismatch(MismatchKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  MismatchKind Kind() const {
    return kind_;
  }

 private:
  MismatchKind kind_;
};

} // namespace sampledir::util
