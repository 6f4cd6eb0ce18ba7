#include "atomic_rewriter.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sampledir::storage {

using sampledir::util::IoError;

namespace {

class ScopedFd {
 public:
  explicit ScopedFd(int fd) : fd_(fd) {
  }
  ~ScopedFd() {
    if (fd_ >= 0) ::close(fd_);
  }
  ScopedFd(const ScopedFd&)            = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const {
    return fd_;
  }

 private:
  int fd_;
};

[[noreturn]] void ThrowSys(const std::string& what, const std::filesystem::path& path) {
  throw IoError(what + " " + path.string() + ": " + std::strerror(errno));
}

void Notify(const RewriteHook& hook, RewriteStep step) {
  if (hook) hook(step);
}

void WriteFullAt(int fd, std::string_view block, const std::optional<std::size_t>& tear_after,
                 const std::filesystem::path& path) {
  const std::size_t len  = tear_after.has_value() ? std::min(*tear_after, block.size()) : block.size();
  const char*       data = block.data();
  std::size_t       done = 0;
  while (done < len) {
    ssize_t w = ::pwrite(fd, data + done, len - done, static_cast<off_t>(done));
    if (w < 0) {
      if (errno == EINTR) continue;
      ThrowSys("write", path);
    }
    if (w == 0) {
      errno = EIO;
      ThrowSys("write", path);
    }
    done += static_cast<std::size_t>(w);
    if (done < len) {
      SAMPLEDIR_LOG_WARN("short write to meta file", {observability::PathField("path", path),
                                                      observability::IntField("written", static_cast<int64_t>(done))});
    }
  }
  if (len < block.size()) {
    throw IoError("write " + path.string() + ": torn after " + std::to_string(len) + " of " +
                  std::to_string(block.size()) + " bytes");
  }
}

void SyncParentDir(const std::filesystem::path& path) {
  auto dir = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
  ScopedFd dfd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (dfd.get() < 0) ThrowSys("open directory", dir);
  if (::fsync(dfd.get()) != 0) ThrowSys("fsync directory", dir);
}

} // namespace

void RewriteInPlace(const std::filesystem::path& path, std::string_view block, const RewriteFaults& faults) {
  // Never O_TRUNC: truncating first would open a window where the file is empty.
  bool created = false;
  int  raw_fd  = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (raw_fd < 0 && errno == ENOENT) {
    raw_fd  = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    created = raw_fd >= 0;
  }
  ScopedFd fd(raw_fd);
  if (fd.get() < 0) ThrowSys("open", path);
  Notify(faults.hook, RewriteStep::kOpened);

  WriteFullAt(fd.get(), block, faults.tear_after_bytes, path);

  struct stat st {};
  if (::fstat(fd.get(), &st) != 0) ThrowSys("stat", path);
  if (static_cast<std::size_t>(st.st_size) > block.size()) {
    if (::ftruncate(fd.get(), static_cast<off_t>(block.size())) != 0) ThrowSys("truncate", path);
  }
  Notify(faults.hook, RewriteStep::kWritten);

  if (::fsync(fd.get()) != 0) ThrowSys("fsync", path);
  if (created) SyncParentDir(path);
  Notify(faults.hook, RewriteStep::kSynced);
}

std::optional<std::string> ReadFileHead(const std::filesystem::path& path, std::size_t limit) {
  ScopedFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd.get() < 0) {
    if (errno == ENOENT) return std::nullopt;
    ThrowSys("open", path);
  }

  std::string data(limit, '\0');
  std::size_t done = 0;
  while (done < limit) {
    ssize_t r = ::read(fd.get(), data.data() + done, limit - done);
    if (r < 0) {
      if (errno == EINTR) continue;
      ThrowSys("read", path);
    }
    if (r == 0) break;
    done += static_cast<std::size_t>(r);
  }
  data.resize(done);
  return data;
}

} // namespace sampledir::storage
