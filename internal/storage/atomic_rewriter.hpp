#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sampledir::storage {

/*
  In-place rewrite of a small fixed-size file.

  The whole block goes down in one positioned write at offset 0, followed by
  fsync. No temporary file is created, so this works on a full filesystem.
  Atomicity relies on the storage stack not tearing a single-sector write;
  POSIX does not promise that. A torn sidecar is detected on decode and
  rebuilt by higher layers.
*/

enum class RewriteStep {
  kOpened,
  kWritten,
  kSynced,
};

// Called after each step completes. Throwing from it abandons the rewrite at
// that point, which is how tests model a crash.
using RewriteHook = std::function<void(RewriteStep)>;

struct RewriteFaults {
  RewriteHook hook;

  // Stops after this many bytes of the block reached the file and raises
  // util::IoError, leaving a torn block behind.
  std::optional<std::size_t> tear_after_bytes;
};

// Throws util::IoError on any open/write/truncate/sync failure.
void RewriteInPlace(const std::filesystem::path& path, std::string_view block, const RewriteFaults& faults = {});

// Reads at most `limit` bytes. Returns nullopt if the file does not exist.
std::optional<std::string> ReadFileHead(const std::filesystem::path& path, std::size_t limit);

} // namespace sampledir::storage
