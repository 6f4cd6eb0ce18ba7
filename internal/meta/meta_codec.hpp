#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "sampledir/v1.hpp"

namespace sampledir::meta {

/*
  Fixed-size sidecar block.

    offset 0      varint32 length L
    offset V      L bytes of serialized DirMeta, ending in its checksum field
    offset V+L    padding up to kMetaBlockSize

  The fixed size lets the block be rewritten in place with a single write
  instead of write-temp-then-rename, which needs free space the recorder may
  not have. The trailing checksum turns a torn rewrite into a FormatError.
*/
inline constexpr std::size_t kMetaBlockSize = 512;

// Throws util::FormatError if the length prefix plus message exceed kMetaBlockSize.
// Any checksum already set on `meta` is replaced.
std::string Encode(const sampledir::v1::DirMeta& meta);

// Throws util::FormatError unless `block` is exactly kMetaBlockSize bytes holding a
// valid prefix and message with a matching checksum. Padding after a checksummed
// message is ignored; a message without one must be followed by NUL bytes only.
// The returned record has no checksum set.
sampledir::v1::DirMeta Decode(std::string_view block);

} // namespace sampledir::meta
