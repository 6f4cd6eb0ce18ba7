#include "meta_codec.hpp"

#include <google/protobuf/io/coded_stream.h>

#include <cstdint>

#include "internal/util/crc32c.hpp"
#include "internal/util/errors.hpp"

namespace sampledir::meta {

using google::protobuf::io::CodedInputStream;
using google::protobuf::io::CodedOutputStream;
using sampledir::util::FormatError;

namespace {

// Field 5, wire type fixed32.
constexpr uint8_t     kChecksumTag         = (5 << 3) | 5;
constexpr std::size_t kChecksumFieldSize   = 1 + sizeof(uint32_t);

} // namespace

std::string Encode(const sampledir::v1::DirMeta& meta) {
  sampledir::v1::DirMeta unsigned_meta = meta;
  unsigned_meta.clear_checksum();

  const std::size_t fields_size = unsigned_meta.ByteSizeLong();
  const std::size_t body_size   = fields_size + kChecksumFieldSize;
  if (body_size > kMetaBlockSize) {
    throw FormatError("DirMeta message requires " + std::to_string(body_size) + " bytes, over limit of " +
                      std::to_string(kMetaBlockSize));
  }

  const auto        body_len    = static_cast<uint32_t>(body_size);
  const std::size_t prefix_size = CodedOutputStream::VarintSize32(body_len);
  if (prefix_size + body_size > kMetaBlockSize) {
    throw FormatError("Length-delimited DirMeta message requires " + std::to_string(prefix_size + body_size) +
                      " bytes, over limit of " + std::to_string(kMetaBlockSize));
  }

  std::string block(kMetaBlockSize, '\0');
  auto*       start  = reinterpret_cast<uint8_t*>(block.data());
  auto*       fields = CodedOutputStream::WriteVarint32ToArray(body_len, start);
  if (!unsigned_meta.SerializeToArray(fields, static_cast<int>(fields_size))) {
    throw FormatError("failed to serialize DirMeta");
  }

  auto*      trailer  = fields + fields_size;
  const auto checksum = sampledir::util::Crc32c(start, static_cast<std::size_t>(trailer - start));
  *trailer++          = kChecksumTag;
  CodedOutputStream::WriteLittleEndian32ToArray(checksum, trailer);
  return block;
}

sampledir::v1::DirMeta Decode(std::string_view block) {
  if (block.size() != kMetaBlockSize) {
    throw FormatError("expected a " + std::to_string(kMetaBlockSize) + "-byte meta block; got " +
                      std::to_string(block.size()) + " bytes");
  }

  const auto* start = reinterpret_cast<const uint8_t*>(block.data());
  CodedInputStream in(start, static_cast<int>(block.size()));

  uint32_t body_len = 0;
  if (!in.ReadVarint32(&body_len)) {
    throw FormatError("meta block has an invalid length prefix");
  }

  const auto prefix_size = static_cast<std::size_t>(in.CurrentPosition());
  if (body_len > kMetaBlockSize - prefix_size) {
    throw FormatError("meta block declares a " + std::to_string(body_len) + "-byte message after a " +
                      std::to_string(prefix_size) + "-byte prefix, past the " + std::to_string(kMetaBlockSize) +
                      "-byte limit");
  }

  sampledir::v1::DirMeta meta;
  if (!meta.ParseFromArray(block.data() + prefix_size, static_cast<int>(body_len))) {
    throw FormatError("meta block holds an unparseable DirMeta message");
  }

  const std::size_t content_end = prefix_size + body_len;
  if (meta.has_checksum()) {
    const std::size_t trailer = content_end - kChecksumFieldSize;
    if (body_len < kChecksumFieldSize || start[trailer] != kChecksumTag) {
      throw FormatError("meta block checksum is not the last field");
    }
    uint32_t stored = 0;
    CodedInputStream::ReadLittleEndian32FromArray(start + trailer + 1, &stored);
    const auto computed = sampledir::util::Crc32c(start, trailer);
    if (stored != meta.checksum() || stored != computed) {
      throw FormatError("meta block checksum mismatch: stored " + std::to_string(stored) + ", computed " +
                        std::to_string(computed));
    }
    meta.clear_checksum();
  } else if (block.find_first_not_of('\0', content_end) != std::string_view::npos) {
    throw FormatError("meta block without checksum has non-NUL bytes after its message");
  }
  return meta;
}

} // namespace sampledir::meta
