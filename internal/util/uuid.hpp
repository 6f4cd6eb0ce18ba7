#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace sampledir::util {

/*
  UUID helpers

  Database, directory and open uuids are stored in DirMeta as raw 16 byte
  RFC4122 UUIDs.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// raw bytes as stored in protobuf `bytes` fields
std::string ToBytes(const UUID& id);
UUID        FromBytes(const std::string& bytes);

// Renders a `bytes` uuid field for logs; tolerates empty and malformed values.
std::string FormatBytes(const std::string& bytes);

} // namespace sampledir::util
