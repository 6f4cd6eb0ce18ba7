#pragma once

#include <cstddef>
#include <cstdint>

namespace sampledir::util {

// CRC32C (Castagnoli), software table implementation.
uint32_t Crc32c(const void* data, std::size_t len);

} // namespace sampledir::util
