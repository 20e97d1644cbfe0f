/**
 * @file checksum.hpp
 * @brief CRC-32 over payload bytes and its fixed 8-hex-digit text form.
 *
 * The checksum is the IEEE 802.3 CRC-32 as computed by zlib's `crc32()`. The
 * empty payload has checksum 0. In manifest text it is always written as exactly
 * eight lowercase hex digits.
 */
#pragma once

#include <stddef.h>
#include <stdint.h>

#include "etl/string.h"

#include "ledgerpack/base91.hpp"

namespace ledgerpack {

/// Eight hex digits.
using ChecksumStr = etl::string<8>;

uint32_t crc32_of(const uint8_t* data, size_t n);

inline uint32_t crc32_of(const Bytes& data) { return crc32_of(data.data(), data.size()); }

/// Render @p crc as eight lowercase hex digits.
ChecksumStr checksum_to_hex(uint32_t crc);

/**
 * @brief Parse exactly eight hex digits (either case).
 * @return true on success; @p out is untouched on failure.
 */
bool checksum_from_hex(const char* text, size_t len, uint32_t& out);

} // namespace ledgerpack

