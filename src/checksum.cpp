#include "ledgerpack/checksum.hpp"

#include <zlib.h>

#include <limits>

namespace ledgerpack {

namespace {

bool hex_char_to_val(char c, uint8_t& out) {
    if (c >= '0' && c <= '9') { out = static_cast<uint8_t>(c - '0');      return true; }
    if (c >= 'a' && c <= 'f') { out = static_cast<uint8_t>(c - 'a' + 10); return true; }
    if (c >= 'A' && c <= 'F') { out = static_cast<uint8_t>(c - 'A' + 10); return true; }
    return false;
}

} // namespace

uint32_t crc32_of(const uint8_t* data, size_t n) {
    uLong crc = ::crc32(0L, Z_NULL, 0);

    // zlib takes uInt lengths; feed large buffers in slices.
    const size_t slice = std::numeric_limits<uInt>::max();
    while (n > 0) {
        const size_t take = n < slice ? n : slice;
        crc  = ::crc32(crc, data, static_cast<uInt>(take));
        data += take;
        n    -= take;
    }
    return static_cast<uint32_t>(crc);
}

ChecksumStr checksum_to_hex(uint32_t crc) {
    ChecksumStr hex;
    for (int shift = 28; shift >= 0; shift -= 4) {
        hex += "0123456789abcdef"[(crc >> shift) & 0x0F];
    }
    return hex;
}

bool checksum_from_hex(const char* text, size_t len, uint32_t& out) {
    if (!text || len != 8) return false;

    uint32_t value = 0;
    for (size_t i = 0; i < len; ++i) {
        uint8_t nibble;
        if (!hex_char_to_val(text[i], nibble)) return false;
        value = (value << 4) | nibble;
    }
    out = value;
    return true;
}

} // namespace ledgerpack
