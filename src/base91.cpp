// -----------------------------------------------------------------------------
// @file base91.cpp
// @brief basE91 transform. See base91.hpp for the bit layout and strictness rules.
// -----------------------------------------------------------------------------
#include "ledgerpack/base91.hpp"

namespace ledgerpack {
namespace base91 {

const char ALPHABET[RADIX + 1] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789"
    "!#$%&()*+,./:;<=>?@[]^_`{|}~\"";

namespace {

// Reverse lookup: symbol → value, -1 for bytes outside the alphabet.
struct DecodeTable {
    int8_t value[256];

    DecodeTable() {
        for (int i = 0; i < 256; ++i) value[i] = -1;
        for (size_t i = 0; i < RADIX; ++i) {
            value[static_cast<uint8_t>(ALPHABET[i])] = static_cast<int8_t>(i);
        }
    }
};

const DecodeTable& table() {
    static const DecodeTable t;
    return t;
}

} // namespace

std::string encode(const uint8_t* in, size_t n) {
    std::string out;
    out.reserve(max_encoded_length(n));

    uint32_t queue = 0;  // pending bits, least significant first
    unsigned bits  = 0;  // number of pending bits

    for (size_t i = 0; i < n; ++i) {
        queue |= static_cast<uint32_t>(in[i]) << bits;
        bits  += 8;

        if (bits > 13) {
            uint32_t v = queue & 8191;          // 13 bits
            if (v > 88) {
                queue >>= 13;
                bits   -= 13;
            } else {
                v      = queue & 16383;         // small value: take 14 bits
                queue >>= 14;
                bits   -= 14;
            }
            out.push_back(ALPHABET[v % RADIX]);
            out.push_back(ALPHABET[v / RADIX]);
        }
    }

    // Final partial group: one symbol if it fits, otherwise two.
    if (bits > 0) {
        out.push_back(ALPHABET[queue % RADIX]);
        if (bits > 7 || queue > 90) {
            out.push_back(ALPHABET[queue / RADIX]);
        }
    }
    return out;
}

Status decode(const std::string& text, Bytes& out, Fault* fault) {
    const DecodeTable& t = table();

    Bytes    result;
    result.reserve(text.size() * 14 / 16 + 1);

    uint32_t queue   = 0;
    unsigned bits    = 0;
    int      pending = -1;  // first symbol of an incomplete pair

    for (size_t i = 0; i < text.size(); ++i) {
        const uint8_t c = static_cast<uint8_t>(text[i]);
        const int     d = t.value[c];
        if (d < 0) {
            return fail(fault, Status::MalformedEncoding, 0, c, i);
        }

        if (pending < 0) {
            pending = d;
            continue;
        }

        const uint32_t v = static_cast<uint32_t>(pending + d * static_cast<int>(RADIX));
        pending = -1;

        queue |= v << bits;
        bits  += (v & 8191) > 88 ? 13 : 14;
        do {
            result.push_back(static_cast<uint8_t>(queue & 0xFF));
            queue >>= 8;
            bits   -= 8;
        } while (bits > 7);
    }

    if (pending >= 0) {
        // A lone symbol must finish exactly one byte started by the previous pair.
        const uint32_t last = queue | (static_cast<uint32_t>(pending) << bits);
        if (bits == 0 || last > 0xFF) {
            return fail(fault, Status::MalformedEncoding, 0,
                        static_cast<uint8_t>(text.back()), text.size() - 1);
        }
        result.push_back(static_cast<uint8_t>(last));
    } else if (queue != 0) {
        // Padding bits above the final byte are always zero in a valid stream.
        return fail(fault, Status::MalformedEncoding, 0,
                    static_cast<uint8_t>(text.back()), text.size() - 1);
    }

    out.swap(result);
    return Status::Ok;
}

bool is_symbol(char c) {
    return table().value[static_cast<uint8_t>(c)] >= 0;
}

size_t max_encoded_length(size_t n) {
    // Every pair carries at least 13 bits; the tail adds at most two symbols.
    return ((n * 8 + 12) / 13) * 2 + 2;
}

double expansion_ratio(size_t encoded, size_t original) {
    if (original == 0) return 0.0;
    return static_cast<double>(encoded) / static_cast<double>(original);
}

} // namespace base91
} // namespace ledgerpack
