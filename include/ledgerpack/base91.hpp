#pragma once

/**
 * @page lp-base91 ledgerpack basE91 Transform
 * @file base91.hpp
 * @brief basE91 encoder/decoder: arbitrary bytes to printable ASCII and back.
 *
 * @details
 * OVERVIEW
 * --------
 * Ledger data entries historically mistreat non-printable bytes, so a payload is
 * mapped into a safe 91-symbol ASCII alphabet before it is cut into records. basE91
 * packs 13 or 14 input bits into every pair of output symbols, which keeps the
 * expansion ratio around 1.23 (base64 is 1.33).
 *
 * ALPHABET
 * --------
 * The reference basE91 table, index 0..90:
 *
 *     ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789!#$%&()*+,./:;<=>?@[]^_`{|}~"
 *
 * Space, backslash, apostrophe and hyphen are not used. Independent encoders and
 * decoders interoperate only with this exact table.
 *
 * HOW IT WORKS
 * ------------
 * Encoding keeps a little-endian bit queue:
 *   - Append each input byte above the queued bits.
 *   - Once more than 13 bits are queued, take the low 13 bits as value v. If v > 88
 *     consume 13 bits, otherwise consume 14 bits and let v be the low 14 bits.
 *   - Emit alphabet[v % 91] then alphabet[v / 91].
 *   - At the end, if bits remain, emit alphabet[q % 91], plus alphabet[q / 91] when
 *     more than 7 bits remain or q > 90.
 *
 * Decoding inverts the pairs (v = a + 91 * b; 13 bits if (v & 8191) > 88, else 14)
 * and flushes whole bytes. A dangling single symbol completes the last byte.
 *
 * STRICTNESS
 * ----------
 * The reference decoder silently skips unknown characters. This one does not:
 *   - any symbol outside the alphabet is `MalformedEncoding` (index = offset);
 *   - a dangling final symbol that cannot complete exactly one byte is
 *     `MalformedEncoding` (truncated final group);
 *   - non-zero padding bits left after the final pair are `MalformedEncoding`.
 *
 * EXAMPLES
 * --------
 * @code
 *   std::string text = ledgerpack::base91::encode(bytes);
 *   ledgerpack::Bytes back;
 *   ledgerpack::Fault fault;
 *   if (ledgerpack::base91::decode(text, back, &fault) != ledgerpack::Status::Ok) {
 *       std::cerr << ledgerpack::describe(fault) << "\n";
 *   }
 * @endcode
 */

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include "ledgerpack/status.hpp"

namespace ledgerpack {

/// Raw payload bytes.
using Bytes = std::vector<uint8_t>;

namespace base91 {

/// Number of symbols in the alphabet.
static constexpr size_t RADIX = 91;

/// The reference basE91 alphabet (index → symbol).
extern const char ALPHABET[RADIX + 1];

/// Encoding-family identifier written into manifests.
static constexpr const char* FAMILY_TAG = "b91";

/**
 * @brief Encode @p n bytes at @p in into basE91 text.
 * @return Printable ASCII text; empty for n == 0.
 */
std::string encode(const uint8_t* in, size_t n);

/// @overload
inline std::string encode(const Bytes& in) { return encode(in.data(), in.size()); }

/**
 * @brief Decode basE91 @p text.
 *
 * @param text  Encoded text.
 * @param out   Receives the decoded bytes on success; left untouched on failure.
 * @param fault Optional diagnostic context.
 * @return Status::Ok or Status::MalformedEncoding.
 */
Status decode(const std::string& text, Bytes& out, Fault* fault = nullptr);

/// True if @p c belongs to the alphabet.
bool is_symbol(char c);

/// Upper bound on the encoded length for @p n input bytes (used for reserve()).
size_t max_encoded_length(size_t n);

/// encoded / original, or 0 when @p original is 0.
double expansion_ratio(size_t encoded, size_t original);

} // namespace base91
} // namespace ledgerpack
