/**
 * @file manifest.hpp
 * @brief ledgerpack Manifest - what a decoder must know before it reassembles.
 *
 * The manifest travels as its own record, `<ns>#m`, next to the data records, so a
 * decoder can check that every data record arrived before it touches any of them.
 *
 * ### Value layout (fits one 64-byte ledger value)
 *
 *     1;b91;<size>;<crc32>;<count>
 *
 * | Field     | Text                           | Meaning                         |
 * |-----------|--------------------------------|---------------------------------|
 * | version   | `1`                            | manifest layout version         |
 * | family    | `b91`                          | encoding family of the stream   |
 * | size      | decimal, no sign, no padding   | original payload length L       |
 * | crc32     | 8 lowercase hex digits         | CRC-32 of the payload           |
 * | count     | decimal                        | number of data records N        |
 *
 * Worst case (20-digit size and count) is 56 characters. A run whose value limit is
 * shorter than its manifest text is refused before any record is built.
 *
 * ### Media type
 *
 * The optional media type lives in a second record, `<ns>#t`:
 *
 *     type/subtype[;key=value]...        e.g.  image/png;n=picture;c=1c291ca3
 *
 * Tokens are printable ASCII without space, `;`, `=` or `,`. Keys are unique.
 * One payload carries one media type; unrelated payloads use separate namespaces.
 */
#pragma once

#include <stdint.h>
#include <string>

#include "etl/vector.h"

#include "ledgerpack/record.hpp"
#include "ledgerpack/status.hpp"

namespace ledgerpack {

static constexpr uint8_t LP_MANIFEST_VERSION = 1;

/// Encoding families a manifest can name.
enum class EncodingFamily : uint8_t {
  Base91 = 0,
};

const char* family_tag(EncodingFamily family);

/// Maximum number of media type parameters.
static constexpr size_t LP_MEDIA_PARAMS_MAX = 16;

/// @brief One media type parameter (`k=v`).
struct MediaParam {
  ValStr k;
  ValStr v;
};

/// @brief Parsed `<ns>#t` value: `type/subtype` plus ordered parameters.
struct MediaType {
  ValStr essence;  ///< `type/subtype`
  etl::vector<MediaParam, LP_MEDIA_PARAMS_MAX> params;

  /**
   * @brief Set or replace a parameter.
   * @return false if key or value is not a valid token, or capacity is full.
   */
  bool set(const char* key, const char* val);

  bool has(const char* key) const { return get(key) != nullptr; }

  /// Value for @p key, or nullptr.
  const ValStr* get(const char* key) const;

  /// Render `type/subtype;k=v;...`. May exceed LP_VALUE_CAP; callers check.
  std::string to_string() const;

  /**
   * @brief Parse @p len characters at @p text.
   * @return false on a missing `/`, empty or invalid tokens, duplicate keys, or more
   *         than LP_MEDIA_PARAMS_MAX parameters. @p out is untouched on failure.
   */
  static bool parse(const char* text, size_t len, MediaType& out);
};

struct Manifest {
  uint8_t        version  = LP_MANIFEST_VERSION;
  EncodingFamily family   = EncodingFamily::Base91;
  uint64_t       size     = 0;  ///< payload length in bytes
  uint32_t       checksum = 0;  ///< CRC-32 of the payload
  uint64_t       count    = 0;  ///< number of data records
  ValStr         media_type;    ///< optional; empty when absent

  /// Render the `<ns>#m` value.
  ValStr to_value() const;

  /**
   * @brief Parse a `<ns>#m` value. @p out is untouched on failure; on success its
   *        media type is cleared (it comes from the `<ns>#t` record).
   * @return Status::Ok or Status::BadManifest (unknown version/family, bad fields).
   */
  static Status from_value(const ValStr& value, Manifest& out, Fault* fault = nullptr);

  /// Parse #media_type. False when it is empty or malformed.
  bool media(MediaType& out) const;
};

inline bool operator==(const Manifest& a, const Manifest& b) {
  return a.version == b.version && a.family == b.family && a.size == b.size &&
         a.checksum == b.checksum && a.count == b.count && a.media_type == b.media_type;
}
inline bool operator!=(const Manifest& a, const Manifest& b) { return !(a == b); }

/// True if @p media_type parses as a MediaType and fits one ledger value.
bool valid_media_type(const std::string& media_type);

} // namespace ledgerpack

