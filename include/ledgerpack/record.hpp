/**
 * @file record.hpp
 * @brief ledgerpack Record & key scheme - the atomic unit a ledger stores.
 *
 * A `Record` is one ledger data entry: a short key and a short value, both ASCII.
 * Keys and values are fixed-capacity ETL strings sized to the ledger hard limit
 * (64 bytes each for Stellar `ManageData`). A run's `Limits` may be tighter.
 *
 * ## Key conventions
 *
 * | Kind        | Key                    | Value                                  |
 * |-------------|------------------------|----------------------------------------|
 * | Data        | `<ns>:<index>`         | slice of the basE91 stream             |
 * | Manifest    | `<ns>#m`               | `1;b91;<size>;<crc32 hex>;<count>`     |
 * | Media type  | `<ns>#t`               | media type, e.g. `image/png`           |
 *
 * - `<ns>` is the namespace: one or more of `A-Z a-z 0-9 _ . -`. It never holds
 *   `:` or `#`, so the kind of a record is decided by the first of those after
 *   the namespace.
 * - `<index>` is lowercase base-36 (`0-9a-z`), zero-padded to the run's width
 *   `max(2, digits36(count - 1))`. The padding keeps keys sortable as text;
 *   decoders parse the number and do not care about the width.
 *
 * Records from other namespaces can share the same store (same account); the
 * reassembler classifies and drops them.
 */
#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>

#include "etl/string.h"

#include "ledgerpack/status.hpp"

namespace ledgerpack {

// Ledger hard capacities (bytes).
static constexpr size_t LP_KEY_CAP   = 64;  ///< Maximum key length the ledger accepts
static constexpr size_t LP_VALUE_CAP = 64;  ///< Maximum value length the ledger accepts

static constexpr char LP_DATA_SEP     = ':';  ///< `<ns>:<index>`
static constexpr char LP_META_SEP     = '#';  ///< `<ns>#m`, `<ns>#t`
static constexpr char LP_MANIFEST_TAG = 'm';
static constexpr char LP_MEDIA_TAG    = 't';

/// Minimum index width, so small runs still sort as text.
static constexpr size_t LP_INDEX_MIN_WIDTH = 2;

/// Base-36 digits needed for any uint64_t.
static constexpr size_t LP_INDEX_MAX_WIDTH = 13;

using KeyStr = etl::string<LP_KEY_CAP>;
using ValStr = etl::string<LP_VALUE_CAP>;

/// @brief One ledger entry.
struct Record {
    KeyStr key;
    ValStr value;
};

inline bool operator==(const Record& a, const Record& b) { return a.key == b.key && a.value == b.value; }
inline bool operator!=(const Record& a, const Record& b) { return !(a == b); }

/// @brief Per-run size policy; must fit inside the ledger capacities.
struct Limits {
    size_t   max_key_len   = LP_KEY_CAP;    ///< 1..LP_KEY_CAP
    size_t   max_value_len = LP_VALUE_CAP;  ///< 1..LP_VALUE_CAP
    uint64_t max_records   = 0;             ///< 0 = unlimited
};

/// What a key means relative to one namespace.
enum class RecordKind : uint8_t {
    Foreign = 0,  // different namespace, or not ours at all
    Data,
    Manifest,
    MediaType,
    Invalid,      // our namespace, but unparsable suffix
};

/**
 * @brief Check limits against the ledger capacities.
 * @return Status::Ok or Status::InvalidLimits (expected = capacity, actual = value).
 */
Status validate_limits(const Limits& limits, Fault* fault = nullptr);

/// True if @p ns is non-empty, fits a key, and uses only `A-Z a-z 0-9 _ . -`.
bool valid_namespace(const std::string& ns);

/// Width of the index text for a run of @p count records.
size_t index_width(uint64_t count);

/**
 * @brief Write @p index as base-36, zero-padded to @p width.
 * @param out Buffer of at least LP_INDEX_MAX_WIDTH + 1 bytes; NUL-terminated.
 * @return Number of characters written (may exceed @p width for large indices).
 */
size_t index_to_text(uint64_t index, size_t width, char* out);

/// Parse 1..LP_INDEX_MAX_WIDTH lowercase base-36 digits. @p out untouched on failure.
bool index_from_text(const char* text, size_t len, uint64_t& out);

KeyStr make_data_key(const std::string& ns, uint64_t index, size_t width);
KeyStr make_manifest_key(const std::string& ns);
KeyStr make_media_key(const std::string& ns);

/// Length of a data key for @p ns at @p width, without building it.
inline size_t data_key_length(const std::string& ns, size_t width) { return ns.size() + 1 + width; }

/// Length of the manifest / media type keys for @p ns.
inline size_t meta_key_length(const std::string& ns) { return ns.size() + 2; }

/**
 * @brief Classify @p key against namespace @p ns.
 * @param index Receives the parsed index when the result is RecordKind::Data.
 */
RecordKind classify(const KeyStr& key, const std::string& ns, uint64_t* index = nullptr);

} // namespace ledgerpack

