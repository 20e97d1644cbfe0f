/**
 * @file pipeline.hpp
 * @brief ledgerpack Pipeline - encode a payload into ledger entries, decode it back.
 *
 * ---
 *
 * @par Operational model
 * ```
 *  [Wrapper: CLI / submitter]                      [Pipeline]
 *          │
 *   read file ── Bytes ── encode() ──► base91::encode ─► chunker::chunk
 *          │                                │
 *          ◄──────── Encoded{records, manifest, stats}
 *          │
 *   ledger_entries() ──► submit one entry per ledger operation
 *
 *   fetch entries ── decode_entries() ──► manifest lookup ─► reassembler
 *          │                                                    │
 *          ◄──────────────────── Bytes (verified) ──────────────┘
 *   write file
 * ```
 *
 * @par Design constraints
 * - No I/O, no globals, no locks. Every call owns its buffers; independent calls may
 *   run on different threads.
 * - Stats are return values. Elapsed time is measured with a steady clock around the
 *   transform itself.
 * - Decode either returns the verified payload or fails with no output.
 */
#pragma once

#include <stdint.h>
#include <string>
#include <vector>

#include "ledgerpack/base91.hpp"
#include "ledgerpack/manifest.hpp"
#include "ledgerpack/record.hpp"
#include "ledgerpack/status.hpp"

namespace ledgerpack {

/// Default key namespace.
static constexpr const char* LP_DEFAULT_NAMESPACE = "blob";

struct EncodeOptions {
  Limits      limits;
  std::string key_namespace = LP_DEFAULT_NAMESPACE;
  std::string media_type;  ///< optional `type/subtype[;k=v]...`; stored as `<ns>#t`
};

struct EncodeStats {
  uint64_t original_size = 0;  ///< L
  uint64_t encoded_size  = 0;  ///< E, length of the basE91 stream
  uint64_t record_count  = 0;  ///< N, data records only
  uint64_t stored_size   = 0;  ///< key + value bytes over all ledger entries
  double   ratio         = 0;  ///< encoded_size / original_size (0 for empty input)
  uint32_t checksum      = 0;
  uint64_t elapsed_us    = 0;
};

struct DecodeStats {
  uint64_t record_count = 0;  ///< data records used
  uint64_t encoded_size = 0;
  uint64_t decoded_size = 0;
  uint32_t checksum     = 0;
  uint64_t elapsed_us   = 0;
};

struct Encoded {
  std::vector<Record> records;  ///< data records in index order
  Manifest            manifest;
  EncodeStats         stats;
};

namespace pipeline {

/**
 * @brief Encode @p payload into data records and a manifest.
 *
 * Every entry ledger_entries() will produce is checked against @p options.limits
 * first: the chunker's checks, then `ValueBudgetExceeded` when the manifest or media
 * type text is longer than `max_value_len` (expected = limit, actual = length).
 * An unparsable media type is `BadManifest`.
 *
 * @param out Filled on success; untouched on failure.
 */
Status encode(const Bytes& payload, const EncodeOptions& options, Encoded& out, Fault* fault = nullptr);

/**
 * @brief Decode data records under @p ns using an out-of-band @p manifest.
 * @param out Filled on success; untouched on failure.
 */
Status decode(const std::vector<Record>& records, const Manifest& manifest, const std::string& ns,
              Bytes& out, Fault* fault = nullptr, DecodeStats* stats = nullptr);

/// Manifest record, optional media type record, then the data records.
std::vector<Record> ledger_entries(const Encoded& encoded, const std::string& ns);

/**
 * @brief Find and parse the `<ns>#m` (and optional `<ns>#t`) records in @p entries.
 * @return Ok, or BadManifest when the manifest record is absent, repeated with
 *         different values, or unparsable, or the media type record is unparsable.
 */
Status find_manifest(const std::vector<Record>& entries, const std::string& ns, Manifest& out,
                     Fault* fault = nullptr);

/// find_manifest() + decode() over one fetched entry set.
Status decode_entries(const std::vector<Record>& entries, const std::string& ns, Bytes& out,
                      Fault* fault = nullptr, DecodeStats* stats = nullptr);

} // namespace pipeline
} // namespace ledgerpack

