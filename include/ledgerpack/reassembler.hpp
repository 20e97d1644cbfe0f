/**
 * @file reassembler.hpp
 * @brief Reassembler - turns a fetched record set back into verified bytes.
 *
 * The store gives no ordering guarantee and may return entries that belong to other
 * namespaces on the same account. The reassembler therefore:
 *
 *  1. keeps only `<ns>:<index>` records (foreign and `#` records are skipped,
 *     records with a broken index are dropped);
 *  2. sorts by numeric index; identical duplicates collapse into one, duplicates with
 *     different values fail with `DuplicateIndex`;
 *  3. requires exactly the indices 0..N-1 (N from the manifest), otherwise
 *     `IncompleteData` with expected = N and actual = distinct indices seen;
 *  4. concatenates the values.
 *
 * `decode_and_verify()` then runs the basE91 decoder and compares length and CRC-32
 * against the manifest. It either returns the exact payload or fails with no output.
 */
#pragma once

#include <string>
#include <vector>

#include "ledgerpack/base91.hpp"
#include "ledgerpack/manifest.hpp"
#include "ledgerpack/record.hpp"
#include "ledgerpack/status.hpp"

namespace ledgerpack {
namespace reassembler {

/**
 * @brief Order and concatenate the data records of namespace @p ns.
 * @param text_out Receives the encoded stream on success; untouched on failure.
 */
Status reassemble(const std::vector<Record>& records, const Manifest& manifest, const std::string& ns,
                  std::string& text_out, Fault* fault = nullptr);

/**
 * @brief reassemble() + basE91 decode + size and checksum verification.
 * @param bytes_out    Receives the payload on success; untouched on failure.
 * @param encoded_size If non-null, receives the length of the reassembled stream.
 * @return Ok, IncompleteData, DuplicateIndex, MalformedEncoding or ChecksumMismatch.
 */
Status decode_and_verify(const std::vector<Record>& records, const Manifest& manifest, const std::string& ns,
                         Bytes& bytes_out, Fault* fault = nullptr, size_t* encoded_size = nullptr);

} // namespace reassembler
} // namespace ledgerpack

