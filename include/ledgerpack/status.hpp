/**
 * @file status.hpp
 * @brief ledgerpack Status & Fault - how every operation reports failure.
 *
 * Library calls never throw. Each operation returns a `Status` and, when the
 * caller passes a `Fault*`, fills in the context needed to tell truncation,
 * corruption and scheme mismatch apart:
 *
 * | Status               | expected            | actual               | index                 |
 * |----------------------|---------------------|----------------------|-----------------------|
 * | MalformedEncoding    | -                   | offending byte value | text offset           |
 * | KeyBudgetExceeded    | max key length      | required key length  | -                     |
 * | IncompleteData       | manifest count      | distinct indices     | first bad index       |
 * | DuplicateIndex       | -                   | -                    | conflicting index     |
 * | ChecksumMismatch     | manifest checksum   | computed checksum    | -                     |
 * | RecordBudgetExceeded | max records         | required records     | -                     |
 *
 * All failures are terminal for the call that raised them. Nothing is retried and
 * no partial output is produced.
 */
#pragma once

#include <stdint.h>
#include <string>

namespace ledgerpack {

/// Result codes shared by the codec, chunker, reassembler and outer layers.
enum class Status : uint8_t {
  Ok = 0,
  MalformedEncoding,     // symbol outside the alphabet, bad final group
  KeyBudgetExceeded,     // namespace + index text does not fit the key limit
  ValueBudgetExceeded,   // manifest or media type text does not fit the value limit
  IncompleteData,        // distinct data records != manifest count
  DuplicateIndex,        // two records, same index, different value
  ChecksumMismatch,      // decoded size or CRC differs from the manifest
  InvalidLimits,         // limits outside the ledger capacity
  InvalidNamespace,      // empty namespace or reserved characters
  RecordBudgetExceeded,  // more records than the profile allows
  BadManifest,           // manifest record missing or unparsable
  BadRecordFile,         // record-set file has the wrong shape
  BadProfile,            // ledger profile unreadable or out of range
  IoError,               // file could not be read or written
};

/// Diagnostic context attached to a failing Status.
struct Fault {
  Status   status   = Status::Ok;
  uint64_t expected = 0;
  uint64_t actual   = 0;
  uint64_t index    = 0;
};

/// Stable identifier for a status, e.g. "IncompleteData".
const char* to_string(Status s);

/// One-line human-readable diagnostic for a fault.
std::string describe(const Fault& f);

/// Fill @p f (if non-null) and hand back @p s so callers can `return fail(...)`.
inline Status fail(Fault* f, Status s, uint64_t expected = 0, uint64_t actual = 0, uint64_t index = 0) {
  if (f) {
    f->status   = s;
    f->expected = expected;
    f->actual   = actual;
    f->index    = index;
  }
  return s;
}

} // namespace ledgerpack

