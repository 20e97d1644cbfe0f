/**
 * @file record_file.hpp
 * @brief Record-set file - a local stand-in for the ledger's data entries.
 *
 * The CLI cannot talk to a ledger; it hands entries to (and takes them from) a JSON
 * file that a submitter or fetcher fills in:
 * @code
 * {
 *   "namespace": "blob",
 *   "entries": [
 *     { "key": "blob#m",  "value": "1;b91;100;1c291ca3;2" },
 *     { "key": "blob:00", "value": "..." },
 *     { "key": "blob:01", "value": "..." }
 *   ]
 * }
 * @endcode
 *
 * Entries may appear in any order and may include other namespaces. Loading
 * refuses entries that could never have come from the ledger (non-string fields,
 * keys or values over 64 bytes).
 */
#pragma once

#include <string>
#include <vector>

#include "ledgerpack/record.hpp"
#include "ledgerpack/status.hpp"

namespace ledgerpack {

struct RecordSet {
    std::string         key_namespace;  ///< namespace the writer used; may be empty
    std::vector<Record> entries;
};

/**
 * @brief Load a record-set file.
 * @return Ok, IoError (missing/unreadable) or BadRecordFile. @p out untouched on failure.
 */
Status load_record_set(const std::string& path, RecordSet& out, std::string* error = nullptr);

/// Save atomically (temp file + rename). IoError on failure.
Status save_record_set(const std::string& path, const RecordSet& set, std::string* error = nullptr);

} // namespace ledgerpack

