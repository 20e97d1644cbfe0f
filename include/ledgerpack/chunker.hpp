/**
 * @file chunker.hpp
 * @brief Record Chunker - cuts an encoded stream into ledger-sized records.
 *
 * ---
 *
 * ## Role
 *
 * The chunker takes the basE91 text of a payload and splits it into consecutive,
 * non-overlapping fragments of `limits.max_value_len` characters. Every fragment
 * but the last is full; the last holds the remainder. Fragment *i* becomes the
 * record `<ns>:<index i>` (see record.hpp for the key scheme).
 *
 * ```
 *   "AbCdEfGhIjKlMnOp..."  (E characters)
 *        │
 *        ├── blob:00 → "AbCdEfGh..."   (max_value_len)
 *        ├── blob:01 → "IjKlMnOp..."   (max_value_len)
 *        └── blob:0n → "...xyz"        (E mod max_value_len, or full)
 * ```
 *
 * ## Fail fast
 *
 * Everything that could stop a run is checked before the first record is built:
 *
 * | Check                                         | Status                 |
 * |-----------------------------------------------|------------------------|
 * | limits outside 1..64                          | `InvalidLimits`        |
 * | namespace empty or with reserved characters   | `InvalidNamespace`     |
 * | N > `max_records` (when non-zero)             | `RecordBudgetExceeded` |
 * | `<ns>:<index>` or `<ns>#m` longer than limit  | `KeyBudgetExceeded`    |
 *
 * A failing call leaves the output vector untouched.
 *
 * ## Edge cases
 *
 * - Empty text yields zero records (the manifest still describes the empty payload).
 * - The index width grows with N (2 digits up to 1296 records, 3 up to 46656, ...),
 *   so a long namespace can fit a small payload and fail a large one.
 */
#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include "ledgerpack/record.hpp"
#include "ledgerpack/status.hpp"

namespace ledgerpack {
namespace chunker {

/// Number of records for @p text_len characters: ceil(text_len / max_value_len).
uint64_t record_count(size_t text_len, const Limits& limits);

/**
 * @brief Run every fail-fast check for a stream of @p text_len characters.
 * @return Status::Ok when chunk() would succeed.
 */
Status plan(size_t text_len, const Limits& limits, const std::string& ns, Fault* fault = nullptr);

/**
 * @brief Split @p text into ordered records under namespace @p ns.
 *
 * @param text   Encoded stream (printable ASCII).
 * @param limits Key/value/record limits for this run.
 * @param ns     Key namespace.
 * @param out    Receives the records in index order (replaced, not appended).
 * @param fault  Optional diagnostic context.
 */
Status chunk(const std::string& text, const Limits& limits, const std::string& ns,
             std::vector<Record>& out, Fault* fault = nullptr);

} // namespace chunker
} // namespace ledgerpack

