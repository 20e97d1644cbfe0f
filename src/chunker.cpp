/**
 * @file chunker.cpp
 * @brief Record Chunker implementation.
 *
 * Refer to chunker.hpp for the layout and the fail-fast rules.
 */
#include "ledgerpack/chunker.hpp"

namespace ledgerpack {
namespace chunker {

uint64_t record_count(size_t text_len, const Limits& limits) {
    if (limits.max_value_len == 0) return 0;
    return (static_cast<uint64_t>(text_len) + limits.max_value_len - 1) / limits.max_value_len;
}

Status plan(size_t text_len, const Limits& limits, const std::string& ns, Fault* fault) {
    Status st = validate_limits(limits, fault);
    if (st != Status::Ok) return st;

    if (!valid_namespace(ns)) {
        return fail(fault, Status::InvalidNamespace, LP_KEY_CAP, ns.size());
    }

    const uint64_t count = record_count(text_len, limits);
    if (limits.max_records != 0 && count > limits.max_records) {
        return fail(fault, Status::RecordBudgetExceeded, limits.max_records, count);
    }

    // The longest key of the run is either a data key or a meta key.
    size_t needed = meta_key_length(ns);
    if (count > 0) {
        const size_t data_len = data_key_length(ns, index_width(count));
        if (data_len > needed) needed = data_len;
    }
    if (needed > limits.max_key_len) {
        return fail(fault, Status::KeyBudgetExceeded, limits.max_key_len, needed);
    }
    return Status::Ok;
}

Status chunk(const std::string& text, const Limits& limits, const std::string& ns,
             std::vector<Record>& out, Fault* fault) {
    Status st = plan(text.size(), limits, ns, fault);
    if (st != Status::Ok) return st;

    const uint64_t count = record_count(text.size(), limits);
    const size_t   width = index_width(count);

    std::vector<Record> records;
    records.reserve(static_cast<size_t>(count));

    size_t written = 0;  // characters of text already placed
    for (uint64_t i = 0; i < count; ++i) {
        const size_t remaining = text.size() - written;
        const size_t frag_len  = remaining > limits.max_value_len ? limits.max_value_len : remaining;

        Record r;
        r.key = make_data_key(ns, i, width);
        r.value.assign(text.data() + written, frag_len);
        records.push_back(r);

        written += frag_len;
    }

    out.swap(records);
    return Status::Ok;
}

} // namespace chunker
} // namespace ledgerpack
