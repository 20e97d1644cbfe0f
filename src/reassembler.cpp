// -----------------------------------------------------------------------------
// @file reassembler.cpp
// @brief Record set → encoded stream → verified payload.
// -----------------------------------------------------------------------------
#include "ledgerpack/reassembler.hpp"

#include <algorithm>
#include <utility>

#include "ledgerpack/checksum.hpp"

namespace ledgerpack {
namespace reassembler {

namespace {

using Slot = std::pair<uint64_t, const Record*>;

} // namespace

Status reassemble(const std::vector<Record>& records, const Manifest& manifest, const std::string& ns,
                  std::string& text_out, Fault* fault) {
    // Step 1: collect our data records with their parsed index
    std::vector<Slot> slots;
    slots.reserve(records.size());
    for (const auto& r : records) {
        uint64_t index;
        if (classify(r.key, ns, &index) == RecordKind::Data) {
            slots.emplace_back(index, &r);
        }
    }

    // Step 2: order by index, collapse identical copies, refuse conflicting ones
    std::stable_sort(slots.begin(), slots.end(),
                     [](const Slot& a, const Slot& b) { return a.first < b.first; });

    std::vector<Slot> unique;
    unique.reserve(slots.size());
    for (const auto& s : slots) {
        if (!unique.empty() && unique.back().first == s.first) {
            if (unique.back().second->value != s.second->value) {
                return fail(fault, Status::DuplicateIndex, 0, 0, s.first);
            }
            continue;
        }
        unique.push_back(s);
    }

    // Step 3: exactly 0..N-1 must be present
    const uint64_t found = unique.size();
    if (found != manifest.count) {
        uint64_t missing = 0;
        while (missing < found && unique[missing].first == missing) ++missing;
        return fail(fault, Status::IncompleteData, manifest.count, found, missing);
    }
    if (found > 0 && unique.back().first != found - 1) {
        // Same count but an index past the end means another one is missing.
        uint64_t missing = 0;
        while (unique[missing].first == missing) ++missing;
        return fail(fault, Status::IncompleteData, manifest.count, found, missing);
    }

    // Step 4: concatenate
    std::string text;
    size_t total = 0;
    for (const auto& s : unique) total += s.second->value.size();
    text.reserve(total);
    for (const auto& s : unique) text.append(s.second->value.data(), s.second->value.size());

    text_out.swap(text);
    return Status::Ok;
}

Status decode_and_verify(const std::vector<Record>& records, const Manifest& manifest, const std::string& ns,
                         Bytes& bytes_out, Fault* fault, size_t* encoded_size) {
    std::string text;
    Status st = reassemble(records, manifest, ns, text, fault);
    if (st != Status::Ok) return st;

    Bytes bytes;
    st = base91::decode(text, bytes, fault);
    if (st != Status::Ok) return st;

    const uint32_t actual = crc32_of(bytes);
    if (bytes.size() != manifest.size || actual != manifest.checksum) {
        return fail(fault, Status::ChecksumMismatch, manifest.checksum, actual);
    }

    if (encoded_size) *encoded_size = text.size();
    bytes_out.swap(bytes);
    return Status::Ok;
}

} // namespace reassembler
} // namespace ledgerpack
