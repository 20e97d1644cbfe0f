// -----------------------------------------------------------------------------
// @file pipeline.cpp
// @brief Encode/decode entry points composing codec, chunker and reassembler.
// -----------------------------------------------------------------------------
#include "ledgerpack/pipeline.hpp"

#include <chrono>
#include <utility>

#include "ledgerpack/checksum.hpp"
#include "ledgerpack/chunker.hpp"
#include "ledgerpack/reassembler.hpp"

namespace ledgerpack {
namespace pipeline {

namespace {

using Clock = std::chrono::steady_clock;

uint64_t micros_since(Clock::time_point start) {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count());
}

uint64_t stored_bytes(const std::vector<Record>& entries) {
    uint64_t total = 0;
    for (const auto& r : entries) total += r.key.size() + r.value.size();
    return total;
}

} // namespace

Status encode(const Bytes& payload, const EncodeOptions& options, Encoded& out, Fault* fault) {
    const auto start = Clock::now();

    if (!options.media_type.empty() && !valid_media_type(options.media_type)) {
        return fail(fault, Status::BadManifest, LP_VALUE_CAP, options.media_type.size());
    }

    const std::string text = base91::encode(payload);

    Status st = chunker::plan(text.size(), options.limits, options.key_namespace, fault);
    if (st != Status::Ok) return st;

    Encoded result;
    result.manifest.size     = payload.size();
    result.manifest.checksum = crc32_of(payload);
    result.manifest.count    = chunker::record_count(text.size(), options.limits);
    result.manifest.media_type.assign(options.media_type.c_str());

    // The meta records obey the same value limit as the data records.
    const size_t limit        = options.limits.max_value_len;
    const size_t manifest_len = result.manifest.to_value().size();
    if (manifest_len > limit) {
        return fail(fault, Status::ValueBudgetExceeded, limit, manifest_len);
    }
    if (options.media_type.size() > limit) {
        return fail(fault, Status::ValueBudgetExceeded, limit, options.media_type.size());
    }

    st = chunker::chunk(text, options.limits, options.key_namespace, result.records, fault);
    if (st != Status::Ok) return st;

    EncodeStats& s  = result.stats;
    s.original_size = payload.size();
    s.encoded_size  = text.size();
    s.record_count  = result.records.size();
    s.checksum      = result.manifest.checksum;
    s.ratio         = base91::expansion_ratio(text.size(), payload.size());
    s.stored_size   = stored_bytes(ledger_entries(result, options.key_namespace));
    s.elapsed_us    = micros_since(start);

    out = std::move(result);
    return Status::Ok;
}

Status decode(const std::vector<Record>& records, const Manifest& manifest, const std::string& ns,
              Bytes& out, Fault* fault, DecodeStats* stats) {
    const auto start = Clock::now();

    if (!valid_namespace(ns)) {
        return fail(fault, Status::InvalidNamespace, LP_KEY_CAP, ns.size());
    }

    Bytes  bytes;
    size_t encoded_size = 0;
    Status st = reassembler::decode_and_verify(records, manifest, ns, bytes, fault, &encoded_size);
    if (st != Status::Ok) return st;

    if (stats) {
        stats->record_count = manifest.count;
        stats->encoded_size = encoded_size;
        stats->decoded_size = bytes.size();
        stats->checksum     = manifest.checksum;
        stats->elapsed_us   = micros_since(start);
    }

    out.swap(bytes);
    return Status::Ok;
}

std::vector<Record> ledger_entries(const Encoded& encoded, const std::string& ns) {
    std::vector<Record> entries;
    entries.reserve(encoded.records.size() + 2);

    Record manifest;
    manifest.key   = make_manifest_key(ns);
    manifest.value = encoded.manifest.to_value();
    entries.push_back(manifest);

    if (!encoded.manifest.media_type.empty()) {
        Record media;
        media.key   = make_media_key(ns);
        media.value = encoded.manifest.media_type;
        entries.push_back(media);
    }

    entries.insert(entries.end(), encoded.records.begin(), encoded.records.end());
    return entries;
}

Status find_manifest(const std::vector<Record>& entries, const std::string& ns, Manifest& out,
                     Fault* fault) {
    const Record* manifest_rec = nullptr;
    const Record* media_rec    = nullptr;

    for (const auto& r : entries) {
        const RecordKind kind = classify(r.key, ns);
        const Record**   slot = kind == RecordKind::Manifest  ? &manifest_rec
                              : kind == RecordKind::MediaType ? &media_rec
                                                              : nullptr;
        if (!slot) continue;
        if (*slot && (*slot)->value != r.value) {
            return fail(fault, Status::BadManifest);
        }
        *slot = &r;
    }

    if (!manifest_rec) return fail(fault, Status::BadManifest);

    Manifest m;
    Status st = Manifest::from_value(manifest_rec->value, m, fault);
    if (st != Status::Ok) return st;

    if (media_rec) {
        MediaType parsed;
        if (!MediaType::parse(media_rec->value.c_str(), media_rec->value.size(), parsed)) {
            return fail(fault, Status::BadManifest, 0, 0, 0);
        }
        m.media_type = media_rec->value;
    }
    out = m;
    return Status::Ok;
}

Status decode_entries(const std::vector<Record>& entries, const std::string& ns, Bytes& out,
                      Fault* fault, DecodeStats* stats) {
    Manifest manifest;
    Status st = find_manifest(entries, ns, manifest, fault);
    if (st != Status::Ok) return st;
    return decode(entries, manifest, ns, out, fault, stats);
}

} // namespace pipeline
} // namespace ledgerpack
