#include <doctest/doctest.h>
#include "ledgerpack/base91.hpp"
#include "ledgerpack/pipeline.hpp"
#include "ledgerpack/reassembler.hpp"

#include <algorithm>
#include <cstring>
#include <random>
#include <string>
#include <vector>

using namespace ledgerpack;

static Bytes sample_payload(size_t n) {
    Bytes b;
    uint32_t x = 12345;
    for (size_t i = 0; i < n; ++i) {
        x = x * 1103515245u + 12345u;
        b.push_back(static_cast<uint8_t>(x >> 16));
    }
    return b;
}

static Encoded encode_sample(size_t n, size_t max_value = 16) {
    EncodeOptions opts;
    opts.limits.max_value_len = max_value;
    Encoded enc;
    REQUIRE(pipeline::encode(sample_payload(n), opts, enc) == Status::Ok);
    REQUIRE(enc.records.size() >= 4);
    return enc;
}

// Encoding of @p n bytes whose last record is shorter than the others.
static Encoded encode_ragged(size_t n) {
    const size_t text_len = base91::encode(sample_payload(n)).size();
    size_t max_value = 9;
    while (text_len % max_value == 0) ++max_value;
    const Encoded enc = encode_sample(n, max_value);
    REQUIRE(enc.records.back().value.size() < max_value);
    return enc;
}

TEST_CASE("Reassembler: order of records does not matter") {
    const Encoded enc = encode_sample(200);
    std::vector<Record> shuffled(enc.records.rbegin(), enc.records.rend());
    std::rotate(shuffled.begin(), shuffled.begin() + 2, shuffled.end());

    Bytes out;
    REQUIRE(reassembler::decode_and_verify(shuffled, enc.manifest, "blob", out) == Status::Ok);
    CHECK(out == sample_payload(200));
}

TEST_CASE("Reassembler: missing record is IncompleteData") {
    const Encoded enc = encode_sample(200);
    std::vector<Record> records = enc.records;
    records.erase(records.begin() + 2);

    Bytes out{0xAA};
    Fault fault;
    CHECK(reassembler::decode_and_verify(records, enc.manifest, "blob", out, &fault) == Status::IncompleteData);
    CHECK(fault.expected == enc.manifest.count);
    CHECK(fault.actual == enc.manifest.count - 1);
    CHECK(fault.index == 2);
    CHECK(out == Bytes{0xAA});
}

TEST_CASE("Reassembler: record past the end is IncompleteData") {
    const Encoded enc = encode_sample(200);
    std::vector<Record> records = enc.records;
    const uint64_t n = records.size();

    Record extra = records.back();
    extra.key = make_data_key("blob", n, index_width(n));
    records.pop_back();
    records.push_back(extra);

    Fault fault;
    std::string text;
    CHECK(reassembler::reassemble(records, enc.manifest, "blob", text, &fault) == Status::IncompleteData);
    CHECK(fault.index == n - 1);
    CHECK(fault.actual == n);
}

TEST_CASE("Reassembler: duplicates") {
    const Encoded enc = encode_sample(200);
    Bytes out;

    SUBCASE("identical copies collapse") {
        std::vector<Record> records = enc.records;
        records.push_back(enc.records[1]);
        records.push_back(enc.records[1]);
        REQUIRE(reassembler::decode_and_verify(records, enc.manifest, "blob", out) == Status::Ok);
        CHECK(out == sample_payload(200));
    }

    SUBCASE("conflicting copies are refused") {
        std::vector<Record> records = enc.records;
        Record bad = enc.records[1];
        bad.value[0] = bad.value[0] == 'A' ? 'B' : 'A';
        records.push_back(bad);

        Fault fault;
        CHECK(reassembler::decode_and_verify(records, enc.manifest, "blob", out, &fault) == Status::DuplicateIndex);
        CHECK(fault.index == 1);
    }
}

TEST_CASE("Reassembler: other namespaces and meta records are ignored") {
    const Encoded enc = encode_sample(200);
    std::vector<Record> records = enc.records;

    Record foreign;
    foreign.key   = "other:00";
    foreign.value = "zzzz";
    records.insert(records.begin(), foreign);

    Record lookalike;
    lookalike.key   = "blob2:01";
    lookalike.value = "zzzz";
    records.push_back(lookalike);

    Record manifest;
    manifest.key   = make_manifest_key("blob");
    manifest.value = enc.manifest.to_value();
    records.push_back(manifest);

    Bytes out;
    REQUIRE(reassembler::decode_and_verify(records, enc.manifest, "blob", out) == Status::Ok);
    CHECK(out == sample_payload(200));
}

TEST_CASE("Reassembler: corruption never goes unnoticed") {
    const Encoded enc = encode_sample(200);
    Bytes out;

    SUBCASE("symbol outside the alphabet") {
        std::vector<Record> records = enc.records;
        records[0].value[3] = '-';
        Fault fault;
        CHECK(reassembler::decode_and_verify(records, enc.manifest, "blob", out, &fault) == Status::MalformedEncoding);
        CHECK(fault.index == 3);
    }

    SUBCASE("swapped alphabet symbol") {
        std::vector<Record> records = enc.records;
        records[1].value[5] = records[1].value[5] == 'q' ? 'r' : 'q';
        const Status st = reassembler::decode_and_verify(records, enc.manifest, "blob", out);
        CHECK((st == Status::ChecksumMismatch || st == Status::MalformedEncoding));
    }

    SUBCASE("manifest checksum disagrees") {
        Manifest m = enc.manifest;
        m.checksum ^= 1u;
        Fault fault;
        CHECK(reassembler::decode_and_verify(enc.records, m, "blob", out, &fault) == Status::ChecksumMismatch);
        CHECK(fault.expected == m.checksum);
        CHECK(fault.actual == enc.manifest.checksum);
    }

    SUBCASE("manifest size disagrees") {
        Manifest m = enc.manifest;
        m.size += 1;
        CHECK(reassembler::decode_and_verify(enc.records, m, "blob", out) == Status::ChecksumMismatch);
    }

    CHECK(out.empty());
}

TEST_CASE("Reassembler: zero records for the empty payload") {
    Manifest m;
    Bytes out{1, 2, 3};
    REQUIRE(reassembler::decode_and_verify({}, m, "blob", out) == Status::Ok);
    CHECK(out.empty());

    m.count = 1;
    CHECK(reassembler::decode_and_verify({}, m, "blob", out) == Status::IncompleteData);
}

TEST_CASE("Reassembler: any shuffle decodes") {
    const Encoded enc = encode_ragged(300);
    for (uint32_t seed = 1; seed <= 8; ++seed) {
        std::vector<Record> records = enc.records;
        std::mt19937 rng(seed);
        std::shuffle(records.begin(), records.end(), rng);

        Bytes out;
        REQUIRE(reassembler::decode_and_verify(records, enc.manifest, "blob", out) == Status::Ok);
        CHECK(out == sample_payload(300));
    }
}

TEST_CASE("Reassembler: dropping any single record is IncompleteData") {
    const Encoded enc = encode_ragged(120);
    const uint64_t n = enc.records.size();
    for (uint64_t i = 0; i < n; ++i) {
        CAPTURE(i);
        std::vector<Record> records = enc.records;
        records.erase(records.begin() + static_cast<std::ptrdiff_t>(i));

        Bytes out{0xAA};
        Fault fault;
        CHECK(reassembler::decode_and_verify(records, enc.manifest, "blob", out, &fault) == Status::IncompleteData);
        CHECK(fault.expected == n);
        CHECK(fault.actual == n - 1);
        CHECK(fault.index == i);
        CHECK(out == Bytes{0xAA});
    }
}

TEST_CASE("Reassembler: a corrupted symbol anywhere is caught") {
    const Encoded enc = encode_ragged(60);
    const size_t stride = enc.records.front().value.size();

    for (size_t r = 0; r < enc.records.size(); ++r) {
        for (size_t pos = 0; pos < enc.records[r].value.size(); ++pos) {
            CAPTURE(r);
            CAPTURE(pos);
            const char original = enc.records[r].value[pos];
            const char* hit     = std::strchr(base91::ALPHABET, original);
            REQUIRE(hit != nullptr);
            const size_t sym = static_cast<size_t>(hit - base91::ALPHABET);

            std::vector<Record> records = enc.records;
            records[r].value[pos] = base91::ALPHABET[(sym + 1) % base91::RADIX];
            Bytes out{0xAA};
            const Status st = reassembler::decode_and_verify(records, enc.manifest, "blob", out);
            CHECK((st == Status::ChecksumMismatch || st == Status::MalformedEncoding));
            CHECK(out == Bytes{0xAA});

            records[r].value[pos] = '-';
            Fault fault;
            CHECK(reassembler::decode_and_verify(records, enc.manifest, "blob", out, &fault) == Status::MalformedEncoding);
            CHECK(fault.index == r * stride + pos);
            CHECK(out == Bytes{0xAA});
        }
    }
}
