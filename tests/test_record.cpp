#include <doctest/doctest.h>
#include "ledgerpack/record.hpp"
#include "ledgerpack/status.hpp"

#include <string>

using namespace ledgerpack;

TEST_CASE("Index width grows with the record count") {
    CHECK(index_width(0) == 2);
    CHECK(index_width(1) == 2);
    CHECK(index_width(36) == 2);
    CHECK(index_width(1296) == 2);
    CHECK(index_width(1297) == 3);
    CHECK(index_width(46656) == 3);
    CHECK(index_width(46657) == 4);
}

TEST_CASE("Index text is zero-padded lowercase base-36") {
    char buf[LP_INDEX_MAX_WIDTH + 1];
    CHECK(index_to_text(0, 2, buf) == 2);
    CHECK(std::string(buf) == "00");
    index_to_text(35, 2, buf);
    CHECK(std::string(buf) == "0z");
    index_to_text(36, 3, buf);
    CHECK(std::string(buf) == "010");
    index_to_text(UINT64_MAX, 2, buf);
    CHECK(std::string(buf) == "3w5e11264sgsf");

    uint64_t v = 0;
    CHECK(index_from_text("0z", 2, v));
    CHECK(v == 35);
    CHECK(index_from_text("3w5e11264sgsf", 13, v));
    CHECK(v == UINT64_MAX);
    CHECK_FALSE(index_from_text("3w5e11264sgsg", 13, v)); // overflow
    CHECK_FALSE(index_from_text("0Z", 2, v));
    CHECK_FALSE(index_from_text("", 0, v));
    CHECK(v == UINT64_MAX);
}

TEST_CASE("Key builders") {
    CHECK(std::string(make_data_key("blob", 5, 2).c_str()) == "blob:05");
    CHECK(std::string(make_data_key("blob", 1296, 3).c_str()) == "blob:100");
    CHECK(std::string(make_manifest_key("blob").c_str()) == "blob#m");
    CHECK(std::string(make_media_key("blob").c_str()) == "blob#t");
    CHECK(data_key_length("blob", 2) == 7);
    CHECK(meta_key_length("blob") == 6);
}

TEST_CASE("Classify keys against a namespace") {
    uint64_t index = 0;
    CHECK(classify(KeyStr("blob:0a"), "blob", &index) == RecordKind::Data);
    CHECK(index == 10);
    CHECK(classify(KeyStr("blob#m"), "blob") == RecordKind::Manifest);
    CHECK(classify(KeyStr("blob#t"), "blob") == RecordKind::MediaType);

    CHECK(classify(KeyStr("other:00"), "blob") == RecordKind::Foreign);
    CHECK(classify(KeyStr("blob2:00"), "blob") == RecordKind::Foreign);
    CHECK(classify(KeyStr("blob"), "blob") == RecordKind::Foreign);

    CHECK(classify(KeyStr("blob:"), "blob") == RecordKind::Invalid);
    CHECK(classify(KeyStr("blob:0A"), "blob") == RecordKind::Invalid);
    CHECK(classify(KeyStr("blob#x"), "blob") == RecordKind::Invalid);
    CHECK(classify(KeyStr("blob#mm"), "blob") == RecordKind::Invalid);
}

TEST_CASE("Namespaces and limits") {
    CHECK(valid_namespace("blob"));
    CHECK(valid_namespace("img_2024.v-1"));
    CHECK_FALSE(valid_namespace(""));
    CHECK_FALSE(valid_namespace("a:b"));
    CHECK_FALSE(valid_namespace("a#b"));
    CHECK_FALSE(valid_namespace("a b"));
    CHECK_FALSE(valid_namespace(std::string(65, 'a')));

    Limits ok;
    CHECK(validate_limits(ok) == Status::Ok);

    Limits bad_key;
    bad_key.max_key_len = 65;
    Fault fault;
    CHECK(validate_limits(bad_key, &fault) == Status::InvalidLimits);
    CHECK(fault.expected == LP_KEY_CAP);
    CHECK(fault.actual == 65);

    Limits bad_value;
    bad_value.max_value_len = 0;
    CHECK(validate_limits(bad_value, &fault) == Status::InvalidLimits);
    CHECK(fault.actual == 0);
}

TEST_CASE("Fault descriptions") {
    Fault f;
    fail(&f, Status::IncompleteData, 5, 3, 1);
    CHECK(describe(f) == "IncompleteData: expected 5 records, found 3");

    fail(&f, Status::ChecksumMismatch, 0xCBF43926u, 0x1u);
    CHECK(describe(f) == "ChecksumMismatch: expected crc32 cbf43926, got 00000001");

    CHECK(std::string(to_string(Status::DuplicateIndex)) == "DuplicateIndex");
    CHECK(fail(nullptr, Status::BadManifest) == Status::BadManifest);
}
