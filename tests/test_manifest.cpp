#include <doctest/doctest.h>
#include "ledgerpack/manifest.hpp"

#include <string>

using namespace ledgerpack;

static Status parse(const char* text, Manifest& out, Fault* fault = nullptr) {
    return Manifest::from_value(ValStr(text), out, fault);
}

TEST_CASE("Manifest value layout") {
    Manifest m;
    m.size     = 100;
    m.checksum = 0x1c291ca3u;
    m.count    = 2;
    CHECK(std::string(m.to_value().c_str()) == "1;b91;100;1c291ca3;2");

    Manifest empty;
    CHECK(std::string(empty.to_value().c_str()) == "1;b91;0;00000000;0");

    Manifest huge;
    huge.size  = UINT64_MAX;
    huge.count = UINT64_MAX;
    CHECK(huge.to_value().size() == 56);

    Manifest back;
    REQUIRE(Manifest::from_value(huge.to_value(), back) == Status::Ok);
    CHECK(back == huge);
}

TEST_CASE("Manifest parsing") {
    Manifest m;
    m.media_type = "image/png";
    REQUIRE(parse("1;b91;100;1C291CA3;2", m) == Status::Ok);
    CHECK(m.size == 100);
    CHECK(m.checksum == 0x1c291ca3u);
    CHECK(m.count == 2);
    CHECK(m.media_type.empty());
    CHECK(m.family == EncodingFamily::Base91);
}

TEST_CASE("Manifest parsing rejects malformed values") {
    Manifest m;
    m.size = 42;
    Fault fault;

    CHECK(parse("2;b91;100;1c291ca3;2", m, &fault) == Status::BadManifest);
    CHECK(parse("1;b64;100;1c291ca3;2", m, &fault) == Status::BadManifest);
    CHECK(fault.index == 1);
    CHECK(parse("1;b91;-1;1c291ca3;2", m, &fault) == Status::BadManifest);
    CHECK(fault.index == 2);
    CHECK(parse("1;b91;100;1c291ca;2", m, &fault) == Status::BadManifest);
    CHECK(fault.index == 3);
    CHECK(parse("1;b91;100;1c291ca3;", m, &fault) == Status::BadManifest);
    CHECK(fault.index == 4);
    CHECK(parse("1;b91;100;1c291ca3", m) == Status::BadManifest);
    CHECK(parse("1;b91;100;1c291ca3;2;x", m) == Status::BadManifest);
    CHECK(parse("1;b91;99999999999999999999;1c291ca3;2", m) == Status::BadManifest);
    CHECK(parse("", m) == Status::BadManifest);

    CHECK(m.size == 42); // untouched
}

TEST_CASE("Media type rules") {
    CHECK(valid_media_type("image/png"));
    CHECK(valid_media_type("application/vnd.ms-excel"));
    CHECK_FALSE(valid_media_type(""));
    CHECK_FALSE(valid_media_type("text/plain; charset=utf-8"));
    CHECK(valid_media_type("text/plain;charset=utf-8"));
    CHECK_FALSE(valid_media_type(std::string(65, 'a')));
    CHECK(std::string(family_tag(EncodingFamily::Base91)) == "b91");
}

static bool parse_media(const std::string& text, MediaType& out) {
    return MediaType::parse(text.data(), text.size(), out);
}

TEST_CASE("Media type parameters") {
    MediaType mt;
    REQUIRE(parse_media("image/png;n=picture;c=1c291ca3", mt));
    CHECK(std::string(mt.essence.c_str()) == "image/png");
    REQUIRE(mt.params.size() == 2);
    CHECK(std::string(mt.params[0].k.c_str()) == "n");
    CHECK(std::string(mt.get("n")->c_str()) == "picture");
    CHECK(std::string(mt.get("c")->c_str()) == "1c291ca3");
    CHECK(mt.has("c"));
    CHECK_FALSE(mt.has("s"));
    CHECK(mt.get("s") == nullptr);
    CHECK(mt.to_string() == "image/png;n=picture;c=1c291ca3");

    SUBCASE("set replaces in place") {
        REQUIRE(mt.set("n", "logo"));
        REQUIRE(mt.set("s", "512"));
        CHECK(mt.params.size() == 3);
        CHECK(mt.to_string() == "image/png;n=logo;c=1c291ca3;s=512");
        CHECK_FALSE(mt.set("bad key", "x"));
        CHECK_FALSE(mt.set("k", ""));
        CHECK_FALSE(mt.set("a/b", "x"));
        CHECK(mt.params.size() == 3);
    }

    SUBCASE("no parameters") {
        MediaType plain;
        REQUIRE(parse_media("text/plain", plain));
        CHECK(plain.params.empty());
        CHECK(plain.to_string() == "text/plain");
    }
}

TEST_CASE("Media type parsing rejects malformed text") {
    const char* bad[] = {
        "",
        "image",
        "/png",
        "image/",
        "a/b/c",
        "image/png;",
        "image/png;n",
        "image/png;=x",
        "image/png;n=",
        "image/png;n=a=b",
        "image/png;n=a;n=b",
        "image/png,text/plain",
        "image/png; n=x",
    };
    for (const char* text : bad) {
        CAPTURE(text);
        MediaType mt;
        mt.essence = "keep/me";
        CHECK_FALSE(parse_media(text, mt));
        CHECK(std::string(mt.essence.c_str()) == "keep/me");
        CHECK(mt.params.empty());
    }

    MediaType mt;
    CHECK_FALSE(parse_media("image/png;n=" + std::string(60, 'x'), mt));
}

TEST_CASE("Media type parameter capacity") {
    MediaType mt;
    mt.essence = "a/b";
    for (size_t i = 0; i < LP_MEDIA_PARAMS_MAX; ++i) {
        CHECK(mt.set(("k" + std::to_string(i)).c_str(), "v"));
    }
    CHECK_FALSE(mt.set("extra", "v"));
    CHECK(mt.set("k0", "w"));
    CHECK(mt.params.size() == LP_MEDIA_PARAMS_MAX);
}
