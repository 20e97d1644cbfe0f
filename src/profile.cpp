// -----------------------------------------------------------------------------
// @file profile.cpp
// @brief JSON ledger profile: XDG location, validation, atomic save.
// -----------------------------------------------------------------------------
#include "ledgerpack/profile.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

#include "nlohmann/json.hpp"

#include "ledgerpack/manifest.hpp"
#include "file_io.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ledgerpack {

namespace {

bool read_size(const json& j, const char* key, uint64_t lo, uint64_t hi, uint64_t& out, std::string& error) {
    if (!j.contains(key)) return true;
    const json& v = j[key];
    if (!v.is_number_unsigned()) {
        error = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    const uint64_t n = v.get<uint64_t>();
    if (n < lo || n > hi) {
        error = std::string("'") + key + "' out of range " + std::to_string(lo) + ".." + std::to_string(hi);
        return false;
    }
    out = n;
    return true;
}

bool read_string(const json& j, const char* key, std::string& out, std::string& error) {
    if (!j.contains(key)) return true;
    const json& v = j[key];
    if (!v.is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = v.get<std::string>();
    return true;
}

Status bad(std::string* error, const std::string& msg) {
    if (error) *error = msg;
    return Status::BadProfile;
}

} // namespace

EncodeOptions Profile::encode_options() const {
    EncodeOptions o;
    o.limits        = limits;
    o.key_namespace = key_namespace;
    o.media_type    = media_type;
    return o;
}

std::string default_profile_path() {
    const char* xdg  = std::getenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    fs::path base = (xdg && *xdg) ? fs::path(xdg)
                                  : fs::path(home ? home : ".") / ".config";
    return (base / "ledgerpack" / "profile.json").string();
}

Status load_profile(const std::string& path, Profile& out, std::string* error) {
    std::error_code ec;
    const bool present = fs::exists(path, ec);
    if (ec) return bad(error, path + ": " + ec.message());
    if (!present) return Status::Ok;

    json j;
    std::string msg;
    if (!detail::read_json_file(path, j, msg)) return bad(error, msg);
    if (!j.is_object()) return bad(error, path + ": profile must be a JSON object");

    Profile p = out;
    uint64_t key_len   = p.limits.max_key_len;
    uint64_t value_len = p.limits.max_value_len;
    uint64_t records   = p.limits.max_records;

    if (!read_string(j, "namespace", p.key_namespace, msg) ||
        !read_size(j, "max_key_len", 1, LP_KEY_CAP, key_len, msg) ||
        !read_size(j, "max_value_len", 1, LP_VALUE_CAP, value_len, msg) ||
        !read_size(j, "max_records", 0, UINT64_MAX, records, msg) ||
        !read_string(j, "media_type", p.media_type, msg)) {
        return bad(error, path + ": " + msg);
    }
    if (!valid_namespace(p.key_namespace)) {
        return bad(error, path + ": invalid namespace '" + p.key_namespace + "'");
    }
    if (!p.media_type.empty() && !valid_media_type(p.media_type)) {
        return bad(error, path + ": invalid media type '" + p.media_type + "'");
    }

    p.limits.max_key_len   = static_cast<size_t>(key_len);
    p.limits.max_value_len = static_cast<size_t>(value_len);
    p.limits.max_records   = records;
    out = p;
    return Status::Ok;
}

void apply_environment(Profile& profile) {
    const char* ns = std::getenv("LEDGERPACK_NAMESPACE");
    if (ns && *ns) profile.key_namespace = ns;
}

Status save_profile(const std::string& path, const Profile& profile, std::string* error) {
    json j;
    j["namespace"]     = profile.key_namespace;
    j["max_key_len"]   = profile.limits.max_key_len;
    j["max_value_len"] = profile.limits.max_value_len;
    j["max_records"]   = profile.limits.max_records;
    j["media_type"]    = profile.media_type;

    std::string msg;
    if (!detail::atomic_write_json(path, j, msg)) {
        if (error) *error = msg;
        return Status::IoError;
    }
    return Status::Ok;
}

} // namespace ledgerpack
