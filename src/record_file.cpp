#include "ledgerpack/record_file.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include "nlohmann/json.hpp"

#include "file_io.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ledgerpack {

namespace {

Status bad(std::string* error, const std::string& msg) {
    if (error) *error = msg;
    return Status::BadRecordFile;
}

} // namespace

Status load_record_set(const std::string& path, RecordSet& out, std::string* error) {
    std::error_code ec;
    const bool present = fs::exists(path, ec);
    if (ec || !present) {
        if (error) *error = path + ": " + (ec ? ec.message() : std::string("no such file"));
        return Status::IoError;
    }

    json j;
    std::string msg;
    if (!detail::read_json_file(path, j, msg)) return bad(error, msg);

    if (!j.is_object() || !j.contains("entries") || !j["entries"].is_array()) {
        return bad(error, path + ": expected an object with an \"entries\" array");
    }

    RecordSet set;
    if (j.contains("namespace")) {
        if (!j["namespace"].is_string()) return bad(error, path + ": \"namespace\" must be a string");
        set.key_namespace = j["namespace"].get<std::string>();
    }

    const json& entries = j["entries"];
    set.entries.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        const json& e = entries[i];
        const std::string where = path + ": entry " + std::to_string(i);

        if (!e.is_object() || !e.contains("key") || !e.contains("value") ||
            !e["key"].is_string() || !e["value"].is_string()) {
            return bad(error, where + " needs string \"key\" and \"value\"");
        }
        const std::string key   = e["key"].get<std::string>();
        const std::string value = e["value"].get<std::string>();
        if (key.empty() || key.size() > LP_KEY_CAP) {
            return bad(error, where + " key length " + std::to_string(key.size()) + " outside 1..64");
        }
        if (value.size() > LP_VALUE_CAP) {
            return bad(error, where + " value length " + std::to_string(value.size()) + " over 64");
        }

        Record r;
        r.key.assign(key.data(), key.size());
        r.value.assign(value.data(), value.size());
        set.entries.push_back(r);
    }

    out = std::move(set);
    return Status::Ok;
}

Status save_record_set(const std::string& path, const RecordSet& set, std::string* error) {
    json entries = json::array();
    for (const auto& r : set.entries) {
        json e;
        e["key"]   = std::string(r.key.data(), r.key.size());
        e["value"] = std::string(r.value.data(), r.value.size());
        entries.push_back(e);
    }

    json j;
    j["namespace"] = set.key_namespace;
    j["entries"]   = entries;

    std::string msg;
    if (!detail::atomic_write_json(path, j, msg)) {
        if (error) *error = msg;
        return Status::IoError;
    }
    return Status::Ok;
}

} // namespace ledgerpack
