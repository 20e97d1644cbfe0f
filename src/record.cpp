// -----------------------------------------------------------------------------
// @file record.cpp
// @brief Key scheme helpers: limits, namespace rules, base-36 index text.
// -----------------------------------------------------------------------------
#include "ledgerpack/record.hpp"

#include <string.h>

namespace ledgerpack {

namespace {

const char DIGITS36[] = "0123456789abcdefghijklmnopqrstuvwxyz";

bool digit36_to_val(char c, uint8_t& out) {
    if (c >= '0' && c <= '9') { out = static_cast<uint8_t>(c - '0');      return true; }
    if (c >= 'a' && c <= 'z') { out = static_cast<uint8_t>(c - 'a' + 10); return true; }
    return false;
}

bool namespace_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '.' || c == '-';
}

KeyStr make_meta_key(const std::string& ns, char tag) {
    KeyStr key(ns.c_str());
    key += LP_META_SEP;
    key += tag;
    return key;
}

} // namespace

Status validate_limits(const Limits& limits, Fault* fault) {
    if (limits.max_key_len == 0 || limits.max_key_len > LP_KEY_CAP) {
        return fail(fault, Status::InvalidLimits, LP_KEY_CAP, limits.max_key_len);
    }
    if (limits.max_value_len == 0 || limits.max_value_len > LP_VALUE_CAP) {
        return fail(fault, Status::InvalidLimits, LP_VALUE_CAP, limits.max_value_len);
    }
    return Status::Ok;
}

bool valid_namespace(const std::string& ns) {
    if (ns.empty() || ns.size() > LP_KEY_CAP) return false;
    for (char c : ns) {
        if (!namespace_char(c)) return false;
    }
    return true;
}

size_t index_width(uint64_t count) {
    size_t   width = 1;
    uint64_t last  = count > 0 ? count - 1 : 0;
    while (last >= 36) {
        last /= 36;
        ++width;
    }
    return width < LP_INDEX_MIN_WIDTH ? LP_INDEX_MIN_WIDTH : width;
}

size_t index_to_text(uint64_t index, size_t width, char* out) {
    char   rev[LP_INDEX_MAX_WIDTH];
    size_t n = 0;
    do {
        rev[n++] = DIGITS36[index % 36];
        index /= 36;
    } while (index > 0);

    if (width > LP_INDEX_MAX_WIDTH) width = LP_INDEX_MAX_WIDTH;

    size_t len = 0;
    for (size_t pad = n; pad < width; ++pad) out[len++] = '0';
    while (n > 0) out[len++] = rev[--n];
    out[len] = '\0';
    return len;
}

bool index_from_text(const char* text, size_t len, uint64_t& out) {
    if (!text || len == 0 || len > LP_INDEX_MAX_WIDTH) return false;

    uint64_t value = 0;
    for (size_t i = 0; i < len; ++i) {
        uint8_t d;
        if (!digit36_to_val(text[i], d)) return false;
        // 13 digits can exceed 64 bits; refuse rather than wrap.
        if (value > (UINT64_MAX - d) / 36) return false;
        value = value * 36 + d;
    }
    out = value;
    return true;
}

KeyStr make_data_key(const std::string& ns, uint64_t index, size_t width) {
    char digits[LP_INDEX_MAX_WIDTH + 1];
    index_to_text(index, width, digits);

    KeyStr key(ns.c_str());
    key += LP_DATA_SEP;
    key.append(digits);
    return key;
}

KeyStr make_manifest_key(const std::string& ns) { return make_meta_key(ns, LP_MANIFEST_TAG); }

KeyStr make_media_key(const std::string& ns) { return make_meta_key(ns, LP_MEDIA_TAG); }

RecordKind classify(const KeyStr& key, const std::string& ns, uint64_t* index) {
    const size_t n = ns.size();
    if (key.size() <= n || strncmp(key.c_str(), ns.c_str(), n) != 0) {
        return RecordKind::Foreign;
    }

    const char  sep  = key[n];
    const char* rest = key.c_str() + n + 1;
    const size_t len = key.size() - n - 1;

    if (sep == LP_DATA_SEP) {
        uint64_t parsed;
        if (!index_from_text(rest, len, parsed)) return RecordKind::Invalid;
        if (index) *index = parsed;
        return RecordKind::Data;
    }
    if (sep == LP_META_SEP) {
        if (len == 1 && rest[0] == LP_MANIFEST_TAG) return RecordKind::Manifest;
        if (len == 1 && rest[0] == LP_MEDIA_TAG)    return RecordKind::MediaType;
        return RecordKind::Invalid;
    }

    // "blob2:00" is not in namespace "blob".
    return RecordKind::Foreign;
}

} // namespace ledgerpack
