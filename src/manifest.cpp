#include "ledgerpack/manifest.hpp"

#include <stdio.h>
#include <string.h>

#include "ledgerpack/base91.hpp"
#include "ledgerpack/checksum.hpp"

namespace ledgerpack {

namespace {

static constexpr char FIELD_SEP    = ';';
static constexpr size_t FIELD_COUNT = 5;

static constexpr char PARAM_SEP    = ';';
static constexpr char PARAM_ASSIGN = '=';

// Printable, no space and none of the media type separators.
bool valid_token(const char* text, size_t len, bool allow_slash) {
    if (len == 0) return false;
    for (size_t i = 0; i < len; ++i) {
        const char c = text[i];
        if (c <= ' ' || c > '~') return false;
        if (c == ';' || c == '=' || c == ',') return false;
        if (c == '/' && !allow_slash) return false;
    }
    return true;
}

// Decimal without sign, leading '+', or overflow.
bool parse_u64(const char* text, size_t len, uint64_t& out) {
    if (len == 0 || len > 20) return false;
    uint64_t value = 0;
    for (size_t i = 0; i < len; ++i) {
        const char c = text[i];
        if (c < '0' || c > '9') return false;
        const uint64_t d = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - d) / 10) return false;
        value = value * 10 + d;
    }
    out = value;
    return true;
}

} // namespace

const char* family_tag(EncodingFamily family) {
    switch (family) {
        case EncodingFamily::Base91: return base91::FAMILY_TAG;
    }
    return "";
}

ValStr Manifest::to_value() const {
    char buf[LP_VALUE_CAP + 1];
    const ChecksumStr crc = checksum_to_hex(checksum);
    snprintf(buf, sizeof(buf), "%u;%s;%llu;%s;%llu",
             static_cast<unsigned>(version),
             family_tag(family),
             static_cast<unsigned long long>(size),
             crc.c_str(),
             static_cast<unsigned long long>(count));
    return ValStr(buf);
}

Status Manifest::from_value(const ValStr& value, Manifest& out, Fault* fault) {
    // Split into exactly five fields.
    const char* fields[FIELD_COUNT];
    size_t      lengths[FIELD_COUNT];
    size_t      n     = 0;
    const char* start = value.c_str();
    const char* end   = start + value.size();

    for (const char* p = start; ; ++p) {
        if (p == end || *p == FIELD_SEP) {
            if (n == FIELD_COUNT) return fail(fault, Status::BadManifest, FIELD_COUNT, n + 1);
            fields[n]  = start;
            lengths[n] = static_cast<size_t>(p - start);
            ++n;
            if (p == end) break;
            start = p + 1;
        }
    }
    if (n != FIELD_COUNT) return fail(fault, Status::BadManifest, FIELD_COUNT, n);

    uint64_t version;
    if (!parse_u64(fields[0], lengths[0], version) || version != LP_MANIFEST_VERSION) {
        return fail(fault, Status::BadManifest, LP_MANIFEST_VERSION, 0, 0);
    }
    const char* tag = family_tag(EncodingFamily::Base91);
    if (lengths[1] != strlen(tag) || strncmp(fields[1], tag, lengths[1]) != 0) {
        return fail(fault, Status::BadManifest, 0, 0, 1);
    }

    Manifest m;
    m.version = LP_MANIFEST_VERSION;
    m.family  = EncodingFamily::Base91;
    if (!parse_u64(fields[2], lengths[2], m.size))                   return fail(fault, Status::BadManifest, 0, 0, 2);
    if (!checksum_from_hex(fields[3], lengths[3], m.checksum))       return fail(fault, Status::BadManifest, 0, 0, 3);
    if (!parse_u64(fields[4], lengths[4], m.count))                  return fail(fault, Status::BadManifest, 0, 0, 4);

    out = m;
    return Status::Ok;
}

bool MediaType::set(const char* key, const char* val) {
    if (!key || !val) return false;
    const size_t klen = strlen(key);
    const size_t vlen = strlen(val);
    if (!valid_token(key, klen, false) || !valid_token(val, vlen, true)) return false;
    if (klen > LP_VALUE_CAP || vlen > LP_VALUE_CAP) return false;

    for (auto& p : params) {
        if (p.k == key) { p.v.assign(val, vlen); return true; }
    }
    if (params.full()) return false;
    MediaParam p;
    p.k.assign(key, klen);
    p.v.assign(val, vlen);
    params.push_back(p);
    return true;
}

const ValStr* MediaType::get(const char* key) const {
    for (const auto& p : params) if (p.k == key) return &p.v;
    return nullptr;
}

std::string MediaType::to_string() const {
    std::string out(essence.c_str(), essence.size());
    for (const auto& p : params) {
        out += PARAM_SEP;
        out.append(p.k.c_str(), p.k.size());
        out += PARAM_ASSIGN;
        out.append(p.v.c_str(), p.v.size());
    }
    return out;
}

bool MediaType::parse(const char* text, size_t len, MediaType& out) {
    if (!text || len == 0 || len > LP_VALUE_CAP) return false;

    const char* end = text + len;
    const char* sep = static_cast<const char*>(memchr(text, PARAM_SEP, len));
    const char* essence_end = sep ? sep : end;

    // essence: exactly one '/', both sides non-empty
    const size_t elen  = static_cast<size_t>(essence_end - text);
    const char*  slash = static_cast<const char*>(memchr(text, '/', elen));
    if (!slash || slash == text || slash + 1 == essence_end) return false;
    if (memchr(slash + 1, '/', static_cast<size_t>(essence_end - slash - 1))) return false;
    if (!valid_token(text, elen, true)) return false;

    MediaType m;
    m.essence.assign(text, elen);

    const char* p = essence_end;
    while (p != end) {
        ++p;  // skip ';'
        const char* next = static_cast<const char*>(memchr(p, PARAM_SEP, static_cast<size_t>(end - p)));
        const char* stop = next ? next : end;
        const char* eq   = static_cast<const char*>(memchr(p, PARAM_ASSIGN, static_cast<size_t>(stop - p)));
        if (!eq) return false;
        if (!valid_token(p, static_cast<size_t>(eq - p), false) ||
            !valid_token(eq + 1, static_cast<size_t>(stop - eq - 1), true)) {
            return false;
        }

        const std::string key(p, eq);
        const std::string val(eq + 1, stop);
        if (m.has(key.c_str())) return false;
        if (!m.set(key.c_str(), val.c_str())) return false;
        p = stop;
    }

    out = m;
    return true;
}

bool Manifest::media(MediaType& out) const {
    return MediaType::parse(media_type.c_str(), media_type.size(), out);
}

bool valid_media_type(const std::string& media_type) {
    MediaType m;
    return MediaType::parse(media_type.data(), media_type.size(), m);
}

} // namespace ledgerpack
