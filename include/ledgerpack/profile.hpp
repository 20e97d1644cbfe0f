/**
 * @file profile.hpp
 * @brief Ledger profile - namespace and size limits for one target ledger.
 *
 * A profile is a small JSON file:
 * @code
 * {
 *   "namespace":     "blob",
 *   "max_key_len":   64,
 *   "max_value_len": 64,
 *   "max_records":   0,
 *   "media_type":    ""
 * }
 * @endcode
 *
 * Default location: `$XDG_CONFIG_HOME/ledgerpack/profile.json`, falling back to
 * `~/.config/ledgerpack/profile.json`. A missing file means defaults. Keys that are
 * absent keep their defaults; keys of the wrong type or out of range make the whole
 * profile `BadProfile`. `LEDGERPACK_NAMESPACE` in the environment overrides the
 * namespace after the file is read.
 */
#pragma once

#include <string>

#include "ledgerpack/pipeline.hpp"
#include "ledgerpack/record.hpp"
#include "ledgerpack/status.hpp"

namespace ledgerpack {

struct Profile {
    std::string key_namespace = LP_DEFAULT_NAMESPACE;
    Limits      limits;
    std::string media_type;

    /// Options for pipeline::encode() built from this profile.
    EncodeOptions encode_options() const;
};

/// `$XDG_CONFIG_HOME/ledgerpack/profile.json` or `~/.config/ledgerpack/profile.json`.
std::string default_profile_path();

/**
 * @brief Load @p path into @p out (which should hold the defaults to start from).
 * @param error Receives a message on failure.
 * @return Ok (also when the file does not exist) or BadProfile, including when the
 *         path cannot be checked at all.
 */
Status load_profile(const std::string& path, Profile& out, std::string* error = nullptr);

/// Apply `LEDGERPACK_NAMESPACE` if set and non-empty.
void apply_environment(Profile& profile);

/// Write @p profile to @p path atomically (temp file + rename). IoError on failure.
Status save_profile(const std::string& path, const Profile& profile, std::string* error = nullptr);

} // namespace ledgerpack

