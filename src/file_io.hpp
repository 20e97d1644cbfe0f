// Internal file helpers shared by profile.cpp, record_file.cpp and payload_file.cpp.
#pragma once

#include <stddef.h>
#include <string>

#include "nlohmann/json.hpp"

namespace ledgerpack {
namespace detail {

/// Parse @p path into @p out. On failure @p error names the file and the reason.
bool read_json_file(const std::string& path, nlohmann::json& out, std::string& error);

/**
 * @brief Write @p n bytes to a temp file beside @p path, then rename over it.
 *
 * Parent directories are created. On failure the temp file is removed and @p path
 * keeps whatever it held before.
 */
bool atomic_write_file(const std::string& path, const char* data, size_t n, std::string& error);

/// atomic_write_file() of @p j, indented, with a trailing newline.
bool atomic_write_json(const std::string& path, const nlohmann::json& j, std::string& error);

} // namespace detail
} // namespace ledgerpack
