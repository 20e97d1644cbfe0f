/**
 * @file payload_file.hpp
 * @brief Raw payload files on either side of the pipeline.
 *
 * The pipeline works on byte buffers only; these two calls move a payload between
 * disk and a Bytes buffer. Writing goes through a temp file and a rename, so a
 * decoded file appears at its final path only once it is complete.
 */
#pragma once

#include <string>

#include "ledgerpack/base91.hpp"
#include "ledgerpack/status.hpp"

namespace ledgerpack {

/// Read all of @p path. IoError on failure; @p out untouched.
Status read_payload(const std::string& path, Bytes& out, std::string* error = nullptr);

/// Write @p data to @p path atomically. IoError on failure; @p path untouched.
Status write_payload(const std::string& path, const Bytes& data, std::string* error = nullptr);

} // namespace ledgerpack
