#include "file_io.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace ledgerpack {
namespace detail {

bool read_json_file(const std::string& path, nlohmann::json& out, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = path + ": cannot open for reading";
        return false;
    }
    try {
        nlohmann::json j;
        in >> j;
        out = std::move(j);
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = path + ": " + e.what();
        return false;
    }
}

bool atomic_write_file(const std::string& path, const char* data, size_t n, std::string& error) {
    const fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            error = p.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    fs::path tmp = p;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = tmp.string() + ": cannot open for writing";
            return false;
        }
        out.write(data, static_cast<std::streamsize>(n));
        out.flush();
        if (!out) {
            error = tmp.string() + ": write failed";
            out.close();
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, p, ec);
    if (ec) {
        error = path + ": " + ec.message();
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

bool atomic_write_json(const std::string& path, const nlohmann::json& j, std::string& error) {
    const std::string text = j.dump(2) + "\n";
    return atomic_write_file(path, text.data(), text.size(), error);
}

} // namespace detail
} // namespace ledgerpack
