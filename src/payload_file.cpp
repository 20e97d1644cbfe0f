#include "ledgerpack/payload_file.hpp"

#include <fstream>
#include <iterator>

#include "file_io.hpp"

namespace ledgerpack {

Status read_payload(const std::string& path, Bytes& out, std::string* error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        if (error) *error = path + ": cannot open for reading";
        return Status::IoError;
    }
    Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        if (error) *error = path + ": read failed";
        return Status::IoError;
    }
    out.swap(data);
    return Status::Ok;
}

Status write_payload(const std::string& path, const Bytes& data, std::string* error) {
    std::string msg;
    if (!detail::atomic_write_file(path, reinterpret_cast<const char*>(data.data()), data.size(), msg)) {
        if (error) *error = msg;
        return Status::IoError;
    }
    return Status::Ok;
}

} // namespace ledgerpack
