#include "file_io.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>

#include "errors.hpp"
#include "log.hpp"

namespace fs = std::filesystem;

namespace pdfmask {

Bytes read_file(const std::string &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw IoError("cannot open " + path);
    Bytes data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) throw IoError("read failed: " + path);
    return data;
}

void write_file(const std::string &path, const Bytes &data) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw IoError("cannot open " + path + " for writing");
    f.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    f.close();
    if (!f) throw IoError("write failed: " + path);
}

TempDir::TempDir(const std::string &prefix) {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    for (int attempt = 0; attempt < 8; ++attempt) {
        std::ostringstream name;
        name << prefix << std::hex << gen();
        fs::path p = fs::temp_directory_path() / name.str();
        std::error_code ec;
        if (fs::create_directory(p, ec)) {
            path_ = p.string();
            return;
        }
    }
    throw IoError("cannot create temp directory for " + prefix);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) log_warn("io", LogLine("temp directory not removed").kv("path", path_).kv("error", ec.message()).str());
}

std::string TempDir::file(const std::string &name) const { return (fs::path(path_) / name).string(); }

} // namespace pdfmask
