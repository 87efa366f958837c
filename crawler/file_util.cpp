#include "file_util.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <sys/stat.h>
#include <sys/types.h>

#include <zlib.h>

namespace prefixcrawl {

static bool ends_with_gz(const std::string& path) {
    return path.size() >= 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

bool file_exists(const std::string& path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

void mkdirs_for_path(const std::string& path) {
    // Every '/' after the first character ends one ancestor directory.
    for (size_t i = 1; i < path.size(); i++) {
        if (path[i] != '/') continue;
        const std::string dir = path.substr(0, i);
        if (::mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) return;
    }
}

static std::string read_gzip_file(const std::string& path, std::string& out) {
    gzFile gz = ::gzopen(path.c_str(), "rb");
    if (!gz) return "could not open " + path + " for reading";

    std::vector<char> buf(64 * 1024);
    while (true) {
        int n = ::gzread(gz, buf.data(), static_cast<unsigned>(buf.size()));
        if (n < 0) {
            int zerr = Z_OK;
            std::string msg = ::gzerror(gz, &zerr);
            ::gzclose(gz);
            return "gzip read failed for " + path + ": " + msg;
        }
        if (n == 0) break;
        out.append(buf.data(), static_cast<size_t>(n));
    }
    ::gzclose(gz);
    return "";
}

std::string read_text_file(const std::string& path, std::string& out) {
    out.clear();
    if (ends_with_gz(path)) return read_gzip_file(path, out);

    std::ifstream in(path, std::ios::binary);
    if (!in) return "could not open " + path + " for reading";
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return "could not read " + path;
    out = ss.str();
    return "";
}

static std::string write_gzip_file(const std::string& path, const std::string& text) {
    gzFile gz = ::gzopen(path.c_str(), "wb6");
    if (!gz) return "could not open " + path + " for writing";

    size_t off = 0;
    while (off < text.size()) {
        const size_t chunk = std::min<size_t>(text.size() - off, 1 << 20);
        int n = ::gzwrite(gz, text.data() + off, static_cast<unsigned>(chunk));
        if (n <= 0) {
            int zerr = Z_OK;
            std::string msg = ::gzerror(gz, &zerr);
            ::gzclose(gz);
            return "gzip write failed for " + path + ": " + msg;
        }
        off += static_cast<size_t>(n);
    }
    if (::gzclose(gz) != Z_OK) return "gzip close failed for " + path;
    return "";
}

static std::string write_plain_file(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return "could not open " + path + " for writing";
    if (!text.empty()) {
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        if (!out) return "failed while writing " + path;
    }
    out.flush();
    if (!out) return "failed while flushing " + path;
    return "";
}

std::string write_text_file_atomic(const std::string& path, const std::string& text) {
    mkdirs_for_path(path);
    const std::string tmp = path + ".tmp";

    auto err = ends_with_gz(path) ? write_gzip_file(tmp, text) : write_plain_file(tmp, text);
    if (!err.empty()) {
        (void)std::remove(tmp.c_str());
        return err;
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::string msg = std::string("rename() failed: ") + std::strerror(errno);
        (void)std::remove(tmp.c_str());
        return msg;
    }
    return "";
}

}  // namespace prefixcrawl
