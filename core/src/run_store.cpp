#include "kyotee/run_store.h"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace kyotee {

namespace fs = std::filesystem;

static std::string timestamp_id() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm);
    return buf;
}

bool RunStore::create(const std::string& runs_base, const std::string& pinned_id,
                      RunStore* out, std::string* err) {
    std::error_code ec;
    fs::create_directories(runs_base, ec);
    if (ec) {
        if (err) *err = "cannot create " + runs_base + ": " + ec.message();
        return false;
    }

    const std::string base_id = pinned_id.empty() ? timestamp_id() : pinned_id;
    for (int n = 1; n < 1000; n++) {
        std::string id = (n == 1) ? base_id : base_id + "-" + std::to_string(n);
        fs::path dir = fs::path(runs_base) / id;
        // create_directory returns false when it already exists
        if (fs::create_directory(dir, ec)) {
            out->dir_ = fs::absolute(dir).lexically_normal().string();
            out->id_ = id;
            return true;
        }
        if (ec) {
            if (err) *err = "cannot create " + dir.string() + ": " + ec.message();
            return false;
        }
    }
    if (err) *err = "too many runs named " + base_id + " in " + runs_base;
    return false;
}

std::string RunStore::iter_rel(const std::string& phase_id, int iteration) {
    return phase_id + "/iter_" + std::to_string(iteration);
}

std::string RunStore::abs(const std::string& rel) const {
    return (fs::path(dir_) / rel).string();
}

bool RunStore::write_new(const std::string& rel, const std::string& content, std::string* err) const {
    const fs::path p = fs::path(dir_) / rel;
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
        if (err) *err = "cannot create " + p.parent_path().string() + ": " + ec.message();
        return false;
    }

    int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (err) *err = "cannot create " + p.string() + ": " + std::strerror(errno);
        return false;
    }
    size_t off = 0;
    while (off < content.size()) {
        ssize_t w = ::write(fd, content.data() + off, content.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (err) *err = "write failed for " + p.string() + ": " + std::strerror(errno);
            ::close(fd);
            return false;
        }
        off += (size_t)w;
    }
    if (::close(fd) != 0) {
        if (err) *err = "close failed for " + p.string() + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

bool RunStore::copy_in(const std::string& src, const std::string& rel, std::string* err) const {
    std::ifstream f(src, std::ios::binary);
    if (!f) {
        if (err) *err = "cannot read " + src;
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return write_new(rel, ss.str(), err);
}

} // namespace kyotee
