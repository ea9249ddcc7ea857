#include "kestrel/fsutil.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>
#if defined(__linux__)
  #include <sys/random.h>
#endif

namespace kestrel {

std::string write_atomic(const std::filesystem::path& dst, const std::string& body, bool fsync) {
    std::error_code ec;
    if (dst.has_parent_path()) {
        std::filesystem::create_directories(dst.parent_path(), ec);
        if (ec) return "create_directories: " + ec.message();
    }
    auto tmp = dst;
    tmp += ".tmp";

    int fd = ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return std::string("open: ") + std::strerror(errno);
    size_t off = 0;
    while (off < body.size()) {
        ssize_t w = ::write(fd, body.data() + off, body.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            std::string err = std::string("write: ") + std::strerror(errno);
            ::close(fd);
            std::filesystem::remove(tmp, ec);
            return err;
        }
        off += (size_t)w;
    }
    if (fsync && ::fsync(fd) != 0) {
        std::string err = std::string("fsync: ") + std::strerror(errno);
        ::close(fd);
        std::filesystem::remove(tmp, ec);
        return err;
    }
    ::close(fd);

    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove(tmp, ec2);
        return "rename: " + ec.message();
    }
    if (fsync && dst.has_parent_path()) {
        int dir_fd = ::open(dst.parent_path().c_str(), O_RDONLY | O_DIRECTORY);
        if (dir_fd >= 0) { (void)::fsync(dir_fd); ::close(dir_fd); }
    }
    return "";
}

std::optional<std::string> slurp_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) return std::nullopt;
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

std::vector<std::filesystem::path> list_dir_json(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> v;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) return v;
    for (auto& e : std::filesystem::directory_iterator(dir, ec)) {
        if (ec) break;
        if (!e.is_regular_file(ec)) continue;
        auto p = e.path();
        auto name = p.filename().string();
        if (name.empty() || name[0] == '.') continue;
        if (p.extension() != ".json") continue;
        v.push_back(p);
    }
    std::sort(v.begin(), v.end(), [](const std::filesystem::path& a, const std::filesystem::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return v;
}

int64_t file_age_ms(const std::filesystem::path& p) {
    std::error_code ec;
    auto ft = std::filesystem::last_write_time(p, ec);
    if (ec) return -1;
    auto age = std::filesystem::file_time_type::clock::now() - ft;
    return std::chrono::duration_cast<std::chrono::milliseconds>(age).count();
}

std::filesystem::path expand_home(const std::string& p) {
    if (p.empty() || p[0] != '~') return p;
    if (p.size() > 1 && p[1] != '/') return p;
    const char* home = std::getenv("HOME");
    std::string h = home ? home : "/";
    if (p.size() <= 2) return h;
    return std::filesystem::path(h) / p.substr(2);
}

uint32_t secure_rand32() {
    uint32_t r = 0;
#if defined(__linux__)
    if (getrandom(&r, sizeof(r), 0) == (ssize_t)sizeof(r)) return r;
#endif
    if (FILE* f = std::fopen("/dev/urandom", "rb")) {
        size_t n = std::fread(&r, 1, sizeof(r), f);
        std::fclose(f);
        if (n == sizeof(r)) return r;
    }
    auto t = std::chrono::steady_clock::now().time_since_epoch().count();
    return (uint32_t)(t ^ (t >> 32));
}

std::string unique_stem(int64_t now_ms) {
    std::ostringstream oss;
    oss << std::setw(13) << std::setfill('0') << now_ms << "-"
        << std::hex << std::setw(8) << std::setfill('0') << secure_rand32();
    return oss.str();
}

} // namespace kestrel
