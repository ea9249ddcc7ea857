#include "kestrel/journal.h"

#include <cerrno>
#include <cstring>
#include <fstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kestrel {

Journal::Journal(std::filesystem::path path) : path_(std::move(path)) {}

Journal::~Journal() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void Journal::set_fsync(bool enable) {
    std::lock_guard<std::mutex> lk(mu_);
    fsync_ = enable;
}

std::string Journal::open_locked() {
    if (fd_ >= 0) return "";
    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return std::string("create_directories: ") + ec.message();
    }
    fd_ = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) return std::string("open: ") + std::strerror(errno);
    return "";
}

// Cuts a partial final line so the next append starts on a fresh line.
std::string Journal::drop_torn_tail_locked() {
    struct stat st{};
    if (::fstat(fd_, &st) != 0) return std::string("fstat: ") + std::strerror(errno);
    off_t end = st.st_size;
    if (end == 0) return "";

    int rfd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (rfd < 0) return std::string("open: ") + std::strerror(errno);
    off_t keep = 0;
    char buf[4096];
    off_t pos = end;
    bool found = false;
    while (pos > 0 && !found) {
        off_t chunk = pos < (off_t)sizeof(buf) ? pos : (off_t)sizeof(buf);
        pos -= chunk;
        ssize_t r = ::pread(rfd, buf, (size_t)chunk, pos);
        if (r < 0) {
            if (errno == EINTR) {
                pos += chunk;
                continue;
            }
            std::string err = std::string("pread: ") + std::strerror(errno);
            ::close(rfd);
            return err;
        }
        for (ssize_t i = r - 1; i >= 0; i--) {
            if (buf[i] == '\n') {
                keep = pos + i + 1;
                found = true;
                break;
            }
        }
    }
    ::close(rfd);
    if (keep == end) return "";
    if (::ftruncate(fd_, keep) != 0) return std::string("ftruncate: ") + std::strerror(errno);
    if (fsync_) (void)::fsync(fd_);
    return "";
}

std::string Journal::open(bool truncate_file) {
    std::lock_guard<std::mutex> lk(mu_);
    std::string err = open_locked();
    if (!err.empty()) return err;
    if (truncate_file) {
        if (::ftruncate(fd_, 0) != 0) err = std::string("ftruncate: ") + std::strerror(errno);
    } else {
        err = drop_torn_tail_locked();
    }
    if (!err.empty()) {
        ::close(fd_);
        fd_ = -1;
    }
    return err;
}

bool Journal::is_open() const {
    std::lock_guard<std::mutex> lk(mu_);
    return fd_ >= 0;
}

std::string Journal::append_json_line(const std::string& json) {
    std::lock_guard<std::mutex> lk(mu_);
    std::string err = open_locked();
    if (!err.empty()) return err;

    std::string line = json;
    if (line.empty() || line.back() != '\n') line.push_back('\n');

    size_t off = 0;
    while (off < line.size()) {
        ssize_t w = ::write(fd_, line.data() + off, line.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            return std::string("write: ") + std::strerror(errno);
        }
        off += (size_t)w;
    }
    if (fsync_ && ::fsync(fd_) != 0) {
        return std::string("fsync: ") + std::strerror(errno);
    }
    return "";
}

std::string Journal::truncate() {
    std::lock_guard<std::mutex> lk(mu_);
    std::string err = open_locked();
    if (!err.empty()) return err;
    if (::ftruncate(fd_, 0) != 0) return std::string("ftruncate: ") + std::strerror(errno);
    if (fsync_) (void)::fsync(fd_);
    return "";
}

long long Journal::size_bytes() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ < 0) {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) return 0;
        return (long long)std::filesystem::file_size(path_, ec);
    }
    struct stat st{};
    if (::fstat(fd_, &st) != 0) return -1;
    return (long long)st.st_size;
}

size_t Journal::replay(const std::function<void(const std::string&)>& fn) const {
    std::ifstream in(path_, std::ios::binary);
    if (!in.good()) return 0;
    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    size_t n = 0;
    size_t start = 0;
    while (start < body.size()) {
        size_t nl = body.find('\n', start);
        if (nl == std::string::npos) break;  // torn tail
        if (nl > start) {
            fn(body.substr(start, nl - start));
            n++;
        }
        start = nl + 1;
    }
    return n;
}

} // namespace kestrel
