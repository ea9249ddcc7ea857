#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>

namespace kestrel {

// Journal: append-only JSONL log.
//
// Each append writes a single line: <json>\n
// A torn final line (crash mid-write) is skipped on replay and cut off
// by open(false), so later appends never fuse with it.
//
// Thread-safe, with optional fsync per append.
class Journal {
public:
    explicit Journal(std::filesystem::path path);
    ~Journal();

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    void set_fsync(bool enable);

    // Opens the file (creates parent dirs if needed).
    // If truncate=true, truncates the existing file to empty; otherwise
    // drops a torn final line.
    // Returns empty string on success.
    std::string open(bool truncate = false);

    bool is_open() const;

    // Appends one JSON record line. Returns empty string on success.
    std::string append_json_line(const std::string& json);

    // Truncates the file to empty (keeps it open).
    std::string truncate();

    long long size_bytes() const;

    // Calls fn for every complete line in order. Returns lines visited.
    size_t replay(const std::function<void(const std::string&)>& fn) const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::string open_locked();
    std::string drop_torn_tail_locked();

    std::filesystem::path path_;
    int fd_ = -1;
    bool fsync_ = false;
    mutable std::mutex mu_;
};

} // namespace kestrel
