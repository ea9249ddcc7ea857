#pragma once

// Shared folder watcher: polls host folders that groups mount into their
// sessions and wakes every group whose mount covers a changed file.
//
// The first scan of a folder only records a baseline. A folder that is
// missing or unreadable is skipped and re-checked after restart_ms; when it
// comes back a fresh baseline is taken.

#include "clock.h"
#include "executor.h"
#include "host_state.h"
#include "log.h"
#include "session_manager.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace kestrel {

struct SharedChange {
    std::filesystem::path path;   // absolute host path
    std::string event;            // created | modified | deleted
};

struct SharedWatchOptions {
    int64_t poll_ms{2000};
    int64_t restart_ms{5000};
    size_t max_listed{20};        // changes listed per wake prompt
};

// Hidden files, editor backups ("~") and in-progress temporaries (".tmp").
bool is_ignored_shared_name(const std::string& name);

class SharedFolderWatcher {
public:
    // Returns false if the wake was refused (host shutting down).
    using WakeFn = std::function<bool(const std::string& folder, WakeEntry e)>;

    SharedFolderWatcher(std::vector<std::filesystem::path> dirs, HostState& state, Clock& clock,
                        WakeFn wake, SharedWatchOptions opt = {}, EventLog* events = nullptr);
    ~SharedFolderWatcher();

    SharedFolderWatcher(const SharedFolderWatcher&) = delete;
    SharedFolderWatcher& operator=(const SharedFolderWatcher&) = delete;

    // One pass over every folder. Returns the changes seen since the last
    // pass; groups mounting them have been woken.
    std::vector<SharedChange> scan_once();

    void start(Executor* exec = nullptr);
    void stop();

    const std::vector<std::filesystem::path>& dirs() const { return dirs_; }

private:
    struct FileStamp {
        int64_t mtime_ns{0};
        uintmax_t size{0};
        bool operator!=(const FileStamp& o) const { return mtime_ns != o.mtime_ns || size != o.size; }
    };
    using Snapshot = std::map<std::string, FileStamp>;

    struct Watched {
        std::filesystem::path root;
        Snapshot files;
        bool baseline{false};
        bool down{false};
        int64_t retry_at_ms{0};
    };

    bool snapshot(const std::filesystem::path& root, Snapshot* out, std::string* err) const;
    void wake_groups(const std::vector<SharedChange>& changes);
    void arm();

    std::vector<std::filesystem::path> dirs_;
    HostState& state_;
    Clock& clock_;
    WakeFn wake_;
    SharedWatchOptions opt_;
    EventLog* events_;

    std::mutex scan_mu_;
    std::vector<Watched> watched_;

    std::mutex timer_mu_;
    TimerId timer_{0};
    bool running_{false};
    Executor* exec_{nullptr};
};

} // namespace kestrel
