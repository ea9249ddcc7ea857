#include "kestrel/shared_watch.h"
#include "kestrel/fsutil.h"
#include "kestrel/json_util.h"
#include "kestrel/mount_security.h"

#include <chrono>

namespace kestrel {

namespace fs = std::filesystem;

bool is_ignored_shared_name(const std::string& name) {
    if (name.empty() || name[0] == '.') return true;
    if (name.back() == '~') return true;
    return name.size() >= 4 && name.compare(name.size() - 4, 4, ".tmp") == 0;
}

SharedFolderWatcher::SharedFolderWatcher(std::vector<fs::path> dirs, HostState& state, Clock& clock,
                                         WakeFn wake, SharedWatchOptions opt, EventLog* events)
    : dirs_(std::move(dirs)), state_(state), clock_(clock), wake_(std::move(wake)),
      opt_(opt), events_(events) {
    for (const auto& d : dirs_) {
        std::error_code ec;
        fs::path root = fs::weakly_canonical(d, ec);
        Watched w;
        w.root = ec ? d.lexically_normal() : root;
        watched_.push_back(std::move(w));
    }
}

SharedFolderWatcher::~SharedFolderWatcher() { stop(); }

bool SharedFolderWatcher::snapshot(const fs::path& root, Snapshot* out, std::string* err) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        *err = "not a directory";
        return false;
    }
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        *err = ec.message();
        return false;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            *err = ec.message();
            return false;
        }
        const fs::directory_entry& e = *it;
        std::error_code fe;
        if (is_ignored_shared_name(e.path().filename().string())) {
            if (e.is_directory(fe)) it.disable_recursion_pending();
            continue;
        }
        if (!e.is_regular_file(fe)) continue;
        auto mtime = e.last_write_time(fe);
        if (fe) continue;
        uintmax_t size = e.file_size(fe);
        if (fe) continue;
        FileStamp st;
        st.mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count();
        st.size = size;
        (*out)[e.path().string()] = st;
    }
    if (ec) {
        *err = ec.message();
        return false;
    }
    return true;
}

std::vector<SharedChange> SharedFolderWatcher::scan_once() {
    std::lock_guard<std::mutex> lk(scan_mu_);
    const int64_t now = clock_.now_ms();
    std::vector<SharedChange> changes;

    for (Watched& w : watched_) {
        if (w.down && now < w.retry_at_ms) continue;
        Snapshot snap;
        std::string err;
        if (!snapshot(w.root, &snap, &err)) {
            if (!w.down) {
                log_warn("shared", w.root.string() + ": " + err + ", retrying every " +
                         std::to_string(opt_.restart_ms) + "ms");
            }
            w.down = true;
            w.baseline = false;
            w.files.clear();
            w.retry_at_ms = now + opt_.restart_ms;
            continue;
        }
        if (w.down) log_info("shared", w.root.string() + " is back, taking a new baseline");
        w.down = false;
        if (!w.baseline) {
            w.files = std::move(snap);
            w.baseline = true;
            continue;
        }

        for (const auto& [path, st] : snap) {
            auto old = w.files.find(path);
            if (old == w.files.end()) changes.push_back(SharedChange{path, "created"});
            else if (old->second != st) changes.push_back(SharedChange{path, "modified"});
        }
        for (const auto& [path, st] : w.files) {
            if (!snap.count(path)) changes.push_back(SharedChange{path, "deleted"});
        }
        w.files = std::move(snap);
    }

    if (!changes.empty()) wake_groups(changes);
    return changes;
}

void SharedFolderWatcher::wake_groups(const std::vector<SharedChange>& changes) {
    for (const Group& g : state_.groups()) {
        std::vector<std::string> lines;
        for (const AdditionalMount& m : g.additional_mounts) {
            if (m.host_path.empty()) continue;
            std::error_code ec;
            fs::path host = fs::weakly_canonical(expand_home(m.host_path), ec);
            if (ec || host.empty()) continue;
            std::string cp = m.container_path.empty() ? host.filename().string() : m.container_path;
            for (const SharedChange& c : changes) {
                if (!path_within(c.path, host)) continue;
                fs::path rel = c.path.lexically_relative(host);
                lines.push_back(c.event + " " + EXTRA_MOUNT_BASE + "/" + cp + "/" + rel.string());
            }
        }
        if (lines.empty()) continue;

        std::string text = "Files changed in a shared folder:\n";
        for (size_t i = 0; i < lines.size() && i < opt_.max_listed; i++) text += "- " + lines[i] + "\n";
        if (lines.size() > opt_.max_listed) {
            text += "- and " + std::to_string(lines.size() - opt_.max_listed) + " more\n";
        }
        text += "Review the changes and reply only if something needs attention.";

        WakeEntry e;
        e.group_jid = g.jid;
        e.kind = WakeKind::TASK;
        e.task_id = "shared-" + g.folder;
        e.context_mode = "group";
        e.text = std::move(text);
        e.enqueued_ms = clock_.now_ms();
        bool ok = wake_ && wake_(g.folder, std::move(e));
        if (ok) {
            log_info("shared", g.folder + ": woken for " + std::to_string(lines.size()) + " change(s)");
        } else {
            log_warn("shared", g.folder + ": wake refused");
        }
        if (events_) {
            json::ObjectBuilder p;
            p.set("group", g.folder).set("changes", (int64_t)lines.size()).set_bool("woken", ok);
            events_->event("shared_change", p.str());
        }
    }
}

void SharedFolderWatcher::arm() {
    timer_ = clock_.schedule_after(opt_.poll_ms, [this]() {
        Executor* exec = nullptr;
        {
            std::lock_guard<std::mutex> lk(timer_mu_);
            if (!running_) return;
            exec = exec_;
        }
        auto run = [this]() {
            {
                std::lock_guard<std::mutex> lk(timer_mu_);
                if (!running_) return;
            }
            (void)scan_once();
            std::lock_guard<std::mutex> lk(timer_mu_);
            if (running_) arm();
        };
        if (exec) {
            if (!exec->submit(PRIO_TASK, run)) log_warn("shared", "executor closed, polling stops");
        } else {
            run();
        }
    });
}

void SharedFolderWatcher::start(Executor* exec) {
    {
        std::lock_guard<std::mutex> lk(timer_mu_);
        if (running_) return;
    }
    // Baseline before the first poll so changes made after start are seen.
    (void)scan_once();
    std::lock_guard<std::mutex> lk(timer_mu_);
    if (running_) return;
    running_ = true;
    exec_ = exec;
    for (const auto& w : watched_) log_info("shared", "watching " + w.root.string());
    arm();
}

void SharedFolderWatcher::stop() {
    std::lock_guard<std::mutex> lk(timer_mu_);
    if (!running_) return;
    running_ = false;
    if (timer_) clock_.cancel(timer_);
    timer_ = 0;
}

} // namespace kestrel
