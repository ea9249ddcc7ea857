#include "kestrel/session_manager.h"
#include "kestrel/heartbeat.h"
#include "kestrel/ipc.h"
#include "kestrel/json_util.h"
#include "kestrel/timezone.h"

#include <algorithm>
#include <chrono>
#include <thread>

namespace kestrel {

const char* wake_kind_name(WakeKind k) {
    switch (k) {
        case WakeKind::MESSAGE: return "message";
        case WakeKind::TASK: return "task";
        case WakeKind::HEARTBEAT: return "heartbeat";
    }
    return "unknown";
}

const char* session_state_name(SessionState s) {
    switch (s) {
        case SessionState::PENDING: return "pending";
        case SessionState::STARTING: return "starting";
        case SessionState::RUNNING: return "running";
        case SessionState::DRAINING: return "draining";
        case SessionState::TERMINATED: return "terminated";
        case SessionState::FAILED: return "failed";
        case SessionState::KILLED: return "killed";
    }
    return "unknown";
}

static const char* kFailureNotice =
    "Sorry, something went wrong while handling that. Please try again.";

// ---------- AllowlistMountPolicy ----------

AllowlistMountPolicy::AllowlistMountPolicy(std::filesystem::path allowlist_path, EventLog* events)
    : path_(std::move(allowlist_path)), events_(events) {}

MountSetResult AllowlistMountPolicy::validate(const Group& g) {
    if (g.additional_mounts.empty()) {
        MountSetResult ok;
        ok.ok = true;
        return ok;
    }

    std::string err;
    auto allowlist = load_mount_allowlist(path_, &err);
    if (!allowlist) {
        log_warn("mounts", "allowlist unavailable (" + err + "), denying additional mounts for " + g.folder);
    }

    MountSetResult r = validate_mount_set(g.additional_mounts, allowlist, g.is_main(), path_);
    for (const auto& d : r.decisions) {
        if (d.allowed) {
            log_debug("mounts", g.folder + ": " + d.resolved_path.string() + " -> " + d.container_path +
                      (d.effective_readonly ? " (ro)" : " (rw)"));
            continue;
        }
        log_warn("mounts", g.folder + ": mount " + d.requested_path + " denied: " + d.reason);
        if (events_) {
            json::ObjectBuilder p;
            p.set("group", g.folder).set("path", d.requested_path).set("reason", d.reason);
            events_->event("mount_denied", p.str());
        }
    }
    return r;
}

// ---------- Session ----------

struct SessionManager::Session {
    std::mutex mu;
    Group group;
    SessionState state{SessionState::PENDING};
    std::string reason;
    std::unique_ptr<ProcessHandle> proc;

    int64_t started_ms{0};
    int64_t last_activity_ms{0};
    int64_t output_bytes{0};
    std::string buf;            // unconsumed output, scanned for result blocks

    bool discarding{false};     // output cap hit; further output is dropped
    bool killing{false};
    bool finalized{false};
    bool quiet{false};          // heartbeat-only: no failure notice
    bool isolated{false};       // does not touch the group's conversation id
    bool runtime_error{false};
    int suppress_max_chars{-1};
    int results_sent{0};

    std::string session_id;
    int64_t cursor_ms{0};

    TimerId idle_timer{0};
    TimerId hard_timer{0};
    TimerId escalate_timer{0};
};

SessionManager::SessionManager(HostState& state, ProcessLauncher& launcher, MountPolicy& mounts,
                               Clock& clock, Executor& exec, SessionOptions opt, Hooks hooks,
                               EventLog* events)
    : state_(state), launcher_(launcher), mounts_(mounts), clock_(clock), exec_(exec),
      opt_(std::move(opt)), hooks_(std::move(hooks)), events_(events) {}

SessionManager::~SessionManager() { shutdown(0); }

SessionManager::SessionPtr SessionManager::find(const std::string& folder) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(folder);
    return it == sessions_.end() ? nullptr : it->second;
}

void SessionManager::transition(Session& s, SessionState to, const std::string& reason) {
    SessionState from = s.state;
    s.state = to;
    if (!reason.empty()) s.reason = reason;
    log_info("session", s.group.folder + ": " + session_state_name(from) + " -> " + session_state_name(to) +
             (reason.empty() ? std::string() : " (" + reason + ")"));
    if (events_) {
        json::ObjectBuilder p;
        p.set("group", s.group.folder).set("from", session_state_name(from)).set("to", session_state_name(to));
        if (!reason.empty()) p.set("reason", reason);
        events_->event("session_state", p.str());
    }
}

void SessionManager::arm_idle_locked(const SessionPtr& s) {
    if (s->idle_timer) clock_.cancel(s->idle_timer);
    std::weak_ptr<Session> w = s;
    s->idle_timer = clock_.schedule_after(opt_.idle_ms, [this, w]() {
        if (auto sp = w.lock()) begin_drain(sp, "idle-timeout");
    });
}

void SessionManager::touch_locked(const SessionPtr& s) {
    s->last_activity_ms = clock_.now_ms();
    if (s->state == SessionState::RUNNING) arm_idle_locked(s);
}

std::string SessionManager::format_messages(const std::vector<WakeEntry>& batch) {
    auto esc = [](const std::string& in) {
        std::string out;
        out.reserve(in.size());
        for (char c : in) {
            switch (c) {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                case '"': out += "&quot;"; break;
                default: out.push_back(c);
            }
        }
        return out;
    };
    std::string s = "<messages>\n";
    for (const auto& e : batch) {
        const std::string& who = e.sender_name.empty() ? e.sender : e.sender_name;
        s += "<message sender=\"" + esc(who) + "\" time=\"" + format_utc(e.message_ts_ms) + "\">" +
             esc(e.text) + "</message>\n";
    }
    s += "</messages>";
    return s;
}

std::string SessionManager::build_stdin(const Group& g, const std::vector<WakeEntry>& batch,
                                        const std::string& session_id) const {
    bool messages = std::all_of(batch.begin(), batch.end(),
                                [](const WakeEntry& e) { return e.kind == WakeKind::MESSAGE; });
    json::ObjectBuilder b;
    b.set("prompt", messages ? format_messages(batch) : batch.front().text)
     .set("groupFolder", g.folder)
     .set("chatJid", g.jid)
     .set("assistantName", opt_.assistant_name)
     .set_bool("isMain", g.is_main())
     .set_bool("isScheduledTask", !messages);
    if (!session_id.empty()) b.set("sessionId", session_id);
    if (!messages && !batch.front().task_id.empty()) b.set("taskId", batch.front().task_id);
    return b.str() + "\n";
}

// ---------- start / deliver ----------

StartResult SessionManager::start(const Group& g, const std::vector<WakeEntry>& batch, CancelToken cancel) {
    StartResult res;
    if (batch.empty()) {
        res.error = "empty batch";
        return res;
    }

    auto s = std::make_shared<Session>();
    s->group = g;
    s->started_ms = clock_.now_ms();
    s->quiet = std::all_of(batch.begin(), batch.end(),
                           [](const WakeEntry& e) { return e.kind == WakeKind::HEARTBEAT; });
    if (batch.size() == 1 && batch.front().kind == WakeKind::HEARTBEAT) {
        s->suppress_max_chars = batch.front().suppress_max_chars;
    }
    s->isolated = batch.size() == 1 && batch.front().kind != WakeKind::MESSAGE &&
                  batch.front().context_mode == "isolated";
    for (const auto& e : batch) s->cursor_ms = std::max(s->cursor_ms, e.message_ts_ms);

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (shutting_down_) {
            res.error = "host shutting down";
            return res;
        }
        if (sessions_.count(g.folder)) {
            res.error = "session already live for " + g.folder;
            return res;
        }
        sessions_[g.folder] = s;
    }

    auto fail = [&](const std::string& why, bool retryable) {
        {
            std::lock_guard<std::mutex> lk(s->mu);
            s->finalized = true;
            transition(*s, SessionState::FAILED, why);
        }
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = sessions_.find(g.folder);
            if (it != sessions_.end() && it->second == s) sessions_.erase(it);
        }
        StartResult r;
        r.retryable = retryable;
        r.error = why;
        return r;
    };

    if (cancel.cancelled()) return fail("cancelled", false);

    MountSetResult mr = mounts_.validate(g);
    if (!mr.ok) return fail("mount-denied: " + mr.reason, false);

    {
        std::lock_guard<std::mutex> lk(s->mu);
        transition(*s, SessionState::STARTING, "");
    }

    if (opt_.agent_argv.empty()) return fail("no agent command configured", false);

    std::error_code ec;
    std::filesystem::path cwd = opt_.groups_dir / g.folder;
    std::filesystem::create_directories(cwd, ec);
    if (ec) return fail("create " + cwd.string() + ": " + ec.message(), true);
    for (const char* sub : {"tasks", "messages", "input"}) {
        std::filesystem::create_directories(ipc::group_dir(opt_.ipc_root, g.folder) / sub, ec);
    }
    ipc::reset_input(opt_.ipc_root, g.folder);

    std::string session_id = s->isolated ? std::string() : state_.session_marker(g.folder).session_id;

    SpawnSpec spec;
    spec.argv = opt_.agent_argv;
    spec.wrapper = opt_.wrapper;
    spec.cwd = cwd.string();
    spec.env = {
        {"KESTREL_GROUP_FOLDER", g.folder},
        {"KESTREL_CHAT_JID", g.jid},
        {"KESTREL_IPC_DIR", ipc::group_dir(opt_.ipc_root, g.folder).string()},
        {"KESTREL_IS_MAIN", g.is_main() ? "1" : "0"},
        {"KESTREL_ASSISTANT_NAME", opt_.assistant_name},
    };
    spec.mounts = mr.mounts;
    spec.stdin_data = build_stdin(g, batch, session_id);
    spec.limits = opt_.limits;

    std::string err;
    std::unique_ptr<ProcessHandle> proc = launcher_.spawn(spec, &err);
    if (!proc) return fail("spawn failed: " + err, true);
    if (cancel.cancelled()) {
        proc->kill();
        return fail("cancelled", false);
    }

    std::weak_ptr<Session> w = s;
    {
        std::lock_guard<std::mutex> lk(s->mu);
        if (s->finalized) {
            // forced shutdown reaped this entry while the process was starting
            proc->kill();
            res.error = "host shutting down";
            return res;
        }
        s->proc = std::move(proc);
        s->session_id = session_id;
        transition(*s, SessionState::RUNNING, "");
        touch_locked(s);
        s->hard_timer = clock_.schedule_after(opt_.hard_timeout_ms, [this, w]() {
            if (auto sp = w.lock()) begin_kill(sp, "hard-timeout");
        });
        log_info("session", g.folder + ": pid " + std::to_string(s->proc->pid()) + ", " +
                 std::to_string(batch.size()) + " entr" + (batch.size() == 1 ? "y" : "ies") + ", " +
                 std::to_string(mr.mounts.size()) + " extra mount(s)");
    }

    if (opt_.self_pump && !exec_.submit(PRIO_MESSAGE, [this, s]() { pump_loop(s); })) {
        log_error("session", g.folder + ": executor refused the output pump, killing session");
        begin_kill(s, "host-shutdown");
    }

    res.ok = true;
    return res;
}

bool SessionManager::deliver(const std::string& folder, const WakeEntry& e, CancelToken cancel) {
    if (cancel.cancelled()) return false;
    SessionPtr s = find(folder);
    if (!s) return false;
    {
        std::lock_guard<std::mutex> lk(s->mu);
        if (s->finalized || s->state != SessionState::RUNNING) return false;
    }

    std::string text = e.kind == WakeKind::MESSAGE ? format_messages({e}) : e.text;
    std::string err = ipc::write_input_message(opt_.ipc_root, folder, text, clock_.now_ms());
    if (!err.empty()) {
        log_warn("session", folder + ": input delivery failed: " + err);
        return false;
    }

    std::lock_guard<std::mutex> lk(s->mu);
    // Drain began while the file was written; the caller falls back to a
    // fresh spawn, which clears the stale input.
    if (s->finalized || s->state != SessionState::RUNNING) return false;
    touch_locked(s);
    if (e.kind == WakeKind::MESSAGE) {
        s->suppress_max_chars = -1;
        s->quiet = false;
        s->cursor_ms = std::max(s->cursor_ms, e.message_ts_ms);
    } else if (e.kind == WakeKind::HEARTBEAT) {
        // The next reply answers the heartbeat and gets its threshold.
        s->suppress_max_chars = e.suppress_max_chars;
    }
    log_debug("session", folder + ": delivered " + wake_kind_name(e.kind) + " into live session");
    return true;
}

// ---------- queries ----------

bool SessionManager::is_live(const std::string& folder) const {
    return find(folder) != nullptr;
}

bool SessionManager::accepting(const std::string& folder) const {
    SessionPtr s = find(folder);
    if (!s) return false;
    std::lock_guard<std::mutex> lk(s->mu);
    return !s->finalized && s->state == SessionState::RUNNING;
}

std::optional<SessionInfo> SessionManager::info(const std::string& folder) const {
    SessionPtr s = find(folder);
    if (!s) return std::nullopt;
    std::lock_guard<std::mutex> lk(s->mu);
    SessionInfo i;
    i.folder = folder;
    i.state = s->state;
    i.reason = s->reason;
    i.pid = s->proc ? s->proc->pid() : 0;
    i.started_ms = s->started_ms;
    i.last_activity_ms = s->last_activity_ms;
    i.output_bytes = s->output_bytes;
    return i;
}

size_t SessionManager::live_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.size();
}

// ---------- output ----------

static std::string strip_internal(const std::string& in) {
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t a = in.find("<internal>", pos);
        if (a == std::string::npos) break;
        size_t b = in.find("</internal>", a);
        if (b == std::string::npos) break;
        out.append(in, pos, a - pos);
        pos = b + std::string("</internal>").size();
    }
    out.append(in, pos, std::string::npos);
    size_t b = out.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = out.find_last_not_of(" \t\r\n");
    return out.substr(b, e - b + 1);
}

void SessionManager::on_output(const SessionPtr& s, const std::string& chunk) {
    static const std::string start = OUTPUT_START_MARKER;
    static const std::string end = OUTPUT_END_MARKER;

    std::vector<std::string> blocks;
    bool cap = false;
    {
        std::lock_guard<std::mutex> lk(s->mu);
        if (s->finalized || s->discarding) return;
        s->output_bytes += (int64_t)chunk.size();
        if (s->output_bytes > opt_.max_output_bytes) {
            s->discarding = true;
            s->buf.clear();
            cap = true;
        } else {
            touch_locked(s);
            s->buf += chunk;
            while (true) {
                size_t a = s->buf.find(start);
                if (a == std::string::npos) {
                    // keep a tail that may hold a partial marker
                    if (s->buf.size() > start.size()) s->buf.erase(0, s->buf.size() - start.size());
                    break;
                }
                size_t b = s->buf.find(end, a + start.size());
                if (b == std::string::npos) {
                    s->buf.erase(0, a);
                    break;
                }
                blocks.push_back(s->buf.substr(a + start.size(), b - a - start.size()));
                s->buf.erase(0, b + end.size());
            }
        }
    }
    if (cap) {
        log_warn("session", s->group.folder + ": output exceeded " + std::to_string(opt_.max_output_bytes) + " bytes");
        begin_kill(s, "output-cap");
        return;
    }
    for (const auto& blk : blocks) handle_result(s, blk);
}

void SessionManager::handle_result(const SessionPtr& s, const std::string& json_text) {
    json::Doc d = json::parse(json_text);
    if (!d.is_object()) {
        log_warn("session", s->group.folder + ": unparseable result block");
        return;
    }
    std::string status = json::get_string(d.root, "status").value_or("success");
    std::string result = strip_internal(json::get_string(d.root, "result").value_or(""));
    auto new_id = json::get_string(d.root, "newSessionId");

    bool send = false;
    {
        std::lock_guard<std::mutex> lk(s->mu);
        if (new_id && !new_id->empty() && !s->isolated) s->session_id = *new_id;
        if (status == "error") {
            s->runtime_error = true;
            log_warn("session", s->group.folder + ": runtime error: " +
                     json::get_string(d.root, "error").value_or("unknown"));
        }
        if (!result.empty()) {
            if (s->suppress_max_chars >= 0 && is_heartbeat_ok(result, s->suppress_max_chars)) {
                if (events_) {
                    json::ObjectBuilder p;
                    p.set("group", s->group.folder).set("chars", (int64_t)result.size());
                    events_->event("heartbeat_suppressed", p.str());
                }
            } else {
                s->results_sent++;
                send = true;
            }
        }
    }
    if (send && hooks_.send_message) hooks_.send_message(s->group.jid, result);
}

// ---------- drain / kill ----------

void SessionManager::begin_drain(const SessionPtr& s, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lk(s->mu);
        if (s->finalized || s->state != SessionState::RUNNING) return;
        if (s->idle_timer) clock_.cancel(s->idle_timer);
        s->idle_timer = 0;
        transition(*s, SessionState::DRAINING, reason);
    }
    std::string err = ipc::write_close_sentinel(opt_.ipc_root, s->group.folder);
    if (!err.empty()) log_warn("session", s->group.folder + ": close sentinel: " + err);

    std::weak_ptr<Session> w = s;
    std::lock_guard<std::mutex> lk(s->mu);
    if (s->finalized || s->killing) return;
    s->escalate_timer = clock_.schedule_after(opt_.grace_ms, [this, w]() {
        if (auto sp = w.lock()) escalate(sp, 1);
    });
}

void SessionManager::begin_kill(const SessionPtr& s, const std::string& reason) {
    std::lock_guard<std::mutex> lk(s->mu);
    if (s->finalized || s->killing) return;
    s->killing = true;
    if (s->idle_timer) clock_.cancel(s->idle_timer);
    if (s->escalate_timer) clock_.cancel(s->escalate_timer);
    s->idle_timer = 0;
    if (s->state != SessionState::DRAINING) transition(*s, SessionState::DRAINING, reason);
    else s->reason = reason;
    if (s->proc) s->proc->terminate();
    std::weak_ptr<Session> w = s;
    s->escalate_timer = clock_.schedule_after(opt_.grace_ms, [this, w]() {
        if (auto sp = w.lock()) escalate(sp, 2);
    });
}

void SessionManager::escalate(const SessionPtr& s, int step) {
    std::lock_guard<std::mutex> lk(s->mu);
    s->escalate_timer = 0;
    if (s->finalized || !s->proc) return;
    if (step == 1) {
        log_warn("session", s->group.folder + ": still running after close request, sending SIGTERM");
        s->proc->terminate();
        std::weak_ptr<Session> w = s;
        s->escalate_timer = clock_.schedule_after(opt_.grace_ms, [this, w]() {
            if (auto sp = w.lock()) escalate(sp, 2);
        });
        return;
    }
    log_warn("session", s->group.folder + ": grace period over, sending SIGKILL");
    s->proc->kill();
}

void SessionManager::request_drain(const std::string& folder, const std::string& reason) {
    if (SessionPtr s = find(folder)) begin_drain(s, reason);
}

// ---------- exit ----------

void SessionManager::finalize(const SessionPtr& s, int exit_code) {
    bool quiet_shutdown = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        quiet_shutdown = shutting_down_;
    }

    SessionState final_state;
    std::string reason;
    bool notify = false;
    SessionMarker marker;
    {
        std::lock_guard<std::mutex> lk(s->mu);
        if (s->finalized) return;
        s->finalized = true;
        for (TimerId* t : {&s->idle_timer, &s->hard_timer, &s->escalate_timer}) {
            if (*t) clock_.cancel(*t);
            *t = 0;
        }

        if (s->state == SessionState::RUNNING) {
            transition(*s, SessionState::DRAINING, "process-exit");
        }
        if (s->killing) {
            final_state = SessionState::KILLED;
        } else if (exit_code != 0 && s->reason == "process-exit") {
            final_state = SessionState::FAILED;
            s->reason = "exit code " + std::to_string(exit_code);
        } else {
            final_state = SessionState::TERMINATED;
        }
        reason = s->reason;
        transition(*s, final_state, "");

        notify = (final_state != SessionState::TERMINATED || s->runtime_error) &&
                 s->results_sent == 0 && !s->quiet && !quiet_shutdown;
        marker.session_id = s->session_id;
        marker.last_cursor_ms = s->cursor_ms;
    }

    const std::string& folder = s->group.folder;
    SessionMarker prev = state_.session_marker(folder);
    if (marker.session_id.empty()) marker.session_id = prev.session_id;
    marker.last_cursor_ms = std::max(marker.last_cursor_ms, prev.last_cursor_ms);
    std::string err = state_.save_session_marker(folder, marker);
    if (!err.empty()) log_error("session", folder + ": failed to persist session marker: " + err);

    if (notify && hooks_.send_message) hooks_.send_message(s->group.jid, kFailureNotice);

    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = sessions_.find(folder);
        if (it != sessions_.end() && it->second == s) sessions_.erase(it);
    }
    if (hooks_.on_ended) hooks_.on_ended(folder, final_state, reason);
}

bool SessionManager::pump_session(const SessionPtr& s, int wait_ms) {
    {
        std::lock_guard<std::mutex> lk(s->mu);
        if (s->finalized) return false;
        if (!s->proc) return true;
    }
    std::string chunk;
    ReadStatus rs = s->proc->read_some(chunk, wait_ms);
    if (!chunk.empty()) on_output(s, chunk);

    if (auto code = s->proc->poll_exit()) {
        for (int i = 0; i < 64; i++) {
            std::string more;
            ReadStatus r = s->proc->read_some(more, 0);
            if (!more.empty()) on_output(s, more);
            if (r != ReadStatus::DATA) break;
        }
        finalize(s, *code);
        return false;
    }
    if (rs == ReadStatus::END && wait_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
    }
    return true;
}

bool SessionManager::pump(const std::string& folder, int wait_ms) {
    SessionPtr s = find(folder);
    return s ? pump_session(s, wait_ms) : false;
}

void SessionManager::pump_loop(SessionPtr s) {
    while (pump_session(s, opt_.pump_wait_ms)) {}
}

// ---------- shutdown ----------

void SessionManager::shutdown(int64_t grace_ms) {
    std::vector<SessionPtr> live;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (shutting_down_) return;
        shutting_down_ = true;
        for (auto& kv : sessions_) live.push_back(kv.second);
    }
    if (live.empty()) return;
    log_info("session", "shutdown: draining " + std::to_string(live.size()) + " session(s)");

    for (auto& s : live) begin_drain(s, "host-shutdown");

    auto wait_until = [&](std::chrono::steady_clock::time_point deadline) {
        while (live_count() > 0 && std::chrono::steady_clock::now() < deadline) {
            if (!opt_.self_pump) {
                for (auto& s : live) (void)pump_session(s, 0);
                if (live_count() == 0) break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    };

    wait_until(std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max<int64_t>(0, grace_ms)));

    std::vector<SessionPtr> remaining;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& kv : sessions_) remaining.push_back(kv.second);
    }
    if (remaining.empty()) return;

    log_warn("session", "shutdown: force-killing " + std::to_string(remaining.size()) + " session(s)");
    for (auto& s : remaining) {
        begin_kill(s, "host-shutdown");
        std::lock_guard<std::mutex> lk(s->mu);
        if (s->proc) s->proc->kill();
    }
    live = remaining;
    wait_until(std::chrono::steady_clock::now() + std::chrono::seconds(5));

    // A process that ignores SIGKILL (stuck in the kernel) is abandoned.
    for (auto& s : remaining) finalize(s, 128 + 9);
}

} // namespace kestrel
