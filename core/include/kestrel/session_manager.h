#pragma once

// Session lifecycle: one sandboxed agent-runtime process per group.
//
//   Pending -> Starting -> Running -> Draining -> Terminated
//   Pending -> Failed                  (mount denial, spawn failure)
//   Running -> Draining -> Killed      (hard timeout, output cap, forced shutdown)
//
// The manager owns the live-session table. Timers run on the Clock; output
// is pumped either by a worker loop on the Executor (production) or by
// explicit pump() calls (tests).

#include "cancel.h"
#include "clock.h"
#include "executor.h"
#include "host_state.h"
#include "log.h"
#include "mount_security.h"
#include "proc.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kestrel {

constexpr const char* OUTPUT_START_MARKER = "---KESTREL_OUTPUT_START---";
constexpr const char* OUTPUT_END_MARKER = "---KESTREL_OUTPUT_END---";

enum class WakeKind { MESSAGE, TASK, HEARTBEAT };

const char* wake_kind_name(WakeKind k);

// One queued reason to wake a group.
struct WakeEntry {
    std::string group_jid;
    WakeKind kind{WakeKind::MESSAGE};
    std::string sender;
    std::string sender_name;
    std::string text;               // message text or task prompt
    std::string task_id;
    std::string context_mode{"group"};
    int64_t enqueued_ms{0};
    int64_t message_ts_ms{0};
    int suppress_max_chars{-1};     // >= 0: heartbeat replies may be suppressed
};

enum class SessionState { PENDING, STARTING, RUNNING, DRAINING, TERMINATED, FAILED, KILLED };

const char* session_state_name(SessionState s);

// Mount approval for a group's configured mount set, evaluated per spawn.
class MountPolicy {
public:
    virtual ~MountPolicy() = default;
    virtual MountSetResult validate(const Group& g) = 0;
};

// Re-reads the allowlist file on every call.
class AllowlistMountPolicy : public MountPolicy {
public:
    explicit AllowlistMountPolicy(std::filesystem::path allowlist_path, EventLog* events = nullptr);
    MountSetResult validate(const Group& g) override;

private:
    std::filesystem::path path_;
    EventLog* events_;
};

struct SessionOptions {
    int64_t idle_ms{300000};
    int64_t hard_timeout_ms{1800000};
    int64_t max_output_bytes{10 * 1024 * 1024};
    int64_t grace_ms{10000};

    std::vector<std::string> agent_argv;
    std::vector<std::string> wrapper;
    std::filesystem::path groups_dir;
    std::filesystem::path ipc_root;
    std::string assistant_name{"Kestrel"};
    ProcLimits limits;

    bool self_pump{true};
    int pump_wait_ms{200};
};

struct StartResult {
    bool ok{false};
    bool retryable{false};
    std::string error;
};

struct SessionInfo {
    std::string folder;
    SessionState state{SessionState::PENDING};
    std::string reason;
    int pid{0};
    int64_t started_ms{0};
    int64_t last_activity_ms{0};
    int64_t output_bytes{0};
};

class SessionManager {
public:
    struct Hooks {
        // Routes a runtime result to the group's chat.
        std::function<void(const std::string& jid, const std::string& text)> send_message;
        // Called once for every session that reached Running, after it is
        // removed from the live table.
        std::function<void(const std::string& folder, SessionState final_state, const std::string& reason)> on_ended;
    };

    SessionManager(HostState& state, ProcessLauncher& launcher, MountPolicy& mounts,
                   Clock& clock, Executor& exec, SessionOptions opt, Hooks hooks,
                   EventLog* events = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Validates mounts and spawns a session for the group with the batch as
    // its initial prompt. Blocking; call from a worker. A failed start
    // reaches on_ended only when a forced shutdown reaped the session while
    // it was starting.
    StartResult start(const Group& g, const std::vector<WakeEntry>& batch, CancelToken cancel = {});

    // Writes the entry into a Running session's input area and resets its
    // idle timer. False if no session is accepting input or the token is
    // already cancelled.
    bool deliver(const std::string& folder, const WakeEntry& e, CancelToken cancel = {});

    bool is_live(const std::string& folder) const;
    bool accepting(const std::string& folder) const;
    std::optional<SessionInfo> info(const std::string& folder) const;
    size_t live_count() const;

    // Reads pending output and checks for exit. Returns false once the
    // session has been finalized (or does not exist).
    bool pump(const std::string& folder, int wait_ms = 0);

    // Running -> Draining: writes the close sentinel and escalates to
    // SIGTERM/SIGKILL after the grace period.
    void request_drain(const std::string& folder, const std::string& reason);

    // Stops new starts, drains every session, force-kills what is still
    // alive after grace_ms. Idempotent.
    void shutdown(int64_t grace_ms);

    // Formats messages as the runtime's <messages> prompt.
    static std::string format_messages(const std::vector<WakeEntry>& batch);

private:
    struct Session;
    using SessionPtr = std::shared_ptr<Session>;

    SessionPtr find(const std::string& folder) const;
    void transition(Session& s, SessionState to, const std::string& reason);
    void touch_locked(const SessionPtr& s);
    void arm_idle_locked(const SessionPtr& s);
    void on_output(const SessionPtr& s, const std::string& chunk);
    void handle_result(const SessionPtr& s, const std::string& json_text);
    void begin_drain(const SessionPtr& s, const std::string& reason);
    void begin_kill(const SessionPtr& s, const std::string& reason);
    void escalate(const SessionPtr& s, int step);
    void finalize(const SessionPtr& s, int exit_code);
    bool pump_session(const SessionPtr& s, int wait_ms);
    void pump_loop(SessionPtr s);
    std::string build_stdin(const Group& g, const std::vector<WakeEntry>& batch, const std::string& session_id) const;

    HostState& state_;
    ProcessLauncher& launcher_;
    MountPolicy& mounts_;
    Clock& clock_;
    Executor& exec_;
    SessionOptions opt_;
    Hooks hooks_;
    EventLog* events_;

    mutable std::mutex mu_;
    std::map<std::string, SessionPtr> sessions_;   // by folder
    bool shutting_down_{false};
};

} // namespace kestrel
