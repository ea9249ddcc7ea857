#pragma once

// File mailbox between host and sessions.
//
// Layout under the IPC root (data/ipc), one directory per group folder:
//   <folder>/tasks/*.json     session -> host task envelopes
//   <folder>/messages/*.json  session -> host outbound messages (same envelope)
//   <folder>/input/*.json     host -> session follow-up messages
//   <folder>/input/_close     host -> session: finish and exit
//   errors/                   envelopes that never parsed
//
// Producers write <name>.json.tmp and rename, so a *.json file is complete
// once visible; the watcher still tolerates truncated files by retrying them
// until a settle window passes.

#include "clock.h"
#include "executor.h"
#include "host_state.h"
#include "log.h"
#include "mount_security.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace kestrel {

class Scheduler;

namespace ipc {

struct SendMessage {
    std::string chat_jid;
    std::string text;
};

struct ScheduleTask {
    std::string prompt;
    std::string schedule_type;    // cron | interval | once
    std::string schedule_value;
    std::string target_folder;    // empty: issuing group
    std::string context_mode{"isolated"};
};

struct PauseTask { std::string task_id; };
struct ResumeTask { std::string task_id; };
struct CancelTask { std::string task_id; };

// List-query: answered with a snapshot written into the issuer's input area.
struct ListTasks { };

struct ApproveContact { std::string jid; };
struct DenyContact { std::string jid; };

struct RegisterGroup {
    std::string jid;
    std::string name;
    std::string folder;
    bool requires_trigger{true};
    std::vector<AdditionalMount> additional_mounts;
};

using TaskPayload = std::variant<SendMessage, ScheduleTask, PauseTask, ResumeTask, CancelTask,
                                 ListTasks, ApproveContact, DenyContact, RegisterGroup>;

struct Envelope {
    std::string id;               // filename stem; idempotence key
    std::string source_group;     // as written by the producer; verified, never trusted
    TaskPayload payload;
    int64_t created_at_ms{0};
};

const char* type_name(const TaskPayload& p);

// Decodes {type, sourceGroupId, payload, createdAt}. The payload is checked
// against the schema of its type. nullopt + *err on any violation.
std::optional<Envelope> decode_envelope(const std::string& text, std::string* err);
std::string encode_envelope(const Envelope& e);

// Host -> session input files.
std::filesystem::path group_dir(const std::filesystem::path& ipc_root, const std::string& folder);
std::filesystem::path input_dir(const std::filesystem::path& ipc_root, const std::string& folder);
std::string write_input_message(const std::filesystem::path& ipc_root, const std::string& folder,
                                const std::string& text, int64_t now_ms);
std::string write_close_sentinel(const std::filesystem::path& ipc_root, const std::string& folder);
// Removes a stale _close and any leftover input files before a fresh spawn.
void reset_input(const std::filesystem::path& ipc_root, const std::string& folder);

// Executes authorized envelopes against the host collaborators.
class Dispatcher {
public:
    struct Hooks {
        // Routes a message to its channel. False if undeliverable.
        std::function<bool(const std::string& jid, const std::string& text)> send_message;
        // Called after a group is registered (e.g. to set up its heartbeat).
        std::function<void(const Group&)> on_group_registered;
    };

    Dispatcher(HostState& state, Scheduler& scheduler, Clock& clock,
               std::filesystem::path ipc_root, Hooks hooks, EventLog* events = nullptr);

    // Authorization uses `issuer` (derived from the directory the file came
    // from), never the envelope's sourceGroupId. Returns empty string when
    // the task was executed; "unauthorized: ..." when rejected.
    std::string dispatch(const Envelope& env, const Group& issuer);

private:
    std::string handle(const SendMessage& m, const Envelope& env, const Group& issuer);
    std::string handle(const ScheduleTask& m, const Envelope& env, const Group& issuer);
    std::string handle(const PauseTask& m, const Envelope& env, const Group& issuer);
    std::string handle(const ResumeTask& m, const Envelope& env, const Group& issuer);
    std::string handle(const CancelTask& m, const Envelope& env, const Group& issuer);
    std::string handle(const ListTasks& m, const Envelope& env, const Group& issuer);
    std::string handle(const ApproveContact& m, const Envelope& env, const Group& issuer);
    std::string handle(const DenyContact& m, const Envelope& env, const Group& issuer);
    std::string handle(const RegisterGroup& m, const Envelope& env, const Group& issuer);

    std::string own_task_check(const std::string& task_id, const Group& issuer);

    HostState& state_;
    Scheduler& scheduler_;
    Clock& clock_;
    std::filesystem::path ipc_root_;
    Hooks hooks_;
    EventLog* events_;
};

struct WatcherOptions {
    int64_t settle_ms{5000};        // unparseable files younger than this are retried
    int64_t dedup_ttl_ms{300000};
    size_t dedup_max{10000};
};

struct ScanStats {
    size_t dispatched{0};
    size_t rejected{0};
    size_t duplicates{0};
    size_t errors{0};
    size_t deferred{0};
};

// Scans every group's task/message directories and dispatches envelopes
// exactly once per file identity.
class Watcher {
public:
    Watcher(std::filesystem::path ipc_root, HostState& state, Dispatcher& dispatcher,
            Clock& clock, WatcherOptions opt = {}, EventLog* events = nullptr);
    ~Watcher();

    Watcher(const Watcher&) = delete;
    Watcher& operator=(const Watcher&) = delete;

    ScanStats scan_once();

    // Processes one file found under <ipc_root>/<folder>/{tasks,messages}.
    // Exposed so replayed filesystem events go through the same dedup path.
    ScanStats process_file(const std::string& folder, const std::filesystem::path& file);

    // Polls every poll_ms. With an executor the scan runs on it, so the
    // clock's timer thread only submits work.
    void start(int64_t poll_ms, Executor* exec = nullptr);
    void stop();

private:
    bool seen_recently(const std::string& key, int64_t now);
    void remember(const std::string& key, int64_t now);
    void arm();

    std::filesystem::path root_;
    HostState& state_;
    Dispatcher& dispatcher_;
    Clock& clock_;
    WatcherOptions opt_;
    EventLog* events_;

    std::mutex scan_mu_;
    std::mutex dedup_mu_;
    std::unordered_map<std::string, int64_t> processed_;

    std::mutex timer_mu_;
    TimerId timer_{0};
    int64_t poll_ms_{1000};
    bool running_{false};
    Executor* exec_{nullptr};
};

} // namespace ipc
} // namespace kestrel
