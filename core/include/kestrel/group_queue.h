#pragma once

// Per-group FIFO of wake entries plus the global concurrency governor.
//
// Invariants:
//   - at most one live session per group (the group's admission slot)
//   - at most max_concurrent live sessions across all groups
//   - entries for one group reach the runtime in enqueue order
// enqueue() never blocks; admission runs on the executor.

#include "cancel.h"
#include "clock.h"
#include "executor.h"
#include "host_state.h"
#include "log.h"
#include "scheduler.h"
#include "session_manager.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace kestrel {

struct QueueOptions {
    int max_concurrent{5};
    int max_retries{5};
    int64_t retry_base_ms{5000};
};

class GroupQueue {
public:
    struct Hooks {
        // User-visible notice for entries that had to be dropped.
        std::function<void(const std::string& jid, const std::string& text)> notify;
    };

    GroupQueue(HostState& state, SessionManager& sessions, Executor& exec, Clock& clock,
               QueueOptions opt, Hooks hooks, EventLog* events = nullptr);
    ~GroupQueue();

    GroupQueue(const GroupQueue&) = delete;
    GroupQueue& operator=(const GroupQueue&) = delete;

    // Returns false once shut down or if the executor refuses the work.
    bool enqueue(const std::string& folder, WakeEntry e);

    // Session manager callback: frees the group's slot and admits the next
    // pending entry or a waiting group.
    void on_session_ended(const std::string& folder);

    // Admits the group's next entry if nothing is live for it.
    void drain_if_idle(const std::string& folder);

    // Scheduler fire handler: turns a due task into a wake entry.
    FireResult fire_task(const ScheduledTask& t);

    // Rejects further enqueues and cancels pending spawn retries. Idempotent.
    void shutdown();

    size_t active_count() const;
    size_t pending(const std::string& folder) const;
    size_t waiting_count() const;

private:
    struct Slot {
        std::deque<WakeEntry> q;
        bool active{false};     // holds one of the global slots
        bool busy{false};       // a worker is running process() for it
        bool rerun{false};      // kicked while busy
        int retries{0};
        TimerId retry_timer{0};
    };

    void process(const std::string& folder);
    void kick(const std::string& folder);
    void admit_waiting();
    void add_waiting_locked(const std::string& folder, const Slot& slot);
    void drop_batch(const std::string& folder, const std::vector<WakeEntry>& batch, const std::string& why);

    HostState& state_;
    SessionManager& sessions_;
    Executor& exec_;
    Clock& clock_;
    QueueOptions opt_;
    Hooks hooks_;
    EventLog* events_;
    CancelSource cancel_;

    mutable std::mutex mu_;
    std::map<std::string, Slot> slots_;   // by folder
    std::deque<std::string> waiting_;     // groups waiting for a global slot
    std::deque<std::string> waiting_low_; // heartbeat-only waiters, admitted last
    size_t active_{0};
    bool shutting_down_{false};
};

} // namespace kestrel
