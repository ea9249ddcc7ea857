#pragma once

#include "cancel.h"
#include "clock.h"
#include "executor.h"
#include "log.h"
#include "task_store.h"
#include "timezone.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kestrel {

enum class FireResult {
    ENQUEUED,   // accepted; advance the schedule
    RETRY,      // not accepted now; leave next_run so the next tick retries
    DROP,       // target is gone; pause the task
};

using FireFn = std::function<FireResult(const ScheduledTask&)>;

// Polls the task table on a coarse period and hands due tasks to the
// fire handler (normally the group queue).
//
// Firing is at-least-once: the wake is enqueued first and the advanced
// next_run is persisted afterwards, so a crash in between repeats one
// firing instead of losing it. A task that missed several occurrences
// while the host was down fires once and skips ahead to the next future
// occurrence.
class Scheduler {
public:
    Scheduler(TaskStore& store, Clock& clock, TimeZone host_tz, EventLog* events = nullptr);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void set_fire_handler(FireFn fn);

    // Next run strictly after now_ms. nullopt when the schedule has no
    // future occurrence. Throws std::invalid_argument on a bad schedule.
    static std::optional<int64_t> compute_next_run(const ScheduledTask& t, int64_t now_ms, const TimeZone& host_tz);

    // Validates the schedule, fills created_at and next_run, persists.
    // Returns empty string on success.
    std::string create(ScheduledTask t);
    std::string pause(const std::string& id);
    std::string resume(const std::string& id);
    // Marks the task done with result "cancelled".
    std::string cancel(const std::string& id);

    std::optional<ScheduledTask> get(const std::string& id) const;
    // Empty folder: every task.
    std::vector<ScheduledTask> list(const std::string& group_folder = "") const;

    // Fires every due active task once. Returns the number enqueued.
    // Once the token is cancelled no further task is fired; tasks not yet
    // reached keep their next_run.
    size_t tick(CancelToken cancel = {});

    // Recurring tick every poll_ms. The tick itself runs on the executor
    // when one is given, otherwise on the clock's thread.
    void start(int64_t poll_ms, Executor* exec = nullptr);
    // Cancels the recurring tick, including one already running.
    void stop();

    // Checkpoints the store. Returns empty string on success.
    std::string flush();

    const TimeZone& timezone() const { return tz_; }

private:
    void arm_locked();
    std::string persist_locked(const ScheduledTask& t);

    TaskStore& store_;
    Clock& clock_;
    TimeZone tz_;
    EventLog* events_;
    FireFn fire_;

    mutable std::mutex mu_;          // serializes tick and task operations
    std::mutex timer_mu_;
    TimerId timer_{0};
    int64_t poll_ms_{0};
    Executor* exec_{nullptr};
    CancelSource stopping_;
    std::atomic<bool> running_{false};
};

} // namespace kestrel
