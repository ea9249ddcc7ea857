#pragma once

#include "journal.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kestrel {

enum class ScheduleKind { CRON, INTERVAL, ONCE };
enum class TaskStatus { ACTIVE, PAUSED, DONE };

const char* schedule_kind_name(ScheduleKind k);
std::optional<ScheduleKind> parse_schedule_kind(const std::string& s);
const char* task_status_name(TaskStatus s);
std::optional<TaskStatus> parse_task_status(const std::string& s);

struct ScheduledTask {
    std::string id;
    std::string group_folder;
    std::string chat_jid;
    std::string prompt;
    ScheduleKind kind{ScheduleKind::ONCE};
    std::string schedule_value;   // cron expression, interval ms, or timestamp
    std::string context_mode{"isolated"};  // "group" resumes the group session
    std::string timezone;         // empty: host zone
    int64_t next_run_ms{0};       // 0: not scheduled
    TaskStatus status{TaskStatus::ACTIVE};
    int64_t last_run_ms{0};
    std::string last_result;
    int64_t created_at_ms{0};
    int suppress_max_chars{-1};   // >= 0: heartbeat suppression threshold
};

struct TaskRun {
    std::string task_id;
    int64_t run_at_ms{0};
    std::string status;   // "enqueued", "rejected", "error"
    std::string detail;
};

std::string task_to_json(const ScheduledTask& t);
std::optional<ScheduledTask> task_from_json(const std::string& json, std::string* err);

// Durable task records keyed by id. Implementations must make put()
// durable before returning so a crash after a firing replays at worst once.
class TaskStore {
public:
    virtual ~TaskStore() = default;

    virtual std::string load() = 0;
    virtual std::optional<ScheduledTask> get(const std::string& id) const = 0;
    virtual std::vector<ScheduledTask> all() const = 0;
    virtual std::string put(const ScheduledTask& t) = 0;
    virtual std::string append_run(const TaskRun& r) = 0;
    // Compacts state to a checkpoint. Returns empty string on success.
    virtual std::string flush() = 0;
};

class MemoryTaskStore : public TaskStore {
public:
    std::string load() override { return ""; }
    std::optional<ScheduledTask> get(const std::string& id) const override;
    std::vector<ScheduledTask> all() const override;
    std::string put(const ScheduledTask& t) override;
    std::string append_run(const TaskRun& r) override;
    std::string flush() override { return ""; }

    std::vector<TaskRun> runs() const;

private:
    mutable std::mutex mu_;
    std::map<std::string, ScheduledTask> tasks_;
    std::vector<TaskRun> runs_;
};

// Checkpoint snapshot (tasks.json) plus a journal of PUT records since the
// last checkpoint (tasks.journal.jsonl). load() = snapshot + replay.
// Firings are appended to task-runs.jsonl.
class FileTaskStore : public TaskStore {
public:
    explicit FileTaskStore(std::filesystem::path dir, bool fsync = true);

    std::string load() override;
    std::optional<ScheduledTask> get(const std::string& id) const override;
    std::vector<ScheduledTask> all() const override;
    std::string put(const ScheduledTask& t) override;
    std::string append_run(const TaskRun& r) override;
    std::string flush() override;

    std::filesystem::path snapshot_path() const { return dir_ / "tasks.json"; }
    const Journal& journal() const { return journal_; }

private:
    std::filesystem::path dir_;
    bool fsync_;
    mutable std::mutex mu_;
    std::map<std::string, ScheduledTask> tasks_;
    Journal journal_;
    Journal runs_;
};

} // namespace kestrel
