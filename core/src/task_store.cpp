#include "kestrel/task_store.h"
#include "kestrel/fsutil.h"
#include "kestrel/json_util.h"
#include "kestrel/log.h"

namespace kestrel {

const char* schedule_kind_name(ScheduleKind k) {
    switch (k) {
        case ScheduleKind::CRON:     return "cron";
        case ScheduleKind::INTERVAL: return "interval";
        case ScheduleKind::ONCE:     return "once";
    }
    return "once";
}

std::optional<ScheduleKind> parse_schedule_kind(const std::string& s) {
    if (s == "cron") return ScheduleKind::CRON;
    if (s == "interval") return ScheduleKind::INTERVAL;
    if (s == "once") return ScheduleKind::ONCE;
    return std::nullopt;
}

const char* task_status_name(TaskStatus s) {
    switch (s) {
        case TaskStatus::ACTIVE: return "active";
        case TaskStatus::PAUSED: return "paused";
        case TaskStatus::DONE:   return "done";
    }
    return "active";
}

std::optional<TaskStatus> parse_task_status(const std::string& s) {
    if (s == "active") return TaskStatus::ACTIVE;
    if (s == "paused") return TaskStatus::PAUSED;
    if (s == "done" || s == "completed") return TaskStatus::DONE;
    return std::nullopt;
}

static json_object* task_object(const ScheduledTask& t) {
    json::ObjectBuilder b;
    b.set("id", t.id)
     .set("groupFolder", t.group_folder)
     .set("chatJid", t.chat_jid)
     .set("prompt", t.prompt)
     .set("scheduleType", schedule_kind_name(t.kind))
     .set("scheduleValue", t.schedule_value)
     .set("contextMode", t.context_mode)
     .set("nextRun", t.next_run_ms)
     .set("status", task_status_name(t.status))
     .set("lastRun", t.last_run_ms)
     .set("lastResult", t.last_result)
     .set("createdAt", t.created_at_ms)
     .set("suppressMaxChars", t.suppress_max_chars);
    if (!t.timezone.empty()) b.set("timezone", t.timezone);
    return b.release();
}

std::string task_to_json(const ScheduledTask& t) {
    json::Doc d(task_object(t));
    return json::to_string(d.root);
}

static std::optional<ScheduledTask> task_from_object(json_object* o, std::string* err) {
    ScheduledTask t;
    t.id = json::get_string(o, "id").value_or("");
    if (t.id.empty()) {
        if (err) *err = "task without id";
        return std::nullopt;
    }
    t.group_folder = json::get_string(o, "groupFolder").value_or("");
    t.chat_jid = json::get_string(o, "chatJid").value_or("");
    t.prompt = json::get_string(o, "prompt").value_or("");
    auto kind = parse_schedule_kind(json::get_string(o, "scheduleType").value_or(""));
    if (!kind) {
        if (err) *err = "task " + t.id + ": unknown scheduleType";
        return std::nullopt;
    }
    t.kind = *kind;
    t.schedule_value = json::get_string(o, "scheduleValue").value_or("");
    t.context_mode = json::get_string(o, "contextMode").value_or("isolated");
    t.timezone = json::get_string(o, "timezone").value_or("");
    t.next_run_ms = json::get_int(o, "nextRun").value_or(0);
    t.status = parse_task_status(json::get_string(o, "status").value_or("")).value_or(TaskStatus::PAUSED);
    t.last_run_ms = json::get_int(o, "lastRun").value_or(0);
    t.last_result = json::get_string(o, "lastResult").value_or("");
    t.created_at_ms = json::get_int(o, "createdAt").value_or(0);
    t.suppress_max_chars = (int)json::get_int(o, "suppressMaxChars").value_or(-1);
    return t;
}

std::optional<ScheduledTask> task_from_json(const std::string& text, std::string* err) {
    json::Doc d = json::parse(text);
    if (!d.is_object()) {
        if (err) *err = "task record is not a JSON object";
        return std::nullopt;
    }
    return task_from_object(d.root, err);
}

// ---------- MemoryTaskStore ----------

std::optional<ScheduledTask> MemoryTaskStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

std::vector<ScheduledTask> MemoryTaskStore::all() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<ScheduledTask> out;
    for (const auto& [id, t] : tasks_) out.push_back(t);
    return out;
}

std::string MemoryTaskStore::put(const ScheduledTask& t) {
    std::lock_guard<std::mutex> lk(mu_);
    tasks_[t.id] = t;
    return "";
}

std::string MemoryTaskStore::append_run(const TaskRun& r) {
    std::lock_guard<std::mutex> lk(mu_);
    runs_.push_back(r);
    return "";
}

std::vector<TaskRun> MemoryTaskStore::runs() const {
    std::lock_guard<std::mutex> lk(mu_);
    return runs_;
}

// ---------- FileTaskStore ----------

FileTaskStore::FileTaskStore(std::filesystem::path dir, bool fsync)
    : dir_(std::move(dir)),
      fsync_(fsync),
      journal_(dir_ / "tasks.journal.jsonl"),
      runs_(dir_ / "task-runs.jsonl") {
    journal_.set_fsync(fsync_);
}

std::string FileTaskStore::load() {
    std::lock_guard<std::mutex> lk(mu_);
    tasks_.clear();

    std::error_code ec;
    if (std::filesystem::exists(snapshot_path(), ec)) {
        auto body = slurp_file(snapshot_path());
        if (!body) return "cannot read " + snapshot_path().string();
        json::Doc d = json::parse(*body);
        if (!d.is_object()) return "task snapshot is corrupt: " + snapshot_path().string();
        for (json_object* o : json::get_object_array(d.root, "tasks")) {
            std::string err;
            auto t = task_from_object(o, &err);
            if (!t) {
                log_warn("tasks", "snapshot entry skipped: " + err);
                continue;
            }
            tasks_[t->id] = *t;
        }
    }

    size_t replayed = 0;
    journal_.replay([&](const std::string& line) {
        json::Doc d = json::parse(line);
        if (!d.is_object()) return;
        if (json::get_string(d.root, "t").value_or("") != "PUT") return;
        std::string err;
        auto t = task_from_object(json::field(d.root, "task"), &err);
        if (!t) {
            log_warn("tasks", "journal record skipped: " + err);
            return;
        }
        tasks_[t->id] = *t;
        replayed++;
    });
    if (replayed > 0) {
        log_info("tasks", "replayed " + std::to_string(replayed) + " journal record(s)");
    }
    return journal_.open(false);
}

std::optional<ScheduledTask> FileTaskStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

std::vector<ScheduledTask> FileTaskStore::all() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<ScheduledTask> out;
    out.reserve(tasks_.size());
    for (const auto& [id, t] : tasks_) out.push_back(t);
    return out;
}

std::string FileTaskStore::put(const ScheduledTask& t) {
    std::lock_guard<std::mutex> lk(mu_);
    json::ObjectBuilder rec;
    rec.set("t", "PUT").set_object("task", task_object(t));
    std::string err = journal_.append_json_line(rec.str());
    if (!err.empty()) return err;
    // Memory follows disk.
    tasks_[t.id] = t;
    return "";
}

std::string FileTaskStore::append_run(const TaskRun& r) {
    json::ObjectBuilder rec;
    rec.set("task_id", r.task_id).set("run_at", r.run_at_ms).set("status", r.status);
    if (!r.detail.empty()) rec.set("detail", r.detail);
    return runs_.append_json_line(rec.str());
}

std::string FileTaskStore::flush() {
    std::lock_guard<std::mutex> lk(mu_);
    json_object* arr = json_object_new_array();
    for (const auto& [id, t] : tasks_) json_object_array_add(arr, task_object(t));
    json::ObjectBuilder root;
    root.set("version", 1).set_object("tasks", arr);
    std::string err = write_atomic(snapshot_path(), root.str() + "\n", fsync_);
    if (!err.empty()) return "checkpoint: " + err;
    // Snapshot is durable; journal records are now redundant.
    err = journal_.truncate();
    if (!err.empty()) return "journal truncate: " + err;
    return "";
}

} // namespace kestrel
