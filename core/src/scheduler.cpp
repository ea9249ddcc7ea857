#include "kestrel/scheduler.h"
#include "kestrel/cron.h"
#include "kestrel/json_util.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace kestrel {

Scheduler::Scheduler(TaskStore& store, Clock& clock, TimeZone host_tz, EventLog* events)
    : store_(store), clock_(clock), tz_(std::move(host_tz)), events_(events) {}

Scheduler::~Scheduler() { stop(); }

void Scheduler::set_fire_handler(FireFn fn) {
    std::lock_guard<std::mutex> lk(mu_);
    fire_ = std::move(fn);
}

static int64_t parse_interval_ms(const std::string& v) {
    if (v.empty() || v.size() > 15 || !std::all_of(v.begin(), v.end(), ::isdigit)) {
        throw std::invalid_argument("interval must be a positive number of milliseconds: \"" + v + "\"");
    }
    int64_t ms = std::stoll(v);
    if (ms < 1000) throw std::invalid_argument("interval below one second: " + v);
    return ms;
}

std::optional<int64_t> Scheduler::compute_next_run(const ScheduledTask& t, int64_t now_ms, const TimeZone& host_tz) {
    switch (t.kind) {
        case ScheduleKind::CRON: {
            TimeZone tz = t.timezone.empty() ? host_tz : TimeZone::named(t.timezone);
            return CronExpr::parse(t.schedule_value).next_after(now_ms, tz);
        }
        case ScheduleKind::INTERVAL:
            return now_ms + parse_interval_ms(t.schedule_value);
        case ScheduleKind::ONCE: {
            TimeZone tz = t.timezone.empty() ? host_tz : TimeZone::named(t.timezone);
            auto at = parse_timestamp(t.schedule_value, tz);
            if (!at) throw std::invalid_argument("invalid timestamp: \"" + t.schedule_value + "\"");
            return *at;
        }
    }
    return std::nullopt;
}

std::string Scheduler::persist_locked(const ScheduledTask& t) {
    std::string err = store_.put(t);
    if (!err.empty()) log_error("scheduler", "persist task " + t.id + " failed: " + err);
    return err;
}

std::string Scheduler::create(ScheduledTask t) {
    if (t.id.empty()) return "task id is empty";
    if (t.group_folder.empty()) return "task " + t.id + " has no group";
    if (t.prompt.empty()) return "task " + t.id + " has no prompt";

    const int64_t now = clock_.now_ms();
    std::optional<int64_t> next;
    try {
        next = compute_next_run(t, now, tz_);
    } catch (const std::invalid_argument& e) {
        return std::string("invalid schedule: ") + e.what();
    }
    if (!next) return "schedule has no future occurrence";

    std::lock_guard<std::mutex> lk(mu_);
    if (store_.get(t.id)) return "task " + t.id + " already exists";
    t.next_run_ms = *next;
    t.status = TaskStatus::ACTIVE;
    if (t.created_at_ms == 0) t.created_at_ms = now;
    std::string err = persist_locked(t);
    if (!err.empty()) return err;

    if (events_) {
        json::ObjectBuilder p;
        p.set("task_id", t.id).set("group", t.group_folder)
         .set("schedule_type", schedule_kind_name(t.kind))
         .set("schedule_value", t.schedule_value).set("next_run", t.next_run_ms);
        events_->event("task_created", p.str());
    }
    log_info("scheduler", "created task " + t.id + " (" + schedule_kind_name(t.kind) + " " +
             t.schedule_value + ") next run " + format_utc(t.next_run_ms));
    return "";
}

std::string Scheduler::pause(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto t = store_.get(id);
    if (!t) return "task " + id + " not found";
    if (t->status == TaskStatus::DONE) return "task " + id + " is already done";
    t->status = TaskStatus::PAUSED;
    std::string err = persist_locked(*t);
    if (err.empty() && events_) events_->event("task_paused", "{\"task_id\":\"" + json::escape(id) + "\"}");
    return err;
}

std::string Scheduler::resume(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto t = store_.get(id);
    if (!t) return "task " + id + " not found";
    if (t->status == TaskStatus::DONE) return "task " + id + " is already done";
    const int64_t now = clock_.now_ms();
    try {
        // A once task keeps its time; if that passed it fires on the next tick.
        if (t->kind != ScheduleKind::ONCE || t->next_run_ms == 0) {
            auto next = compute_next_run(*t, now, tz_);
            if (!next) return "schedule has no future occurrence";
            t->next_run_ms = *next;
        }
    } catch (const std::invalid_argument& e) {
        return std::string("invalid schedule: ") + e.what();
    }
    t->status = TaskStatus::ACTIVE;
    std::string err = persist_locked(*t);
    if (err.empty() && events_) events_->event("task_resumed", "{\"task_id\":\"" + json::escape(id) + "\"}");
    return err;
}

std::string Scheduler::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto t = store_.get(id);
    if (!t) return "task " + id + " not found";
    t->status = TaskStatus::DONE;
    t->next_run_ms = 0;
    t->last_result = "cancelled";
    std::string err = persist_locked(*t);
    if (err.empty() && events_) events_->event("task_cancelled", "{\"task_id\":\"" + json::escape(id) + "\"}");
    return err;
}

std::optional<ScheduledTask> Scheduler::get(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return store_.get(id);
}

std::vector<ScheduledTask> Scheduler::list(const std::string& group_folder) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<ScheduledTask> out;
    for (auto& t : store_.all()) {
        if (group_folder.empty() || t.group_folder == group_folder) out.push_back(std::move(t));
    }
    std::sort(out.begin(), out.end(), [](const ScheduledTask& a, const ScheduledTask& b) {
        if (a.next_run_ms != b.next_run_ms) return a.next_run_ms < b.next_run_ms;
        return a.id < b.id;
    });
    return out;
}

size_t Scheduler::tick(CancelToken cancel) {
    std::lock_guard<std::mutex> lk(mu_);
    const int64_t now = clock_.now_ms();
    size_t fired = 0;

    for (auto t : store_.all()) {
        if (cancel.cancelled()) break;
        if (t.status != TaskStatus::ACTIVE) continue;

        if (t.next_run_ms == 0) {
            // Active without a next run: recompute, disabling the task if
            // the schedule is unusable.
            try {
                auto next = compute_next_run(t, now, tz_);
                if (!next) throw std::invalid_argument("no future occurrence");
                t.next_run_ms = *next;
                persist_locked(t);
            } catch (const std::invalid_argument& e) {
                t.status = TaskStatus::PAUSED;
                t.last_result = std::string("error: ") + e.what();
                log_warn("scheduler", "task " + t.id + " paused: " + e.what());
                persist_locked(t);
            }
            continue;
        }
        if (t.next_run_ms > now) continue;

        FireResult fr = fire_ ? fire_(t) : FireResult::RETRY;
        TaskRun run;
        run.task_id = t.id;
        run.run_at_ms = now;

        if (fr == FireResult::RETRY) {
            run.status = "deferred";
            (void)store_.append_run(run);
            continue;
        }
        if (fr == FireResult::DROP) {
            t.status = TaskStatus::PAUSED;
            t.last_result = "error: target group not registered";
            run.status = "rejected";
            run.detail = t.last_result;
            (void)store_.append_run(run);
            persist_locked(t);
            log_warn("scheduler", "task " + t.id + " paused: group " + t.group_folder + " is not registered");
            continue;
        }

        fired++;
        t.last_run_ms = now;
        if (t.kind == ScheduleKind::ONCE) {
            t.status = TaskStatus::DONE;
            t.next_run_ms = 0;
        } else {
            try {
                auto next = compute_next_run(t, now, tz_);
                if (!next) throw std::invalid_argument("no future occurrence");
                t.next_run_ms = *next;
            } catch (const std::invalid_argument& e) {
                t.status = TaskStatus::PAUSED;
                t.next_run_ms = 0;
                t.last_result = std::string("error: ") + e.what();
                log_warn("scheduler", "task " + t.id + " paused: " + e.what());
            }
        }
        run.status = "enqueued";
        std::string rerr = store_.append_run(run);
        if (!rerr.empty()) log_warn("scheduler", "run log append failed: " + rerr);
        persist_locked(t);

        if (events_) {
            json::ObjectBuilder p;
            p.set("task_id", t.id).set("group", t.group_folder)
             .set("run_at", now).set("next_run", t.next_run_ms)
             .set("status", task_status_name(t.status));
            events_->event("task_fired", p.str());
        }
        log_info("scheduler", "fired task " + t.id + " for " + t.group_folder);
    }
    return fired;
}

void Scheduler::arm_locked() {
    if (!running_.load()) return;
    CancelToken token = stopping_.token();
    timer_ = clock_.schedule_after(poll_ms_, [this, token]() {
        if (token.cancelled()) return;
        auto run = [this, token]() {
            (void)tick(token);
            std::lock_guard<std::mutex> lk(timer_mu_);
            arm_locked();
        };
        if (exec_) {
            if (!exec_->submit(PRIO_TASK, run)) return;
        } else {
            run();
        }
    });
}

void Scheduler::start(int64_t poll_ms, Executor* exec) {
    std::lock_guard<std::mutex> lk(timer_mu_);
    if (running_.exchange(true)) return;
    stopping_ = CancelSource{};
    poll_ms_ = std::max<int64_t>(1, poll_ms);
    exec_ = exec;
    log_info("scheduler", "started, poll " + std::to_string(poll_ms_) + "ms, zone " + tz_.name());
    arm_locked();
}

void Scheduler::stop() {
    std::lock_guard<std::mutex> lk(timer_mu_);
    if (!running_.exchange(false)) return;
    stopping_.cancel();
    if (timer_) clock_.cancel(timer_);
    timer_ = 0;
}

std::string Scheduler::flush() {
    std::lock_guard<std::mutex> lk(mu_);
    std::string err = store_.flush();
    if (!err.empty()) log_error("scheduler", "flush failed: " + err);
    return err;
}

} // namespace kestrel
