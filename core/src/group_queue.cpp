#include "kestrel/group_queue.h"
#include "kestrel/json_util.h"

#include <algorithm>

namespace kestrel {

static int32_t priority_for(WakeKind k) {
    switch (k) {
        case WakeKind::MESSAGE: return PRIO_MESSAGE;
        case WakeKind::TASK: return PRIO_TASK;
        case WakeKind::HEARTBEAT: return PRIO_HEARTBEAT;
    }
    return PRIO_TASK;
}

GroupQueue::GroupQueue(HostState& state, SessionManager& sessions, Executor& exec, Clock& clock,
                       QueueOptions opt, Hooks hooks, EventLog* events)
    : state_(state), sessions_(sessions), exec_(exec), clock_(clock),
      opt_(opt), hooks_(std::move(hooks)), events_(events) {
    if (opt_.max_concurrent < 1) opt_.max_concurrent = 1;
}

GroupQueue::~GroupQueue() { shutdown(); }

bool GroupQueue::enqueue(const std::string& folder, WakeEntry e) {
    int32_t prio = priority_for(e.kind);
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (shutting_down_) return false;
        Slot& slot = slots_[folder];
        if (e.kind != WakeKind::MESSAGE && !e.task_id.empty()) {
            for (const auto& q : slot.q) {
                if (q.task_id == e.task_id) {
                    log_debug("queue", folder + ": task " + e.task_id + " already queued");
                    return true;
                }
            }
        }
        if (e.enqueued_ms == 0) e.enqueued_ms = clock_.now_ms();
        slot.q.push_back(std::move(e));
    }
    return exec_.submit(prio, [this, folder]() { process(folder); });
}

void GroupQueue::kick(const std::string& folder) {
    int32_t prio = PRIO_MESSAGE;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = slots_.find(folder);
        if (it == slots_.end() || it->second.q.empty()) return;
        prio = priority_for(it->second.q.front().kind);
    }
    if (!exec_.submit(prio, [this, folder]() { process(folder); })) {
        log_debug("queue", folder + ": executor closed, not admitting");
    }
}

void GroupQueue::drain_if_idle(const std::string& folder) {
    if (sessions_.is_live(folder)) return;
    kick(folder);
}

void GroupQueue::add_waiting_locked(const std::string& folder, const Slot& slot) {
    auto& list = (!slot.q.empty() && slot.q.front().kind == WakeKind::HEARTBEAT) ? waiting_low_ : waiting_;
    if (std::find(waiting_.begin(), waiting_.end(), folder) != waiting_.end()) return;
    if (std::find(waiting_low_.begin(), waiting_low_.end(), folder) != waiting_low_.end()) return;
    list.push_back(folder);
}

void GroupQueue::admit_waiting() {
    std::vector<std::string> next;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (shutting_down_) return;
        size_t free_slots = active_ < (size_t)opt_.max_concurrent ? (size_t)opt_.max_concurrent - active_ : 0;
        while (free_slots > 0 && (!waiting_.empty() || !waiting_low_.empty())) {
            auto& list = !waiting_.empty() ? waiting_ : waiting_low_;
            next.push_back(list.front());
            list.pop_front();
            free_slots--;
        }
    }
    for (const auto& f : next) kick(f);
}

void GroupQueue::drop_batch(const std::string& folder, const std::vector<WakeEntry>& batch, const std::string& why) {
    log_error("queue", folder + ": dropping " + std::to_string(batch.size()) + " entr" +
              (batch.size() == 1 ? "y" : "ies") + ": " + why);
    if (events_) {
        json::ObjectBuilder p;
        p.set("group", folder).set("entries", (int64_t)batch.size()).set("reason", why);
        events_->event("queue_dropped", p.str());
    }
    bool user_facing = std::any_of(batch.begin(), batch.end(),
                                   [](const WakeEntry& e) { return e.kind == WakeKind::MESSAGE; });
    if (user_facing && hooks_.notify && !batch.empty()) {
        hooks_.notify(batch.front().group_jid, "Sorry, I could not start a session for this chat (" + why + ").");
    }
}

void GroupQueue::process(const std::string& folder) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        Slot& slot = slots_[folder];
        if (slot.busy) {
            slot.rerun = true;
            return;
        }
        slot.busy = true;
        slot.rerun = false;
    }
    // Stops unless a kick arrived while the session was being inspected.
    auto release = [&]() {
        std::lock_guard<std::mutex> lk(mu_);
        Slot& slot = slots_[folder];
        if (slot.rerun) {
            slot.rerun = false;
            return false;
        }
        slot.busy = false;
        return true;
    };

    while (true) {
        WakeEntry front;
        {
            std::lock_guard<std::mutex> lk(mu_);
            Slot& slot = slots_[folder];
            if (shutting_down_ || slot.q.empty()) {
                slot.busy = false;
                return;
            }
            front = slot.q.front();
        }

        if (sessions_.accepting(folder)) {
            if (sessions_.deliver(folder, front, cancel_.token())) {
                std::lock_guard<std::mutex> lk(mu_);
                Slot& slot = slots_[folder];
                if (!slot.q.empty()) slot.q.pop_front();
                continue;
            }
            // Session is draining: no retry, the entry spawns a fresh
            // session once this one has ended.
            log_info("queue", folder + ": live session not accepting input, will respawn after it ends");
            if (release()) return;
            continue;
        }
        if (sessions_.is_live(folder)) {
            // starting or draining; on_session_ended re-kicks
            if (release()) return;
            continue;
        }

        std::vector<WakeEntry> batch;
        {
            std::lock_guard<std::mutex> lk(mu_);
            Slot& slot = slots_[folder];
            if (slot.active || slot.retry_timer) {
                slot.busy = false;
                return;
            }
            if (active_ >= (size_t)opt_.max_concurrent) {
                add_waiting_locked(folder, slot);
                slot.busy = false;
                log_debug("queue", folder + ": at concurrency limit (" + std::to_string(active_) + "), waiting");
                return;
            }
            active_++;
            slot.active = true;
            if (slot.q.front().kind == WakeKind::MESSAGE) {
                while (!slot.q.empty() && slot.q.front().kind == WakeKind::MESSAGE) {
                    batch.push_back(std::move(slot.q.front()));
                    slot.q.pop_front();
                }
            } else {
                batch.push_back(std::move(slot.q.front()));
                slot.q.pop_front();
            }
        }

        auto group = state_.group_by_folder(folder);
        StartResult r;
        if (!group) r.error = "group " + folder + " is not registered";
        else r = sessions_.start(*group, batch, cancel_.token());

        if (r.ok) {
            std::lock_guard<std::mutex> lk(mu_);
            slots_[folder].retries = 0;
            continue;
        }

        bool requeue = false;
        bool retry = false;
        int attempt = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            Slot& slot = slots_[folder];
            // A forced shutdown may already have ended the starting session.
            if (slot.active) {
                slot.active = false;
                active_--;
            }
            if (shutting_down_ || r.error.rfind("session already live", 0) == 0) {
                requeue = true;
            } else if (r.retryable) {
                slot.retries++;
                attempt = slot.retries;
                if (attempt <= opt_.max_retries) {
                    requeue = true;
                    retry = true;
                } else {
                    slot.retries = 0;
                }
            }
            if (requeue) {
                for (auto it = batch.rbegin(); it != batch.rend(); ++it) slot.q.push_front(std::move(*it));
            }
            if (retry) {
                int64_t delay = backoff_delay_ms(attempt, opt_.retry_base_ms, 2, opt_.retry_base_ms * 64);
                log_warn("queue", folder + ": start failed (" + r.error + "), retry " + std::to_string(attempt) +
                         "/" + std::to_string(opt_.max_retries) + " in " + std::to_string(delay) + "ms");
                slot.retry_timer = clock_.schedule_after(delay, [this, folder]() {
                    {
                        std::lock_guard<std::mutex> lk2(mu_);
                        slots_[folder].retry_timer = 0;
                    }
                    kick(folder);
                });
            }
            if (requeue) slot.busy = false;
        }
        admit_waiting();
        if (requeue) return;

        drop_batch(folder, batch, r.retryable ? "start failed after " + std::to_string(opt_.max_retries) +
                                                " retries: " + r.error
                                              : r.error);
    }
}

void GroupQueue::on_session_ended(const std::string& folder) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        Slot& slot = slots_[folder];
        if (slot.active) {
            slot.active = false;
            active_--;
        }
        if (shutting_down_) return;
    }
    kick(folder);
    admit_waiting();
}

FireResult GroupQueue::fire_task(const ScheduledTask& t) {
    auto group = state_.group_by_folder(t.group_folder);
    if (!group) {
        log_warn("queue", "task " + t.id + " targets unknown group " + t.group_folder);
        return FireResult::DROP;
    }
    WakeEntry e;
    e.group_jid = group->jid;
    e.kind = t.suppress_max_chars >= 0 ? WakeKind::HEARTBEAT : WakeKind::TASK;
    e.text = t.prompt;
    e.task_id = t.id;
    e.context_mode = t.context_mode;
    e.suppress_max_chars = t.suppress_max_chars;
    e.enqueued_ms = clock_.now_ms();
    return enqueue(t.group_folder, std::move(e)) ? FireResult::ENQUEUED : FireResult::RETRY;
}

void GroupQueue::shutdown() {
    std::vector<TimerId> timers;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (shutting_down_) return;
        shutting_down_ = true;
        for (auto& kv : slots_) {
            if (kv.second.retry_timer) timers.push_back(kv.second.retry_timer);
            kv.second.retry_timer = 0;
        }
    }
    for (TimerId id : timers) clock_.cancel(id);
    cancel_.cancel();
    log_info("queue", "shut down; new entries are rejected");
}

size_t GroupQueue::active_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return active_;
}

size_t GroupQueue::pending(const std::string& folder) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = slots_.find(folder);
    return it == slots_.end() ? 0 : it->second.q.size();
}

size_t GroupQueue::waiting_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return waiting_.size() + waiting_low_.size();
}

} // namespace kestrel
