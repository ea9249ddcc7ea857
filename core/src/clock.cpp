#include "kestrel/clock.h"
#include "kestrel/fsutil.h"

#include <chrono>

namespace kestrel {

static int64_t wall_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// --- SystemClock ---

SystemClock::SystemClock() : thread_([this] { loop(); }) {}

SystemClock::~SystemClock() {
    stop();
}

int64_t SystemClock::now_ms() const {
    return wall_ms();
}

TimerId SystemClock::schedule_at(int64_t due_ms, TimerFn fn) {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopped_) return 0;
    TimerId id = next_id_++;
    fns_[id] = std::move(fn);
    heap_.push(Entry{due_ms, id});
    cv_.notify_one();
    return id;
}

bool SystemClock::cancel(TimerId id) {
    std::lock_guard<std::mutex> lk(mu_);
    if (fns_.erase(id) == 0) return false;
    // Dead entries are skipped when they surface; rebuild once they dominate.
    if (heap_.size() > 64 && heap_.size() > 2 * fns_.size()) compact_locked();
    return true;
}

void SystemClock::compact_locked() {
    std::vector<Entry> live;
    live.reserve(fns_.size());
    while (!heap_.empty()) {
        if (fns_.count(heap_.top().id)) live.push_back(heap_.top());
        heap_.pop();
    }
    for (const Entry& e : live) heap_.push(e);
}

size_t SystemClock::heap_entries() const {
    std::lock_guard<std::mutex> lk(mu_);
    return heap_.size();
}

void SystemClock::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopped_) return;
        stopped_ = true;
        fns_.clear();
        cv_.notify_all();
    }
    if (thread_.joinable()) thread_.join();
}

void SystemClock::loop() {
    std::unique_lock<std::mutex> lk(mu_);
    while (!stopped_) {
        if (heap_.empty()) {
            cv_.wait(lk, [&] { return stopped_ || !heap_.empty(); });
            continue;
        }
        Entry top = heap_.top();
        auto fit = fns_.find(top.id);
        if (fit == fns_.end()) {
            heap_.pop();
            continue;
        }
        int64_t wait = top.due_ms - wall_ms();
        if (wait > 0) {
            cv_.wait_for(lk, std::chrono::milliseconds(wait));
            continue;
        }
        heap_.pop();
        TimerFn fn = std::move(fit->second);
        fns_.erase(fit);
        lk.unlock();
        fn();
        lk.lock();
    }
}

// --- ManualClock ---

int64_t ManualClock::now_ms() const {
    std::lock_guard<std::mutex> lk(mu_);
    return now_;
}

TimerId ManualClock::schedule_at(int64_t due_ms, TimerFn fn) {
    std::lock_guard<std::mutex> lk(mu_);
    TimerId id = next_id_++;
    timers_.emplace(std::make_pair(due_ms, id), std::move(fn));
    return id;
}

bool ManualClock::cancel(TimerId id) {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->first.second == id) {
            timers_.erase(it);
            return true;
        }
    }
    return false;
}

void ManualClock::advance(int64_t delta_ms) {
    int64_t target;
    {
        std::lock_guard<std::mutex> lk(mu_);
        target = now_ + delta_ms;
    }
    set(target);
}

void ManualClock::set(int64_t target) {
    while (true) {
        TimerFn fn;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = timers_.begin();
            if (it == timers_.end() || it->first.first > target) {
                if (target > now_) now_ = target;
                return;
            }
            if (it->first.first > now_) now_ = it->first.first;
            fn = std::move(it->second);
            timers_.erase(it);
        }
        fn();
    }
}

size_t ManualClock::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return timers_.size();
}

int64_t backoff_delay_ms(int attempt, int64_t base_ms, int64_t mult, int64_t max_ms, int64_t jitter_ms) {
    if (base_ms < 0) base_ms = 0;
    if (mult < 1) mult = 1;
    if (max_ms < 0) max_ms = 0;
    if (jitter_ms < 0) jitter_ms = 0;
    int exp = attempt - 1;
    if (exp < 0) exp = 0;
    long double d = (long double)base_ms;
    for (int i = 0; i < exp && (max_ms == 0 || d < (long double)max_ms); i++) d *= (long double)mult;
    int64_t delay = (int64_t)d;
    if (delay > max_ms && max_ms > 0) delay = max_ms;
    if (jitter_ms > 0) delay += (int64_t)(secure_rand32() % (uint64_t)(jitter_ms + 1));
    return delay;
}

} // namespace kestrel
