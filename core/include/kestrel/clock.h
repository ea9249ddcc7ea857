#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>
#include <vector>

namespace kestrel {

using TimerId = uint64_t;
using TimerFn = std::function<void()>;

// Time source plus one-shot timers. All times are epoch milliseconds.
// Timer callbacks never run while the clock's internal lock is held, so a
// callback may schedule or cancel other timers.
class Clock {
public:
    virtual ~Clock() = default;

    virtual int64_t now_ms() const = 0;
    virtual TimerId schedule_at(int64_t due_ms, TimerFn fn) = 0;
    // Returns false if the timer already fired or was never scheduled.
    virtual bool cancel(TimerId id) = 0;

    TimerId schedule_after(int64_t delay_ms, TimerFn fn) {
        return schedule_at(now_ms() + delay_ms, std::move(fn));
    }
};

// Wall-clock time with a dedicated timer thread.
class SystemClock : public Clock {
public:
    SystemClock();
    ~SystemClock() override;

    SystemClock(const SystemClock&) = delete;
    SystemClock& operator=(const SystemClock&) = delete;

    int64_t now_ms() const override;
    TimerId schedule_at(int64_t due_ms, TimerFn fn) override;
    bool cancel(TimerId id) override;

    // Stops the timer thread; pending timers are dropped. Idempotent.
    void stop();

    // Heap entries, cancelled ones included.
    size_t heap_entries() const;

private:
    struct Entry {
        int64_t due_ms;
        TimerId id;
    };
    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.due_ms != b.due_ms) return a.due_ms > b.due_ms;
            return a.id > b.id;
        }
    };

    void loop();
    void compact_locked();

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::priority_queue<Entry, std::vector<Entry>, Later> heap_;
    std::unordered_map<TimerId, TimerFn> fns_;
    TimerId next_id_{1};
    bool stopped_{false};
    std::thread thread_;
};

// Logical clock for deterministic tests: time only moves via advance()/set().
class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start_ms = 0) : now_(start_ms) {}

    int64_t now_ms() const override;
    TimerId schedule_at(int64_t due_ms, TimerFn fn) override;
    bool cancel(TimerId id) override;

    // Moves time forward by delta_ms, firing due timers in due order on the
    // calling thread. Timers scheduled by callbacks fire too if they fall due.
    void advance(int64_t delta_ms);
    void set(int64_t now_ms);

    size_t pending() const;

private:
    mutable std::mutex mu_;
    int64_t now_;
    std::multimap<std::pair<int64_t, TimerId>, TimerFn> timers_;
    TimerId next_id_{1};
};

// Exponential backoff: base_ms * mult^(attempt-1), capped at max_ms, plus
// up to jitter_ms of random jitter. attempt starts at 1.
int64_t backoff_delay_ms(int attempt, int64_t base_ms, int64_t mult, int64_t max_ms, int64_t jitter_ms = 0);

} // namespace kestrel
