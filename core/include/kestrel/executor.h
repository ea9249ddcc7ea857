#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace kestrel {

// Work priorities: lower value runs first.
constexpr int32_t PRIO_CONTROL   = 0;    // drains, shutdown bookkeeping
constexpr int32_t PRIO_MESSAGE   = 100;  // user-originated wakes
constexpr int32_t PRIO_TASK      = 200;  // scheduled tasks
constexpr int32_t PRIO_HEARTBEAT = 300;  // self-check wakes

// ConcurrentPriorityQueue
// - Thread-safe push/pop
// - Blocking pop with shutdown()
// - Lower priority value => higher priority, FIFO among equals
template <typename T>
class ConcurrentPriorityQueue {
public:
    struct Item {
        int32_t priority{0};
        uint64_t seq{0};
        T value;
    };

private:
    struct Cmp {
        bool operator()(const Item& a, const Item& b) const {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.seq > b.seq;
        }
    };

public:
    // Returns false once shut down; the value is dropped.
    bool push(int32_t priority, T value) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return false;
        q_.push(Item{priority, seq_++, std::move(value)});
        cv_.notify_one();
        return true;
    }

    // Blocks until an item is available. After shutdown() the remaining items
    // are still handed out; returns false only when closed and empty.
    bool pop(Item& out) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&]{ return closed_ || !q_.empty(); });
        if (q_.empty()) return false;
        out = std::move(const_cast<Item&>(q_.top()));
        q_.pop();
        return true;
    }

    bool try_pop(Item& out) {
        std::lock_guard<std::mutex> lk(mu_);
        if (q_.empty()) return false;
        out = std::move(const_cast<Item&>(q_.top()));
        q_.pop();
        return true;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::priority_queue<Item, std::vector<Item>, Cmp> q_;
    uint64_t seq_{0};
    bool closed_{false};
};

// Runs blocking work off the dispatch path.
class Executor {
public:
    virtual ~Executor() = default;
    // Returns false if the executor no longer accepts work.
    virtual bool submit(int32_t priority, std::function<void()> fn) = 0;
};

class ThreadPoolExecutor : public Executor {
public:
    explicit ThreadPoolExecutor(int workers);
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    bool submit(int32_t priority, std::function<void()> fn) override;

    // Stops accepting work, runs what is queued, joins workers. Idempotent.
    void shutdown();

    size_t queued() const { return q_.size(); }

private:
    ConcurrentPriorityQueue<std::function<void()>> q_;
    std::vector<std::thread> threads_;
    std::mutex join_mu_;
};

// Queues work until run_all()/run_one() is called. For deterministic tests.
class ManualExecutor : public Executor {
public:
    bool submit(int32_t priority, std::function<void()> fn) override;
    bool run_one();
    size_t run_all();
    size_t queued() const { return q_.size(); }

private:
    ConcurrentPriorityQueue<std::function<void()>> q_;
};

} // namespace kestrel
