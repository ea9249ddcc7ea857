#include "kestrel/executor.h"
#include "kestrel/log.h"

#include <exception>

namespace kestrel {

static void run_guarded(std::function<void()>& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        log_error("executor", std::string("task threw: ") + e.what());
    }
}

ThreadPoolExecutor::ThreadPoolExecutor(int workers) {
    if (workers < 1) workers = 1;
    threads_.reserve((size_t)workers);
    for (int i = 0; i < workers; i++) {
        threads_.emplace_back([this]() {
            ConcurrentPriorityQueue<std::function<void()>>::Item it;
            while (q_.pop(it)) {
                run_guarded(it.value);
            }
        });
    }
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    shutdown();
}

bool ThreadPoolExecutor::submit(int32_t priority, std::function<void()> fn) {
    return q_.push(priority, std::move(fn));
}

void ThreadPoolExecutor::shutdown() {
    q_.shutdown();
    std::lock_guard<std::mutex> lk(join_mu_);
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

bool ManualExecutor::submit(int32_t priority, std::function<void()> fn) {
    return q_.push(priority, std::move(fn));
}

bool ManualExecutor::run_one() {
    ConcurrentPriorityQueue<std::function<void()>>::Item it;
    if (!q_.try_pop(it)) return false;
    run_guarded(it.value);
    return true;
}

size_t ManualExecutor::run_all() {
    size_t n = 0;
    while (run_one()) n++;
    return n;
}

} // namespace kestrel
