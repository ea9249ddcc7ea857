#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace kestrel {

namespace detail {
struct CancelState {
    std::atomic<bool> cancelled{false};
    std::mutex mu;
    std::vector<std::function<void()>> callbacks;
};
} // namespace detail

// Read side of a cancellation flag. Cheap to copy; a default-constructed
// token is never cancelled.
class CancelToken {
public:
    CancelToken() = default;
    explicit CancelToken(std::shared_ptr<detail::CancelState> st) : st_(std::move(st)) {}

    bool cancelled() const { return st_ && st_->cancelled.load(); }

    // Runs fn immediately if already cancelled, otherwise on cancel().
    void on_cancel(std::function<void()> fn) const {
        if (!st_) return;
        {
            std::lock_guard<std::mutex> lk(st_->mu);
            if (!st_->cancelled.load()) {
                st_->callbacks.push_back(std::move(fn));
                return;
            }
        }
        fn();
    }

private:
    std::shared_ptr<detail::CancelState> st_;
};

class CancelSource {
public:
    CancelSource() : st_(std::make_shared<detail::CancelState>()) {}

    CancelToken token() const { return CancelToken(st_); }
    bool cancelled() const { return st_->cancelled.load(); }

    // Idempotent: callbacks run once, on the first call.
    void cancel() {
        std::vector<std::function<void()>> cbs;
        {
            std::lock_guard<std::mutex> lk(st_->mu);
            if (st_->cancelled.exchange(true)) return;
            cbs.swap(st_->callbacks);
        }
        for (auto& cb : cbs) cb();
    }

private:
    std::shared_ptr<detail::CancelState> st_;
};

} // namespace kestrel
