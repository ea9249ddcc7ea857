#pragma once

// Scriptable ProcessLauncher for session and queue tests.

#include "kestrel/proc.h"
#include "kestrel/session_manager.h"

#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct FakeScript {
    std::mutex mu;
    std::string folder;
    std::string stdin_data;
    std::string pending_out;
    std::optional<int> exit_code;
    bool exit_on_term{true};
    bool terminated{false};
    bool killed{false};
    int reads_until_exit{-1};   // >= 0: exits with 0 after that many reads

    void emit(const std::string& s) {
        std::lock_guard<std::mutex> lk(mu);
        pending_out += s;
    }
    void exit_with(int code) {
        std::lock_guard<std::mutex> lk(mu);
        if (!exit_code) exit_code = code;
    }
    bool exited() {
        std::lock_guard<std::mutex> lk(mu);
        return exit_code.has_value();
    }
};

class FakeProcess : public kestrel::ProcessHandle {
public:
    FakeProcess(std::shared_ptr<FakeScript> sc, int pid) : sc_(std::move(sc)), pid_(pid) {}

    int pid() const override { return pid_; }

    kestrel::ReadStatus read_some(std::string& out, int wait_ms) override {
        {
            std::lock_guard<std::mutex> lk(sc_->mu);
            if (sc_->reads_until_exit == 0 && !sc_->exit_code) sc_->exit_code = 0;
            if (sc_->reads_until_exit > 0) sc_->reads_until_exit--;
            if (!sc_->pending_out.empty()) {
                out += sc_->pending_out;
                sc_->pending_out.clear();
                return kestrel::ReadStatus::DATA;
            }
            if (sc_->exit_code) return kestrel::ReadStatus::END;
        }
        if (wait_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(std::min(wait_ms, 5)));
        return kestrel::ReadStatus::NONE;
    }

    std::optional<int> poll_exit() override {
        std::lock_guard<std::mutex> lk(sc_->mu);
        return sc_->exit_code;
    }

    int wait() override {
        while (true) {
            if (auto c = poll_exit()) return *c;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void terminate() override {
        std::lock_guard<std::mutex> lk(sc_->mu);
        sc_->terminated = true;
        if (sc_->exit_on_term && !sc_->exit_code) sc_->exit_code = 143;
    }

    void kill() override {
        std::lock_guard<std::mutex> lk(sc_->mu);
        sc_->killed = true;
        if (!sc_->exit_code) sc_->exit_code = 137;
    }

private:
    std::shared_ptr<FakeScript> sc_;
    int pid_;
};

class FakeLauncher : public kestrel::ProcessLauncher {
public:
    std::unique_ptr<kestrel::ProcessHandle> spawn(const kestrel::SpawnSpec& spec, std::string* err) override {
        if (on_spawn) on_spawn();
        std::lock_guard<std::mutex> lk(mu_);
        if (fail_remaining > 0) {
            fail_remaining--;
            if (err) *err = "fake spawn failure";
            return nullptr;
        }
        auto sc = std::make_shared<FakeScript>();
        for (const auto& kv : spec.env) {
            if (kv.first == "KESTREL_GROUP_FOLDER") sc->folder = kv.second;
        }
        sc->stdin_data = spec.stdin_data;
        sc->exit_on_term = exit_on_term;
        sc->reads_until_exit = reads_until_exit;
        specs.push_back(spec);
        scripts.push_back(sc);
        return std::make_unique<FakeProcess>(sc, 1000 + (int)scripts.size());
    }

    size_t spawn_count() {
        std::lock_guard<std::mutex> lk(mu_);
        return scripts.size();
    }

    std::shared_ptr<FakeScript> script(size_t i) {
        std::lock_guard<std::mutex> lk(mu_);
        return i < scripts.size() ? scripts[i] : nullptr;
    }

    std::shared_ptr<FakeScript> last() {
        std::lock_guard<std::mutex> lk(mu_);
        return scripts.empty() ? nullptr : scripts.back();
    }

    // Settings applied to processes spawned afterwards.
    int fail_remaining{0};
    bool exit_on_term{true};
    int reads_until_exit{-1};
    // Runs before each spawn, outside the launcher lock.
    std::function<void()> on_spawn;

    std::vector<kestrel::SpawnSpec> specs;
    std::vector<std::shared_ptr<FakeScript>> scripts;

private:
    std::mutex mu_;
};

// Wraps a real policy and counts per-mount validations.
class CountingMountPolicy : public kestrel::MountPolicy {
public:
    explicit CountingMountPolicy(kestrel::MountPolicy& inner) : inner_(inner) {}
    kestrel::MountSetResult validate(const kestrel::Group& g) override {
        calls++;
        kestrel::MountSetResult r = inner_.validate(g);
        mounts_checked += r.decisions.size();
        return r;
    }
    size_t calls{0};
    size_t mounts_checked{0};

private:
    kestrel::MountPolicy& inner_;
};
