#include "test_common.h"
#include "fake_process.h"

#include "kestrel/fsutil.h"
#include "kestrel/ipc.h"
#include "kestrel/session_manager.h"

#include <functional>
#include <tuple>

using namespace kestrel;
namespace fs = std::filesystem;

struct Ended {
    std::string folder;
    SessionState state;
    std::string reason;
};

struct Rig {
    fs::path dir;
    HostState state;
    FakeLauncher launcher;
    AllowlistMountPolicy policy;
    ManualClock clock{0};
    ManualExecutor exec;
    std::vector<std::pair<std::string, std::string>> sent;
    std::vector<Ended> ended;
    std::unique_ptr<SessionManager> sm;

    Rig(const std::string& name, const std::function<void(SessionOptions&)>& tweak = {})
        : dir(fresh_dir(name)), policy(dir / "mount-allowlist.json") {
        SessionOptions so;
        so.idle_ms = 5000;
        so.hard_timeout_ms = 60000;
        so.grace_ms = 1000;
        so.agent_argv = {"agent-runtime"};
        so.groups_dir = dir / "groups";
        so.ipc_root = dir / "ipc";
        so.self_pump = false;
        if (tweak) tweak(so);

        SessionManager::Hooks h;
        h.send_message = [this](const std::string& jid, const std::string& text) { sent.emplace_back(jid, text); };
        h.on_ended = [this](const std::string& folder, SessionState st, const std::string& reason) {
            ended.push_back(Ended{folder, st, reason});
        };
        sm = std::make_unique<SessionManager>(state, launcher, policy, clock, exec, so, h);
    }

    Group add_group(const std::string& folder) {
        Group g;
        g.jid = "spool:" + folder;
        g.name = folder;
        g.folder = folder;
        if (std::string err = state.register_group(g); !err.empty()) die("register_group: " + err);
        return g;
    }
};

static WakeEntry message(const std::string& text, int64_t ts) {
    WakeEntry e;
    e.kind = WakeKind::MESSAGE;
    e.sender = "spool:alice";
    e.sender_name = "Alice";
    e.text = text;
    e.message_ts_ms = ts;
    return e;
}

static std::string result_block(const std::string& json) {
    return std::string("noise before\n") + OUTPUT_START_MARKER + json + OUTPUT_END_MARKER + "\n";
}

static bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

static void test_lifecycle_and_results() {
    Rig r("session_lifecycle");
    Group g = r.add_group("family");

    StartResult res = r.sm->start(g, {message("what is for dinner", 1000)});
    expect_true(res.ok, "start should succeed: " + res.error);
    expect_eq_ll((long long)r.launcher.spawn_count(), 1, "one spawn");
    auto info = r.sm->info("family");
    expect_true(info && info->state == SessionState::RUNNING, "session running");
    expect_true(r.sm->accepting("family"), "running session accepts input");

    const SpawnSpec& spec = r.launcher.specs[0];
    expect_eq_str(spec.cwd, (r.dir / "groups" / "family").string(), "cwd is the group workspace");
    expect_true(fs::is_directory(spec.cwd), "workspace created");
    expect_true(fs::is_directory(ipc::input_dir(r.dir / "ipc", "family")), "input dir created");
    bool is_main_flag = false;
    for (const auto& kv : spec.env) {
        if (kv.first == "KESTREL_IS_MAIN") is_main_flag = kv.second == "1";
    }
    expect_true(!is_main_flag, "non-main group flagged as such");
    auto sc = r.launcher.last();
    expect_true(contains(sc->stdin_data, "what is for dinner"), "prompt carries the message");
    expect_true(contains(sc->stdin_data, "\"isScheduledTask\":false"), "message batch is not a task");
    expect_true(!contains(sc->stdin_data, "sessionId"), "first spawn has no session id");

    StartResult dup = r.sm->start(g, {message("again", 1001)});
    expect_true(!dup.ok && !dup.retryable, "second start for the same group refused");
    expect_true(contains(dup.error, "already live"), "duplicate start reason");

    // Follow-up delivered into the live session; a cancelled caller writes nothing.
    CancelSource gone;
    gone.cancel();
    expect_true(!r.sm->deliver("family", message("never", 1500), gone.token()), "cancelled delivery refused");
    expect_true(r.sm->deliver("family", message("and dessert?", 2000)), "deliver into running session");
    expect_eq_ll((long long)list_dir_json(ipc::input_dir(r.dir / "ipc", "family")).size(), 1, "one input file");

    // Result routing with internal reasoning stripped.
    sc->emit(result_block("{\"status\":\"success\",\"result\":\"Pasta <internal>user asked twice</internal>tonight\","
                          "\"newSessionId\":\"sess-1\"}"));
    expect_true(r.sm->pump("family"), "pump keeps a live session");
    expect_eq_ll((long long)r.sent.size(), 1, "one result routed");
    expect_eq_str(r.sent[0].first, "spool:family", "result goes to the group chat");
    expect_eq_str(r.sent[0].second, "Pasta tonight", "internal block stripped");

    // A result split across reads is still found.
    std::string block = result_block("{\"status\":\"success\",\"result\":\"split\"}");
    sc->emit(block.substr(0, 20));
    (void)r.sm->pump("family");
    sc->emit(block.substr(20));
    (void)r.sm->pump("family");
    expect_eq_ll((long long)r.sent.size(), 2, "split block reassembled");

    // Idle timeout drains with the close sentinel.
    r.clock.advance(5001);
    info = r.sm->info("family");
    expect_true(info && info->state == SessionState::DRAINING, "idle session draining");
    expect_eq_str(info->reason, "idle-timeout", "drain reason");
    expect_true(fs::exists(ipc::input_dir(r.dir / "ipc", "family") / "_close"), "close sentinel written");
    expect_true(!r.sm->accepting("family"), "draining session refuses input");
    expect_true(!r.sm->deliver("family", message("late", 9000)), "deliver refused while draining");

    sc->exit_with(0);
    expect_true(!r.sm->pump("family"), "pump reports the exit");
    expect_eq_ll((long long)r.ended.size(), 1, "on_ended fired once");
    expect_true(r.ended[0].state == SessionState::TERMINATED, "clean exit is terminated");
    expect_eq_str(r.ended[0].reason, "idle-timeout", "final reason kept");
    expect_eq_ll((long long)r.sm->live_count(), 0, "live table empty");
    expect_eq_ll((long long)r.sent.size(), 2, "no failure notice after results");

    SessionMarker m = r.state.session_marker("family");
    expect_eq_str(m.session_id, "sess-1", "session id persisted");
    expect_eq_ll(m.last_cursor_ms, 2000, "cursor advanced to newest delivered message");

    // The next spawn resumes the conversation and starts with a clean input area.
    res = r.sm->start(g, {message("hi again", 3000)});
    expect_true(res.ok, "restart: " + res.error);
    expect_true(contains(r.launcher.last()->stdin_data, "\"sessionId\":\"sess-1\""), "session resumed");
    expect_true(!fs::exists(ipc::input_dir(r.dir / "ipc", "family") / "_close"), "stale sentinel removed");
    expect_eq_ll((long long)list_dir_json(ipc::input_dir(r.dir / "ipc", "family")).size(), 0, "stale input removed");
}

static void test_isolated_task() {
    Rig r("session_isolated");
    Group g = r.add_group("ops");
    expect_true(r.state.save_session_marker("ops", SessionMarker{"conv-7", 0}).empty(), "seed marker");

    WakeEntry t;
    t.kind = WakeKind::TASK;
    t.task_id = "task-1";
    t.text = "summarize the logs";
    t.context_mode = "isolated";
    StartResult res = r.sm->start(g, {t});
    expect_true(res.ok, "task start: " + res.error);
    auto sc = r.launcher.last();
    expect_true(contains(sc->stdin_data, "summarize the logs"), "task prompt passed verbatim");
    expect_true(contains(sc->stdin_data, "\"taskId\":\"task-1\""), "task id passed");
    expect_true(contains(sc->stdin_data, "\"isScheduledTask\":true"), "flagged as scheduled");
    expect_true(!contains(sc->stdin_data, "conv-7"), "isolated task does not resume the group session");

    sc->emit(result_block("{\"status\":\"success\",\"result\":\"done\",\"newSessionId\":\"throwaway\"}"));
    sc->exit_with(0);
    expect_true(!r.sm->pump("ops"), "task session finished");
    expect_eq_str(r.state.session_marker("ops").session_id, "conv-7", "isolated run keeps the group session id");
}

static void test_hard_timeout() {
    Rig r("session_hard", [](SessionOptions& so) {
        so.idle_ms = 100000;
        so.hard_timeout_ms = 20000;
    });
    Group g = r.add_group("busy");
    expect_true(r.sm->start(g, {message("long job", 1)}).ok, "start");
    auto sc = r.launcher.last();

    // Activity keeps resetting the idle timer but not the hard deadline.
    for (int i = 0; i < 4; i++) {
        r.clock.advance(4000);
        sc->emit("working...\n");
        expect_true(r.sm->pump("busy"), "still alive");
    }
    r.clock.advance(4001);
    expect_true(sc->terminated, "SIGTERM sent at the hard deadline");
    expect_true(!r.sm->pump("busy"), "terminated process reaped");
    expect_eq_ll((long long)r.ended.size(), 1, "ended once");
    expect_true(r.ended[0].state == SessionState::KILLED, "hard timeout ends killed");
    expect_eq_str(r.ended[0].reason, "hard-timeout", "hard timeout reason");
    expect_eq_ll((long long)r.sent.size(), 1, "failure notice sent");
    expect_true(contains(r.sent[0].second, "went wrong"), "notice text");
}

static void test_sigkill_escalation() {
    Rig r("session_escalate");
    r.launcher.exit_on_term = false;
    Group g = r.add_group("stubborn");
    expect_true(r.sm->start(g, {message("x", 1)}).ok, "start");
    auto sc = r.launcher.last();

    r.clock.advance(5001);   // idle -> draining, close sentinel
    expect_true(!sc->terminated, "grace period before SIGTERM");
    r.clock.advance(1000);   // grace over -> SIGTERM
    expect_true(sc->terminated, "SIGTERM after grace");
    expect_true(!sc->exited(), "process ignores SIGTERM");
    r.clock.advance(1000);   // second grace -> SIGKILL
    expect_true(sc->killed, "SIGKILL after second grace");
    expect_true(!r.sm->pump("stubborn"), "killed process reaped");
    expect_true(r.ended[0].state == SessionState::TERMINATED, "idle drain that needed signals is not a kill");
    expect_eq_str(r.ended[0].reason, "idle-timeout", "reason stays idle-timeout");
}

static void test_output_cap() {
    Rig r("session_cap", [](SessionOptions& so) { so.max_output_bytes = 64; });
    Group g = r.add_group("chatty");
    expect_true(r.sm->start(g, {message("talk", 1)}).ok, "start");
    auto sc = r.launcher.last();
    sc->emit(std::string(100, 'x'));
    expect_true(!r.sm->pump("chatty"), "capped session reaped");
    expect_true(sc->terminated, "capped process terminated");
    expect_true(r.ended[0].state == SessionState::KILLED, "output cap ends killed");
    expect_eq_str(r.ended[0].reason, "output-cap", "output cap reason");
}

static void test_failure_notice() {
    Rig r("session_fail");
    Group g = r.add_group("crashy");
    expect_true(r.sm->start(g, {message("boom", 1)}).ok, "start");
    r.launcher.last()->exit_with(3);
    expect_true(!r.sm->pump("crashy"), "crashed session reaped");
    expect_true(r.ended[0].state == SessionState::FAILED, "nonzero exit fails");
    expect_eq_str(r.ended[0].reason, "exit code 3", "exit code in reason");
    expect_eq_ll((long long)r.sent.size(), 1, "user told about the failure");

    // A runtime-reported error without any result also notifies.
    expect_true(r.sm->start(g, {message("again", 2)}).ok, "restart");
    auto sc = r.launcher.last();
    sc->emit(result_block("{\"status\":\"error\",\"error\":\"model unavailable\"}"));
    sc->exit_with(0);
    expect_true(!r.sm->pump("crashy"), "reaped");
    expect_eq_ll((long long)r.sent.size(), 2, "runtime error notified");
}

static void test_heartbeat_suppression() {
    Rig r("session_heartbeat");
    Group g = r.add_group("home");

    WakeEntry hb;
    hb.kind = WakeKind::HEARTBEAT;
    hb.task_id = "heartbeat-home";
    hb.text = "check in";
    hb.suppress_max_chars = 300;

    expect_true(r.sm->start(g, {hb}).ok, "heartbeat start");
    auto sc = r.launcher.last();
    sc->emit(result_block("{\"status\":\"success\",\"result\":\"HEARTBEAT_OK\"}"));
    (void)r.sm->pump("home");
    expect_eq_ll((long long)r.sent.size(), 0, "bare sentinel suppressed");

    sc->emit(result_block("{\"status\":\"success\",\"result\":\"The backup failed last night.\"}"));
    (void)r.sm->pump("home");
    expect_eq_ll((long long)r.sent.size(), 1, "real content delivered");

    sc->exit_with(0);
    expect_true(!r.sm->pump("home"), "reaped");

    // A failing heartbeat stays quiet.
    expect_true(r.sm->start(g, {hb}).ok, "second heartbeat");
    r.launcher.last()->exit_with(1);
    expect_true(!r.sm->pump("home"), "reaped");
    expect_eq_ll((long long)r.sent.size(), 1, "no failure notice for a heartbeat");

    // A user message delivered into a heartbeat session lifts suppression.
    expect_true(r.sm->start(g, {hb}).ok, "third heartbeat");
    sc = r.launcher.last();
    expect_true(r.sm->deliver("home", message("are you there?", 50)), "deliver");
    sc->emit(result_block("{\"status\":\"success\",\"result\":\"HEARTBEAT_OK\"}"));
    (void)r.sm->pump("home");
    expect_eq_ll((long long)r.sent.size(), 2, "reply to a user is never suppressed");
    sc->exit_with(0);
    expect_true(!r.sm->pump("home"), "reaped");

    // A heartbeat delivered into a live message session applies its threshold.
    expect_true(r.sm->start(g, {message("plan the weekend", 60)}).ok, "message start");
    sc = r.launcher.last();
    sc->emit(result_block("{\"status\":\"success\",\"result\":\"Hiking on Saturday.\"}"));
    (void)r.sm->pump("home");
    expect_eq_ll((long long)r.sent.size(), 3, "message reply sent");
    expect_true(r.sm->deliver("home", hb), "heartbeat delivered live");
    sc->emit(result_block("{\"status\":\"success\",\"result\":\"HEARTBEAT_OK\"}"));
    (void)r.sm->pump("home");
    expect_eq_ll((long long)r.sent.size(), 3, "live heartbeat sentinel suppressed");
    expect_true(r.sm->deliver("home", message("and Sunday?", 70)), "follow-up message");
    sc->emit(result_block("{\"status\":\"success\",\"result\":\"Rest.\"}"));
    (void)r.sm->pump("home");
    expect_eq_ll((long long)r.sent.size(), 4, "message after heartbeat delivered");
}

static void test_start_failures() {
    Rig r("session_start_fail");
    Group g = r.add_group("mounty");
    g.additional_mounts.push_back(AdditionalMount{(r.dir / "data").string(), "data", true});
    expect_true(r.state.register_group(g).empty(), "update group");

    StartResult res = r.sm->start(g, {message("hi", 1)});
    expect_true(!res.ok, "mount denial fails the start");
    expect_true(!res.retryable, "mount denial is not retryable");
    expect_true(res.error.rfind("mount-denied", 0) == 0, "mount denial reason: " + res.error);
    expect_eq_ll((long long)r.launcher.spawn_count(), 0, "no process for a denied mount set");
    expect_eq_ll((long long)r.sm->live_count(), 0, "nothing live");
    expect_eq_ll((long long)r.ended.size(), 0, "failed start never reaches on_ended");

    Group plain = r.add_group("plain");
    r.launcher.fail_remaining = 1;
    res = r.sm->start(plain, {message("hi", 1)});
    expect_true(!res.ok && res.retryable, "spawn failure is retryable");
    expect_eq_ll((long long)r.sm->live_count(), 0, "nothing live after spawn failure");
    expect_true(r.sm->start(plain, {message("hi", 1)}).ok, "next attempt succeeds");

    CancelSource cs;
    cs.cancel();
    Group other = r.add_group("other");
    res = r.sm->start(other, {message("hi", 1)}, cs.token());
    expect_true(!res.ok && !res.retryable, "cancelled start fails");
}

static void test_shutdown() {
    Rig r("session_shutdown");
    Group a = r.add_group("alpha");
    Group b = r.add_group("beta");
    expect_true(r.sm->start(a, {message("a", 1)}).ok, "start alpha");
    expect_true(r.sm->start(b, {message("b", 1)}).ok, "start beta");

    r.sm->shutdown(20);
    expect_eq_ll((long long)r.sm->live_count(), 0, "all sessions gone");
    expect_eq_ll((long long)r.ended.size(), 2, "both ended");
    for (const auto& e : r.ended) {
        expect_true(e.state == SessionState::KILLED, "unresponsive sessions killed");
        expect_eq_str(e.reason, "host-shutdown", "shutdown reason");
    }
    expect_eq_ll((long long)r.sent.size(), 0, "no failure notices during shutdown");

    StartResult res = r.sm->start(a, {message("late", 2)});
    expect_true(!res.ok, "no starts after shutdown");
    r.sm->shutdown(20);   // idempotent
}

int main() {
    set_log_threshold(LogLevel::WARN);
    test_lifecycle_and_results();
    test_isolated_task();
    test_hard_timeout();
    test_sigkill_escalation();
    test_output_cap();
    test_failure_notice();
    test_heartbeat_suppression();
    test_start_failures();
    test_shutdown();
    std::cerr << "test_session: ALL PASSED" << std::endl;
    return 0;
}
