#include "cmd_host.h"

#include "kestrel/channel.h"
#include "kestrel/clock.h"
#include "kestrel/config.h"
#include "kestrel/executor.h"
#include "kestrel/group_queue.h"
#include "kestrel/heartbeat.h"
#include "kestrel/host_state.h"
#include "kestrel/inbound.h"
#include "kestrel/ipc.h"
#include "kestrel/log.h"
#include "kestrel/proc.h"
#include "kestrel/scheduler.h"
#include "kestrel/session_manager.h"
#include "kestrel/shared_watch.h"
#include "kestrel/task_store.h"
#include "kestrel/timezone.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

#include <pthread.h>

using namespace kestrel;

static std::string ensure_layout(const HostConfig& cfg) {
    std::error_code ec;
    for (const auto& d : {cfg.groups_dir, cfg.data_dir, cfg.store_dir, cfg.ipc_dir,
                          cfg.groups_dir / MAIN_GROUP_FOLDER}) {
        std::filesystem::create_directories(d, ec);
        if (ec) return "create " + d.string() + ": " + ec.message();
    }
    return "";
}

static void bootstrap_main_group(HostState& state, const HostConfig& cfg, int64_t now) {
    if (state.group_by_folder(MAIN_GROUP_FOLDER)) return;
    if (cfg.main_jid.empty()) {
        log_warn("host", "no main group registered; set KESTREL_MAIN_JID to administer the host from a chat");
        return;
    }
    Group g;
    g.jid = cfg.main_jid;
    g.name = "main";
    g.folder = MAIN_GROUP_FOLDER;
    g.requires_trigger = false;
    g.added_at_ms = now;
    std::string err = state.register_group(g);
    if (!err.empty()) log_error("host", "cannot register main group: " + err);
    else log_info("host", "registered main group " + g.jid);
}

int cmd_run(int argc, char** argv) {
    (void)argc;
    (void)argv;

    // Profile defaults must be applied before any thread starts.
    Profile profile = detect_profile();
    apply_profile_defaults(profile);
    HostConfig cfg = load_host_config();

    ::signal(SIGPIPE, SIG_IGN);
    // Shutdown signals are taken synchronously by sigwait below; every
    // thread started from here on inherits the mask.
    sigset_t stop_set;
    sigemptyset(&stop_set);
    sigaddset(&stop_set, SIGINT);
    sigaddset(&stop_set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_set, nullptr);

    if (std::string err = ensure_layout(cfg); !err.empty()) {
        log_error("host", err);
        return 1;
    }
    if (cfg.agent_argv.empty()) {
        log_error("host", "KESTREL_AGENT_CMD is empty or malformed");
        return 2;
    }

    log_info("host", std::string("profile=") + profile_name(profile) + " root=" + cfg.root.string() +
             " max_sessions=" + std::to_string(cfg.max_concurrent_sessions));

    EventLog events((cfg.data_dir / "events.jsonl").string());

    HostState state(cfg.data_dir / "state.json");
    if (std::string err = state.load(); !err.empty()) {
        log_error("host", "cannot load host state: " + err);
        return 1;
    }

    TimeZone tz = TimeZone::utc();
    try {
        tz = TimeZone::named(cfg.timezone);
    } catch (const std::invalid_argument& e) {
        log_warn("host", std::string("timezone: ") + e.what() + ", using UTC");
    }

    FileTaskStore store(cfg.store_dir, cfg.journal_fsync);
    if (std::string err = store.load(); !err.empty()) {
        log_error("host", "cannot load task store: " + err);
        return 1;
    }

    SystemClock clock;
    bootstrap_main_group(state, cfg, clock.now_ms());

    ThreadPoolExecutor exec(cfg.workers);
    ChannelRouter router(clock);
    router.add(std::make_shared<SpoolChannel>(cfg.data_dir / "spool", clock, cfg.ipc_poll_ms, &exec));
    auto send = [&router](const std::string& jid, const std::string& text) { (void)router.send(jid, text); };

    Scheduler scheduler(store, clock, tz, &events);

    PosixProcessLauncher launcher;
    AllowlistMountPolicy mount_policy(cfg.mount_allowlist_path, &events);

    SessionOptions so;
    so.idle_ms = cfg.session_idle_ms;
    so.hard_timeout_ms = cfg.session_timeout_ms;
    so.max_output_bytes = cfg.session_max_output_bytes;
    so.grace_ms = cfg.session_grace_ms;
    so.agent_argv = cfg.agent_argv;
    so.wrapper = cfg.session_wrapper;
    so.groups_dir = cfg.groups_dir;
    so.ipc_root = cfg.ipc_dir;
    so.assistant_name = cfg.assistant_name;

    std::atomic<GroupQueue*> queue_ptr{nullptr};
    SessionManager::Hooks sh;
    sh.send_message = send;
    sh.on_ended = [&queue_ptr](const std::string& folder, SessionState, const std::string&) {
        if (GroupQueue* q = queue_ptr.load()) q->on_session_ended(folder);
    };
    SessionManager sessions(state, launcher, mount_policy, clock, exec, so, sh, &events);

    QueueOptions qo;
    qo.max_concurrent = cfg.max_concurrent_sessions;
    GroupQueue queue(state, sessions, exec, clock, qo, GroupQueue::Hooks{send}, &events);
    queue_ptr.store(&queue);

    scheduler.set_fire_handler([&queue](const ScheduledTask& t) { return queue.fire_task(t); });
    initialize_all_heartbeats(state, cfg.groups_dir, scheduler);

    ipc::Dispatcher::Hooks dh;
    dh.send_message = [&router](const std::string& jid, const std::string& text) { return router.send(jid, text); };
    dh.on_group_registered = [&](const Group& g) {
        std::error_code ec;
        std::filesystem::create_directories(cfg.groups_dir / g.folder, ec);
        initialize_heartbeat(g, cfg.groups_dir, scheduler);
    };
    ipc::Dispatcher dispatcher(state, scheduler, clock, cfg.ipc_dir, dh, &events);
    ipc::Watcher watcher(cfg.ipc_dir, state, dispatcher, clock, ipc::WatcherOptions{}, &events);

    std::vector<std::filesystem::path> shared_dirs;
    for (const auto& d : cfg.shared_dirs) {
        std::error_code ec;
        if (std::filesystem::is_directory(d, ec)) shared_dirs.push_back(d);
        else log_debug("host", "shared folder " + d.string() + " does not exist, not watching");
    }
    SharedWatchOptions swo;
    swo.poll_ms = cfg.shared_poll_ms;
    SharedFolderWatcher shared(shared_dirs, state, clock,
        [&queue](const std::string& folder, WakeEntry e) { return queue.enqueue(folder, std::move(e)); },
        swo, &events);

    InboundRouter inbound(state, queue, clock, cfg.assistant_name, send, &events);
    if (std::string err = router.connect_all([&inbound](const InboundMessage& m) { (void)inbound.on_message(m); });
        !err.empty()) {
        log_error("host", "channel connect failed: " + err);
        return 1;
    }

    watcher.start(cfg.ipc_poll_ms, &exec);
    if (shared_dirs.empty()) log_warn("host", "no shared folders to watch");
    else shared.start(&exec);
    scheduler.start(cfg.scheduler_poll_ms, &exec);
    events.event("host_started", "{}");
    log_info("host", "running; " + std::to_string(state.groups().size()) + " group(s), " +
             std::to_string(scheduler.list().size()) + " task(s)");

    int sig = 0;
    while (sigwait(&stop_set, &sig) != 0) {}
    log_info("host", std::string("received ") + (sig == SIGINT ? "SIGINT" : "SIGTERM") + ", shutting down");

    // 1. stop accepting new work
    router.disconnect_all();
    watcher.stop();
    shared.stop();
    scheduler.stop();
    queue.shutdown();
    // 2-3. drain live sessions, force-kill after the grace period
    sessions.shutdown(cfg.session_grace_ms);
    queue_ptr.store(nullptr);
    // 4. persist scheduler state
    if (std::string err = scheduler.flush(); !err.empty()) {
        log_error("host", "scheduler flush failed: " + err);
    }
    exec.shutdown();
    clock.stop();
    events.event("host_stopped", "{}");
    log_info("host", "stopped");
    return 0;
}
