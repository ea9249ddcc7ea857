#include "cmd_host.h"

#include "kestrel/config.h"
#include "kestrel/cron.h"
#include "kestrel/host_state.h"
#include "kestrel/log.h"
#include "kestrel/session_manager.h"
#include "kestrel/task_store.h"
#include "kestrel/timezone.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>

using namespace kestrel;

int cmd_check_mounts(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: kestrel_host check-mounts <group-folder>\n";
        return 2;
    }
    HostConfig cfg = load_host_config();
    HostState state(cfg.data_dir / "state.json");
    if (std::string err = state.load(); !err.empty()) {
        std::cerr << "cannot load host state: " << err << "\n";
        return 1;
    }
    auto g = state.group_by_folder(argv[2]);
    if (!g) {
        std::cerr << "no group with folder " << argv[2] << "\n";
        return 1;
    }

    std::cout << "allowlist: " << cfg.mount_allowlist_path.string() << "\n";
    if (g->additional_mounts.empty()) {
        std::cout << g->folder << ": no additional mounts configured\n";
        return 0;
    }

    AllowlistMountPolicy policy(cfg.mount_allowlist_path);
    MountSetResult r = policy.validate(*g);
    for (const auto& d : r.decisions) {
        if (d.allowed) {
            std::cout << "ALLOW " << d.resolved_path.string() << " -> " << d.container_path
                      << (d.effective_readonly ? " (ro)" : " (rw)") << "\n";
        } else {
            std::cout << "DENY  " << d.requested_path << ": " << d.reason << "\n";
        }
    }
    std::cout << (r.ok ? "mount set approved\n" : "mount set denied: " + r.reason + "\n");
    return r.ok ? 0 : 1;
}

int cmd_cron_next(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: kestrel_host cron-next <expr> [timezone] [count]\n";
        return 2;
    }
    try {
        CronExpr expr = CronExpr::parse(argv[2]);
        TimeZone tz = argc > 3 ? TimeZone::named(argv[3]) : TimeZone::utc();
        int count = argc > 4 ? std::max(1, std::atoi(argv[4])) : 1;

        int64_t t = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        for (int i = 0; i < count; i++) {
            auto next = expr.next_after(t, tz);
            if (!next) {
                std::cout << "no further occurrence\n";
                return 1;
            }
            std::cout << format_local(*next, tz) << " " << tz.name() << "  (" << format_utc(*next) << ")\n";
            t = *next;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}

int cmd_tasks(int argc, char** argv) {
    HostConfig cfg = load_host_config();
    FileTaskStore store(cfg.store_dir, false);
    if (std::string err = store.load(); !err.empty()) {
        std::cerr << "cannot load task store: " << err << "\n";
        return 1;
    }
    std::string folder = argc > 2 ? argv[2] : "";
    size_t n = 0;
    for (const auto& t : store.all()) {
        if (!folder.empty() && t.group_folder != folder) continue;
        std::cout << std::left << std::setw(28) << t.id << " "
                  << std::setw(12) << t.group_folder << " "
                  << std::setw(7) << task_status_name(t.status) << " "
                  << std::setw(9) << schedule_kind_name(t.kind) << " "
                  << std::setw(16) << t.schedule_value << " "
                  << "next=" << (t.next_run_ms ? format_utc(t.next_run_ms) : std::string("-"))
                  << (t.last_result.empty() ? std::string() : " last=" + t.last_result) << "\n";
        n++;
    }
    std::cout << n << " task(s)\n";
    return 0;
}
