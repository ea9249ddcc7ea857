#include "kestrel/config.h"
#include "kestrel/fsutil.h"
#include "kestrel/log.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace kestrel {

Profile detect_profile() {
    const char* env = std::getenv("KESTREL_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("KESTREL_LOG_LEVEL",               "debug",   NO_OVERWRITE);
            setenv("KESTREL_SESSION_IDLE_MS",         "120000",  NO_OVERWRITE);
            setenv("KESTREL_JOURNAL_FSYNC",           "0",       NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("KESTREL_LOG_LEVEL",               "info",    NO_OVERWRITE);
            setenv("KESTREL_SESSION_IDLE_MS",         "300000",  NO_OVERWRITE);
            setenv("KESTREL_SESSION_MAX_OUTPUT_BYTES","4194304", NO_OVERWRITE);
            setenv("KESTREL_JOURNAL_FSYNC",           "1",       NO_OVERWRITE);
            break;
    }
}

int64_t getenv_i64(const char* key, int64_t defv) {
    if (const char* e = std::getenv(key)) {
        try { return std::stoll(e); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

static std::string getenv_str(const char* key, const std::string& defv) {
    const char* e = std::getenv(key);
    if (!e || !*e) return defv;
    return e;
}

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;
    bool have_token = false;

    auto flush = [&]() {
        if (have_token) {
            out.push_back(cur);
            cur.clear();
            have_token = false;
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\'') { st = SQ; have_token = true; continue; }
            if (c == '"') { st = DQ; esc = false; have_token = true; continue; }
            cur.push_back(c);
            have_token = true;
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

HostConfig load_host_config() {
    HostConfig cfg;
    cfg.assistant_name = getenv_str("KESTREL_ASSISTANT_NAME", cfg.assistant_name);
    cfg.main_jid = getenv_str("KESTREL_MAIN_JID", "");

    std::error_code ec;
    std::filesystem::path root = getenv_str("KESTREL_ROOT", "");
    if (root.empty()) root = std::filesystem::current_path(ec);
    cfg.root = std::filesystem::absolute(root, ec);
    cfg.groups_dir = cfg.root / "groups";
    cfg.data_dir = cfg.root / "data";
    cfg.store_dir = cfg.root / "store";
    cfg.ipc_dir = cfg.data_dir / "ipc";

    // The allowlist lives outside the project root so no session mount can reach it.
    std::string home = getenv_str("HOME", "/root");
    cfg.mount_allowlist_path = getenv_str("KESTREL_MOUNT_ALLOWLIST",
        (std::filesystem::path(home) / ".config" / "kestrel" / "mount-allowlist.json").string());

    cfg.max_concurrent_sessions = (int)std::max<int64_t>(1,
        getenv_i64("KESTREL_MAX_CONCURRENT_SESSIONS", cfg.max_concurrent_sessions));
    // Each live session holds a worker for its pump loop; two more keep
    // admissions and scheduler ticks moving.
    cfg.workers = (int)std::max<int64_t>(cfg.max_concurrent_sessions + 2,
        std::clamp<int64_t>(getenv_i64("KESTREL_WORKERS", cfg.max_concurrent_sessions + 2), 2, 128));

    cfg.session_idle_ms = std::max<int64_t>(1000, getenv_i64("KESTREL_SESSION_IDLE_MS", cfg.session_idle_ms));
    cfg.session_timeout_ms = std::max<int64_t>(1000, getenv_i64("KESTREL_SESSION_TIMEOUT_MS", cfg.session_timeout_ms));
    cfg.session_max_output_bytes = std::max<int64_t>(1024,
        getenv_i64("KESTREL_SESSION_MAX_OUTPUT_BYTES", cfg.session_max_output_bytes));
    cfg.session_grace_ms = std::max<int64_t>(0, getenv_i64("KESTREL_SESSION_GRACE_MS", cfg.session_grace_ms));

    cfg.scheduler_poll_ms = std::clamp<int64_t>(getenv_i64("KESTREL_SCHEDULER_POLL_MS", cfg.scheduler_poll_ms), 1000, 3600000);
    cfg.ipc_poll_ms = std::clamp<int64_t>(getenv_i64("KESTREL_IPC_POLL_MS", cfg.ipc_poll_ms), 50, 60000);
    cfg.timezone = getenv_str("KESTREL_TZ", getenv_str("TZ", "UTC"));

    std::string shared = getenv_str("KESTREL_SHARED_DIRS", "~/kestrel-shared");
    size_t start = 0;
    while (start <= shared.size()) {
        size_t colon = shared.find(':', start);
        if (colon == std::string::npos) colon = shared.size();
        std::string one = shared.substr(start, colon - start);
        if (!one.empty()) cfg.shared_dirs.push_back(expand_home(one));
        start = colon + 1;
    }
    cfg.shared_poll_ms = std::clamp<int64_t>(getenv_i64("KESTREL_SHARED_POLL_MS", cfg.shared_poll_ms), 100, 60000);

    std::string agent_cmd = getenv_str("KESTREL_AGENT_CMD", "kestrel-agent");
    cfg.agent_argv = split_argv_quoted(agent_cmd);
    if (cfg.agent_argv.empty()) {
        log_warn("config", "KESTREL_AGENT_CMD does not parse; sessions cannot start");
    }
    cfg.session_wrapper = split_argv_quoted(getenv_str("KESTREL_SESSION_WRAPPER", ""));

    cfg.journal_fsync = getenv_i64("KESTREL_JOURNAL_FSYNC", 0) != 0;
    return cfg;
}

} // namespace kestrel
