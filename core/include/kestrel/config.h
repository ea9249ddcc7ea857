#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kestrel {

enum class Profile { DEV, PROD };

// Detect profile from KESTREL_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: short idle window, verbose logging
// PROD: longer idle window, tighter output cap, journal fsync on
void apply_profile_defaults(Profile p);

struct HostConfig {
    std::string assistant_name{"Kestrel"};
    std::string main_jid;                // registers the main group on first start

    std::filesystem::path root;          // project root
    std::filesystem::path groups_dir;    // <root>/groups
    std::filesystem::path data_dir;      // <root>/data
    std::filesystem::path store_dir;     // <root>/store
    std::filesystem::path ipc_dir;       // <root>/data/ipc
    std::filesystem::path mount_allowlist_path;

    int max_concurrent_sessions{5};
    int workers{7};

    int64_t session_idle_ms{300000};
    int64_t session_timeout_ms{1800000};
    int64_t session_max_output_bytes{10 * 1024 * 1024};
    int64_t session_grace_ms{10000};

    int64_t scheduler_poll_ms{60000};
    int64_t ipc_poll_ms{1000};
    std::string timezone{"UTC"};

    // Shared folders whose changes wake the groups that mount them.
    std::vector<std::filesystem::path> shared_dirs;
    int64_t shared_poll_ms{2000};

    std::vector<std::string> agent_argv;     // opaque runtime command
    std::vector<std::string> session_wrapper; // optional container wrapper prefix

    bool journal_fsync{false};
};

// Reads KESTREL_* variables. Malformed numbers fall back to defaults.
HostConfig load_host_config();

int64_t getenv_i64(const char* key, int64_t defv);

// Split a command string into argv tokens.
// Supports single/double quotes and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace kestrel
