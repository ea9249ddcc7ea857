#pragma once

// Mount security: decides which host paths a session may see.
//
// The allowlist is read from a file outside the project tree on every
// session spawn and never cached, so edits apply to the next spawn.
// Validation is pure apart from filesystem lookups (canonicalization).
//
// Order of checks for one requested mount:
//   1. container path must be relative and free of ".."
//   2. host path is canonicalized with every symlink resolved
//   3. canonical path must sit under (or equal) some allowlist root
//   4. no component may match a global or per-root blocked pattern
//   5. the allowlist file itself must not be reachable through the mount
//   6. read-write is granted only if requested, the root allows it and
//      the group is main or nonMainReadOnly is off

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kestrel {

struct AllowedRoot {
    std::string path;                 // may start with "~"
    bool allow_read_write{false};
    std::string description;
    std::vector<std::string> blocked_patterns;
};

struct MountAllowlist {
    std::vector<AllowedRoot> allowed_roots;
    std::vector<std::string> blocked_patterns;
    bool non_main_read_only{true};
};

// A group's configured extra mount.
struct AdditionalMount {
    std::string host_path;
    std::string container_path;  // empty: basename of host_path
    bool readonly{true};
};

struct MountDecision {
    bool allowed{false};
    std::string reason;
    std::string requested_path;
    std::filesystem::path resolved_path;
    std::filesystem::path matched_root;
    std::string container_path;
    bool effective_readonly{true};
};

// A mount ready to hand to the session launcher.
struct ValidatedMount {
    std::filesystem::path host_path;
    std::string container_path;  // absolute path inside the session
    bool readonly{true};
};

struct MountSetResult {
    bool ok{false};
    std::string reason;                    // first denial, if any
    std::vector<ValidatedMount> mounts;    // empty unless ok
    std::vector<MountDecision> decisions;  // one per requested mount
};

// Patterns that are always blocked regardless of the allowlist file.
const std::vector<std::string>& default_blocked_patterns();

// Parse the allowlist document. nullopt + *err on malformed input.
std::optional<MountAllowlist> parse_mount_allowlist(const std::string& json, std::string* err);

// Read and parse. A missing file is reported through *err as well.
std::optional<MountAllowlist> load_mount_allowlist(const std::filesystem::path& path, std::string* err);

bool is_valid_container_path(const std::string& p);

// True if `child` equals `root` or lies beneath it (component-wise).
bool path_within(const std::filesystem::path& child, const std::filesystem::path& root);

MountDecision validate_mount(const AdditionalMount& mount,
                             const MountAllowlist& allowlist,
                             bool is_main,
                             const std::filesystem::path& allowlist_path);

// Validates every mount; any denial fails the whole set (no partial mounts).
// A missing allowlist denies all additional mounts.
MountSetResult validate_mount_set(const std::vector<AdditionalMount>& mounts,
                                  const std::optional<MountAllowlist>& allowlist,
                                  bool is_main,
                                  const std::filesystem::path& allowlist_path);

// Where additional mounts appear inside a session.
constexpr const char* EXTRA_MOUNT_BASE = "/workspace/extra";

} // namespace kestrel
