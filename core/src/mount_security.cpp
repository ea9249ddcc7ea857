#include "kestrel/mount_security.h"
#include "kestrel/fsutil.h"
#include "kestrel/json_util.h"

#include <fnmatch.h>

#include <algorithm>

namespace kestrel {

const std::vector<std::string>& default_blocked_patterns() {
    static const std::vector<std::string> patterns = {
        ".ssh", ".gnupg", ".gpg", ".aws", ".azure", ".gcloud", ".kube", ".docker",
        "credentials", ".env", ".netrc", ".npmrc", ".pypirc",
        "id_rsa", "id_ed25519", "private_key", ".secret",
    };
    return patterns;
}

std::optional<MountAllowlist> parse_mount_allowlist(const std::string& text, std::string* err) {
    json::Doc d = json::parse(text);
    if (!d.is_object()) {
        if (err) *err = "allowlist is not a JSON object";
        return std::nullopt;
    }
    json_object* roots = json::field(d.root, "allowedRoots");
    if (!roots || !json_object_is_type(roots, json_type_array)) {
        if (err) *err = "allowlist: allowedRoots must be an array";
        return std::nullopt;
    }

    MountAllowlist al;
    for (json_object* r : json::get_object_array(d.root, "allowedRoots")) {
        AllowedRoot root;
        auto p = json::get_string(r, "path");
        if (!p || p->empty()) {
            if (err) *err = "allowlist: allowedRoots entry without path";
            return std::nullopt;
        }
        root.path = *p;
        root.allow_read_write = json::get_bool(r, "allowReadWrite").value_or(false);
        root.description = json::get_string(r, "description").value_or("");
        root.blocked_patterns = json::get_string_array(r, "blockedPatterns");
        al.allowed_roots.push_back(std::move(root));
    }
    al.blocked_patterns = json::get_string_array(d.root, "blockedPatterns");
    al.non_main_read_only = json::get_bool(d.root, "nonMainReadOnly").value_or(true);
    return al;
}

std::optional<MountAllowlist> load_mount_allowlist(const std::filesystem::path& path, std::string* err) {
    auto body = slurp_file(path);
    if (!body) {
        if (err) *err = "allowlist not found at " + path.string();
        return std::nullopt;
    }
    return parse_mount_allowlist(*body, err);
}

bool is_valid_container_path(const std::string& p) {
    if (p.empty() || p[0] == '/') return false;
    if (p.find(':') != std::string::npos) return false;
    for (const auto& part : std::filesystem::path(p)) {
        if (part == "..") return false;
    }
    return true;
}

bool path_within(const std::filesystem::path& child, const std::filesystem::path& root) {
    auto c = child.begin();
    for (auto r = root.begin(); r != root.end(); ++r) {
        // A trailing separator yields an empty final element.
        if (r->empty()) continue;
        if (c == child.end() || *c != *r) return false;
        ++c;
    }
    return true;
}

static bool component_matches(const std::string& component, const std::string& pattern) {
    if (pattern.empty()) return false;
    if (pattern.find_first_of("*?[") != std::string::npos) {
        return fnmatch(pattern.c_str(), component.c_str(), 0) == 0;
    }
    return component == pattern || component.find(pattern) != std::string::npos;
}

// Pattern with a '/' names a sub-path of the root; otherwise it is matched
// against every component of the canonical path.
static std::optional<std::string> find_blocked(const std::filesystem::path& resolved,
                                               const std::filesystem::path& root,
                                               const std::vector<std::string>& patterns) {
    std::filesystem::path rel = resolved.lexically_relative(root);
    for (const auto& pat : patterns) {
        if (pat.find('/') != std::string::npos) {
            std::filesystem::path sub = std::filesystem::path(pat).lexically_normal();
            if (path_within(rel, sub)) return pat;
            continue;
        }
        for (const auto& part : resolved) {
            if (component_matches(part.string(), pat)) return pat;
        }
    }
    return std::nullopt;
}

static MountDecision deny(MountDecision d, std::string reason) {
    d.allowed = false;
    d.reason = std::move(reason);
    return d;
}

MountDecision validate_mount(const AdditionalMount& mount,
                             const MountAllowlist& allowlist,
                             bool is_main,
                             const std::filesystem::path& allowlist_path) {
    MountDecision d;
    d.requested_path = mount.host_path;

    if (mount.host_path.empty()) return deny(d, "empty host path");

    std::filesystem::path expanded = expand_home(mount.host_path);
    d.container_path = mount.container_path.empty()
        ? expanded.lexically_normal().filename().string()
        : mount.container_path;
    if (!is_valid_container_path(d.container_path)) {
        return deny(d, "invalid container path \"" + d.container_path + "\"");
    }

    std::error_code ec;
    std::filesystem::path resolved = std::filesystem::canonical(expanded, ec);
    if (ec) return deny(d, "host path does not exist: " + expanded.string());
    d.resolved_path = resolved;

    // Most specific matching root wins.
    const AllowedRoot* match = nullptr;
    std::filesystem::path match_canon;
    for (const auto& root : allowlist.allowed_roots) {
        std::filesystem::path rc = std::filesystem::canonical(expand_home(root.path), ec);
        if (ec) { ec.clear(); continue; }
        if (!path_within(resolved, rc)) continue;
        if (!match || rc.string().size() > match_canon.string().size()) {
            match = &root;
            match_canon = rc;
        }
    }
    if (!match) {
        return deny(d, "path " + resolved.string() + " is not under any allowed root");
    }
    d.matched_root = match_canon;

    std::vector<std::string> patterns = default_blocked_patterns();
    patterns.insert(patterns.end(), allowlist.blocked_patterns.begin(), allowlist.blocked_patterns.end());
    if (auto hit = find_blocked(resolved, match_canon, patterns)) {
        return deny(d, "path matches blocked pattern \"" + *hit + "\"");
    }
    if (auto hit = find_blocked(resolved, match_canon, match->blocked_patterns)) {
        return deny(d, "path matches root blocked pattern \"" + *hit + "\"");
    }

    if (!allowlist_path.empty()) {
        std::filesystem::path al = std::filesystem::weakly_canonical(expand_home(allowlist_path.string()), ec);
        if (ec) { ec.clear(); al = std::filesystem::absolute(allowlist_path, ec); }
        if (!al.empty() && path_within(al, resolved)) {
            return deny(d, "mount would expose the mount allowlist");
        }
    }

    bool readonly = true;
    if (!mount.readonly) {
        if (!is_main && allowlist.non_main_read_only) readonly = true;
        else if (!match->allow_read_write) readonly = true;
        else readonly = false;
    }
    d.effective_readonly = readonly;
    d.allowed = true;
    d.reason = "allowed under " + match_canon.string();
    return d;
}

MountSetResult validate_mount_set(const std::vector<AdditionalMount>& mounts,
                                  const std::optional<MountAllowlist>& allowlist,
                                  bool is_main,
                                  const std::filesystem::path& allowlist_path) {
    MountSetResult res;
    if (mounts.empty()) {
        res.ok = true;
        return res;
    }
    if (!allowlist) {
        res.reason = "no mount allowlist configured; additional mounts denied";
        for (const auto& m : mounts) {
            MountDecision d;
            d.requested_path = m.host_path;
            d.reason = res.reason;
            res.decisions.push_back(std::move(d));
        }
        return res;
    }

    std::vector<std::string> seen_targets;
    for (const auto& m : mounts) {
        MountDecision d = validate_mount(m, *allowlist, is_main, allowlist_path);
        if (d.allowed) {
            if (std::find(seen_targets.begin(), seen_targets.end(), d.container_path) != seen_targets.end()) {
                d = deny(d, "duplicate container path \"" + d.container_path + "\"");
            } else {
                seen_targets.push_back(d.container_path);
            }
        }
        if (!d.allowed && res.reason.empty()) res.reason = m.host_path + ": " + d.reason;
        res.decisions.push_back(std::move(d));
    }
    if (!res.reason.empty()) return res;

    for (const auto& d : res.decisions) {
        ValidatedMount vm;
        vm.host_path = d.resolved_path;
        vm.container_path = std::string(EXTRA_MOUNT_BASE) + "/" + d.container_path;
        vm.readonly = d.effective_readonly;
        res.mounts.push_back(std::move(vm));
    }
    res.ok = true;
    return res;
}

} // namespace kestrel
