#include "kestrel/host_state.h"
#include "kestrel/fsutil.h"
#include "kestrel/json_util.h"
#include "kestrel/log.h"

#include <cctype>

namespace kestrel {

const char* contact_status_name(ContactStatus s) {
    switch (s) {
        case ContactStatus::PENDING:  return "pending";
        case ContactStatus::APPROVED: return "approved";
        case ContactStatus::BLOCKED:  return "blocked";
    }
    return "pending";
}

std::optional<ContactStatus> parse_contact_status(const std::string& s) {
    if (s == "pending") return ContactStatus::PENDING;
    if (s == "approved") return ContactStatus::APPROVED;
    if (s == "blocked") return ContactStatus::BLOCKED;
    return std::nullopt;
}

bool is_valid_group_folder(const std::string& folder) {
    if (folder.empty() || folder.size() > 64) return false;
    if (folder == "." || folder == "..") return false;
    for (char c : folder) {
        if (!(std::isalnum((unsigned char)c) || c == '_' || c == '-')) return false;
    }
    return true;
}

std::string folder_for_jid(const std::string& jid) {
    std::string out;
    for (char c : jid) {
        if (out.size() >= 64) break;
        unsigned char uc = (unsigned char)c;
        if (std::isalnum(uc)) out.push_back((char)std::tolower(uc));
        else if (c == '-' || c == '_') out.push_back(c);
        else if (!out.empty() && out.back() != '-') out.push_back('-');
    }
    while (!out.empty() && out.back() == '-') out.pop_back();
    if (out.empty() || out == MAIN_GROUP_FOLDER) out = "group-" + out;
    return out;
}

HostState::HostState(std::filesystem::path state_file) : path_(std::move(state_file)) {}

static json_object* mounts_to_json(const std::vector<AdditionalMount>& mounts) {
    json_object* arr = json_object_new_array();
    for (const auto& m : mounts) {
        json::ObjectBuilder b;
        b.set("hostPath", m.host_path);
        if (!m.container_path.empty()) b.set("containerPath", m.container_path);
        b.set_bool("readonly", m.readonly);
        json_object_array_add(arr, b.release());
    }
    return arr;
}

static std::vector<AdditionalMount> parse_mounts(json_object* obj, const char* key) {
    std::vector<AdditionalMount> out;
    for (json_object* m : json::get_object_array(obj, key)) {
        AdditionalMount am;
        am.host_path = json::get_string(m, "hostPath").value_or("");
        am.container_path = json::get_string(m, "containerPath").value_or("");
        am.readonly = json::get_bool(m, "readonly").value_or(true);
        if (!am.host_path.empty()) out.push_back(std::move(am));
    }
    return out;
}

std::string HostState::load() {
    if (path_.empty()) return "";
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return "";
    auto body = slurp_file(path_);
    if (!body) return "cannot read " + path_.string();
    json::Doc d = json::parse(*body);
    if (!d.is_object()) return "state snapshot is not a JSON object: " + path_.string();

    std::lock_guard<std::mutex> lk(mu_);
    groups_.clear();
    contacts_.clear();
    markers_.clear();

    for (json_object* g : json::get_object_array(d.root, "groups")) {
        Group grp;
        grp.jid = json::get_string(g, "jid").value_or("");
        grp.name = json::get_string(g, "name").value_or("");
        grp.folder = json::get_string(g, "folder").value_or("");
        grp.requires_trigger = json::get_bool(g, "requiresTrigger").value_or(true);
        grp.added_at_ms = json::get_int(g, "addedAt").value_or(0);
        grp.additional_mounts = parse_mounts(g, "additionalMounts");
        if (grp.jid.empty() || !is_valid_group_folder(grp.folder)) {
            log_warn("state", "skipping invalid group entry jid=" + grp.jid + " folder=" + grp.folder);
            continue;
        }
        groups_[grp.jid] = std::move(grp);
    }
    for (json_object* c : json::get_object_array(d.root, "contacts")) {
        Contact ct;
        ct.jid = json::get_string(c, "jid").value_or("");
        ct.display_name = json::get_string(c, "name").value_or("");
        ct.status = parse_contact_status(json::get_string(c, "status").value_or("")).value_or(ContactStatus::PENDING);
        ct.first_seen_ms = json::get_int(c, "firstSeen").value_or(0);
        ct.updated_ms = json::get_int(c, "updated").value_or(0);
        if (!ct.jid.empty()) contacts_[ct.jid] = std::move(ct);
    }
    for (json_object* m : json::get_object_array(d.root, "sessions")) {
        auto folder = json::get_string(m, "folder").value_or("");
        if (folder.empty()) continue;
        SessionMarker sm;
        sm.session_id = json::get_string(m, "sessionId").value_or("");
        sm.last_cursor_ms = json::get_int(m, "lastCursor").value_or(0);
        markers_[folder] = sm;
    }
    return "";
}

std::string HostState::persist_locked() const {
    if (path_.empty()) return "";

    json_object* groups = json_object_new_array();
    for (const auto& [jid, g] : groups_) {
        json::ObjectBuilder b;
        b.set("jid", g.jid).set("name", g.name).set("folder", g.folder)
         .set_bool("requiresTrigger", g.requires_trigger)
         .set("addedAt", g.added_at_ms)
         .set_object("additionalMounts", mounts_to_json(g.additional_mounts));
        json_object_array_add(groups, b.release());
    }
    json_object* contacts = json_object_new_array();
    for (const auto& [jid, c] : contacts_) {
        json::ObjectBuilder b;
        b.set("jid", c.jid).set("name", c.display_name)
         .set("status", contact_status_name(c.status))
         .set("firstSeen", c.first_seen_ms).set("updated", c.updated_ms);
        json_object_array_add(contacts, b.release());
    }
    json_object* sessions = json_object_new_array();
    for (const auto& [folder, m] : markers_) {
        json::ObjectBuilder b;
        b.set("folder", folder).set("sessionId", m.session_id).set("lastCursor", m.last_cursor_ms);
        json_object_array_add(sessions, b.release());
    }

    json::ObjectBuilder root;
    root.set("version", 1)
        .set_object("groups", groups)
        .set_object("contacts", contacts)
        .set_object("sessions", sessions);
    return write_atomic(path_, root.str() + "\n", true);
}

std::optional<Group> HostState::group_by_jid(const std::string& jid) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = groups_.find(jid);
    if (it == groups_.end()) return std::nullopt;
    return it->second;
}

std::optional<Group> HostState::group_by_folder(const std::string& folder) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [jid, g] : groups_) {
        if (g.folder == folder) return g;
    }
    return std::nullopt;
}

std::vector<Group> HostState::groups() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Group> out;
    out.reserve(groups_.size());
    for (const auto& [jid, g] : groups_) out.push_back(g);
    return out;
}

std::string HostState::register_group(const Group& g) {
    if (g.jid.empty()) return "group jid is empty";
    if (!is_valid_group_folder(g.folder)) return "invalid group folder \"" + g.folder + "\"";

    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [jid, other] : groups_) {
        if (other.folder == g.folder && jid != g.jid) {
            return "folder \"" + g.folder + "\" already belongs to " + jid;
        }
    }
    std::optional<Group> prev;
    if (auto it = groups_.find(g.jid); it != groups_.end()) prev = it->second;
    groups_[g.jid] = g;
    std::string err = persist_locked();
    if (!err.empty()) {
        if (prev) groups_[g.jid] = *prev;
        else groups_.erase(g.jid);
        return "persist failed: " + err;
    }
    return "";
}

std::optional<Contact> HostState::contact(const std::string& jid) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = contacts_.find(jid);
    if (it == contacts_.end()) return std::nullopt;
    return it->second;
}

std::vector<Contact> HostState::contacts() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Contact> out;
    for (const auto& [jid, c] : contacts_) out.push_back(c);
    return out;
}

ContactStatus HostState::note_contact(const std::string& jid, const std::string& display_name, int64_t now_ms) {
    std::lock_guard<std::mutex> lk(mu_);
    if (auto it = contacts_.find(jid); it != contacts_.end()) return it->second.status;
    Contact c;
    c.jid = jid;
    c.display_name = display_name;
    c.first_seen_ms = now_ms;
    c.updated_ms = now_ms;
    contacts_[jid] = c;
    std::string err = persist_locked();
    if (!err.empty()) log_warn("state", "contact " + jid + " not persisted: " + err);
    return ContactStatus::PENDING;
}

std::string HostState::set_contact_status(const std::string& jid, ContactStatus s, int64_t now_ms) {
    std::lock_guard<std::mutex> lk(mu_);
    auto prev_contacts = contacts_;
    auto prev_groups = groups_;

    Contact& c = contacts_[jid];
    if (c.jid.empty()) {
        c.jid = jid;
        c.first_seen_ms = now_ms;
    }
    c.status = s;
    c.updated_ms = now_ms;

    if (s == ContactStatus::APPROVED && groups_.find(jid) == groups_.end()) {
        Group g;
        g.jid = jid;
        g.name = c.display_name.empty() ? jid : c.display_name;
        g.folder = folder_for_jid(jid);
        g.added_at_ms = now_ms;
        for (const auto& [other_jid, other] : groups_) {
            if (other.folder == g.folder) {
                g.folder = g.folder.substr(0, 55) + "-" + std::to_string(now_ms % 100000000);
                break;
            }
        }
        groups_[jid] = g;
    }

    std::string err = persist_locked();
    if (!err.empty()) {
        contacts_ = std::move(prev_contacts);
        groups_ = std::move(prev_groups);
        return "persist failed: " + err;
    }
    return "";
}

SessionMarker HostState::session_marker(const std::string& folder) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = markers_.find(folder);
    if (it == markers_.end()) return SessionMarker{};
    return it->second;
}

std::string HostState::save_session_marker(const std::string& folder, const SessionMarker& m) {
    std::lock_guard<std::mutex> lk(mu_);
    auto prev = markers_;
    markers_[folder] = m;
    std::string err = persist_locked();
    if (!err.empty()) {
        markers_ = std::move(prev);
        return "persist failed: " + err;
    }
    return "";
}

} // namespace kestrel
