#pragma once

#include "mount_security.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kestrel {

constexpr const char* MAIN_GROUP_FOLDER = "main";

struct Group {
    std::string jid;        // channel-qualified id, e.g. "spool:family"
    std::string name;
    std::string folder;     // workspace folder under groups/
    bool requires_trigger{true};
    std::vector<AdditionalMount> additional_mounts;
    int64_t added_at_ms{0};

    bool is_main() const { return folder == MAIN_GROUP_FOLDER; }
};

enum class ContactStatus { PENDING, APPROVED, BLOCKED };

const char* contact_status_name(ContactStatus s);
std::optional<ContactStatus> parse_contact_status(const std::string& s);

struct Contact {
    std::string jid;
    std::string display_name;
    ContactStatus status{ContactStatus::PENDING};
    int64_t first_seen_ms{0};
    int64_t updated_ms{0};
};

// Per-group continuity data written when a session terminates.
struct SessionMarker {
    std::string session_id;       // runtime conversation id, resumed next spawn
    int64_t last_cursor_ms{0};    // newest inbound message timestamp handed to a session
};

bool is_valid_group_folder(const std::string& folder);

// Folder name derived from a jid: lowercase, [a-z0-9_-], max 64 chars.
std::string folder_for_jid(const std::string& jid);

// Single owner of the group registry, contact list and session markers.
// Passed by reference to the queue, session manager and IPC dispatcher.
// Every mutation is persisted with write-then-rename; on failure the
// in-memory change is rolled back so memory never runs ahead of disk.
class HostState {
public:
    // Empty path: in-memory only (tests).
    explicit HostState(std::filesystem::path state_file = {});

    // Loads the snapshot. A missing file is not an error.
    // Returns empty string on success.
    std::string load();

    std::optional<Group> group_by_jid(const std::string& jid) const;
    std::optional<Group> group_by_folder(const std::string& folder) const;
    std::vector<Group> groups() const;

    // Registers or replaces a group. Rejects invalid folders and folder
    // collisions with a different jid. Returns empty string on success.
    std::string register_group(const Group& g);

    std::optional<Contact> contact(const std::string& jid) const;
    std::vector<Contact> contacts() const;

    // Records a first-seen contact as PENDING; no-op for known contacts.
    // Returns the contact's current status.
    ContactStatus note_contact(const std::string& jid, const std::string& display_name, int64_t now_ms);

    // APPROVED registers a group for the contact if none exists.
    std::string set_contact_status(const std::string& jid, ContactStatus s, int64_t now_ms);

    SessionMarker session_marker(const std::string& folder) const;
    std::string save_session_marker(const std::string& folder, const SessionMarker& m);

    const std::filesystem::path& path() const { return path_; }

private:
    std::string persist_locked() const;

    std::filesystem::path path_;
    mutable std::mutex mu_;
    std::map<std::string, Group> groups_;        // by jid
    std::map<std::string, Contact> contacts_;    // by jid
    std::map<std::string, SessionMarker> markers_; // by folder
};

} // namespace kestrel
