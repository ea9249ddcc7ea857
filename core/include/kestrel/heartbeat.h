#pragma once

#include "host_state.h"
#include "scheduler.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace kestrel {

constexpr const char* HEARTBEAT_OK_TOKEN = "HEARTBEAT_OK";
constexpr int DEFAULT_MAX_SUPPRESSED_CHARS = 300;

struct ActiveHours {
    int start{0};   // 0..23
    int end{0};     // 0..23
    std::string timezone;
};

struct HeartbeatConfig {
    bool enabled{false};
    std::string every;                  // "<n>m" or "<n>h"
    std::optional<ActiveHours> active_hours;
    bool suppress_ok{true};
    int max_suppressed_chars{DEFAULT_MAX_SUPPRESSED_CHARS};
    std::string prompt;                 // empty: default prompt
};

// "<n>m" / "<n>h" to milliseconds. Throws std::invalid_argument.
int64_t parse_interval(const std::string& every);

// 60m -> "0 * * * *", divisors of 60 -> "*/N * * * *", otherwise nullopt
// (the heartbeat then runs in interval mode).
std::optional<std::string> heartbeat_cron_for(int64_t interval_ms);

// Parses {"heartbeat":{...}}. nullopt + *err on malformed input; a
// document with the heartbeat disabled parses with enabled=false.
std::optional<HeartbeatConfig> parse_heartbeat_config(const std::string& json, std::string* err);

// groups/<folder>/heartbeat-config.json. nullopt if absent, malformed or disabled.
std::optional<HeartbeatConfig> load_heartbeat_config(const std::filesystem::path& groups_dir,
                                                     const std::string& folder);

// Prefixes the prompt with the active-hours instruction. Outside the window
// the runtime is told to answer with the bare sentinel, so filtering happens
// in content, not in scheduling.
std::string wrap_prompt_with_active_hours(const HeartbeatConfig& cfg, const std::string& base_prompt);

// True if message contains the HEARTBEAT_OK token (case-insensitive, word
// boundary) and what remains after removing every occurrence and all
// punctuation, trimmed, is at most max_chars characters.
bool is_heartbeat_ok(const std::string& message, int max_chars = DEFAULT_MAX_SUPPRESSED_CHARS);

std::string heartbeat_task_id(const std::string& folder);

// Creates the heartbeat task for one group. An existing task with the same
// id is left untouched. Returns true if the group has an active heartbeat.
bool initialize_heartbeat(const Group& group,
                          const std::filesystem::path& groups_dir,
                          Scheduler& scheduler);

// Returns the number of groups with a heartbeat.
size_t initialize_all_heartbeats(const HostState& state,
                                 const std::filesystem::path& groups_dir,
                                 Scheduler& scheduler);

} // namespace kestrel
