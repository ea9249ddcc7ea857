#include "kestrel/heartbeat.h"
#include "kestrel/fsutil.h"
#include "kestrel/json_util.h"
#include "kestrel/log.h"

#include <cctype>
#include <stdexcept>

namespace kestrel {

static const char* kDefaultHeartbeatPrompt =
    "Read HEARTBEAT.md and follow the instructions. If nothing needs attention, respond with HEARTBEAT_OK.";

int64_t parse_interval(const std::string& every) {
    if (every.size() < 2) throw std::invalid_argument("invalid interval \"" + every + "\": use e.g. \"60m\" or \"2h\"");
    char unit = every.back();
    std::string num = every.substr(0, every.size() - 1);
    if (num.empty() || num.size() > 9) throw std::invalid_argument("invalid interval \"" + every + "\"");
    for (char c : num) {
        if (!std::isdigit((unsigned char)c)) throw std::invalid_argument("invalid interval \"" + every + "\"");
    }
    int64_t v = std::stoll(num);
    if (v <= 0) throw std::invalid_argument("interval must be positive: \"" + every + "\"");
    if (unit == 'm') return v * 60 * 1000;
    if (unit == 'h') return v * 60 * 60 * 1000;
    throw std::invalid_argument("invalid interval unit in \"" + every + "\"");
}

std::optional<std::string> heartbeat_cron_for(int64_t interval_ms) {
    int64_t minutes = interval_ms / (60 * 1000);
    if (minutes == 60) return std::string("0 * * * *");
    if (minutes > 0 && minutes < 60 && 60 % minutes == 0) {
        return "*/" + std::to_string(minutes) + " * * * *";
    }
    return std::nullopt;
}

std::optional<HeartbeatConfig> parse_heartbeat_config(const std::string& text, std::string* err) {
    json::Doc d = json::parse(text);
    if (!d.is_object()) {
        if (err) *err = "heartbeat config is not a JSON object";
        return std::nullopt;
    }
    json_object* hb = json::field(d.root, "heartbeat");
    if (!hb || !json_object_is_type(hb, json_type_object)) {
        HeartbeatConfig off;
        return off;
    }
    HeartbeatConfig cfg;
    cfg.enabled = json::get_bool(hb, "enabled").value_or(false);
    cfg.every = json::get_string(hb, "every").value_or("60m");
    cfg.suppress_ok = json::get_bool(hb, "suppressOk").value_or(true);
    cfg.max_suppressed_chars = (int)json::get_int(hb, "maxSuppressedChars").value_or(DEFAULT_MAX_SUPPRESSED_CHARS);
    cfg.prompt = json::get_string(hb, "prompt").value_or("");
    if (json_object* ah = json::field(hb, "activeHours")) {
        ActiveHours a;
        auto start = json::get_int(ah, "start");
        auto end = json::get_int(ah, "end");
        if (!start || !end || *start < 0 || *start > 23 || *end < 0 || *end > 23) {
            if (err) *err = "activeHours.start/end must be hours 0-23";
            return std::nullopt;
        }
        a.start = (int)*start;
        a.end = (int)*end;
        a.timezone = json::get_string(ah, "timezone").value_or("UTC");
        cfg.active_hours = a;
    }
    if (cfg.max_suppressed_chars < 0) cfg.max_suppressed_chars = 0;
    return cfg;
}

std::optional<HeartbeatConfig> load_heartbeat_config(const std::filesystem::path& groups_dir,
                                                     const std::string& folder) {
    std::filesystem::path p = groups_dir / folder / "heartbeat-config.json";
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) {
        log_debug("heartbeat", "no heartbeat config for " + folder);
        return std::nullopt;
    }
    auto body = slurp_file(p);
    if (!body) {
        log_error("heartbeat", "cannot read " + p.string());
        return std::nullopt;
    }
    std::string err;
    auto cfg = parse_heartbeat_config(*body, &err);
    if (!cfg) {
        log_error("heartbeat", "failed to load heartbeat config for " + folder + ": " + err);
        return std::nullopt;
    }
    if (!cfg->enabled) {
        log_debug("heartbeat", "heartbeat disabled for " + folder);
        return std::nullopt;
    }
    return cfg;
}

static std::string hour_label(int h) {
    if (h == 0) return "12 AM";
    if (h == 12) return "12 PM";
    if (h > 12) return std::to_string(h - 12) + " PM";
    return std::to_string(h) + " AM";
}

std::string wrap_prompt_with_active_hours(const HeartbeatConfig& cfg, const std::string& base_prompt) {
    if (!cfg.active_hours) return base_prompt;
    const ActiveHours& a = *cfg.active_hours;
    return "Check the current time in " + a.timezone + " timezone. If it's between " +
           std::to_string(a.start) + ":00 and " + std::to_string(a.end) + ":00 (" +
           hour_label(a.start) + " to " + hour_label(a.end) +
           "), proceed with the heartbeat check. Otherwise, respond with just \"HEARTBEAT_OK\" (outside active hours).\n\n"
           "If within active hours:\n" + base_prompt;
}

static bool is_word_char(char c) {
    return std::isalnum((unsigned char)c) || c == '_';
}

// Case-insensitive token search honouring word boundaries on both sides.
static size_t find_token(const std::string& s, size_t from) {
    const std::string tok = HEARTBEAT_OK_TOKEN;
    for (size_t i = from; i + tok.size() <= s.size(); i++) {
        bool eq = true;
        for (size_t k = 0; k < tok.size(); k++) {
            if (std::toupper((unsigned char)s[i + k]) != tok[k]) { eq = false; break; }
        }
        if (!eq) continue;
        bool left = (i == 0) || !is_word_char(s[i - 1]);
        bool right = (i + tok.size() == s.size()) || !is_word_char(s[i + tok.size()]);
        if (left && right) return i;
    }
    return std::string::npos;
}

bool is_heartbeat_ok(const std::string& message, int max_chars) {
    size_t pos = find_token(message, 0);
    if (pos == std::string::npos) return false;

    std::string rest;
    size_t from = 0;
    while (pos != std::string::npos) {
        rest.append(message, from, pos - from);
        from = pos + std::string(HEARTBEAT_OK_TOKEN).size();
        pos = find_token(message, from);
    }
    rest.append(message, from, std::string::npos);

    std::string kept;
    for (char c : rest) {
        if (is_word_char(c) || std::isspace((unsigned char)c)) kept.push_back(c);
    }
    size_t b = 0;
    while (b < kept.size() && std::isspace((unsigned char)kept[b])) b++;
    size_t e = kept.size();
    while (e > b && std::isspace((unsigned char)kept[e - 1])) e--;
    size_t remaining = e - b;

    if ((int64_t)remaining <= (int64_t)max_chars) {
        log_debug("heartbeat", "suppressing HEARTBEAT_OK reply (remaining " + std::to_string(remaining) + " chars)");
        return true;
    }
    log_debug("heartbeat", "HEARTBEAT_OK with " + std::to_string(remaining) + " chars of content, delivering");
    return false;
}

std::string heartbeat_task_id(const std::string& folder) {
    return "heartbeat-" + folder;
}

bool initialize_heartbeat(const Group& group,
                          const std::filesystem::path& groups_dir,
                          Scheduler& scheduler) {
    auto cfg = load_heartbeat_config(groups_dir, group.folder);
    if (!cfg) return false;

    const std::string id = heartbeat_task_id(group.folder);
    if (scheduler.get(id)) {
        log_info("heartbeat", "heartbeat task " + id + " already exists, leaving it as is");
        return true;
    }

    int64_t interval_ms = 0;
    try {
        interval_ms = parse_interval(cfg->every);
    } catch (const std::invalid_argument& e) {
        log_error("heartbeat", "heartbeat for " + group.folder + " disabled: " + e.what());
        return false;
    }

    ScheduledTask t;
    t.id = id;
    t.group_folder = group.folder;
    t.chat_jid = group.jid;
    t.prompt = wrap_prompt_with_active_hours(*cfg, cfg->prompt.empty() ? kDefaultHeartbeatPrompt : cfg->prompt);
    t.context_mode = "group";
    t.suppress_max_chars = cfg->suppress_ok ? cfg->max_suppressed_chars : -1;
    if (auto cron = heartbeat_cron_for(interval_ms)) {
        t.kind = ScheduleKind::CRON;
        t.schedule_value = *cron;
        if (cfg->active_hours) t.timezone = cfg->active_hours->timezone;
    } else {
        t.kind = ScheduleKind::INTERVAL;
        t.schedule_value = std::to_string(interval_ms);
    }

    std::string err = scheduler.create(t);
    if (!err.empty()) {
        log_error("heartbeat", "failed to initialize heartbeat for " + group.folder + ": " + err);
        return false;
    }
    log_info("heartbeat", "heartbeat initialized for " + group.folder + " (" +
             schedule_kind_name(t.kind) + " " + t.schedule_value + ")");
    return true;
}

size_t initialize_all_heartbeats(const HostState& state,
                                 const std::filesystem::path& groups_dir,
                                 Scheduler& scheduler) {
    size_t n = 0;
    for (const auto& g : state.groups()) {
        if (initialize_heartbeat(g, groups_dir, scheduler)) n++;
    }
    if (n > 0) log_info("heartbeat", std::to_string(n) + " heartbeat(s) initialized");
    else log_debug("heartbeat", "no heartbeats configured");
    return n;
}

} // namespace kestrel
