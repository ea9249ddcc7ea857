#include "test_common.h"

#include "kestrel/heartbeat.h"

#include <stdexcept>

using namespace kestrel;
namespace fs = std::filesystem;

static void test_sentinel_detection() {
    expect_true(is_heartbeat_ok("HEARTBEAT_OK"), "bare token");
    expect_true(is_heartbeat_ok("  heartbeat_ok.  "), "case-insensitive with punctuation");
    expect_true(is_heartbeat_ok("**HEARTBEAT_OK**"), "markdown emphasis ignored");
    expect_true(is_heartbeat_ok("All quiet. HEARTBEAT_OK"), "short remark still suppressed at 300");
    expect_true(!is_heartbeat_ok("Your disk is 95% full, please clean up."), "no token, never suppressed");
    expect_true(!is_heartbeat_ok("XHEARTBEAT_OK"), "token must start on a word boundary");
    expect_true(!is_heartbeat_ok("HEARTBEAT_OKAY"), "token must end on a word boundary");

    std::string long_tail = "HEARTBEAT_OK " + std::string(250, 'a');
    expect_true(is_heartbeat_ok(long_tail, 300), "250 chars of content fit under 300");
    expect_true(!is_heartbeat_ok(long_tail, 10), "250 chars of content exceed 10");
    expect_true(!is_heartbeat_ok("HEARTBEAT_OK " + std::string(301, 'b'), 300), "301 chars exceed 300");
    expect_true(is_heartbeat_ok("HEARTBEAT_OK " + std::string(300, 'b'), 300), "exactly 300 is allowed");
    expect_true(is_heartbeat_ok("HEARTBEAT_OK and HEARTBEAT_OK", 3), "every occurrence removed before counting");
    expect_true(is_heartbeat_ok("HEARTBEAT_OK", 0), "zero threshold allows the bare token");
}

static void test_intervals() {
    expect_eq_ll(parse_interval("30m"), 30LL * 60 * 1000, "minutes");
    expect_eq_ll(parse_interval("2h"), 2LL * 3600 * 1000, "hours");
    for (const char* bad : {"", "m", "0m", "5s", "-5m", "1.5h", "10"}) {
        try {
            (void)parse_interval(bad);
            die(std::string("interval should be rejected: ") + bad);
        } catch (const std::invalid_argument&) {}
    }

    expect_eq_str(heartbeat_cron_for(parse_interval("60m")).value_or(""), "0 * * * *", "hourly");
    expect_eq_str(heartbeat_cron_for(parse_interval("1h")).value_or(""), "0 * * * *", "1h is hourly");
    expect_eq_str(heartbeat_cron_for(parse_interval("15m")).value_or(""), "*/15 * * * *", "divisor of 60");
    expect_true(!heartbeat_cron_for(parse_interval("45m")), "45m runs in interval mode");
    expect_true(!heartbeat_cron_for(parse_interval("2h")), "2h runs in interval mode");
}

static void test_config_and_prompt() {
    std::string err;
    auto cfg = parse_heartbeat_config(
        "{\"heartbeat\":{\"enabled\":true,\"every\":\"30m\",\"maxSuppressedChars\":10,"
        "\"activeHours\":{\"start\":9,\"end\":21,\"timezone\":\"Europe/Berlin\"}}}", &err);
    expect_true(cfg.has_value(), "config parses: " + err);
    expect_true(cfg->enabled && cfg->suppress_ok, "enabled, suppression on by default");
    expect_eq_ll(cfg->max_suppressed_chars, 10, "custom threshold");
    expect_true(cfg->active_hours && cfg->active_hours->start == 9 && cfg->active_hours->end == 21, "active hours");

    std::string wrapped = wrap_prompt_with_active_hours(*cfg, "Check the mailbox.");
    expect_true(wrapped.find("Europe/Berlin") != std::string::npos, "zone named in the prompt");
    expect_true(wrapped.find("9 AM to 9 PM") != std::string::npos, "hours spelled out");
    expect_true(wrapped.find("HEARTBEAT_OK") != std::string::npos, "sentinel instruction present");
    expect_true(wrapped.size() > std::string("Check the mailbox.").size() &&
                wrapped.compare(wrapped.size() - 18, 18, "Check the mailbox.") == 0, "base prompt kept at the end");

    HeartbeatConfig plain;
    expect_eq_str(wrap_prompt_with_active_hours(plain, "p"), "p", "no window, prompt unchanged");

    auto off = parse_heartbeat_config("{\"other\":1}", &err);
    expect_true(off && !off->enabled, "missing heartbeat section means disabled");
    expect_true(!parse_heartbeat_config("{\"heartbeat\":{\"enabled\":true,\"activeHours\":{\"start\":25,\"end\":3}}}", &err),
                "bad hour rejected");
    expect_true(!parse_heartbeat_config("[1,2]", &err), "non-object rejected");
}

static Group group(const std::string& folder) {
    Group g;
    g.jid = "spool:" + folder;
    g.name = folder;
    g.folder = folder;
    return g;
}

static void test_initialize() {
    fs::path groups = fresh_dir("heartbeat_groups");
    write_text(groups / "kitchen" / "heartbeat-config.json",
               "{\"heartbeat\":{\"enabled\":true,\"every\":\"15m\"}}");
    write_text(groups / "garden" / "heartbeat-config.json",
               "{\"heartbeat\":{\"enabled\":true,\"every\":\"45m\",\"suppressOk\":false,\"prompt\":\"Water?\"}}");
    write_text(groups / "attic" / "heartbeat-config.json",
               "{\"heartbeat\":{\"enabled\":false,\"every\":\"15m\"}}");
    write_text(groups / "cellar" / "heartbeat-config.json", "{\"heartbeat\":");

    HostState state;
    for (const char* f : {"kitchen", "garden", "attic", "cellar", "hall"}) {
        expect_true(state.register_group(group(f)).empty(), std::string("register ") + f);
    }

    MemoryTaskStore store;
    ManualClock clock(1767225600000LL);
    Scheduler sched(store, clock, TimeZone::utc());
    expect_eq_ll((long long)initialize_all_heartbeats(state, groups, sched), 2, "two groups have heartbeats");

    auto k = sched.get(heartbeat_task_id("kitchen"));
    expect_true(k.has_value(), "kitchen heartbeat task");
    expect_true(k->kind == ScheduleKind::CRON, "15m maps to cron");
    expect_eq_str(k->schedule_value, "*/15 * * * *", "cron expression");
    expect_eq_ll(k->suppress_max_chars, DEFAULT_MAX_SUPPRESSED_CHARS, "default threshold");
    expect_eq_str(k->context_mode, "group", "heartbeat keeps the group conversation");
    expect_true(k->prompt.find("HEARTBEAT.md") != std::string::npos, "default prompt");

    auto g = sched.get(heartbeat_task_id("garden"));
    expect_true(g && g->kind == ScheduleKind::INTERVAL, "45m runs as an interval");
    expect_eq_str(g->schedule_value, std::to_string(45 * 60 * 1000), "interval in ms");
    expect_eq_ll(g->suppress_max_chars, -1, "suppression disabled");
    expect_eq_str(g->prompt, "Water?", "custom prompt");

    expect_true(!sched.get(heartbeat_task_id("attic")), "disabled config creates nothing");
    expect_true(!sched.get(heartbeat_task_id("cellar")), "malformed config creates nothing");
    expect_true(!sched.get(heartbeat_task_id("hall")), "no config creates nothing");

    // Re-running leaves existing tasks alone, including a user's pause.
    expect_true(sched.pause(heartbeat_task_id("kitchen")).empty(), "pause kitchen");
    expect_eq_ll((long long)initialize_all_heartbeats(state, groups, sched), 2, "idempotent");
    expect_eq_ll((long long)sched.list().size(), 2, "no duplicates");
    expect_true(sched.get(heartbeat_task_id("kitchen"))->status == TaskStatus::PAUSED, "pause survives");
}

int main() {
    set_log_threshold(LogLevel::ERROR);
    test_sentinel_detection();
    test_intervals();
    test_config_and_prompt();
    test_initialize();
    std::cerr << "test_heartbeat: ALL PASSED" << std::endl;
    return 0;
}
