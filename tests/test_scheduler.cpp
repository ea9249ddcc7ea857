#include "test_common.h"

#include "kestrel/scheduler.h"

#include <algorithm>
#include <fstream>

using namespace kestrel;
namespace fs = std::filesystem;

static int64_t utc(const std::string& s) {
    auto t = parse_timestamp(s, TimeZone::utc());
    if (!t) die("bad timestamp literal " + s);
    return *t;
}

static ScheduledTask make_task(const std::string& id, ScheduleKind kind, const std::string& value) {
    ScheduledTask t;
    t.id = id;
    t.group_folder = "ops";
    t.chat_jid = "spool:ops";
    t.prompt = "do the thing";
    t.kind = kind;
    t.schedule_value = value;
    return t;
}

static void test_create_and_validate() {
    MemoryTaskStore store;
    ManualClock clock(utc("2026-01-15T10:07:00Z"));
    Scheduler s(store, clock, TimeZone::utc());

    expect_true(s.create(make_task("c1", ScheduleKind::CRON, "*/15 * * * *")).empty(), "cron task created");
    expect_eq_str(format_utc(s.get("c1")->next_run_ms), "2026-01-15T10:15:00Z", "cron next run");
    expect_true(s.get("c1")->created_at_ms == clock.now_ms(), "created_at filled");

    expect_true(s.create(make_task("i1", ScheduleKind::INTERVAL, "60000")).empty(), "interval task created");
    expect_eq_ll(s.get("i1")->next_run_ms, clock.now_ms() + 60000, "interval next run");

    expect_true(s.create(make_task("o1", ScheduleKind::ONCE, "2026-01-15T12:00:00Z")).empty(), "once task created");
    expect_eq_ll(s.get("o1")->next_run_ms, utc("2026-01-15T12:00:00Z"), "once next run");

    // Local once timestamps use the task zone.
    ScheduledTask local = make_task("o2", ScheduleKind::ONCE, "2026-01-15T09:00");
    local.timezone = "America/New_York";
    expect_true(s.create(local).empty(), "zoned once task created");
    expect_eq_ll(s.get("o2")->next_run_ms, utc("2026-01-15T14:00:00Z"), "09:00 New York is 14:00 UTC");

    expect_true(s.create(make_task("c1", ScheduleKind::CRON, "0 * * * *")).find("already exists") != std::string::npos,
                "duplicate id rejected");
    expect_true(s.create(make_task("bad1", ScheduleKind::CRON, "every day")).rfind("invalid schedule", 0) == 0,
                "bad cron rejected");
    expect_true(!s.create(make_task("bad2", ScheduleKind::INTERVAL, "-5")).empty(), "negative interval rejected");
    expect_true(!s.create(make_task("bad3", ScheduleKind::INTERVAL, "10")).empty(), "sub-second interval rejected");
    expect_true(!s.create(make_task("bad4", ScheduleKind::ONCE, "soon")).empty(), "bad timestamp rejected");
    ScheduledTask badzone = make_task("bad5", ScheduleKind::CRON, "0 9 * * *");
    badzone.timezone = "Mars/Olympus";
    expect_true(!s.create(badzone).empty(), "unknown zone rejected");
    ScheduledTask noprompt = make_task("bad6", ScheduleKind::CRON, "0 9 * * *");
    noprompt.prompt.clear();
    expect_true(!s.create(noprompt).empty(), "task without prompt rejected");
    expect_true(!s.get("bad1"), "rejected tasks are not stored");

    auto listed = s.list("ops");
    expect_eq_ll((long long)listed.size(), 4, "four tasks listed");
    expect_eq_str(listed[0].id, "i1", "list is ordered by next run");
    expect_eq_str(listed[1].id, "c1", "cron second");
    expect_eq_ll((long long)s.list("other").size(), 0, "filter by group");
}

static void test_tick_fires_and_advances() {
    MemoryTaskStore store;
    ManualClock clock(utc("2026-01-15T10:07:00Z"));
    Scheduler s(store, clock, TimeZone::utc());
    std::vector<std::string> fired;
    s.set_fire_handler([&](const ScheduledTask& t) {
        fired.push_back(t.id);
        return FireResult::ENQUEUED;
    });

    expect_true(s.create(make_task("cron", ScheduleKind::CRON, "*/15 * * * *")).empty(), "cron");
    expect_true(s.create(make_task("once", ScheduleKind::ONCE, "2026-01-15T10:20:00Z")).empty(), "once");

    expect_eq_ll((long long)s.tick(), 0, "nothing due yet");
    clock.set(utc("2026-01-15T10:15:00Z"));
    expect_eq_ll((long long)s.tick(), 1, "cron due at 10:15");
    expect_eq_str(format_utc(s.get("cron")->next_run_ms), "2026-01-15T10:30:00Z", "cron advanced");
    expect_eq_ll(s.get("cron")->last_run_ms, clock.now_ms(), "last run recorded");

    clock.set(utc("2026-01-15T10:20:30Z"));
    expect_eq_ll((long long)s.tick(), 1, "once task due");
    auto once = s.get("once");
    expect_true(once->status == TaskStatus::DONE, "once task done after firing");
    expect_eq_ll(once->next_run_ms, 0, "done task has no next run");
    clock.set(utc("2026-01-16T00:00:00Z"));
    s.tick();
    expect_eq_ll((long long)std::count(fired.begin(), fired.end(), "once"), 1, "once task fires exactly once");

    // Host down for hours: the missed occurrences collapse into one firing.
    fired.clear();
    clock.set(utc("2026-01-16T15:07:00Z"));
    expect_eq_ll((long long)s.tick(), 1, "missed cron runs fire once");
    expect_eq_ll((long long)fired.size(), 1, "one firing");
    expect_eq_str(format_utc(s.get("cron")->next_run_ms), "2026-01-16T15:15:00Z", "skipped ahead to the future");
    expect_eq_ll((long long)s.tick(), 0, "no catch-up burst");

    auto runs = store.runs();
    expect_true(!runs.empty() && runs.back().status == "enqueued", "run log records the firing");
}

static void test_retry_drop_pause() {
    MemoryTaskStore store;
    ManualClock clock(utc("2026-01-15T10:00:00Z"));
    Scheduler s(store, clock, TimeZone::utc());
    FireResult answer = FireResult::RETRY;
    int calls = 0;
    s.set_fire_handler([&](const ScheduledTask&) {
        calls++;
        return answer;
    });

    expect_true(s.create(make_task("t", ScheduleKind::INTERVAL, "60000")).empty(), "create");
    int64_t due = s.get("t")->next_run_ms;
    clock.set(due);
    expect_eq_ll((long long)s.tick(), 0, "retry does not count as fired");
    expect_eq_ll(s.get("t")->next_run_ms, due, "retry keeps next run");
    s.tick();
    expect_eq_ll(calls, 2, "retried on the next tick");

    answer = FireResult::DROP;
    s.tick();
    auto t = s.get("t");
    expect_true(t->status == TaskStatus::PAUSED, "drop pauses the task");
    expect_true(t->last_result.find("not registered") != std::string::npos, "drop reason recorded");
    s.tick();
    expect_eq_ll(calls, 3, "paused task is not fired");

    // Pause / resume / cancel.
    answer = FireResult::ENQUEUED;
    clock.set(due + 300000);
    expect_true(s.resume("t").empty(), "resume");
    expect_eq_ll(s.get("t")->next_run_ms, due + 360000, "resume recomputes from now");
    expect_true(s.pause("t").empty(), "pause");
    clock.set(due + 400000);
    expect_eq_ll((long long)s.tick(), 0, "paused task idle");
    expect_true(s.cancel("t").empty(), "cancel");
    t = s.get("t");
    expect_true(t->status == TaskStatus::DONE && t->last_result == "cancelled", "cancel marks done");
    expect_true(!s.resume("t").empty(), "done task cannot resume");
    expect_true(!s.pause("missing").empty(), "unknown id");

    // A stored task whose schedule went bad is paused on the next tick.
    ScheduledTask broken = make_task("broken", ScheduleKind::CRON, "not a cron");
    broken.next_run_ms = 0;
    expect_true(store.put(broken).empty(), "put broken");
    s.tick();
    auto b = s.get("broken");
    expect_true(b->status == TaskStatus::PAUSED, "invalid schedule paused");
    expect_true(b->last_result.rfind("error:", 0) == 0, "error recorded");
}

static void test_file_store_reload() {
    fs::path dir = fresh_dir("scheduler_store");
    ManualClock clock(utc("2026-01-15T10:07:00Z"));
    {
        FileTaskStore store(dir, false);
        expect_true(store.load().empty(), "empty store loads");
        Scheduler s(store, clock, TimeZone::utc());
        s.set_fire_handler([](const ScheduledTask&) { return FireResult::ENQUEUED; });
        expect_true(s.create(make_task("a", ScheduleKind::CRON, "0 * * * *")).empty(), "create a");
        expect_true(s.create(make_task("b", ScheduleKind::ONCE, "2026-01-15T10:30:00Z")).empty(), "create b");
        expect_true(s.flush().empty(), "checkpoint");
        expect_eq_ll(store.journal().size_bytes(), 0, "journal truncated by checkpoint");

        clock.set(utc("2026-01-15T11:00:00Z"));
        expect_eq_ll((long long)s.tick(), 2, "both fire");
        expect_true(store.journal().size_bytes() > 0, "firings journaled after the checkpoint");
    }
    // Simulate a crash that tore the last journal line.
    {
        std::ofstream j(dir / "tasks.journal.jsonl", std::ios::app | std::ios::binary);
        j << "{\"t\":\"PUT\",\"task\":{\"id\":\"torn\"";
    }
    FileTaskStore reopened(dir, false);
    expect_true(reopened.load().empty(), "reload");
    auto a = reopened.get("a");
    auto b = reopened.get("b");
    expect_true(a && b, "tasks survive restart");
    expect_eq_str(format_utc(a->next_run_ms), "2026-01-15T12:00:00Z", "advanced next run survives");
    expect_true(b->status == TaskStatus::DONE, "done status survives");
    expect_true(!reopened.get("torn"), "torn record ignored");
    expect_true(fs::exists(dir / "task-runs.jsonl"), "run log written");

    // A change made after the crash survives the next restart.
    {
        Scheduler s(reopened, clock, TimeZone::utc());
        expect_true(s.pause("a").empty(), "pause after restart");
    }
    FileTaskStore third(dir, false);
    expect_true(third.load().empty(), "second reload");
    auto a2 = third.get("a");
    expect_true(a2 && a2->status == TaskStatus::PAUSED, "pause journaled after a torn tail survives");
    expect_true(third.get("b").has_value(), "earlier records still replay");
}

static void test_recurring_tick() {
    MemoryTaskStore store;
    ManualClock clock(utc("2026-01-15T10:00:00Z"));
    Scheduler s(store, clock, TimeZone::utc());
    int fired = 0;
    s.set_fire_handler([&](const ScheduledTask&) {
        fired++;
        return FireResult::ENQUEUED;
    });
    expect_true(s.create(make_task("hourly", ScheduleKind::CRON, "0 * * * *")).empty(), "create");
    s.start(60000);
    clock.advance(3 * 3600 * 1000);
    expect_eq_ll(fired, 3, "poll loop fires each hour");
    s.stop();
    clock.advance(3600 * 1000);
    expect_eq_ll(fired, 3, "stopped scheduler stays quiet");

    // A cancelled tick fires nothing and leaves the task due.
    CancelSource cs;
    cs.cancel();
    const int64_t due = s.get("hourly")->next_run_ms;
    expect_eq_ll((long long)s.tick(cs.token()), 0, "cancelled tick fires nothing");
    expect_eq_ll(s.get("hourly")->next_run_ms, due, "next run untouched");
    expect_eq_ll((long long)s.tick(), 1, "uncancelled tick catches up");
    expect_eq_ll(fired, 4, "fired once more");
}

int main() {
    set_log_threshold(LogLevel::ERROR);
    test_create_and_validate();
    test_tick_fires_and_advances();
    test_retry_drop_pause();
    test_file_store_reload();
    test_recurring_tick();
    std::cerr << "test_scheduler: ALL PASSED" << std::endl;
    return 0;
}
