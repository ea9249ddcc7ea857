#include "test_common.h"

#include "kestrel/cron.h"
#include "kestrel/timezone.h"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace kestrel;

static int64_t utc(const std::string& s) {
    auto t = parse_timestamp(s, TimeZone::utc());
    if (!t) die("bad timestamp literal " + s);
    return *t;
}

static void expect_next(const std::string& expr, const std::string& after, const std::string& want,
                        const TimeZone& tz = TimeZone::utc()) {
    auto next = CronExpr::parse(expr).next_after(utc(after), tz);
    expect_true(next.has_value(), expr + " should have a next run after " + after);
    expect_eq_str(format_utc(*next), want, expr + " after " + after + " in " + tz.name());
}

static void expect_rejected(const std::string& expr) {
    try {
        (void)CronExpr::parse(expr);
    } catch (const std::invalid_argument&) {
        return;
    }
    die("expression should be rejected: " + expr);
}

int main() {
    // Calendar helpers.
    expect_eq_ll(days_in_month(2024, 2), 29, "leap February");
    expect_eq_ll(days_in_month(2026, 2), 28, "common February");
    expect_eq_ll(weekday_of(2026, 1, 1), 4, "2026-01-01 is a Thursday");

    // Timestamp parsing and formatting.
    expect_eq_str(format_utc(utc("2026-01-15T10:07:00Z")), "2026-01-15T10:07:00Z", "round trip");
    expect_eq_ll(utc("1767225600000"), 1767225600000LL, "epoch milliseconds accepted");
    expect_eq_ll(utc("2026-01-01T00:00"), 1767225600000LL, "seconds optional");
    expect_true(!parse_timestamp("2026-02-30T00:00:00Z", TimeZone::utc()), "invalid day rejected");
    expect_true(!parse_timestamp("tomorrow", TimeZone::utc()), "garbage rejected");
    expect_true(!parse_timestamp("2026-01-01T00:00:00+01:00", TimeZone::utc()), "offsets rejected");

    // Steps, strictly-after semantics.
    expect_next("*/15 * * * *", "2026-01-15T10:07:00Z", "2026-01-15T10:15:00Z");
    expect_next("*/15 * * * *", "2026-01-15T10:15:00Z", "2026-01-15T10:30:00Z");
    expect_next("*/15 * * * *", "2026-01-15T23:59:30Z", "2026-01-16T00:00:00Z");
    expect_next("5,35 */6 * * *", "2026-01-15T06:36:00Z", "2026-01-15T12:05:00Z");
    expect_next("0 0 1 * *", "2026-12-31T12:00:00Z", "2027-01-01T00:00:00Z");

    // Weekdays, names, shorthands.
    expect_next("0 9 * * 1-5", "2026-01-17T10:00:00Z", "2026-01-19T09:00:00Z");
    expect_next("0 9 * * mon-fri", "2026-01-17T10:00:00Z", "2026-01-19T09:00:00Z");
    expect_next("0 0 * * 7", "2026-01-15T00:00:00Z", "2026-01-18T00:00:00Z");
    expect_next("0 12 1 jun *", "2026-01-15T00:00:00Z", "2026-06-01T12:00:00Z");
    expect_next("@daily", "2026-01-15T10:07:00Z", "2026-01-16T00:00:00Z");
    expect_next("@hourly", "2026-01-15T10:07:00Z", "2026-01-15T11:00:00Z");
    expect_next("@weekly", "2026-01-15T10:07:00Z", "2026-01-18T00:00:00Z");

    // Day-of-month and day-of-week both restricted: either matches.
    expect_next("0 0 13 * 5", "2026-01-15T00:00:00Z", "2026-01-16T00:00:00Z");
    expect_next("0 0 29 2 *", "2026-01-15T00:00:00Z", "2028-02-29T00:00:00Z");
    expect_true(!CronExpr::parse("0 0 31 2 *").next_after(utc("2026-01-01T00:00:00Z"), TimeZone::utc()),
                "impossible date has no next run");

    // Zones: wall-clock 08:30 in New York in winter and summer.
    TimeZone ny = TimeZone::named("America/New_York");
    expect_eq_str(ny.name(), "America/New_York", "zone name kept");
    expect_next("30 8 * * *", "2026-01-15T12:00:00Z", "2026-01-15T13:30:00Z", ny);
    expect_next("30 8 * * *", "2026-07-15T12:00:00Z", "2026-07-15T12:30:00Z", ny);
    expect_eq_str(format_local(utc("2026-07-15T12:30:00Z"), ny), "2026-07-15T08:30:00", "local formatting");
    TimeZone tokyo = TimeZone::named("Asia/Tokyo");
    expect_next("0 9 * * *", "2026-01-15T00:30:00Z", "2026-01-16T00:00:00Z", tokyo);

    // A day without 02:30 (spring forward) still yields a run later that day or after.
    {
        auto next = CronExpr::parse("30 2 * * *").next_after(utc("2026-03-08T05:00:00Z"), ny);
        expect_true(next.has_value(), "DST gap day has a next run");
        expect_true(*next > utc("2026-03-08T05:00:00Z") && *next <= utc("2026-03-09T07:30:00Z"),
                    "DST gap run lands within a day");
    }

    try {
        (void)TimeZone::named("Not/AZone");
        die("unknown zone should throw");
    } catch (const std::invalid_argument&) {}
    expect_true(TimeZone::named("UTC").is_utc(), "UTC by name");

    // Zone lookups race with zone-local conversions on other threads.
    {
        std::atomic<int> wrong{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; t++) {
            threads.emplace_back([&wrong, t] {
                for (int i = 0; i < 200; i++) {
                    TimeZone z = TimeZone::named(t % 2 ? "Asia/Tokyo" : "America/New_York");
                    CivilTime c = z.to_local(utc("2026-01-15T12:00:00Z"));
                    if (c.hour != (t % 2 ? 21 : 7)) wrong++;
                }
            });
        }
        for (auto& th : threads) th.join();
        expect_eq_ll(wrong.load(), 0, "concurrent lookups and conversions stay consistent");
    }

    // Malformed expressions.
    expect_rejected("");
    expect_rejected("* * * *");
    expect_rejected("* * * * * *");
    expect_rejected("61 * * * *");
    expect_rejected("* 24 * * *");
    expect_rejected("*/0 * * * *");
    expect_rejected("5-1 * * * *");
    expect_rejected("0 0 0 * *");
    expect_rejected("0 0 * foo *");
    expect_rejected("@sometimes");

    expect_true(CronExpr::parse("0 12 * * 1").matches(CivilTime{2026, 1, 19, 12, 0, 0, 1}), "matches civil time");
    expect_true(!CronExpr::parse("0 12 * * 1").matches(CivilTime{2026, 1, 20, 12, 0, 0, 2}), "wrong weekday");

    std::cerr << "test_cron: ALL PASSED" << std::endl;
    return 0;
}
