#include "kestrel/timezone.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <mutex>
#include <stdexcept>

namespace kestrel {

static std::mutex g_tz_mu;

int days_in_month(int year, int month) {
    static const int dm[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return dm[(month - 1) % 12];
}

int weekday_of(int year, int month, int day) {
    // Sakamoto
    static const int t[12] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
    if (month < 3) year -= 1;
    return (year + year / 4 - year / 100 + year / 400 + t[month - 1] + day) % 7;
}

static CivilTime from_tm(const struct tm& t) {
    CivilTime c;
    c.year = t.tm_year + 1900;
    c.month = t.tm_mon + 1;
    c.day = t.tm_mday;
    c.hour = t.tm_hour;
    c.minute = t.tm_min;
    c.second = t.tm_sec;
    c.weekday = t.tm_wday;
    return c;
}

static struct tm to_tm(const CivilTime& c) {
    struct tm t{};
    t.tm_year = c.year - 1900;
    t.tm_mon = c.month - 1;
    t.tm_mday = c.day;
    t.tm_hour = c.hour;
    t.tm_min = c.minute;
    t.tm_sec = c.second;
    t.tm_isdst = -1;
    return t;
}

static int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
    return q;
}

// Runs fn with TZ set to `name`, restoring the previous value afterwards.
template <typename Fn>
static auto with_tz(const std::string& name, Fn fn) {
    std::lock_guard<std::mutex> lk(g_tz_mu);
    const char* prev = std::getenv("TZ");
    std::string saved = prev ? prev : "";
    bool had = prev != nullptr;
    setenv("TZ", name.c_str(), 1);
    tzset();
    auto r = fn();
    if (had) setenv("TZ", saved.c_str(), 1);
    else unsetenv("TZ");
    tzset();
    return r;
}

TimeZone TimeZone::utc() { return TimeZone("UTC", true); }

TimeZone TimeZone::named(const std::string& name) {
    if (name.empty() || name == "UTC" || name == "Etc/UTC" || name == "GMT" || name == "Z") {
        return utc();
    }
    if (name.find("..") != std::string::npos || name[0] == '/') {
        throw std::invalid_argument("invalid timezone: " + name);
    }
    std::filesystem::path dir = "/usr/share/zoneinfo";
    {
        // Environment reads are serialized with the TZ switches in with_tz.
        std::lock_guard<std::mutex> lk(g_tz_mu);
        if (const char* d = std::getenv("TZDIR")) dir = d;
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(dir / name, ec)) {
        throw std::invalid_argument("unknown timezone: " + name);
    }
    return TimeZone(name, false);
}

CivilTime TimeZone::to_local(int64_t epoch_ms) const {
    time_t secs = (time_t)floor_div(epoch_ms, 1000);
    if (utc_) {
        struct tm t{};
        gmtime_r(&secs, &t);
        return from_tm(t);
    }
    return with_tz(name_, [&]() {
        struct tm t{};
        localtime_r(&secs, &t);
        return from_tm(t);
    });
}

int64_t TimeZone::from_local(const CivilTime& c) const {
    struct tm t = to_tm(c);
    if (utc_) return (int64_t)timegm(&t) * 1000;
    return with_tz(name_, [&]() {
        return (int64_t)mktime(&t) * 1000;
    });
}

static std::string format_civil(const CivilTime& c) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                  c.year, c.month, c.day, c.hour, c.minute, c.second);
    return buf;
}

std::string format_local(int64_t epoch_ms, const TimeZone& tz) {
    return format_civil(tz.to_local(epoch_ms));
}

std::string format_utc(int64_t epoch_ms) {
    return format_civil(TimeZone::utc().to_local(epoch_ms)) + "Z";
}

std::optional<int64_t> parse_timestamp(const std::string& s, const TimeZone& tz) {
    if (s.empty()) return std::nullopt;
    bool digits = true;
    for (char c : s) {
        if (!std::isdigit((unsigned char)c)) { digits = false; break; }
    }
    if (digits) {
        if (s.size() > 15) return std::nullopt;
        return std::stoll(s);
    }

    std::string body = s;
    bool zulu = false;
    if (body.back() == 'Z') {
        zulu = true;
        body.pop_back();
    }
    CivilTime c;
    int used = 0;
    int n = std::sscanf(body.c_str(), "%4d-%2d-%2dT%2d:%2d%n:%2d%n",
                        &c.year, &c.month, &c.day, &c.hour, &c.minute, &used, &c.second, &used);
    if (n < 5 || (size_t)used != body.size()) return std::nullopt;
    if (c.month < 1 || c.month > 12) return std::nullopt;
    if (c.day < 1 || c.day > days_in_month(c.year, c.month)) return std::nullopt;
    if (c.hour < 0 || c.hour > 23 || c.minute < 0 || c.minute > 59) return std::nullopt;
    if (c.second < 0 || c.second > 59) return std::nullopt;
    if (zulu) return TimeZone::utc().from_local(c);
    return tz.from_local(c);
}

} // namespace kestrel
