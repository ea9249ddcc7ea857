#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace kestrel {

// Civil (wall-clock) time, minute resolution is what the scheduler needs
// but seconds are kept for formatting.
struct CivilTime {
    int year{1970};
    int month{1};   // 1..12
    int day{1};     // 1..31
    int hour{0};
    int minute{0};
    int second{0};
    int weekday{4}; // 0 = Sunday, filled by conversions
};

int days_in_month(int year, int month);
// 0 = Sunday.
int weekday_of(int year, int month, int day);

// An IANA zone. UTC is computed directly; other zones go through the C
// library with TZ switched under a process-wide lock.
class TimeZone {
public:
    static TimeZone utc();

    // Throws std::invalid_argument if the zone is unknown to the system
    // zoneinfo database.
    static TimeZone named(const std::string& name);

    const std::string& name() const { return name_; }
    bool is_utc() const { return utc_; }

    CivilTime to_local(int64_t epoch_ms) const;

    // Wall-clock time to epoch ms. Times in a DST gap move forward,
    // ambiguous times resolve to the first occurrence.
    int64_t from_local(const CivilTime& c) const;

private:
    TimeZone(std::string name, bool utc) : name_(std::move(name)), utc_(utc) {}

    std::string name_;
    bool utc_;
};

// "YYYY-MM-DDTHH:MM:SS" in the zone, no offset suffix.
std::string format_local(int64_t epoch_ms, const TimeZone& tz);

// "YYYY-MM-DDTHH:MM:SSZ" (UTC).
std::string format_utc(int64_t epoch_ms);

// Accepts epoch milliseconds ("1767225600000"), "YYYY-MM-DDTHH:MM[:SS]"
// in the given zone, or the same with a trailing "Z" for UTC.
std::optional<int64_t> parse_timestamp(const std::string& s, const TimeZone& tz);

} // namespace kestrel
