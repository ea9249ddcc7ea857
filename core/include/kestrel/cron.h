#pragma once

#include "timezone.h"

#include <cstdint>
#include <optional>
#include <string>

namespace kestrel {

// Five-field cron expression: minute hour day-of-month month day-of-week.
//
// Each field accepts "*", numbers, ranges "a-b", steps "*/n" and "a-b/n",
// and comma lists. Month and weekday names (jan, mon, ...) are accepted,
// weekday 7 is Sunday. The @hourly/@daily/@weekly/@monthly/@yearly
// shorthands expand to their five-field forms.
//
// When both day-of-month and day-of-week are restricted a day matches if
// either does (classic cron behaviour).
class CronExpr {
public:
    // Throws std::invalid_argument on a malformed expression.
    static CronExpr parse(const std::string& expr);

    // First matching minute strictly after `after_ms`, evaluated in tz.
    // nullopt if nothing matches within five years (e.g. "0 0 31 2 *").
    std::optional<int64_t> next_after(int64_t after_ms, const TimeZone& tz) const;

    bool matches(const CivilTime& c) const;

    const std::string& source() const { return source_; }

private:
    CronExpr() = default;

    uint64_t minutes_{0};   // bits 0..59
    uint32_t hours_{0};     // bits 0..23
    uint32_t mdays_{0};     // bits 1..31
    uint16_t months_{0};    // bits 1..12
    uint8_t wdays_{0};      // bits 0..6
    bool mday_star_{true};
    bool wday_star_{true};
    std::string source_;
};

} // namespace kestrel
