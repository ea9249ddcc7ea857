#include "kestrel/cron.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace kestrel {

namespace {

struct FieldSpec {
    const char* name;
    int lo;
    int hi;
    const char* const* names;  // optional symbolic names, indexed from `lo`
};

const char* const kMonthNames[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                   "jul", "aug", "sep", "oct", "nov", "dec", nullptr};
const char* const kDayNames[] = {"sun", "mon", "tue", "wed", "thu", "fri", "sat", nullptr};

int parse_value(const std::string& tok, const FieldSpec& f) {
    if (tok.empty()) throw std::invalid_argument(std::string("cron ") + f.name + ": empty value");
    if (f.names && std::isalpha((unsigned char)tok[0])) {
        std::string low = tok;
        for (auto& c : low) c = (char)std::tolower((unsigned char)c);
        for (int i = 0; f.names[i]; i++) {
            if (low == f.names[i]) return f.lo + i;
        }
        throw std::invalid_argument(std::string("cron ") + f.name + ": unknown name \"" + tok + "\"");
    }
    for (char c : tok) {
        if (!std::isdigit((unsigned char)c)) {
            throw std::invalid_argument(std::string("cron ") + f.name + ": bad value \"" + tok + "\"");
        }
    }
    if (tok.size() > 3) throw std::invalid_argument(std::string("cron ") + f.name + ": value out of range");
    return std::stoi(tok);
}

// Returns a bitmask of allowed values and whether the field was "*".
uint64_t parse_field(const std::string& field, const FieldSpec& f, int hi_accept, bool* star) {
    uint64_t mask = 0;
    *star = (field == "*" || field == "?");
    std::stringstream ss(field);
    std::string part;
    bool any = false;
    while (std::getline(ss, part, ',')) {
        any = true;
        int step = 1;
        auto slash = part.find('/');
        std::string range = part;
        if (slash != std::string::npos) {
            range = part.substr(0, slash);
            std::string st = part.substr(slash + 1);
            if (st.empty() || st.size() > 3 || !std::all_of(st.begin(), st.end(), ::isdigit)) {
                throw std::invalid_argument(std::string("cron ") + f.name + ": bad step \"" + part + "\"");
            }
            step = std::stoi(st);
            if (step <= 0) throw std::invalid_argument(std::string("cron ") + f.name + ": step must be positive");
        }
        int a, b;
        if (range == "*" || range == "?") {
            a = f.lo;
            b = f.hi;
        } else {
            auto dash = range.find('-');
            if (dash != std::string::npos) {
                a = parse_value(range.substr(0, dash), f);
                b = parse_value(range.substr(dash + 1), f);
            } else {
                a = parse_value(range, f);
                // "a/n" runs from a to the end of the range
                b = (slash != std::string::npos) ? f.hi : a;
            }
        }
        if (a < f.lo || a > hi_accept || b < f.lo || b > hi_accept || a > b) {
            throw std::invalid_argument(std::string("cron ") + f.name + ": value out of range in \"" + part + "\"");
        }
        for (int v = a; v <= b; v += step) mask |= (1ULL << v);
    }
    if (!any) throw std::invalid_argument(std::string("cron ") + f.name + ": empty field");
    return mask;
}

std::string expand_macro(const std::string& expr) {
    if (expr == "@hourly") return "0 * * * *";
    if (expr == "@daily" || expr == "@midnight") return "0 0 * * *";
    if (expr == "@weekly") return "0 0 * * 0";
    if (expr == "@monthly") return "0 0 1 * *";
    if (expr == "@yearly" || expr == "@annually") return "0 0 1 1 *";
    if (!expr.empty() && expr[0] == '@') throw std::invalid_argument("cron: unknown macro \"" + expr + "\"");
    return expr;
}

bool bit(uint64_t mask, int v) { return (mask >> v) & 1ULL; }

} // namespace

CronExpr CronExpr::parse(const std::string& expr) {
    std::string trimmed = expr;
    trimmed.erase(0, trimmed.find_first_not_of(" \t"));
    trimmed.erase(trimmed.find_last_not_of(" \t") + 1);
    std::string body = expand_macro(trimmed);

    std::vector<std::string> fields;
    std::istringstream in(body);
    std::string tok;
    while (in >> tok) fields.push_back(tok);
    if (fields.size() != 5) {
        throw std::invalid_argument("cron: expected 5 fields, got " + std::to_string(fields.size()) + " in \"" + expr + "\"");
    }

    static const FieldSpec kMinute{"minute", 0, 59, nullptr};
    static const FieldSpec kHour{"hour", 0, 23, nullptr};
    static const FieldSpec kMday{"day-of-month", 1, 31, nullptr};
    static const FieldSpec kMonth{"month", 1, 12, kMonthNames};
    static const FieldSpec kWday{"day-of-week", 0, 6, kDayNames};

    CronExpr c;
    c.source_ = trimmed;
    bool star = false;
    c.minutes_ = parse_field(fields[0], kMinute, 59, &star);
    c.hours_ = (uint32_t)parse_field(fields[1], kHour, 23, &star);
    c.mdays_ = (uint32_t)parse_field(fields[2], kMday, 31, &c.mday_star_);
    c.months_ = (uint16_t)parse_field(fields[3], kMonth, 12, &star);
    // 7 is accepted as Sunday
    uint64_t wd = parse_field(fields[4], kWday, 7, &c.wday_star_);
    if (wd & (1ULL << 7)) wd = (wd & ~(1ULL << 7)) | 1ULL;
    c.wdays_ = (uint8_t)wd;
    return c;
}

bool CronExpr::matches(const CivilTime& t) const {
    if (!bit(minutes_, t.minute) || !bit(hours_, t.hour) || !bit(months_, t.month)) return false;
    int wd = weekday_of(t.year, t.month, t.day);
    bool md = bit(mdays_, t.day);
    bool wdm = bit(wdays_, wd);
    if (mday_star_ && wday_star_) return true;
    if (mday_star_) return wdm;
    if (wday_star_) return md;
    return md || wdm;
}

std::optional<int64_t> CronExpr::next_after(int64_t after_ms, const TimeZone& tz) const {
    // Walk civil time in the zone, skipping whole months/days/hours that
    // cannot match.
    CivilTime c = tz.to_local(after_ms);
    c.second = 0;
    c.minute += 1;
    if (c.minute == 60) { c.minute = 0; c.hour += 1; }
    if (c.hour == 24) {
        c.hour = 0;
        c.day += 1;
        if (c.day > days_in_month(c.year, c.month)) {
            c.day = 1;
            if (++c.month == 13) { c.month = 1; c.year++; }
        }
    }

    const int limit_year = c.year + 5;
    auto next_month = [&]() {
        c.day = 1; c.hour = 0; c.minute = 0;
        if (++c.month == 13) { c.month = 1; c.year++; }
    };
    auto next_day = [&]() {
        c.hour = 0; c.minute = 0;
        if (++c.day > days_in_month(c.year, c.month)) {
            c.day = 1;
            if (++c.month == 13) { c.month = 1; c.year++; }
        }
    };
    auto next_hour = [&]() {
        c.minute = 0;
        if (++c.hour == 24) {
            c.hour = 23;
            next_day();
        }
    };

    while (c.year <= limit_year) {
        if (!bit(months_, c.month)) { next_month(); continue; }

        int wd = weekday_of(c.year, c.month, c.day);
        bool md = bit(mdays_, c.day);
        bool wdm = bit(wdays_, wd);
        bool day_ok;
        if (mday_star_ && wday_star_) day_ok = true;
        else if (mday_star_) day_ok = wdm;
        else if (wday_star_) day_ok = md;
        else day_ok = md || wdm;
        if (!day_ok) { next_day(); continue; }

        if (!bit(hours_, c.hour)) { next_hour(); continue; }
        if (!bit(minutes_, c.minute)) {
            if (++c.minute == 60) next_hour();
            continue;
        }

        int64_t at = tz.from_local(c);
        // DST overlaps can map a later wall time to an earlier instant.
        if (at > after_ms) {
            CivilTime back = tz.to_local(at);
            // A wall time inside a DST gap is normalised forward; only
            // accept it if the normalised time still matches.
            if (back.hour == c.hour && back.minute == c.minute) return at;
            if (matches(back)) return at;
        }
        if (++c.minute == 60) next_hour();
    }
    return std::nullopt;
}

} // namespace kestrel
