#include "schedule.hpp"

#include <algorithm>
#include <cstdio>

namespace cronrepo {

static constexpr WallTime kMinute = 60;
static constexpr WallTime kHour = 3600;
static constexpr WallTime kDay = 86400;

WallTime make_wall_time(int year, int month, int day, int hour, int minute) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    return timegm(&tm);
}

WallTime parse_wall_time(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0;
    char tail = 0;
    int n = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d%c",
                        &year, &month, &day, &hour, &minute, &tail);
    if (n != 5) {
        n = std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &tail);
        if (n != 3) {
            throw EnumerationError("invalid time '" + text +
                                   "', expected YYYY-mm-ddTHH:MM");
        }
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        throw EnumerationError("time out of range: '" + text + "'");
    }

    WallTime t = make_wall_time(year, month, day, hour, minute);
    // Reject dates that timegm normalized, e.g. 2021-02-30
    std::tm check{};
    gmtime_r(&t, &check);
    if (check.tm_mday != day || check.tm_mon != month - 1) {
        throw EnumerationError("no such date: '" + text + "'");
    }
    return t;
}

std::string format_wall_time(WallTime t, const std::string& format) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[256];
    size_t n = std::strftime(buf, sizeof(buf), format.c_str(), &tm);
    return std::string(buf, n);
}

WallTime current_wall_minute() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    return make_wall_time(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                          tm.tm_hour, tm.tm_min);
}

bool day_matches(const Tag& tag, const std::tm& tm) {
    bool dom_free = tag.day.is_wildcard();
    bool dow_free = tag.dow.is_wildcard();
    if (dom_free && dow_free) return true;
    if (dom_free) return tag.dow.matches(tm.tm_wday);
    if (dow_free) return tag.day.matches(tm.tm_mday);
    return tag.day.matches(tm.tm_mday) || tag.dow.matches(tm.tm_wday);
}

bool tag_matches(const Tag& tag, WallTime t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tag.minute.matches(tm.tm_min) && tag.hour.matches(tm.tm_hour) &&
           tag.month.matches(tm.tm_mon + 1) && day_matches(tag, tm);
}

std::vector<WallTime> enumerate(const Tag& tag, WallTime start, WallTime end) {
    std::vector<WallTime> out;
    // Round a start inside a minute up to the next whole minute
    WallTime t = start;
    if (t % kMinute != 0) t += kMinute - t % kMinute;

    // Same result as testing every minute; whole days and hours that
    // cannot match are skipped.
    while (t <= end) {
        std::tm tm{};
        gmtime_r(&t, &tm);
        WallTime into_day = tm.tm_hour * kHour + tm.tm_min * kMinute + tm.tm_sec;
        if (!tag.month.matches(tm.tm_mon + 1) || !day_matches(tag, tm)) {
            t = t - into_day + kDay;
            continue;
        }
        if (!tag.hour.matches(tm.tm_hour)) {
            t = t - (tm.tm_min * kMinute + tm.tm_sec) + kHour;
            continue;
        }
        if (tag.minute.matches(tm.tm_min)) out.push_back(t);
        t += kMinute;
    }
    return out;
}

std::vector<Invocation> list_invocations(const std::vector<Tag>& tags,
                                         WallTime start, WallTime end) {
    std::vector<Invocation> out;
    for (size_t i = 0; i < tags.size(); ++i) {
        for (WallTime t : enumerate(tags[i], start, end)) {
            out.push_back(Invocation{t, i});
        }
    }
    std::sort(out.begin(), out.end(), [](const Invocation& a, const Invocation& b) {
        if (a.when != b.when) return a.when < b.when;
        return a.tag_index < b.tag_index;
    });
    return out;
}

} // namespace cronrepo
