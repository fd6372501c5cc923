#pragma once
#include "tagline.hpp"
#include <ctime>
#include <stdexcept>
#include <string>
#include <vector>

namespace cronrepo {

class EnumerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Wall-clock minutes are carried as zone-free epoch seconds (UTC
// arithmetic on the calendar fields), so no DST gaps or repeats occur.
using WallTime = std::time_t;

// Accepts `YYYY-mm-ddTHH:MM` or `YYYY-mm-dd` (midnight).
// Throws EnumerationError on any other form.
WallTime parse_wall_time(const std::string& text);

WallTime make_wall_time(int year, int month, int day, int hour = 0, int minute = 0);

std::string format_wall_time(WallTime t, const std::string& format);

// Current local time truncated to the minute
WallTime current_wall_minute();

// Day-of-month and day-of-week combine with OR when both are restricted
bool day_matches(const Tag& tag, const std::tm& tm);

bool tag_matches(const Tag& tag, WallTime t);

// Minutes in [start, end] at which `tag` fires, ascending.
std::vector<WallTime> enumerate(const Tag& tag, WallTime start, WallTime end);

struct Invocation {
    WallTime when;
    size_t tag_index;  // position in the tag list given to list_invocations
};

// Invocations of all tags merged by (time, tag position).
std::vector<Invocation> list_invocations(const std::vector<Tag>& tags,
                                         WallTime start, WallTime end);

} // namespace cronrepo
