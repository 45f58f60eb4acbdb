#pragma once

#include <string>
#include <optional>
#include <utility>

// Parse a 12-hour clock time ("9:30am", "9:30 AM", "10am") to minutes since
// midnight. 12am is 0, 12pm is 720. Returns nullopt without an am/pm marker.
std::optional<int> parse_clock_time(const std::string& text);

// Parse "10:00am-10:50am" into (start, end) minutes. The end must be after
// the start. "TBA", empty strings and anything malformed yield nullopt.
std::optional<std::pair<int, int>> parse_time_range(const std::string& text);

// Format minutes since midnight as "9:30am" / "12:00pm".
std::string format_clock_time(int minutes);

// Format the age between two points in seconds as "2h35m", "14m22s", "8s".
std::string format_age(long long seconds);
