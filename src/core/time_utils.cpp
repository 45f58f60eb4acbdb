#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <cctype>

std::optional<int> parse_clock_time(const std::string& text) {
    std::string s = to_lower(text);
    trim(s);
    if (s.size() < 3) return std::nullopt;

    bool is_pm;
    std::string suffix = s.substr(s.size() - 2);
    if (suffix == "am") {
        is_pm = false;
    } else if (suffix == "pm") {
        is_pm = true;
    } else {
        return std::nullopt;
    }
    s.erase(s.size() - 2);
    trim(s);

    std::string hour_part = s;
    std::string minute_part = "00";
    auto colon = s.find(':');
    if (colon != std::string::npos) {
        hour_part = s.substr(0, colon);
        minute_part = s.substr(colon + 1);
    }
    if (hour_part.empty() || hour_part.size() > 2 || minute_part.size() != 2) return std::nullopt;
    for (char c : hour_part + minute_part) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }

    int hour = safe_stoi(hour_part, -1);
    int minute = safe_stoi(minute_part, -1);
    if (hour < 1 || hour > 12 || minute < 0 || minute > 59) return std::nullopt;

    if (is_pm && hour != 12) {
        hour += 12;
    } else if (!is_pm && hour == 12) {
        hour = 0;
    }
    return hour * 60 + minute;
}

std::optional<std::pair<int, int>> parse_time_range(const std::string& text) {
    auto dash = text.find('-');
    if (dash == std::string::npos) return std::nullopt;

    auto start = parse_clock_time(text.substr(0, dash));
    auto end = parse_clock_time(text.substr(dash + 1));
    if (!start || !end || *end <= *start) return std::nullopt;
    return std::make_pair(*start, *end);
}

std::string format_clock_time(int minutes) {
    int hour = minutes / 60;
    int minute = minutes % 60;
    const char* marker = hour >= 12 ? "pm" : "am";
    int display = hour % 12;
    if (display == 0) display = 12;
    return fmt::format("{}:{:02d}{}", display, minute, marker);
}

std::string format_age(long long seconds) {
    if (seconds < 0) seconds = 0;
    long long days = seconds / 86400;
    long long hours = (seconds % 86400) / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (days > 0) {
        return fmt::format("{}d{}h", days, hours);
    } else if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}
