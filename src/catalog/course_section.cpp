#include "course_section.hpp"
#include <core/time_utils.hpp>
#include <fmt/format.h>
#include <cctype>

std::string CourseSection::identity() const {
    return fmt::format("{}-{}@{}", code, section, term_id);
}

std::vector<Meeting> CourseSection::meetings() const {
    std::vector<Meeting> out;
    auto day_set = parse_days(days);
    auto range = parse_time_range(time);
    if (day_set.empty() || !range) return out;

    for (Weekday d : day_set) {
        out.push_back({d, range->first, range->second});
    }
    return out;
}

std::set<Weekday> parse_days(const std::string& pattern) {
    static const std::pair<const char*, Weekday> TOKENS[] = {
        {"Tu", Weekday::Tuesday},
        {"Th", Weekday::Thursday},
        {"Sa", Weekday::Saturday},
        {"Su", Weekday::Sunday},
        {"M",  Weekday::Monday},
        {"W",  Weekday::Wednesday},
        {"F",  Weekday::Friday},
    };

    std::set<Weekday> days;
    size_t i = 0;
    while (i < pattern.size()) {
        if (std::isspace(static_cast<unsigned char>(pattern[i]))) { ++i; continue; }

        bool matched = false;
        for (const auto& [token, day] : TOKENS) {
            std::string t(token);
            if (pattern.compare(i, t.size(), t) == 0) {
                days.insert(day);
                i += t.size();
                matched = true;
                break;
            }
        }
        if (!matched) return {};
    }
    return days;
}

const char* weekday_token(Weekday day) {
    switch (day) {
        case Weekday::Monday:    return "M";
        case Weekday::Tuesday:   return "Tu";
        case Weekday::Wednesday: return "W";
        case Weekday::Thursday:  return "Th";
        case Weekday::Friday:    return "F";
        case Weekday::Saturday:  return "Sa";
        case Weekday::Sunday:    return "Su";
    }
    return "?";
}

bool meetings_conflict(const std::vector<Meeting>& a, const std::vector<Meeting>& b) {
    for (const auto& ma : a) {
        for (const auto& mb : b) {
            if (ma.day == mb.day && ma.start < mb.end && mb.start < ma.end) {
                return true;
            }
        }
    }
    return false;
}

bool sections_conflict(const CourseSection& a, const CourseSection& b) {
    return meetings_conflict(a.meetings(), b.meetings());
}

std::string course_department(const std::string& code) {
    std::string dept;
    for (char c : code) {
        if (!std::isalpha(static_cast<unsigned char>(c))) break;
        dept += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return dept;
}

int course_level(const std::string& code) {
    for (char c : code) {
        if (std::isdigit(static_cast<unsigned char>(c))) return c - '0';
    }
    return 0;
}
