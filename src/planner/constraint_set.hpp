#pragma once

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <catalog/course_section.hpp>

enum class RankingPreference { Balanced, MinimizeGaps, MaximizeRating, MaximizeGpa };

const char* ranking_preference_name(RankingPreference p);

// Credit bound; an unset side is open.
struct CreditTarget {
    std::optional<int> min;
    std::optional<int> max;

    bool empty() const { return !min && !max; }
    bool accepts(int credits) const {
        if (min && credits < *min) return false;
        if (max && credits > *max) return false;
        return true;
    }
    std::string describe() const;
};

// Parsed intent of one request. Built fresh per request.
struct ConstraintSet {
    std::vector<std::string> courses;        // specific codes, e.g. "CMSC330"
    std::vector<std::string> departments;    // e.g. "CMSC"
    std::vector<std::string> gen_eds;        // e.g. "FSOC"
    std::set<std::string> excluded_courses;  // already taken

    std::set<Weekday> excluded_days;
    std::set<Weekday> allowed_days;          // empty means any day
    std::optional<int> earliest_start;       // minutes since midnight
    std::optional<int> latest_end;

    CreditTarget credits;
    std::optional<int> level_min;
    std::optional<int> level_max;
    bool open_seats_only = false;
    RankingPreference preference = RankingPreference::Balanced;

    // Topic terms ("machine learning", "security") searched for as whole
    // words in a section's title and description.
    std::vector<std::string> keywords;

    // Phrases that produced the constraints above, in detection order.
    std::vector<std::string> matched;

    bool has_requirements() const {
        return !courses.empty() || !departments.empty() || !gen_eds.empty();
    }

    // Day and time-of-day filter. Sections without a fixed meeting pass.
    bool admits_meetings(const CourseSection& s) const;

    bool admits_level(const CourseSection& s) const;

    // True when no keywords are set or one of them appears in the section.
    bool mentions_topic(const CourseSection& s) const;

    void add_course(const std::string& code);
    void add_department(const std::string& dept);
    void add_gen_ed(const std::string& code);
    void add_keyword(const std::string& term);
    void tighten_earliest(int minute);
    void tighten_latest(int minute);
};
