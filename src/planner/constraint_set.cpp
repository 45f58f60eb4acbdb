#include "constraint_set.hpp"
#include "phrase_table.hpp"
#include <algorithm>
#include <fmt/format.h>

const char* ranking_preference_name(RankingPreference p) {
    switch (p) {
        case RankingPreference::Balanced:       return "balanced";
        case RankingPreference::MinimizeGaps:   return "minimize_gaps";
        case RankingPreference::MaximizeRating: return "maximize_rating";
        case RankingPreference::MaximizeGpa:    return "maximize_gpa";
    }
    return "balanced";
}

std::string CreditTarget::describe() const {
    if (min && max) {
        return *min == *max ? fmt::format("{}", *min) : fmt::format("{}-{}", *min, *max);
    }
    if (min) return fmt::format(">= {}", *min);
    if (max) return fmt::format("<= {}", *max);
    return "any";
}

bool ConstraintSet::admits_meetings(const CourseSection& s) const {
    for (const auto& m : s.meetings()) {
        if (excluded_days.count(m.day)) return false;
        if (!allowed_days.empty() && !allowed_days.count(m.day)) return false;
        if (earliest_start && m.start < *earliest_start) return false;
        if (latest_end && m.end > *latest_end) return false;
    }
    return true;
}

bool ConstraintSet::admits_level(const CourseSection& s) const {
    int level = course_level(s.code);
    if (level_min && level < *level_min) return false;
    if (level_max && level > *level_max) return false;
    return true;
}

bool ConstraintSet::mentions_topic(const CourseSection& s) const {
    if (keywords.empty()) return true;

    auto text = tokenize_words(s.title + " " + s.description);
    for (const auto& term : keywords) {
        auto needle = tokenize_words(term);
        if (needle.empty()) continue;
        if (std::search(text.begin(), text.end(), needle.begin(), needle.end()) != text.end()) {
            return true;
        }
    }
    return false;
}

template <typename C>
static void push_unique(C& list, const std::string& value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) list.push_back(value);
}

void ConstraintSet::add_course(const std::string& code) { push_unique(courses, code); }
void ConstraintSet::add_department(const std::string& dept) { push_unique(departments, dept); }
void ConstraintSet::add_gen_ed(const std::string& code) { push_unique(gen_eds, code); }
void ConstraintSet::add_keyword(const std::string& term) { push_unique(keywords, term); }

void ConstraintSet::tighten_earliest(int minute) {
    earliest_start = earliest_start ? std::max(*earliest_start, minute) : minute;
}

void ConstraintSet::tighten_latest(int minute) {
    latest_end = latest_end ? std::min(*latest_end, minute) : minute;
}
