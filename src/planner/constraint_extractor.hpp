#pragma once

#include <string>
#include <set>
#include <vector>
#include "constraint_set.hpp"
#include "phrase_table.hpp"

// One day or time-of-day rule carried by a phrase such as "no fridays"
// or "mornings".
struct TimeRule {
    enum class Kind { ExcludeDay, OnlyDays, EarliestStart, LatestEnd };

    Kind kind = Kind::ExcludeDay;
    std::set<Weekday> days;
    int minute = 0;
};

// Deterministic free text -> ConstraintSet mapping.
//
// Pattern passes run first and mask what they consume: already-taken
// courses, course levels, credit targets, clock-time bounds, open-seat
// requests and explicit course codes. The remaining words are scanned
// against five phrase tables (gen-ed, department, day/time, ranking
// preference, topic); at each word the longest phrase from any table wins.
// Extraction never fails: text with no matches yields an empty set.
class ConstraintExtractor {
public:
    ConstraintExtractor();
    ConstraintExtractor(PhraseTable<std::string> departments,
                        PhraseTable<std::string> gen_eds,
                        PhraseTable<TimeRule> times,
                        PhraseTable<RankingPreference> preferences,
                        PhraseTable<std::vector<std::string>> topics = {});

    ConstraintSet extract(const std::string& free_text) const;

    static PhraseTable<std::string> default_department_table();
    static PhraseTable<std::string> default_gen_ed_table();
    static PhraseTable<TimeRule> default_time_table();
    static PhraseTable<RankingPreference> default_preference_table();
    // Topic phrase -> title/description terms it stands for.
    static PhraseTable<std::vector<std::string>> default_topic_table();

    const PhraseTable<std::string>& departments() const { return departments_; }
    const PhraseTable<std::string>& gen_eds() const { return gen_eds_; }

private:
    void extract_patterns(std::string& work, ConstraintSet& out) const;
    void scan_phrases(const std::string& work, ConstraintSet& out) const;
    bool is_department(const std::string& lower_code) const;

    PhraseTable<std::string> departments_;
    PhraseTable<std::string> gen_eds_;
    PhraseTable<TimeRule> times_;
    PhraseTable<RankingPreference> preferences_;
    PhraseTable<std::vector<std::string>> topics_;
};
