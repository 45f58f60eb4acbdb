#include "constraint_extractor.hpp"
#include <catalog/partition.hpp>
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <regex>
#include <vector>

namespace {

// ── Pattern passes ──────────────────────────────────────────

const std::regex& excluded_re() {
    static const std::regex re(
        R"(\b(?:took|taken|completed|finished|passed|done with)\s+)"
        R"(((?:[a-z]{4}\s?\d{3}[a-z]?)(?:\s*(?:,|and|&|or)\s*[a-z]{4}\s?\d{3}[a-z]?)*))");
    return re;
}

const std::regex& course_code_re() {
    static const std::regex re(R"(\b([a-z]{4})(\s?)(\d{3}[a-z]?)\b)");
    return re;
}

const std::regex& numbered_level_re() {
    static const std::regex re(R"(\b([1-8])00\s*-?\s*level\b)");
    return re;
}

const std::regex& named_level_re() {
    static const std::regex re(R"(\b(upper|lower)\s*-?\s*(?:level|division)\b)");
    return re;
}

const std::regex& credits_between_re() {
    static const std::regex re(
        R"(\bbetween\s+(\d{1,2})\s+and\s+(\d{1,2})\s*(?:credits?|credit hours?|cr)\b)");
    return re;
}

const std::regex& credits_re() {
    static const std::regex re(
        R"((?:\b(at least|minimum of|min|no less than)\s+|\b(up to|at most|no more than|max|maximum of|under)\s+)?)"
        R"(\b(\d{1,2})(?:\s*(?:-|to)\s*(\d{1,2}))?\s*(?:credits?|credit hours?|cr)\b)");
    return re;
}

const std::regex& clock_bound_re() {
    static const std::regex re(
        R"(\b(no\s+class(?:es)?\s+(?:before|after)|nothing\s+(?:before|after)|not\s+(?:before|after)|)"
        R"(start(?:ing)?\s+after|end(?:ing)?\s+by|done\s+by|finish(?:ed)?\s+by|out\s+by|)"
        R"(before|after|until)\s+(\d{1,2})(?::(\d{2}))?(?:\s*(am|pm))?\b)"
        R"((?:\s+in\s+the\s+(morning|afternoon|evening)\b)?)");
    return re;
}

const std::regex& open_seats_re() {
    static const std::regex re(
        R"(\b(?:open\s+seats?|not\s+full|available\s+seats?|seats\s+available|with\s+seats|has\s+seats)\b)");
    return re;
}

// Run `re` over `work`, hand each match to `fn`, then blank every span the
// callback accepted so later passes do not see it again.
template <typename Fn>
void consume(std::string& work, const std::regex& re, Fn fn) {
    std::vector<std::pair<size_t, size_t>> spans;
    for (auto it = std::sregex_iterator(work.begin(), work.end(), re);
         it != std::sregex_iterator(); ++it) {
        const std::smatch& m = *it;
        if (fn(m)) spans.emplace_back(static_cast<size_t>(m.position(0)),
                                      static_cast<size_t>(m.length(0)));
    }
    for (const auto& [pos, len] : spans) {
        work.replace(pos, len, len, ' ');
    }
}

// Hour/minute/marker groups to minutes since midnight. Without a marker,
// 7-11 read as morning and 12-6 as afternoon; 13-23 are 24-hour times.
std::optional<int> clock_minutes(const std::string& hour_text, const std::string& minute_text,
                                 const std::string& marker) {
    int hour = safe_stoi(hour_text, -1);
    int minute = minute_text.empty() ? 0 : safe_stoi(minute_text, -1);
    if (hour < 0 || minute < 0 || minute > 59) return std::nullopt;

    if (!marker.empty()) {
        return parse_clock_time(fmt::format("{}:{:02d}{}", hour, minute, marker));
    }
    if (hour >= 13 && hour <= 23) return hour * 60 + minute;
    if (hour >= 7 && hour <= 11) return hour * 60 + minute;
    if (hour == 12) return NOON_MINUTES + minute;
    if (hour >= 1 && hour <= 6) return (hour + 12) * 60 + minute;
    return std::nullopt;
}

std::string normalize_code(const std::string& dept, const std::string& number) {
    return to_upper(dept) + to_upper(number);
}

std::string describe_days(const std::set<Weekday>& days) {
    std::string out;
    for (Weekday d : days) out += weekday_token(d);
    return out;
}

struct DayNames {
    Weekday day;
    std::vector<std::string> names;
};

const std::vector<DayNames>& day_names() {
    static const std::vector<DayNames> names = {
        {Weekday::Monday,    {"monday", "mondays", "mon"}},
        {Weekday::Tuesday,   {"tuesday", "tuesdays", "tues", "tue"}},
        {Weekday::Wednesday, {"wednesday", "wednesdays", "wed"}},
        {Weekday::Thursday,  {"thursday", "thursdays", "thurs", "thu"}},
        {Weekday::Friday,    {"friday", "fridays", "fri"}},
        {Weekday::Saturday,  {"saturday", "saturdays", "sat"}},
        {Weekday::Sunday,    {"sunday", "sundays", "sun"}},
    };
    return names;
}

TimeRule exclude_day(Weekday d) {
    TimeRule r;
    r.kind = TimeRule::Kind::ExcludeDay;
    r.days = {d};
    return r;
}

TimeRule only_days(std::set<Weekday> days) {
    TimeRule r;
    r.kind = TimeRule::Kind::OnlyDays;
    r.days = std::move(days);
    return r;
}

TimeRule earliest(int minute) {
    TimeRule r;
    r.kind = TimeRule::Kind::EarliestStart;
    r.minute = minute;
    return r;
}

TimeRule latest(int minute) {
    TimeRule r;
    r.kind = TimeRule::Kind::LatestEnd;
    r.minute = minute;
    return r;
}

}  // namespace

// ── Tables ──────────────────────────────────────────────────

PhraseTable<std::string> ConstraintExtractor::default_department_table() {
    // COMM is deliberately absent: "comm" reads as the oral communication gen-ed.
    static const char* const CODES[] = {
        "AASP", "AAST", "AMSC", "ANSC", "ANTH", "ARCH", "AREC", "ARHU", "ARTH", "ARTT",
        "ASTR", "BCHM", "BIOE", "BMGT", "BSCI", "BSST", "CCJS", "CHBE", "CHEM", "CHIN",
        "CLAS", "CMLT", "CMSC", "CPSP", "ECON", "EDCP", "ENAE", "ENCE", "ENEE", "ENES",
        "ENGL", "ENMA", "ENME", "ENST", "ENTM", "FIRE", "FMSC", "FREN", "GEOG", "GEOL",
        "GERM", "GVPT", "HACS", "HESP", "HIST", "HLTH", "INAG", "INST", "ITAL", "JAPN",
        "JOUR", "KNES", "LARC", "LING", "MATH", "MIEH", "MUSC", "NFSC", "PHIL", "PHYS",
        "PLSC", "PSYC", "RELS", "RUSS", "SOCY", "SPAN", "STAT", "TDPS", "THET", "URSP",
        "WMST",
    };

    PhraseTable<std::string> table;
    for (const char* code : CODES) {
        table.add(code, code);
    }
    return table;
}

PhraseTable<std::string> ConstraintExtractor::default_gen_ed_table() {
    PhraseTable<std::string> table = {
        {"academic writing", "FSAW"},
        {"analytic reasoning", "FSAR"},
        {"analytical reasoning", "FSAR"},
        {"fundamental math", "FSMA"},
        {"math requirement", "FSMA"},
        {"math gen ed", "FSMA"},
        {"oral communication", "FSOC"},
        {"oral communications", "FSOC"},
        {"oral comm", "FSOC"},
        {"public speaking", "FSOC"},
        {"comm", "FSOC"},
        {"professional writing", "FSPW"},
        {"history and social sciences", "DSHS"},
        {"history and social science", "DSHS"},
        {"social science", "DSHS"},
        {"social sciences", "DSHS"},
        {"humanities", "DSHU"},
        {"humanities requirement", "DSHU"},
        {"natural science", "DSNS"},
        {"natural sciences", "DSNS"},
        {"natural science lab", "DSNL"},
        {"science lab", "DSNL"},
        {"lab science", "DSNL"},
        {"scholarship in practice", "DSSP"},
        {"cultural competency", "DVCC"},
        {"cultural competence", "DVCC"},
        {"diversity", "DVUP"},
        {"plural societies", "DVUP"},
        {"understanding plural societies", "DVUP"},
        {"big question", "SCIS"},
        {"big questions", "SCIS"},
        {"signature course", "SCIS"},
        {"i series", "SCIS"},
    };
    for (const auto& [code, name] : gen_ed_codes()) {
        table.add(code, code);
    }
    return table;
}

PhraseTable<TimeRule> ConstraintExtractor::default_time_table() {
    PhraseTable<TimeRule> table;

    for (const auto& dn : day_names()) {
        for (const auto& name : dn.names) {
            for (const char* prefix : {"no", "avoid", "no classes on", "no class on",
                                       "nothing on", "not on", "skip"}) {
                table.add(fmt::format("{} {}", prefix, name), exclude_day(dn.day));
            }
            table.add(name + " off", exclude_day(dn.day));
            table.add(name + " free", exclude_day(dn.day));
        }
    }

    const std::set<Weekday> mwf = {Weekday::Monday, Weekday::Wednesday, Weekday::Friday};
    const std::set<Weekday> mw = {Weekday::Monday, Weekday::Wednesday};
    const std::set<Weekday> tuth = {Weekday::Tuesday, Weekday::Thursday};
    for (const auto& [name, days] : std::vector<std::pair<std::string, std::set<Weekday>>>{
             {"mwf", mwf}, {"mw", mw}, {"tuth", tuth}, {"tth", tuth}, {"tr", tuth},
             {"tuesdays and thursdays", tuth}, {"tuesday and thursday", tuth},
             {"mondays and wednesdays", mw},
             {"mondays wednesdays and fridays", mwf}}) {
        table.add(name + " only", only_days(days));
        table.add("only " + name, only_days(days));
    }

    table.add("morning", latest(NOON_MINUTES));
    table.add("mornings", latest(NOON_MINUTES));
    table.add("morning classes", latest(NOON_MINUTES));
    table.add("afternoon", earliest(NOON_MINUTES));
    table.add("afternoons", earliest(NOON_MINUTES));
    table.add("afternoon classes", earliest(NOON_MINUTES));
    table.add("evening", earliest(17 * 60));
    table.add("evenings", earliest(17 * 60));
    table.add("evening classes", earliest(17 * 60));
    table.add("no early classes", earliest(10 * 60));
    table.add("nothing early", earliest(10 * 60));
    table.add("sleep in", earliest(10 * 60));
    table.add("no mornings", earliest(NOON_MINUTES));
    table.add("no morning classes", earliest(NOON_MINUTES));
    table.add("no evening classes", latest(18 * 60));
    table.add("no evenings", latest(18 * 60));
    table.add("no night classes", latest(18 * 60));
    table.add("no nights", latest(18 * 60));
    return table;
}

PhraseTable<RankingPreference> ConstraintExtractor::default_preference_table() {
    return {
        {"minimize gaps", RankingPreference::MinimizeGaps},
        {"minimal gaps", RankingPreference::MinimizeGaps},
        {"no gaps", RankingPreference::MinimizeGaps},
        {"few gaps", RankingPreference::MinimizeGaps},
        {"fewer gaps", RankingPreference::MinimizeGaps},
        {"compact", RankingPreference::MinimizeGaps},
        {"back to back", RankingPreference::MinimizeGaps},
        {"tight schedule", RankingPreference::MinimizeGaps},
        {"best professors", RankingPreference::MaximizeRating},
        {"best profs", RankingPreference::MaximizeRating},
        {"best instructors", RankingPreference::MaximizeRating},
        {"good professors", RankingPreference::MaximizeRating},
        {"good profs", RankingPreference::MaximizeRating},
        {"great professors", RankingPreference::MaximizeRating},
        {"highly rated", RankingPreference::MaximizeRating},
        {"top rated", RankingPreference::MaximizeRating},
        {"easy", RankingPreference::MaximizeGpa},
        {"easy a", RankingPreference::MaximizeGpa},
        {"easy classes", RankingPreference::MaximizeGpa},
        {"easiest", RankingPreference::MaximizeGpa},
        {"high gpa", RankingPreference::MaximizeGpa},
        {"gpa boosters", RankingPreference::MaximizeGpa},
    };
}

PhraseTable<std::vector<std::string>> ConstraintExtractor::default_topic_table() {
    using Terms = std::vector<std::string>;
    PhraseTable<Terms> table;

    auto topic = [&table](std::initializer_list<const char*> phrases, Terms terms) {
        for (const char* phrase : phrases) table.add(phrase, terms);
    };

    topic({"ai", "artificial intelligence"}, {"ai", "artificial intelligence"});
    topic({"machine learning", "ml", "deep learning"}, {"machine learning", "deep learning"});
    topic({"algorithms", "algorithm"}, {"algorithm", "algorithms"});
    topic({"security", "cybersecurity", "cyber security"}, {"security", "cybersecurity"});
    topic({"databases", "database"}, {"database", "databases"});
    topic({"networks", "networking", "computer networks"}, {"network", "networks", "networking"});
    topic({"data science", "data analysis"}, {"data science", "data analysis", "data"});
    topic({"graphics", "computer graphics"}, {"graphics"});
    topic({"robotics", "robots"}, {"robotics", "robot", "robots"});
    topic({"statistics"}, {"statistics", "statistical"});
    topic({"programming", "coding"}, {"programming"});
    topic({"web development", "web"}, {"web"});
    topic({"games", "game design", "video games"}, {"game", "games"});
    topic({"film", "films", "movies", "cinema"}, {"film", "films", "cinema"});
    topic({"music"}, {"music", "musical"});
    topic({"ethics"}, {"ethics", "ethical"});
    topic({"climate", "climate change"}, {"climate"});
    topic({"sustainability"}, {"sustainability", "sustainable"});
    topic({"politics"}, {"politics", "political"});
    topic({"philosophy"}, {"philosophy"});
    topic({"religion"}, {"religion", "religious"});
    topic({"creative writing"}, {"creative writing", "fiction", "poetry"});
    return table;
}

// ── Extraction ──────────────────────────────────────────────

ConstraintExtractor::ConstraintExtractor()
    : ConstraintExtractor(default_department_table(), default_gen_ed_table(),
                          default_time_table(), default_preference_table(),
                          default_topic_table()) {}

ConstraintExtractor::ConstraintExtractor(PhraseTable<std::string> departments,
                                         PhraseTable<std::string> gen_eds,
                                         PhraseTable<TimeRule> times,
                                         PhraseTable<RankingPreference> preferences,
                                         PhraseTable<std::vector<std::string>> topics)
    : departments_(std::move(departments)),
      gen_eds_(std::move(gen_eds)),
      times_(std::move(times)),
      preferences_(std::move(preferences)),
      topics_(std::move(topics)) {}

ConstraintSet ConstraintExtractor::extract(const std::string& free_text) const {
    ConstraintSet out;
    std::string work = to_lower(free_text);
    extract_patterns(work, out);
    scan_phrases(work, out);

    // A course the user already took is never a requirement
    out.courses.erase(std::remove_if(out.courses.begin(), out.courses.end(),
                                     [&](const std::string& c) {
                                         return out.excluded_courses.count(c) > 0;
                                     }),
                      out.courses.end());
    return out;
}

bool ConstraintExtractor::is_department(const std::string& lower_code) const {
    return departments_.longest_match({lower_code}, 0).has_value();
}

void ConstraintExtractor::extract_patterns(std::string& work, ConstraintSet& out) const {
    consume(work, excluded_re(), [&](const std::smatch& m) {
        std::string list = m[1].str();
        for (auto it = std::sregex_iterator(list.begin(), list.end(), course_code_re());
             it != std::sregex_iterator(); ++it) {
            std::string code = normalize_code((*it)[1].str(), (*it)[3].str());
            out.excluded_courses.insert(code);
            out.matched.push_back(fmt::format("took {} -> exclude {}", code, code));
        }
        return true;
    });

    consume(work, numbered_level_re(), [&](const std::smatch& m) {
        int level = safe_stoi(m[1].str());
        out.level_min = level;
        out.level_max = level;
        out.matched.push_back(fmt::format("{} -> level {}", m[0].str(), level));
        return true;
    });

    consume(work, named_level_re(), [&](const std::smatch& m) {
        if (m[1].str() == "upper") {
            out.level_min = 3;
            out.level_max = 4;
        } else {
            out.level_min = 1;
            out.level_max = 2;
        }
        out.matched.push_back(fmt::format("{} -> levels {}-{}", m[0].str(),
                                          *out.level_min, *out.level_max));
        return true;
    });

    consume(work, credits_between_re(), [&](const std::smatch& m) {
        int a = safe_stoi(m[1].str());
        int b = safe_stoi(m[2].str());
        out.credits.min = std::min(a, b);
        out.credits.max = std::max(a, b);
        out.matched.push_back(fmt::format("{} -> credits {}", m[0].str(), out.credits.describe()));
        return true;
    });

    consume(work, credits_re(), [&](const std::smatch& m) {
        int n = safe_stoi(m[3].str());
        if (n <= 0) return false;

        if (m[4].matched) {
            int hi = safe_stoi(m[4].str());
            out.credits.min = std::min(n, hi);
            out.credits.max = std::max(n, hi);
        } else if (m[1].matched) {
            out.credits.min = n;
            out.credits.max.reset();
        } else if (m[2].matched) {
            out.credits.max = n;
            out.credits.min.reset();
        } else {
            out.credits.min = n;
            out.credits.max = n;
        }
        out.matched.push_back(fmt::format("{} -> credits {}", m[0].str(), out.credits.describe()));
        return true;
    });

    consume(work, clock_bound_re(), [&](const std::smatch& m) {
        // "10 in the morning" carries its marker in words
        std::string marker = m[4].str();
        if (marker.empty() && m[5].matched) marker = m[5].str() == "morning" ? "am" : "pm";
        auto minute = clock_minutes(m[2].str(), m[3].str(), marker);
        if (!minute) return false;

        std::string connector = m[1].str();
        bool negated = connector.rfind("no", 0) == 0 || connector.rfind("not", 0) == 0;
        bool says_before = connector.find("before") != std::string::npos;
        bool says_after = connector.find("after") != std::string::npos;

        // "no classes before 10" and "after 10" bound the start;
        // "nothing after 3", "before 3" and "done by 3" bound the end.
        bool bounds_start = (negated && says_before) || (!negated && says_after);
        if (bounds_start) {
            out.tighten_earliest(*minute);
            out.matched.push_back(fmt::format("{} -> start >= {}", m[0].str(),
                                              format_clock_time(*minute)));
        } else {
            out.tighten_latest(*minute);
            out.matched.push_back(fmt::format("{} -> end <= {}", m[0].str(),
                                              format_clock_time(*minute)));
        }
        return true;
    });

    consume(work, open_seats_re(), [&](const std::smatch& m) {
        out.open_seats_only = true;
        out.matched.push_back(fmt::format("{} -> open seats only", m[0].str()));
        return true;
    });

    consume(work, course_code_re(), [&](const std::smatch& m) {
        std::string dept = m[1].str();
        // "cmsc 330" needs a known department; "cmsc330" is taken as written
        if (!m[2].str().empty() && !is_department(dept)) return false;

        std::string code = normalize_code(dept, m[3].str());
        out.add_course(code);
        out.matched.push_back(fmt::format("{} -> course {}", m[0].str(), code));
        return true;
    });
}

void ConstraintExtractor::scan_phrases(const std::string& work, ConstraintSet& out) const {
    auto words = tokenize_words(work);

    size_t pos = 0;
    while (pos < words.size()) {
        auto gen_ed = gen_eds_.longest_match(words, pos);
        auto dept = departments_.longest_match(words, pos);
        auto time = times_.longest_match(words, pos);
        auto pref = preferences_.longest_match(words, pos);
        auto topic = topics_.longest_match(words, pos);

        // Longest phrase wins; ties go gen-ed, department, day/time, preference, topic
        size_t best = 0;
        if (gen_ed) best = std::max(best, gen_ed->length);
        if (dept) best = std::max(best, dept->length);
        if (time) best = std::max(best, time->length);
        if (pref) best = std::max(best, pref->length);
        if (topic) best = std::max(best, topic->length);

        if (best == 0) {
            ++pos;
            continue;
        }

        if (gen_ed && gen_ed->length == best) {
            out.add_gen_ed(*gen_ed->value);
            out.matched.push_back(fmt::format("{} -> gen-ed {}", gen_ed->phrase, *gen_ed->value));
        } else if (dept && dept->length == best) {
            out.add_department(*dept->value);
            out.matched.push_back(fmt::format("{} -> department {}", dept->phrase, *dept->value));
        } else if (time && time->length == best) {
            const TimeRule& rule = *time->value;
            switch (rule.kind) {
                case TimeRule::Kind::ExcludeDay:
                    out.excluded_days.insert(rule.days.begin(), rule.days.end());
                    out.matched.push_back(fmt::format("{} -> exclude {}", time->phrase,
                                                      describe_days(rule.days)));
                    break;
                case TimeRule::Kind::OnlyDays:
                    out.allowed_days = rule.days;
                    out.matched.push_back(fmt::format("{} -> only {}", time->phrase,
                                                      describe_days(rule.days)));
                    break;
                case TimeRule::Kind::EarliestStart:
                    out.tighten_earliest(rule.minute);
                    out.matched.push_back(fmt::format("{} -> start >= {}", time->phrase,
                                                      format_clock_time(rule.minute)));
                    break;
                case TimeRule::Kind::LatestEnd:
                    out.tighten_latest(rule.minute);
                    out.matched.push_back(fmt::format("{} -> end <= {}", time->phrase,
                                                      format_clock_time(rule.minute)));
                    break;
            }
        } else if (pref && pref->length == best) {
            out.preference = *pref->value;
            out.matched.push_back(fmt::format("{} -> prefer {}", pref->phrase,
                                              ranking_preference_name(*pref->value)));
        } else {
            for (const auto& term : *topic->value) out.add_keyword(term);
            out.matched.push_back(fmt::format("{} -> topic {}", topic->phrase,
                                              fmt::join(*topic->value, "/")));
        }
        pos += best;
    }
}
