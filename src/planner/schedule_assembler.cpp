#include "schedule_assembler.hpp"
#include <algorithm>
#include <map>
#include <set>

// ── Slots ───────────────────────────────────────────────────

std::string RequirementSlot::partition_key() const {
    return kind == Kind::Course ? course_department(code) : code;
}

PartitionId RequirementSlot::partition(const std::string& term_id) const {
    PartitionId id;
    id.kind = partition_kind();
    id.key = partition_key();
    id.term_id = term_id;
    return id;
}

std::string RequirementSlot::label() const {
    switch (kind) {
        case Kind::Course:     return "course " + code;
        case Kind::Department: return "dept " + code;
        case Kind::GenEd:      return "gen-ed " + code;
    }
    return code;
}

std::vector<RequirementSlot> requirement_slots(const ConstraintSet& constraints) {
    std::vector<RequirementSlot> slots;
    for (const auto& c : constraints.courses) {
        slots.push_back({RequirementSlot::Kind::Course, c});
    }
    for (const auto& d : constraints.departments) {
        slots.push_back({RequirementSlot::Kind::Department, d});
    }
    for (const auto& g : constraints.gen_eds) {
        slots.push_back({RequirementSlot::Kind::GenEd, g});
    }
    return slots;
}

std::string ScheduleCandidate::key() const {
    std::vector<std::string> ids;
    for (const auto& s : sections) ids.push_back(s.identity());
    std::sort(ids.begin(), ids.end());

    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += '|';
        out += id;
    }
    return out;
}

// ── Scoring ─────────────────────────────────────────────────

int idle_gap_minutes(const std::vector<const CourseSection*>& sections) {
    std::map<Weekday, std::vector<std::pair<int, int>>> by_day;
    for (const auto* s : sections) {
        for (const auto& m : s->meetings()) {
            by_day[m.day].emplace_back(m.start, m.end);
        }
    }

    int idle = 0;
    for (auto& [day, blocks] : by_day) {
        if (blocks.size() < 2) continue;
        std::sort(blocks.begin(), blocks.end());
        int busy_until = blocks.front().second;
        for (size_t i = 1; i < blocks.size(); ++i) {
            if (blocks[i].first > busy_until) idle += blocks[i].first - busy_until;
            busy_until = std::max(busy_until, blocks[i].second);
        }
    }
    return idle;
}

ScheduleAssembler::ScheduleAssembler(AssemblerOptions options) : options_(std::move(options)) {}

void ScheduleAssembler::score(ScheduleCandidate& candidate, RankingPreference preference) const {
    RankingWeights w = options_.weights;
    switch (preference) {
        case RankingPreference::MinimizeGaps:   w.compactness *= w.preference_boost; break;
        case RankingPreference::MaximizeRating: w.rating *= w.preference_boost; break;
        case RankingPreference::MaximizeGpa:    w.gpa *= w.preference_boost; break;
        case RankingPreference::Balanced:       break;
    }

    double rating_sum = 0.0, gpa_sum = 0.0;
    int rating_n = 0, gpa_n = 0;
    std::vector<const CourseSection*> ptrs;
    candidate.total_credits = 0;
    for (const auto& s : candidate.sections) {
        ptrs.push_back(&s);
        candidate.total_credits += s.credits;
        if (s.instructor_rating) { rating_sum += *s.instructor_rating; rating_n++; }
        if (s.course_gpa) { gpa_sum += *s.course_gpa; gpa_n++; }
    }

    candidate.avg_rating = rating_n ? rating_sum / rating_n : 0.0;
    candidate.avg_gpa = gpa_n ? gpa_sum / gpa_n : 0.0;
    candidate.idle_minutes = idle_gap_minutes(ptrs);
    candidate.score = w.rating * candidate.avg_rating
                    + w.gpa * candidate.avg_gpa
                    - w.compactness * candidate.idle_minutes;
}

// Higher score first, then less idle time, then the first section's code,
// then the full section set so the order is total.
static bool ranks_before(const ScheduleCandidate& a, const std::string& a_key,
                         const ScheduleCandidate& b, const std::string& b_key) {
    if (a.score != b.score) return a.score > b.score;
    if (a.idle_minutes != b.idle_minutes) return a.idle_minutes < b.idle_minutes;
    const std::string& a_first = a.sections.empty() ? std::string() : a.sections.front().code;
    const std::string& b_first = b.sections.empty() ? std::string() : b.sections.front().code;
    if (a_first != b_first) return a_first < b_first;
    return a_key < b_key;
}

// ── Pools ───────────────────────────────────────────────────

static bool more_desirable(const CourseSection* a, const CourseSection* b) {
    double ar = a->instructor_rating.value_or(-1.0);
    double br = b->instructor_rating.value_or(-1.0);
    if (ar != br) return ar > br;
    double ag = a->course_gpa.value_or(-1.0);
    double bg = b->course_gpa.value_or(-1.0);
    if (ag != bg) return ag > bg;
    if (a->open_seats != b->open_seats) return a->open_seats > b->open_seats;
    if (a->code != b->code) return a->code < b->code;
    return a->section < b->section;
}

std::vector<const CourseSection*> ScheduleAssembler::build_pool(const RequirementSlot& slot,
                                                                const ConstraintSet& constraints,
                                                                const CachePartition* partition) const {
    std::vector<const CourseSection*> pool;
    if (!partition) return pool;

    std::set<std::string> seen;
    for (const auto& s : partition->sections) {
        if (constraints.excluded_courses.count(s.code)) continue;
        if (constraints.open_seats_only && s.open_seats <= 0) continue;
        if (!constraints.admits_meetings(s)) continue;

        if (slot.kind == RequirementSlot::Kind::Course) {
            if (s.code != slot.code) continue;
        } else {
            // Explicitly requested courses fill their own slots
            if (std::find(constraints.courses.begin(), constraints.courses.end(), s.code)
                != constraints.courses.end()) continue;
            if (slot.kind == RequirementSlot::Kind::Department &&
                course_department(s.code) != slot.code) continue;
            if (!constraints.admits_level(s)) continue;
        }

        if (!seen.insert(s.identity()).second) continue;
        pool.push_back(&s);
    }

    // Topic terms narrow department and gen-ed pools, but a slot with no
    // matching section keeps its whole pool
    if (slot.kind != RequirementSlot::Kind::Course && !constraints.keywords.empty()) {
        std::vector<const CourseSection*> on_topic;
        for (const auto* s : pool) {
            if (constraints.mentions_topic(*s)) on_topic.push_back(s);
        }
        if (!on_topic.empty()) pool = std::move(on_topic);
    }

    std::sort(pool.begin(), pool.end(), more_desirable);
    return pool;
}

// ── Search ──────────────────────────────────────────────────

namespace {

struct PoolEntry {
    const CourseSection* section;
    std::vector<Meeting> meetings;
};

struct Frame {
    size_t slot;
    size_t next;    // next pool index to try at this slot
};

}  // namespace

AssemblyResult ScheduleAssembler::assemble(const ConstraintSet& constraints,
                                           const std::vector<PartitionSnapshot>& partitions) const {
    AssemblyResult result;
    result.slots = requirement_slots(constraints);
    if (result.slots.empty()) return result;

    std::map<std::pair<PartitionKind, std::string>, const CachePartition*> by_key;
    for (const auto& p : partitions) {
        if (p) by_key[{p->id.kind, p->id.key}] = p.get();
    }

    std::vector<std::vector<PoolEntry>> pools;
    for (const auto& slot : result.slots) {
        auto it = by_key.find({slot.partition_kind(), slot.partition_key()});
        const CachePartition* partition = it == by_key.end() ? nullptr : it->second;

        std::vector<PoolEntry> pool;
        for (const auto* s : build_pool(slot, constraints, partition)) {
            pool.push_back({s, s->meetings()});
        }
        result.pool_sizes.push_back(pool.size());
        pools.push_back(std::move(pool));
    }

    for (const auto& pool : pools) {
        if (pool.empty()) return result;
    }

    // Largest credit count still obtainable from slot i onward
    std::vector<int> max_remaining(pools.size() + 1, 0);
    for (size_t i = pools.size(); i-- > 0;) {
        int best = 0;
        for (const auto& e : pools[i]) best = std::max(best, e.section->credits);
        max_remaining[i] = max_remaining[i + 1] + best;
    }

    const CreditTarget& target = constraints.credits;
    const size_t keep = static_cast<size_t>(std::max(options_.max_results, 0));
    std::vector<std::pair<ScheduleCandidate, std::string>> best;   // sorted, with keys

    std::vector<const PoolEntry*> chosen;
    int credits = 0;
    std::vector<Frame> stack;
    stack.push_back({0, 0});

    while (!stack.empty()) {
        if (options_.cancel && options_.cancel->load()) {
            result.cancelled = true;
            break;
        }

        Frame& top = stack.back();
        const auto& pool = pools[top.slot];

        if (top.next >= pool.size()) {
            stack.pop_back();
            if (!stack.empty()) {
                credits -= chosen.back()->section->credits;
                chosen.pop_back();
            }
            continue;
        }

        if (result.nodes_visited >= options_.node_budget) {
            result.partial_search = true;
            break;
        }
        result.nodes_visited++;

        const PoolEntry& entry = pool[top.next++];
        const CourseSection& s = *entry.section;

        int with = credits + s.credits;
        if (target.max && with > *target.max) continue;
        if (target.min && with + max_remaining[top.slot + 1] < *target.min) continue;

        bool ok = true;
        for (const auto* c : chosen) {
            if (c->section->code == s.code || meetings_conflict(c->meetings, entry.meetings)) {
                ok = false;
                break;
            }
        }
        if (!ok) continue;

        if (top.slot + 1 < pools.size()) {
            chosen.push_back(&entry);
            credits = with;
            stack.push_back({top.slot + 1, 0});
            continue;
        }

        // Every slot filled
        if (!target.accepts(with)) continue;
        result.complete_found++;
        if (keep == 0) continue;

        ScheduleCandidate candidate;
        for (const auto* c : chosen) candidate.sections.push_back(*c->section);
        candidate.sections.push_back(s);
        score(candidate, constraints.preference);
        std::string key = candidate.key();

        bool duplicate = std::any_of(best.begin(), best.end(),
                                     [&](const auto& b) { return b.second == key; });
        if (duplicate) continue;

        auto pos = std::find_if(best.begin(), best.end(), [&](const auto& b) {
            return ranks_before(candidate, key, b.first, b.second);
        });
        if (pos == best.end() && best.size() >= keep) continue;
        best.insert(pos, {std::move(candidate), std::move(key)});
        if (best.size() > keep) best.pop_back();
    }

    for (auto& b : best) result.schedules.push_back(std::move(b.first));
    return result;
}
