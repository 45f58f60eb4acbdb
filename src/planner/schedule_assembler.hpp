#pragma once

#include <string>
#include <vector>
#include <atomic>
#include <cstdint>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <catalog/partition.hpp>
#include "constraint_set.hpp"

// One requirement the schedule must fill with exactly one section.
struct RequirementSlot {
    enum class Kind { Course, Department, GenEd };

    Kind kind = Kind::Department;
    std::string code;               // "CMSC330", "CMSC" or "FSOC"

    PartitionKind partition_kind() const {
        return kind == Kind::GenEd ? PartitionKind::GenEd : PartitionKind::Department;
    }
    // Course slots draw from their department's partition
    std::string partition_key() const;
    PartitionId partition(const std::string& term_id) const;
    std::string label() const;      // "course CMSC330", "dept CMSC", "gen-ed FSOC"
};

// Specific courses first, then departments, then gen-eds, in mention order.
std::vector<RequirementSlot> requirement_slots(const ConstraintSet& constraints);

struct ScheduleCandidate {
    std::vector<CourseSection> sections;   // one per slot, in slot order
    int total_credits = 0;
    double score = 0.0;
    int idle_minutes = 0;
    double avg_rating = 0.0;
    double avg_gpa = 0.0;

    // Sorted section identities; equal keys mean an identical section set
    std::string key() const;
};

struct AssemblerOptions {
    int max_results = DEFAULT_MAX_RESULTS;
    int64_t node_budget = DEFAULT_NODE_BUDGET;
    RankingWeights weights;
    const std::atomic<bool>* cancel = nullptr;   // polled at every search step
};

struct AssemblyResult {
    std::vector<ScheduleCandidate> schedules;    // best first, at most max_results
    std::vector<RequirementSlot> slots;
    std::vector<size_t> pool_sizes;              // per slot, after filtering
    int64_t nodes_visited = 0;
    size_t complete_found = 0;
    bool partial_search = false;                 // node budget ran out
    bool cancelled = false;
};

// Total minutes between consecutive classes, summed over days with two or
// more classes. Sections without a fixed meeting contribute nothing.
int idle_gap_minutes(const std::vector<const CourseSection*>& sections);

// Depth-first search over one candidate pool per requirement slot.
//
// Pools are filtered by the constraint set and ordered by desirability
// (rating, then GPA, then open seats). The search keeps an explicit stack
// of (slot, next candidate) frames; each candidate tried counts against
// the node budget. A candidate is committed only when it does not conflict
// with any committed section, repeats no committed course, and keeps the
// credit target reachable. Complete assignments inside the credit target
// are scored and the best distinct ones kept.
class ScheduleAssembler {
public:
    explicit ScheduleAssembler(AssemblerOptions options = {});

    AssemblyResult assemble(const ConstraintSet& constraints,
                            const std::vector<PartitionSnapshot>& partitions) const;

    std::vector<const CourseSection*> build_pool(const RequirementSlot& slot,
                                                 const ConstraintSet& constraints,
                                                 const CachePartition* partition) const;

    // Weighted score of a complete assignment; fills `candidate`'s derived fields.
    void score(ScheduleCandidate& candidate, RankingPreference preference) const;

    const AssemblerOptions& options() const { return options_; }

private:
    AssemblerOptions options_;
};
