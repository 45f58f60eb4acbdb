#pragma once

#include <string>
#include <vector>
#include <atomic>
#include <managers/cache_store.hpp>
#include "constraint_extractor.hpp"
#include "schedule_assembler.hpp"

enum class ReasonCode { Ok, PartitionUnavailable, NoConstraintsRecognized, Unsatisfiable };

const char* reason_code_name(ReasonCode code);

struct ScheduleRequest {
    std::string free_text;
    std::string term_id;    // empty means the current term
};

struct PartitionProblem {
    PartitionId id;
    std::string error;
};

struct ScheduleResponse {
    std::string term_id;
    std::vector<ScheduleCandidate> schedules;
    ReasonCode reason = ReasonCode::Ok;

    // Summary for whoever phrases the answer
    ConstraintSet constraints;
    std::vector<RequirementSlot> slots;
    std::vector<size_t> pool_sizes;
    int64_t nodes_visited = 0;
    size_t complete_found = 0;
    std::vector<PartitionProblem> unavailable;
    std::vector<PartitionId> stale;

    bool partial_search = false;
    bool stale_data = false;
    bool cancelled = false;
};

// Runs one request end to end: extract constraints, resolve every needed
// partition through the cache (concurrently, one thread per partition),
// then assemble. Failures are reported in the response, never thrown.
class ScheduleService {
public:
    ScheduleService(CacheStore& cache, FetchFn fetch, AssemblerOptions options,
                    ConstraintExtractor extractor = ConstraintExtractor());

    ScheduleResponse build(const ScheduleRequest& request,
                           const std::atomic<bool>* cancel = nullptr) const;

    // Drop the cached copy and fetch it again.
    Result<ResolvedPartition> refresh(const PartitionId& id) const;

    const ConstraintExtractor& extractor() const { return extractor_; }
    CacheStore& cache() const { return cache_; }

private:
    std::vector<Result<ResolvedPartition>> resolve_all(const std::vector<PartitionId>& ids) const;

    CacheStore& cache_;
    FetchFn fetch_;
    AssemblerOptions options_;
    ConstraintExtractor extractor_;
};
