#include "schedule_service.hpp"
#include <thread>
#include <algorithm>
#include <core/log.hpp>
#include <core/terms.hpp>
#include <fmt/format.h>

const char* reason_code_name(ReasonCode code) {
    switch (code) {
        case ReasonCode::Ok:                      return "ok";
        case ReasonCode::PartitionUnavailable:    return "partition_unavailable";
        case ReasonCode::NoConstraintsRecognized: return "no_constraints_recognized";
        case ReasonCode::Unsatisfiable:           return "unsatisfiable";
    }
    return "unknown";
}

ScheduleService::ScheduleService(CacheStore& cache, FetchFn fetch, AssemblerOptions options,
                                 ConstraintExtractor extractor)
    : cache_(cache), fetch_(std::move(fetch)),
      options_(std::move(options)), extractor_(std::move(extractor)) {}

std::vector<Result<ResolvedPartition>> ScheduleService::resolve_all(
        const std::vector<PartitionId>& ids) const {
    std::vector<Result<ResolvedPartition>> results(
        ids.size(), Result<ResolvedPartition>::Err("not resolved"));

    std::vector<std::thread> workers;
    workers.reserve(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        workers.emplace_back([this, &ids, &results, i] {
            try {
                results[i] = cache_.resolve(ids[i], fetch_);
            } catch (const std::exception& e) {
                results[i] = Result<ResolvedPartition>::Err(e.what());
            } catch (...) {
                results[i] = Result<ResolvedPartition>::Err(
                    fmt::format("Fetch for {} raised an unknown error", ids[i].to_string()));
            }
        });
    }
    for (auto& t : workers) t.join();
    return results;
}

ScheduleResponse ScheduleService::build(const ScheduleRequest& request,
                                        const std::atomic<bool>* cancel) const {
    ScheduleResponse response;
    response.term_id = request.term_id.empty() ? current_term() : request.term_id;
    response.constraints = extractor_.extract(request.free_text);
    response.slots = requirement_slots(response.constraints);

    termplan_log(fmt::format("plan: term {} slots {} text \"{}\"",
                             response.term_id, response.slots.size(), request.free_text));

    if (response.slots.empty()) {
        response.reason = ReasonCode::NoConstraintsRecognized;
        return response;
    }

    // Several slots may share a partition (CMSC330 and CMSC both read dept:CMSC)
    std::vector<PartitionId> ids;
    for (const auto& slot : response.slots) {
        auto id = slot.partition(response.term_id);
        if (std::find(ids.begin(), ids.end(), id) == ids.end()) ids.push_back(id);
    }

    auto resolved = resolve_all(ids);

    std::vector<PartitionSnapshot> snapshots;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (resolved[i].is_err()) {
            response.unavailable.push_back({ids[i], resolved[i].error});
            continue;
        }
        if (resolved[i].value.stale) response.stale.push_back(ids[i]);
        snapshots.push_back(resolved[i].value.partition);
    }
    response.stale_data = !response.stale.empty();

    if (!response.unavailable.empty()) {
        response.reason = ReasonCode::PartitionUnavailable;
        return response;
    }

    AssemblerOptions options = options_;
    options.cancel = cancel;
    ScheduleAssembler assembler(options);
    auto result = assembler.assemble(response.constraints, snapshots);

    response.schedules = std::move(result.schedules);
    response.pool_sizes = std::move(result.pool_sizes);
    response.nodes_visited = result.nodes_visited;
    response.complete_found = result.complete_found;
    response.partial_search = result.partial_search;
    response.cancelled = result.cancelled;
    response.reason = response.schedules.empty() ? ReasonCode::Unsatisfiable : ReasonCode::Ok;

    termplan_log(fmt::format("plan: {} nodes, {} complete, {} returned, reason {}",
                             response.nodes_visited, response.complete_found,
                             response.schedules.size(), reason_code_name(response.reason)));
    return response;
}

Result<ResolvedPartition> ScheduleService::refresh(const PartitionId& id) const {
    return cache_.refresh(id, fetch_);
}
