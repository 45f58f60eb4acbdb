#include "cache_store.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

CacheStore::CacheStore(std::chrono::seconds ttl,
                       std::unique_ptr<PartitionStore> persist,
                       Clock clock)
    : ttl_(ttl), persist_(std::move(persist)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

bool CacheStore::is_stale(const CachePartition& partition, SystemTime now) const {
    return now - partition.fetched_at > ttl_;
}

std::shared_ptr<CacheStore::Slot> CacheStore::slot_for(const PartitionId& id) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& slot = slots_[id];
    if (!slot) slot = std::make_shared<Slot>();
    return slot;
}

std::vector<std::pair<PartitionId, std::shared_ptr<CacheStore::Slot>>> CacheStore::all_slots() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return std::vector<std::pair<PartitionId, std::shared_ptr<Slot>>>(slots_.begin(), slots_.end());
}

Result<ResolvedPartition> CacheStore::resolve(const PartitionId& id, const FetchFn& fetch,
                                              std::optional<Deadline> deadline) {
    auto slot = slot_for(id);
    std::unique_lock<std::mutex> lock(slot->mutex);

    if (slot->current && !is_stale(*slot->current, clock_())) {
        hits_++;
        return Result<ResolvedPartition>::Ok({slot->current, true, false});
    }

    misses_++;
    if (slot->in_flight) {
        termplan_log(fmt::format("cache: joining in-flight fetch for {}", id.to_string()));
        auto flight = slot->in_flight;
        return wait_for(*slot, lock, flight, id, deadline);
    }
    return run_fetch(*slot, lock, id, fetch);
}

Result<ResolvedPartition> CacheStore::refresh(const PartitionId& id, const FetchFn& fetch) {
    auto slot = slot_for(id);
    std::unique_lock<std::mutex> lock(slot->mutex);

    if (slot->in_flight) {
        termplan_log(fmt::format("cache: refresh joining in-flight fetch for {}", id.to_string()));
        auto flight = slot->in_flight;
        return wait_for(*slot, lock, flight, id, std::nullopt);
    }
    termplan_log(fmt::format("cache: forced refresh of {}", id.to_string()));
    return run_fetch(*slot, lock, id, fetch);
}

Result<ResolvedPartition> CacheStore::wait_for(Slot& slot, std::unique_lock<std::mutex>& lock,
                                               const std::shared_ptr<Flight>& flight,
                                               const PartitionId& id,
                                               std::optional<Deadline> deadline) {
    auto done = [&flight] { return flight->done; };

    if (!deadline) {
        slot.cv.wait(lock, done);
        return flight->outcome;
    }

    if (slot.cv.wait_until(lock, *deadline, done)) {
        return flight->outcome;
    }

    // Gave up waiting; the fetch itself stays alive for the other waiters
    termplan_log(fmt::format("cache: deadline passed waiting for {}", id.to_string()));
    if (slot.current) {
        bool stale = is_stale(*slot.current, clock_());
        if (stale) stale_serves_++;
        return Result<ResolvedPartition>::Ok({slot.current, true, stale});
    }
    return Result<ResolvedPartition>::Err(
        fmt::format("Deadline exceeded waiting for {}", id.to_string()));
}

Result<ResolvedPartition> CacheStore::run_fetch(Slot& slot, std::unique_lock<std::mutex>& lock,
                                                const PartitionId& id, const FetchFn& fetch) {
    auto flight = std::make_shared<Flight>();
    slot.in_flight = flight;
    lock.unlock();

    auto finish = [&](Result<ResolvedPartition> outcome) {
        lock.lock();
        flight->outcome = std::move(outcome);
        flight->done = true;
        slot.in_flight.reset();
        lock.unlock();
        slot.cv.notify_all();
    };

    fetches_++;
    termplan_log(fmt::format("cache: fetching {}", id.to_string()));

    Result<std::vector<CourseSection>> fetched = Result<std::vector<CourseSection>>::Err("");
    try {
        fetched = fetch(id);
    } catch (const std::exception& e) {
        fetched = Result<std::vector<CourseSection>>::Err(e.what());
    } catch (...) {
        finish(Result<ResolvedPartition>::Err(
            fmt::format("Fetch for {} aborted", id.to_string())));
        throw;
    }

    lock.lock();
    Result<ResolvedPartition> outcome = Result<ResolvedPartition>::Err("");
    PartitionSnapshot published;

    if (fetched.is_ok()) {
        auto partition = std::make_shared<CachePartition>();
        partition->id = id;
        partition->sections = std::move(fetched.value);
        partition->fetched_at = clock_();
        for (auto& s : partition->sections) {
            if (s.term_id.empty()) s.term_id = id.term_id;
        }
        termplan_log(fmt::format("cache: stored {} ({} sections)",
                                 id.to_string(), partition->sections.size()));

        published = partition;
        slot.current = published;
        outcome = Result<ResolvedPartition>::Ok({published, false, false});
    } else {
        fetch_failures_++;
        termplan_log(fmt::format("cache: fetch failed for {}: {}", id.to_string(), fetched.error));

        if (slot.current) {
            bool stale = is_stale(*slot.current, clock_());
            if (stale) stale_serves_++;
            termplan_log(fmt::format("cache: serving previous copy of {} (stale={})",
                                     id.to_string(), stale));
            outcome = Result<ResolvedPartition>::Ok({slot.current, true, stale});
        } else {
            outcome = Result<ResolvedPartition>::Err(
                fmt::format("Fetch failed for {}: {}", id.to_string(), fetched.error));
        }
    }
    flight->outcome = outcome;
    flight->done = true;
    slot.in_flight.reset();
    lock.unlock();
    slot.cv.notify_all();

    if (published) persist(*published);
    return outcome;
}

void CacheStore::persist(const CachePartition& partition) {
    if (!persist_) return;
    auto result = persist_->save(partition);
    if (result.is_err()) {
        // Durable copy is advisory; the in-memory entry stays authoritative
        termplan_log(fmt::format("cache: persist failed for {}: {}",
                                 partition.id.to_string(), result.error));
    }
}

size_t CacheStore::warm_start() {
    if (!persist_) return 0;

    size_t loaded = 0;
    SystemTime now = clock_();
    for (auto& p : persist_->load_all()) {
        if (is_stale(p, now)) {
            termplan_log(fmt::format("cache: skipping expired {}", p.id.to_string()));
            continue;
        }
        auto slot = slot_for(p.id);
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->current && slot->current->fetched_at >= p.fetched_at) continue;
        slot->current = std::make_shared<const CachePartition>(std::move(p));
        loaded++;
    }
    termplan_log(fmt::format("cache: warm start loaded {} partition(s)", loaded));
    return loaded;
}

size_t CacheStore::flush() {
    if (!persist_) return 0;

    size_t saved = 0;
    for (const auto& [id, slot] : all_slots()) {
        PartitionSnapshot snapshot;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            snapshot = slot->current;
        }
        if (!snapshot) continue;

        auto result = persist_->save(*snapshot);
        if (result.is_ok()) {
            saved++;
        } else {
            termplan_log(fmt::format("cache: flush failed for {}: {}", id.to_string(), result.error));
        }
    }
    return saved;
}

void CacheStore::invalidate(const PartitionId& id) {
    auto slot = slot_for(id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->current.reset();
    termplan_log(fmt::format("cache: invalidated {}", id.to_string()));
}

std::vector<CacheEntryInfo> CacheStore::entries() const {
    std::vector<CacheEntryInfo> out;
    SystemTime now = clock_();
    for (const auto& [id, slot] : all_slots()) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (!slot->current && !slot->in_flight) continue;

        CacheEntryInfo info;
        info.id = id;
        info.fetching = slot->in_flight != nullptr;
        if (slot->current) {
            info.section_count = slot->current->sections.size();
            info.fetched_at = slot->current->fetched_at;
            info.stale = is_stale(*slot->current, now);
        }
        out.push_back(info);
    }
    return out;
}

CacheStats CacheStore::stats() const {
    CacheStats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.fetches = fetches_.load();
    s.fetch_failures = fetch_failures_.load();
    s.stale_serves = stale_serves_.load();
    return s;
}
