#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <optional>
#include <functional>
#include <core/types.hpp>
#include <core/utils.hpp>
#include <catalog/partition.hpp>
#include <catalog/fetcher.hpp>
#include "partition_store.hpp"

struct ResolvedPartition {
    PartitionSnapshot partition;
    bool from_cache = false;   // served without running a fetch for this call
    bool stale = false;        // past TTL, served because the refresh failed
};

struct CacheEntryInfo {
    PartitionId id;
    size_t section_count = 0;
    SystemTime fetched_at;
    bool stale = false;
    bool fetching = false;
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t fetches = 0;
    uint64_t fetch_failures = 0;
    uint64_t stale_serves = 0;
};

// Get-or-fetch store of catalog partitions.
//
// - A fresh entry is returned without calling the fetch function.
// - A stale or missing entry is fetched; concurrent resolves of the same
//   partition share one in-flight fetch and all receive its outcome.
// - When the fetch fails and a stale entry exists, the stale entry is
//   served with stale = true instead of an error.
//
// Locking is per partition. The fetch itself runs with no lock held, so
// waiters on other partitions are never serialized behind it.
class CacheStore {
public:
    using Clock = std::function<SystemTime()>;
    using Deadline = std::chrono::steady_clock::time_point;

    CacheStore(std::chrono::seconds ttl,
               std::unique_ptr<PartitionStore> persist = nullptr,
               Clock clock = nullptr);

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    // A deadline bounds how long this call waits on a fetch started by
    // another caller. Passing it is treated like a fetch failure; the shared
    // fetch keeps running for the remaining waiters.
    Result<ResolvedPartition> resolve(const PartitionId& id, const FetchFn& fetch,
                                      std::optional<Deadline> deadline = std::nullopt);

    // Fetch now regardless of freshness. A failed fetch leaves the current
    // copy in place and serves it with from_cache = true. Joins a fetch
    // already in flight instead of starting a second one.
    Result<ResolvedPartition> refresh(const PartitionId& id, const FetchFn& fetch);

    // Seed memory from persisted partitions still within TTL. Returns count.
    size_t warm_start();

    // Write every in-memory partition to durable storage. Returns count.
    size_t flush();

    // Drop the in-memory entry; the next resolve fetches.
    void invalidate(const PartitionId& id);

    std::vector<CacheEntryInfo> entries() const;
    CacheStats stats() const;

    bool is_stale(const CachePartition& partition, SystemTime now) const;
    std::chrono::seconds ttl() const { return ttl_; }

private:
    struct Flight {
        bool done = false;
        Result<ResolvedPartition> outcome = Result<ResolvedPartition>::Err("fetch pending");
    };

    struct Slot {
        std::mutex mutex;
        std::condition_variable cv;
        PartitionSnapshot current;
        std::shared_ptr<Flight> in_flight;
    };

    std::shared_ptr<Slot> slot_for(const PartitionId& id);
    std::vector<std::pair<PartitionId, std::shared_ptr<Slot>>> all_slots() const;

    Result<ResolvedPartition> wait_for(Slot& slot, std::unique_lock<std::mutex>& lock,
                                       const std::shared_ptr<Flight>& flight,
                                       const PartitionId& id,
                                       std::optional<Deadline> deadline);
    Result<ResolvedPartition> run_fetch(Slot& slot, std::unique_lock<std::mutex>& lock,
                                        const PartitionId& id, const FetchFn& fetch);
    void persist(const CachePartition& partition);

    std::chrono::seconds ttl_;
    std::unique_ptr<PartitionStore> persist_;
    Clock clock_;

    mutable std::mutex slots_mutex_;   // guards the map only, never held across a fetch
    std::map<PartitionId, std::shared_ptr<Slot>> slots_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> fetches_{0};
    std::atomic<uint64_t> fetch_failures_{0};
    std::atomic<uint64_t> stale_serves_{0};
};
