#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <catalog/partition.hpp>

namespace fs = std::filesystem;

// Durable copy of cached partitions, one YAML file per partition:
//
//   kind: dept
//   key: CMSC
//   term_id: "202608"
//   fetched_at: 2026-08-20T14:02:11Z
//   sections: [...]
//
// The copy is advisory. Missing or corrupt files load as absent.
class PartitionStore {
public:
    explicit PartitionStore(fs::path dir);

    Result<void> save(const CachePartition& partition);

    std::optional<CachePartition> load(const PartitionId& id) const;
    std::vector<CachePartition> load_all() const;

    fs::path path_for(const PartitionId& id) const;
    const fs::path& dir() const { return dir_; }

private:
    std::optional<CachePartition> load_path(const fs::path& path) const;

    fs::path dir_;
};
