#pragma once

#include <string>
#include <vector>
#include <functional>
#include <filesystem>
#include <core/types.hpp>
#include "partition.hpp"

// Fetch capability: obtains a fresh, ordered section list for one partition.
// Implementations may block on I/O and must report failure through Result.
using FetchFn = std::function<Result<std::vector<CourseSection>>(const PartitionId&)>;

class CatalogFetcher {
public:
    virtual ~CatalogFetcher() = default;

    virtual Result<std::vector<CourseSection>> fetch(const PartitionId& id) = 0;

    // Bind this fetcher as a FetchFn. The fetcher must outlive the function.
    FetchFn as_fetch_fn() {
        return [this](const PartitionId& id) { return fetch(id); };
    }
};

// Reads partitions from YAML files laid out as
//   <root>/<term>/dept/<KEY>.yaml
//   <root>/<term>/gened/<KEY>.yaml
// each holding a list of section records.
class DirectoryCatalogFetcher : public CatalogFetcher {
public:
    explicit DirectoryCatalogFetcher(std::filesystem::path root);

    Result<std::vector<CourseSection>> fetch(const PartitionId& id) override;

    std::filesystem::path path_for(const PartitionId& id) const;

private:
    std::filesystem::path root_;
};
