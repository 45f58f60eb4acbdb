#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct CacheConfig {
    std::string dir;                 // persisted partitions (one YAML file each)
    int ttl_hours = 24;
    bool warm_start = true;          // seed memory from fresh persisted files on startup
};

struct CatalogConfig {
    std::string dir;                 // root of the directory-backed fetcher
};

struct SearchConfig {
    int max_results = 5;             // K
    int64_t node_budget = 200000;    // backtracking steps before giving up
};

struct RankingWeights {
    double rating = 1.0;
    double gpa = 1.0;
    double compactness = 0.01;       // per idle minute between classes
    double preference_boost = 2.0;   // multiplier for the weight the user asked for
};
