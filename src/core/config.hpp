#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.termplan/config.yaml. A missing file yields defaults.
    static Result<Config> load_global();

    // Load a config file at an explicit path. A missing file is an error.
    static Result<Config> load_file(const fs::path& path);

    // Parse config text (YAML). Unset keys keep their defaults.
    static Result<Config> parse(const std::string& yaml_text);

    // Built-in defaults (cache and catalog under ~/.termplan).
    static Config defaults();

    // Accessors
    const CacheConfig& cache() const { return cache_; }
    const CatalogConfig& catalog() const { return catalog_; }
    const SearchConfig& search() const { return search_; }
    const RankingWeights& ranking() const { return ranking_; }
    const std::optional<std::string>& default_term() const { return default_term_; }

public:
    Config() = default;

private:
    CacheConfig cache_;
    CatalogConfig catalog_;
    SearchConfig search_;
    RankingWeights ranking_;
    std::optional<std::string> default_term_;
};

bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config (never overwrites an existing file)
Result<void> create_default_global_config();
