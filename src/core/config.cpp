#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / TERMPLAN_HOME_DIR;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    // Ensure directory exists
    fs::create_directories(config_path.parent_path());

    const char* default_config = R"(# termplan configuration

cache:
  dir: "~/.termplan/cache"          # one YAML file per cached partition
  ttl_hours: 24                     # partitions older than this are refetched
  warm_start: true                  # load fresh cached partitions on startup

catalog:
  dir: "~/.termplan/catalog"        # <dir>/<term>/<dept|gened>/<KEY>.yaml

search:
  max_results: 5
  node_budget: 200000

# Score = rating * avg instructor rating + gpa * avg course GPA
#       - compactness * idle minutes between classes
ranking:
  rating_weight: 1.0
  gpa_weight: 1.0
  compactness_weight: 0.01
  preference_boost: 2.0

# Optional: default term id (YYYYMM); the current term is used otherwise
# term: "202608"
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static CacheConfig parse_cache_config(const YAML::Node& node, const CacheConfig& base) {
    CacheConfig cache = base;
    cache.dir = platform::expand_home(node["dir"].as<std::string>(base.dir)).string();
    cache.ttl_hours = node["ttl_hours"].as<int>(base.ttl_hours);
    cache.warm_start = node["warm_start"].as<bool>(base.warm_start);
    return cache;
}

static SearchConfig parse_search_config(const YAML::Node& node, const SearchConfig& base) {
    SearchConfig search = base;
    search.max_results = node["max_results"].as<int>(base.max_results);
    search.node_budget = node["node_budget"].as<int64_t>(base.node_budget);
    return search;
}

static RankingWeights parse_ranking_config(const YAML::Node& node, const RankingWeights& base) {
    RankingWeights w = base;
    w.rating = node["rating_weight"].as<double>(base.rating);
    w.gpa = node["gpa_weight"].as<double>(base.gpa);
    w.compactness = node["compactness_weight"].as<double>(base.compactness);
    w.preference_boost = node["preference_boost"].as<double>(base.preference_boost);
    return w;
}

Config Config::defaults() {
    Config config;
    config.cache_.dir = (get_global_config_dir() / "cache").string();
    config.cache_.ttl_hours = DEFAULT_CACHE_TTL_HOURS;
    config.catalog_.dir = (get_global_config_dir() / "catalog").string();
    config.search_.max_results = DEFAULT_MAX_RESULTS;
    config.search_.node_budget = DEFAULT_NODE_BUDGET;
    config.ranking_.rating = DEFAULT_RATING_WEIGHT;
    config.ranking_.gpa = DEFAULT_GPA_WEIGHT;
    config.ranking_.compactness = DEFAULT_COMPACTNESS_WEIGHT;
    config.ranking_.preference_boost = DEFAULT_PREFERENCE_BOOST;
    return config;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config = defaults();

    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }

        if (root["cache"] && root["cache"].IsMap()) {
            config.cache_ = parse_cache_config(root["cache"], config.cache_);
        }
        if (root["catalog"] && root["catalog"].IsMap()) {
            config.catalog_.dir = platform::expand_home(
                root["catalog"]["dir"].as<std::string>(config.catalog_.dir)).string();
        }
        if (root["search"] && root["search"].IsMap()) {
            config.search_ = parse_search_config(root["search"], config.search_);
        }
        if (root["ranking"] && root["ranking"].IsMap()) {
            config.ranking_ = parse_ranking_config(root["ranking"], config.ranking_);
        }
        if (root["term"] && root["term"].IsScalar()) {
            config.default_term_ = root["term"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse config: {}", e.what()));
    }

    if (config.cache_.ttl_hours <= 0) {
        return Result<Config>::Err("cache.ttl_hours must be positive");
    }
    if (config.search_.max_results <= 0) {
        return Result<Config>::Err("search.max_results must be positive");
    }
    if (config.search_.node_budget <= 0) {
        return Result<Config>::Err("search.node_budget must be positive");
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Config not found at " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto result = parse(buffer.str());
    if (result.is_err()) {
        return Result<Config>::Err(path.string() + ": " + result.error);
    }
    return result;
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(defaults());
    }
    return load_file(get_global_config_path());
}
