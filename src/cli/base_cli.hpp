#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <catalog/fetcher.hpp>
#include <managers/cache_store.hpp>
#include <planner/schedule_service.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_config();

    // Build cache, fetcher and service from the loaded config.
    void init_planner();
    // Persist the cache and release everything init_planner built.
    void shutdown_planner();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    std::optional<Config> config;
    std::string config_error;
    std::unique_ptr<CacheStore> cache;
    std::unique_ptr<CatalogFetcher> fetcher;
    std::unique_ptr<ScheduleService> service;
    std::string term;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};

// Command groups, one file each under commands/
void register_plan_commands(BaseCLI& cli);
void register_term_commands(BaseCLI& cli);
void register_cache_commands(BaseCLI& cli);
