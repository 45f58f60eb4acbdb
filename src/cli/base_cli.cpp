#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/log.hpp>
#include <core/terms.hpp>

BaseCLI::BaseCLI() {
    auto config_result = Config::load_global();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config_error = config_result.error;
    }
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail("Config could not be loaded: " + config_error);
        std::cout << theme::step("Fix " + get_global_config_path().string()
                                 + " or run 'termplan init'.");
        return false;
    }
    return true;
}

void BaseCLI::init_planner() {
    if (!config) return;
    const auto& cfg = config.value();

    std::unique_ptr<PartitionStore> persist;
    if (!cfg.cache().dir.empty()) {
        persist = std::make_unique<PartitionStore>(cfg.cache().dir);
    }
    cache = std::make_unique<CacheStore>(std::chrono::hours(cfg.cache().ttl_hours),
                                         std::move(persist));
    if (cfg.cache().warm_start) {
        cache->warm_start();
    }

    fetcher = std::make_unique<DirectoryCatalogFetcher>(cfg.catalog().dir);

    AssemblerOptions options;
    options.max_results = cfg.search().max_results;
    options.node_budget = cfg.search().node_budget;
    options.weights = cfg.ranking();
    service = std::make_unique<ScheduleService>(*cache, fetcher->as_fetch_fn(), options);

    term = cfg.default_term().value_or(current_term());
    termplan_log(fmt::format("cli: planner ready, term {}", term));
}

void BaseCLI::shutdown_planner() {
    if (cache) {
        size_t saved = cache->flush();
        termplan_log(fmt::format("cli: flushed {} partition(s)", saved));
    }
    service.reset();
    fetcher.reset();
    cache.reset();
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Planning", {"plan"}},
        {"Terms",    {"term", "terms"}},
        {"Cache",    {"cache", "refresh"}},
        {"General",  {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    if (term.empty()) {
        return rl_esc(theme::color::BROWN) + "termplan"
             + rl_esc(theme::color::RESET) + "> ";
    }
    return rl_esc(theme::color::BROWN) + "termplan"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(theme::color::BLUE) + term_label(term)
         + rl_esc(theme::color::RESET) + "> ";
}
