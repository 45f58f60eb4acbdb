#include "termplan_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/terms.hpp>
#include <core/log.hpp>
#include <readline/readline.h>
#include <readline/history.h>

TermplanCLI::TermplanCLI() : BaseCLI() {
    register_all_commands();
}

void TermplanCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI& cli, const std::string& arg) {
        quit_requested_ = true;
    }, "Save the cache and exit");

    add_command("exit", [this](BaseCLI& cli, const std::string& arg) {
        quit_requested_ = true;
    }, "Save the cache and exit");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_plan_commands(*this);
    register_term_commands(*this);
    register_cache_commands(*this);
}

void TermplanCLI::run_repl() {
    std::cout << theme::banner();

    std::cout << theme::section("Startup");
    if (!require_config()) {
        std::cout << "\n";
        return;
    }
    std::cout << theme::ok(global_config_exists() ? "Config loaded"
                                                  : "No config file, using defaults");

    init_planner();
    auto entries = cache->entries();
    std::cout << theme::ok(fmt::format("Cache ready ({} partition(s) warm)", entries.size()));

    std::cout << theme::section("Ready");
    std::cout << theme::kv("Term", term + "  " + term_label(term));
    std::cout << theme::kv("Catalog", config.value().catalog().dir);
    std::cout << theme::kv("Cache", config.value().cache().dir);
    std::cout << theme::kv("Log", termplan_log_path());
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested_) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            std::cout << "\n";
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;
        if (command.empty()) continue;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    std::cout << theme::dim("    Saving cache...") << "\n";
    shutdown_planner();
}

void TermplanCLI::run_init() {
    auto result = create_default_global_config();
    if (result.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + result.error);
        return;
    }
    std::cout << theme::ok("Config file ready at " + get_global_config_path().string());
    std::cout << theme::step("Point catalog.dir at your catalog export, then run 'termplan'.");
}

int TermplanCLI::run_once(const std::string& command, const std::string& args) {
    if (!require_config()) return 1;
    init_planner();
    execute_command(command, args);
    shutdown_planner();
    return 0;
}
