#include <iostream>
#include <vector>
#include <string>
#include "cli/termplan_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>
#include <core/terms.hpp>

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    termplan"
              << theme::color::RESET << theme::color::DIM
              << "                         Start the interactive planner" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    termplan plan "
              << theme::color::RESET << theme::color::BROWN << "\"<request>\""
              << theme::color::RESET << theme::color::DIM
              << "   Build schedules once" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "                  "
              << theme::color::RESET << theme::color::BROWN << "[--term ID]"
              << theme::color::RESET << theme::color::DIM
              << "   Plan for a specific term" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    termplan terms"
              << theme::color::RESET << theme::color::DIM
              << "                   List known terms" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    termplan cache"
              << theme::color::RESET << theme::color::DIM
              << "                   Show persisted partitions" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    termplan init"
              << theme::color::RESET << theme::color::DIM
              << "                    Write ~/.termplan/config.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    termplan --version               Show version\n"
              << "    termplan --help                  Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        TermplanCLI cli;

        if (argc == 1) {
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "termplan"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << TERMPLAN_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "init") {
            cli.run_init();
            return 0;
        } else if (cmd == "terms") {
            return cli.run_once("terms", "");
        } else if (cmd == "cache") {
            return cli.run_once("cache", "");
        } else if (cmd == "plan") {
            std::string text;
            std::string term;
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--term") {
                    if (i + 1 >= argc) {
                        std::cout << theme::fail("--term needs a term id.");
                        return 1;
                    }
                    term = argv[++i];
                    if (!is_valid_term(term)) {
                        std::cout << theme::fail("Unknown term: " + term);
                        std::cout << theme::step("Run 'termplan terms' to list valid ids.");
                        return 1;
                    }
                    continue;
                }
                if (!text.empty()) text += " ";
                text += a;
            }
            if (text.empty()) {
                std::cout << theme::fail("Missing request text.");
                std::cout << theme::step("Usage: termplan plan \"<request>\" [--term ID]");
                return 1;
            }

            if (!cli.require_config()) return 1;
            cli.init_planner();
            if (!term.empty()) cli.execute_command("term", term);
            cli.execute_command("plan", text);
            cli.shutdown_planner();
            return 0;
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
