#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

class TermplanCLI : public BaseCLI {
public:
    TermplanCLI();

    void run_repl();
    void run_init();

    // One-shot invocation: load the planner, run a REPL command, flush.
    int run_once(const std::string& command, const std::string& args);

private:
    void register_all_commands();
    bool quit_requested_ = false;
};
