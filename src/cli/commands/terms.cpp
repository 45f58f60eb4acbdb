#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/terms.hpp>
#include <core/utils.hpp>

static void do_terms(BaseCLI& cli, const std::string& arg) {
    auto listing = list_terms();
    std::cout << theme::section("Terms");
    for (const auto& t : listing.terms) {
        std::string marks;
        if (t.id == listing.current) marks += "  current";
        if (t.id == cli.term) marks += "  selected";
        std::cout << theme::color::BLUE << fmt::format("    {:<8}", t.id) << theme::color::RESET
                  << fmt::format("{:<14}", t.label)
                  << theme::color::DIM << marks << theme::color::RESET << "\n";
    }
    std::cout << "\n";
}

static void do_term(BaseCLI& cli, const std::string& arg) {
    std::string id = arg;
    trim(id);
    if (id.empty()) {
        std::cout << theme::kv("Term", cli.term.empty() ? "(none)"
                                                        : cli.term + "  " + term_label(cli.term));
        return;
    }
    if (!is_valid_term(id)) {
        std::cout << theme::fail("Not a term id: " + id);
        std::cout << theme::step("Term ids are YYYYMM with MM one of 01, 05, 08, 12.");
        return;
    }
    cli.term = id;
    std::cout << theme::ok("Planning for " + term_label(id));
}

void register_term_commands(BaseCLI& cli) {
    cli.add_command("terms", do_terms, "List known terms");
    cli.add_command("term", do_term, "Show or set the planning term");
}
