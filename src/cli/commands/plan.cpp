#include "../base_cli.hpp"
#include "../theme.hpp"
#include "../schedule_view.hpp"
#include <iostream>
#include <core/utils.hpp>

static void do_plan(BaseCLI& cli, const std::string& arg) {
    if (!cli.service) {
        cli.require_config();
        return;
    }
    std::string text = arg;
    trim(text);
    if (text.empty()) {
        std::cout << theme::fail("Usage: plan <request>");
        std::cout << theme::step("Example: plan 12 credits of CMSC and a diversity gen-ed, mornings only");
        return;
    }

    ScheduleRequest request;
    request.free_text = text;
    request.term_id = cli.term;
    print_schedule_response(cli.service->build(request));
}

void register_plan_commands(BaseCLI& cli) {
    cli.add_command("plan", do_plan, "Build conflict-free schedules from a request");
}
