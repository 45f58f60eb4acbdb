#include "schedule_view.hpp"
#include "theme.hpp"
#include <iostream>
#include <algorithm>
#include <array>
#include <fmt/format.h>
#include <core/terms.hpp>

static std::string rating_cell(const std::optional<double>& v) {
    return v ? fmt::format("{:.2f}", *v) : "-";
}

static std::string seats_cell(const CourseSection& s) {
    if (s.total_seats > 0) return fmt::format("{}/{}", s.open_seats, s.total_seats);
    return std::to_string(s.open_seats);
}

std::string format_schedule(const ScheduleCandidate& schedule, size_t index) {
    constexpr size_t COLS = 8;
    const std::array<std::string, COLS> header = {
        "COURSE", "SEC", "DAYS", "TIME", "INSTRUCTOR", "RATING", "GPA", "SEATS"};

    std::vector<std::array<std::string, COLS>> rows;
    for (const auto& s : schedule.sections) {
        rows.push_back({s.code, s.section,
                        s.days.empty() ? "TBA" : s.days,
                        s.time.empty() ? "TBA" : s.time,
                        s.instructor.empty() ? "Staff" : s.instructor,
                        rating_cell(s.instructor_rating),
                        rating_cell(s.course_gpa),
                        seats_cell(s)});
    }

    // Compute column widths from headers and data
    std::array<size_t, COLS> width;
    for (size_t c = 0; c < COLS; ++c) {
        width[c] = header[c].size();
        for (const auto& r : rows) width[c] = std::max(width[c], r[c].size());
    }

    auto line = [&](const std::array<std::string, COLS>& cells) {
        std::string out = "  ";
        for (size_t c = 0; c < COLS; ++c) {
            out += fmt::format("{:<{}}", cells[c], width[c] + 2);
        }
        while (!out.empty() && out.back() == ' ') out.pop_back();
        return out + "\n";
    };

    std::string out;
    out += "\n" + theme::color::BROWN + theme::color::BOLD
         + fmt::format("  Schedule {}", index + 1) + theme::color::RESET
         + theme::color::DIM
         + fmt::format("   score {:.2f}  credits {}  idle {}m",
                       schedule.score, schedule.total_credits, schedule.idle_minutes)
         + theme::color::RESET + "\n";
    out += theme::color::DIM + line(header) + theme::color::RESET;
    for (const auto& r : rows) out += line(r);
    return out;
}

static std::string join(const std::vector<std::string>& items, const std::string& sep = ", ") {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

std::string format_summary(const ScheduleResponse& response) {
    std::string out = theme::section("Summary");
    out += theme::kv("Term", term_label(response.term_id));

    if (!response.constraints.matched.empty()) {
        out += theme::kv("Matched", response.constraints.matched.front());
        for (size_t i = 1; i < response.constraints.matched.size(); ++i) {
            out += theme::kv("", response.constraints.matched[i]);
        }
    }

    std::vector<std::string> slots;
    for (size_t i = 0; i < response.slots.size(); ++i) {
        std::string s = response.slots[i].label();
        if (i < response.pool_sizes.size()) s += fmt::format(" ({})", response.pool_sizes[i]);
        slots.push_back(s);
    }
    if (!slots.empty()) out += theme::kv("Slots", join(slots));
    if (!response.constraints.credits.empty()) {
        out += theme::kv("Credits", response.constraints.credits.describe());
    }
    if (!response.constraints.keywords.empty()) {
        out += theme::kv("Topics", join(response.constraints.keywords));
    }
    out += theme::kv("Ranking", ranking_preference_name(response.constraints.preference));
    out += theme::kv("Searched", fmt::format("{} nodes, {} complete",
                                             response.nodes_visited, response.complete_found));

    for (const auto& p : response.unavailable) {
        out += theme::fail(p.id.to_string() + ": " + p.error);
    }
    for (const auto& id : response.stale) {
        out += theme::info("Served stale data for " + id.to_string());
    }
    if (response.partial_search) {
        out += theme::info("Search budget ran out; results may not be the best possible.");
    }
    if (response.cancelled) {
        out += theme::info("Search cancelled.");
    }

    out += theme::kv("Reason", reason_code_name(response.reason));
    return out;
}

void print_schedule_response(const ScheduleResponse& response) {
    for (size_t i = 0; i < response.schedules.size(); ++i) {
        std::cout << format_schedule(response.schedules[i], i);
    }

    switch (response.reason) {
        case ReasonCode::NoConstraintsRecognized:
            std::cout << "\n" << theme::fail("No courses, departments or gen-eds recognized.");
            std::cout << theme::step("Try e.g. 'plan CMSC330 and a history class, no fridays'.");
            break;
        case ReasonCode::PartitionUnavailable:
            std::cout << "\n" << theme::fail("Some catalog data could not be loaded.");
            break;
        case ReasonCode::Unsatisfiable:
            std::cout << "\n" << theme::fail("No conflict-free schedule satisfies the request.");
            break;
        case ReasonCode::Ok:
            break;
    }

    std::cout << format_summary(response) << "\n";
}
