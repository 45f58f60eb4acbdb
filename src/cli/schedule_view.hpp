#pragma once

#include <string>
#include <vector>
#include <planner/schedule_service.hpp>

// Table of one schedule's sections, padded to the widest cell per column.
std::string format_schedule(const ScheduleCandidate& schedule, size_t index);

// Matched constraints, search counts, flags and reason.
std::string format_summary(const ScheduleResponse& response);

void print_schedule_response(const ScheduleResponse& response);
