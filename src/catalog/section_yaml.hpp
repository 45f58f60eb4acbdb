#pragma once

#include <vector>
#include <yaml-cpp/yaml.h>
#include "course_section.hpp"

// YAML codec shared by the persisted cache and the directory fetcher.
// Keys: code, section, title, description, credits, instructor,
// instructor_rating, course_gpa, open_seats, total_seats, location,
// days, time, gen_eds, term_id.

void emit_section(YAML::Emitter& out, const CourseSection& s);
void emit_sections(YAML::Emitter& out, const std::vector<CourseSection>& sections);

// Throws YAML::Exception on a malformed node.
CourseSection parse_section(const YAML::Node& node, const std::string& fallback_term = "");
std::vector<CourseSection> parse_sections(const YAML::Node& seq, const std::string& fallback_term = "");
