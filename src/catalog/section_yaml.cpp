#include "section_yaml.hpp"

void emit_section(YAML::Emitter& out, const CourseSection& s) {
    out << YAML::BeginMap;
    out << YAML::Key << "code" << YAML::Value << s.code;
    out << YAML::Key << "section" << YAML::Value << s.section;
    out << YAML::Key << "title" << YAML::Value << s.title;
    out << YAML::Key << "description" << YAML::Value << s.description;
    out << YAML::Key << "credits" << YAML::Value << s.credits;
    out << YAML::Key << "instructor" << YAML::Value << s.instructor;
    if (s.instructor_rating) {
        out << YAML::Key << "instructor_rating" << YAML::Value << *s.instructor_rating;
    }
    if (s.course_gpa) {
        out << YAML::Key << "course_gpa" << YAML::Value << *s.course_gpa;
    }
    out << YAML::Key << "open_seats" << YAML::Value << s.open_seats;
    out << YAML::Key << "total_seats" << YAML::Value << s.total_seats;
    out << YAML::Key << "location" << YAML::Value << s.location;
    out << YAML::Key << "days" << YAML::Value << s.days;
    out << YAML::Key << "time" << YAML::Value << s.time;
    out << YAML::Key << "gen_eds" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto& g : s.gen_eds) out << g;
    out << YAML::EndSeq;
    out << YAML::Key << "term_id" << YAML::Value << s.term_id;
    out << YAML::EndMap;
}

void emit_sections(YAML::Emitter& out, const std::vector<CourseSection>& sections) {
    out << YAML::BeginSeq;
    for (const auto& s : sections) emit_section(out, s);
    out << YAML::EndSeq;
}

CourseSection parse_section(const YAML::Node& node, const std::string& fallback_term) {
    if (!node.IsMap()) {
        throw YAML::Exception(node.Mark(), "section record must be a mapping");
    }

    CourseSection s;
    s.code = node["code"].as<std::string>("");
    s.section = node["section"].as<std::string>("");
    s.title = node["title"].as<std::string>("");
    s.description = node["description"].as<std::string>("");
    s.credits = node["credits"].as<int>(0);
    s.instructor = node["instructor"].as<std::string>("TBA");
    if (node["instructor_rating"] && !node["instructor_rating"].IsNull()) {
        s.instructor_rating = node["instructor_rating"].as<double>();
    }
    if (node["course_gpa"] && !node["course_gpa"].IsNull()) {
        s.course_gpa = node["course_gpa"].as<double>();
    }
    s.open_seats = node["open_seats"].as<int>(0);
    s.total_seats = node["total_seats"].as<int>(0);
    s.location = node["location"].as<std::string>("");
    s.days = node["days"].as<std::string>("");
    s.time = node["time"].as<std::string>("");
    if (node["gen_eds"] && node["gen_eds"].IsSequence()) {
        for (const auto& g : node["gen_eds"]) {
            s.gen_eds.insert(g.as<std::string>());
        }
    }
    s.term_id = node["term_id"].as<std::string>(fallback_term);

    if (s.code.empty()) {
        throw YAML::Exception(node.Mark(), "section record without code");
    }
    if (s.credits <= 0) {
        throw YAML::Exception(node.Mark(), "section " + s.code + " has non-positive credits");
    }
    if (s.open_seats < 0) s.open_seats = 0;
    return s;
}

std::vector<CourseSection> parse_sections(const YAML::Node& seq, const std::string& fallback_term) {
    std::vector<CourseSection> out;
    if (!seq || seq.IsNull()) return out;
    if (!seq.IsSequence()) {
        throw YAML::Exception(seq.Mark(), "sections must be a list");
    }
    for (const auto& n : seq) {
        out.push_back(parse_section(n, fallback_term));
    }
    return out;
}
