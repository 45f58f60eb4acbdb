#include "partition.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

std::string PartitionId::to_string() const {
    return fmt::format("{}:{}@{}", partition_kind_name(kind), key, term_id);
}

std::string PartitionId::file_name() const {
    return sanitize_key(fmt::format("{}_{}_{}", partition_kind_name(kind), key, term_id))
           + CACHE_FILE_EXT;
}

const char* partition_kind_name(PartitionKind kind) {
    return kind == PartitionKind::Department ? "dept" : "gened";
}

std::optional<PartitionKind> parse_partition_kind(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "dept" || n == "department") return PartitionKind::Department;
    if (n == "gened" || n == "gen-ed") return PartitionKind::GenEd;
    return std::nullopt;
}

const std::map<std::string, std::string>& gen_ed_codes() {
    static const std::map<std::string, std::string> codes = {
        {"FSAW", "Academic Writing"},
        {"FSAR", "Analytic Reasoning"},
        {"FSMA", "Math"},
        {"FSOC", "Oral Communications"},
        {"FSPW", "Professional Writing"},
        {"DSHS", "History and Social Sciences"},
        {"DSHU", "Humanities"},
        {"DSNS", "Natural Sciences"},
        {"DSNL", "Natural Science Lab"},
        {"DSSP", "Scholarship in Practice"},
        {"DVCC", "Cultural Competency"},
        {"DVUP", "Understanding Plural Societies"},
        {"SCIS", "Signature Courses - Big Question"},
    };
    return codes;
}

bool is_gen_ed_code(const std::string& code) {
    return gen_ed_codes().count(code) > 0;
}
