#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <core/utils.hpp>
#include "course_section.hpp"

enum class PartitionKind { Department, GenEd };

// Unit of fetch/cache granularity: all sections for one department or one
// gen-ed code in one term.
struct PartitionId {
    PartitionKind kind = PartitionKind::Department;
    std::string key;       // "CMSC", "FSOC"
    std::string term_id;   // "202608"

    // "dept:CMSC@202608"
    std::string to_string() const;

    // "dept_CMSC_202608.yaml"
    std::string file_name() const;

    bool operator==(const PartitionId& other) const {
        return kind == other.kind && key == other.key && term_id == other.term_id;
    }
    bool operator!=(const PartitionId& other) const { return !(*this == other); }
    bool operator<(const PartitionId& other) const {
        if (kind != other.kind) return kind < other.kind;
        if (key != other.key) return key < other.key;
        return term_id < other.term_id;
    }
};

const char* partition_kind_name(PartitionKind kind);
std::optional<PartitionKind> parse_partition_kind(const std::string& name);

// Snapshot of one partition. Never mutated once published; a refresh
// replaces the whole object.
struct CachePartition {
    PartitionId id;
    std::vector<CourseSection> sections;
    SystemTime fetched_at;
};

using PartitionSnapshot = std::shared_ptr<const CachePartition>;

// Gen-ed codes recognized by the catalog, with display names.
const std::map<std::string, std::string>& gen_ed_codes();
bool is_gen_ed_code(const std::string& code);
