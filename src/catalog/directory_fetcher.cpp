#include "fetcher.hpp"
#include "section_yaml.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

DirectoryCatalogFetcher::DirectoryCatalogFetcher(fs::path root) : root_(std::move(root)) {}

fs::path DirectoryCatalogFetcher::path_for(const PartitionId& id) const {
    return root_ / sanitize_key(id.term_id) / partition_kind_name(id.kind)
           / (sanitize_key(id.key) + ".yaml");
}

Result<std::vector<CourseSection>> DirectoryCatalogFetcher::fetch(const PartitionId& id) {
    using R = Result<std::vector<CourseSection>>;

    if (id.kind == PartitionKind::GenEd && !is_gen_ed_code(id.key)) {
        return R::Err(fmt::format("Unknown gen-ed code '{}'", id.key));
    }

    fs::path path = path_for(id);
    if (!fs::exists(path)) {
        return R::Err(fmt::format("No catalog data for {} ({})", id.to_string(), path.string()));
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        // Accept either a bare list or a {sections: [...]} mapping
        YAML::Node seq = root.IsMap() ? root["sections"] : root;
        auto sections = parse_sections(seq, id.term_id);
        termplan_log(fmt::format("catalog: read {} sections for {} from {}",
                                 sections.size(), id.to_string(), path.string()));
        return R::Ok(std::move(sections));
    } catch (const YAML::Exception& e) {
        return R::Err(fmt::format("Malformed catalog file {}: {}", path.string(), e.what()));
    }
}
