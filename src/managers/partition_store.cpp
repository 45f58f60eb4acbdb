#include "partition_store.hpp"
#include <catalog/section_yaml.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <thread>
#include <functional>

PartitionStore::PartitionStore(fs::path dir) : dir_(std::move(dir)) {}

fs::path PartitionStore::path_for(const PartitionId& id) const {
    return dir_ / id.file_name();
}

Result<void> PartitionStore::save(const CachePartition& partition) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "kind" << YAML::Value << partition_kind_name(partition.id.kind);
    out << YAML::Key << "key" << YAML::Value << partition.id.key;
    out << YAML::Key << "term_id" << YAML::Value << YAML::DoubleQuoted << partition.id.term_id;
    out << YAML::Key << "fetched_at" << YAML::Value << format_iso_utc(partition.fetched_at);
    out << YAML::Key << "sections" << YAML::Value;
    emit_sections(out, partition.sections);
    out << YAML::EndMap;

    if (!out.good()) {
        return Result<void>::Err("YAML emit failed: " + out.GetLastError());
    }

    try {
        fs::create_directories(dir_);

        // Write beside the target and rename so readers never see a torn file
        fs::path target = path_for(partition.id);
        fs::path tmp = target;
        tmp += fmt::format(".tmp.{}", std::hash<std::thread::id>{}(std::this_thread::get_id()));
        {
            std::ofstream fout(tmp);
            if (!fout) {
                return Result<void>::Err("Cannot write " + tmp.string());
            }
            fout << out.c_str() << "\n";
        }
        fs::rename(tmp, target);
    } catch (const fs::filesystem_error& e) {
        return Result<void>::Err(e.what());
    }
    return Result<void>::Ok();
}

std::optional<CachePartition> PartitionStore::load(const PartitionId& id) const {
    fs::path path = path_for(id);
    if (!fs::exists(path)) return std::nullopt;

    auto p = load_path(path);
    if (p && p->id != id) {
        termplan_log(fmt::format("partition store: {} holds {}, ignoring",
                                 path.string(), p->id.to_string()));
        return std::nullopt;
    }
    return p;
}

std::vector<CachePartition> PartitionStore::load_all() const {
    std::vector<CachePartition> out;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return out;

    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension() != CACHE_FILE_EXT) continue;
        if (auto p = load_path(entry.path())) {
            out.push_back(std::move(*p));
        }
    }
    return out;
}

std::optional<CachePartition> PartitionStore::load_path(const fs::path& path) const {
    try {
        YAML::Node root = YAML::LoadFile(path.string());

        auto kind = parse_partition_kind(root["kind"].as<std::string>(""));
        auto fetched_at = parse_iso_utc(root["fetched_at"].as<std::string>(""));
        if (!kind || !fetched_at) {
            termplan_log("partition store: bad header in " + path.string());
            return std::nullopt;
        }

        CachePartition p;
        p.id.kind = *kind;
        p.id.key = root["key"].as<std::string>("");
        p.id.term_id = root["term_id"].as<std::string>("");
        p.fetched_at = *fetched_at;
        if (p.id.key.empty() || p.id.term_id.empty()) {
            termplan_log("partition store: missing key/term in " + path.string());
            return std::nullopt;
        }
        p.sections = parse_sections(root["sections"], p.id.term_id);
        return p;
    } catch (const YAML::Exception& e) {
        // Corrupted cache file, treat as absent
        termplan_log(fmt::format("partition store: cannot read {}: {}", path.string(), e.what()));
        return std::nullopt;
    }
}
