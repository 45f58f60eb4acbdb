#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cstdint>
#include <fmt/format.h>
#include <core/time_utils.hpp>
#include <core/utils.hpp>

static void do_cache(BaseCLI& cli, const std::string& arg) {
    if (!cli.cache) {
        cli.require_config();
        return;
    }

    auto entries = cli.cache->entries();
    auto stats = cli.cache->stats();

    std::cout << theme::section("Cache");
    std::cout << theme::kv("TTL", format_age(cli.cache->ttl().count()));
    std::cout << theme::kv("Lookups", fmt::format("{} hit, {} miss", stats.hits, stats.misses));
    std::cout << theme::kv("Fetches", fmt::format("{} ok, {} failed, {} stale served",
                                                  stats.fetches - stats.fetch_failures,
                                                  stats.fetch_failures, stats.stale_serves));

    if (entries.empty()) {
        std::cout << "\n" << theme::dim("  No cached partitions.") << "\n\n";
        return;
    }

    std::sort(entries.begin(), entries.end(),
              [](const CacheEntryInfo& a, const CacheEntryInfo& b) { return a.id < b.id; });

    size_t w0 = 9;
    for (const auto& e : entries) w0 = std::max(w0, e.id.to_string().size());

    auto now = std::chrono::system_clock::now();
    std::cout << "\n" << theme::color::DIM
              << fmt::format("  {:<{}} {:<10} {:<10} {}\n", "PARTITION", w0 + 2, "SECTIONS", "AGE", "STATUS")
              << theme::color::RESET;

    for (const auto& e : entries) {
        std::string age = "-";
        if (e.section_count > 0 || !e.fetching) {
            auto secs = std::chrono::duration_cast<std::chrono::seconds>(now - e.fetched_at).count();
            age = format_age(std::max<int64_t>(secs, 0));
        }

        std::string status;
        if (e.fetching) {
            status = theme::yellow("FETCHING");
        } else if (e.stale) {
            status = theme::red("STALE");
        } else {
            status = theme::green("FRESH");
        }

        std::cout << fmt::format("  {:<{}} {:<10} {:<10} ", e.id.to_string(), w0 + 2,
                                 e.section_count, age)
                  << status << "\n";
    }
    std::cout << "\n";
}

static void do_refresh(BaseCLI& cli, const std::string& arg) {
    if (!cli.service) {
        cli.require_config();
        return;
    }

    std::istringstream iss(arg);
    std::string kind_str, key;
    iss >> kind_str >> key;

    auto kind = parse_partition_kind(kind_str);
    if (!kind || key.empty()) {
        std::cout << theme::fail("Usage: refresh <dept|gened> <KEY>");
        return;
    }

    PartitionId id;
    id.kind = *kind;
    id.key = to_upper(key);
    id.term_id = cli.term;

    auto result = cli.service->refresh(id);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    const auto& resolved = result.value;
    if (resolved.from_cache) {
        std::cout << theme::info(fmt::format("Fetch failed; kept previous copy of {} ({} sections)",
                                             id.to_string(), resolved.partition->sections.size()));
    } else {
        std::cout << theme::ok(fmt::format("Refreshed {} ({} sections)",
                                           id.to_string(), resolved.partition->sections.size()));
    }
}

void register_cache_commands(BaseCLI& cli) {
    cli.add_command("cache", do_cache, "Show cached partitions and hit counts");
    cli.add_command("refresh", do_refresh, "Re-fetch one partition: refresh <dept|gened> <KEY>");
}
