#pragma once

#include <spdlog/common.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dumpscope {

// Where fetched symbol files are cached between runs.
struct symbol_cache_config {
    std::filesystem::path directory;
    bool enabled = true;
};

// Everything a resolver needs to look symbols up for one analysis run.
struct symbol_config {
    std::vector<std::string> symbol_paths;
    std::vector<std::string> symbol_urls;
    symbol_cache_config cache;
    uint64_t http_timeout_secs = 1000;
};

struct config {
    symbol_config symbols;

    // Snapshot cadence: publish after this many captured events or after
    // this interval, whichever comes first.
    std::chrono::milliseconds publish_interval{100};
    std::size_t publish_event_batch = 256;

    // Worker threads running analysis tasks (0 = 2). At least two, so a
    // cancelled task that is slow to return never delays a restart.
    unsigned int analysis_threads = 0;

    // Presentation tick
    std::chrono::milliseconds render_interval{100};

    std::string log_level = "info";
};

// Defaults used when no config file is given.
config default_config();

// Parse config from YAML file. Throws on error.
config load_config(const std::string& path);

// Parse an spdlog level name. Returns nullopt if invalid.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s);

} // namespace dumpscope
