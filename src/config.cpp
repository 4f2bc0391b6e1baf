#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace dumpscope {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s) {
    if (s == "trace")                   return spdlog::level::trace;
    if (s == "debug")                   return spdlog::level::debug;
    if (s == "info")                    return spdlog::level::info;
    if (s == "warn" || s == "warning")  return spdlog::level::warn;
    if (s == "error" || s == "err")     return spdlog::level::err;
    if (s == "critical")                return spdlog::level::critical;
    if (s == "off")                     return spdlog::level::off;
    return std::nullopt;
}

config default_config() {
    config cfg;
    cfg.symbols.symbol_urls = {"https://symbols.mozilla.org/"};
    cfg.symbols.cache.directory = std::filesystem::temp_directory_path() / "dumpscope-cache";
    cfg.symbols.cache.enabled = true;
    return cfg;
}

static std::vector<std::string> load_string_list(const YAML::Node& node, const char* key) {
    if (!node.IsSequence()) {
        throw std::runtime_error(std::string("config: '") + key + "' must be a list");
    }
    std::vector<std::string> out;
    for (const auto& item : node) {
        auto s = item.as<std::string>();
        if (!s.empty()) out.push_back(std::move(s));
    }
    return out;
}

config load_config(const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    config cfg = default_config();

    // Symbols
    if (auto n = root["symbol_paths"]) cfg.symbols.symbol_paths = load_string_list(n, "symbol_paths");
    if (auto n = root["symbol_urls"])  cfg.symbols.symbol_urls  = load_string_list(n, "symbol_urls");

    if (auto n = root["symbol_cache_dir"]) {
        auto dir = n.as<std::string>();
        if (dir.empty()) throw std::runtime_error("config: 'symbol_cache_dir' must not be empty");
        cfg.symbols.cache.directory = dir;
    }
    if (auto n = root["symbol_cache_enabled"]) cfg.symbols.cache.enabled = n.as<bool>();
    if (auto n = root["http_timeout_secs"])    cfg.symbols.http_timeout_secs = n.as<uint64_t>();

    // Snapshot cadence
    if (auto n = root["publish_interval_ms"]) {
        cfg.publish_interval = std::chrono::milliseconds(n.as<uint32_t>());
    }
    if (auto n = root["publish_event_batch"]) {
        cfg.publish_event_batch = n.as<std::size_t>();
        if (cfg.publish_event_batch == 0) {
            throw std::runtime_error("config: 'publish_event_batch' must be greater than zero");
        }
    }

    // Operational
    if (auto n = root["analysis_threads"])   cfg.analysis_threads = n.as<unsigned int>();
    if (auto n = root["render_interval_ms"]) {
        cfg.render_interval = std::chrono::milliseconds(n.as<uint32_t>());
        if (cfg.render_interval.count() == 0) {
            throw std::runtime_error("config: 'render_interval_ms' must be greater than zero");
        }
    }
    if (auto n = root["log_level"]) {
        cfg.log_level = n.as<std::string>();
        if (!parse_log_level(cfg.log_level)) {
            throw std::runtime_error("config: invalid 'log_level': " + cfg.log_level);
        }
    }

    return cfg;
}

} // namespace dumpscope
