#include "symbol_cache.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace dumpscope {

namespace fs = std::filesystem;

namespace {

bool same_path(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    bool eq = fs::equivalent(a, b, ec);
    return !ec && eq;
}

void check_clearable(const fs::path& dir) {
    if (dir.empty()) {
        throw cache_config_error("symbol cache path is empty");
    }

    std::error_code ec;
    auto canonical = fs::weakly_canonical(dir, ec);
    if (ec) canonical = dir;

    if (canonical == canonical.root_path()) {
        throw cache_config_error("refusing to clear filesystem root '" + dir.string() + "'");
    }

    if (const char* home = std::getenv("HOME"); home && *home && same_path(canonical, home)) {
        throw cache_config_error("refusing to clear home directory '" + dir.string() + "'");
    }

    auto st = fs::symlink_status(dir, ec);
    if (ec || !fs::exists(st)) {
        throw cache_config_error("symbol cache '" + dir.string() + "' does not exist");
    }
    if (fs::is_symlink(st) || !fs::is_directory(st)) {
        throw cache_config_error("symbol cache '" + dir.string() + "' is not a directory");
    }

    if (!is_tool_owned_cache(dir)) {
        throw cache_config_error("'" + dir.string() +
                                 "' was not created by dumpscope (no " +
                                 cache_marker_name + " marker); refusing to clear it");
    }
}

} // anonymous namespace

bool is_tool_owned_cache(const fs::path& dir) {
    std::error_code ec;
    return fs::is_regular_file(fs::symlink_status(dir / cache_marker_name, ec));
}

bool prepare_symbol_cache(const symbol_cache_config& cfg,
                          const std::shared_ptr<spdlog::logger>& log) {
    if (!cfg.enabled || cfg.directory.empty()) return false;

    fs::create_directories(cfg.directory);

    if (is_tool_owned_cache(cfg.directory)) return true;

    if (!fs::is_empty(cfg.directory)) {
        log->warn("symbol cache '{}' is not empty and has no marker; it will not be clearable",
                  cfg.directory.string());
        return false;
    }

    std::ofstream marker(cfg.directory / cache_marker_name);
    marker << "dumpscope symbol cache\n";
    if (!marker) {
        log->warn("failed to write cache marker in '{}'", cfg.directory.string());
        return false;
    }
    log->debug("marked '{}' as symbol cache", cfg.directory.string());
    return true;
}

std::size_t clear_symbol_cache(const symbol_cache_config& cfg,
                               const std::shared_ptr<spdlog::logger>& log) {
    check_clearable(cfg.directory);

    std::size_t removed = 0;
    for (const auto& entry : fs::directory_iterator(cfg.directory)) {
        if (entry.path().filename() == cache_marker_name) continue;
        fs::remove_all(entry.path());
        ++removed;
    }

    log->info("cleared symbol cache '{}' ({} entries)", cfg.directory.string(), removed);
    return removed;
}

} // namespace dumpscope
