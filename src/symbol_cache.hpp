#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <filesystem>
#include <memory>

namespace dumpscope {

// Marker file proving a cache directory was created by this tool.
inline constexpr const char* cache_marker_name = ".dumpscope-cache";

// Create the cache directory if needed and mark it as ours when it is new
// or empty. A non-empty directory without a marker is left unmarked.
// Returns true if the directory ends up tool-owned. Throws
// std::filesystem::filesystem_error if the directory cannot be created.
bool prepare_symbol_cache(const symbol_cache_config& cfg,
                          const std::shared_ptr<spdlog::logger>& log);

// The directory carries our marker as a regular file.
bool is_tool_owned_cache(const std::filesystem::path& dir);

// Remove everything in a tool-owned cache directory except the marker.
// Returns the number of top-level entries removed. Throws
// cache_config_error, touching nothing, if the path is empty, a filesystem
// root, the home directory, not a directory, or lacks the marker.
std::size_t clear_symbol_cache(const symbol_cache_config& cfg,
                               const std::shared_ptr<spdlog::logger>& log);

} // namespace dumpscope
