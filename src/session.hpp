#pragma once

#include "analysis.hpp"
#include "analysis_task.hpp"
#include "config.hpp"
#include "result_snapshot.hpp"
#include "snapshot_store.hpp"
#include "span_log_tree.hpp"
#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

namespace dumpscope {

enum class session_state {
    idle,
    analyzing,
    done,
    failed,
    cancelled
};

const char* state_name(session_state s);

// Lifecycle of one open dump. All methods are called from the single
// control (presentation) thread and never wait on analysis work.
class session {
public:
    session(const config& cfg,
            std::shared_ptr<analyzer> engine,
            resolver_factory make_resolver,
            std::shared_ptr<spdlog::logger> log);
    ~session();

    session(const session&) = delete;
    session& operator=(const session&) = delete;

    // Validate that dump_path is a readable file and start analyzing it.
    // Throws dump_open_error, leaving the session untouched, otherwise.
    void open(const std::filesystem::path& dump_path, const symbol_config& symbols);

    // Cancel any running analysis and start over on the open dump with a
    // fresh log tree. Throws dump_open_error if no dump is open.
    void restart(const symbol_config& symbols);
    void restart();

    // Request cancellation of the running analysis, if any.
    void cancel();

    // Presentation-side filter; never affects the running analysis.
    void set_filter(filter_query query) { m_filter = std::move(query); }
    const filter_query& filter() const { return m_filter; }

    // Clear the configured symbol cache. Throws cache_config_error while any
    // analysis task, current or cancelled, has not returned, or if the
    // directory is not tool-owned.
    std::size_t clear_symbol_cache();

    // Latest snapshot. Non-blocking; never null.
    std::shared_ptr<const result_snapshot> current() const { return m_store->current(); }

    session_state state() const;
    uint64_t generation() const { return m_generation; }
    const std::optional<std::filesystem::path>& dump_path() const { return m_dump_path; }
    const symbol_config& symbols() const { return m_symbols; }
    worker_pool::stats pool_stats() const { return m_pool.get_stats(); }

private:
    void start_task();

    config m_cfg;
    std::shared_ptr<analyzer> m_engine;
    resolver_factory m_make_resolver;
    std::shared_ptr<spdlog::logger> m_log;

    std::shared_ptr<snapshot_store> m_store;
    worker_pool m_pool;

    std::optional<std::filesystem::path> m_dump_path;
    symbol_config m_symbols;
    filter_query m_filter;

    uint64_t m_generation = 0;
    std::shared_ptr<analysis_task> m_task;
};

// Session state implied by a snapshot.
session_state state_of(const result_snapshot& snap);

} // namespace dumpscope
