#pragma once

#include "analysis.hpp"
#include "config.hpp"
#include "result_snapshot.hpp"
#include "snapshot_store.hpp"
#include "span_log_tree.hpp"
#include "span_scope.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>

namespace dumpscope {

// One analysis pass over one dump. Constructed on the control thread,
// run() on a worker thread. Captures everything the analyzer logs into its
// own span_log_tree and publishes snapshots of its progress into the
// session's snapshot_store under its generation.
class analysis_task {
public:
    analysis_task(uint64_t generation,
                  std::filesystem::path dump_path,
                  symbol_config symbols,
                  std::shared_ptr<analyzer> engine,
                  resolver_factory make_resolver,
                  std::shared_ptr<snapshot_store> store,
                  const config& cfg,
                  std::shared_ptr<spdlog::logger> log);

    analysis_task(const analysis_task&) = delete;
    analysis_task& operator=(const analysis_task&) = delete;

    // Run to a terminal outcome. Never throws. Must be called once.
    void run();

    // Cooperative: the outcome becomes cancelled once the analyzer returns.
    void cancel();
    bool cancel_requested() const { return m_cancel.load(std::memory_order_relaxed); }

    uint64_t generation() const { return m_generation; }

    // Latest outcome of this task, independent of what the store shows.
    analysis_outcome outcome() const;

    // Live tree; exposed for inspection, readers should prefer snapshots.
    span_log_tree& logs() { return m_tree; }

private:
    class context;

    void on_event(log_event ev);
    void set_phase(analysis_phase phase);
    void set_partial(const process_state& partial);
    void finish(analysis_outcome outcome);

    // Caller holds m_state_mutex.
    void publish_locked();
    analysis_outcome running_outcome() const;

    const uint64_t m_generation;
    const std::filesystem::path m_dump_path;
    const symbol_config m_symbols;
    std::shared_ptr<analyzer> m_engine;
    resolver_factory m_make_resolver;
    std::shared_ptr<snapshot_store> m_store;
    std::shared_ptr<spdlog::logger> m_log;

    const std::chrono::milliseconds m_publish_interval;
    const std::size_t m_publish_event_batch;

    std::atomic<bool> m_cancel{false};
    span_log_tree m_tree;

    std::chrono::steady_clock::time_point m_started;

    // Publication state, shared by the analyzer thread(s) logging through
    // the capture sink and by run().
    mutable std::mutex m_state_mutex;
    analysis_outcome m_outcome;
    analysis_phase m_phase = analysis_phase::reading_dump;
    std::shared_ptr<const process_state> m_result;
    uint64_t m_sequence = 0;
    std::size_t m_pending_events = 0;
    bool m_final_published = false;
    std::chrono::steady_clock::time_point m_last_publish;
};

} // namespace dumpscope
