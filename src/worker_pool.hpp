#pragma once

#include "analysis_task.hpp"
#include "config.hpp"
#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace dumpscope {

// Background threads running analysis tasks. Each task occupies one thread
// until its analyzer returns; with two or more threads a restarted task
// does not wait behind a cancelled one that is still winding down.
class worker_pool {
public:
    struct stats {
        uint64_t started = 0;
        uint64_t succeeded = 0;
        uint64_t failed = 0;
        uint64_t cancelled = 0;
        std::size_t queue_depth = 0;
        std::size_t in_flight = 0;
    };

    worker_pool(const config& cfg, std::shared_ptr<spdlog::logger> log);
    ~worker_pool();

    // Spawn N worker threads. Must be called once.
    void start();

    // Cancel running and queued tasks, then join threads. Blocks until every
    // running analyzer has returned.
    void stop();

    // Hand a task to the pool. Never blocks.
    void enqueue(std::shared_ptr<analysis_task> task);

    // Approximate queue depth.
    std::size_t queue_depth() const;

    // Tasks enqueued whose run() has not returned yet, cancelled ones
    // still winding down included.
    std::size_t in_flight() const { return m_in_flight.load(std::memory_order_acquire); }

    // Atomically read aggregate stats from all workers.
    stats get_stats() const;

private:
    void worker_loop(unsigned int worker_id);
    void record(const analysis_outcome& outcome);

    std::shared_ptr<spdlog::logger> m_log;

    unsigned int m_thread_count;
    std::atomic<bool> m_running{false};

    // nullptr is the poison pill
    moodycamel::BlockingConcurrentQueue<std::shared_ptr<analysis_task>> m_queue;
    std::vector<std::thread> m_threads;

    std::mutex m_active_mutex;
    std::vector<std::shared_ptr<analysis_task>> m_active;
    std::atomic<std::size_t> m_in_flight{0};

    // Aggregate stats (relaxed atomics)
    std::atomic<uint64_t> m_started{0};
    std::atomic<uint64_t> m_succeeded{0};
    std::atomic<uint64_t> m_failed{0};
    std::atomic<uint64_t> m_cancelled{0};
};

} // namespace dumpscope
