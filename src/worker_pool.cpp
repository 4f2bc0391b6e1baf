#include "worker_pool.hpp"
#include <algorithm>
#include <chrono>

namespace dumpscope {

worker_pool::worker_pool(const config& cfg, std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log)),
      m_thread_count(cfg.analysis_threads > 0 ? cfg.analysis_threads : 2)
{
    if (m_thread_count < 2) m_thread_count = 2;
}

worker_pool::~worker_pool() {
    stop();
}

void worker_pool::start() {
    if (m_running.exchange(true)) return; // already started

    m_threads.reserve(m_thread_count);
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_threads.emplace_back(&worker_pool::worker_loop, this, i);
    }
    m_log->debug("Worker pool started with {} threads", m_thread_count);
}

void worker_pool::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    {
        std::lock_guard<std::mutex> lock(m_active_mutex);
        for (auto& task : m_active) task->cancel();
    }

    // Enqueue poison pills (null tasks), one per thread
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_queue.enqueue(nullptr);
    }

    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();

    // Tasks still queued never started; resolve them as cancelled so their
    // final snapshot goes out.
    std::shared_ptr<analysis_task> task;
    while (m_queue.try_dequeue(task)) {
        if (!task) continue;
        task->cancel();
        task->run();
        record(task->outcome());
        m_in_flight.fetch_sub(1, std::memory_order_release);
    }
    m_log->debug("Worker pool stopped");
}

void worker_pool::enqueue(std::shared_ptr<analysis_task> task) {
    m_in_flight.fetch_add(1, std::memory_order_acq_rel);
    m_queue.enqueue(std::move(task));
}

std::size_t worker_pool::queue_depth() const {
    return m_queue.size_approx();
}

worker_pool::stats worker_pool::get_stats() const {
    return {
        m_started.load(std::memory_order_relaxed),
        m_succeeded.load(std::memory_order_relaxed),
        m_failed.load(std::memory_order_relaxed),
        m_cancelled.load(std::memory_order_relaxed),
        m_queue.size_approx(),
        in_flight()
    };
}

void worker_pool::record(const analysis_outcome& outcome) {
    if (outcome.is_succeeded())      m_succeeded.fetch_add(1, std::memory_order_relaxed);
    else if (outcome.is_failed())    m_failed.fetch_add(1, std::memory_order_relaxed);
    else if (outcome.is_cancelled()) m_cancelled.fetch_add(1, std::memory_order_relaxed);
}

void worker_pool::worker_loop(unsigned int worker_id) {
    m_log->debug("Worker {} started", worker_id);

    std::shared_ptr<analysis_task> task;
    while (m_running.load(std::memory_order_relaxed)) {
        // Block with timeout to allow checking m_running for graceful shutdown
        bool got = m_queue.wait_dequeue_timed(task, std::chrono::milliseconds(100));

        if (!got) continue;

        // Null task = poison pill
        if (!task) break;

        {
            std::lock_guard<std::mutex> lock(m_active_mutex);
            m_active.push_back(task);
        }
        // stop() may have cancelled the active set before this task joined it
        if (!m_running.load(std::memory_order_relaxed)) task->cancel();

        m_started.fetch_add(1, std::memory_order_relaxed);
        m_log->debug("Worker {} running analysis {}", worker_id, task->generation());
        task->run();
        record(task->outcome());

        {
            std::lock_guard<std::mutex> lock(m_active_mutex);
            m_active.erase(std::remove(m_active.begin(), m_active.end(), task), m_active.end());
        }
        m_in_flight.fetch_sub(1, std::memory_order_release);
        task.reset();
    }

    m_log->debug("Worker {} stopped", worker_id);
}

} // namespace dumpscope
