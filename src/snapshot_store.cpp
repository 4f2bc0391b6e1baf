#include "snapshot_store.hpp"

namespace dumpscope {

static std::shared_ptr<const result_snapshot> initial_snapshot(uint64_t generation) {
    auto snap = std::make_shared<result_snapshot>();
    snap->generation = generation;
    snap->logs = std::make_shared<const span_node>(std::string{});
    return snap;
}

snapshot_store::snapshot_store(std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log)),
      m_snapshot(initial_snapshot(0))
{}

void snapshot_store::reset(uint64_t generation) {
    std::lock_guard<std::mutex> lock(m_write_mutex);
    m_generation.store(generation, std::memory_order_relaxed);
    std::atomic_store(&m_snapshot, initial_snapshot(generation));
    m_log->debug("snapshot store reset to generation {}", generation);
}

bool snapshot_store::publish(std::shared_ptr<const result_snapshot> snap) {
    if (!snap) return false;

    std::lock_guard<std::mutex> lock(m_write_mutex);

    if (snap->generation != m_generation.load(std::memory_order_relaxed)) {
        m_log->debug("dropping snapshot of stale generation {} (current {})",
                     snap->generation, m_generation.load(std::memory_order_relaxed));
        return false;
    }

    auto cur = std::atomic_load(&m_snapshot);
    if (cur->outcome.terminal()) {
        m_log->debug("dropping snapshot {} published after terminal outcome '{}'",
                     snap->sequence, cur->outcome.name());
        return false;
    }
    if (snap->sequence <= cur->sequence) {
        m_log->debug("dropping out-of-order snapshot {} (current {})",
                     snap->sequence, cur->sequence);
        return false;
    }

    std::atomic_store(&m_snapshot, std::move(snap));
    return true;
}

std::shared_ptr<const result_snapshot> snapshot_store::current() const {
    return std::atomic_load(&m_snapshot);
}

uint64_t snapshot_store::generation() const {
    return m_generation.load(std::memory_order_relaxed);
}

} // namespace dumpscope
