#pragma once

#include "result_snapshot.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace dumpscope {

// The one slot shared between a session's analysis tasks and its readers.
// Uses RCU-style snapshot swapping: readers get a lock-free
// shared_ptr<const result_snapshot>, writers serialize via mutex and
// atomically publish new snapshots.
class snapshot_store {
public:
    explicit snapshot_store(std::shared_ptr<spdlog::logger> log);

    // Start a new generation and publish its initial running{0} snapshot
    // with an empty log tree. Snapshots of older generations are rejected
    // from now on.
    void reset(uint64_t generation);

    // Replace the current snapshot. Returns false (and keeps the current
    // one) if the snapshot belongs to another generation, is not newer than
    // the current one, or the current one is already terminal.
    bool publish(std::shared_ptr<const result_snapshot> snap);

    // Latest published snapshot. Never null, never blocks on writers.
    std::shared_ptr<const result_snapshot> current() const;

    uint64_t generation() const;

private:
    std::shared_ptr<spdlog::logger> m_log;

    // Serializes publish/reset; readers never take it.
    std::mutex m_write_mutex;

    // Current snapshot: atomic load/store for lock-free reader access.
    std::shared_ptr<const result_snapshot> m_snapshot;

    std::atomic<uint64_t> m_generation{0};
};

} // namespace dumpscope
