#pragma once

#include "span_log_tree.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dumpscope {

// Marks a unit of analysis work on the calling thread. Every record logged
// while the guard is alive carries its label in the span path. Guards nest.
class span_guard {
public:
    explicit span_guard(std::string label);
    ~span_guard();

    span_guard(const span_guard&) = delete;
    span_guard& operator=(const span_guard&) = delete;
};

// Labels of the guards alive on the calling thread, outermost first.
std::vector<std::string> current_span_path();

// spdlog sink that turns each record into a log_event tagged with the
// emitting thread's span path and hands it to a target, typically a task's
// span_log_tree. Owned by one analysis task; never installed globally.
class capture_sink : public spdlog::sinks::base_sink<std::mutex> {
public:
    using target_fn = std::function<void(log_event)>;

    explicit capture_sink(target_fn target);

    // Stop forwarding. Waits for a record being forwarded right now;
    // anything logged afterwards is dropped.
    void detach();
    bool attached();

    std::size_t dropped() const { return m_dropped.load(std::memory_order_relaxed); }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override {}

private:
    target_fn m_target;
    std::atomic<std::size_t> m_dropped{0};
};

// Synchronous logger at trace level whose only sink is the capture sink.
// Not registered with spdlog, so the default logger is never affected.
std::shared_ptr<spdlog::logger> make_capture_logger(const std::string& name,
                                                    std::shared_ptr<capture_sink> sink);

} // namespace dumpscope
