#include "span_scope.hpp"

namespace dumpscope {

namespace {

thread_local std::vector<std::string> t_span_stack;

} // anonymous namespace

span_guard::span_guard(std::string label) {
    t_span_stack.push_back(std::move(label));
}

span_guard::~span_guard() {
    t_span_stack.pop_back();
}

std::vector<std::string> current_span_path() {
    return t_span_stack;
}

capture_sink::capture_sink(target_fn target)
    : m_target(std::move(target))
{}

void capture_sink::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    m_target = nullptr;
}

bool capture_sink::attached() {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(m_target);
}

// Called with mutex_ held by base_sink::log().
void capture_sink::sink_it_(const spdlog::details::log_msg& msg) {
    if (!m_target) {
        m_dropped.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    log_event ev;
    ev.level = msg.level;
    ev.message.assign(msg.payload.begin(), msg.payload.end());
    ev.time = msg.time;
    ev.span_path = current_span_path();
    m_target(std::move(ev));
}

std::shared_ptr<spdlog::logger> make_capture_logger(const std::string& name,
                                                    std::shared_ptr<capture_sink> sink) {
    auto log = std::make_shared<spdlog::logger>(name, std::move(sink));
    log->set_level(spdlog::level::trace);
    return log;
}

} // namespace dumpscope
