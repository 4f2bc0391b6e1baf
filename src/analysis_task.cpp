#include "analysis_task.hpp"
#include "errors.hpp"
#include "symbol_cache.hpp"
#include <filesystem>

namespace dumpscope {

// The analyzer's view of the task.
class analysis_task::context : public analysis_context {
public:
    context(analysis_task& task, std::shared_ptr<spdlog::logger> log)
        : m_task(task), m_log(std::move(log))
    {}

    const std::shared_ptr<spdlog::logger>& log() const override { return m_log; }
    bool cancelled() const override { return m_task.cancel_requested(); }
    void set_phase(analysis_phase phase) override { m_task.set_phase(phase); }
    void report_partial(const process_state& partial) override { m_task.set_partial(partial); }

private:
    analysis_task& m_task;
    std::shared_ptr<spdlog::logger> m_log;
};

analysis_task::analysis_task(uint64_t generation,
                             std::filesystem::path dump_path,
                             symbol_config symbols,
                             std::shared_ptr<analyzer> engine,
                             resolver_factory make_resolver,
                             std::shared_ptr<snapshot_store> store,
                             const config& cfg,
                             std::shared_ptr<spdlog::logger> log)
    : m_generation(generation), m_dump_path(std::move(dump_path)),
      m_symbols(std::move(symbols)), m_engine(std::move(engine)),
      m_make_resolver(std::move(make_resolver)), m_store(std::move(store)),
      m_log(std::move(log)),
      m_publish_interval(cfg.publish_interval),
      m_publish_event_batch(cfg.publish_event_batch > 0 ? cfg.publish_event_batch : 1),
      m_started(std::chrono::steady_clock::now()),
      m_outcome{analysis_outcome::running{}},
      m_last_publish(m_started)
{}

void analysis_task::cancel() {
    if (!m_cancel.exchange(true)) {
        m_log->info("cancel requested for analysis {}", m_generation);
    }
}

analysis_outcome analysis_task::outcome() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_outcome;
}

analysis_outcome analysis_task::running_outcome() const {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - m_started);
    return analysis_outcome{analysis_outcome::running{elapsed}};
}

void analysis_task::run() {
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        m_started = std::chrono::steady_clock::now();
        m_last_publish = m_started;
    }

    if (cancel_requested()) {
        m_tree.close();
        finish(analysis_outcome{analysis_outcome::cancelled{}});
        return;
    }

    // Capture boundary: everything the analyzer logs through this logger
    // lands in this task's tree and nowhere else.
    auto sink = std::make_shared<capture_sink>(
        [this](log_event ev) { on_event(std::move(ev)); });
    context ctx(*this, make_capture_logger("analysis", sink));

    analysis_outcome result{analysis_outcome::cancelled{}};
    try {
        ctx.log()->info("opening {}", m_dump_path.string());
        file_dump_source dump(m_dump_path);
        ctx.log()->debug("dump is {} bytes", dump.size());

        if (m_symbols.cache.enabled) {
            try {
                prepare_symbol_cache(m_symbols.cache, ctx.log());
            } catch (const std::filesystem::filesystem_error& e) {
                ctx.log()->warn("symbol cache unavailable: {}", e.what());
            }
        }

        std::unique_ptr<symbol_resolver> resolver;
        if (m_make_resolver) resolver = m_make_resolver(m_symbols);
        if (!resolver) resolver = std::make_unique<null_symbol_resolver>();

        auto state = m_engine->analyze(dump, *resolver, ctx);

        if (cancel_requested()) {
            ctx.log()->info("analysis finished after cancellation; discarding result");
        } else {
            result = analysis_outcome{analysis_outcome::succeeded{
                std::make_shared<const process_state>(std::move(state))}};
        }
    } catch (const cancelled_error&) {
        ctx.log()->info("analysis cancelled");
    } catch (const std::exception& e) {
        ctx.log()->error("analysis failed: {}", e.what());
        result = analysis_outcome{analysis_outcome::failed{e.what()}};
    } catch (...) {
        ctx.log()->error("analysis failed: unknown exception");
        result = analysis_outcome{analysis_outcome::failed{"unknown exception"}};
    }

    // Late records from the analyzer are dropped from here on.
    sink->detach();
    m_tree.close();

    if (auto dropped = sink->dropped()) {
        m_log->debug("analysis {} dropped {} late log records", m_generation, dropped);
    }
    finish(std::move(result));
}

void analysis_task::on_event(log_event ev) {
    if (!m_tree.ingest(std::move(ev))) return;

    std::lock_guard<std::mutex> lock(m_state_mutex);
    ++m_pending_events;
    auto now = std::chrono::steady_clock::now();
    if (m_pending_events >= m_publish_event_batch || now - m_last_publish >= m_publish_interval) {
        publish_locked();
    }
}

void analysis_task::set_phase(analysis_phase phase) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (m_phase == phase) return;
    m_phase = phase;
    publish_locked();
}

void analysis_task::set_partial(const process_state& partial) {
    auto copy = std::make_shared<const process_state>(partial);
    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_result = std::move(copy);
    publish_locked();
}

void analysis_task::finish(analysis_outcome outcome) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (m_outcome.terminal()) return;

    if (auto* ok = std::get_if<analysis_outcome::succeeded>(&outcome.value)) {
        m_result = ok->result;
        m_phase = analysis_phase::done;
    }
    m_outcome = std::move(outcome);
    publish_locked();
    m_final_published = true;

    if (m_outcome.is_failed()) {
        m_log->warn("analysis {} failed: {}", m_generation, m_outcome.error());
    } else {
        m_log->info("analysis {} {} ({} log events)",
                    m_generation, m_outcome.name(), m_tree.event_count());
    }
}

void analysis_task::publish_locked() {
    // Nothing goes out after the terminal snapshot.
    if (m_final_published) return;

    auto snap = std::make_shared<result_snapshot>();
    snap->generation = m_generation;
    snap->sequence = ++m_sequence;
    snap->outcome = m_outcome.terminal() ? m_outcome : running_outcome();
    snap->phase = m_phase;
    snap->logs = m_tree.snapshot();
    snap->event_count = snap->logs->event_count();
    snap->result = m_result;

    m_pending_events = 0;
    m_last_publish = std::chrono::steady_clock::now();
    m_store->publish(std::move(snap));
}

} // namespace dumpscope
