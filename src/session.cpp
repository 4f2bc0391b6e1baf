#include "session.hpp"
#include "errors.hpp"
#include "symbol_cache.hpp"
#include <fstream>
#include <system_error>

namespace dumpscope {

const char* state_name(session_state s) {
    switch (s) {
        case session_state::idle:      return "idle";
        case session_state::analyzing: return "analyzing";
        case session_state::done:      return "done";
        case session_state::failed:    return "failed";
        case session_state::cancelled: return "cancelled";
    }
    return "unknown";
}

session_state state_of(const result_snapshot& snap) {
    if (snap.generation == 0) return session_state::idle;
    if (snap.outcome.is_succeeded()) return session_state::done;
    if (snap.outcome.is_failed())    return session_state::failed;
    if (snap.outcome.is_cancelled()) return session_state::cancelled;
    return session_state::analyzing;
}

session::session(const config& cfg,
                 std::shared_ptr<analyzer> engine,
                 resolver_factory make_resolver,
                 std::shared_ptr<spdlog::logger> log)
    : m_cfg(cfg), m_engine(std::move(engine)),
      m_make_resolver(std::move(make_resolver)), m_log(std::move(log)),
      m_store(std::make_shared<snapshot_store>(m_log)),
      m_pool(m_cfg, m_log),
      m_symbols(cfg.symbols)
{
    m_pool.start();
}

session::~session() {
    if (m_task) m_task->cancel();
    m_pool.stop();
}

session_state session::state() const {
    return state_of(*m_store->current());
}

void session::open(const std::filesystem::path& dump_path, const symbol_config& symbols) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(dump_path, ec)) {
        throw dump_open_error("not a readable file: " + dump_path.string());
    }
    std::ifstream probe(dump_path, std::ios::binary);
    if (!probe) {
        throw dump_open_error("cannot open dump: " + dump_path.string());
    }

    m_log->info("opening {}", dump_path.string());
    m_dump_path = dump_path;
    m_symbols = symbols;
    start_task();
}

void session::restart(const symbol_config& symbols) {
    if (!m_dump_path) throw dump_open_error("no dump opened");
    m_symbols = symbols;
    start_task();
}

void session::restart() {
    restart(m_symbols);
}

void session::cancel() {
    if (m_task && state() == session_state::analyzing) {
        m_task->cancel();
    }
}

std::size_t session::clear_symbol_cache() {
    // A task cancelled by restart() may still be reading the cache after
    // the current generation has finished.
    if (state() == session_state::analyzing || m_pool.in_flight() > 0) {
        throw cache_config_error("cannot clear symbol cache '" +
                                 m_symbols.cache.directory.string() +
                                 "' while an analysis is using it");
    }
    return dumpscope::clear_symbol_cache(m_symbols.cache, m_log);
}

void session::start_task() {
    // The old task keeps running until its analyzer notices; whatever it
    // still publishes carries the old generation and is dropped.
    if (m_task) m_task->cancel();

    ++m_generation;
    m_store->reset(m_generation);

    m_task = std::make_shared<analysis_task>(
        m_generation, *m_dump_path, m_symbols, m_engine, m_make_resolver,
        m_store, m_cfg, m_log);
    m_pool.enqueue(m_task);

    m_log->debug("started analysis {} of {}", m_generation, m_dump_path->string());
}

} // namespace dumpscope
