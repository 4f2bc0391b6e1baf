#include "config.hpp"
#include "errors.hpp"
#include "raw_dump.hpp"
#include "report.hpp"
#include "session.hpp"
#include "symbol_cache.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>

namespace {

// Splits "thread 0/frame 2" into span labels.
std::vector<std::string> parse_span_prefix(const std::string& s) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        auto slash = s.find('/', start);
        if (slash == std::string::npos) slash = s.size();
        if (slash > start) out.push_back(s.substr(start, slash - start));
        start = slash + 1;
    }
    return out;
}

int exit_code(dumpscope::session_state state) {
    switch (state) {
        case dumpscope::session_state::done:      return 0;
        case dumpscope::session_state::cancelled: return 130;
        default:                                  return 2;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("dumpscope",
        "Minidump analyzer with a live, filterable diagnostic log tree");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("json", "Print the final report as JSON")
        ("filter", "Only show log messages containing this text", cxxopts::value<std::string>())
        ("min-level", "Only show log messages at or above this level", cxxopts::value<std::string>())
        ("span", "Only show log messages under this span path, e.g. \"thread 0/frame 0\"",
         cxxopts::value<std::string>())
        ("clear-cache", "Clear the symbol cache and exit")
        ("symbols-url", "Symbol server URL (repeatable, overrides config)",
         cxxopts::value<std::vector<std::string>>())
        ("symbols-path", "Local symbol directory (repeatable, overrides config)",
         cxxopts::value<std::vector<std::string>>())
        ("symbol-cache", "Symbol cache directory (overrides config)", cxxopts::value<std::string>())
        ("no-symbol-cache", "Do not use a symbol cache")
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help")
        ("dump", "Minidump to analyze", cxxopts::value<std::string>());

    options.parse_positional({"dump"});
    options.positional_help("<minidump>");

    auto result = options.parse(argc, argv);

    if (result.count("help") || (!result.count("dump") && !result.count("clear-cache"))) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    // Logger
    auto console = spdlog::stdout_color_mt("dumpscope");

    // Load config
    dumpscope::config cfg = dumpscope::default_config();
    if (result.count("config")) {
        try {
            cfg = dumpscope::load_config(result["config"].as<std::string>());
        } catch (const std::exception& e) {
            console->error("Failed to load config: {}", e.what());
            return 1;
        }
    }

    // CLI overrides
    if (result.count("symbols-url"))  cfg.symbols.symbol_urls = result["symbols-url"].as<std::vector<std::string>>();
    if (result.count("symbols-path")) cfg.symbols.symbol_paths = result["symbols-path"].as<std::vector<std::string>>();
    if (result.count("symbol-cache")) cfg.symbols.cache.directory = result["symbol-cache"].as<std::string>();
    if (result.count("no-symbol-cache")) cfg.symbols.cache.enabled = false;
    if (result.count("verbose")) cfg.log_level = "debug";

    // Set log level
    auto level = dumpscope::parse_log_level(cfg.log_level);
    console->set_level(level.value_or(spdlog::level::info));

    dumpscope::filter_query filter;
    if (result.count("filter")) filter.text = result["filter"].as<std::string>();
    if (result.count("span"))   filter.span_prefix = parse_span_prefix(result["span"].as<std::string>());
    if (result.count("min-level")) {
        auto min = dumpscope::parse_log_level(result["min-level"].as<std::string>());
        if (!min) {
            console->error("Unknown log level '{}'", result["min-level"].as<std::string>());
            return 1;
        }
        filter.min_level = *min;
    }

    if (result.count("clear-cache")) {
        try {
            auto removed = dumpscope::clear_symbol_cache(cfg.symbols.cache, console);
            console->info("Removed {} entries from {}", removed, cfg.symbols.cache.directory.string());
            return 0;
        } catch (const std::exception& e) {
            console->error("Cannot clear symbol cache: {}", e.what());
            return 1;
        }
    }

    auto make_resolver = [console](const dumpscope::symbol_config& symbols)
        -> std::unique_ptr<dumpscope::symbol_resolver> {
        if (!symbols.symbol_urls.empty() || !symbols.symbol_paths.empty()) {
            console->debug("symbol sources configured ({} paths, {} urls); no symbol file reader built in",
                           symbols.symbol_paths.size(), symbols.symbol_urls.size());
        }
        return std::make_unique<dumpscope::null_symbol_resolver>();
    };

    dumpscope::session session(cfg, std::make_shared<dumpscope::raw_dump_analyzer>(),
                               make_resolver, console);
    session.set_filter(filter);

    try {
        session.open(result["dump"].as<std::string>(), cfg.symbols);
    } catch (const dumpscope::dump_open_error& e) {
        console->error("{}", e.what());
        return 1;
    }

    // Single-threaded io_context drives the presentation
    asio::io_context ioc(1);

    // Ctrl-C cancels the analysis; the render loop exits on the terminal snapshot
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int) {
        if (ec) return;
        console->info("Cancelling...");
        session.cancel();
    });

    const bool as_json = result.count("json") > 0;

    asio::co_spawn(ioc,
        [&]() -> asio::awaitable<void> {
            asio::steady_timer timer(co_await asio::this_coro::executor);
            dumpscope::analysis_phase last_phase = dumpscope::analysis_phase::reading_dump;
            std::size_t last_events = 0;

            for (;;) {
                auto snap = session.current();
                if (snap->phase != last_phase || snap->event_count != last_events) {
                    console->info("[{}] {} log events", dumpscope::phase_name(snap->phase),
                                  snap->event_count);
                    last_phase = snap->phase;
                    last_events = snap->event_count;
                }

                if (snap->outcome.terminal()) {
                    if (as_json) {
                        std::cout << dumpscope::to_json(*snap, session.filter()).dump(2) << std::endl;
                    } else {
                        if (snap->result) std::cout << dumpscope::render_stacks(*snap->result);
                        std::cout << "\nlog:\n" << dumpscope::render_text(*snap->logs, session.filter());
                        if (snap->outcome.is_failed()) {
                            console->error("Analysis failed: {}", snap->outcome.error());
                        }
                    }
                    console->info("Analysis {}", snap->outcome.name());
                    break;
                }

                timer.expires_after(cfg.render_interval);
                co_await timer.async_wait(asio::use_awaitable);
            }
            signals.cancel();
        },
        asio::detached
    );

    ioc.run();

    auto stats = session.pool_stats();
    console->debug("analyses: {} started, {} succeeded, {} failed, {} cancelled",
                   stats.started, stats.succeeded, stats.failed, stats.cancelled);
    return exit_code(session.state());
}
