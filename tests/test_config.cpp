#include "config.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace {

std::string write_config(const test_support::temp_dir& dir, const std::string& yaml) {
    auto path = dir / "dumpscope.yaml";
    test_support::write_file(path, yaml);
    return path.string();
}

} // namespace

TEST(config, defaults) {
    auto cfg = dumpscope::default_config();
    ASSERT_EQ(cfg.symbols.symbol_urls.size(), 1u);
    EXPECT_EQ(cfg.symbols.symbol_urls[0], "https://symbols.mozilla.org/");
    EXPECT_TRUE(cfg.symbols.symbol_paths.empty());
    EXPECT_EQ(cfg.symbols.cache.directory.filename(), std::filesystem::path("dumpscope-cache"));
    EXPECT_TRUE(cfg.symbols.cache.enabled);
    EXPECT_EQ(cfg.symbols.http_timeout_secs, 1000u);
    EXPECT_EQ(cfg.publish_interval, std::chrono::milliseconds(100));
    EXPECT_EQ(cfg.publish_event_batch, 256u);
    EXPECT_EQ(cfg.analysis_threads, 0u);
    EXPECT_EQ(cfg.render_interval, std::chrono::milliseconds(100));
    EXPECT_EQ(cfg.log_level, "info");
}

TEST(config, empty_file_gives_defaults) {
    test_support::temp_dir dir;
    auto cfg = dumpscope::load_config(write_config(dir, "{}\n"));
    auto defaults = dumpscope::default_config();
    EXPECT_EQ(cfg.symbols.symbol_urls, defaults.symbols.symbol_urls);
    EXPECT_EQ(cfg.symbols.cache.directory, defaults.symbols.cache.directory);
    EXPECT_EQ(cfg.publish_event_batch, defaults.publish_event_batch);
}

TEST(config, loads_all_keys) {
    test_support::temp_dir dir;
    auto cfg = dumpscope::load_config(write_config(dir,
        "symbol_paths:\n"
        "  - /opt/symbols\n"
        "  - /home/me/syms\n"
        "symbol_urls:\n"
        "  - https://symbols.example.com/\n"
        "symbol_cache_dir: /var/cache/dumpscope\n"
        "symbol_cache_enabled: false\n"
        "http_timeout_secs: 30\n"
        "publish_interval_ms: 250\n"
        "publish_event_batch: 64\n"
        "analysis_threads: 4\n"
        "render_interval_ms: 50\n"
        "log_level: debug\n"));

    EXPECT_EQ(cfg.symbols.symbol_paths, (std::vector<std::string>{"/opt/symbols", "/home/me/syms"}));
    EXPECT_EQ(cfg.symbols.symbol_urls, (std::vector<std::string>{"https://symbols.example.com/"}));
    EXPECT_EQ(cfg.symbols.cache.directory, std::filesystem::path("/var/cache/dumpscope"));
    EXPECT_FALSE(cfg.symbols.cache.enabled);
    EXPECT_EQ(cfg.symbols.http_timeout_secs, 30u);
    EXPECT_EQ(cfg.publish_interval, std::chrono::milliseconds(250));
    EXPECT_EQ(cfg.publish_event_batch, 64u);
    EXPECT_EQ(cfg.analysis_threads, 4u);
    EXPECT_EQ(cfg.render_interval, std::chrono::milliseconds(50));
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST(config, empty_url_list_disables_symbol_servers) {
    test_support::temp_dir dir;
    auto cfg = dumpscope::load_config(write_config(dir, "symbol_urls: []\n"));
    EXPECT_TRUE(cfg.symbols.symbol_urls.empty());
}

TEST(config, rejects_invalid_values) {
    test_support::temp_dir dir;
    EXPECT_THROW(dumpscope::load_config(write_config(dir, "publish_event_batch: 0\n")),
                 std::runtime_error);
    EXPECT_THROW(dumpscope::load_config(write_config(dir, "render_interval_ms: 0\n")),
                 std::runtime_error);
    EXPECT_THROW(dumpscope::load_config(write_config(dir, "log_level: chatty\n")),
                 std::runtime_error);
    EXPECT_THROW(dumpscope::load_config(write_config(dir, "symbol_urls: https://one.example/\n")),
                 std::runtime_error);
    EXPECT_THROW(dumpscope::load_config(write_config(dir, "symbol_cache_dir: \"\"\n")),
                 std::runtime_error);
}

TEST(config, missing_file_throws) {
    test_support::temp_dir dir;
    EXPECT_ANY_THROW(dumpscope::load_config((dir / "absent.yaml").string()));
}

TEST(config, parse_log_level) {
    EXPECT_EQ(dumpscope::parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(dumpscope::parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(dumpscope::parse_log_level("info"), spdlog::level::info);
    EXPECT_EQ(dumpscope::parse_log_level("warning"), spdlog::level::warn);
    EXPECT_EQ(dumpscope::parse_log_level("err"), spdlog::level::err);
    EXPECT_EQ(dumpscope::parse_log_level("off"), spdlog::level::off);
    EXPECT_FALSE(dumpscope::parse_log_level("INFO").has_value());
    EXPECT_FALSE(dumpscope::parse_log_level("").has_value());
}
