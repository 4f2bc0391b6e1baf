#include "symbol_cache.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <cstdlib>

namespace fs = std::filesystem;
using dumpscope::cache_config_error;
using dumpscope::symbol_cache_config;

namespace {

symbol_cache_config cache_at(const fs::path& dir) {
    symbol_cache_config cfg;
    cfg.directory = dir;
    cfg.enabled = true;
    return cfg;
}

} // namespace

TEST(symbol_cache, prepare_creates_and_marks_new_directory) {
    test_support::temp_dir tmp;
    auto cfg = cache_at(tmp / "cache" / "nested");

    EXPECT_TRUE(dumpscope::prepare_symbol_cache(cfg, test_support::make_log()));
    EXPECT_TRUE(fs::is_directory(cfg.directory));
    EXPECT_TRUE(fs::is_regular_file(cfg.directory / dumpscope::cache_marker_name));
    EXPECT_TRUE(dumpscope::is_tool_owned_cache(cfg.directory));

    // Idempotent
    EXPECT_TRUE(dumpscope::prepare_symbol_cache(cfg, test_support::make_log()));
}

TEST(symbol_cache, prepare_leaves_foreign_directory_unmarked) {
    test_support::temp_dir tmp;
    test_support::write_file(tmp / "notes.txt", std::string("mine"));

    auto cfg = cache_at(tmp.path());
    EXPECT_FALSE(dumpscope::prepare_symbol_cache(cfg, test_support::make_log()));
    EXPECT_FALSE(dumpscope::is_tool_owned_cache(tmp.path()));
}

TEST(symbol_cache, prepare_skips_disabled_cache) {
    test_support::temp_dir tmp;
    auto cfg = cache_at(tmp / "cache");
    cfg.enabled = false;

    EXPECT_FALSE(dumpscope::prepare_symbol_cache(cfg, test_support::make_log()));
    EXPECT_FALSE(fs::exists(cfg.directory));
}

TEST(symbol_cache, clear_removes_everything_but_the_marker) {
    test_support::temp_dir tmp;
    auto cfg = cache_at(tmp / "cache");
    ASSERT_TRUE(dumpscope::prepare_symbol_cache(cfg, test_support::make_log()));

    test_support::write_file(cfg.directory / "a.sym", std::string("MODULE"));
    fs::create_directories(cfg.directory / "libxul.so" / "0123456789ABCDEF");
    test_support::write_file(cfg.directory / "libxul.so" / "0123456789ABCDEF" / "libxul.so.sym",
                             std::string("MODULE"));

    EXPECT_EQ(dumpscope::clear_symbol_cache(cfg, test_support::make_log()), 2u);
    EXPECT_TRUE(dumpscope::is_tool_owned_cache(cfg.directory));

    std::size_t left = 0;
    for (const auto& e : fs::directory_iterator(cfg.directory)) {
        (void)e;
        ++left;
    }
    EXPECT_EQ(left, 1u);

    // Clearing an empty cache is fine
    EXPECT_EQ(dumpscope::clear_symbol_cache(cfg, test_support::make_log()), 0u);
}

TEST(symbol_cache, clear_refuses_unmarked_directory_without_touching_it) {
    test_support::temp_dir tmp;
    auto dir = tmp / "documents";
    fs::create_directories(dir / "sub");
    test_support::write_file(dir / "important.txt", std::string("keep me"));

    EXPECT_THROW(dumpscope::clear_symbol_cache(cache_at(dir), test_support::make_log()),
                 cache_config_error);
    EXPECT_TRUE(fs::exists(dir / "important.txt"));
    EXPECT_TRUE(fs::exists(dir / "sub"));
}

TEST(symbol_cache, clear_refuses_marker_that_is_not_a_file) {
    test_support::temp_dir tmp;
    fs::create_directories(tmp / dumpscope::cache_marker_name);
    test_support::write_file(tmp / "data", std::string("x"));

    EXPECT_FALSE(dumpscope::is_tool_owned_cache(tmp.path()));
    EXPECT_THROW(dumpscope::clear_symbol_cache(cache_at(tmp.path()), test_support::make_log()),
                 cache_config_error);
    EXPECT_TRUE(fs::exists(tmp / "data"));
}

TEST(symbol_cache, clear_refuses_unsafe_paths) {
    test_support::temp_dir tmp;
    auto log = test_support::make_log();

    EXPECT_THROW(dumpscope::clear_symbol_cache(cache_at(fs::path{}), log), cache_config_error);
    EXPECT_THROW(dumpscope::clear_symbol_cache(cache_at("/"), log), cache_config_error);
    EXPECT_THROW(dumpscope::clear_symbol_cache(cache_at(tmp / "missing"), log), cache_config_error);

    test_support::write_file(tmp / "file", std::string("x"));
    EXPECT_THROW(dumpscope::clear_symbol_cache(cache_at(tmp / "file"), log), cache_config_error);
    EXPECT_TRUE(fs::exists(tmp / "file"));

    if (const char* home = std::getenv("HOME"); home && *home && fs::is_directory(home)) {
        EXPECT_THROW(dumpscope::clear_symbol_cache(cache_at(home), log), cache_config_error);
    }
}

TEST(symbol_cache, clear_refuses_symlink_to_owned_cache) {
    test_support::temp_dir tmp;
    auto cfg = cache_at(tmp / "cache");
    ASSERT_TRUE(dumpscope::prepare_symbol_cache(cfg, test_support::make_log()));
    test_support::write_file(cfg.directory / "a.sym", std::string("MODULE"));

    std::error_code ec;
    fs::create_directory_symlink(cfg.directory, tmp / "link", ec);
    if (ec) GTEST_SKIP() << "symlinks unavailable: " << ec.message();

    EXPECT_THROW(dumpscope::clear_symbol_cache(cache_at(tmp / "link"), test_support::make_log()),
                 cache_config_error);
    EXPECT_TRUE(fs::exists(cfg.directory / "a.sym"));
}
