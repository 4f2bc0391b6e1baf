#include "report.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using dumpscope::pointer_width;
using dumpscope::stack_frame;

namespace {

std::shared_ptr<const dumpscope::process_state> sample_state() {
    auto state = std::make_shared<dumpscope::process_state>();
    state->system.cpu = "amd64";
    state->system.os = "Linux";
    state->system.width = pointer_width::bits64;
    state->system.cpu_count = 8;
    state->crash = dumpscope::crash_info{"SIGSEGV", 0x10, 101};
    state->requesting_thread = 1;
    state->modules.push_back({0x7f0000000000, 0x10000, "/usr/lib/libfoo.so"});

    dumpscope::call_stack main_thread;
    main_thread.thread_id = 100;
    main_thread.thread_name = "main";
    stack_frame f;
    f.instruction = 0x7f0000001234;
    f.trust = dumpscope::frame_trust::context;
    f.module = state->modules[0];
    f.function_name = "foo_main";
    main_thread.frames.push_back(f);

    dumpscope::call_stack worker;
    worker.thread_id = 101;
    stack_frame g;
    g.instruction = 0xdead0000;
    g.trust = dumpscope::frame_trust::context;
    worker.frames.push_back(g);

    state->threads = {main_thread, worker};
    return state;
}

} // namespace

TEST(report, format_address) {
    EXPECT_EQ(dumpscope::format_address(0x1234, pointer_width::bits32), "0x00001234");
    EXPECT_EQ(dumpscope::format_address(0x1234, pointer_width::unknown), "0x00001234");
    EXPECT_EQ(dumpscope::format_address(0x1234, pointer_width::bits64), "0x0000000000001234");
}

TEST(report, frame_signature) {
    stack_frame f;
    f.instruction = 0x7f0000001234;
    EXPECT_EQ(dumpscope::frame_signature(f, pointer_width::bits64), "0x00007f0000001234");

    f.module = dumpscope::module_info{0x7f0000000000, 0x10000, "/usr/lib/libfoo.so"};
    EXPECT_EQ(dumpscope::frame_signature(f, pointer_width::bits64), "libfoo.so + 0x1234");

    f.module->code_file = "C:\\Windows\\System32\\ntdll.dll";
    EXPECT_EQ(dumpscope::frame_signature(f, pointer_width::bits64), "ntdll.dll + 0x1234");

    f.function_name = "foo_main";
    EXPECT_EQ(dumpscope::frame_signature(f, pointer_width::bits64), "foo_main");
}

TEST(report, thread_name) {
    dumpscope::call_stack stack;
    stack.thread_id = 42;
    EXPECT_EQ(dumpscope::thread_name(stack), "(42)");
    stack.thread_name = "Compositor";
    EXPECT_EQ(dumpscope::thread_name(stack), "Compositor (42)");
}

TEST(report, render_stacks_marks_crashed_thread) {
    auto text = dumpscope::render_stacks(*sample_state());
    EXPECT_NE(text.find("crash: SIGSEGV at 0x0000000000000010"), std::string::npos);
    EXPECT_NE(text.find("thread 0 main (100)\n"), std::string::npos);
    EXPECT_NE(text.find("thread 1 (101) (crashed)"), std::string::npos);
    EXPECT_NE(text.find("foo_main"), std::string::npos);
    EXPECT_NE(text.find("/usr/lib/libfoo.so"), std::string::npos);
}

TEST(report, to_json_of_succeeded_snapshot) {
    dumpscope::span_log_tree tree;
    dumpscope::log_event ev;
    ev.level = spdlog::level::warn;
    ev.message = "cfi lookup miss";
    ev.time = std::chrono::system_clock::now();
    ev.span_path = {"thread 0", "frame 2"};
    tree.ingest(ev);
    ev.level = spdlog::level::debug;
    ev.message = "scanning stack";
    ev.span_path = {"thread 0"};
    tree.ingest(ev);

    dumpscope::result_snapshot snap;
    snap.generation = 2;
    snap.sequence = 7;
    snap.outcome = dumpscope::analysis_outcome{dumpscope::analysis_outcome::succeeded{sample_state()}};
    snap.phase = dumpscope::analysis_phase::done;
    snap.logs = tree.snapshot();
    snap.event_count = 2;
    snap.result = sample_state();

    auto j = dumpscope::to_json(snap);
    EXPECT_EQ(j["outcome"], "succeeded");
    EXPECT_EQ(j["phase"], "done");
    EXPECT_EQ(j["generation"], 2);
    EXPECT_FALSE(j.contains("error"));

    const auto& result = j["result"];
    EXPECT_EQ(result["system"]["cpu"], "amd64");
    EXPECT_EQ(result["crash"]["reason"], "SIGSEGV");
    EXPECT_EQ(result["requesting_thread"], 1);
    ASSERT_EQ(result["modules"].size(), 1u);
    ASSERT_EQ(result["threads"].size(), 2u);
    EXPECT_EQ(result["threads"][0]["frames"][0]["function"], "foo_main");
    EXPECT_EQ(result["threads"][0]["frames"][0]["trust"], "context");
    EXPECT_TRUE(result["threads"][1]["frames"][0]["function"].is_null());
    EXPECT_TRUE(result["threads"][1]["frames"][0]["module"].is_null());

    ASSERT_EQ(j["logs"].size(), 2u);
    EXPECT_EQ(j["logs"][0]["message"], "cfi lookup miss");
    EXPECT_EQ(j["logs"][0]["level"], "warning");
    EXPECT_EQ(j["logs"][0]["path"], nlohmann::json::array({"thread 0", "frame 2"}));

    dumpscope::filter_query warnings;
    warnings.min_level = spdlog::level::warn;
    EXPECT_EQ(dumpscope::to_json(snap, warnings)["logs"].size(), 1u);
}

TEST(report, to_json_of_failed_snapshot) {
    dumpscope::result_snapshot snap;
    snap.generation = 1;
    snap.outcome = dumpscope::analysis_outcome{dumpscope::analysis_outcome::failed{"truncated dump"}};
    snap.logs = std::make_shared<const dumpscope::span_node>(std::string{});

    auto j = dumpscope::to_json(snap);
    EXPECT_EQ(j["outcome"], "failed");
    EXPECT_EQ(j["error"], "truncated dump");
    EXPECT_TRUE(j["result"].is_null());
    EXPECT_TRUE(j["logs"].empty());
}
