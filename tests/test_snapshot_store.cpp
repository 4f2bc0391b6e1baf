#include "snapshot_store.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <type_traits>

using dumpscope::analysis_outcome;
using dumpscope::result_snapshot;
using dumpscope::snapshot_store;

namespace {

std::shared_ptr<const result_snapshot> make_snap(uint64_t generation, uint64_t sequence,
                                                 analysis_outcome outcome = {}) {
    auto snap = std::make_shared<result_snapshot>();
    snap->generation = generation;
    snap->sequence = sequence;
    snap->outcome = std::move(outcome);
    snap->logs = std::make_shared<const dumpscope::span_node>(std::string{});
    return snap;
}

} // namespace

TEST(snapshot_store, initial_snapshot_is_idle_and_empty) {
    snapshot_store store(test_support::make_log());

    auto cur = store.current();
    ASSERT_NE(cur, nullptr);
    EXPECT_EQ(cur->generation, 0u);
    EXPECT_TRUE(cur->outcome.is_running());
    ASSERT_NE(cur->logs, nullptr);
    EXPECT_EQ(cur->logs->event_count(), 0u);
    EXPECT_EQ(cur->result, nullptr);
}

TEST(snapshot_store, reset_publishes_fresh_running_snapshot) {
    snapshot_store store(test_support::make_log());
    store.reset(3);

    auto cur = store.current();
    EXPECT_EQ(store.generation(), 3u);
    EXPECT_EQ(cur->generation, 3u);
    EXPECT_EQ(cur->sequence, 0u);
    EXPECT_TRUE(cur->outcome.is_running());
    ASSERT_NE(cur->logs, nullptr);
}

TEST(snapshot_store, publish_replaces_current) {
    snapshot_store store(test_support::make_log());
    store.reset(1);

    auto snap = make_snap(1, 1);
    EXPECT_TRUE(store.publish(snap));
    EXPECT_EQ(store.current(), snap);
}

TEST(snapshot_store, rejects_stale_generation) {
    snapshot_store store(test_support::make_log());
    store.reset(1);
    store.reset(2);

    EXPECT_FALSE(store.publish(make_snap(1, 5)));
    EXPECT_EQ(store.current()->generation, 2u);
    EXPECT_EQ(store.current()->sequence, 0u);
}

TEST(snapshot_store, rejects_non_increasing_sequence) {
    snapshot_store store(test_support::make_log());
    store.reset(1);

    EXPECT_TRUE(store.publish(make_snap(1, 2)));
    EXPECT_FALSE(store.publish(make_snap(1, 2)));
    EXPECT_FALSE(store.publish(make_snap(1, 1)));
    EXPECT_TRUE(store.publish(make_snap(1, 3)));
    EXPECT_EQ(store.current()->sequence, 3u);
}

TEST(snapshot_store, terminal_snapshot_is_final) {
    snapshot_store store(test_support::make_log());
    store.reset(1);

    auto done = make_snap(1, 2, analysis_outcome{analysis_outcome::failed{"boom"}});
    EXPECT_TRUE(store.publish(done));

    EXPECT_FALSE(store.publish(make_snap(1, 3)));
    EXPECT_FALSE(store.publish(make_snap(1, 4, analysis_outcome{analysis_outcome::cancelled{}})));
    EXPECT_EQ(store.current(), done);
    EXPECT_EQ(store.current()->outcome.error(), "boom");
}

TEST(snapshot_store, reset_after_terminal_starts_over) {
    snapshot_store store(test_support::make_log());
    store.reset(1);
    store.publish(make_snap(1, 1, analysis_outcome{analysis_outcome::cancelled{}}));

    store.reset(2);
    EXPECT_TRUE(store.current()->outcome.is_running());
    EXPECT_TRUE(store.publish(make_snap(2, 1)));
}

TEST(snapshot_store, null_publish_is_rejected) {
    snapshot_store store(test_support::make_log());
    EXPECT_FALSE(store.publish(nullptr));
    EXPECT_NE(store.current(), nullptr);
}

TEST(snapshot_store, readers_hold_superseded_snapshots) {
    snapshot_store store(test_support::make_log());
    store.reset(1);
    store.publish(make_snap(1, 1));

    auto held = store.current();
    store.publish(make_snap(1, 2));

    EXPECT_EQ(held->sequence, 1u);
    EXPECT_EQ(store.current()->sequence, 2u);
}

TEST(analysis_outcome, names_and_predicates) {
    analysis_outcome running;
    EXPECT_TRUE(running.is_running());
    EXPECT_FALSE(running.terminal());
    EXPECT_STREQ(running.name(), "running");

    analysis_outcome failed{analysis_outcome::failed{"bad"}};
    EXPECT_TRUE(failed.terminal());
    EXPECT_TRUE(failed.is_failed());
    EXPECT_EQ(failed.error(), "bad");
    EXPECT_STREQ(failed.name(), "failed");

    analysis_outcome ok{analysis_outcome::succeeded{}};
    EXPECT_TRUE(ok.is_succeeded());
    EXPECT_TRUE(ok.error().empty());
    EXPECT_STREQ(ok.name(), "succeeded");

    analysis_outcome cancelled{analysis_outcome::cancelled{}};
    EXPECT_TRUE(cancelled.is_cancelled());
    EXPECT_STREQ(cancelled.name(), "cancelled");
}

TEST(analysis_outcome, default_constructed_snapshot_is_running) {
    static_assert(std::is_default_constructible_v<analysis_outcome>);
    static_assert(std::is_default_constructible_v<result_snapshot>);

    result_snapshot snap;
    EXPECT_TRUE(snap.outcome.is_running());
    EXPECT_EQ(std::get<analysis_outcome::running>(snap.outcome.value).elapsed.count(), 0);
    EXPECT_EQ(snap.generation, 0u);
    EXPECT_EQ(snap.result, nullptr);
}
