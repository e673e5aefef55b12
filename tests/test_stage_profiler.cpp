#include <gtest/gtest.h>
#include <sstream>
#include <thread>
#include <vector>
#include "common/stage_profiler.hpp"

using namespace impactflow;

TEST(StageProfiler, RecordAccumulates) {
    StageProfiler prof;
    prof.record("fit", 2.0);
    prof.record("fit", 6.0);

    const auto s = prof.stats("fit");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->call_count, 2u);
    EXPECT_DOUBLE_EQ(s->last_ms, 6.0);
    EXPECT_DOUBLE_EQ(s->min_ms, 2.0);
    EXPECT_DOUBLE_EQ(s->max_ms, 6.0);
    EXPECT_DOUBLE_EQ(s->avg_ms(), 4.0);
}

TEST(StageProfiler, ScopedStageTimesItsScope) {
    StageProfiler prof;
    {
        ScopedStage stage(prof, "scoped");
        volatile double x = 0;
        for (int i = 0; i < 100000; ++i) x = x + 0.01;
    }
    const auto s = prof.stats("scoped");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->call_count, 1u);
    EXPECT_GE(s->last_ms, 0.0);
}

TEST(StageProfiler, DisabledRecordsNothing) {
    StageProfiler prof;
    prof.set_enabled(false);
    prof.record("x", 1.0);
    { ScopedStage stage(prof, "y"); }
    EXPECT_FALSE(prof.stats("x").has_value());
    EXPECT_TRUE(prof.all_stats().empty());
}

TEST(StageProfiler, EndWithoutBeginIsIgnored) {
    StageProfiler prof;
    prof.end_stage("never_started");
    EXPECT_FALSE(prof.stats("never_started").has_value());
}

TEST(StageProfiler, ReportListsStagesByName) {
    StageProfiler prof;
    prof.record("price_change", 1.0);
    prof.record("composite_ofi", 1.0);
    const auto all = prof.all_stats();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].name, "composite_ofi");

    std::ostringstream out;
    prof.print_report(out);
    EXPECT_NE(out.str().find("STAGE TIMINGS"), std::string::npos);
    EXPECT_LT(out.str().find("composite_ofi"), out.str().find("price_change"));
}

TEST(StageProfiler, StatsIsASnapshotUnderConcurrentRecording) {
    StageProfiler prof;
    prof.record("fit", 1.0);
    const auto before = prof.stats("fit");

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&prof] {
            for (int i = 0; i < 1000; ++i) prof.record("fit", 2.0);
        });
    }
    for (auto& w : workers) w.join();

    ASSERT_TRUE(before.has_value());
    EXPECT_EQ(before->call_count, 1u);
    EXPECT_EQ(prof.stats("fit")->call_count, 4001u);
}
