#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <vector>
#include "engine/job_system.hpp"

using namespace impactflow;

TEST(JobSystem, ZeroSelectsAtLeastOneWorker) {
    JobSystem jobs(0);
    EXPECT_GE(jobs.thread_count(), 1u);
    jobs.set_thread_count(3);
    EXPECT_EQ(jobs.thread_count(), 3u);
}

TEST(JobSystem, VisitsEveryIndexExactlyOnce) {
    JobSystem jobs(4);
    std::vector<std::atomic<int>> hits(1000);
    jobs.parallel_for(hits.size(), [&](size_t i) { hits[i].fetch_add(1); });
    for (size_t i = 0; i < hits.size(); ++i) EXPECT_EQ(hits[i].load(), 1) << "index " << i;
}

TEST(JobSystem, ReturnsOnlyAfterAllTasksFinish) {
    JobSystem jobs(8);
    std::vector<double> slots(64, 0.0);
    jobs.parallel_for(slots.size(), [&](size_t i) {
        double acc = 0.0;
        for (int k = 0; k < 10000; ++k) acc += static_cast<double>(k % 7);
        slots[i] = acc + static_cast<double>(i);
    });
    for (size_t i = 0; i < slots.size(); ++i) EXPECT_GT(slots[i], 0.0);
}

TEST(JobSystem, SingleWorkerRunsInOrder) {
    JobSystem jobs(1);
    std::vector<size_t> order;
    jobs.parallel_for(5, [&](size_t i) { order.push_back(i); });
    EXPECT_EQ(order, (std::vector<size_t>{0, 1, 2, 3, 4}));
}

TEST(JobSystem, EmptyRangeIsNoOp) {
    JobSystem jobs(4);
    bool called = false;
    jobs.parallel_for(0, [&](size_t) { called = true; });
    EXPECT_FALSE(called);
}

TEST(JobSystem, TaskExceptionReachesCaller) {
    JobSystem jobs(4);
    EXPECT_THROW(jobs.parallel_for(16, [](size_t i) {
        if (i == 7) throw std::runtime_error("boom");
    }), std::runtime_error);
}
