#include "cpupool/rt/ShutdownCoordinator.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace cpupool::rt;

TEST(ShutdownCoordinatorTest, RunsStepsInOrder) {
    ShutdownCoordinator sc;
    std::vector<std::string> ran;
    sc.registerStep("late", 90, [&] { ran.push_back("late"); });
    sc.registerStep("early", 5, [&] { ran.push_back("early"); });
    sc.registerStep("middle", 40, [&] { ran.push_back("middle"); });

    EXPECT_EQ(sc.stop(), 0u);
    EXPECT_EQ(ran, (std::vector<std::string>{"early", "middle", "late"}));
}

TEST(ShutdownCoordinatorTest, StopIsIdempotent) {
    ShutdownCoordinator sc;
    int runs = 0;
    sc.registerStep("once", 1, [&] { ++runs; });
    sc.stop();
    sc.stop();
    EXPECT_EQ(runs, 1);
    EXPECT_TRUE(sc.stopping());
}

TEST(ShutdownCoordinatorTest, FailingStepDoesNotStopOthers) {
    ShutdownCoordinator sc;
    bool after = false;
    sc.registerStep("boom", 1, [] { throw std::runtime_error("step failed"); });
    sc.registerStep("after", 2, [&] { after = true; });
    EXPECT_EQ(sc.stop(), 1u);
    EXPECT_TRUE(after);
}

TEST(ShutdownCoordinatorTest, ConcurrentStopRunsOnce) {
    ShutdownCoordinator sc;
    std::atomic<int> runs{0};
    sc.registerStep("count", 1, [&] { runs++; });
    std::vector<std::thread> ts;
    for (int i = 0; i < 8; ++i) ts.emplace_back([&] { sc.stop(); });
    for (auto& t : ts) t.join();
    EXPECT_EQ(runs.load(), 1);
}
