#include "cpupool/TaskPool.hpp"
#include "TestUtil.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace cpupool;
using namespace cpupool::test;

namespace {

// Tracks how many "square" tasks run at once.
struct Concurrency {
    std::atomic<int> now{0};
    std::atomic<int> peak{0};
};

std::shared_ptr<HandlerRegistry> squareRegistry(std::shared_ptr<Concurrency> c) {
    auto reg = makeTestRegistry();
    reg->registerHandler("square", [c](const std::string& d) {
        const int n = ++c->now;
        int p = c->peak.load();
        while (n > p && !c->peak.compare_exchange_weak(p, n)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        --c->now;
        const long v = std::stol(d);
        if (v < 0) throw std::runtime_error("negative input " + d);
        return std::to_string(v * v);
    });
    return reg;
}

Task mk(const std::string& id, const std::string& type, const std::string& data) {
    Task t;
    t.id = id;
    t.type = type;
    t.data = data;
    return t;
}

} // namespace

TEST(BatchTest, ExecuteBatchKeepsInputOrderAndNeverThrows) {
    TaskPool pool(testConfig(2), makeTestRegistry());
    std::vector<TaskResult> results;
    ASSERT_NO_THROW(results = pool.executeBatch({ mk("A", "echo", "a"), mk("B", "fail", "b broke") }));
    ASSERT_EQ(results.size(), 2u);

    EXPECT_EQ(results[0].id, "A");
    EXPECT_TRUE(results[0].success);
    EXPECT_EQ(results[0].result, "a");
    EXPECT_FALSE(results[0].errorKind.has_value());

    EXPECT_EQ(results[1].id, "B");
    EXPECT_FALSE(results[1].success);
    EXPECT_EQ(results[1].error, "b broke");
    EXPECT_EQ(results[1].errorKind, ErrorKind::TaskExecutionError);
}

TEST(BatchTest, ExecuteBatchEmpty) {
    TaskPool pool(testConfig(1), makeTestRegistry());
    EXPECT_TRUE(pool.executeBatch({}).empty());
}

TEST(BatchTest, ExecuteBatchReportsShutdown) {
    TaskPool pool(testConfig(1), makeTestRegistry());
    pool.shutdown();
    auto results = pool.executeBatch({ mk("x", "echo", "x") });
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].errorKind, ErrorKind::PoolShuttingDown);
    EXPECT_TRUE(results[0].workerId.empty());
}

TEST(BatchTest, ParallelMapChunksAndPreservesOrder) {
    auto c = std::make_shared<Concurrency>();
    TaskPool pool(testConfig(8), squareRegistry(c));

    std::vector<int> items;
    for (int i = 0; i < 10; ++i) items.push_back(i);

    auto out = pool.parallelMap(items, "square", [](int v) { return std::to_string(v); }, 3);
    ASSERT_EQ(out.size(), items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        EXPECT_EQ(out[i], std::to_string(items[i] * items[i]));
    }
    EXPECT_LE(c->peak.load(), 3);
    EXPECT_GE(c->peak.load(), 1);
}

TEST(BatchTest, ParallelMapDefaultsToMaxWorkers) {
    auto c = std::make_shared<Concurrency>();
    TaskPool pool(testConfig(2), squareRegistry(c));

    std::vector<std::string> items{"1", "2", "3", "4", "5"};
    auto out = pool.parallelMap(items, "square", [](const std::string& s) { return s; });
    EXPECT_EQ(out, (std::vector<std::string>{"1", "4", "9", "16", "25"}));
    EXPECT_LE(c->peak.load(), 2);
}

TEST(BatchTest, ParallelMapThrowsOnFirstFailure) {
    auto c = std::make_shared<Concurrency>();
    TaskPool pool(testConfig(4), squareRegistry(c));

    std::vector<int> items{1, 2, 3, 4, -5, 6};
    try {
        pool.parallelMap(items, "square", [](int v) { return std::to_string(v); }, 2);
        FAIL() << "expected TaskError";
    } catch (const TaskError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TaskExecutionError);
        EXPECT_EQ(std::string(e.what()), "Task failed for item 4: negative input -5");
    }
}

TEST(BatchTest, ParallelMapEmptyInput) {
    TaskPool pool(testConfig(1), makeTestRegistry());
    auto out = pool.parallelMap(std::vector<int>{}, "echo", [](int v) { return std::to_string(v); });
    EXPECT_TRUE(out.empty());
}

TEST(BatchTest, ParallelMapUnknownTypePropagatesKind) {
    TaskPool pool(testConfig(1), makeTestRegistry());
    std::vector<int> items{1};
    try {
        pool.parallelMap(items, "missing", [](int v) { return std::to_string(v); });
        FAIL() << "expected TaskError";
    } catch (const TaskError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownTaskType);
    }
}
