#include "cpupool/rt/TaskQueue.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace cpupool;
using namespace cpupool::rt;

namespace {
Task task(const std::string& id, int priority = 0) {
    Task t;
    t.id = id;
    t.type = "echo";
    t.priority = priority;
    return t;
}
} // namespace

TEST(TaskQueueTest, EmptyPopReturnsNothing) {
    TaskQueue q;
    EXPECT_TRUE(q.empty());
    EXPECT_FALSE(q.pop().has_value());
}

TEST(TaskQueueTest, FifoAmongEqualPriority) {
    TaskQueue q;
    for (const char* id : {"a", "b", "c"}) q.push(task(id));
    EXPECT_EQ(q.ids(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(q.pop()->id, "a");
    EXPECT_EQ(q.pop()->id, "b");
    EXPECT_EQ(q.pop()->id, "c");
    EXPECT_TRUE(q.empty());
}

TEST(TaskQueueTest, HigherPriorityFirst) {
    TaskQueue q;
    q.push(task("low1", 0));
    q.push(task("neg", -3));
    q.push(task("high", 5));
    q.push(task("low2", 0));
    q.push(task("mid", 2));
    EXPECT_EQ(q.ids(), (std::vector<std::string>{"high", "mid", "low1", "low2", "neg"}));
    EXPECT_EQ(q.size(), 5u);
}

TEST(TaskQueueTest, RemoveById) {
    TaskQueue q;
    q.push(task("a"));
    q.push(task("b", 1));
    q.push(task("c"));

    EXPECT_TRUE(q.contains("b"));
    EXPECT_TRUE(q.remove("b"));
    EXPECT_FALSE(q.contains("b"));
    EXPECT_FALSE(q.remove("b"));
    EXPECT_FALSE(q.remove("zzz"));
    EXPECT_EQ(q.ids(), (std::vector<std::string>{"a", "c"}));
}

TEST(TaskQueueTest, PopForgetsId) {
    TaskQueue q;
    q.push(task("a"));
    auto t = q.pop();
    ASSERT_TRUE(t.has_value());
    EXPECT_FALSE(q.contains("a"));
    EXPECT_FALSE(q.remove("a"));
}

TEST(TaskQueueTest, DrainReturnsDispatchOrder) {
    TaskQueue q;
    q.push(task("a"));
    q.push(task("b", 9));
    auto all = q.drain();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, "b");
    EXPECT_EQ(all[1].id, "a");
    EXPECT_TRUE(q.empty());
    EXPECT_FALSE(q.contains("a"));
}

TEST(TaskQueueTest, PayloadSurvives) {
    TaskQueue q;
    Task t = task("p", 1);
    t.data = "{\"path\":\"/tmp/x\"}";
    t.timeout = std::chrono::milliseconds(250);
    q.push(t);
    auto out = q.pop();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->data, t.data);
    ASSERT_TRUE(out->timeout.has_value());
    EXPECT_EQ(out->timeout->count(), 250);
}
