#include "cpupool/EventBus.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cpupool;

namespace {
PoolEvent ev(EventType t, const std::string& task = {}) {
    PoolEvent e;
    e.type = t;
    e.taskId = task;
    return e;
}
} // namespace

TEST(EventBusTest, DeliversToAllSubscribers) {
    EventBus bus;
    int a = 0, b = 0;
    bus.subscribe([&](const PoolEvent&) { ++a; });
    bus.subscribe([&](const PoolEvent&) { ++b; });
    bus.publish(ev(EventType::TaskCompleted));
    bus.publish(ev(EventType::WorkerCreated));
    EXPECT_EQ(a, 2);
    EXPECT_EQ(b, 2);
}

TEST(EventBusTest, TypedSubscriptionFilters) {
    EventBus bus;
    std::vector<std::string> seen;
    bus.subscribe(EventType::TaskTimedOut, [&](const PoolEvent& e) { seen.push_back(e.taskId); });
    bus.publish(ev(EventType::TaskCompleted, "a"));
    bus.publish(ev(EventType::TaskTimedOut, "b"));
    EXPECT_EQ(seen, (std::vector<std::string>{"b"}));
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
    EventBus bus;
    int n = 0;
    auto tok = bus.subscribe([&](const PoolEvent&) { ++n; });
    EXPECT_EQ(bus.listenerCount(), 1u);
    bus.publish(ev(EventType::TaskFailed));
    EXPECT_TRUE(bus.unsubscribe(tok));
    EXPECT_FALSE(bus.unsubscribe(tok));
    bus.publish(ev(EventType::TaskFailed));
    EXPECT_EQ(n, 1);
    EXPECT_EQ(bus.listenerCount(), 0u);
}

TEST(EventBusTest, ThrowingListenerDoesNotStopOthers) {
    EventBus bus;
    int after = 0;
    bus.subscribe([](const PoolEvent&) { throw std::runtime_error("listener bug"); });
    bus.subscribe([&](const PoolEvent&) { ++after; });
    EXPECT_NO_THROW(bus.publish(ev(EventType::ShutdownStarted)));
    EXPECT_EQ(after, 1);
}

TEST(EventBusTest, ListenerMayUnsubscribeDuringPublish) {
    EventBus bus;
    EventBus::Token self = 0;
    int n = 0;
    self = bus.subscribe([&](const PoolEvent&) { ++n; bus.unsubscribe(self); });
    bus.publish(ev(EventType::WorkerExited));
    bus.publish(ev(EventType::WorkerExited));
    EXPECT_EQ(n, 1);
}

TEST(EventBusTest, EventNames) {
    EXPECT_STREQ(eventTypeName(EventType::WorkerCreated), "worker_created");
    EXPECT_STREQ(eventTypeName(EventType::TaskTimedOut), "task_timed_out");
    EXPECT_STREQ(eventTypeName(EventType::ShutdownCompleted), "shutdown_completed");
}
