#include "cpupool/rt/Worker.hpp"
#include "TestUtil.hpp"
#include <gtest/gtest.h>
#include <mutex>
#include <vector>

using namespace cpupool;
using namespace cpupool::rt;
using namespace cpupool::test;
using namespace std::chrono_literals;

namespace {

// Thread-safe collector standing in for the coordinator.
struct Inbox {
    std::mutex mx;
    std::vector<WorkerMessage> msgs;

    Worker::Sink sink() {
        return [this](WorkerMessage m) {
            std::lock_guard<std::mutex> lk(mx);
            msgs.push_back(std::move(m));
        };
    }
    std::size_t size() {
        std::lock_guard<std::mutex> lk(mx);
        return msgs.size();
    }
    WorkerMessage at(std::size_t i) {
        std::lock_guard<std::mutex> lk(mx);
        return msgs.at(i);
    }
};

Task task(const std::string& id, const std::string& type, const std::string& data) {
    Task t;
    t.id = id;
    t.type = type;
    t.data = data;
    return t;
}

} // namespace

TEST(WorkerTest, RunsTaskAndReportsResult) {
    Inbox inbox;
    auto w = Worker::spawn("w1", makeTestRegistry(), inbox.sink());

    ASSERT_TRUE(w->post(task("t1", "echo", "payload"), 42));
    ASSERT_TRUE(waitFor([&] { return inbox.size() == 1; }));

    auto m = inbox.at(0);
    EXPECT_EQ(m.type, WorkerMessage::Type::TaskCompleted);
    EXPECT_EQ(m.workerId, "w1");
    EXPECT_EQ(m.taskId, "t1");
    EXPECT_EQ(m.ticket, 42u);
    EXPECT_EQ(m.result, "payload");

    w->requestStop();
    EXPECT_TRUE(w->join(1000ms));
    ASSERT_EQ(inbox.size(), 2u);
    EXPECT_EQ(inbox.at(1).type, WorkerMessage::Type::WorkerExited);
    EXPECT_EQ(inbox.at(1).exitCode, 0);
}

TEST(WorkerTest, HandlerExceptionIsTaskFailure) {
    Inbox inbox;
    auto w = Worker::spawn("w1", makeTestRegistry(), inbox.sink());

    w->post(task("t1", "fail", "bad input"), 1);
    ASSERT_TRUE(waitFor([&] { return inbox.size() == 1; }));
    auto m = inbox.at(0);
    EXPECT_EQ(m.type, WorkerMessage::Type::TaskFailed);
    EXPECT_EQ(m.kind, ErrorKind::TaskExecutionError);
    EXPECT_EQ(m.error, "bad input");

    // Still usable.
    ASSERT_TRUE(w->post(task("t2", "echo", "again"), 2));
    ASSERT_TRUE(waitFor([&] { return inbox.size() == 2; }));
    EXPECT_EQ(inbox.at(1).type, WorkerMessage::Type::TaskCompleted);

    w->requestStop();
    EXPECT_TRUE(w->join(1000ms));
}

TEST(WorkerTest, UnknownTypeIsTaskFailure) {
    Inbox inbox;
    auto w = Worker::spawn("w1", makeTestRegistry(), inbox.sink());
    w->post(task("t1", "nope", ""), 1);
    ASSERT_TRUE(waitFor([&] { return inbox.size() == 1; }));
    EXPECT_EQ(inbox.at(0).kind, ErrorKind::UnknownTaskType);
    EXPECT_EQ(inbox.at(0).error, "Unknown task type: nope");
    EXPECT_FALSE(w->exited());
    w->requestStop();
    EXPECT_TRUE(w->join(1000ms));
}

TEST(WorkerTest, FaultEndsTheWorker) {
    Inbox inbox;
    auto w = Worker::spawn("w1", makeTestRegistry(), inbox.sink());
    w->post(task("t1", "crash", "heap corrupted"), 1);

    ASSERT_TRUE(waitFor([&] { return w->exited(); }));
    ASSERT_EQ(inbox.size(), 2u);
    EXPECT_EQ(inbox.at(0).type, WorkerMessage::Type::WorkerError);
    EXPECT_EQ(inbox.at(0).taskId, "t1");
    EXPECT_EQ(inbox.at(0).error, "heap corrupted");
    EXPECT_EQ(inbox.at(1).type, WorkerMessage::Type::WorkerExited);
    EXPECT_EQ(inbox.at(1).exitCode, 1);

    EXPECT_FALSE(w->post(task("t2", "echo", "x"), 2));
    EXPECT_TRUE(w->join(1000ms));
}

TEST(WorkerTest, MailboxClosedOnceCrashIsReported) {
    Inbox inbox;
    auto w = Worker::spawn("w1", makeTestRegistry(), inbox.sink());
    ASSERT_TRUE(w->post(task("t1", "crash", "boom"), 1));

    // No waiting for the thread to exit: the crash report alone must be
    // enough for the mailbox to refuse work.
    ASSERT_TRUE(waitFor([&] { return inbox.size() >= 1; }));
    ASSERT_EQ(inbox.at(0).type, WorkerMessage::Type::WorkerError);
    EXPECT_FALSE(w->post(task("t2", "echo", "x"), 2));

    ASSERT_TRUE(waitFor([&] { return w->exited(); }));
    EXPECT_FALSE(w->post(task("t3", "echo", "x"), 3));
    EXPECT_TRUE(w->join(1000ms));
    for (std::size_t i = 0; i < inbox.size(); ++i) {
        EXPECT_NE(inbox.at(i).taskId, "t2");
        EXPECT_NE(inbox.at(i).taskId, "t3");
    }
}

TEST(WorkerTest, SingleSlotMailbox) {
    auto blocker = std::make_shared<Blocker>();
    Inbox inbox;
    auto w = Worker::spawn("w1", makeTestRegistry(blocker), inbox.sink());

    ASSERT_TRUE(w->post(task("a", "block", "a"), 1));
    ASSERT_TRUE(waitFor([&] { return blocker->startedCount() == 1; }));
    ASSERT_TRUE(w->post(task("b", "echo", "b"), 2));
    EXPECT_FALSE(w->post(task("c", "echo", "c"), 3));

    blocker->releaseAll();
    ASSERT_TRUE(waitFor([&] { return inbox.size() == 2; }));
    w->requestStop();
    EXPECT_TRUE(w->join(1000ms));
}

TEST(WorkerTest, DisconnectedWorkerStaysSilent) {
    auto blocker = std::make_shared<Blocker>();
    Inbox inbox;
    auto w = Worker::spawn("w1", makeTestRegistry(blocker), inbox.sink());

    w->post(task("a", "block", "a"), 1);
    ASSERT_TRUE(waitFor([&] { return blocker->startedCount() == 1; }));
    w->disconnect();
    w->requestStop();
    EXPECT_FALSE(w->join(20ms));   // abandoned while still busy

    blocker->releaseAll();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(inbox.size(), 0u);
}
