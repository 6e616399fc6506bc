/**
 * EventBusTest.cpp
 */

#include "core/Logger.hpp"
#include "core/transfer/EventBus.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace fetchkit::core::transfer;

namespace {

TaskSnapshot snapshotFor(const std::string& id) {
    TaskSnapshot snapshot;
    snapshot.id = id;
    snapshot.status = TaskStatus::Running;
    return snapshot;
}

class EventBusTest : public ::testing::Test {
protected:
    void SetUp() override {
        fetchkit::core::Logger::instance().setLevel(fetchkit::core::LogLevel::Off);
    }

    void TearDown() override {
        fetchkit::core::Logger::instance().setLevel(fetchkit::core::LogLevel::Info);
    }

    EventBus bus;
};

} // namespace

TEST_F(EventBusTest, TaskCallbacksOnlySeeTheirTask) {
    std::vector<std::string> seen;
    bus.subscribe("a", [&](const TaskSnapshot& task, TaskEvent) { seen.push_back(task.id); });

    bus.dispatch(snapshotFor("a"), TaskEvent::Started);
    bus.dispatch(snapshotFor("b"), TaskEvent::Started);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "a");
}

TEST_F(EventBusTest, TaskCallbacksRunBeforeGlobalOnes) {
    std::vector<std::string> order;
    bus.subscribeAll([&](const std::string& id, const TaskSnapshot&, TaskEvent event) {
        order.push_back("global:" + id + ":" + toString(event));
    });
    bus.subscribe("a", [&](const TaskSnapshot&, TaskEvent event) {
        order.push_back(std::string("task:") + toString(event));
    });

    bus.dispatch(snapshotFor("a"), TaskEvent::Progress);

    std::vector<std::string> expected = {"task:progress", "global:a:progress"};
    EXPECT_EQ(order, expected);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
    int calls = 0;
    auto subscription = bus.subscribe("a", [&](const TaskSnapshot&, TaskEvent) { ++calls; });
    auto global = bus.subscribeAll([&](const std::string&, const TaskSnapshot&, TaskEvent) { ++calls; });

    EXPECT_EQ(bus.getSubscriberCount("a"), 1u);
    EXPECT_EQ(bus.getGlobalSubscriberCount(), 1u);

    bus.unsubscribe(subscription);
    bus.unsubscribe(global);
    bus.dispatch(snapshotFor("a"), TaskEvent::Completed);

    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(subscription->isActive());
    EXPECT_EQ(bus.getSubscriberCount("a"), 0u);
    EXPECT_EQ(bus.getGlobalSubscriberCount(), 0u);
}

TEST_F(EventBusTest, ClearTaskDropsItsCallbacks) {
    int calls = 0;
    auto subscription = bus.subscribe("a", [&](const TaskSnapshot&, TaskEvent) { ++calls; });

    bus.clearTask("a");
    bus.dispatch(snapshotFor("a"), TaskEvent::Completed);

    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(subscription->isActive());
}

TEST_F(EventBusTest, ThrowingCallbackIsIsolated) {
    int calls = 0;
    bus.subscribe("a", [](const TaskSnapshot&, TaskEvent) { throw std::runtime_error("boom"); });
    bus.subscribe("a", [&](const TaskSnapshot&, TaskEvent) { ++calls; });
    bus.subscribeAll([](const std::string&, const TaskSnapshot&, TaskEvent) { throw 42; });
    bus.subscribeAll([&](const std::string&, const TaskSnapshot&, TaskEvent) { ++calls; });

    EXPECT_NO_THROW(bus.dispatch(snapshotFor("a"), TaskEvent::Progress));
    EXPECT_EQ(calls, 2);
}

TEST_F(EventBusTest, CallbackMaySubscribeDuringDispatch) {
    int late = 0;
    bus.subscribe("a", [&](const TaskSnapshot&, TaskEvent) {
        bus.subscribe("a", [&](const TaskSnapshot&, TaskEvent) { ++late; });
    });

    bus.dispatch(snapshotFor("a"), TaskEvent::Started);
    EXPECT_EQ(late, 0);
    EXPECT_EQ(bus.getSubscriberCount("a"), 2u);
}

TEST_F(EventBusTest, EmptyTaskIdIsRejected) {
    EXPECT_THROW(bus.subscribe("", [](const TaskSnapshot&, TaskEvent) {}), std::invalid_argument);
}
