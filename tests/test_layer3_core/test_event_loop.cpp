/**
 * @file test_event_loop.cpp
 * @brief EventLoop draining, failure containment and idle detection on a bare Scheduler.
 */
#include "amod_core.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace asyncmodules::core;
using namespace std::chrono_literals;
using ::testing::ElementsAre;

namespace
{

Async<void> record_item(std::vector<std::string> *seen, QueueItem item)
{
    if (item.target == "throws_int")
    {
        throw 42;
    }
    if (item.target == "throws_std")
    {
        throw std::runtime_error("rejected item");
    }
    seen->push_back(item.target);
    co_return;
}

Async<void> put_after_nap(Scheduler &scheduler, EventLoop *loop, std::string target)
{
    co_await scheduler.sleep(30ms);
    loop->put(std::move(target), Metadata{}, nlohmann::json::object());
}

} // namespace

TEST(EventLoopTest, ItemsDrainInFifoOrder)
{
    Scheduler scheduler(5ms);
    std::vector<std::string> seen;
    EventLoop loop(
        scheduler, [&](const QueueItem &item) { return record_item(&seen, item); },
        [] { return true; });
    for (const char *target : {"one", "two", "three"})
    {
        loop.put(target, Metadata{}, nlohmann::json::object());
    }
    EXPECT_EQ(loop.size(), 3u);
    EXPECT_TRUE(loop.run());
    EXPECT_THAT(seen, ElementsAre("one", "two", "three"));
    EXPECT_TRUE(loop.empty());
    EXPECT_EQ(loop.processed(), 3u);
}

TEST(EventLoopTest, FailingItemsAreLoggedAndLaterItemsStillRun)
{
    Scheduler scheduler(5ms);
    std::vector<std::string> seen;
    EventLoop loop(
        scheduler, [&](const QueueItem &item) { return record_item(&seen, item); },
        [] { return true; });
    loop.put("throws_int", Metadata{}, nlohmann::json::object());
    loop.put("throws_std", Metadata{}, nlohmann::json::object());
    loop.put("after", Metadata{}, nlohmann::json::object());

    EXPECT_TRUE(loop.run());
    EXPECT_THAT(seen, ElementsAre("after"));
    EXPECT_EQ(loop.processed(), 3u);
    EXPECT_EQ(scheduler.detached_count(), 0u);
}

TEST(EventLoopTest, IdleCallbackRunsAfterEveryDrain)
{
    Scheduler scheduler(5ms);
    std::vector<std::string> seen;
    int idle_calls = 0;
    EventLoop *loop_ptr = nullptr;
    EventLoop loop(
        scheduler,
        [&](const QueueItem &item)
        {
            if (item.target == "first")
            {
                // Work that outlives the drain and queues more later.
                scheduler.spawn("late-producer", put_after_nap(scheduler, loop_ptr, "second"));
            }
            return record_item(&seen, item);
        },
        [&]
        {
            ++idle_calls;
            return seen.size() == 2;
        });
    loop_ptr = &loop;
    loop.put("first", Metadata{}, nlohmann::json::object());

    EXPECT_TRUE(loop.run());
    EXPECT_THAT(seen, ElementsAre("first", "second"));
    EXPECT_EQ(idle_calls, 2);
}

TEST(EventLoopTest, StopEndsRunAndKeepsPendingItems)
{
    Scheduler scheduler(5ms);
    std::vector<std::string> seen;
    EventLoop *loop_ptr = nullptr;
    EventLoop loop(
        scheduler,
        [&](const QueueItem &item)
        {
            loop_ptr->stop();
            return record_item(&seen, item);
        },
        [] { return true; });
    loop_ptr = &loop;
    loop.put("a", Metadata{}, nlohmann::json::object());
    loop.put("b", Metadata{}, nlohmann::json::object());

    EXPECT_FALSE(loop.run());
    EXPECT_THAT(seen, ElementsAre("a"));
    EXPECT_EQ(loop.size(), 1u);
    EXPECT_TRUE(loop.stopped());
}
