/**
 * @file test_scheduler.cpp
 * @brief Tests for the cooperative home-thread Scheduler.
 */
#include "amod_core.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace asyncmodules::core;
using namespace std::chrono_literals;
using ::testing::ElementsAre;

namespace
{

Scheduler::Job make_job(std::string description, std::function<void()> run,
                        std::function<void()> cancel = {})
{
    Scheduler::Job job;
    job.description = std::move(description);
    job.run = std::move(run);
    job.cancel = std::move(cancel);
    return job;
}

Async<void> sleeper(Scheduler &scheduler, std::string name, std::chrono::milliseconds duration,
                    std::vector<std::string> *order)
{
    order->push_back(name + "-begin");
    const bool woken = co_await scheduler.sleep(duration);
    order->push_back(name + (woken ? "-end" : "-cancelled"));
}

Async<int> doubled_after_sleep(Scheduler &scheduler, int value)
{
    co_await scheduler.sleep(5ms);
    co_return value * 2;
}

Async<int> failing_after_sleep(Scheduler &scheduler)
{
    co_await scheduler.sleep(1ms);
    throw std::runtime_error("late failure");
}

Async<int> nested_run_sync(Scheduler &scheduler)
{
    co_return scheduler.run_sync("inner", doubled_after_sleep(scheduler, 1));
}

Async<void> discard(Async<int> work)
{
    (void)co_await std::move(work);
}

} // namespace

TEST(SchedulerTest, ConstructingThreadIsHome)
{
    Scheduler scheduler;
    EXPECT_TRUE(scheduler.is_home_thread());
    EXPECT_EQ(scheduler.home_thread(), std::this_thread::get_id());

    bool other_is_home = true;
    std::thread t([&] { other_is_home = scheduler.is_home_thread(); });
    t.join();
    EXPECT_FALSE(other_is_home);
}

TEST(SchedulerTest, PostedJobsRunInOrder)
{
    Scheduler scheduler;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i)
    {
        scheduler.post(make_job("job", [&order, i] { order.push_back(i); }));
    }
    EXPECT_EQ(scheduler.ready_count(), 5u);
    ASSERT_TRUE(scheduler.run_until([&] { return order.size() == 5; }));
    EXPECT_THAT(order, ElementsAre(0, 1, 2, 3, 4));
    EXPECT_EQ(scheduler.ready_count(), 0u);
}

TEST(SchedulerTest, RunOneRunsSingleJob)
{
    Scheduler scheduler;
    int runs = 0;
    scheduler.post(make_job("a", [&] { ++runs; }));
    scheduler.post(make_job("b", [&] { ++runs; }));
    EXPECT_TRUE(scheduler.run_one());
    EXPECT_EQ(runs, 1);
    EXPECT_TRUE(scheduler.run_one());
    EXPECT_FALSE(scheduler.run_one());
    EXPECT_EQ(runs, 2);
}

TEST(SchedulerTest, PostOffHomeThreadThrows)
{
    Scheduler scheduler;
    std::atomic<bool> threw{false};
    std::thread t(
        [&]
        {
            try
            {
                scheduler.post(make_job("foreign", [] {}));
            }
            catch (const std::logic_error &)
            {
                threw = true;
            }
        });
    t.join();
    EXPECT_TRUE(threw.load());
    EXPECT_EQ(scheduler.ready_count(), 0u);
}

TEST(SchedulerTest, SubmitFromHomeThreadThrows)
{
    Scheduler scheduler;
    EXPECT_THROW((void)scheduler.submit("self", [] { return 1; }), std::logic_error);
}

TEST(SchedulerTest, SubmitRunsOnHomeThreadAndReturnsValue)
{
    Scheduler scheduler(5ms);
    const auto home = std::this_thread::get_id();
    std::thread::id ran_on;
    std::future<int> result;

    std::thread caller(
        [&]
        {
            result = scheduler.submit("compute",
                                      [&]
                                      {
                                          ran_on = std::this_thread::get_id();
                                          return 42;
                                      });
        });
    caller.join();

    ASSERT_TRUE(scheduler.run_until(
        [&] { return result.wait_for(0s) == std::future_status::ready; }));
    EXPECT_EQ(result.get(), 42);
    EXPECT_EQ(ran_on, home);
}

TEST(SchedulerTest, SubmitPropagatesException)
{
    Scheduler scheduler(5ms);
    std::future<void> result;
    std::thread caller(
        [&] { result = scheduler.submit("fail", [] { throw std::runtime_error("bad input"); }); });
    caller.join();

    ASSERT_TRUE(scheduler.run_until(
        [&] { return result.wait_for(0s) == std::future_status::ready; }));
    EXPECT_THROW(result.get(), std::runtime_error);
}

TEST(SchedulerTest, BlockingCallerIsServedByPump)
{
    Scheduler scheduler(5ms);
    std::atomic<bool> done{false};
    int value = 0;
    std::thread caller(
        [&]
        {
            value = scheduler.submit("blocking", [] { return 7; }).get();
            done = true;
        });
    ASSERT_TRUE(scheduler.run_until([&] { return done.load(); }));
    caller.join();
    EXPECT_EQ(value, 7);
}

TEST(SchedulerTest, SleepForRunsReadyJobs)
{
    Scheduler scheduler;
    int runs = 0;
    scheduler.post(make_job("during-sleep", [&] { ++runs; }));
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(scheduler.sleep_for(20ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
    EXPECT_EQ(runs, 1);
}

TEST(SchedulerTest, SleepersResumeOnTheirOwnDeadlines)
{
    Scheduler scheduler;
    std::vector<std::string> order;
    const auto start = std::chrono::steady_clock::now();
    std::chrono::steady_clock::duration short_done{};

    scheduler.spawn("short", sleeper(scheduler, "short", 10ms, &order));
    scheduler.spawn("long", sleeper(scheduler, "long", 60ms, &order));
    ASSERT_TRUE(scheduler.run_until(
        [&]
        {
            if (short_done == std::chrono::steady_clock::duration{} &&
                std::find(order.begin(), order.end(), "short-end") != order.end())
            {
                short_done = std::chrono::steady_clock::now() - start;
            }
            return order.size() == 4;
        }));

    EXPECT_THAT(order, ElementsAre("short-begin", "long-begin", "short-end", "long-end"));
    EXPECT_LT(short_done, 60ms);
    EXPECT_EQ(scheduler.timer_count(), 0u);
    EXPECT_EQ(scheduler.detached_count(), 0u);
}

TEST(SchedulerTest, EqualDeadlinesResumeInOrderOfSleeping)
{
    Scheduler scheduler;
    std::vector<std::string> order;
    for (const char *name : {"a", "b", "c"})
    {
        scheduler.spawn(name, sleeper(scheduler, name, 0ms, &order));
    }
    ASSERT_TRUE(scheduler.run_until([&] { return order.size() == 6; }));
    EXPECT_THAT(order, ElementsAre("a-begin", "b-begin", "c-begin", "a-end", "b-end", "c-end"));
}

TEST(SchedulerTest, BlockingPumpInsideJobThrows)
{
    Scheduler scheduler;
    int logic_errors = 0;
    scheduler.post(make_job("blocking",
                            [&]
                            {
                                try
                                {
                                    (void)scheduler.run_until([] { return true; });
                                }
                                catch (const std::logic_error &)
                                {
                                    ++logic_errors;
                                }
                                try
                                {
                                    (void)scheduler.sleep_for(1ms);
                                }
                                catch (const std::logic_error &)
                                {
                                    ++logic_errors;
                                }
                            }));
    ASSERT_TRUE(scheduler.run_one());
    EXPECT_EQ(logic_errors, 2);
    EXPECT_FALSE(scheduler.in_job());
}

TEST(SchedulerTest, RunSyncInsideCoroutineThrows)
{
    Scheduler scheduler;
    EXPECT_THROW(scheduler.run_sync("outer", nested_run_sync(scheduler)), std::logic_error);
}

TEST(SchedulerTest, RunSyncReturnsCoroutineValue)
{
    Scheduler scheduler;
    EXPECT_EQ(scheduler.run_sync("double", doubled_after_sleep(scheduler, 4)), 8);
    EXPECT_EQ(scheduler.detached_count(), 0u);
}

TEST(SchedulerTest, RunSyncPropagatesCoroutineException)
{
    Scheduler scheduler;
    EXPECT_THROW(scheduler.run_sync("failing", failing_after_sleep(scheduler)), std::runtime_error);
    EXPECT_EQ(scheduler.detached_count(), 0u);
}

TEST(SchedulerTest, SubmitDrivesReturnedCoroutine)
{
    Scheduler scheduler(5ms);
    std::future<int> result;
    std::thread caller(
        [&] { result = scheduler.submit("double", [&] { return doubled_after_sleep(scheduler, 21); }); });
    caller.join();

    ASSERT_TRUE(scheduler.run_until(
        [&] { return result.wait_for(0s) == std::future_status::ready; }));
    EXPECT_EQ(result.get(), 42);
}

TEST(SchedulerTest, DetachedFailureIsCollected)
{
    Scheduler scheduler;
    scheduler.spawn("failing", discard(failing_after_sleep(scheduler)));
    EXPECT_EQ(scheduler.detached_count(), 1u);
    ASSERT_TRUE(scheduler.run_until([&] { return scheduler.detached_count() == 0; }));
    EXPECT_EQ(scheduler.timer_count(), 0u);
}

TEST(SchedulerTest, CancelAllResumesSleepersWithFalse)
{
    Scheduler scheduler;
    std::vector<std::string> order;
    scheduler.spawn("parked", sleeper(scheduler, "parked", 10s, &order));
    ASSERT_TRUE(scheduler.run_until([&] { return scheduler.timer_count() == 1; }));

    EXPECT_EQ(scheduler.cancel_all(), 1u);
    EXPECT_THAT(order, ElementsAre("parked-begin", "parked-cancelled"));
    EXPECT_EQ(scheduler.timer_count(), 0u);
    EXPECT_EQ(scheduler.detached_count(), 0u);
}

TEST(SchedulerTest, SleepAfterStopCompletesWithFalse)
{
    Scheduler scheduler;
    scheduler.request_stop();
    std::vector<std::string> order;
    Async<void> work = sleeper(scheduler, "late", 10s, &order);
    work.resume();
    EXPECT_TRUE(work.done());
    EXPECT_THAT(order, ElementsAre("late-begin", "late-cancelled"));
    EXPECT_EQ(scheduler.timer_count(), 0u);
}

TEST(SchedulerTest, SpawnedJobCancelledBeforeStartRunsOnCancel)
{
    Scheduler scheduler;
    std::vector<std::string> order;
    bool on_cancel_ran = false;
    scheduler.spawn("never", sleeper(scheduler, "never", 1ms, &order),
                    [&] { on_cancel_ran = true; });
    EXPECT_EQ(scheduler.cancel_all(), 1u);
    EXPECT_TRUE(on_cancel_ran);
    EXPECT_TRUE(order.empty());
    EXPECT_EQ(scheduler.detached_count(), 0u);
}

TEST(SchedulerTest, PollHooksRunOnServiceWithoutNesting)
{
    Scheduler scheduler;
    int calls = 0;
    int nested_attempts = 0;
    scheduler.add_poll_hook(
        [&]
        {
            ++calls;
            if (calls == 1)
            {
                // A pump inside a hook must not re-enter the hook.
                ++nested_attempts;
                scheduler.service();
            }
        });
    scheduler.service();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(nested_attempts, 1);
    scheduler.service();
    EXPECT_EQ(calls, 2);
}

TEST(SchedulerTest, RequestStopEndsPumps)
{
    Scheduler scheduler(5ms);
    std::thread stopper(
        [&]
        {
            std::this_thread::sleep_for(20ms);
            scheduler.request_stop();
        });
    EXPECT_FALSE(scheduler.run_until([] { return false; }));
    stopper.join();
    EXPECT_TRUE(scheduler.stop_requested());
    EXPECT_FALSE(scheduler.sleep_for(1s));
}

TEST(SchedulerTest, NotifyWakesWaitingPump)
{
    Scheduler scheduler(std::chrono::milliseconds(10000));
    std::atomic<bool> flag{false};
    std::thread waker(
        [&]
        {
            std::this_thread::sleep_for(20ms);
            flag = true;
            scheduler.notify();
        });
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(scheduler.run_until([&] { return flag.load(); }));
    waker.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(SchedulerTest, CancelAllCancelsPendingJobs)
{
    Scheduler scheduler;
    int runs = 0;
    int cancels = 0;
    for (int i = 0; i < 3; ++i)
    {
        scheduler.post(make_job("pending", [&] { ++runs; }, [&] { ++cancels; }));
    }
    EXPECT_EQ(scheduler.cancel_all(), 3u);
    EXPECT_EQ(runs, 0);
    EXPECT_EQ(cancels, 3);
    EXPECT_TRUE(scheduler.closed());

    // Posting after close cancels immediately.
    scheduler.post(make_job("late", [&] { ++runs; }, [&] { ++cancels; }));
    EXPECT_EQ(cancels, 4);
    EXPECT_EQ(scheduler.ready_count(), 0u);
}

TEST(SchedulerTest, CancelAllFailsWaitingSubmitters)
{
    Scheduler scheduler;
    std::future<int> result;
    std::thread caller([&] { result = scheduler.submit("never-run", [] { return 1; }); });
    caller.join();

    EXPECT_EQ(scheduler.cancel_all(), 1u);
    EXPECT_THROW(result.get(), TaskCancelled);
}

TEST(SchedulerTest, SubmitAfterCloseThrowsSchedulerStopped)
{
    Scheduler scheduler;
    (void)scheduler.cancel_all();
    std::atomic<bool> stopped{false};
    std::thread caller(
        [&]
        {
            try
            {
                (void)scheduler.submit("late", [] { return 0; });
            }
            catch (const SchedulerStopped &)
            {
                stopped = true;
            }
        });
    caller.join();
    EXPECT_TRUE(stopped.load());
}
