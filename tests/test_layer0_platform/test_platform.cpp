/**
 * @file test_platform.cpp
 * @brief Layer 0 tests for the platform queries (PID, thread ID, executable name, time).
 */
#include "amod_platform.hpp"
#include "asyncmodules_version.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace asyncmodules::platform;
using namespace ::testing;
using namespace std::chrono_literals;

TEST(PlatformCoreTest, GetPID_ReturnsStableNonZeroID)
{
    uint64_t pid1 = get_pid();
    uint64_t pid2 = get_pid();
    EXPECT_GT(pid1, 0u);
    EXPECT_EQ(pid1, pid2) << "PID should be stable within the same process";
}

TEST(PlatformCoreTest, GetThreadID_DifferentForDifferentThreads)
{
    uint64_t main_tid = get_native_thread_id();
    EXPECT_EQ(main_tid, get_native_thread_id());

    std::atomic<uint64_t> worker_tid{0};
    std::thread worker([&worker_tid]() { worker_tid.store(get_native_thread_id()); });
    worker.join();

    EXPECT_GT(worker_tid.load(), 0u) << "Worker thread ID should be valid";
    EXPECT_NE(main_tid, worker_tid.load()) << "Different threads should have different thread IDs";
}

TEST(PlatformCoreTest, ExecutableName_MatchesTestBinary)
{
    const std::string name = get_executable_name();
    const std::string full = get_executable_name(true);
    ASSERT_NE(name, "unknown");
    EXPECT_THAT(name, HasSubstr("test_layer1_base"));
    EXPECT_THAT(full, EndsWith(name));
    EXPECT_GT(full.size(), name.size());
}

TEST(PlatformCoreTest, Version_MatchesGeneratedHeader)
{
    EXPECT_STREQ(get_version_string(), ASYNCMODULES_VERSION_STRING);
    EXPECT_EQ(get_version_major(), ASYNCMODULES_VERSION_MAJOR);
    EXPECT_EQ(get_version_minor(), ASYNCMODULES_VERSION_MINOR);
    EXPECT_EQ(get_version_patch(), ASYNCMODULES_VERSION_PATCH);
}

TEST(PlatformCoreTest, MonotonicTime_MeasuresSleep)
{
    uint64_t start = monotonic_time_ns();
    std::this_thread::sleep_for(5ms);
    uint64_t elapsed = elapsed_time_ns(start);
    EXPECT_GE(elapsed, 5'000'000u);
    EXPECT_LT(elapsed, 5'000'000'000u);
}

TEST(PlatformCoreTest, ElapsedTime_FutureStartClampsToZero)
{
    const uint64_t future = monotonic_time_ns() + 60'000'000'000ull;
    EXPECT_EQ(elapsed_time_ns(future), 0u);
}
