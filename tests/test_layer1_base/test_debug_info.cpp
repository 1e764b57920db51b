/**
 * @file test_debug_info.cpp
 * @brief Tests for stack trace capture and the panic macro.
 */
#include "amod_base.hpp"
#include "shared_test_helpers.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::HasSubstr;

namespace
{

[[gnu::noinline]] std::string capture_from_named_frame()
{
    return asyncmodules::debug::format_stack_trace();
}

} // namespace

TEST(DebugInfoTest, FormatStackTrace_ListsFrames)
{
    const std::string trace = capture_from_named_frame();
    ASSERT_FALSE(trace.empty());
    EXPECT_THAT(trace, HasSubstr("#00"));
    EXPECT_THAT(trace, HasSubstr("#01"));
}

TEST(DebugInfoTest, FormatStackTrace_SkipFramesShortensTrace)
{
    const std::string full = asyncmodules::debug::format_stack_trace(0);
    const std::string skipped = asyncmodules::debug::format_stack_trace(2);
    EXPECT_LT(asyncmodules::tests::helper::count_lines(skipped),
              asyncmodules::tests::helper::count_lines(full));
}

TEST(DebugInfoTest, PrintStackTrace_WritesToStderr)
{
    asyncmodules::tests::helper::StringCapture capture(STDERR_FILENO);
    asyncmodules::debug::print_stack_trace();
    const std::string out = capture.output();
    EXPECT_THAT(out, HasSubstr("#00"));
}

TEST(DebugInfoTest, LocHereString_NamesThisFile)
{
    const std::string loc = AMOD_LOC_HERE_STR;
    EXPECT_THAT(loc, HasSubstr("test_debug_info.cpp"));
}

TEST(DebugInfoDeathTest, Panic_PrintsMessageAndAborts)
{
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_DEATH(AMOD_PANIC("invariant broken: {}", 42), "PANIC.*invariant broken: 42");
}
