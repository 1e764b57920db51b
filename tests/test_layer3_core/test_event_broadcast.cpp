/**
 * @file test_event_broadcast.cpp
 * @brief Broadcast delivery, the on_exit stage sequence and direct dispatch errors.
 *
 * The manager is driven on the test thread (its home thread) without run(), so
 * asynchronous deliveries are completed with TaskDispatcher::wait_for_running_tasks().
 */
#include "amod_core.hpp"
#include "recording_modules.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include <fmt/format.h>

using namespace asyncmodules::core;
using namespace asyncmodules::tests::helper;
using ::testing::ElementsAre;

namespace
{

std::shared_ptr<RecordingModule> as_recording(const ModulePtr &module)
{
    return std::static_pointer_cast<RecordingModule>(module);
}

class EventBroadcastTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        auto listen_ping = [](RecordingModule &m) { m.listen("on_ping"); };
        a_ = as_recording(manager_.register_module("a", RecordingModule::factory(journal_, listen_ping)));
        b_ = as_recording(manager_.register_module("b", RecordingModule::factory(journal_, listen_ping)));
        c_ = as_recording(manager_.register_module("c", RecordingModule::factory(journal_, listen_ping)));
    }

    JournalPtr journal_ = std::make_shared<EventJournal>();
    ModuleManager manager_{in_process_config()};
    std::shared_ptr<RecordingModule> a_, b_, c_;
};

} // namespace

TEST_F(EventBroadcastTest, SyncBroadcastSkipsOriginator)
{
    manager_.broadcast_event("on_ping", a_->create_metadata(), false);
    EXPECT_EQ(a_->count("on_ping"), 0u);
    EXPECT_EQ(b_->count("on_ping"), 1u);
    EXPECT_EQ(c_->count("on_ping"), 1u);
    EXPECT_THAT(journal_->entries(), ElementsAre("b:on_ping", "c:on_ping"));
}

TEST_F(EventBroadcastTest, ManagerOriginReachesEveryModule)
{
    manager_.broadcast_event("on_ping", manager_.create_metadata(), false);
    EXPECT_THAT(journal_->entries(), ElementsAre("a:on_ping", "b:on_ping", "c:on_ping"));
}

TEST_F(EventBroadcastTest, AsyncBroadcastStartsOneTaskPerRecipient)
{
    manager_.broadcast_event("on_ping", a_->create_metadata(), true, {{"value", 7}});
    // Nothing runs until the scheduler is pumped.
    EXPECT_EQ(b_->count("on_ping"), 0u);
    EXPECT_EQ(manager_.dispatcher().running_count(), 2u);

    ASSERT_TRUE(manager_.dispatcher().wait_for_running_tasks());
    EXPECT_EQ(a_->count("on_ping"), 0u);
    EXPECT_EQ(b_->count("on_ping"), 1u);
    EXPECT_EQ(c_->count("on_ping"), 1u);
    EXPECT_EQ(c_->calls().back().kwargs.at("value"), 7);
}

TEST_F(EventBroadcastTest, ModulesWithoutHandlerAreSkippedQuietly)
{
    manager_.broadcast_event("on_unhandled", manager_.create_metadata(), false);
    EXPECT_TRUE(journal_->entries().empty());

    manager_.broadcast_event("on_unhandled", manager_.create_metadata(), true);
    ASSERT_TRUE(manager_.dispatcher().wait_for_running_tasks());
    EXPECT_EQ(manager_.dispatcher().total_failed(), 0u);
}

TEST_F(EventBroadcastTest, ModuleRelaysBroadcastThroughReferences)
{
    a_->on("relay",
           [](RecordingModule &self, const Kwargs &) -> Async<nlohmann::json>
           {
               co_await self.broadcast_event("on_ping", false);
               co_return nullptr;
           });
    auto result = manager_.exec_task("a.relay", manager_.create_metadata());
    ASSERT_TRUE(result.is_ok());
    EXPECT_THAT(journal_->entries(), ElementsAre("a:relay", "b:on_ping", "c:on_ping"));
}

TEST_F(EventBroadcastTest, BlockingManagerCallInsideHandlerThrows)
{
    a_->on("nested", [this](RecordingModule &, const Kwargs &) -> nlohmann::json
           { return manager_.exec_task("b.on_ping", manager_.create_metadata()).content(); });
    EXPECT_THROW((void)manager_.exec_task("a.nested", manager_.create_metadata()),
                 std::logic_error);
    EXPECT_EQ(b_->count("on_ping"), 0u);
    EXPECT_FALSE(manager_.scheduler().in_job());

    // Queueing from a handler does not block and stays allowed.
    a_->on("queue", [](RecordingModule &self, const Kwargs &) { self.enqueue_task("b.on_ping"); });
    EXPECT_TRUE(manager_.exec_task("a.queue", manager_.create_metadata()).is_ok());
    EXPECT_EQ(manager_.event_loop().size(), 1u);
}

TEST_F(EventBroadcastTest, SyncBroadcastPropagatesHandlerException)
{
    b_->on("on_ping", [](RecordingModule &, const Kwargs &) -> nlohmann::json
           { throw std::runtime_error("b rejects ping"); });
    EXPECT_THROW(manager_.broadcast_event("on_ping", manager_.create_metadata(), false),
                 std::runtime_error);
    // Delivery stops at the failing module.
    EXPECT_EQ(a_->count("on_ping"), 1u);
    EXPECT_EQ(c_->count("on_ping"), 0u);
}

TEST_F(EventBroadcastTest, AsyncBroadcastFailureIsContained)
{
    b_->on("on_ping", [](RecordingModule &, const Kwargs &) -> nlohmann::json
           { throw std::runtime_error("b rejects ping"); });
    manager_.broadcast_event("on_ping", manager_.create_metadata(), true);
    ASSERT_TRUE(manager_.dispatcher().wait_for_running_tasks());
    EXPECT_EQ(a_->count("on_ping"), 1u);
    EXPECT_EQ(c_->count("on_ping"), 1u);
    EXPECT_EQ(manager_.dispatcher().total_failed(), 1u);
}

// ============================================================================
// on_exit
// ============================================================================

TEST_F(EventBroadcastTest, ExitRunsShutdownStagesOnceInOrder)
{
    EXPECT_FALSE(manager_.exit_requested());
    manager_.broadcast_event("on_exit", manager_.create_metadata(), false);
    EXPECT_TRUE(manager_.exit_requested());
    manager_.broadcast_event("on_exit", manager_.create_metadata(), false);

    for (const auto &m : {a_, b_, c_})
    {
        EXPECT_EQ(m->count("on_exit"), 2u) << m->name();
        EXPECT_EQ(m->count("deactivate"), 1u) << m->name();
        EXPECT_EQ(m->count("initiate_shutdown"), 1u) << m->name();
        EXPECT_EQ(m->count("finalize_shutdown"), 1u) << m->name();
        EXPECT_EQ(m->count("startup"), 0u) << m->name();
    }

    // Every module finishes a stage before any module enters the next one.
    for (const char *name : {"a", "b", "c"})
    {
        for (const char *other : {"a", "b", "c"})
        {
            EXPECT_LT(journal_->first_index(fmt::format("{}:on_exit", name)),
                      journal_->first_index(fmt::format("{}:deactivate", other)));
            EXPECT_LT(journal_->first_index(fmt::format("{}:deactivate", name)),
                      journal_->first_index(fmt::format("{}:initiate_shutdown", other)));
            EXPECT_LT(journal_->first_index(fmt::format("{}:initiate_shutdown", name)),
                      journal_->first_index(fmt::format("{}:finalize_shutdown", other)));
        }
    }
}

TEST_F(EventBroadcastTest, ExitFromModuleSkipsItsOwnOnExitOnly)
{
    manager_.broadcast_event("on_exit", b_->create_metadata(), false);
    EXPECT_EQ(b_->count("on_exit"), 0u);
    EXPECT_EQ(a_->count("on_exit"), 1u);
    // Stages come from the manager and reach the originator too.
    EXPECT_EQ(b_->count("finalize_shutdown"), 1u);
}

// ============================================================================
// Direct dispatch
// ============================================================================

TEST_F(EventBroadcastTest, ExecTaskReturnsMethodResult)
{
    a_->on("add", [](RecordingModule &, const Kwargs &kw) -> nlohmann::json
           { return kw.at("x").get<int>() + kw.at("y").get<int>(); });
    auto result = manager_.exec_task("a.add", b_->create_metadata(), {{"x", 2}, {"y", 3}});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.content(), 5);
}

TEST_F(EventBroadcastTest, ExecTaskTypedErrors)
{
    const auto md = manager_.create_metadata();

    auto unknown_module = manager_.exec_task("ghost.on_ping", md);
    ASSERT_TRUE(unknown_module.is_error());
    EXPECT_EQ(unknown_module.error(), CallError::UnknownModule);

    b_->set_ready_state(false);
    auto not_ready = manager_.exec_task("b.on_ping", md);
    ASSERT_TRUE(not_ready.is_error());
    EXPECT_EQ(not_ready.error(), CallError::ModuleNotReady);
    EXPECT_EQ(b_->count("on_ping"), 0u);

    auto unknown_method = manager_.exec_task("a.no_such_method", md);
    ASSERT_TRUE(unknown_method.is_error());
    EXPECT_EQ(unknown_method.error(), CallError::UnknownMethod);
}

TEST_F(EventBroadcastTest, ExecTaskPropagatesMethodException)
{
    a_->on("explode", [](RecordingModule &, const Kwargs &) -> nlohmann::json
           { throw std::invalid_argument("bad kwargs"); });
    EXPECT_THROW((void)manager_.exec_task("a.explode", manager_.create_metadata()),
                 std::invalid_argument);
}

TEST_F(EventBroadcastTest, ExecTaskAsyncReportsAcceptance)
{
    const auto md = manager_.create_metadata();
    EXPECT_FALSE(manager_.exec_task_async("ghost.on_ping", md));
    c_->set_ready_state(false);
    EXPECT_FALSE(manager_.exec_task_async("c.on_ping", md));

    EXPECT_TRUE(manager_.exec_task_async("a.on_ping", md, {{"n", 1}}));
    EXPECT_EQ(manager_.dispatcher().running_count(), 1u);
    ASSERT_TRUE(manager_.dispatcher().wait_for_running_tasks());
    EXPECT_EQ(a_->count("on_ping"), 1u);
    EXPECT_EQ(a_->calls().back().kwargs.at("n"), 1);
}

TEST_F(EventBroadcastTest, ReadinessQuery)
{
    EXPECT_TRUE(manager_.is_ready_module("a"));
    EXPECT_FALSE(manager_.is_ready_module("ghost"));
    a_->set_ready_state(false);
    EXPECT_FALSE(manager_.is_ready_module("a"));
}

TEST_F(EventBroadcastTest, ReRegisteredModuleReceivesLaterCalls)
{
    auto replacement = as_recording(manager_.register_module(
        "b", RecordingModule::factory(journal_, [](RecordingModule &m) { m.listen("on_ping"); })));
    manager_.broadcast_event("on_ping", manager_.create_metadata(), false);
    EXPECT_EQ(b_->count("on_ping"), 0u);
    EXPECT_EQ(replacement->count("on_ping"), 1u);
    EXPECT_THAT(journal_->entries(), ElementsAre("a:on_ping", "b:on_ping", "c:on_ping"));
}
