// Coroutine runtime headers
#include "transport/coro/AsyncCondition.hpp"
#include "transport/coro/Cancellation.hpp"
#include "transport/coro/CoroTask.hpp"
#include "transport/coro/TaskSupervisor.hpp"
#include "transport/coro/coroIoContext.hpp"
#include "logger.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace transport::test {

  using namespace std::chrono_literals;
  using ::testing::ElementsAre;
  using ::testing::UnorderedElementsAre;

  Task<int> answer() { co_return 42; }

  Task<int> add_one(int value) {
    int base = co_await answer();
    co_return base + value;
  }

  Task<void> fail_with(std::string message) {
    co_await transport::yield();
    throw std::runtime_error(message);
  }

  Task<std::string> catch_failure() {
    try {
      co_await fail_with("boom");
    } catch (const std::runtime_error& e) {
      co_return std::string("caught ") + e.what();
    }
    co_return std::string("not thrown");
  }

  Task<void> record_steps(std::vector<std::string>& log, std::string name, int steps) {
    for (int i = 1; i <= steps; ++i) {
      log.push_back(name + std::to_string(i));
      co_await transport::yield();
    }
  }

  Task<void> sleep_forever() {
    co_await transport::sleep_for(1h);
  }

  class CoroRuntimeTest : public ::testing::Test {
  protected:
    void SetUp() override {
      sink = std::make_shared<VectorSink>();
      logger = std::make_shared<Logger>("test");
      logger->add_sink(sink);
      context = std::make_shared<CoroIoContext>();
      context->set_logger(logger);
    }

    std::shared_ptr<VectorSink> sink;
    std::shared_ptr<Logger> logger;
    std::shared_ptr<CoroIoContext> context;
  };

  TEST_F(CoroRuntimeTest, runUntilComplete_ReturnsNestedResult) {
    EXPECT_EQ(context->run_until_complete(add_one(1)), 43);
  }

  TEST_F(CoroRuntimeTest, exception_PropagatesToAwaiter) {
    EXPECT_EQ(context->run_until_complete(catch_failure()), "caught boom");
    EXPECT_THROW(context->run_until_complete(fail_with("root failure")), std::runtime_error);
  }

  TEST_F(CoroRuntimeTest, yield_InterleavesTasksInPostOrder) {
    std::vector<std::string> log;
    auto a = record_steps(log, "a", 2);
    auto b = record_steps(log, "b", 2);
    context->spawn(a, std::make_shared<CancellationState>());
    context->spawn(b, std::make_shared<CancellationState>());

    ASSERT_TRUE(context->run_until([&] { return a.done() && b.done(); }));
    EXPECT_THAT(log, ElementsAre("a1", "b1", "a2", "b2"));
  }

  TEST_F(CoroRuntimeTest, sleepFor_WaitsAtLeastDuration) {
    auto body = [&]() -> Task<std::chrono::steady_clock::duration> {
      const auto start = std::chrono::steady_clock::now();
      co_await transport::sleep_for(20ms);
      co_return std::chrono::steady_clock::now() - start;
    };
    EXPECT_GE(context->run_until_complete(body()), 20ms);
    EXPECT_EQ(context->get_completed_operations(CoroIoContext::PendingOpCategory::Timer), 1u);
  }

  TEST_F(CoroRuntimeTest, cancellation_InterruptsSleepAndIsDeliveredOnce) {
    bool cancelled = false;
    bool cleanup_ran = false;
    auto body = [&]() -> Task<void> {
      try {
        co_await transport::sleep_for(1h);
      } catch (const OperationCancelled&) {
        cancelled = true;
      }
      co_await transport::yield();
      cleanup_ran = true;
    };

    auto task = body();
    auto cancellation = std::make_shared<CancellationState>();
    context->spawn(task, cancellation);
    context->run_until([&] { return context->pending_count() == 1; });

    cancellation->request();
    ASSERT_TRUE(context->run_until([&] { return task.done(); }));
    EXPECT_TRUE(cancelled);
    EXPECT_TRUE(cleanup_ran);
    EXPECT_NO_THROW(task.get_result());
  }

  TEST_F(CoroRuntimeTest, cancellation_BeforeFirstRunStopsRootTask) {
    bool body_ran = false;
    auto body = [&]() -> Task<void> {
      body_ran = true;
      co_return;
    };

    auto task = body();
    auto cancellation = std::make_shared<CancellationState>();
    cancellation->request();
    context->spawn(task, cancellation);
    ASSERT_TRUE(context->run_until([&] { return task.done(); }));

    EXPECT_FALSE(body_ran);
    EXPECT_THROW(task.get_result(), OperationCancelled);
  }

  TEST_F(CoroRuntimeTest, runUntilComplete_ThrowsWhenNothingCanWakeTask) {
    AsyncCondition never;
    auto body = [&]() -> Task<void> { co_await never.wait([] { return false; }); };
    EXPECT_THROW(context->run_until_complete(body()), std::runtime_error);
  }

  TEST_F(CoroRuntimeTest, asyncCondition_ResumesWaiterWhenPredicateHolds) {
    AsyncCondition condition;
    bool ready = false;
    bool resumed = false;
    auto waiter_body = [&]() -> Task<void> {
      co_await condition.wait([&] { return ready; });
      resumed = true;
    };

    auto waiter = waiter_body();
    context->spawn(waiter, std::make_shared<CancellationState>());
    context->run_until([&] { return condition.waiting_count() == 1; });

    condition.notify_all();
    context->run_until([&] { return context->ready_count() == 0; });
    EXPECT_FALSE(resumed);
    EXPECT_EQ(condition.waiting_count(), 1u);

    ready = true;
    condition.notify_all();
    ASSERT_TRUE(context->run_until([&] { return waiter.done(); }));
    EXPECT_TRUE(resumed);
    EXPECT_EQ(condition.waiting_count(), 0u);
  }

  TEST_F(CoroRuntimeTest, asyncCondition_CancelledWaiterThrows) {
    AsyncCondition condition;
    auto waiter_body = [&]() -> Task<void> { co_await condition.wait([] { return false; }); };

    auto waiter = waiter_body();
    auto cancellation = std::make_shared<CancellationState>();
    context->spawn(waiter, cancellation);
    context->run_until([&] { return condition.waiting_count() == 1; });

    cancellation->request();
    ASSERT_TRUE(context->run_until([&] { return waiter.done(); }));
    EXPECT_EQ(condition.waiting_count(), 0u);
    EXPECT_THROW(waiter.get_result(), OperationCancelled);
  }

  TEST_F(CoroRuntimeTest, supervisor_CancelsOnlyRequestedKeyGroup) {
    TaskSupervisor supervisor(context, logger);
    supervisor.add_task(sleep_forever(), "first", "A");
    supervisor.add_task(sleep_forever(), "second", "B");
    context->run_until([&] { return context->pending_count() == 2; });

    EXPECT_THAT(supervisor.task_names(), UnorderedElementsAre("A:first", "B:second"));

    supervisor.cancel_key_tasks("A");
    ASSERT_TRUE(context->run_until([&] { return supervisor.task_count("A") == 0; }));
    EXPECT_EQ(supervisor.task_count("B"), 1u);

    context->run_until_complete(supervisor.async_exit());
    EXPECT_EQ(supervisor.task_count(), 0u);
  }

  TEST_F(CoroRuntimeTest, supervisor_LogsFailedTaskByName) {
    TaskSupervisor supervisor(context, logger);
    context->run_until_complete(supervisor.async_enter());
    EXPECT_TRUE(supervisor.is_entered());

    supervisor.add_task(fail_with("kaput"), "Flaky Worker", "WORK");
    ASSERT_TRUE(context->run_until([&] { return supervisor.task_count() == 0; }));
    EXPECT_EQ(supervisor.cleanup_completed_tasks(), 1u);

    EXPECT_EQ(sink->count_containing("WORK:Flaky Worker failed: kaput", LogLevel::Error), 1u);

    context->run_until_complete(supervisor.async_exit());
    EXPECT_FALSE(supervisor.is_entered());
  }

  TEST_F(CoroRuntimeTest, supervisor_DestructorDrainsRunningTasks) {
    {
      TaskSupervisor supervisor(context, logger);
      supervisor.add_task(sleep_forever(), "sleeper", "S");
      context->run_until([&] { return context->pending_count() == 1; });
    }
    EXPECT_EQ(context->pending_count(), 0u);
    EXPECT_EQ(sink->count_containing("destroyed with 1 running task", LogLevel::Warning), 1u);
  }

} // namespace transport::test
