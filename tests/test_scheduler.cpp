#include <gtest/gtest.h>

#include "core/scheduler.h"
#include "core/task_factory.h"
#include "test_support.h"

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace taskrun::core;
using namespace taskrun::test_support;

namespace {

using Clock = std::chrono::steady_clock;

SchedulerConfig workers(int n) {
  SchedulerConfig cfg;
  cfg.worker_count = n;
  return cfg;
}

long long elapsed_ms(Clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                               since)
      .count();
}

TaskDescription describe(int id, std::string name, std::string type) {
  TaskDescription d;
  d.task_id = id;
  d.name = std::move(name);
  d.type = std::move(type);
  return d;
}

/// Work step that sleeps and records its peak concurrency.
LambdaTask::WorkFn sleep_for(std::chrono::milliseconds d, ConcurrencyProbe *probe) {
  return [d, probe]() {
    probe->enter();
    std::this_thread::sleep_for(d);
    probe->leave();
    return Result<void, TaskError>::Ok();
  };
}

} // namespace

// ============================================================
// Test: Registration
// ============================================================

TEST(TaskScheduler, AddTaskAttachesLoggerFirst) {
  Journal journal;
  auto logger = std::make_shared<RecordingLogger>(&journal);
  TaskScheduler scheduler(workers(1), logger);

  auto task = std::make_shared<LambdaTask>(1, "first", succeed());
  ASSERT_TRUE(scheduler.add_task(task).is_ok());
  task->attach(std::make_shared<RecordingObserver>("obs", &journal));
  ASSERT_EQ(task->observer_count(), 2u);
  ASSERT_EQ(scheduler.size(), 1u);

  ASSERT_EQ(task->run(), TaskStatus::Completed);

  const std::vector<std::string> expected = {
      "log:task_status_changed", "obs:Running", "log:task_status_changed",
      "obs:Completed"};
  ASSERT_EQ(journal.snapshot(), expected);
}

TEST(TaskScheduler, NullTaskRejected) {
  TaskScheduler scheduler;
  auto result = scheduler.add_task(nullptr);
  ASSERT_TRUE(result.is_err());
  ASSERT_EQ(result.error().category, ErrorCategory::Internal);
  ASSERT_EQ(scheduler.size(), 0u);
}

TEST(TaskScheduler, EmptyRunReturnsImmediately) {
  TaskScheduler scheduler;
  ASSERT_TRUE(scheduler.run_all().is_ok());
  ASSERT_EQ(scheduler.summary().total, 0u);
}

TEST(TaskScheduler, NonPositiveWorkerCountFallsBackToDefault) {
  TaskScheduler zero(workers(0));
  TaskScheduler negative(workers(-3));
  ASSERT_EQ(zero.config().worker_count, kDefaultWorkerCount);
  ASSERT_EQ(negative.config().worker_count, kDefaultWorkerCount);
  ASSERT_EQ(TaskScheduler().config().worker_count, 5);
}

// ============================================================
// Test: run_all
// ============================================================

TEST(TaskScheduler, FactoryTasksAllComplete) {
  auto logger = std::make_shared<RecordingLogger>();
  TaskFactory factory(logger, std::chrono::milliseconds(10));
  TaskScheduler scheduler(workers(5), logger);

  const std::vector<TaskDescription> batch = {
      describe(1, "Send Welcome Email", "email"),
      describe(2, "Backup Database", "backup"),
      describe(3, "Generate Sales Report", "report"),
      describe(4, "Send Newsletter", "email"),
  };
  for (const auto &d : batch) {
    auto created = factory.create_task(d);
    ASSERT_TRUE(created.is_ok());
    ASSERT_TRUE(scheduler.add_task(created.value()).is_ok());
  }

  ASSERT_TRUE(scheduler.run_all().is_ok());

  const auto s = scheduler.summary();
  ASSERT_EQ(s.total, 4u);
  ASSERT_EQ(s.completed, 4u);
  ASSERT_EQ(s.failed, 0u);
  ASSERT_EQ(s.pending, 0u);
  ASSERT_EQ(s.running, 0u);

  // Two transitions per task, one completion message per task.
  ASSERT_EQ(logger->lines_for("task_status_changed").size(), 8u);
  ASSERT_EQ(logger->lines_for("work_done").size(), 4u);
  ASSERT_TRUE(logger->contains("Task 2 (Backup Database) status changed: "
                               "Running -> Completed"));
  ASSERT_EQ(logger->lines_for("run_finished").size(), 1u);
}

TEST(TaskScheduler, FailureDoesNotAbortSiblings) {
  auto logger = std::make_shared<RecordingLogger>();
  TaskScheduler scheduler(workers(2), logger);

  auto ok1 = std::make_shared<LambdaTask>(1, "ok-1", succeed());
  auto bad = std::make_shared<LambdaTask>(2, "bad", fail("mailbox full"));
  auto ok2 = std::make_shared<LambdaTask>(3, "ok-2", succeed());
  ASSERT_TRUE(scheduler.add_task(ok1).is_ok());
  ASSERT_TRUE(scheduler.add_task(bad).is_ok());
  ASSERT_TRUE(scheduler.add_task(ok2).is_ok());

  ASSERT_TRUE(scheduler.run_all().is_ok());

  ASSERT_EQ(ok1->status(), TaskStatus::Completed);
  ASSERT_EQ(bad->status(), TaskStatus::Failed);
  ASSERT_EQ(ok2->status(), TaskStatus::Completed);
  ASSERT_EQ(scheduler.summary().failed, 1u);

  std::vector<RecordingLogger::Line> warned;
  for (const auto &line : logger->lines_for("task_status_changed")) {
    if (line.level == "warn") {
      warned.push_back(line);
    }
  }
  ASSERT_EQ(warned.size(), 1u);
  ASSERT_EQ(warned[0].trace_id, "task-2");
  ASSERT_NE(warned[0].msg.find("Running -> Failed"), std::string::npos);
  ASSERT_NE(warned[0].msg.find("mailbox full"), std::string::npos);
}

TEST(TaskScheduler, NonStandardThrowIsContainedInItsTask) {
  auto logger = std::make_shared<RecordingLogger>();
  TaskScheduler scheduler(workers(2), logger);

  auto rogue = std::make_shared<LambdaTask>(1, "rogue", []() -> Result<void, TaskError> {
    throw 42;
  });
  auto a = std::make_shared<LambdaTask>(2, "a", succeed());
  auto b = std::make_shared<LambdaTask>(3, "b", succeed());
  ASSERT_TRUE(scheduler.add_task(rogue).is_ok());
  ASSERT_TRUE(scheduler.add_task(a).is_ok());
  ASSERT_TRUE(scheduler.add_task(b).is_ok());

  ASSERT_TRUE(scheduler.run_all().is_ok());
  ASSERT_EQ(rogue->status(), TaskStatus::Failed);
  ASSERT_EQ(rogue->error()->category, ErrorCategory::TaskExecution);
  ASSERT_EQ(a->status(), TaskStatus::Completed);
  ASSERT_EQ(b->status(), TaskStatus::Completed);

  const auto s = scheduler.summary();
  ASSERT_EQ(s.running, 0u);
  ASSERT_EQ(s.failed, 1u);
  ASSERT_TRUE(logger->lines_for("run_fault").empty());
  ASSERT_EQ(logger->lines_for("run_finished").size(), 1u);
}

TEST(TaskScheduler, RunningTwiceDoesNotRepeatWork) {
  TaskScheduler scheduler(workers(2));
  auto task = std::make_shared<LambdaTask>(1, "once", succeed());
  ASSERT_TRUE(scheduler.add_task(task).is_ok());

  ASSERT_TRUE(scheduler.run_all().is_ok());
  ASSERT_TRUE(scheduler.run_all().is_ok());
  ASSERT_EQ(task->executions(), 1);
}

TEST(TaskScheduler, SingleWorkerStartsTasksInInsertionOrder) {
  Journal journal;
  TaskScheduler scheduler(workers(1));

  for (int id = 1; id <= 5; ++id) {
    auto task = std::make_shared<LambdaTask>(id, "t", [&journal, id]() {
      journal.push(std::to_string(id));
      return Result<void, TaskError>::Ok();
    });
    ASSERT_TRUE(scheduler.add_task(task).is_ok());
  }

  ASSERT_TRUE(scheduler.run_all().is_ok());
  const std::vector<std::string> expected = {"1", "2", "3", "4", "5"};
  ASSERT_EQ(journal.snapshot(), expected);
}

// ============================================================
// Test: Concurrency bounds
// ============================================================

TEST(TaskScheduler, WideEnoughPoolRunsTasksInParallel) {
  ConcurrencyProbe probe;
  TaskScheduler scheduler(workers(5));
  const std::vector<int> units = {2, 3, 1, 2};
  for (size_t i = 0; i < units.size(); ++i) {
    ASSERT_TRUE(scheduler
                    .add_task(std::make_shared<LambdaTask>(
                        static_cast<int>(i) + 1, "t",
                        sleep_for(std::chrono::milliseconds(50 * units[i]),
                                  &probe)))
                    .is_ok());
  }

  const auto start = Clock::now();
  ASSERT_TRUE(scheduler.run_all().is_ok());
  const auto ms = elapsed_ms(start);

  // Roughly the longest task, not the sum (400 ms).
  ASSERT_GE(ms, 140);
  ASSERT_LT(ms, 350);
  ASSERT_EQ(probe.max_running(), 4);
  ASSERT_EQ(scheduler.summary().completed, 4u);
}

TEST(TaskScheduler, PoolSizeBoundsConcurrency) {
  ConcurrencyProbe probe;
  TaskScheduler scheduler(workers(2));
  for (int id = 1; id <= 4; ++id) {
    ASSERT_TRUE(scheduler
                    .add_task(std::make_shared<LambdaTask>(
                        id, "t", sleep_for(std::chrono::milliseconds(100), &probe)))
                    .is_ok());
  }

  const auto start = Clock::now();
  ASSERT_TRUE(scheduler.run_all().is_ok());
  const auto ms = elapsed_ms(start);

  // Two waves of two.
  ASSERT_GE(ms, 190);
  ASSERT_LT(ms, 380);
  ASSERT_EQ(probe.max_running(), 2);
}
