#include <gtest/gtest.h>

#include "core/task_factory.h"
#include "core/task_variants.h"
#include "test_support.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace taskrun::core;
using namespace taskrun::test_support;

namespace {

constexpr std::chrono::milliseconds kUnit{5};

TaskDescription describe(int id, std::string name, std::string type) {
  TaskDescription d;
  d.task_id = id;
  d.name = std::move(name);
  d.type = std::move(type);
  return d;
}

} // namespace

TEST(TaskFactory, EmailTaskRunsToCompletionAndIdentifiesTask) {
  auto logger = std::make_shared<RecordingLogger>();
  TaskFactory factory(logger, kUnit);

  auto created = factory.create_task(describe(1, "x", "email"));
  ASSERT_TRUE(created.is_ok());
  auto task = std::move(created).value();

  ASSERT_EQ(task->id(), 1);
  ASSERT_EQ(task->name(), "x");
  ASSERT_EQ(task->kind(), "email");
  ASSERT_EQ(task->status(), TaskStatus::Pending);

  ASSERT_EQ(task->run(), TaskStatus::Completed);

  auto work_lines = logger->lines_for("work_done");
  ASSERT_EQ(work_lines.size(), 1u);
  ASSERT_EQ(work_lines[0].component, "EmailTask");
  ASSERT_EQ(work_lines[0].msg, "Sending email for Task 1");
}

TEST(TaskFactory, VariantsCarryTheirDurationsAndMessages) {
  TaskFactory factory(nullptr, kUnit);

  struct Case {
    const char *type;
    int units;
    const char *message;
  };
  const std::vector<Case> cases = {
      {"email", 2, "Sending email for Task 7"},
      {"backup", 3, "Backing up data for Task 7"},
      {"report", 1, "Generating report for Task 7"},
  };

  for (const auto &c : cases) {
    auto created = factory.create_task(describe(7, "n", c.type));
    ASSERT_TRUE(created.is_ok()) << c.type;
    auto simulated = std::dynamic_pointer_cast<SimulatedTask>(created.value());
    ASSERT_NE(simulated, nullptr) << c.type;
    ASSERT_EQ(simulated->kind(), c.type);
    ASSERT_EQ(simulated->duration(), kUnit * c.units) << c.type;
    ASSERT_EQ(simulated->completion_message(), c.message);
  }
}

TEST(TaskFactory, ConcreteClassesSelectedByDiscriminant) {
  TaskFactory factory(nullptr, kUnit);
  auto email = factory.create_task(describe(1, "a", "email"));
  auto backup = factory.create_task(describe(2, "b", "backup"));
  auto report = factory.create_task(describe(3, "c", "report"));
  ASSERT_NE(std::dynamic_pointer_cast<EmailTask>(email.value()), nullptr);
  ASSERT_NE(std::dynamic_pointer_cast<BackupTask>(backup.value()), nullptr);
  ASSERT_NE(std::dynamic_pointer_cast<ReportTask>(report.value()), nullptr);
}

TEST(TaskFactory, UnknownTypeIsRejected) {
  TaskFactory factory(nullptr, kUnit);

  auto created = factory.create_task(describe(2, "y", "bogus"));
  ASSERT_TRUE(created.is_err());
  ASSERT_EQ(created.error().category, ErrorCategory::UnknownTaskType);
  ASSERT_EQ(created.error().code, kUnknownTaskTypeCode);
  ASSERT_EQ(created.error().details.at("type"), "bogus");
  ASSERT_NE(created.error().message.find("bogus"), std::string::npos);
}

TEST(TaskFactory, DiscriminantIsCaseSensitive) {
  TaskFactory factory(nullptr, kUnit);
  ASSERT_TRUE(factory.create_task(describe(1, "a", "Email")).is_err());
  ASSERT_TRUE(factory.create_task(describe(1, "a", "")).is_err());
}

TEST(TaskFactory, OnlyTypeIsValidated) {
  TaskFactory factory(nullptr, kUnit);
  // Duplicate ids and empty names are the caller's business.
  ASSERT_TRUE(factory.create_task(describe(5, "", "report")).is_ok());
  ASSERT_TRUE(factory.create_task(describe(5, "", "report")).is_ok());
  ASSERT_TRUE(factory.create_task(describe(-1, "neg", "backup")).is_ok());
}

TEST(TaskFactory, BuiltInTypesListed) {
  TaskFactory factory;
  const std::vector<std::string> expected = {"backup", "email", "report"};
  ASSERT_EQ(factory.types(), expected);
  ASSERT_TRUE(factory.has_type("email"));
  ASSERT_FALSE(factory.has_type("bogus"));
}

TEST(TaskFactory, RegisterCustomType) {
  TaskFactory factory(nullptr, kUnit);
  auto registered = factory.register_type("noop", [](const TaskDescription &d) {
    return std::make_shared<LambdaTask>(d.task_id, d.name, succeed());
  });
  ASSERT_TRUE(registered.is_ok());
  ASSERT_TRUE(factory.has_type("noop"));

  auto created = factory.create_task(describe(9, "custom", "noop"));
  ASSERT_TRUE(created.is_ok());
  ASSERT_EQ(created.value()->kind(), "lambda");
  ASSERT_EQ(created.value()->run(), TaskStatus::Completed);
}

TEST(TaskFactory, RegisterRejectsEmptyTypeAndNullCreator) {
  TaskFactory factory(nullptr, kUnit);
  auto empty_type = factory.register_type("", [](const TaskDescription &d) {
    return std::make_shared<LambdaTask>(d.task_id, d.name, succeed());
  });
  ASSERT_TRUE(empty_type.is_err());
  ASSERT_EQ(empty_type.error().category, ErrorCategory::Internal);

  auto null_creator = factory.register_type("x", nullptr);
  ASSERT_TRUE(null_creator.is_err());
  ASSERT_FALSE(factory.has_type("x"));
}

TEST(TaskFactory, CreatorReturningNullIsAnError) {
  TaskFactory factory(nullptr, kUnit);
  ASSERT_TRUE(factory
                  .register_type("broken",
                                 [](const TaskDescription &) {
                                   return std::shared_ptr<Task>();
                                 })
                  .is_ok());
  auto created = factory.create_task(describe(1, "b", "broken"));
  ASSERT_TRUE(created.is_err());
  ASSERT_EQ(created.error().category, ErrorCategory::Internal);
}

TEST(SimulatedTask, SleepsForItsDuration) {
  ReportTask task(3, "Sales Report", std::chrono::milliseconds(30));
  const auto start = std::chrono::steady_clock::now();
  ASSERT_EQ(task.run(), TaskStatus::Completed);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  ASSERT_GE(elapsed, std::chrono::milliseconds(30));
}
