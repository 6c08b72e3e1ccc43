#include "scheduler/worker/task_scheduler.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "scheduler/worker/generic_task.hpp"

namespace seqpart {

class TaskSchedulerTest : public ::testing::Test {
 protected:
  static void IncrementCounterInSubtasks(std::atomic_uint32_t* counter, TaskScheduler* scheduler) {
    for (size_t i = 0; i < 10; ++i) {
      auto task = std::make_shared<GenericTask>([counter, scheduler]() {
        std::vector<std::shared_ptr<AbstractTask>> jobs;
        for (size_t j = 0; j < 3; ++j) {
          auto job = std::make_shared<GenericTask>([counter]() { (*counter)++; });

          scheduler->Schedule(job);
          jobs.emplace_back(job);
        }

        scheduler->WaitForTasks(jobs);
      });
      scheduler->Schedule(task);
    }
  }
};

/**
 * Schedule some tasks with subtasks, make sure all of them finish
 */
TEST_F(TaskSchedulerTest, BasicTest) {
  TaskScheduler scheduler;
  std::atomic_uint32_t counter = 0;

  IncrementCounterInSubtasks(&counter, &scheduler);
  scheduler.WaitForAllTasks();

  ASSERT_EQ(counter, 30u);
}

TEST_F(TaskSchedulerTest, SingleWorkerGuaranteeProgress) {
  TaskScheduler scheduler(1);

  std::atomic_bool task_done = false;
  auto task = std::make_shared<GenericTask>([&]() {
    auto subtask = std::make_shared<GenericTask>([&]() { task_done = true; });

    scheduler.Schedule(subtask);
    scheduler.WaitForTasks(std::vector<std::shared_ptr<AbstractTask>>{subtask});
  });

  scheduler.Schedule(task);
  scheduler.WaitForAllTasks();
  EXPECT_TRUE(task_done);
}

TEST_F(TaskSchedulerTest, WaitForTasks) {
  std::atomic_bool task_1_is_finished = false;
  auto task_1 = std::make_shared<GenericTask>([&task_1_is_finished]() { task_1_is_finished = true; });

  std::atomic_bool is_running = true;
  std::atomic_bool task_2_is_finished = false;
  auto task_2 = std::make_shared<GenericTask>([&is_running, &task_2_is_finished]() {
    while (is_running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    task_2_is_finished = true;
  });

  TaskScheduler scheduler(2);
  scheduler.Schedule(task_2);
  scheduler.ScheduleAndWaitForTasks({task_1});

  EXPECT_TRUE(task_1_is_finished);
  EXPECT_FALSE(task_2_is_finished);
  is_running = false;
  scheduler.WaitForAllTasks();
  EXPECT_TRUE(task_2_is_finished);
}

TEST_F(TaskSchedulerTest, SchedulingTwiceRunsOnce) {
  TaskScheduler scheduler(2);
  std::atomic_uint32_t counter = 0;
  auto task = std::make_shared<GenericTask>([&counter]() { ++counter; });

  scheduler.Schedule(task);
  scheduler.Schedule(task);
  scheduler.WaitForAllTasks();

  EXPECT_EQ(counter, 1u);
  EXPECT_TRUE(task->IsDone());
  EXPECT_NE(task->Id(), kInvalidTaskId);
}

TEST_F(TaskSchedulerTest, FailingTaskKeepsItsException) {
  TaskScheduler scheduler(2);
  auto failing_task = std::make_shared<GenericTask>([]() { throw std::runtime_error("scan failed"); });
  auto succeeding_task = std::make_shared<GenericTask>([]() {});

  scheduler.ScheduleAndWaitForTasks({failing_task, succeeding_task});

  EXPECT_EQ(failing_task->State(), TaskState::kDone);
  EXPECT_TRUE(failing_task->Failed());
  EXPECT_FALSE(succeeding_task->Failed());
  EXPECT_THROW(failing_task->RethrowIfFailed(), std::runtime_error);
  EXPECT_NO_THROW(succeeding_task->RethrowIfFailed());
}

TEST_F(TaskSchedulerTest, Description) {
  auto task = std::make_shared<GenericTask>([]() {});
  task->SetDescription("scan range 3");
  EXPECT_EQ(task->Description(), "scan range 3");
}

}  // namespace seqpart
