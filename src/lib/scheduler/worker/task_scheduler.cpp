#include "task_scheduler.hpp"

#include <algorithm>
#include <thread>

#include "utils/assert.hpp"

namespace seqpart {

TaskScheduler::TaskScheduler() : TaskScheduler(std::max(1U, std::thread::hardware_concurrency())) {}

TaskScheduler::TaskScheduler(size_t num_threads) : executor_(num_threads) {}

void TaskScheduler::WaitForAllTasks() {
  std::unique_lock<std::mutex> lock(lock_);
  lock_condition_.wait(lock, [&]() { return num_scheduled_tasks_ == 0; });

  // Make sure that all changes to memory are visible to the calling thread.
  std::atomic_thread_fence(std::memory_order_seq_cst);
}

void TaskScheduler::WaitForTasks(const std::vector<std::shared_ptr<AbstractTask>>& tasks) {
  if (executor_.IsExecutorThread()) {
    const auto is_finished = [&tasks]() -> bool {
      return std::ranges::all_of(tasks, [](const std::shared_ptr<AbstractTask>& task) { return task->IsDone(); });
    };

    while (!is_finished()) {
      executor_.WorkerProcessSingleItemNoWait();
    }
  } else {
    for (const auto& task : tasks) {
      task->Join();
    }
  }

  std::atomic_thread_fence(std::memory_order_seq_cst);
}

void TaskScheduler::Schedule(const std::shared_ptr<AbstractTask>& task) {
  if (!task->TryTransitionToScheduled()) {
    return;
  }

  task->SetId(next_task_id_++);
  ++num_scheduled_tasks_;

  const bool success_enqueued = task->TryTransitionToEnqueued();
  DebugAssert(success_enqueued, "A freshly scheduled task must be enqueueable.");

  executor_.Submit([this, task]() {
    task->Execute();
    OnTaskFinished();
  });
}

void TaskScheduler::OnTaskFinished() {
  // Decrement under the lock, so WaitForAllTasks() cannot miss the notification between its check and its wait.
  std::unique_lock<std::mutex> lock(lock_);
  const size_t num_tasks_still_scheduled = --num_scheduled_tasks_;
  lock.unlock();

  if (num_tasks_still_scheduled == 0) {
    lock_condition_.notify_all();
  }
}

void TaskScheduler::ScheduleTasks(const std::vector<std::shared_ptr<AbstractTask>>& tasks) {
  for (const auto& task : tasks) {
    Schedule(task);
  }
}

void TaskScheduler::ScheduleAndWaitForTasks(const std::vector<std::shared_ptr<AbstractTask>>& tasks) {
  ScheduleTasks(tasks);
  WaitForTasks(tasks);
}

}  // namespace seqpart
