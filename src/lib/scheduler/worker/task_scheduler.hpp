#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

#include "scheduler/worker/abstract_task.hpp"
#include "scheduler/worker/task_executor.hpp"
#include "types.hpp"

namespace seqpart {

class TaskScheduler : public Noncopyable {
 public:
  /**
   * Constructs a new scheduler with a thread pool sized to the number of available cores.
   */
  TaskScheduler();

  /**
   * Constructs a new scheduler with a fixed thread pool size.
   */
  explicit TaskScheduler(size_t num_threads);

  /**
   * Blocks until all tasks of this scheduler are finished.
   */
  void WaitForAllTasks();

  /**
   * Schedules the given tasks for execution and returns immediately. If no asynchronicity is needed, prefer
   * ScheduleAndWaitForTasks.
   */
  void ScheduleTasks(const std::vector<std::shared_ptr<AbstractTask>>& tasks);

  /**
   * Blocks until all specified tasks are completed. When called from one of the scheduler's own threads, the calling
   * thread keeps processing queued tasks while it waits.
   */
  void WaitForTasks(const std::vector<std::shared_ptr<AbstractTask>>& tasks);

  void ScheduleAndWaitForTasks(const std::vector<std::shared_ptr<AbstractTask>>& tasks);

  void Schedule(const std::shared_ptr<AbstractTask>& task);

  size_t NumThreads() const { return executor_.NumThreads(); }

 private:
  void OnTaskFinished();

  std::atomic<TaskId> next_task_id_ = 0;
  std::atomic<size_t> num_scheduled_tasks_ = 0;
  std::mutex lock_;
  std::condition_variable lock_condition_;
  // Declared last, so its threads are joined before the members above are destroyed.
  TaskExecutor executor_;
};

}  // namespace seqpart
