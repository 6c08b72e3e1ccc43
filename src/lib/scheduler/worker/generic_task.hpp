#pragma once

#include <functional>
#include <utility>

#include "abstract_task.hpp"

namespace seqpart {

/**
 * A general purpose Task for any kind of work that fits into a void()-function.
 *
 * Usage example:
 *
 * TaskScheduler scheduler(4);
 * std::atomic_uint32_t c = 0;
 *
 * auto job0 = std::make_shared<GenericTask>([&c]() { ++c; });
 * auto job1 = std::make_shared<GenericTask>([&c]() { ++c; });
 * scheduler.ScheduleAndWaitForTasks({job0, job1});
 *
 * // c == 2 now
 */
class GenericTask : public AbstractTask {
 public:
  explicit GenericTask(std::function<void()> task_function) : task_function_(std::move(task_function)) {}

 protected:
  void OnExecute() override;

 private:
  std::function<void()> task_function_;
};

}  // namespace seqpart
