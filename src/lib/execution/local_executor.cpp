#include "local_executor.hpp"

#include <algorithm>
#include <string>
#include <thread>

#include <aws/core/utils/logging/LogMacros.h>

#include "configuration.hpp"
#include "scheduler/worker/generic_task.hpp"

namespace seqpart {

LocalExecutor::LocalExecutor()
    : LocalExecutor(std::max(1U, std::thread::hardware_concurrency()) * kLocalExecutorThreadsPerCpu) {}

LocalExecutor::LocalExecutor(size_t num_threads) : scheduler_(std::make_unique<TaskScheduler>(num_threads)) {}

void LocalExecutor::ExecuteAll(const std::vector<std::function<void()>>& jobs) {
  if (jobs.empty()) {
    return;
  }

  std::vector<std::shared_ptr<AbstractTask>> tasks;
  tasks.reserve(jobs.size());
  for (size_t i = 0; i < jobs.size(); ++i) {
    auto task = std::make_shared<GenericTask>(jobs[i]);
    task->SetDescription("LocalExecutor job " + std::to_string(i));
    tasks.emplace_back(std::move(task));
  }

  AWS_LOGSTREAM_DEBUG(kBaseTag.c_str(), "Executing " << tasks.size() << " jobs on " << scheduler_->NumThreads()
                                                     << " threads.");
  scheduler_->ScheduleAndWaitForTasks(tasks);

  for (const auto& task : tasks) {
    task->RethrowIfFailed();
  }
}

size_t LocalExecutor::Concurrency() const { return scheduler_->NumThreads(); }

}  // namespace seqpart
