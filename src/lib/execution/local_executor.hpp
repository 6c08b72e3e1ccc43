#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "abstract_executor.hpp"
#include "scheduler/worker/task_scheduler.hpp"

namespace seqpart {

/**
 * Runs jobs on an in-process thread pool through the TaskScheduler. Jobs may call ExecuteAll() themselves; the waiting
 * pool thread then processes queued jobs until its own batch is done.
 */
class LocalExecutor : public AbstractExecutor {
 public:
  /**
   * Sizes the pool to kLocalExecutorThreadsPerCpu threads per available core.
   */
  LocalExecutor();
  explicit LocalExecutor(size_t num_threads);

  void ExecuteAll(const std::vector<std::function<void()>>& jobs) override;
  size_t Concurrency() const override;

 private:
  std::unique_ptr<TaskScheduler> scheduler_;
};

}  // namespace seqpart
