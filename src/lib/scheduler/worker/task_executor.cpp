#include "task_executor.hpp"

#include "utils/assert.hpp"

namespace seqpart {

namespace {

// Identifies the pool of the current thread. Thread ids are only known after the threads started, so a thread-local
// avoids synchronizing a shared set of ids.
thread_local const TaskExecutor* current_executor = nullptr;

}  // namespace

TaskExecutor::TaskExecutor(size_t num_threads) {
  Assert(num_threads > 0, "A TaskExecutor needs at least one thread.");
  thread_pool_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    thread_pool_.emplace_back([this]() { WorkerMain(); });
  }
}

TaskExecutor::~TaskExecutor() {
  is_running_ = false;
  queue_.Close();
  for (auto& thread : thread_pool_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

bool TaskExecutor::IsExecutorThread() const { return current_executor == this; }

void TaskExecutor::WorkerMain() {
  current_executor = this;

  std::function<void()> job;
  while (queue_.Pop(&job)) {
    job();
  }
}

void TaskExecutor::WorkerProcessSingleItemNoWait() {
  DebugAssert(IsExecutorThread(), "This function should only be called from an executor thread.");

  std::function<void()> job;
  const bool has_job = queue_.TryPop(&job);
  if (has_job && is_running_) {
    job();
  } else {
    std::this_thread::yield();
  }
}

void TaskExecutor::Submit(std::function<void()> job) {
  const bool accepted = queue_.Push(std::move(job));
  Assert(accepted, "Cannot submit jobs to a TaskExecutor that is shutting down.");
}

}  // namespace seqpart
