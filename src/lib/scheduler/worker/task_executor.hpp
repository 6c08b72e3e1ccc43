#pragma once

#include <atomic>
#include <functional>
#include <thread>
#include <vector>

#include "types.hpp"
#include "utils/concurrent/concurrent_queue.hpp"

namespace seqpart {

/**
 * A fixed-size thread pool that pops jobs from a shared queue. Jobs must not throw; wrap them into an AbstractTask to
 * capture exceptions.
 */
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions,hicpp-special-member-functions)
class TaskExecutor : public Noncopyable {
 public:
  explicit TaskExecutor(size_t num_threads);
  ~TaskExecutor();

  void Submit(std::function<void()> job);

  /**
   * Runs one queued job if there is any, otherwise yields. Lets an executor thread make progress while it waits for
   * tasks it submitted itself.
   */
  void WorkerProcessSingleItemNoWait();

  /**
   * @return true if the calling thread belongs to this executor's pool.
   */
  bool IsExecutorThread() const;

  size_t NumThreads() const { return thread_pool_.size(); }

 private:
  void WorkerMain();

  std::atomic<bool> is_running_ = true;
  ConcurrentQueue<std::function<void()>> queue_;
  std::vector<std::thread> thread_pool_;
};

}  // namespace seqpart
