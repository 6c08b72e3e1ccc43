#pragma once

#include <functional>
#include <vector>

#include "types.hpp"

namespace seqpart {

/**
 * The execution collaborator. It accepts a batch of opaque jobs, runs them in any order and with any degree of
 * parallelism, and returns once every job has finished. If jobs threw, the exception of the lowest-indexed failing job
 * is rethrown after all jobs have finished.
 */
class AbstractExecutor : public Noncopyable {
 public:
  virtual ~AbstractExecutor() = default;

  virtual void ExecuteAll(const std::vector<std::function<void()>>& jobs) = 0;

  /**
   * Number of jobs this executor can run at the same time.
   */
  virtual size_t Concurrency() const = 0;
};

}  // namespace seqpart
