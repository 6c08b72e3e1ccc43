#pragma once

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "types.hpp"

namespace seqpart {

/**
 * @brief Overview of the different task states and involved transitions:
 *
 *    +-----------+
 *    |  Created  |
 *    +-----------+
 *          | TaskScheduler::Schedule()
 *          v
 *    +-----------+
 *    | Scheduled |
 *    +-----------+
 *          | handed to the TaskExecutor
 *          v
 *    +-----------+
 *    | Enqueued  |
 *    +-----------+
 *          | Execute()
 *          v
 *    +-----------+
 *    |  Started  |
 *    +-----------+
 *          | OnExecute() returns or throws
 *          v
 *    +-----------+
 *    |   Done    |
 *    +-----------+
 *
 * A task whose OnExecute() throws still reaches TaskState::kDone. The exception is kept and can be inspected with
 * Exception() or rethrown with RethrowIfFailed() by the thread that joins the task.
 */

// The state enum values are declared in progressive order to allow for comparisons involving the >, >= operators.
enum class TaskState { kCreated, kScheduled, kEnqueued, kStarted, kDone };
static_assert(static_cast<std::underlying_type_t<TaskState>>(TaskState::kCreated) == 0,
              "TaskState::kCreated is not equal to 0. TaskState enum values are expected to be ordered.");

/**
 * Base class for anything that can be scheduled by the TaskScheduler and executed by a TaskExecutor.
 *
 * Derive and implement logic in OnExecute()
 */
class AbstractTask : public std::enable_shared_from_this<AbstractTask> {
 public:
  virtual ~AbstractTask() = default;

  /**
   * Unique ID of a task, assigned on scheduling. Only used for debugging.
   */
  TaskId Id() const;
  void SetId(TaskId id);

  bool IsScheduled() const;
  bool IsDone() const;

  /**
   * @return true if OnExecute() threw. Only meaningful once the task is done.
   */
  bool Failed() const;
  std::exception_ptr Exception() const;
  void RethrowIfFailed() const;

  virtual std::string Description() const;
  void SetDescription(std::string description);

  bool TryTransitionToScheduled();
  bool TryTransitionToEnqueued();

  /**
   * Callback to be executed right after the Task finished.
   * Notice the execution of the callback might happen on ANY thread.
   */
  void SetDoneCallback(std::function<void()> done_callback);

  /**
   * Executes the task in the current thread and blocks until OnExecute() returns.
   */
  void Execute();

  /**
   * Blocks the calling thread until the Task finished executing.
   */
  void Join();

  TaskState State() const;

 protected:
  virtual void OnExecute() = 0;

  /**
   * Transitions the task's state to @param new_state.
   * @return true on success and
   *          false if another caller/thread/worker was faster in progressing this task's state.
   */
  [[nodiscard]] bool TryTransitionTo(TaskState new_state);

 private:
  std::atomic<TaskId> id_ = kInvalidTaskId;
  std::function<void()> done_callback_;
  std::exception_ptr exception_;

  std::atomic<TaskState> state_ = TaskState::kCreated;
  std::mutex transition_to_mutex_;

  // For making Tasks Join()-able.
  std::condition_variable done_condition_variable_;
  std::mutex done_condition_variable_mutex_;

  std::string description_;
};

}  // namespace seqpart
