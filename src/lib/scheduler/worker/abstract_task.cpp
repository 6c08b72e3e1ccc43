#include "abstract_task.hpp"

#include <string>
#include <utility>

#include "utils/assert.hpp"

namespace seqpart {

TaskId AbstractTask::Id() const { return id_; }

void AbstractTask::SetId(TaskId id) { id_ = id; }

bool AbstractTask::IsScheduled() const { return state_ >= TaskState::kScheduled; }

bool AbstractTask::IsDone() const { return state_ == TaskState::kDone; }

bool AbstractTask::Failed() const { return exception_ != nullptr; }

std::exception_ptr AbstractTask::Exception() const {
  DebugAssert(IsDone(), "The outcome of a task is only known once it is done.");
  return exception_;
}

void AbstractTask::RethrowIfFailed() const {
  if (Failed()) {
    std::rethrow_exception(exception_);
  }
}

std::string AbstractTask::Description() const {
  return description_.empty() ? "{Task with id: " + std::to_string(id_) + "}" : description_;
}

void AbstractTask::SetDescription(std::string description) { description_ = std::move(description); }

void AbstractTask::SetDoneCallback(std::function<void()> done_callback) {
  DebugAssert(!IsScheduled(), "Possible race: Do not set callback after the Task was scheduled.");

  done_callback_ = std::move(done_callback);
}

void AbstractTask::Join() {
  std::unique_lock<std::mutex> lock(done_condition_variable_mutex_);

  if (IsDone()) {
    return;
  }

  DebugAssert(IsScheduled(), "Task must be scheduled before it can be waited for.");
  done_condition_variable_.wait(lock, [&]() { return IsDone(); });
}

void AbstractTask::Execute() {
  const bool success_started = TryTransitionTo(TaskState::kStarted);
  Assert(success_started, "Expected successful transition to TaskState::kStarted.");

  // We need to make sure that data written by the scheduling thread is visible in the thread executing the task.
  std::atomic_thread_fence(std::memory_order_seq_cst);

  try {
    OnExecute();
  } catch (...) {
    // Handed to whoever joins the task, see RethrowIfFailed().
    exception_ = std::current_exception();
  }

  std::unique_lock<std::mutex> lock(done_condition_variable_mutex_);
  const bool success_done = TryTransitionTo(TaskState::kDone);
  Assert(success_done, "Expected successful transition to TaskState::kDone.");
  lock.unlock();

  if (done_callback_) {
    done_callback_();
  }

  done_condition_variable_.notify_all();
}

TaskState AbstractTask::State() const { return state_; }

bool AbstractTask::TryTransitionTo(TaskState new_state) {
  const std::lock_guard<std::mutex> lock(transition_to_mutex_);
  switch (new_state) {
    case TaskState::kScheduled:
      if (state_ >= TaskState::kScheduled) {
        return false;
      }
      Assert(state_ == TaskState::kCreated, "Illegal state transition to TaskState::kScheduled.");
      break;
    case TaskState::kEnqueued:
      if (state_ >= TaskState::kEnqueued) {
        return false;
      }
      Assert(state_ == TaskState::kScheduled, "Illegal state transition to TaskState::kEnqueued.");
      break;
    case TaskState::kStarted:
      Assert(state_ == TaskState::kEnqueued,
             "Illegal state transition to TaskState::kStarted: Task should have been enqueued before being executed.");
      break;
    case TaskState::kDone:
      Assert(state_ == TaskState::kStarted, "Illegal state transition to TaskState::kDone.");
      break;
    default:
      Fail("Unexpected target state in AbstractTask.");
  }

  state_.exchange(new_state);
  return true;
}

/**
 * Try to change the state of the task to TaskState::kScheduled.
 * @return false if the task is already scheduled, true otherwise.
 */
bool AbstractTask::TryTransitionToScheduled() { return TryTransitionTo(TaskState::kScheduled); }

/**
 * Try to change the state of the task to TaskState::kEnqueued.
 * @return false if the task is already submitted, true otherwise.
 */
bool AbstractTask::TryTransitionToEnqueued() { return TryTransitionTo(TaskState::kEnqueued); }

}  // namespace seqpart
