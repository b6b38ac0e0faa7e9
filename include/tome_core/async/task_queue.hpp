#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tome_core/async/ITask.hpp"
#include "tome_core/async/task.hpp"

namespace tome_core {

/**
 * @class TaskQueue
 * @brief Thread-safe FIFO of pending tasks plus a record of every task's status.
 *
 * Tasks are handed to exactly one worker. Records outlive the tasks so that
 * callers can inspect which documents completed or failed.
 */
class TaskQueue {
 public:
  TaskQueue() = default;

  TaskQueue(const TaskQueue&) = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;

  /**
   * @brief Assigns an id to the task and appends it to the queue.
   * @return The id of the queued task.
   */
  long long enqueue(ITaskPtr task);

  // Pops the oldest pending task and marks it PROCESSING; nullptr when empty.
  ITaskPtr fetch_and_claim_next_task();

  // Like fetch_and_claim_next_task() but waits up to timeout for a task.
  ITaskPtr wait_and_claim_next_task(std::chrono::milliseconds timeout);

  void update_task_status(long long task_id, TaskStatus status);
  void mark_task_as_failed(long long task_id, const std::string& error_message);

  std::optional<TaskRecord> get_task(long long task_id) const;
  std::vector<TaskRecord> get_tasks_by_status(TaskStatus status) const;
  size_t pending_count() const;

 private:
  ITaskPtr claim_front_locked();
  void set_status_locked(long long task_id, TaskStatus status);

  mutable std::mutex mutex_;
  std::condition_variable task_available_;
  std::deque<ITaskPtr> pending_;
  std::map<long long, TaskRecord> records_;
  long long next_id_ = 1;
};

}  // namespace tome_core
