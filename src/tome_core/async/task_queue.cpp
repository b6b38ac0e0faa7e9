#include "tome_core/async/task_queue.hpp"

#include <stdexcept>

namespace tome_core {

long long TaskQueue::enqueue(ITaskPtr task) {
  if (!task) {
    throw std::invalid_argument("Cannot enqueue a null task.");
  }

  long long task_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    task_id = next_id_++;
    task->set_id(task_id);
    task->set_status(TaskStatus::PENDING);

    TaskRecord record;
    record.id = task_id;
    record.task_type = task->get_type();
    record.target = task->get_target();
    record.status = TaskStatus::PENDING;
    record.created_at = task->get_created_at();
    record.updated_at = std::chrono::system_clock::now();
    records_.emplace(task_id, std::move(record));

    pending_.push_back(std::move(task));
  }
  task_available_.notify_one();
  return task_id;
}

ITaskPtr TaskQueue::fetch_and_claim_next_task() {
  std::lock_guard<std::mutex> lock(mutex_);
  return claim_front_locked();
}

ITaskPtr TaskQueue::wait_and_claim_next_task(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  task_available_.wait_for(lock, timeout, [this] { return !pending_.empty(); });
  return claim_front_locked();
}

ITaskPtr TaskQueue::claim_front_locked() {
  if (pending_.empty()) {
    return nullptr;
  }
  ITaskPtr task = std::move(pending_.front());
  pending_.pop_front();
  task->set_status(TaskStatus::PROCESSING);
  set_status_locked(task->get_id(), TaskStatus::PROCESSING);
  return task;
}

void TaskQueue::update_task_status(long long task_id, TaskStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  set_status_locked(task_id, status);
}

void TaskQueue::mark_task_as_failed(long long task_id, const std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  set_status_locked(task_id, TaskStatus::FAILED);
  records_.at(task_id).error_message = error_message;
}

void TaskQueue::set_status_locked(long long task_id, TaskStatus status) {
  auto it = records_.find(task_id);
  if (it == records_.end()) {
    throw std::out_of_range("Unknown task id: " + std::to_string(task_id));
  }
  it->second.status = status;
  it->second.updated_at = std::chrono::system_clock::now();
}

std::optional<TaskRecord> TaskQueue::get_task(long long task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(task_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<TaskRecord> TaskQueue::get_tasks_by_status(TaskStatus status) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TaskRecord> tasks;
  for (const auto& [id, record] : records_) {
    if (record.status == status) {
      tasks.push_back(record);
    }
  }
  return tasks;
}

size_t TaskQueue::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

}  // namespace tome_core
