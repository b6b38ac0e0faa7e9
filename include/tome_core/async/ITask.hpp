#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "tome_core/async/task.hpp"

namespace tome_core {
class ServiceProvider;
}
using ProgressUpdater = std::function<void(float, const std::string&)>;

namespace tome_core {
class ITask {
 public:
  ITask(long long id,
        TaskStatus status,
        std::chrono::system_clock::time_point created_at,
        std::chrono::system_clock::time_point updated_at,
        std::optional<std::string> error_message)
      : id_(id),
        status_(status),
        created_at_(created_at),
        updated_at_(updated_at),
        error_message_(error_message) {}

  virtual ~ITask() = default;

  virtual void execute(ServiceProvider& services, const ProgressUpdater& on_progress) = 0;

  // Called by the worker when execute() threw.
  virtual void on_failed(std::exception_ptr /*error*/) {}

  virtual const char* get_type() const = 0;

  // What the task works on, for logs and task records.
  virtual std::string get_target() const = 0;

  long long get_id() const {
    return id_;
  }
  void set_id(long long id) {
    id_ = id;
  }
  TaskStatus get_status() const {
    return status_;
  }
  void set_status(TaskStatus status) {
    status_ = status;
    updated_at_ = std::chrono::system_clock::now();
  }
  std::chrono::system_clock::time_point get_created_at() const {
    return created_at_;
  }

 protected:
  long long id_;
  TaskStatus status_;
  std::chrono::system_clock::time_point created_at_;
  std::chrono::system_clock::time_point updated_at_;
  std::optional<std::string> error_message_;
};

using ITaskPtr = std::unique_ptr<ITask>;
}  // namespace tome_core
