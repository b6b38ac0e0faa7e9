#include "tome_core/async/worker.hpp"

#include <iostream>
#include <stdexcept>

#include "tome_core/async/service_provider.hpp"
#include "tome_core/async/task_queue.hpp"

namespace tome_core {
namespace async {

Worker::Worker(int worker_id, std::shared_ptr<ServiceProvider> services)
    : worker_id_(worker_id), services_(std::move(services)) {
  if (!services_) {
    throw std::invalid_argument("Worker requires a service provider.");
  }
  std::cout << "Worker [" << worker_id_ << "] created." << std::endl;
}

Worker::~Worker() {
  stop();
  // Blocks until the loop has finished its current task.
  if (thread.joinable()) {
    thread.join();
  }
  std::cout << "Worker [" << worker_id_ << "] joined and shut down." << std::endl;
}

void Worker::start() {
  if (thread.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop.store(false);
  thread = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop.store(true);
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;
  TaskQueue& task_queue = services_->get_task_queue();

  while (!should_stop.load()) {
    ITaskPtr task = task_queue.wait_and_claim_next_task(IDLE_WAIT);
    if (task) {
      execute_task(std::move(task));
    }
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_task() {
  ITaskPtr task = services_->get_task_queue().fetch_and_claim_next_task();
  if (!task) {
    return false;
  }
  execute_task(std::move(task));
  return true;
}

void Worker::execute_task(ITaskPtr task) {
  TaskQueue& task_queue = services_->get_task_queue();
  const long long task_id = task->get_id();

  try {
    ProgressUpdater on_progress = [this, task_id](float p, const std::string& msg) {
      std::cout << "Worker [" << worker_id_ << "] task " << task_id << " ("
                << static_cast<int>(p * 100.0f) << "%): " << msg << std::endl;
    };

    task->execute(*services_, on_progress);
    task->set_status(TaskStatus::COMPLETED);
    task_queue.update_task_status(task_id, TaskStatus::COMPLETED);
  } catch (const std::exception& e) {
    std::cerr << "Worker [" << worker_id_ << "] ERROR processing task " << task_id << " ("
              << task->get_target() << "): " << e.what() << std::endl;
    task->set_status(TaskStatus::FAILED);
    task_queue.mark_task_as_failed(task_id, e.what());
    task->on_failed(std::current_exception());
  }
}

}  // namespace async
}  // namespace tome_core
