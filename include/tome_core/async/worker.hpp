#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "tome_core/async/ITask.hpp"

namespace tome_core {
class ServiceProvider;
}

namespace tome_core {
namespace async {

/**
 * @class Worker
 * @brief A background thread that takes tasks from the TaskQueue and runs them.
 *
 * Workers share nothing but the queue and the read-only pipeline, so any
 * number of them can index documents side by side. A Worker is non-copyable
 * and non-movable to keep ownership of its thread clear.
 */
 class Worker {
  public:
      // How long an idle worker waits for a task before checking its stop flag.
      static constexpr std::chrono::milliseconds IDLE_WAIT{100};

      /**
       * @brief Constructs a Worker instance.
       * @param worker_id A unique identifier for this worker, used for logging.
       * @param services A shared pointer to the service provider.
       */
      Worker(int worker_id, std::shared_ptr<ServiceProvider> services);

      /**
       * @brief Destructor. Stops and joins the worker thread.
       */
      ~Worker();

      /**
       * @brief Starts the processing loop in a new background thread.
       *
       * Throws std::runtime_error if the worker is already running.
       */
      void start();

      /**
       * @brief Signals the worker to stop after its current task.
       *
       * Does not block; the destructor joins the thread.
       */
      void stop();

      Worker(const Worker&) = delete;
      Worker& operator=(const Worker&) = delete;
      Worker(Worker&&) = delete;
      Worker& operator=(Worker&&) = delete;

      /**
       * @brief Runs at most one pending task on the calling thread.
       * @return true if a task was taken from the queue (whether it succeeded or not).
       */
      bool run_one_task();

  private:
      void run_loop();
      void execute_task(ITaskPtr task);

      int worker_id_;
      std::shared_ptr<ServiceProvider> services_;
      std::atomic<bool> should_stop{false};
      std::thread thread;
  };
}
}
