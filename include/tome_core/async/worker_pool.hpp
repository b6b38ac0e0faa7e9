#pragma once

#include "tome_core/async/worker.hpp"
#include <memory>
#include <vector>

namespace tome_core {
class ServiceProvider;
}

namespace tome_core::async {

/**
 * @class WorkerPool
 * @brief Manages a collection of Worker threads for concurrent task processing.
 *
 * This class is responsible for the entire lifecycle of the worker threads:
 * creating them, starting them, and ensuring they are safely shut down
 * when the pool is destroyed. It follows the RAII principle.
 */
class WorkerPool {
public:
    /**
     * @brief Constructs the WorkerPool and creates the worker instances.
     *
     * @param num_threads The number of worker threads to create in the pool.
     * @param services The queue and pipeline shared by every worker.
     * @throw std::invalid_argument if num_threads is zero.
     */
    WorkerPool(size_t num_threads, std::shared_ptr<ServiceProvider> services);

    /**
     * @brief Destructor. Automatically stops and joins all worker threads.
     */
    ~WorkerPool();

    /**
     * @brief Starts all worker threads in the pool.
     */
    void start();

    /**
     * @brief Signals all worker threads in the pool to stop.
     *
     * The workers will finish their current tasks and then exit their loops.
     * This method does not block. The destructor ensures waiting is handled.
     */
    void stop();

    size_t size() const { return m_workers.size(); }
    bool is_running() const { return m_is_running; }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

private:
    std::vector<std::unique_ptr<Worker>> m_workers;
    bool m_is_running = false;
};

} // namespace tome_core::async
