#include "tome_core/async/worker_pool.hpp"

#include <iostream>
#include <stdexcept>

namespace tome_core::async {

WorkerPool::WorkerPool(size_t num_threads, std::shared_ptr<ServiceProvider> services) {
    if (num_threads == 0) {
        throw std::invalid_argument("WorkerPool must have at least one thread.");
    }

    m_workers.reserve(num_threads);

    for (size_t i = 0; i < num_threads; ++i) {
        m_workers.emplace_back(std::make_unique<Worker>(static_cast<int>(i), services));
    }
    std::cout << "WorkerPool created with " << num_threads << " workers."
              << std::endl;
}

WorkerPool::~WorkerPool() {
    if (m_is_running) {
        stop();
    }
    // Worker destructors join their threads.
}

void WorkerPool::start() {
    if (m_is_running) {
        std::cerr << "Warning: WorkerPool is already running." << std::endl;
        return;
    }
    std::cout << "Starting all workers in the pool..." << std::endl;
    for (const auto& worker : m_workers) {
        worker->start();
    }
    m_is_running = true;
}

void WorkerPool::stop() {
    if (!m_is_running) {
        return;
    }
    std::cout << "Stopping all workers in the pool..." << std::endl;
    for (const auto& worker : m_workers) {
        worker->stop();
    }
    m_is_running = false;
}

} // namespace tome_core::async
