// RequestQueue.cpp
#include "RequestQueue.hpp"

#include <iostream>

RequestQueue::RequestQueue(bool verbose)
    : m_verbose(verbose) {
    m_worker = std::thread(&RequestQueue::workerLoop, this);
}

RequestQueue::~RequestQueue() {
    shutdown();
}

std::size_t RequestQueue::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void RequestQueue::push(QueuedTask task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            // Dropping the task destroys its packaged_task, which breaks the
            // caller's promise instead of leaving it waiting forever.
            std::cerr << "[RequestQueue] Rejecting '" << task.name << "' after shutdown" << std::endl;
            return;
        }
        m_tasks.push(std::move(task));
    }
    m_taskAvailable.notify_one();
}

void RequestQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_taskAvailable.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void RequestQueue::workerLoop() {
    while (true) {
        QueuedTask task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_taskAvailable.wait(lock, [this] { return m_stopping || !m_tasks.empty(); });
            if (m_tasks.empty()) break; // stopping and drained
            task = std::move(m_tasks.front());
            m_tasks.pop();
        }

        if (m_verbose) {
            std::cout << "[RequestQueue] executing: " << task.name << std::endl;
        }
        // packaged_task captures anything the callable throws.
        task.run();
    }
}
