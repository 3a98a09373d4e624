/**
 * @file WorkerPool.cpp
 * @brief Implementation of WorkerPool.
 */

#include "application/WorkerPool.hpp"
#include <iostream>
#include <stdexcept>

namespace forker::application {

WorkerPool::WorkerPool(size_t threadCount) : m_threadCount(threadCount) {
    if (threadCount == 0) {
        throw std::invalid_argument("WorkerPool needs at least one thread");
    }
    m_threads.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        m_threads.emplace_back(&WorkerPool::workerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) return false;
        m_tasks.push(std::move(task));
    }
    m_cv.notify_one();
    return true;
}

size_t WorkerPool::inFlight() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size() + m_running;
}

size_t WorkerPool::idleCapacity() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t busy = m_tasks.size() + m_running;
    return busy >= m_threadCount ? 0 : m_threadCount - busy;
}

bool WorkerPool::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCv.wait_for(lock, timeout, [this] {
        return m_tasks.empty() && m_running == 0;
    });
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping && m_threads.empty()) return;
        m_stopping = true;
        if (!m_tasks.empty()) {
            std::cout << "[WorkerPool] Dropping " << m_tasks.size() << " queued task(s) on stop" << std::endl;
        }
        std::queue<std::function<void()>>().swap(m_tasks);
    }
    m_cv.notify_all();
    m_idleCv.notify_all();

    for (auto& t : m_threads) {
        if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
            t.join();
        }
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_threads.clear();
}

void WorkerPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_stopping || !m_tasks.empty(); });
            if (m_stopping) return;
            task = std::move(m_tasks.front());
            m_tasks.pop();
            ++m_running;
        }

        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[WorkerPool] Task failed: " << e.what() << std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_running;
        }
        m_idleCv.notify_all();
    }
}

} // namespace forker::application
