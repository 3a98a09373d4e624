/**
 * @file WorkerPool.hpp
 * @brief Bounded pool of worker threads for job steps.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace forker::application {

/**
 * @class WorkerPool
 * @brief Fixed number of threads, independent of how many files are in flight.
 *
 * Unlike fire-and-forget threads, every task is accounted for until it
 * returns, so shutdown can wait for in-flight work and then join.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t threadCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queues a task.
     * @return False if the pool has been stopped; the task is not run.
     */
    bool submit(std::function<void()> task);

    size_t threadCount() const { return m_threadCount; }

    /** @brief Tasks queued or running. */
    size_t inFlight() const;

    /** @brief Threads that could start a new task right now. */
    size_t idleCapacity() const;

    /**
     * @brief Waits until no task is queued or running.
     * @return False if the timeout expired first.
     */
    bool waitIdle(std::chrono::milliseconds timeout);

    /** @brief Drops queued tasks, lets running ones finish, joins all threads. Idempotent. */
    void stop();

private:
    void workerLoop();

    size_t m_threadCount;
    std::vector<std::thread> m_threads;
    std::queue<std::function<void()>> m_tasks;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    size_t m_running = 0;
    bool m_stopping = false;
};

} // namespace forker::application
