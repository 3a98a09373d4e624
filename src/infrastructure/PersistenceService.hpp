/**
 * @file PersistenceService.hpp
 * @brief Durable file I/O: synchronous atomic replacement and a serialized append queue.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace forker::infrastructure {

/**
 * @struct AppendTask
 * @brief A block of text to append to a file from the background writer.
 */
struct AppendTask {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Owns all durable writes of the state directory.
 *
 * Record replacement is synchronous (temp file, fsync, rename, directory
 * fsync) so that a state change is on disk before anyone can observe it.
 * Audit appends pass through one background thread so that lines from
 * concurrent jobs never interleave.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    /**
     * @brief Atomically replaces @p filename with @p content and makes it durable.
     * @throws std::runtime_error if any step fails. The previous content is left intact.
     */
    void writeAtomic(const std::string& filename, const std::string& content);

    /**
     * @brief Atomically renames a file and makes the rename durable.
     * @throws std::runtime_error on failure.
     */
    void moveDurable(const std::string& from, const std::string& to);

    /**
     * @brief Queues @p content to be appended to @p filename.
     * Ignored once the service has been stopped.
     */
    void appendAsync(const std::string& filename, const std::string& content);

    /** @brief Blocks until every queued append has been written. */
    void flush();

    /**
     * @brief Stops the worker thread after draining pending appends.
     */
    void stop();

    /** @brief fsync of a directory so that renames and creations inside it survive a crash. */
    static void SyncDirectory(const std::string& directory);

private:
    void workerLoop();
    void performAppend(const AppendTask& task);

    std::queue<AppendTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<unsigned long long> m_tempCounter{0};
};

} // namespace forker::infrastructure
