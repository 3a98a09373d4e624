/**
 * @file ShutdownCoordinator.hpp
 * @brief Explicit, ordered shutdown of the replication service.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "application/Dispatcher.hpp"

namespace forker::application {

enum class ShutdownPhase {
    Accepting,
    Draining,
    Stopped
};

inline std::string ShutdownPhaseToString(ShutdownPhase phase) {
    switch (phase) {
        case ShutdownPhase::Accepting: return "Accepting";
        case ShutdownPhase::Draining: return "Draining";
        case ShutdownPhase::Stopped: return "Stopped";
    }
    return "Unknown";
}

/**
 * @class ShutdownCoordinator
 * @brief Runs the shutdown sequence instead of relying on destructor order.
 *
 * 1. stop admission and timer ticks (the current tick completes);
 * 2. Draining: wait up to the grace period for executing steps, then raise
 *    the hard stop so copies and hashes abandon at their next chunk;
 * 3. release resources in registration order, then Stopped.
 */
class ShutdownCoordinator {
public:
    ShutdownCoordinator(std::shared_ptr<Dispatcher> dispatcher, std::chrono::milliseconds gracePeriod);

    /** @brief Registers a release step that runs after the worker threads are joined. */
    void addReleaseStep(std::string name, std::function<void()> step);

    /** @brief Idempotent. Concurrent callers block until the first one completes. */
    void shutdown();

    ShutdownPhase phase() const;

    /** @brief Waits until @p target (or a later phase) is reached. */
    bool waitForPhase(ShutdownPhase target, std::chrono::milliseconds timeout);

private:
    void setPhase(ShutdownPhase phase);

    std::shared_ptr<Dispatcher> m_dispatcher;
    std::chrono::milliseconds m_gracePeriod;
    std::vector<std::pair<std::string, std::function<void()>>> m_releaseSteps;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    ShutdownPhase m_phase = ShutdownPhase::Accepting;
    bool m_started = false;
};

} // namespace forker::application
