/**
 * @file ForkerService.hpp
 * @brief Service host for Forker.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

#include "application/ForkerConfig.hpp"
#include "application/ForkerServices.hpp"

namespace forker::app {

/**
 * @class ForkerService
 * @brief Orchestrates the service lifecycle: wiring and recovery, the run loop, and shutdown.
 */
class ForkerService {
public:
    explicit ForkerService(application::ForkerConfig config);
    ~ForkerService();

    /**
     * @brief Initializes, runs until a stop is requested or a fatal fault occurs, then shuts down.
     * @return Exit code (0 for a clean stop, 1 if startup failed or the state store failed).
     */
    int Run();

    /**
     * @brief Offline operator command: returns one quarantined job to work.
     * Must run while the service is stopped; the next start picks the job up.
     * @return Exit code (0 if the job was released).
     */
    int ReleaseFromQuarantine(const std::string& jobId, const std::string& reason);

    /** @brief Thread-safe; may be called from a signal-watching thread. */
    void RequestStop();

    /** @brief Installs SIGINT/SIGTERM handling that requests a stop of the running service. */
    static void InstallSignalHandlers();

    const application::ForkerServices& Services() const { return m_services; }

private:
    /**
     * @brief Builds the components, recovers persisted jobs and starts the dispatcher.
     * @return True if initialization succeeded.
     */
    bool Init();

    /**
     * @brief Runs the shutdown sequence.
     */
    void Shutdown();

    application::ForkerConfig m_config;
    application::ForkerServices m_services; ///< Wired components.

    std::mutex m_stopMutex;
    std::condition_variable m_stopCv;
    bool m_stopRequested = false;
    std::atomic<bool> m_fatal{false};
    bool m_initialized = false;
};

} // namespace forker::app
