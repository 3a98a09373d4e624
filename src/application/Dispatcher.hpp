/**
 * @file Dispatcher.hpp
 * @brief Timer-driven scheduler that admits discovered files and hands job steps to the worker pool.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "application/ForkerConfig.hpp"
#include "application/JobStateMachine.hpp"
#include "application/JobTokenTable.hpp"
#include "application/ReplicationMetrics.hpp"
#include "application/WorkerPool.hpp"
#include "domain/DiscoveredFile.hpp"
#include "domain/FileJob.hpp"

namespace forker::application {

/**
 * @class Dispatcher
 * @brief Owns the timer thread, the discovery queue and the open-job index.
 *
 * Ticks run strictly one after another on a single thread: the next tick is
 * scheduled only once the previous dispatch pass has returned. Discovery
 * events from any thread go through one queue that only the timer thread
 * drains. A job whose token is taken is skipped for that tick.
 */
class Dispatcher {
public:
    /// Periodic rescan of the source directory. May be empty.
    using ScanFunction = std::function<std::vector<domain::DiscoveredFile>()>;
    using FatalErrorHandler = std::function<void(const std::string&)>;

    Dispatcher(ForkerConfig config,
               std::shared_ptr<JobStateMachine> stateMachine,
               std::shared_ptr<WorkerPool> workers,
               std::shared_ptr<ReplicationMetrics> metrics,
               ScanFunction scan = {});
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * @brief Indexes persisted jobs and starts the timer thread.
     * @param knownJobs Every job in the store, already passed through recovery.
     */
    void start(const std::vector<domain::FileJob>& knownJobs);

    /** @brief Thread-safe. Ignored once admission has stopped. */
    void notifyDiscovered(domain::DiscoveredFile file);

    /** @brief Runs one tick on the calling thread. For use before start() or in tests. */
    void runTickNow();

    // --- Shutdown phases, driven by ShutdownCoordinator ---

    /** @brief From now on no publish starts and no new action begins. */
    void requestShutdown();

    /** @brief Stops admission and ticks; joins the timer thread after its current tick. */
    void stopAccepting();

    /** @brief Waits for executing steps. False if the timeout expired first. */
    bool waitForInFlight(std::chrono::milliseconds timeout);

    /** @brief In-flight copies and hashes abandon at their next chunk. */
    void raiseHardStop();

    /** @brief Joins the worker threads. */
    void releaseResources();

    /**
     * @brief Returns a quarantined job to work after an operator reconciled it.
     * @return False if the job is busy, unknown, not quarantined, or its source is gone.
     * @throws std::invalid_argument for an empty @p reason.
     */
    bool releaseFromQuarantine(const std::string& jobId, const std::string& reason);

    size_t openJobCount() const;
    bool isAccepting() const { return m_accepting; }

    /** @brief Set when a fatal fault (state store unavailable) stopped the dispatcher. */
    std::optional<std::string> fatalError() const;
    void setFatalErrorHandler(FatalErrorHandler handler);

    JobTokenTable& tokens() { return m_tokens; }

private:
    struct OpenJob {
        std::chrono::system_clock::time_point nextDue;
        domain::JobState state = domain::JobState::Discovered;
    };

    struct TrackedSource {
        std::uintmax_t sizeBytes = 0;
        std::int64_t modifiedAtNs = 0;
        std::string jobId;
        bool quarantined = false;   ///< Rediscovery is ignored until the job is released.
    };

    void timerLoop();
    void tick();
    void drainDiscoveries();
    void dispatchDue();
    void runStep(const std::string& jobId);
    void reportFatal(const std::string& message);

    ForkerConfig m_config;
    std::shared_ptr<JobStateMachine> m_stateMachine;
    std::shared_ptr<WorkerPool> m_workers;
    std::shared_ptr<ReplicationMetrics> m_metrics;
    ScanFunction m_scan;

    JobTokenTable m_tokens;

    std::mutex m_discoveryMutex;
    std::deque<domain::DiscoveredFile> m_discoveries;

    mutable std::mutex m_jobsMutex;
    std::map<std::string, OpenJob> m_openJobs;
    std::map<std::string, TrackedSource> m_trackedSources;   ///< keyed by source path

    std::mutex m_tickMutex;            ///< serializes ticks from runTickNow and the timer thread
    std::mutex m_timerMutex;
    std::condition_variable m_timerCv;
    std::thread m_timer;
    bool m_timerStop = false;

    std::atomic<bool> m_accepting{true};
    std::atomic<bool> m_shutdownRequested{false};
    std::atomic<bool> m_hardStop{false};

    mutable std::mutex m_fatalMutex;
    std::optional<std::string> m_fatalError;
    FatalErrorHandler m_fatalHandler;
};

} // namespace forker::application
