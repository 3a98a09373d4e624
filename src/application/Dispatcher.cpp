/**
 * @file Dispatcher.cpp
 * @brief Implementation of Dispatcher.
 */

#include "application/Dispatcher.hpp"
#include <algorithm>
#include <iostream>

#include "domain/ReplicationErrors.hpp"

namespace forker::application {

using namespace forker::domain;

Dispatcher::Dispatcher(ForkerConfig config,
                       std::shared_ptr<JobStateMachine> stateMachine,
                       std::shared_ptr<WorkerPool> workers,
                       std::shared_ptr<ReplicationMetrics> metrics,
                       ScanFunction scan)
    : m_config(std::move(config)),
      m_stateMachine(std::move(stateMachine)),
      m_workers(std::move(workers)),
      m_metrics(std::move(metrics)),
      m_scan(std::move(scan)) {}

Dispatcher::~Dispatcher() {
    stopAccepting();
    // Queued and running steps capture this dispatcher.
    releaseResources();
}

void Dispatcher::start(const std::vector<FileJob>& knownJobs) {
    size_t open = 0;
    {
        std::lock_guard<std::mutex> lock(m_jobsMutex);
        auto now = std::chrono::system_clock::now();
        for (const auto& job : knownJobs) {
            if (!job.isCleanupCompleted() && !job.getSourcePath().empty()) {
                m_trackedSources[job.getSourcePath()] = {job.getSourceSize(), job.getSourceModifiedAtNs(),
                                                         job.getId(), job.isQuarantined()};
            }
            if (job.needsWork()) {
                m_openJobs[job.getId()] = {now, job.getState()};
                ++open;
            }
        }
    }

    std::cout << "[Dispatcher] Starting with " << open << " open job(s), tick every "
              << m_config.tickInterval.count() << " ms" << std::endl;

    {
        std::lock_guard<std::mutex> lock(m_timerMutex);
        m_timerStop = false;
    }
    m_timer = std::thread(&Dispatcher::timerLoop, this);
}

void Dispatcher::notifyDiscovered(DiscoveredFile file) {
    if (!m_accepting) return;
    std::lock_guard<std::mutex> lock(m_discoveryMutex);
    m_discoveries.push_back(std::move(file));
}

void Dispatcher::runTickNow() {
    tick();
}

void Dispatcher::timerLoop() {
    while (true) {
        tick();

        // The next tick is scheduled only after this one has returned.
        std::unique_lock<std::mutex> lock(m_timerMutex);
        if (m_timerCv.wait_for(lock, m_config.tickInterval, [this] { return m_timerStop; })) {
            return;
        }
    }
}

void Dispatcher::tick() {
    std::lock_guard<std::mutex> tickGuard(m_tickMutex);
    if (fatalError()) return;

    try {
        if (m_accepting) {
            drainDiscoveries();
        }
        if (!m_shutdownRequested) {
            dispatchDue();
        }
    } catch (const StateStoreError& e) {
        reportFatal(e.what());
    }

    std::map<JobState, size_t> counts;
    {
        std::lock_guard<std::mutex> lock(m_jobsMutex);
        for (const auto& entry : m_openJobs) {
            counts[entry.second.state]++;
        }
    }
    m_metrics->setOpenJobs(counts);
    m_metrics->recordTickCompleted(std::chrono::steady_clock::now());
}

void Dispatcher::drainDiscoveries() {
    std::deque<DiscoveredFile> batch;
    {
        std::lock_guard<std::mutex> lock(m_discoveryMutex);
        batch.swap(m_discoveries);
    }
    if (m_scan) {
        for (auto& file : m_scan()) {
            batch.push_back(std::move(file));
        }
    }

    for (const auto& file : batch) {
        {
            std::lock_guard<std::mutex> lock(m_jobsMutex);
            auto it = m_trackedSources.find(file.path);
            if (it != m_trackedSources.end() &&
                (it->second.quarantined ||
                 (it->second.sizeBytes == file.sizeBytes && it->second.modifiedAtNs == file.modifiedAtNs))) {
                continue;
            }
        }

        try {
            FileJob job = m_stateMachine->admit(file);
            std::lock_guard<std::mutex> lock(m_jobsMutex);
            m_trackedSources[file.path] = {file.sizeBytes, file.modifiedAtNs, job.getId()};
            m_openJobs[job.getId()] = {std::chrono::system_clock::now(), job.getState()};
        } catch (const StateStoreError&) {
            throw;
        } catch (const PathPolicyViolation& e) {
            std::cerr << "[Dispatcher] Discovered file rejected: " << e.what() << std::endl;
            std::lock_guard<std::mutex> lock(m_jobsMutex);
            m_trackedSources[file.path] = {file.sizeBytes, file.modifiedAtNs, ""};
        } catch (const std::exception& e) {
            std::cerr << "[Dispatcher] Admission failed, will retry on next scan: " << e.what() << std::endl;
        }
    }
}

void Dispatcher::dispatchDue() {
    auto now = std::chrono::system_clock::now();

    std::vector<std::pair<std::chrono::system_clock::time_point, std::string>> due;
    {
        std::lock_guard<std::mutex> lock(m_jobsMutex);
        for (const auto& [id, job] : m_openJobs) {
            if (job.nextDue <= now) {
                due.emplace_back(job.nextDue, id);
            }
        }
    }
    std::sort(due.begin(), due.end());

    size_t free = m_workers->idleCapacity();
    for (const auto& entry : due) {
        if (free == 0) break;
        const std::string& jobId = entry.second;

        auto token = m_tokens.tryAcquire(jobId);
        if (!token) {
            // A previous step of this job is still running; never queue behind it.
            m_metrics->recordBusySkip();
            continue;
        }

        auto held = std::make_shared<JobTokenTable::JobToken>(std::move(*token));
        bool submitted = m_workers->submit([this, held]() mutable {
            runStep(held->jobId());
            held.reset();
        });
        if (!submitted) break;
        --free;
    }
}

void Dispatcher::runStep(const std::string& jobId) {
    StepContext ctx(StepContext::Clock::now() + m_config.stepTimeout, &m_hardStop, &m_shutdownRequested);

    try {
        StepOutcome out = m_stateMachine->advance(jobId, ctx);

        std::lock_guard<std::mutex> lock(m_jobsMutex);
        if (out.quarantined) {
            for (auto& entry : m_trackedSources) {
                if (entry.second.jobId == jobId) entry.second.quarantined = true;
            }
        }
        if (!out.open) {
            m_openJobs.erase(jobId);
            if (out.state == JobState::Verified) {
                // Source is gone; stop tracking it so a new file of the same name is a new job.
                for (auto it = m_trackedSources.begin(); it != m_trackedSources.end(); ++it) {
                    if (it->second.jobId == jobId) {
                        m_trackedSources.erase(it);
                        break;
                    }
                }
            }
        } else {
            OpenJob& open = m_openJobs[jobId];
            open.state = out.state;
            open.nextDue = out.nextDueAt.value_or(std::chrono::system_clock::now());
        }
    } catch (const StateStoreError& e) {
        reportFatal(e.what());
    } catch (const std::exception& e) {
        std::cerr << "[Dispatcher] Step of job " << jobId << " failed: " << e.what() << std::endl;
        std::lock_guard<std::mutex> lock(m_jobsMutex);
        auto it = m_openJobs.find(jobId);
        if (it != m_openJobs.end()) {
            it->second.nextDue = std::chrono::system_clock::now() + m_config.tickInterval;
        }
    }
}

void Dispatcher::reportFatal(const std::string& message) {
    FatalErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_fatalMutex);
        if (m_fatalError) return;
        m_fatalError = message;
        handler = m_fatalHandler;
    }
    m_accepting = false;
    std::cerr << "[Dispatcher] FATAL: state store unavailable: " << message << std::endl;
    if (handler) {
        handler(message);
    }
}

void Dispatcher::requestShutdown() {
    m_shutdownRequested = true;
}

void Dispatcher::stopAccepting() {
    m_accepting = false;
    {
        std::lock_guard<std::mutex> lock(m_timerMutex);
        m_timerStop = true;
    }
    m_timerCv.notify_all();
    if (m_timer.joinable() && m_timer.get_id() != std::this_thread::get_id()) {
        m_timer.join();
    }
}

bool Dispatcher::waitForInFlight(std::chrono::milliseconds timeout) {
    return m_workers->waitIdle(timeout);
}

void Dispatcher::raiseHardStop() {
    m_hardStop = true;
}

void Dispatcher::releaseResources() {
    m_workers->stop();
}

bool Dispatcher::releaseFromQuarantine(const std::string& jobId, const std::string& reason) {
    auto token = m_tokens.tryAcquire(jobId);
    if (!token) {
        std::cerr << "[Dispatcher] Job " << jobId << " is busy, release refused" << std::endl;
        return false;
    }

    std::optional<FileJob> job;
    try {
        job = m_stateMachine->releaseFromQuarantine(jobId, reason);
    } catch (const StateStoreError& e) {
        reportFatal(e.what());
        return false;
    }
    if (!job) return false;

    std::lock_guard<std::mutex> lock(m_jobsMutex);
    m_trackedSources[job->getSourcePath()] = {job->getSourceSize(), job->getSourceModifiedAtNs(), jobId, false};
    m_openJobs[jobId] = {std::chrono::system_clock::now(), job->getState()};
    return true;
}

size_t Dispatcher::openJobCount() const {
    std::lock_guard<std::mutex> lock(m_jobsMutex);
    return m_openJobs.size();
}

std::optional<std::string> Dispatcher::fatalError() const {
    std::lock_guard<std::mutex> lock(m_fatalMutex);
    return m_fatalError;
}

void Dispatcher::setFatalErrorHandler(FatalErrorHandler handler) {
    std::lock_guard<std::mutex> lock(m_fatalMutex);
    m_fatalHandler = std::move(handler);
}

} // namespace forker::application
