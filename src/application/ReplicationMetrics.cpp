/**
 * @file ReplicationMetrics.cpp
 * @brief Implementation of ReplicationMetrics.
 */

#include "application/ReplicationMetrics.hpp"

namespace forker::application {

using domain::JobState;

void ReplicationMetrics::recordOutcome(JobState state) {
    switch (state) {
        case JobState::Verified: m_jobsVerified++; break;
        case JobState::PartiallyFailed: m_jobsPartiallyFailed++; break;
        case JobState::Failed: m_jobsFailed++; break;
        default: break;
    }
}

void ReplicationMetrics::recordTickCompleted(std::chrono::steady_clock::time_point at) {
    m_lastTickAt = at.time_since_epoch().count();
    m_ticksCompleted++;
}

void ReplicationMetrics::setOpenJobs(const std::map<JobState, size_t>& counts) {
    std::lock_guard<std::mutex> lock(m_openMutex);
    m_openJobs = counts;
}

bool ReplicationMetrics::isLive(std::chrono::milliseconds threshold,
                                std::chrono::steady_clock::time_point now) const {
    std::int64_t last = m_lastTickAt;
    if (last == 0) return false;
    std::chrono::steady_clock::time_point lastTick{std::chrono::steady_clock::duration(last)};
    return now - lastTick <= threshold;
}

nlohmann::json ReplicationMetrics::snapshot() const {
    nlohmann::json open = nlohmann::json::object();
    {
        std::lock_guard<std::mutex> lock(m_openMutex);
        for (const auto& [state, count] : m_openJobs) {
            open[domain::JobStateToString(state)] = count;
        }
    }

    return {
        {"jobs_admitted", jobsAdmitted()},
        {"jobs_verified", jobsVerified()},
        {"jobs_partially_failed", jobsPartiallyFailed()},
        {"jobs_failed", jobsFailed()},
        {"jobs_quarantined", jobsQuarantined()},
        {"bytes_copied", bytesCopied()},
        {"verification_failures", verificationFailures()},
        {"transient_retries", transientRetries()},
        {"busy_skips", busySkips()},
        {"ticks_completed", ticksCompleted()},
        {"open_jobs", open}
    };
}

} // namespace forker::application
