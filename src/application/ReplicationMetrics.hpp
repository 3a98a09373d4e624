/**
 * @file ReplicationMetrics.hpp
 * @brief In-process counters and the liveness check exposed to the hosting layer.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/ReplicationStates.hpp"

namespace forker::application {

class ReplicationMetrics {
public:
    void recordAdmitted() { m_jobsAdmitted++; }
    void recordOutcome(domain::JobState state);
    void recordQuarantined() { m_jobsQuarantined++; }
    void addBytesCopied(std::uintmax_t bytes) { m_bytesCopied += bytes; }
    void recordVerificationFailure() { m_verificationFailures++; }
    void recordTransientRetry() { m_transientRetries++; }
    void recordBusySkip() { m_busySkips++; }
    void recordTickCompleted(std::chrono::steady_clock::time_point at);

    /** @brief Replaces the gauge of open jobs per derived state. */
    void setOpenJobs(const std::map<domain::JobState, size_t>& counts);

    /** @brief True if a dispatcher tick completed within @p threshold of @p now. */
    bool isLive(std::chrono::milliseconds threshold,
                std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const;

    std::uint64_t jobsAdmitted() const { return m_jobsAdmitted; }
    std::uint64_t jobsVerified() const { return m_jobsVerified; }
    std::uint64_t jobsPartiallyFailed() const { return m_jobsPartiallyFailed; }
    std::uint64_t jobsFailed() const { return m_jobsFailed; }
    std::uint64_t jobsQuarantined() const { return m_jobsQuarantined; }
    std::uint64_t bytesCopied() const { return m_bytesCopied; }
    std::uint64_t verificationFailures() const { return m_verificationFailures; }
    std::uint64_t transientRetries() const { return m_transientRetries; }
    std::uint64_t busySkips() const { return m_busySkips; }
    std::uint64_t ticksCompleted() const { return m_ticksCompleted; }

    /** @brief All counters and gauges as one JSON object. */
    nlohmann::json snapshot() const;

private:
    std::atomic<std::uint64_t> m_jobsAdmitted{0};
    std::atomic<std::uint64_t> m_jobsVerified{0};
    std::atomic<std::uint64_t> m_jobsPartiallyFailed{0};
    std::atomic<std::uint64_t> m_jobsFailed{0};
    std::atomic<std::uint64_t> m_jobsQuarantined{0};
    std::atomic<std::uint64_t> m_bytesCopied{0};
    std::atomic<std::uint64_t> m_verificationFailures{0};
    std::atomic<std::uint64_t> m_transientRetries{0};
    std::atomic<std::uint64_t> m_busySkips{0};
    std::atomic<std::uint64_t> m_ticksCompleted{0};

    // steady_clock ticks of the last completed dispatcher tick, 0 = never.
    std::atomic<std::int64_t> m_lastTickAt{0};

    mutable std::mutex m_openMutex;
    std::map<domain::JobState, size_t> m_openJobs;
};

} // namespace forker::application
