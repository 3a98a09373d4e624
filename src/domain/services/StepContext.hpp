/**
 * @file StepContext.hpp
 * @brief Deadline and cancellation signals carried by every I/O action of a step.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include "domain/ReplicationErrors.hpp"

namespace forker::domain {

/**
 * @class StepContext
 * @brief Lets long-running copy and hash loops notice a passed deadline,
 *        a hard stop, or (for verification) a shutdown request.
 *
 * The flags are owned by the dispatcher and outlive every step it runs.
 */
class StepContext {
public:
    using Clock = std::chrono::steady_clock;

    StepContext(Clock::time_point deadline,
                const std::atomic<bool>* hardStop,
                const std::atomic<bool>* shutdownRequested)
        : m_deadline(deadline), m_hardStop(hardStop), m_shutdownRequested(shutdownRequested) {}

    /** @brief A context with no deadline and no stop signals. */
    static StepContext Unbounded() {
        return StepContext(Clock::time_point::max(), nullptr, nullptr);
    }

    /** @brief Same signals, but the action also gives up once shutdown has been requested. */
    StepContext abandoningOnShutdown() const {
        StepContext copy = *this;
        copy.m_abandonOnShutdown = true;
        return copy;
    }

    bool hardStopRaised() const { return m_hardStop && m_hardStop->load(); }
    bool shutdownRequested() const { return m_shutdownRequested && m_shutdownRequested->load(); }

    /** @brief No publish may start once shutdown has been signalled. */
    bool publishAllowed() const { return !shutdownRequested() && !hardStopRaised(); }

    bool shouldAbandon() const {
        if (hardStopRaised()) return true;
        if (m_abandonOnShutdown && shutdownRequested()) return true;
        return Clock::now() > m_deadline;
    }

    /** @brief Called between chunks by copy and hash loops. */
    void throwIfAbandoned(const std::string& action) const {
        if (hardStopRaised()) {
            throw StepAbandonedError(action + " abandoned: hard stop");
        }
        if (m_abandonOnShutdown && shutdownRequested()) {
            throw StepAbandonedError(action + " abandoned: shutdown requested");
        }
        if (Clock::now() > m_deadline) {
            throw StepAbandonedError(action + " abandoned: step deadline exceeded");
        }
    }

private:
    Clock::time_point m_deadline;
    const std::atomic<bool>* m_hardStop;
    const std::atomic<bool>* m_shutdownRequested;
    bool m_abandonOnShutdown = false;
};

} // namespace forker::domain
