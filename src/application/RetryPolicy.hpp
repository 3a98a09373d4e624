/**
 * @file RetryPolicy.hpp
 * @brief Bounded exponential backoff with jitter for transient failures.
 */

#pragma once

#include <chrono>
#include <mutex>
#include <random>

#include "application/ForkerConfig.hpp"

namespace forker::application {

class RetryPolicy {
public:
    explicit RetryPolicy(RetrySettings settings, unsigned int seed = std::random_device{}());

    int maxAttempts() const { return m_settings.maxAttempts; }

    /** @brief True once @p failedAttempts has used up the retry budget. */
    bool isExhausted(int failedAttempts) const { return failedAttempts >= m_settings.maxAttempts; }

    /**
     * @brief Delay before the next attempt after @p failedAttempts failures (1-based).
     *
     * base * multiplier^(n-1), capped at the maximum delay, then spread by
     * +/- jitterFactor. Never negative, never above the cap.
     */
    std::chrono::milliseconds delayAfter(int failedAttempts);

private:
    RetrySettings m_settings;
    std::mutex m_rngMutex;
    std::mt19937 m_rng;
};

} // namespace forker::application
