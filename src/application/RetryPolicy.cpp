/**
 * @file RetryPolicy.cpp
 * @brief Implementation of RetryPolicy.
 */

#include "application/RetryPolicy.hpp"
#include <algorithm>
#include <cmath>

namespace forker::application {

RetryPolicy::RetryPolicy(RetrySettings settings, unsigned int seed)
    : m_settings(settings), m_rng(seed) {}

std::chrono::milliseconds RetryPolicy::delayAfter(int failedAttempts) {
    const double base = static_cast<double>(m_settings.baseDelay.count());
    const double cap = static_cast<double>(m_settings.maxDelay.count());
    const int exponent = std::max(0, failedAttempts - 1);

    double delay = std::min(cap, base * std::pow(m_settings.backoffMultiplier, exponent));

    if (m_settings.jitterFactor > 0.0) {
        std::uniform_real_distribution<double> dist(-m_settings.jitterFactor, m_settings.jitterFactor);
        double factor;
        {
            std::lock_guard<std::mutex> lock(m_rngMutex);
            factor = dist(m_rng);
        }
        delay += delay * factor;
    }

    delay = std::clamp(delay, 0.0, cap);
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

} // namespace forker::application
