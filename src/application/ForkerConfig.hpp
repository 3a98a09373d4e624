/**
 * @file ForkerConfig.hpp
 * @brief Service configuration, passed explicitly to every component that needs it.
 */

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace forker::application {

/**
 * @class ConfigError
 * @brief Raised when a configuration value is missing or out of range. Fails startup.
 */
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct RetrySettings {
    int maxAttempts = 3;
    std::chrono::milliseconds baseDelay{5000};
    double backoffMultiplier = 2.0;
    std::chrono::milliseconds maxDelay{5 * 60 * 1000};
    double jitterFactor = 0.25;
};

struct ForkerConfig {
    std::string sourceDirectory;
    std::string primaryDirectory;
    std::string researchDirectory;
    std::string stateDirectory;

    std::string hashAlgorithm = "sha256";
    int workerCount = 4;

    std::chrono::milliseconds tickInterval{1000};
    std::chrono::milliseconds stepTimeout{10 * 60 * 1000};
    std::chrono::milliseconds shutdownGracePeriod{30 * 1000};
    std::chrono::milliseconds minimumFileAge{5000};
    std::chrono::milliseconds livenessThreshold{30 * 1000};
    std::chrono::hours retention{24 * 7};

    RetrySettings retry;

    /**
     * @brief Checks ranges and that the four directories are distinct and not nested.
     * @throws ConfigError describing the first problem found.
     */
    void validate() const;
};

} // namespace forker::application
