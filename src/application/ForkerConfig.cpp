/**
 * @file ForkerConfig.cpp
 * @brief Validation of ForkerConfig.
 */

#include "application/ForkerConfig.hpp"
#include <filesystem>
#include <utility>
#include <vector>

namespace forker::application {

namespace fs = std::filesystem;

namespace {

bool IsSameOrNested(const fs::path& a, const fs::path& b) {
    auto ai = a.begin();
    auto bi = b.begin();
    for (; ai != a.end() && bi != b.end(); ++ai, ++bi) {
        if (*ai != *bi) return false;
    }
    return true;
}

fs::path Normalize(const std::string& dir) {
    fs::path p = fs::absolute(fs::path(dir)).lexically_normal();
    if (p.filename().empty()) p = p.parent_path(); // drop trailing separator
    return p;
}

} // namespace

void ForkerConfig::validate() const {
    const std::vector<std::pair<const char*, const std::string*>> dirs = {
        {"source_directory", &sourceDirectory},
        {"primary_directory", &primaryDirectory},
        {"research_directory", &researchDirectory},
        {"state_directory", &stateDirectory},
    };

    for (const auto& [key, value] : dirs) {
        if (value->empty()) {
            throw ConfigError(std::string(key) + " must be set");
        }
    }

    for (size_t i = 0; i < dirs.size(); ++i) {
        for (size_t j = i + 1; j < dirs.size(); ++j) {
            if (IsSameOrNested(Normalize(*dirs[i].second), Normalize(*dirs[j].second))) {
                throw ConfigError(std::string(dirs[i].first) + " and " + dirs[j].first +
                                  " must be distinct, non-nested directories");
            }
        }
    }

    if (hashAlgorithm != "sha256" && hashAlgorithm != "sha512") {
        throw ConfigError("hash_algorithm must be sha256 or sha512");
    }
    if (workerCount < 1 || workerCount > 64) {
        throw ConfigError("worker_count must be between 1 and 64");
    }
    if (tickInterval.count() <= 0) throw ConfigError("tick_interval_ms must be positive");
    if (stepTimeout.count() <= 0) throw ConfigError("step_timeout_ms must be positive");
    if (shutdownGracePeriod.count() <= 0) throw ConfigError("shutdown_grace_period_ms must be positive");
    if (minimumFileAge.count() < 0) throw ConfigError("minimum_file_age_ms cannot be negative");
    if (livenessThreshold.count() <= 0) throw ConfigError("liveness_threshold_ms must be positive");
    if (retention.count() <= 0) throw ConfigError("retention_hours must be positive");

    if (retry.maxAttempts < 1) throw ConfigError("retry.max_attempts must be at least 1");
    if (retry.baseDelay.count() <= 0) throw ConfigError("retry.base_delay_ms must be positive");
    if (retry.backoffMultiplier <= 1.0) throw ConfigError("retry.backoff_multiplier must be greater than 1");
    if (retry.maxDelay < retry.baseDelay) throw ConfigError("retry.max_delay_ms must not be below retry.base_delay_ms");
    if (retry.jitterFactor < 0.0 || retry.jitterFactor > 1.0) {
        throw ConfigError("retry.jitter_factor must be between 0 and 1");
    }
}

} // namespace forker::application
