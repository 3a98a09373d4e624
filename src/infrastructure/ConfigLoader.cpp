/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

#include "infrastructure/PathUtils.hpp"

namespace forker::infrastructure {

using application::ConfigError;
using application::ForkerConfig;
using json = nlohmann::json;

namespace {

template <typename T>
T Read(const json& j, const char* key, T fallback) {
    if (!j.contains(key)) return fallback;
    try {
        return j.at(key).get<T>();
    } catch (const json::exception&) {
        throw ConfigError(std::string("Setting '") + key + "' has the wrong type");
    }
}

std::chrono::milliseconds ReadMillis(const json& j, const char* key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(Read<long long>(j, key, fallback.count()));
}

} // namespace

ForkerConfig ConfigLoader::Load(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        throw ConfigError("Configuration file not found: " + configPath);
    }

    std::ifstream f(configPath);
    if (!f) {
        throw ConfigError("Cannot open configuration file: " + configPath);
    }
    std::stringstream buffer;
    buffer << f.rdbuf();

    ForkerConfig config = LoadFromString(buffer.str());
    std::cout << "[ConfigLoader] Loaded " << configPath << std::endl;
    return config;
}

ForkerConfig ConfigLoader::LoadFromString(const std::string& jsonText) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("settings.json is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("settings.json must contain a JSON object");
    }

    ForkerConfig c;
    c.sourceDirectory = Read<std::string>(j, "source_directory", "");
    c.primaryDirectory = Read<std::string>(j, "primary_directory", "");
    c.researchDirectory = Read<std::string>(j, "research_directory", "");
    c.stateDirectory = Read<std::string>(j, "state_directory", PathUtils::GetDefaultStateDir().string());

    c.hashAlgorithm = Read<std::string>(j, "hash_algorithm", c.hashAlgorithm);
    c.workerCount = Read<int>(j, "worker_count", c.workerCount);
    c.tickInterval = ReadMillis(j, "tick_interval_ms", c.tickInterval);
    c.stepTimeout = ReadMillis(j, "step_timeout_ms", c.stepTimeout);
    c.shutdownGracePeriod = ReadMillis(j, "shutdown_grace_period_ms", c.shutdownGracePeriod);
    c.minimumFileAge = ReadMillis(j, "minimum_file_age_ms", c.minimumFileAge);
    c.livenessThreshold = ReadMillis(j, "liveness_threshold_ms", c.livenessThreshold);
    c.retention = std::chrono::hours(Read<long long>(j, "retention_hours", c.retention.count()));

    if (j.contains("retry")) {
        const json& r = j["retry"];
        if (!r.is_object()) {
            throw ConfigError("Setting 'retry' must be an object");
        }
        c.retry.maxAttempts = Read<int>(r, "max_attempts", c.retry.maxAttempts);
        c.retry.baseDelay = ReadMillis(r, "base_delay_ms", c.retry.baseDelay);
        c.retry.backoffMultiplier = Read<double>(r, "backoff_multiplier", c.retry.backoffMultiplier);
        c.retry.maxDelay = ReadMillis(r, "max_delay_ms", c.retry.maxDelay);
        c.retry.jitterFactor = Read<double>(r, "jitter_factor", c.retry.jitterFactor);
    }

    c.validate();
    return c;
}

} // namespace forker::infrastructure
