/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the service configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place; the rest of the code base
 * only sees a validated ForkerConfig.
 */

#pragma once

#include <string>

#include "application/ForkerConfig.hpp"

namespace forker::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads and validates a settings file.
     * @param configPath Path to settings.json.
     * @throws application::ConfigError if the file is missing, unparsable or invalid.
     */
    static application::ForkerConfig Load(const std::string& configPath);

    /**
     * @brief Parses and validates settings from JSON text.
     * Keys that are absent keep their defaults; state_directory defaults to the XDG data home.
     */
    static application::ForkerConfig LoadFromString(const std::string& jsonText);
};

} // namespace forker::infrastructure
