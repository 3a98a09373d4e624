/**
 * @file SourceDirectoryScanner.hpp
 * @brief Scanner for detecting stable files dropped into the source directory.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "domain/DiscoveredFile.hpp"

namespace forker::infrastructure {

/**
 * @class SourceDirectoryScanner
 * @brief Infrastructure adapter that lists the source directory.
 *
 * A file is reported only once it is stable: older than the minimum age and
 * with the same size and mtime as in the previous scan. Symbolic links,
 * dot-files and in-flight names (.tmp, .part, .partial, .forker-tmp) are ignored.
 */
class SourceDirectoryScanner {
public:
    SourceDirectoryScanner(std::string sourceDirectory, std::chrono::milliseconds minimumFileAge);

    /**
     * @brief Scans for stable regular files.
     * @return Files that passed the stability check in this scan.
     */
    std::vector<domain::DiscoveredFile> scan();

    static bool IsIgnoredName(const std::string& filename);

private:
    struct Observation {
        std::uintmax_t sizeBytes = 0;
        std::int64_t modifiedAtNs = 0;
    };

    std::string m_sourceDirectory;
    std::chrono::milliseconds m_minimumFileAge;

    std::mutex m_mutex;
    std::map<std::string, Observation> m_previous;
};

} // namespace forker::infrastructure
