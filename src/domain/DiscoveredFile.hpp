/**
 * @file DiscoveredFile.hpp
 * @brief A stable source file reported by discovery, ready for admission.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace forker::domain {

struct DiscoveredFile {
    std::string path;
    std::uintmax_t sizeBytes = 0;
    std::int64_t modifiedAtNs = 0;   ///< Source mtime. Together with path and size it identifies a file across rescans.
    std::chrono::system_clock::time_point discoveredAt{};
};

} // namespace forker::domain
