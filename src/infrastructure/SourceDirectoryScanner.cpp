/**
 * @file SourceDirectoryScanner.cpp
 * @brief Implementation of the SourceDirectoryScanner.
 */

#include "infrastructure/SourceDirectoryScanner.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <system_error>

#include <sys/stat.h>

namespace fs = std::filesystem;

namespace forker::infrastructure {

namespace {

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

SourceDirectoryScanner::SourceDirectoryScanner(std::string sourceDirectory, std::chrono::milliseconds minimumFileAge)
    : m_sourceDirectory(std::move(sourceDirectory)), m_minimumFileAge(minimumFileAge) {}

bool SourceDirectoryScanner::IsIgnoredName(const std::string& filename) {
    if (filename.empty() || filename[0] == '.') return true;

    std::string lower = filename;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });
    for (const char* suffix : {".tmp", ".part", ".partial", ".forker-tmp"}) {
        if (EndsWith(lower, suffix)) return true;
    }
    return false;
}

std::vector<domain::DiscoveredFile> SourceDirectoryScanner::scan() {
    std::vector<domain::DiscoveredFile> stable;
    std::map<std::string, Observation> current;

    std::error_code ec;
    fs::directory_iterator it(m_sourceDirectory, ec);
    if (ec) {
        std::cerr << "[SourceDirectoryScanner] Cannot list source directory: " << ec.message() << std::endl;
        return stable;
    }

    auto nowSystem = std::chrono::system_clock::now();
    auto nowNs = std::chrono::duration_cast<std::chrono::nanoseconds>(nowSystem.time_since_epoch()).count();
    auto minAgeNs = std::chrono::duration_cast<std::chrono::nanoseconds>(m_minimumFileAge).count();

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        const fs::path& p = it->path();
        std::string filename = p.filename().string();
        if (IsIgnoredName(filename)) continue;

        // lstat: never follow a link into somewhere else.
        struct stat st{};
        if (::lstat(p.c_str(), &st) != 0) continue; // vanished between listing and stat
        if (!S_ISREG(st.st_mode)) continue;

        Observation obs;
        obs.sizeBytes = static_cast<std::uintmax_t>(st.st_size);
        obs.modifiedAtNs = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
        current[p.string()] = obs;

        if (nowNs - obs.modifiedAtNs < minAgeNs) continue;

        std::lock_guard<std::mutex> lock(m_mutex);
        auto prev = m_previous.find(p.string());
        if (prev == m_previous.end()) continue;
        if (prev->second.sizeBytes != obs.sizeBytes || prev->second.modifiedAtNs != obs.modifiedAtNs) continue;

        domain::DiscoveredFile file;
        file.path = p.string();
        file.sizeBytes = obs.sizeBytes;
        file.modifiedAtNs = obs.modifiedAtNs;
        file.discoveredAt = nowSystem;
        stable.push_back(std::move(file));
    }
    if (ec) {
        std::cerr << "[SourceDirectoryScanner] Scan stopped early: " << ec.message() << std::endl;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_previous = std::move(current);
    }

    std::sort(stable.begin(), stable.end(), [](const auto& a, const auto& b) { return a.path < b.path; });
    return stable;
}

} // namespace forker::infrastructure
