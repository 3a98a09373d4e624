/**
 * @file LocalCopyEngine.hpp
 * @brief Copy engine for locally mounted destination roots (POSIX).
 */

#pragma once

#include <cstddef>
#include <string>

#include "domain/services/ICopyEngine.hpp"

namespace forker::infrastructure {

/**
 * @class LocalCopyEngine
 * @brief Stages into <root>/.forker-staging and publishes with link(2) and unlink(2).
 *
 * A hard link fails with EEXIST instead of replacing the final name. File
 * systems without hard links fall back to an lstat check and rename(2).
 *
 * Files are opened with O_NOFOLLOW and checked with lstat so that a
 * symbolic link is never read through or written through.
 */
class LocalCopyEngine : public domain::ICopyEngine {
public:
    static constexpr const char* kStagingDirName = ".forker-staging";
    static constexpr const char* kStagingSuffix = ".forker-tmp";
    static constexpr std::size_t kCopyBufferSize = 1024 * 1024;

    LocalCopyEngine() = default;

    std::filesystem::path stagingPathFor(const std::filesystem::path& destinationRoot,
                                         const std::string& stagingName) const override;

    domain::StageResult stage(const std::filesystem::path& sourcePath,
                              const std::filesystem::path& destinationRoot,
                              const std::string& stagingName,
                              const domain::StepContext& ctx) override;

    domain::PublishOutcome publish(const std::filesystem::path& stagedPath,
                                   const std::filesystem::path& finalPath) override;

    void removeStaged(const std::filesystem::path& stagedPath) override;
    domain::SourceCleanup deleteSource(const std::filesystem::path& sourcePath,
                                       const domain::SourceIdentity& admitted) override;
    std::optional<domain::SourceIdentity> identify(const std::filesystem::path& path) const override;

    std::size_t cleanupOrphans(const std::filesystem::path& destinationRoot,
                               const std::set<std::string>& keep) override;

    bool pathExists(const std::filesystem::path& path) const override;
};

} // namespace forker::infrastructure
