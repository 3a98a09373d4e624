/**
 * @file ICopyEngine.hpp
 * @brief Interface for staged copies and atomic publish into a destination root.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

#include "domain/services/StepContext.hpp"

namespace forker::domain {

enum class PublishOutcome {
    Published,         ///< The staged file was renamed to its final name.
    AlreadyPublished   ///< Staged file gone and final name present: an earlier publish completed.
};

enum class SourceCleanup {
    Removed,       ///< The admitted file was deleted.
    AlreadyGone,   ///< Nothing at the source path.
    Replaced       ///< A different file now sits at the source path; it was left alone.
};

/**
 * @struct SourceIdentity
 * @brief Size and modification time that identify one generation of a source file.
 */
struct SourceIdentity {
    std::uintmax_t sizeBytes = 0;
    std::int64_t modifiedAtNs = 0;

    bool operator==(const SourceIdentity& other) const {
        return sizeBytes == other.sizeBytes && modifiedAtNs == other.modifiedAtNs;
    }
    bool operator!=(const SourceIdentity& other) const { return !(*this == other); }
};

struct StageResult {
    std::filesystem::path stagedPath;
    std::uintmax_t bytesCopied = 0;
};

/**
 * @class ICopyEngine
 * @brief Moves bytes from the source directory into the destination roots.
 *
 * Staging always happens inside the destination root so that publish is a
 * same-filesystem rename.
 */
class ICopyEngine {
public:
    virtual ~ICopyEngine() = default;

    /** @brief Deterministic staging location for a given staging name. */
    virtual std::filesystem::path stagingPathFor(const std::filesystem::path& destinationRoot,
                                                 const std::string& stagingName) const = 0;

    /**
     * @brief Copies the source byte for byte into the staging area and makes it durable.
     * A failed stage leaves no partial file behind.
     */
    virtual StageResult stage(const std::filesystem::path& sourcePath,
                              const std::filesystem::path& destinationRoot,
                              const std::string& stagingName,
                              const StepContext& ctx) = 0;

    /**
     * @brief Atomically moves the staged file to its final name. Not cancellable.
     * An existing final name is never replaced, even one that appears during the call.
     * @throws CrossVolumeRenameError instead of ever falling back to copy and delete.
     */
    virtual PublishOutcome publish(const std::filesystem::path& stagedPath,
                                   const std::filesystem::path& finalPath) = 0;

    /** @brief Removes a staged file if it is still there. */
    virtual void removeStaged(const std::filesystem::path& stagedPath) = 0;

    /**
     * @brief Deletes the source if it is still the file that was admitted.
     * A file whose size or modification time differs from @p admitted is kept.
     */
    virtual SourceCleanup deleteSource(const std::filesystem::path& sourcePath,
                                       const SourceIdentity& admitted) = 0;

    /** @brief Identity of the regular file at @p path; empty if there is none. */
    virtual std::optional<SourceIdentity> identify(const std::filesystem::path& path) const = 0;

    /**
     * @brief Removes leftover staging files not named in @p keep.
     * Only files carrying the staging suffix are ever touched.
     */
    virtual std::size_t cleanupOrphans(const std::filesystem::path& destinationRoot,
                                       const std::set<std::string>& keep) = 0;

    /** @brief True if anything (file, directory or link) exists at @p path. */
    virtual bool pathExists(const std::filesystem::path& path) const = 0;
};

} // namespace forker::domain
