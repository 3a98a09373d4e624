/**
 * @file IStateStore.hpp
 * @brief Durable store for job and target records.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/FileJob.hpp"
#include "domain/Target.hpp"

namespace forker::domain {

/**
 * @class IStateStore
 * @brief Source of truth for replication progress.
 *
 * Every write is durable before it returns. Implementations lock per job,
 * never globally. Failures surface as StateStoreError.
 */
class IStateStore {
public:
    virtual ~IStateStore() = default;

    /** @brief Writes the job record and both target records as one atomic unit. */
    virtual void put(const FileJob& job) = 0;

    /** @brief Replaces one target record of an existing job, atomically. */
    virtual void put(const std::string& jobId, const Target& target) = 0;

    virtual std::optional<FileJob> get(const std::string& jobId) = 0;

    /**
     * @brief Every job that still needs work: non-terminal, Verified without
     * source cleanup, or failed without the failure being surfaced.
     */
    virtual std::vector<FileJob> listIncomplete() = 0;

    virtual std::vector<FileJob> listAll() = 0;

    /** @brief Moves a retired job out of the live record set. */
    virtual void archive(const std::string& jobId) = 0;
};

} // namespace forker::domain
