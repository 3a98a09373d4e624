/**
 * @file StateChangeLog.hpp
 * @brief File-system audit trail of job and target state changes.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "domain/FileJob.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace forker::infrastructure {

struct StateChangeRecord {
    std::string jobId;
    std::string entity;
    std::string targetName;
    std::string oldState;
    std::string newState;
    std::chrono::system_clock::time_point timestamp;
    std::string context;
};

/**
 * @class StateChangeLog
 * @brief Appends one JSON line per transition to <stateRoot>/audit/<jobId>.ndjson.
 *
 * Lines are written through the PersistenceService queue, after the state
 * record itself is durable. The log is informational; recovery never reads it.
 */
class StateChangeLog {
public:
    StateChangeLog(std::string stateRoot, std::shared_ptr<PersistenceService> persistence);

    void append(const std::string& jobId, const std::vector<domain::StateTransition>& transitions);

    /** @brief Reads back every well-formed line for a job, oldest first. */
    std::vector<StateChangeRecord> readAll(const std::string& jobId);

    /** @brief Waits until queued lines are on disk. */
    void flush();

private:
    std::string m_stateRoot;
    std::shared_ptr<PersistenceService> m_persistence;

    std::string getLogFilePath(const std::string& jobId) const;
};

} // namespace forker::infrastructure
