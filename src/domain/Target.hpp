/**
 * @file Target.hpp
 * @brief Entity describing one destination of a replication job.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "domain/Digest.hpp"
#include "domain/ReplicationErrors.hpp"
#include "domain/ReplicationStates.hpp"

namespace forker::domain {

/**
 * @struct TargetRecord
 * @brief Plain persisted fields of a target. Used for rehydration.
 */
struct TargetRecord {
    TargetRole role = TargetRole::Primary;
    std::string destinationRoot;
    TargetState state = TargetState::Pending;
    std::string stagedPath;
    std::string finalPath;
    std::optional<Digest> digest;
    int attempts = 0;
    std::optional<std::chrono::system_clock::time_point> nextAttemptAt;
    std::string lastError;
    std::chrono::system_clock::time_point lastTransitionAt{};
};

/**
 * @class Target
 * @brief One destination of a job. Owned by its FileJob; state changes are guarded.
 */
class Target {
private:
    TargetRecord record;

    explicit Target(TargetRecord r) : record(std::move(r)) {}

public:
    Target(TargetRole role, std::string destinationRoot, std::chrono::system_clock::time_point now) {
        record.role = role;
        record.destinationRoot = std::move(destinationRoot);
        record.lastTransitionAt = now;
    }

    static Target Rehydrate(TargetRecord r) {
        return Target(std::move(r));
    }

    // --- Accessors ---
    const TargetRecord& getRecord() const { return record; }
    TargetRole getRole() const { return record.role; }
    std::string getName() const { return TargetRoleToString(record.role); }
    const std::string& getDestinationRoot() const { return record.destinationRoot; }
    TargetState getState() const { return record.state; }
    const std::string& getStagedPath() const { return record.stagedPath; }
    const std::string& getFinalPath() const { return record.finalPath; }
    const std::optional<Digest>& getDigest() const { return record.digest; }
    int getAttempts() const { return record.attempts; }
    const std::optional<std::chrono::system_clock::time_point>& getNextAttemptAt() const { return record.nextAttemptAt; }
    const std::string& getLastError() const { return record.lastError; }
    std::chrono::system_clock::time_point getLastTransitionAt() const { return record.lastTransitionAt; }

    bool isTerminal() const { return IsTerminal(record.state); }

    bool isWaitingForBackoff(std::chrono::system_clock::time_point now) const {
        return record.nextAttemptAt && *record.nextAttemptAt > now;
    }

    // --- Commands ---

    /**
     * @brief Moves the target to a new state.
     * @return The previous state.
     * @throws InvalidStateTransition when the move is not allowed.
     */
    TargetState transitionTo(TargetState next, std::chrono::system_clock::time_point now) {
        if (!IsLegalTransition(record.state, next)) {
            throw InvalidStateTransition("Target " + getName() + " cannot move from " +
                                         TargetStateToString(record.state) + " to " +
                                         TargetStateToString(next));
        }
        TargetState old = record.state;
        record.state = next;
        record.lastTransitionAt = now;
        return old;
    }

    void setStagedPath(std::string path) { record.stagedPath = std::move(path); }
    void setFinalPath(std::string path) { record.finalPath = std::move(path); }
    void setDigest(Digest d) { record.digest = std::move(d); }

    /** @brief Counts a failed attempt and records its error. */
    int recordFailedAttempt(const std::string& error) {
        record.lastError = error;
        return ++record.attempts;
    }

    void setLastError(std::string error) { record.lastError = std::move(error); }
    void scheduleRetryAt(std::chrono::system_clock::time_point at) { record.nextAttemptAt = at; }
    void clearBackoff() { record.nextAttemptAt.reset(); }
};

} // namespace forker::domain
