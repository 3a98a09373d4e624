/**
 * @file FileJob.hpp
 * @brief Aggregate root for one source file under replication.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/Digest.hpp"
#include "domain/ReplicationErrors.hpp"
#include "domain/ReplicationStates.hpp"
#include "domain/Target.hpp"

namespace forker::domain {

/**
 * @struct StateTransition
 * @brief A job or target state change that has not been written to the audit log yet.
 */
struct StateTransition {
    std::string entity;       ///< "job" or "target".
    std::string targetName;   ///< Empty for job transitions.
    std::string oldState;     ///< Empty when the entity was created.
    std::string newState;
    std::chrono::system_clock::time_point timestamp;
    std::string context;
};

/**
 * @struct FileJobRecord
 * @brief Plain persisted job fields, without the targets.
 */
struct FileJobRecord {
    std::string id;
    std::string sourcePath;
    std::uintmax_t sourceSize = 0;
    std::int64_t sourceModifiedAtNs = 0;
    std::optional<Digest> sourceDigest;
    std::chrono::system_clock::time_point discoveredAt{};
    bool cleanupCompleted = false;
    std::optional<std::chrono::system_clock::time_point> cleanupCompletedAt;
    bool failureSurfaced = false;
    bool quarantined = false;
    std::string quarantineReason;
};

class FileJob {
private:
    FileJobRecord record;
    Target primary;
    Target research;

    // Transitions since the last successful persistence.
    std::vector<StateTransition> pendingTransitions;

    FileJob(FileJobRecord r, Target p, Target s)
        : record(std::move(r)), primary(std::move(p)), research(std::move(s)) {}

public:
    FileJob(std::string id,
            std::string sourcePath,
            std::uintmax_t sourceSize,
            std::int64_t sourceModifiedAtNs,
            std::chrono::system_clock::time_point discoveredAt,
            std::string primaryRoot,
            std::string researchRoot)
        : primary(TargetRole::Primary, std::move(primaryRoot), discoveredAt),
          research(TargetRole::Research, std::move(researchRoot), discoveredAt) {
        record.id = std::move(id);
        record.sourcePath = std::move(sourcePath);
        record.sourceSize = sourceSize;
        record.sourceModifiedAtNs = sourceModifiedAtNs;
        record.discoveredAt = discoveredAt;

        pendingTransitions.push_back({"job", "", "", JobStateToString(JobState::Discovered), discoveredAt, "admitted"});
    }

    static FileJob Rehydrate(FileJobRecord r, TargetRecord primaryRecord, TargetRecord researchRecord) {
        if (primaryRecord.role != TargetRole::Primary || researchRecord.role != TargetRole::Research) {
            throw CorruptStateError("Job " + r.id + " does not carry one primary and one research target");
        }
        return FileJob(std::move(r),
                       Target::Rehydrate(std::move(primaryRecord)),
                       Target::Rehydrate(std::move(researchRecord)));
    }

    // --- Accessors ---
    const FileJobRecord& getRecord() const { return record; }
    const std::string& getId() const { return record.id; }
    const std::string& getSourcePath() const { return record.sourcePath; }
    std::uintmax_t getSourceSize() const { return record.sourceSize; }
    std::int64_t getSourceModifiedAtNs() const { return record.sourceModifiedAtNs; }
    const std::optional<Digest>& getSourceDigest() const { return record.sourceDigest; }
    std::chrono::system_clock::time_point getDiscoveredAt() const { return record.discoveredAt; }
    bool isCleanupCompleted() const { return record.cleanupCompleted; }
    const std::optional<std::chrono::system_clock::time_point>& getCleanupCompletedAt() const { return record.cleanupCompletedAt; }
    bool isFailureSurfaced() const { return record.failureSurfaced; }
    bool isQuarantined() const { return record.quarantined; }
    const std::string& getQuarantineReason() const { return record.quarantineReason; }

    const Target& getTarget(TargetRole role) const {
        return role == TargetRole::Primary ? primary : research;
    }

    Target& getTarget(TargetRole role) {
        return role == TargetRole::Primary ? primary : research;
    }

    /** @brief Derived on every call from the two targets. */
    JobState getState() const {
        return DeriveJobState(primary.getState(), research.getState(), record.quarantined);
    }

    bool allTargetsTerminal() const {
        return primary.isTerminal() && research.isTerminal();
    }

    /**
     * @brief True while the job still needs work from the state machine:
     * a target in progress, a pending source cleanup, or an unsurfaced failure.
     */
    bool needsWork() const {
        if (record.quarantined) return !record.failureSurfaced;
        JobState s = getState();
        if (s == JobState::Verified) return !record.cleanupCompleted;
        if (!allTargetsTerminal()) return true;
        return !record.failureSurfaced;
    }

    // --- Event Management ---
    const std::vector<StateTransition>& getPendingTransitions() const { return pendingTransitions; }
    void clearPendingTransitions() { pendingTransitions.clear(); }

    // --- Commands ---

    /** @brief Sets the source digest. It is immutable once set. */
    void setSourceDigest(Digest d) {
        if (record.sourceDigest) {
            throw std::invalid_argument("Source digest of job " + record.id + " is already set");
        }
        record.sourceDigest = std::move(d);
    }

    /**
     * @brief Moves one target to a new state and records the target and job transitions.
     * @throws InvalidStateTransition when the target refuses the move.
     */
    void transitionTarget(TargetRole role, TargetState next,
                          std::chrono::system_clock::time_point now,
                          const std::string& context) {
        JobState before = getState();
        Target& t = getTarget(role);
        TargetState old = t.transitionTo(next, now);
        pendingTransitions.push_back({"target", t.getName(), TargetStateToString(old),
                                      TargetStateToString(next), now, context});

        JobState after = getState();
        if (after != before) {
            pendingTransitions.push_back({"job", "", JobStateToString(before),
                                          JobStateToString(after), now, context});
        }
    }

    void markCleanupCompleted(std::chrono::system_clock::time_point now) {
        if (getState() != JobState::Verified) {
            throw InvalidStateTransition("Job " + record.id + " cannot clean up its source before it is Verified");
        }
        record.cleanupCompleted = true;
        record.cleanupCompletedAt = now;
        pendingTransitions.push_back({"job", "", JobStateToString(JobState::Verified),
                                      JobStateToString(JobState::Verified), now, "source cleanup completed"});
    }

    void markFailureSurfaced() { record.failureSurfaced = true; }

    /** @brief Marks the job as corrupt. It reports Failed until reconciled by hand. */
    void quarantine(const std::string& reason, std::chrono::system_clock::time_point now) {
        JobState before = getState();
        record.quarantined = true;
        record.quarantineReason = reason;
        pendingTransitions.push_back({"job", "", JobStateToString(before),
                                      JobStateToString(JobState::Failed), now, "quarantined: " + reason});
    }

    /**
     * @brief Returns a quarantined job to work after manual reconciliation.
     *
     * The source is fingerprinted again under its current size and modification
     * time, and both targets start over from Pending.
     * @throws InvalidStateTransition unless the job is quarantined.
     */
    void requeueFromQuarantine(const std::string& reason,
                               std::uintmax_t sourceSize,
                               std::int64_t sourceModifiedAtNs,
                               std::string primaryRoot,
                               std::string researchRoot,
                               std::chrono::system_clock::time_point now) {
        if (!record.quarantined) {
            throw InvalidStateTransition("Job " + record.id + " is not quarantined");
        }
        record.quarantined = false;
        record.quarantineReason.clear();
        record.failureSurfaced = false;
        record.cleanupCompleted = false;
        record.cleanupCompletedAt.reset();
        record.sourceDigest.reset();
        record.sourceSize = sourceSize;
        record.sourceModifiedAtNs = sourceModifiedAtNs;

        primary = Target(TargetRole::Primary, std::move(primaryRoot), now);
        research = Target(TargetRole::Research, std::move(researchRoot), now);

        pendingTransitions.push_back({"job", "", JobStateToString(JobState::Failed),
                                      JobStateToString(getState()), now, "released from quarantine: " + reason});
    }

    /**
     * @brief Checks the persisted combination against the domain invariants.
     * @throws CorruptStateError describing the first violation found.
     */
    void validate() const {
        auto fail = [this](const std::string& what) {
            throw CorruptStateError("Job " + record.id + ": " + what);
        };

        if (record.id.empty()) fail("empty id");
        if (record.sourcePath.empty()) fail("empty source path");
        if (record.cleanupCompleted && getState() != JobState::Verified) {
            fail("source cleanup recorded but job is not Verified");
        }

        for (const Target* t : {&primary, &research}) {
            const std::string name = t->getName();
            if (t->getAttempts() < 0) fail(name + " has a negative attempt count");

            TargetState s = t->getState();
            if (s != TargetState::Pending && s != TargetState::Failed && !record.sourceDigest) {
                fail(name + " progressed without a source digest");
            }
            if ((s == TargetState::Staging || s == TargetState::Staged) && t->getStagedPath().empty()) {
                fail(name + " is " + TargetStateToString(s) + " without a staging path");
            }
            if ((s == TargetState::Staged || s == TargetState::VerificationPending || s == TargetState::Verified) &&
                t->getFinalPath().empty()) {
                fail(name + " is " + TargetStateToString(s) + " without a final path");
            }
            if (s == TargetState::Verified) {
                if (!t->getDigest()) fail(name + " is Verified without a digest");
                if (*t->getDigest() != *record.sourceDigest) fail(name + " is Verified with a digest that differs from the source");
            }
        }
    }
};

} // namespace forker::domain
