/**
 * @file JobStateMachine.hpp
 * @brief Single code path that advances a replication job through its lifecycle.
 */

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "application/ForkerConfig.hpp"
#include "application/ReplicationMetrics.hpp"
#include "application/RetryPolicy.hpp"
#include "domain/DiscoveredFile.hpp"
#include "domain/FileJob.hpp"
#include "domain/repositories/IStateStore.hpp"
#include "domain/services/ICopyEngine.hpp"
#include "domain/services/IHashingEngine.hpp"
#include "domain/services/StepContext.hpp"
#include "infrastructure/StateChangeLog.hpp"

namespace forker::application {

/**
 * @struct StepOutcome
 * @brief What the dispatcher needs to know after one advancement step.
 */
struct StepOutcome {
    domain::JobState state = domain::JobState::Discovered;
    bool open = false;                                               ///< The job still needs work.
    std::optional<std::chrono::system_clock::time_point> nextDueAt;  ///< Earliest useful time for the next step.
    bool abandoned = false;                                          ///< The step stopped early (deadline, hard stop, shutdown).
    bool quarantined = false;
};

/**
 * @struct FailureEvent
 * @brief Raised once per job that ends Failed or PartiallyFailed.
 */
struct FailureEvent {
    std::string jobId;
    domain::JobState state = domain::JobState::Failed;
    bool quarantined = false;
    std::map<std::string, std::string> targetErrors;   ///< target name -> last error
};

/**
 * @class JobStateMachine
 * @brief Applies engine results to jobs and persists every transition before acting on it.
 *
 * Engine errors never escape: each kind becomes a retry, an immediate target
 * failure, or a revert. Only StateStoreError propagates, because without a
 * durable store no transition can be trusted.
 *
 * Callers must hold the job's exclusive token around advance().
 */
class JobStateMachine {
public:
    using FailureListener = std::function<void(const FailureEvent&)>;

    JobStateMachine(ForkerConfig config,
                    std::shared_ptr<domain::IStateStore> store,
                    std::shared_ptr<domain::ICopyEngine> copyEngine,
                    std::shared_ptr<domain::IHashingEngine> hashingEngine,
                    std::shared_ptr<infrastructure::StateChangeLog> auditLog,
                    std::shared_ptr<ReplicationMetrics> metrics);

    /**
     * @brief Creates and persists a job with two Pending targets.
     * @throws domain::PathPolicyViolation if the file is a link or outside the source directory.
     */
    domain::FileJob admit(const domain::DiscoveredFile& file);

    /** @brief Runs one advancement step of a job. */
    StepOutcome advance(const std::string& jobId, const domain::StepContext& ctx);

    /**
     * @brief Startup reconciliation of one persisted job.
     *
     * Invariant violations quarantine the job. Interrupted stages go back to
     * Pending and lose their partial file; Staged and VerificationPending are
     * kept for an idempotent re-publish and a re-verify.
     */
    domain::FileJob recover(domain::FileJob job);

    /**
     * @brief Returns a quarantined job to work once an operator has reconciled it.
     *
     * The source is identified again and both targets restart from Pending.
     * The caller must hold the job's token.
     * @return The requeued job; empty if the job is unknown, not quarantined, or its source is gone.
     * @throws std::invalid_argument for an empty @p reason.
     */
    std::optional<domain::FileJob> releaseFromQuarantine(const std::string& jobId, const std::string& reason);

    /**
     * @brief Removes staging files that no recovered job still owns.
     * Staging files of quarantined jobs are always kept for the operator.
     */
    size_t cleanupOrphans(const std::vector<domain::FileJob>& jobs);

    /** @brief Archives cleaned-up jobs whose retention window has elapsed. */
    size_t sweepRetention(std::chrono::system_clock::time_point now);

    void setFailureListener(FailureListener listener);

    static std::string StagingNameFor(const domain::FileJob& job, domain::TargetRole role);

private:
    enum class ActionResult {
        Continue,   ///< An action ran; try the next one.
        Waiting,    ///< Terminal, in backoff, or not allowed now.
        Stopped     ///< The step must end.
    };

    ActionResult fingerprint(domain::FileJob& job, const domain::StepContext& ctx);
    ActionResult runAction(domain::FileJob& job, domain::TargetRole role, const domain::StepContext& ctx);

    void stageTarget(domain::FileJob& job, domain::TargetRole role, const domain::StepContext& ctx);
    void publishTarget(domain::FileJob& job, domain::TargetRole role);
    void verifyTarget(domain::FileJob& job, domain::TargetRole role, const domain::StepContext& ctx);

    void failTarget(domain::FileJob& job, domain::TargetRole role, const std::string& reason);
    void retryOrFail(domain::FileJob& job, domain::TargetRole role, domain::TargetState revertTo, const std::string& reason);
    void abandonAction(domain::FileJob& job, domain::TargetRole role, domain::TargetState revertTo, const std::string& reason);

    void finalize(domain::FileJob& job);
    void surfaceFailure(domain::FileJob& job);

    void persist(domain::FileJob& job);
    void enforceSourcePolicy(const domain::FileJob& job) const;
    std::string chooseFinalPath(const domain::FileJob& job, const domain::Target& target) const;
    void removeStagedQuietly(const domain::FileJob& job, const domain::Target& target);
    StepOutcome outcomeFor(const domain::FileJob& job) const;

    ForkerConfig m_config;
    std::shared_ptr<domain::IStateStore> m_store;
    std::shared_ptr<domain::ICopyEngine> m_copy;
    std::shared_ptr<domain::IHashingEngine> m_hashing;
    std::shared_ptr<infrastructure::StateChangeLog> m_auditLog;
    std::shared_ptr<ReplicationMetrics> m_metrics;
    RetryPolicy m_retry;

    std::mutex m_listenerMutex;
    FailureListener m_failureListener;
};

} // namespace forker::application
