/**
 * @file JobStateMachine.cpp
 * @brief Implementation of JobStateMachine.
 */

#include "application/JobStateMachine.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>

#include "domain/ReplicationErrors.hpp"
#include "infrastructure/PathUtils.hpp"

namespace forker::application {

namespace fs = std::filesystem;
using namespace forker::domain;
using infrastructure::PathUtils;

namespace {

constexpr TargetRole kRoles[] = {TargetRole::Primary, TargetRole::Research};

std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

/// State a target returns to when the action that started from @p before does not complete.
TargetState RevertStateFor(TargetState before) {
    return before == TargetState::Staging ? TargetState::Pending : before;
}

std::string ShortHex(const Digest& d) {
    return d.hex().substr(0, 16);
}

} // namespace

JobStateMachine::JobStateMachine(ForkerConfig config,
                                 std::shared_ptr<IStateStore> store,
                                 std::shared_ptr<ICopyEngine> copyEngine,
                                 std::shared_ptr<IHashingEngine> hashingEngine,
                                 std::shared_ptr<infrastructure::StateChangeLog> auditLog,
                                 std::shared_ptr<ReplicationMetrics> metrics)
    : m_config(std::move(config)),
      m_store(std::move(store)),
      m_copy(std::move(copyEngine)),
      m_hashing(std::move(hashingEngine)),
      m_auditLog(std::move(auditLog)),
      m_metrics(std::move(metrics)),
      m_retry(m_config.retry) {}

void JobStateMachine::setFailureListener(FailureListener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_failureListener = std::move(listener);
}

std::string JobStateMachine::StagingNameFor(const FileJob& job, TargetRole role) {
    return job.getId() + "." + TargetRoleToString(role);
}

// --- Admission ---

FileJob JobStateMachine::admit(const DiscoveredFile& file) {
    if (!PathUtils::IsWithinRoot(file.path, m_config.sourceDirectory)) {
        throw PathPolicyViolation("Discovered file lies outside the source directory");
    }
    if (PathUtils::IsSymlink(file.path)) {
        throw PathPolicyViolation("Discovered file is a symbolic link");
    }

    auto discoveredNs = std::chrono::duration_cast<std::chrono::nanoseconds>(
        file.discoveredAt.time_since_epoch()).count();
    std::string id = m_hashing->digestText(file.path + '\0' + std::to_string(discoveredNs)).hex().substr(0, 32);

    FileJob job(id, file.path, file.sizeBytes, file.modifiedAtNs, file.discoveredAt,
                m_config.primaryDirectory, m_config.researchDirectory);
    persist(job);
    m_metrics->recordAdmitted();

    std::cout << "[JobStateMachine] Admitted job " << id << " (" << file.sizeBytes << " bytes)" << std::endl;
    return job;
}

// --- Advancement ---

StepOutcome JobStateMachine::advance(const std::string& jobId, const StepContext& ctx) {
    auto loaded = m_store->get(jobId);
    if (!loaded) {
        std::cerr << "[JobStateMachine] Job " << jobId << " is no longer in the state store" << std::endl;
        StepOutcome gone;
        gone.state = JobState::Failed;
        return gone;
    }
    FileJob job = std::move(*loaded);

    bool stopped = false;
    if (!job.isQuarantined()) {
        ActionResult r = fingerprint(job, ctx);
        if (r == ActionResult::Stopped) {
            stopped = true;
        } else if (r == ActionResult::Continue) {
            for (TargetRole role : kRoles) {
                ActionResult ar;
                while ((ar = runAction(job, role, ctx)) == ActionResult::Continue) {
                }
                if (ar == ActionResult::Stopped) {
                    stopped = true;
                    break;
                }
            }
        }
    }

    if (!ctx.hardStopRaised()) {
        finalize(job);
    }

    StepOutcome out = outcomeFor(job);
    out.abandoned = stopped;
    return out;
}

JobStateMachine::ActionResult JobStateMachine::fingerprint(FileJob& job, const StepContext& ctx) {
    if (job.getSourceDigest()) return ActionResult::Continue;
    if (job.allTargetsTerminal()) return ActionResult::Waiting;
    if (ctx.shutdownRequested() || ctx.shouldAbandon()) return ActionResult::Stopped;

    auto now = Now();
    if (job.getTarget(TargetRole::Primary).isWaitingForBackoff(now)) return ActionResult::Waiting;

    try {
        enforceSourcePolicy(job);
        Digest d = m_hashing->digestFile(job.getSourcePath(), ctx.abandoningOnShutdown());
        job.setSourceDigest(d);
        for (TargetRole role : kRoles) {
            job.getTarget(role).clearBackoff();
        }
        persist(job);
        std::cout << "[JobStateMachine] Job " << job.getId() << " fingerprinted: "
                  << d.algorithm << " " << ShortHex(d) << "..." << std::endl;
        return ActionResult::Continue;
    } catch (const StateStoreError&) {
        throw;
    } catch (const StepAbandonedError& e) {
        std::cout << "[JobStateMachine] Job " << job.getId() << " fingerprint " << e.what() << std::endl;
        return ActionResult::Stopped;
    } catch (const PathPolicyViolation& e) {
        for (TargetRole role : kRoles) {
            failTarget(job, role, std::string("path policy: ") + e.what());
        }
        return ActionResult::Waiting;
    } catch (const std::exception& e) {
        int attempts = 0;
        for (TargetRole role : kRoles) {
            attempts = job.getTarget(role).recordFailedAttempt(std::string("fingerprint: ") + e.what());
        }
        if (m_retry.isExhausted(attempts)) {
            for (TargetRole role : kRoles) {
                failTarget(job, role, "source fingerprint failed after " + std::to_string(attempts) +
                                      " attempts: " + e.what());
            }
            return ActionResult::Waiting;
        }
        auto retryAt = now + m_retry.delayAfter(attempts);
        for (TargetRole role : kRoles) {
            job.getTarget(role).scheduleRetryAt(retryAt);
        }
        m_metrics->recordTransientRetry();
        persist(job);
        std::cerr << "[JobStateMachine] Job " << job.getId() << " fingerprint attempt " << attempts << "/"
                  << m_retry.maxAttempts() << " failed: " << e.what() << std::endl;
        return ActionResult::Waiting;
    }
}

JobStateMachine::ActionResult JobStateMachine::runAction(FileJob& job, TargetRole role, const StepContext& ctx) {
    Target& t = job.getTarget(role);
    if (t.isTerminal()) return ActionResult::Waiting;
    if (t.isWaitingForBackoff(Now())) return ActionResult::Waiting;
    // Draining: an action already running may finish, no new one starts.
    if (ctx.shutdownRequested() || ctx.shouldAbandon()) return ActionResult::Stopped;

    TargetState before = t.getState();
    try {
        switch (before) {
            case TargetState::Pending:
                stageTarget(job, role, ctx);
                break;
            case TargetState::Staging:
                // Only reachable when recover() was skipped; treat as an interrupted stage.
                removeStagedQuietly(job, t);
                job.transitionTarget(role, TargetState::Pending, Now(), "interrupted stage");
                persist(job);
                break;
            case TargetState::Staged:
                if (!ctx.publishAllowed()) return ActionResult::Stopped;
                publishTarget(job, role);
                break;
            case TargetState::VerificationPending:
                verifyTarget(job, role, ctx);
                break;
            case TargetState::Verified:
            case TargetState::Failed:
                return ActionResult::Waiting;
        }
        return ActionResult::Continue;
    } catch (const StateStoreError&) {
        throw;
    } catch (const InvalidStateTransition&) {
        throw;
    } catch (const StepAbandonedError& e) {
        abandonAction(job, role, RevertStateFor(before), e.what());
        return ActionResult::Stopped;
    } catch (const IntegrityMismatchError& e) {
        failTarget(job, role, std::string("integrity: ") + e.what());
    } catch (const CrossVolumeRenameError& e) {
        failTarget(job, role, std::string("cross-volume: ") + e.what());
    } catch (const PathPolicyViolation& e) {
        failTarget(job, role, std::string("path policy: ") + e.what());
    } catch (const std::exception& e) {
        // TransientIOError and anything unclassified
        retryOrFail(job, role, RevertStateFor(before), e.what());
    }
    return ActionResult::Continue;
}

void JobStateMachine::stageTarget(FileJob& job, TargetRole role, const StepContext& ctx) {
    enforceSourcePolicy(job);

    Target& t = job.getTarget(role);
    fs::path root = t.getDestinationRoot();
    std::string finalPath = chooseFinalPath(job, t);
    if (!PathUtils::IsWithinRoot(finalPath, root)) {
        throw PathPolicyViolation("Final path escapes its destination root");
    }

    std::string stagingName = StagingNameFor(job, role);
    t.setFinalPath(finalPath);
    t.setStagedPath(m_copy->stagingPathFor(root, stagingName).string());
    t.clearBackoff();
    job.transitionTarget(role, TargetState::Staging, Now(), "stage begin");
    persist(job);

    StageResult result = m_copy->stage(job.getSourcePath(), root, stagingName, ctx);
    m_metrics->addBytesCopied(result.bytesCopied);

    job.transitionTarget(role, TargetState::Staged, Now(), std::to_string(result.bytesCopied) + " bytes staged");
    persist(job);
}

void JobStateMachine::publishTarget(FileJob& job, TargetRole role) {
    Target& t = job.getTarget(role);

    if (!m_copy->pathExists(t.getStagedPath()) && !m_copy->pathExists(t.getFinalPath())) {
        job.transitionTarget(role, TargetState::Pending, Now(), "staging copy lost, restaging");
        persist(job);
        std::cerr << "[JobStateMachine] Job " << job.getId() << " " << t.getName()
                  << ": staging copy lost, restaging" << std::endl;
        return;
    }

    PublishOutcome outcome = m_copy->publish(t.getStagedPath(), t.getFinalPath());
    t.clearBackoff();
    job.transitionTarget(role, TargetState::VerificationPending, Now(),
                         outcome == PublishOutcome::AlreadyPublished ? "already published" : "published");
    persist(job);
}

void JobStateMachine::verifyTarget(FileJob& job, TargetRole role, const StepContext& ctx) {
    Target& t = job.getTarget(role);

    // Compare under the algorithm the source was fingerprinted with, not the configured one.
    const Digest& expected = *job.getSourceDigest();
    Digest d = m_hashing->digestFileWith(expected.algorithm, t.getFinalPath(), ctx.abandoningOnShutdown());
    t.setDigest(d);
    if (d != *job.getSourceDigest()) {
        m_metrics->recordVerificationFailure();
        throw IntegrityMismatchError("published " + t.getName() + " copy does not match the source digest");
    }

    t.clearBackoff();
    std::string context = "digest " + ShortHex(d);
    if (d.quickCheckCrc32) context += " crc32 " + std::to_string(*d.quickCheckCrc32);
    job.transitionTarget(role, TargetState::Verified, Now(), context);
    persist(job);
}

// --- Failure handling ---

void JobStateMachine::failTarget(FileJob& job, TargetRole role, const std::string& reason) {
    Target& t = job.getTarget(role);
    TargetState from = t.getState();
    if (IsTerminal(from)) return;

    t.setLastError(reason);
    t.clearBackoff();
    job.transitionTarget(role, TargetState::Failed, Now(), reason);
    if (from == TargetState::Staging || from == TargetState::Staged) {
        removeStagedQuietly(job, t);
    }
    persist(job);

    std::cerr << "[JobStateMachine] Job " << job.getId() << " target " << t.getName()
              << " Failed: " << reason << std::endl;
}

void JobStateMachine::retryOrFail(FileJob& job, TargetRole role, TargetState revertTo, const std::string& reason) {
    Target& t = job.getTarget(role);
    int attempts = t.recordFailedAttempt(reason);

    if (m_retry.isExhausted(attempts)) {
        failTarget(job, role, "retry budget exhausted after " + std::to_string(attempts) + " attempts: " + reason);
        return;
    }

    if (t.getState() != revertTo) {
        job.transitionTarget(role, revertTo, Now(), "retry after: " + reason);
        if (revertTo == TargetState::Pending) {
            removeStagedQuietly(job, t);
        }
    }

    auto delay = m_retry.delayAfter(attempts);
    t.scheduleRetryAt(Now() + delay);
    m_metrics->recordTransientRetry();
    persist(job);

    std::cerr << "[JobStateMachine] Job " << job.getId() << " target " << t.getName()
              << " attempt " << attempts << "/" << m_retry.maxAttempts() << " failed: " << reason
              << " (retry in " << delay.count() << " ms)" << std::endl;
}

void JobStateMachine::abandonAction(FileJob& job, TargetRole role, TargetState revertTo, const std::string& reason) {
    Target& t = job.getTarget(role);
    if (t.getState() != revertTo) {
        job.transitionTarget(role, revertTo, Now(), reason);
        if (revertTo == TargetState::Pending) {
            removeStagedQuietly(job, t);
        }
    }
    t.setLastError(reason);
    persist(job);

    std::cout << "[JobStateMachine] Job " << job.getId() << " target " << t.getName()
              << " " << reason << "; back to " << TargetStateToString(revertTo) << std::endl;
}

// --- Completion ---

void JobStateMachine::finalize(FileJob& job) {
    JobState state = job.getState();

    if (state == JobState::Verified && !job.isCleanupCompleted()) {
        try {
            SourceIdentity admitted{job.getSourceSize(), job.getSourceModifiedAtNs()};
            SourceCleanup cleanup = m_copy->deleteSource(job.getSourcePath(), admitted);
            job.markCleanupCompleted(Now());
            persist(job);
            m_metrics->recordOutcome(JobState::Verified);
            const char* what = "removed";
            if (cleanup == SourceCleanup::AlreadyGone) what = "already gone";
            if (cleanup == SourceCleanup::Replaced) what = "replaced by a newer file, left in place";
            std::cout << "[JobStateMachine] Job " << job.getId() << " Verified on both targets, source "
                      << what << std::endl;
        } catch (const StateStoreError&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[JobStateMachine] Job " << job.getId() << " source cleanup deferred: " << e.what() << std::endl;
        }
        return;
    }

    bool terminalFailure = job.isQuarantined() ||
        ((state == JobState::Failed || state == JobState::PartiallyFailed) && job.allTargetsTerminal());
    if (terminalFailure && !job.isFailureSurfaced()) {
        surfaceFailure(job);
    }
}

void JobStateMachine::surfaceFailure(FileJob& job) {
    FailureEvent event;
    event.jobId = job.getId();
    event.state = job.getState();
    event.quarantined = job.isQuarantined();
    for (TargetRole role : kRoles) {
        const Target& t = job.getTarget(role);
        event.targetErrors[t.getName()] = t.getLastError();
    }

    std::cerr << "[JobStateMachine] Job " << job.getId() << " ended " << JobStateToString(event.state)
              << (event.quarantined ? " (quarantined: " + job.getQuarantineReason() + ")" : std::string())
              << " [primary " << TargetStateToString(job.getTarget(TargetRole::Primary).getState())
              << ", research " << TargetStateToString(job.getTarget(TargetRole::Research).getState())
              << "]. Source retained." << std::endl;

    FailureListener listener;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        listener = m_failureListener;
    }
    if (listener) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            std::cerr << "[JobStateMachine] Failure listener threw: " << e.what() << std::endl;
        }
    }

    // Delivered at least once: the flag is persisted after the listener ran.
    job.markFailureSurfaced();
    persist(job);
    if (!event.quarantined) {
        m_metrics->recordOutcome(event.state);
    }
}

// --- Recovery ---

FileJob JobStateMachine::recover(FileJob job) {
    auto now = Now();
    try {
        job.validate();
    } catch (const CorruptStateError& e) {
        if (!job.isQuarantined()) {
            job.quarantine(e.what(), now);
            persist(job);
            m_metrics->recordQuarantined();
            std::cerr << "[JobStateMachine] Quarantined job " << job.getId() << ": " << e.what()
                      << ". Manual reconciliation required." << std::endl;
        }
        return job;
    }

    bool changed = false;
    for (TargetRole role : kRoles) {
        Target& t = job.getTarget(role);
        if (t.getState() == TargetState::Staging) {
            removeStagedQuietly(job, t);
            job.transitionTarget(role, TargetState::Pending, now, "recovered: interrupted stage");
            changed = true;
        }
    }
    if (changed) {
        persist(job);
    }
    return job;
}

std::optional<FileJob> JobStateMachine::releaseFromQuarantine(const std::string& jobId, const std::string& reason) {
    if (reason.empty()) {
        throw std::invalid_argument("A reason is required to release a job from quarantine");
    }
    auto loaded = m_store->get(jobId);
    if (!loaded || !loaded->isQuarantined()) {
        std::cerr << "[JobStateMachine] Job " << jobId << " is not in quarantine" << std::endl;
        return std::nullopt;
    }
    FileJob job = std::move(*loaded);

    std::optional<SourceIdentity> source;
    if (!job.getSourcePath().empty() && PathUtils::IsWithinRoot(job.getSourcePath(), m_config.sourceDirectory)) {
        source = m_copy->identify(job.getSourcePath());
    }
    if (!source) {
        std::cerr << "[JobStateMachine] Job " << jobId << " stays quarantined: its source file is gone" << std::endl;
        return std::nullopt;
    }

    auto rootOr = [](const std::string& root, const std::string& fallback) {
        return root.empty() ? fallback : root;
    };
    job.requeueFromQuarantine(reason, source->sizeBytes, source->modifiedAtNs,
                              rootOr(job.getTarget(TargetRole::Primary).getDestinationRoot(), m_config.primaryDirectory),
                              rootOr(job.getTarget(TargetRole::Research).getDestinationRoot(), m_config.researchDirectory),
                              Now());
    job.validate();
    persist(job);

    std::cout << "[JobStateMachine] Job " << jobId << " released from quarantine: " << reason << std::endl;
    return job;
}

size_t JobStateMachine::cleanupOrphans(const std::vector<FileJob>& jobs) {
    std::set<std::string> keep;
    std::set<std::string> roots = {m_config.primaryDirectory, m_config.researchDirectory};
    for (const auto& job : jobs) {
        for (TargetRole role : kRoles) {
            const Target& t = job.getTarget(role);
            if (!t.getDestinationRoot().empty()) {
                roots.insert(t.getDestinationRoot());
            }
            if (job.isQuarantined()) {
                keep.insert(m_copy->stagingPathFor(t.getDestinationRoot(), StagingNameFor(job, role)).filename().string());
                if (!t.getStagedPath().empty()) {
                    keep.insert(fs::path(t.getStagedPath()).filename().string());
                }
            } else if (t.getState() == TargetState::Staged || t.getState() == TargetState::Staging) {
                keep.insert(fs::path(t.getStagedPath()).filename().string());
            }
        }
    }

    size_t removed = 0;
    for (const auto& root : roots) {
        if (root.empty()) continue;
        try {
            removed += m_copy->cleanupOrphans(root, keep);
        } catch (const std::exception& e) {
            std::cerr << "[JobStateMachine] Orphan cleanup under a destination root failed: " << e.what() << std::endl;
        }
    }
    return removed;
}

size_t JobStateMachine::sweepRetention(std::chrono::system_clock::time_point now) {
    size_t archived = 0;
    for (const auto& job : m_store->listAll()) {
        const auto& cleanedAt = job.getCleanupCompletedAt();
        if (!job.isCleanupCompleted() || !cleanedAt) continue;
        if (*cleanedAt + m_config.retention > now) continue;
        m_store->archive(job.getId());
        ++archived;
    }
    if (archived > 0) {
        std::cout << "[JobStateMachine] Archived " << archived << " job(s) past retention" << std::endl;
    }
    return archived;
}

// --- Helpers ---

void JobStateMachine::persist(FileJob& job) {
    m_store->put(job);
    if (m_auditLog) {
        m_auditLog->append(job.getId(), job.getPendingTransitions());
    }
    job.clearPendingTransitions();
}

void JobStateMachine::enforceSourcePolicy(const FileJob& job) const {
    if (!PathUtils::IsWithinRoot(job.getSourcePath(), m_config.sourceDirectory)) {
        throw PathPolicyViolation("Source path escapes the source directory");
    }
    if (PathUtils::IsSymlink(job.getSourcePath())) {
        throw PathPolicyViolation("Source is a symbolic link");
    }
}

std::string JobStateMachine::chooseFinalPath(const FileJob& job, const Target& target) const {
    fs::path source = job.getSourcePath();
    fs::path root = target.getDestinationRoot();
    fs::path candidate = root / source.filename();
    if (!m_copy->pathExists(candidate)) {
        return candidate.string();
    }
    // Name already taken: <stem>.<first 8 of job id><ext>
    std::string disambiguated = source.stem().string() + "." + job.getId().substr(0, 8) + source.extension().string();
    return (root / disambiguated).string();
}

void JobStateMachine::removeStagedQuietly(const FileJob& job, const Target& target) {
    if (target.getStagedPath().empty()) return;
    try {
        m_copy->removeStaged(target.getStagedPath());
    } catch (const std::exception& e) {
        std::cerr << "[JobStateMachine] Job " << job.getId() << " " << target.getName()
                  << ": staging file left for orphan cleanup: " << e.what() << std::endl;
    }
}

StepOutcome JobStateMachine::outcomeFor(const FileJob& job) const {
    StepOutcome out;
    out.state = job.getState();
    out.quarantined = job.isQuarantined();
    out.open = job.needsWork();
    if (!out.open) return out;

    auto now = Now();
    if (job.allTargetsTerminal() || job.isQuarantined()) {
        // Only source cleanup or failure surfacing is left.
        out.nextDueAt = now + m_config.retry.baseDelay;
        return out;
    }

    std::optional<std::chrono::system_clock::time_point> earliest;
    for (TargetRole role : kRoles) {
        const Target& t = job.getTarget(role);
        if (t.isTerminal()) continue;
        auto due = t.getNextAttemptAt().value_or(now);
        if (!earliest || due < *earliest) earliest = due;
    }
    out.nextDueAt = earliest;
    return out;
}

} // namespace forker::application
