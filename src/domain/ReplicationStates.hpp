/**
 * @file ReplicationStates.hpp
 * @brief Value objects describing the lifecycle of a replication job and its targets.
 */

#pragma once

#include <optional>
#include <string>

namespace forker::domain {

/**
 * @enum TargetState
 * @brief Copy state of one destination of a job.
 */
enum class TargetState {
    Pending,              ///< Nothing written yet.
    Staging,              ///< Copy into the staging area is running.
    Staged,               ///< Staging copy complete and durable.
    VerificationPending,  ///< Published under its final name, digest not yet checked.
    Verified,             ///< Published copy matches the source digest.
    Failed                ///< Terminal failure, needs manual reconciliation.
};

/**
 * @enum JobState
 * @brief Overall state of a job. Always derived from its two targets, never stored.
 */
enum class JobState {
    Discovered,
    Copying,
    Verifying,
    Verified,
    PartiallyFailed,
    Failed
};

/**
 * @enum TargetRole
 * @brief The two destinations every job replicates to.
 */
enum class TargetRole {
    Primary,
    Research
};

inline std::string TargetStateToString(TargetState state) {
    switch (state) {
        case TargetState::Pending: return "Pending";
        case TargetState::Staging: return "Staging";
        case TargetState::Staged: return "Staged";
        case TargetState::VerificationPending: return "VerificationPending";
        case TargetState::Verified: return "Verified";
        case TargetState::Failed: return "Failed";
    }
    return "Unknown";
}

inline std::optional<TargetState> TargetStateFromString(const std::string& str) {
    if (str == "Pending") return TargetState::Pending;
    if (str == "Staging") return TargetState::Staging;
    if (str == "Staged") return TargetState::Staged;
    if (str == "VerificationPending") return TargetState::VerificationPending;
    if (str == "Verified") return TargetState::Verified;
    if (str == "Failed") return TargetState::Failed;
    return std::nullopt;
}

inline std::string JobStateToString(JobState state) {
    switch (state) {
        case JobState::Discovered: return "Discovered";
        case JobState::Copying: return "Copying";
        case JobState::Verifying: return "Verifying";
        case JobState::Verified: return "Verified";
        case JobState::PartiallyFailed: return "PartiallyFailed";
        case JobState::Failed: return "Failed";
    }
    return "Unknown";
}

inline std::string TargetRoleToString(TargetRole role) {
    return role == TargetRole::Primary ? "primary" : "research";
}

inline std::optional<TargetRole> TargetRoleFromString(const std::string& str) {
    if (str == "primary") return TargetRole::Primary;
    if (str == "research") return TargetRole::Research;
    return std::nullopt;
}

inline bool IsTerminal(TargetState state) {
    return state == TargetState::Verified || state == TargetState::Failed;
}

/**
 * @brief Checks whether a target may move from one state to another.
 *
 * Besides the forward path, a target may drop back to Pending when its
 * staging copy was interrupted or lost, and may fail from any non-terminal state.
 */
inline bool IsLegalTransition(TargetState from, TargetState to) {
    if (to == TargetState::Failed) {
        return !IsTerminal(from);
    }
    switch (from) {
        case TargetState::Pending:
            return to == TargetState::Staging;
        case TargetState::Staging:
            return to == TargetState::Staged || to == TargetState::Pending;
        case TargetState::Staged:
            return to == TargetState::VerificationPending || to == TargetState::Pending;
        case TargetState::VerificationPending:
            return to == TargetState::Verified;
        case TargetState::Verified:
        case TargetState::Failed:
            return false;
    }
    return false;
}

/**
 * @brief Derives the job state from the states of its two targets.
 * @param quarantined A quarantined job always reports Failed.
 */
inline JobState DeriveJobState(TargetState primary, TargetState research, bool quarantined = false) {
    if (quarantined) return JobState::Failed;

    const bool primaryFailed = primary == TargetState::Failed;
    const bool researchFailed = research == TargetState::Failed;
    if (primaryFailed && researchFailed) return JobState::Failed;
    if (primaryFailed || researchFailed) return JobState::PartiallyFailed;

    if (primary == TargetState::Verified && research == TargetState::Verified) return JobState::Verified;
    if (primary == TargetState::Pending && research == TargetState::Pending) return JobState::Discovered;

    auto copying = [](TargetState s) {
        return s == TargetState::Pending || s == TargetState::Staging || s == TargetState::Staged;
    };
    if (copying(primary) || copying(research)) return JobState::Copying;

    return JobState::Verifying;
}

} // namespace forker::domain
