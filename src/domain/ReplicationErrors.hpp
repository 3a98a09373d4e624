/**
 * @file ReplicationErrors.hpp
 * @brief Error taxonomy raised by the replication engines and the domain model.
 *
 * The job state machine catches these at its boundary and turns each kind
 * into a state transition (retry, immediate failure, quarantine or revert).
 */

#pragma once

#include <stdexcept>
#include <string>

namespace forker::domain {

/** @brief Base of every replication error. */
class ForkerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Recoverable I/O failure. Retried with backoff until the budget runs out. */
class TransientIOError : public ForkerError {
public:
    using ForkerError::ForkerError;
};

/** @brief Published bytes do not match the source digest. */
class IntegrityMismatchError : public ForkerError {
public:
    using ForkerError::ForkerError;
};

/** @brief Publish would need a rename across filesystems. */
class CrossVolumeRenameError : public ForkerError {
public:
    using ForkerError::ForkerError;
};

/**
 * @brief A path is a symbolic link or escapes its configured root.
 * The message never carries the offending path.
 */
class PathPolicyViolation : public ForkerError {
public:
    using ForkerError::ForkerError;
};

/** @brief A persisted record violates the domain invariants. */
class CorruptStateError : public ForkerError {
public:
    using ForkerError::ForkerError;
};

/** @brief A target was asked to make a transition its state does not allow. */
class InvalidStateTransition : public ForkerError {
public:
    using ForkerError::ForkerError;
};

/** @brief An action stopped because its deadline passed or a hard stop was raised. */
class StepAbandonedError : public ForkerError {
public:
    using ForkerError::ForkerError;
};

/** @brief The state store could not read or durably write a record. Fatal. */
class StateStoreError : public ForkerError {
public:
    using ForkerError::ForkerError;
};

} // namespace forker::domain
