#pragma once

namespace steward {

enum class Privilege {
    User,
    Root
};

enum class OutcomeAction {
    None,
    Applied,
    Planned
};

enum class OutcomeResult {
    Success,
    Failed,
    SkippedDependencyFailed,
    SkippedRunAborted,
    SkippedUserOnly
};

enum class FailureReason {
    None,
    InsufficientPrivilege,
    ProbeError,
    ApplyError,
    VerificationFailed,
    DependencyFailed,
    RunAborted
};

// Report-level classification derived from action + result.
enum class OutcomeKind {
    Unchanged,
    Converged,
    Planned,
    Failed,
    SkippedDependencyFailed,
    SkippedRunAborted,
    SkippedUserOnly
};

} // namespace steward
