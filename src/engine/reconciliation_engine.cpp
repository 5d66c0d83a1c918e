#include "engine/reconciliation_engine.hpp"

#include <exception>
#include <utility>

#include <QThread>
#include <QUuid>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/dependency_graph.hpp"

namespace steward {

namespace {

bool blocksDependents(OutcomeResult result)
{
    return result == OutcomeResult::Failed
        || result == OutcomeResult::SkippedDependencyFailed
        || result == OutcomeResult::SkippedRunAborted;
}

ProbeResult guardedProbe(ResourceHandler &handler)
{
    try {
        return handler.probe();
    } catch (const std::exception &ex) {
        return unknownState(std::string("probe raised: ") + ex.what());
    }
}

ApplyResult guardedApply(ResourceHandler &handler, const nlohmann::json &desired)
{
    try {
        return handler.apply(desired);
    } catch (const std::exception &ex) {
        return applyFailed(std::string("apply raised: ") + ex.what());
    }
}

bool guardedMatches(const ResourceHandler &handler,
                    const nlohmann::json &observed,
                    const nlohmann::json &desired)
{
    try {
        return handler.matches(observed, desired);
    } catch (const std::exception &) {
        return false;
    }
}

void fail(ReconciliationOutcome &outcome, FailureReason reason, std::string error)
{
    outcome.result = OutcomeResult::Failed;
    outcome.reason = reason;
    outcome.error = std::move(error);
}

QString outcomeEventName(const ReconciliationOutcome &outcome)
{
    return QStringLiteral("resource_") + QString::fromStdString(toKindString(outcomeKind(outcome)));
}

void validateDescriptors(const std::vector<ResourceDescriptor> &descriptors)
{
    for (const auto &descriptor : descriptors) {
        if (descriptor.id.empty()) {
            throw ConfigError("resource with empty id");
        }
        if (!descriptor.handler) {
            throw ConfigError("resource '" + descriptor.id + "' has no handler");
        }
        if (descriptor.verify.attempts < 1) {
            throw ConfigError("resource '" + descriptor.id
                              + "' needs at least one verification attempt");
        }
    }
}

} // namespace

ReconciliationEngine::ReconciliationEngine(PrivilegeContext context, ReconcileOptions options)
    : m_context(std::move(context))
    , m_options(options)
    , m_sleeper([](std::chrono::milliseconds delay) {
        QThread::msleep(static_cast<unsigned long>(delay.count()));
    })
{
}

void ReconciliationEngine::setSleeper(Sleeper sleeper)
{
    m_sleeper = std::move(sleeper);
}

void ReconciliationEngine::setProgressCallback(ProgressCallback callback)
{
    m_progress = std::move(callback);
}

RunReport ReconciliationEngine::run(const std::vector<ResourceDescriptor> &descriptors) const
{
    const std::string runId = QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
    steward::logging::CorrelationScope corrScope(QString::fromStdString(runId));

    validateDescriptors(descriptors);
    const std::vector<std::string> order = orderResources(descriptors);

    std::unordered_map<std::string, const ResourceDescriptor *> byId;
    for (const auto &descriptor : descriptors) {
        byId.emplace(descriptor.id, &descriptor);
    }

    SLOG_INFO(QStringLiteral("ReconciliationEngine"),
              QStringLiteral("run"),
              QStringLiteral("run_start"),
              QStringLiteral("reconcile_request"),
              QStringLiteral("sequential_dependency_order"),
              steward::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"resources", order.size()},
                              {"dryRun", m_options.dryRun},
                              {"userOnly", m_options.userOnly},
                              {"stopOnFailure", m_options.stopOnFailure},
                              {"elevated", m_context.elevated}}));

    const auto startedAt = std::chrono::system_clock::now();
    std::vector<ReconciliationOutcome> outcomes;
    outcomes.reserve(order.size());
    OutcomeIndex index;
    bool aborted = false;

    for (const auto &id : order) {
        const ResourceDescriptor &descriptor = *byId.at(id);

        ReconciliationOutcome outcome;
        if (aborted) {
            outcome.resourceId = descriptor.id;
            outcome.desiredState = descriptor.desired;
            outcome.result = OutcomeResult::SkippedRunAborted;
            outcome.reason = FailureReason::RunAborted;
            outcome.error = "run stopped after an earlier failure";
        } else {
            outcome = reconcile(descriptor, outcomes, index);
        }

        if (outcome.result == OutcomeResult::Failed && m_options.stopOnFailure) {
            aborted = true;
        }

        const nlohmann::json logContext{
            {"resourceId", outcome.resourceId},
            {"privilege", toPrivilegeString(descriptor.privilege)},
            {"action", toActionString(outcome.action)},
            {"result", toResultString(outcome.result)},
            {"reason", toReasonString(outcome.reason)},
            {"error", outcome.error},
            {"durationMs", outcome.duration.count()}
        };
        if (outcome.result == OutcomeResult::Failed) {
            SLOG_WARN(QStringLiteral("ReconciliationEngine"),
                      QStringLiteral("run"),
                      outcomeEventName(outcome),
                      QString::fromStdString(toReasonString(outcome.reason)),
                      QString::fromStdString(descriptor.handler->kind()),
                      steward::logging::defaultWho(),
                      QString(),
                      logContext);
        } else {
            SLOG_INFO(QStringLiteral("ReconciliationEngine"),
                      QStringLiteral("run"),
                      outcomeEventName(outcome),
                      QStringLiteral("reconcile_step"),
                      QString::fromStdString(descriptor.handler->kind()),
                      steward::logging::defaultWho(),
                      QString(),
                      logContext);
        }

        index.emplace(outcome.resourceId, outcomes.size());
        outcomes.push_back(std::move(outcome));

        if (m_progress) {
            m_progress(descriptor, outcomes.back());
        }
    }

    RunReport report(runId, startedAt, std::chrono::system_clock::now(), m_context,
                     m_options.dryRun, std::move(outcomes));

    SLOG_INFO(QStringLiteral("ReconciliationEngine"),
              QStringLiteral("run"),
              QStringLiteral("run_finished"),
              QStringLiteral("reconcile_request"),
              QStringLiteral("sequential_dependency_order"),
              steward::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"overallSuccess", report.overallSuccess()},
                              {"counts", report.counts()}}));
    return report;
}

ReconciliationOutcome ReconciliationEngine::reconcile(
    const ResourceDescriptor &descriptor,
    const std::vector<ReconciliationOutcome> &previous,
    const OutcomeIndex &index) const
{
    const auto started = std::chrono::steady_clock::now();

    ReconciliationOutcome outcome;
    outcome.resourceId = descriptor.id;
    outcome.desiredState = descriptor.desired;

    auto finish = [&outcome, started]() {
        outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        return outcome;
    };

    // 1. Never converge on top of a broken prerequisite.
    for (const auto &dependency : descriptor.dependsOn) {
        const auto it = index.find(dependency);
        if (it == index.end()) {
            continue;
        }
        const ReconciliationOutcome &prerequisite = previous[it->second];
        if (blocksDependents(prerequisite.result)) {
            outcome.result = OutcomeResult::SkippedDependencyFailed;
            outcome.reason = FailureReason::DependencyFailed;
            outcome.error = "prerequisite '" + dependency + "' "
                + toResultString(prerequisite.result);
            return finish();
        }
    }

    // 2. Privilege gate. Probing itself may need root, so it is not attempted.
    if (descriptor.privilege == Privilege::Root && !m_context.elevated) {
        if (m_options.userOnly) {
            outcome.result = OutcomeResult::SkippedUserOnly;
            outcome.error = "requires root; excluded by user-only mode";
        } else {
            fail(outcome, FailureReason::InsufficientPrivilege,
                 "requires root privileges");
        }
        return finish();
    }

    ResourceHandler &handler = *descriptor.handler;

    // 3. Probe.
    const ProbeResult observed = guardedProbe(handler);
    ++outcome.probeCount;
    if (!observed.ok) {
        fail(outcome, FailureReason::ProbeError, observed.error);
        return finish();
    }
    outcome.startState = observed.state;

    // 4-5. Diff; a converged resource never reaches its applier.
    if (guardedMatches(handler, observed.state, descriptor.desired)) {
        outcome.endState = observed.state;
        outcome.action = OutcomeAction::None;
        outcome.result = OutcomeResult::Success;
        return finish();
    }

    if (m_options.dryRun) {
        outcome.endState = observed.state;
        outcome.action = OutcomeAction::Planned;
        outcome.result = OutcomeResult::Success;
        return finish();
    }

    // 6. Apply.
    SLOG_DEBUG(QStringLiteral("ReconciliationEngine"),
               QStringLiteral("reconcile"),
               QStringLiteral("resource_apply"),
               QStringLiteral("state_drift"),
               QString::fromStdString(handler.kind()),
               steward::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"resourceId", descriptor.id},
                               {"observed", observed.state},
                               {"desired", descriptor.desired}}));

    outcome.action = OutcomeAction::Applied;
    ++outcome.applyCount;
    const ApplyResult applied = guardedApply(handler, descriptor.desired);
    if (!applied.ok) {
        fail(outcome, FailureReason::ApplyError, applied.error);
        return finish();
    }

    // 7. Verify against live state.
    verify(descriptor, outcome);
    return finish();
}

void ReconciliationEngine::verify(const ResourceDescriptor &descriptor,
                                  ReconciliationOutcome &outcome) const
{
    ResourceHandler &handler = *descriptor.handler;
    std::string lastError;

    for (int attempt = 1; attempt <= descriptor.verify.attempts; ++attempt) {
        if (attempt > 1 && m_sleeper) {
            m_sleeper(descriptor.verify.delay);
        }

        const ProbeResult after = guardedProbe(handler);
        ++outcome.probeCount;
        if (!after.ok) {
            lastError = "verification probe failed: " + after.error;
            continue;
        }

        outcome.endState = after.state;
        if (guardedMatches(handler, after.state, descriptor.desired)) {
            outcome.result = OutcomeResult::Success;
            return;
        }
        lastError = "state after apply is " + after.state.dump()
            + ", expected " + descriptor.desired.dump();
    }

    if (descriptor.verify.attempts > 1) {
        lastError += " (after " + std::to_string(descriptor.verify.attempts) + " attempts)";
    }
    fail(outcome, FailureReason::VerificationFailed, lastError);
}

} // namespace steward
