// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/TransitionEngine.h"
#include "common/Logger.h"
#include "common/UniqueIdGenerator.h"
#include "model/Contract.h"
#include "runtime/FsmInstance.h"
#include <stdexcept>

namespace CLE {

TransitionEngine::TransitionEngine(std::shared_ptr<IActionExecutor> executor) : executor_(std::move(executor)) {
    if (!executor_) {
        throw std::invalid_argument("TransitionEngine: action executor cannot be null");
    }
}

TransitionResult TransitionEngine::apply(FsmInstance &instance, const std::string &event, const json &payload) {
    TransitionResult result;
    result.instanceName = instance.getName();
    result.eventName = event;
    result.correlationId = UniqueIdGenerator::generateCorrelationId();

    if (!instance.tryBeginTransition()) {
        result.status = TransitionStatus::Busy;
        result.fromState = instance.getCurrentState();
        result.generation = instance.getGeneration();
        result.errorMessage = "instance '" + instance.getName() + "' has a transition in flight";
        LOG_DEBUG("TransitionEngine: '{}' busy, rejecting '{}'", instance.getName(), event);
        return result;
    }

    {
        FsmInstance::TransitionFlagGuard guard(instance);
        runTransition(instance, event, payload, result);
        instance.recordResult(result);
    }

    // Observers run only after the flag is released, so they may deliver events themselves
    if (result.isCommitted()) {
        instance.notifyObservers(
            StateChangedEvent{result.instanceName, result.fromState, result.toState, event, result.generation});
    }
    return result;
}

std::vector<TransitionEngine::PlannedAction> TransitionEngine::buildPlan(const Contract &contract,
                                                                         const std::string &sourceState,
                                                                         const TransitionDefinition &transition) {
    std::vector<PlannedAction> plan;

    auto append = [&](const std::vector<std::string> &names, ActionPhase phase) {
        for (const auto &name : names) {
            const ActionDefinition *action = contract.findAction(name);
            if (!action) {
                // Contract::create rejects unknown references
                throw std::logic_error("action '" + name + "' missing from contract '" + contract.getName() + "'");
            }
            plan.push_back(PlannedAction{action, phase});
        }
    };

    if (const StateDefinition *source = contract.findState(sourceState)) {
        append(source->exitActions, ActionPhase::Exit);
    }
    append(transition.actions, ActionPhase::Transition);
    if (const StateDefinition *target = contract.findState(transition.toState)) {
        append(target->entryActions, ActionPhase::Entry);
    }
    return plan;
}

void TransitionEngine::runTransition(FsmInstance &instance, const std::string &event, const json &payload,
                                     TransitionResult &result) {
    const Contract &contract = instance.getContract();
    const std::string currentState = instance.getCurrentState();
    const uint64_t generation = instance.getGeneration();

    result.fromState = currentState;
    result.generation = generation;

    const TransitionDefinition *transition = contract.matchTransition(currentState, event);
    if (!transition) {
        result.status = TransitionStatus::NoMatch;
        result.errorMessage = "no transition for event '" + event + "' in state '" + currentState + "'";
        LOG_DEBUG("TransitionEngine: '{}' no match for '{}' in '{}'", instance.getName(), event, currentState);
        return;
    }

    result.transitionName = transition->name;
    result.toState = transition->toState;

    ActionContext context;
    context.instanceName = instance.getName();
    context.contractName = contract.getName();
    context.eventName = event;
    context.payload = payload.is_null() ? json::object() : payload;
    context.sourceState = currentState;
    context.targetState = transition->toState;
    context.correlationId = result.correlationId;
    context.generation = generation;

    LOG_DEBUG("TransitionEngine: '{}' {} -> {} on '{}' [{}]", instance.getName(), currentState, transition->toState,
              event, result.correlationId);

    std::vector<const ActionDefinition *> succeeded;
    for (const auto &step : buildPlan(contract, currentState, *transition)) {
        context.phase = step.phase;
        ActionOutcome outcome = executeAction(*step.action, context);

        const bool success = outcome.success;
        result.actions.push_back(
            ActionRecord{step.action->name, step.action->type, step.phase, step.action->isCritical, outcome});

        if (success) {
            succeeded.push_back(step.action);
            continue;
        }

        if (step.action->isCritical) {
            result.status = TransitionStatus::Aborted;
            result.abortedBy = step.action->name;
            result.errorMessage = "critical action '" + step.action->name + "' of contract '" + contract.getName() +
                                  "' failed (" + toString(outcome.cause) + "): " + outcome.message;
            LOG_ERROR("TransitionEngine: '{}' aborted {} -> {} on '{}': {}", instance.getName(), currentState,
                      transition->toState, event, result.errorMessage);

            rollback(contract, succeeded, context, result);
            return;
        }

        LOG_WARN("TransitionEngine: '{}' non-critical action '{}' failed ({}): {}", instance.getName(),
                 step.action->name, toString(outcome.cause), outcome.message);
    }

    result.generation = instance.commitTransition(transition->toState);
    result.status = TransitionStatus::Committed;
    LOG_INFO("TransitionEngine: '{}' {} -> {} on '{}' (generation {})", instance.getName(), currentState,
             transition->toState, event, result.generation);
}

ActionOutcome TransitionEngine::executeAction(const ActionDefinition &action, const ActionContext &context) {
    try {
        return executor_->execute(action, context);
    } catch (const std::exception &e) {
        return ActionOutcome::failure(FailureCause::Exception, e.what());
    }
}

void TransitionEngine::rollback(const Contract &contract, const std::vector<const ActionDefinition *> &succeeded,
                                ActionContext context, TransitionResult &result) {
    context.phase = ActionPhase::Rollback;

    for (auto it = succeeded.rbegin(); it != succeeded.rend(); ++it) {
        const ActionDefinition *original = *it;
        if (original->rollbackAction.empty()) {
            continue;
        }

        const ActionDefinition *compensation = contract.findAction(original->rollbackAction);
        if (!compensation) {
            LOG_WARN("TransitionEngine: rollback action '{}' for '{}' not found", original->rollbackAction,
                     original->name);
            continue;
        }

        ActionOutcome outcome = executeAction(*compensation, context);
        if (!outcome.success) {
            LOG_WARN("TransitionEngine: rollback '{}' for '{}' failed ({}): {}", compensation->name, original->name,
                     toString(outcome.cause), outcome.message);
        }
        result.rollbacks.push_back(
            ActionRecord{compensation->name, compensation->type, ActionPhase::Rollback, false, outcome});
    }
}

}  // namespace CLE
