// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include "runtime/IActionExecutor.h"
#include "runtime/TransitionResult.h"
#include <memory>
#include <string>
#include <vector>

namespace CLE {

class Contract;
class FsmInstance;

/**
 * @brief Applies one event to one FSM instance
 *
 * Stateless apart from the executor, so a single engine can be shared by any
 * number of instances. Algorithm:
 *
 * 1. Busy if the instance already has a transition in flight
 * 2. Exact (current_state, event) lookup, then wildcard lookup by event
 * 3. Plan = exit_actions(source) ++ transition.actions ++ entry_actions(target)
 * 4. Execute the plan strictly in order
 * 5. Critical failure: roll back the succeeded actions in reverse order and
 *    keep the source state. Non-critical failure: record and continue
 * 6. Commit: state := target, generation += 1, then notify observers
 */
class TransitionEngine {
public:
    /**
     * @brief Plan entry: action definition and the phase it runs in
     */
    struct PlannedAction {
        const ActionDefinition *action = nullptr;
        ActionPhase phase = ActionPhase::Transition;
    };

    /**
     * @throws std::invalid_argument if executor is null
     */
    explicit TransitionEngine(std::shared_ptr<IActionExecutor> executor);

    /**
     * @brief Deliver event to instance
     * @param instance Target instance
     * @param event Event name
     * @param payload Event payload handed to every action
     * @return Committed, NoMatch, Busy or Aborted result; never throws for
     *         runtime outcomes
     */
    TransitionResult apply(FsmInstance &instance, const std::string &event, const json &payload = json::object());

    /**
     * @brief Ordered action plan for transition taken from sourceState
     */
    static std::vector<PlannedAction> buildPlan(const Contract &contract, const std::string &sourceState,
                                                const TransitionDefinition &transition);

private:
    void runTransition(FsmInstance &instance, const std::string &event, const json &payload,
                       TransitionResult &result);

    ActionOutcome executeAction(const ActionDefinition &action, const ActionContext &context);

    void rollback(const Contract &contract, const std::vector<const ActionDefinition *> &succeeded,
                  ActionContext context, TransitionResult &result);

    std::shared_ptr<IActionExecutor> executor_;
};

}  // namespace CLE
