// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "model/Contract.h"
#include "common/ContractErrors.h"
#include "common/Logger.h"

#include <unordered_set>

namespace CLE {

namespace {

std::string indexed(const std::string &list, size_t index) {
    return list + "[" + std::to_string(index) + "]";
}

}  // namespace

std::shared_ptr<const Contract> Contract::create(ContractDefinition definition) {
    // Private constructor; make_shared cannot reach it
    std::shared_ptr<Contract> contract(new Contract(std::move(definition)));
    contract->validateAndIndex();

    LOG_DEBUG("Contract: '{}' v{} validated ({} states, {} transitions, {} actions)", contract->getName(),
              contract->getVersion().toString(), contract->getStates().size(), contract->getTransitions().size(),
              contract->getActions().size());
    return contract;
}

Contract::Contract(ContractDefinition definition) : definition_(std::move(definition)) {}

void Contract::validateAndIndex() {
    const std::string &name = definition_.name;

    if (name.empty()) {
        throw SchemaError(name, "name", "contract name must not be empty");
    }

    // Action table
    for (size_t i = 0; i < definition_.actions.size(); ++i) {
        const auto &action = definition_.actions[i];
        const std::string path = indexed("actions", i);
        if (action.name.empty()) {
            throw SchemaError(name, path + ".action_name", "action name must not be empty");
        }
        if (action.timeoutMs <= 0) {
            throw SchemaError(name, path + ".timeout_ms", "timeout_ms must be greater than zero");
        }
        if (action.timeoutMs > MAX_ACTION_TIMEOUT_MS) {
            throw SchemaError(name, path + ".timeout_ms",
                              "timeout_ms must not exceed " + std::to_string(MAX_ACTION_TIMEOUT_MS));
        }
        if (!actionIndex_.emplace(action.name, i).second) {
            throw SchemaError(name, path + ".action_name", "duplicate action '" + action.name + "'");
        }
    }
    for (size_t i = 0; i < definition_.actions.size(); ++i) {
        const auto &action = definition_.actions[i];
        if (action.rollbackAction.empty()) {
            continue;
        }
        const std::string path = indexed("actions", i) + ".rollback_action";
        if (action.rollbackAction == action.name) {
            throw SchemaError(name, path, "action '" + action.name + "' cannot be its own rollback");
        }
        if (!actionIndex_.count(action.rollbackAction)) {
            throw SchemaError(name, path, "unknown rollback action '" + action.rollbackAction + "'");
        }
    }

    auto checkActionList = [this, &name](const std::vector<std::string> &list, const std::string &path) {
        std::unordered_set<std::string> seen;
        for (size_t i = 0; i < list.size(); ++i) {
            if (!actionIndex_.count(list[i])) {
                throw SchemaError(name, indexed(path, i), "unknown action '" + list[i] + "'");
            }
            if (!seen.insert(list[i]).second) {
                throw SchemaError(name, indexed(path, i), "action '" + list[i] + "' listed twice");
            }
        }
    };

    // States
    if (definition_.states.empty()) {
        throw SchemaError(name, "states", "contract declares no states");
    }
    size_t initialCount = 0;
    size_t terminalCount = 0;
    for (size_t i = 0; i < definition_.states.size(); ++i) {
        const auto &state = definition_.states[i];
        const std::string path = indexed("states", i);
        if (state.name.empty() || state.name == WILDCARD_STATE) {
            throw SchemaError(name, path + ".name", "invalid state name '" + state.name + "'");
        }
        if (!stateIndex_.emplace(state.name, i).second) {
            throw SchemaError(name, path + ".name", "duplicate state '" + state.name + "'");
        }
        if (state.isInitial) {
            ++initialCount;
            initialIndex_ = i;
        }
        if (state.isTerminal) {
            ++terminalCount;
        }
        checkActionList(state.entryActions, path + ".entry_actions");
        checkActionList(state.exitActions, path + ".exit_actions");
    }
    if (initialCount != 1) {
        throw SchemaError(name, "states",
                          "exactly one initial state required, found " + std::to_string(initialCount));
    }
    if (terminalCount == 0) {
        throw SchemaError(name, "states", "at least one terminal state required");
    }

    // Transitions
    for (size_t i = 0; i < definition_.transitions.size(); ++i) {
        auto &transition = definition_.transitions[i];
        const std::string path = indexed("transitions", i);

        if (transition.event.empty()) {
            throw SchemaError(name, path + ".event", "event must not be empty");
        }
        if (!transition.isWildcard() && !stateIndex_.count(transition.fromState)) {
            throw SchemaError(name, path + ".from_state", "unknown state '" + transition.fromState + "'");
        }
        if (!stateIndex_.count(transition.toState)) {
            throw SchemaError(name, path + ".to_state", "unknown state '" + transition.toState + "'");
        }
        checkActionList(transition.actions, path + ".actions");

        if (transition.name.empty()) {
            transition.name = transition.fromState + "__" + transition.event;
        }

        if (transition.isWildcard()) {
            if (!wildcardTransitions_.emplace(transition.event, i).second) {
                throw SchemaError(name, path, "ambiguous wildcard transitions for event '" + transition.event + "'");
            }
        } else if (!exactTransitions_.emplace(std::make_pair(transition.fromState, transition.event), i).second) {
            throw SchemaError(name, path,
                              "ambiguous transitions from '" + transition.fromState + "' on event '" +
                                  transition.event + "'");
        }
    }

    for (size_t i = 0; i < definition_.dependencies.size(); ++i) {
        if (definition_.dependencies[i].name.empty()) {
            throw SchemaError(name, indexed("dependencies", i) + ".name", "dependency name must not be empty");
        }
    }
}

const StateDefinition *Contract::findState(const std::string &stateName) const {
    auto it = stateIndex_.find(stateName);
    return it == stateIndex_.end() ? nullptr : &definition_.states[it->second];
}

const ActionDefinition *Contract::findAction(const std::string &actionName) const {
    auto it = actionIndex_.find(actionName);
    return it == actionIndex_.end() ? nullptr : &definition_.actions[it->second];
}

bool Contract::isTerminal(const std::string &stateName) const {
    const StateDefinition *state = findState(stateName);
    return state != nullptr && state->isTerminal;
}

const TransitionDefinition *Contract::findExactTransition(const std::string &fromState,
                                                          const std::string &event) const {
    auto it = exactTransitions_.find(std::make_pair(fromState, event));
    return it == exactTransitions_.end() ? nullptr : &definition_.transitions[it->second];
}

const TransitionDefinition *Contract::findWildcardTransition(const std::string &event) const {
    auto it = wildcardTransitions_.find(event);
    return it == wildcardTransitions_.end() ? nullptr : &definition_.transitions[it->second];
}

const TransitionDefinition *Contract::matchTransition(const std::string &currentState,
                                                      const std::string &event) const {
    if (const TransitionDefinition *exact = findExactTransition(currentState, event)) {
        return exact;
    }
    if (isTerminal(currentState)) {
        return nullptr;
    }
    return findWildcardTransition(event);
}

std::vector<const TransitionDefinition *> Contract::outgoingTransitions(const std::string &stateName) const {
    std::vector<const TransitionDefinition *> result;
    std::unordered_set<std::string> coveredEvents;

    for (const auto &transition : definition_.transitions) {
        if (transition.fromState == stateName) {
            result.push_back(&transition);
            coveredEvents.insert(transition.event);
        }
    }
    if (!isTerminal(stateName)) {
        for (const auto &transition : definition_.transitions) {
            if (transition.isWildcard() && !coveredEvents.count(transition.event)) {
                result.push_back(&transition);
            }
        }
    }
    return result;
}

}  // namespace CLE
