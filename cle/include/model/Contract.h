// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "model/ContractTypes.h"
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace CLE {

/**
 * @brief Immutable, validated contract
 *
 * Holds the declared states, transitions and action table plus two lookup
 * tables built once at construction:
 * - exact table keyed by (from_state, event)
 * - wildcard table keyed by event, consulted only after the exact lookup misses
 *
 * Instances are only reachable through std::shared_ptr<const Contract>; a
 * reload builds a new value and never mutates an existing one, so concurrent
 * readers need no synchronization.
 */
class Contract {
public:
    /**
     * @brief Validate invariants and build the runtime value
     * @throws SchemaError on any invariant violation (duplicate names, unknown
     *         state or action references, not exactly one initial state, no
     *         terminal state, ambiguous transitions, invalid timeouts)
     */
    static std::shared_ptr<const Contract> create(ContractDefinition definition);

    const std::string &getName() const {
        return definition_.name;
    }

    NodeType getNodeType() const {
        return definition_.nodeType;
    }

    const SemanticVersion &getVersion() const {
        return definition_.version;
    }

    const std::string &getDescription() const {
        return definition_.description;
    }

    const std::vector<StateDefinition> &getStates() const {
        return definition_.states;
    }

    const std::vector<TransitionDefinition> &getTransitions() const {
        return definition_.transitions;
    }

    const std::vector<ActionDefinition> &getActions() const {
        return definition_.actions;
    }

    const std::vector<DependencySpec> &getDependencies() const {
        return definition_.dependencies;
    }

    const std::vector<std::string> &getSubscriptions() const {
        return definition_.subscriptions;
    }

    const StateDefinition &getInitialState() const {
        return definition_.states[initialIndex_];
    }

    const StateDefinition *findState(const std::string &name) const;

    const ActionDefinition *findAction(const std::string &name) const;

    bool isTerminal(const std::string &stateName) const;

    const TransitionDefinition *findExactTransition(const std::string &fromState, const std::string &event) const;

    const TransitionDefinition *findWildcardTransition(const std::string &event) const;

    /**
     * @brief Transition applied for event in currentState
     *
     * Exact match first; the wildcard table is consulted only when the exact
     * lookup misses and currentState is not terminal.
     *
     * @return Matched transition or nullptr (event not applicable here)
     */
    const TransitionDefinition *matchTransition(const std::string &currentState, const std::string &event) const;

    /**
     * @brief Every transition that can fire from stateName (exact plus applicable wildcards)
     */
    std::vector<const TransitionDefinition *> outgoingTransitions(const std::string &stateName) const;

private:
    explicit Contract(ContractDefinition definition);

    void validateAndIndex();

    ContractDefinition definition_;
    size_t initialIndex_ = 0;
    std::unordered_map<std::string, size_t> stateIndex_;
    std::unordered_map<std::string, size_t> actionIndex_;
    std::map<std::pair<std::string, std::string>, size_t> exactTransitions_;
    std::unordered_map<std::string, size_t> wildcardTransitions_;
};

}  // namespace CLE
