// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include "common/SemanticVersion.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace CLE {

/// Source state of a transition that applies from any non-terminal state
inline constexpr const char *WILDCARD_STATE = "*";

/// Upper bound for an action's timeout_ms (24 h)
inline constexpr int64_t MAX_ACTION_TIMEOUT_MS = 24LL * 60 * 60 * 1000;

enum class NodeType { OrchestratorGeneric, ReducerGeneric, EffectGeneric, ComputeGeneric };

enum class ActionType { Event, Logging, Persistence, DataCapture, Alert, Cleanup };

/**
 * @brief Phase of the transition an action runs in
 */
enum class ActionPhase { Exit, Transition, Entry, Rollback };

std::string toString(NodeType type);
std::string toString(ActionType type);
std::string toString(ActionPhase phase);

std::optional<NodeType> nodeTypeFromString(const std::string &text);
std::optional<ActionType> actionTypeFromString(const std::string &text);

/**
 * @brief Action declared once in a contract's action table
 *
 * States and transitions refer to actions by name.
 */
struct ActionDefinition {
    std::string name;
    ActionType type = ActionType::Logging;
    bool isCritical = false;
    int64_t timeoutMs = 0;
    SemanticVersion version;
    std::string rollbackAction;  // empty = no compensation
    json config = json::object();
};

struct StateDefinition {
    std::string name;
    bool isInitial = false;
    bool isTerminal = false;
    std::vector<std::string> entryActions;
    std::vector<std::string> exitActions;
};

struct TransitionDefinition {
    std::string name;
    std::string fromState;  // state name or WILDCARD_STATE
    std::string toState;
    std::string event;
    std::vector<std::string> actions;

    bool isWildcard() const {
        return fromState == WILDCARD_STATE;
    }
};

/**
 * @brief Node graph dependency on another contract at a minimum compatible version
 */
struct DependencySpec {
    std::string name;
    SemanticVersion version;
};

/**
 * @brief Plain description of a contract before invariant validation
 *
 * Produced by ContractParser from a document, or built directly in code;
 * Contract::create turns it into the immutable runtime value.
 */
struct ContractDefinition {
    std::string name;
    NodeType nodeType = NodeType::OrchestratorGeneric;
    SemanticVersion version;
    std::string description;
    std::vector<ActionDefinition> actions;
    std::vector<StateDefinition> states;
    std::vector<TransitionDefinition> transitions;
    std::vector<DependencySpec> dependencies;
    std::vector<std::string> subscriptions;
};

}  // namespace CLE
