// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "model/ContractTypes.h"

#include <array>
#include <utility>

namespace CLE {

namespace {

constexpr std::array<std::pair<NodeType, const char *>, 4> NODE_TYPE_NAMES{{
    {NodeType::OrchestratorGeneric, "ORCHESTRATOR_GENERIC"},
    {NodeType::ReducerGeneric, "REDUCER_GENERIC"},
    {NodeType::EffectGeneric, "EFFECT_GENERIC"},
    {NodeType::ComputeGeneric, "COMPUTE_GENERIC"},
}};

constexpr std::array<std::pair<ActionType, const char *>, 6> ACTION_TYPE_NAMES{{
    {ActionType::Event, "event"},
    {ActionType::Logging, "logging"},
    {ActionType::Persistence, "persistence"},
    {ActionType::DataCapture, "data_capture"},
    {ActionType::Alert, "alert"},
    {ActionType::Cleanup, "cleanup"},
}};

}  // namespace

std::string toString(NodeType type) {
    for (const auto &[value, name] : NODE_TYPE_NAMES) {
        if (value == type) {
            return name;
        }
    }
    return "UNKNOWN";
}

std::string toString(ActionType type) {
    for (const auto &[value, name] : ACTION_TYPE_NAMES) {
        if (value == type) {
            return name;
        }
    }
    return "unknown";
}

std::string toString(ActionPhase phase) {
    switch (phase) {
    case ActionPhase::Exit:
        return "exit";
    case ActionPhase::Transition:
        return "transition";
    case ActionPhase::Entry:
        return "entry";
    case ActionPhase::Rollback:
        return "rollback";
    }
    return "unknown";
}

std::optional<NodeType> nodeTypeFromString(const std::string &text) {
    for (const auto &[value, name] : NODE_TYPE_NAMES) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<ActionType> actionTypeFromString(const std::string &text) {
    for (const auto &[value, name] : ACTION_TYPE_NAMES) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace CLE
