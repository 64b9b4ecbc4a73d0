// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include "model/ContractTypes.h"
#include "runtime/ActionTypes.h"
#include <cstdint>
#include <string>
#include <vector>

namespace CLE {

/**
 * @brief Outcome class of one event delivery
 *
 * NoMatch and Busy are signals, not failures. Aborted means a critical
 * action failed and the source state was kept.
 */
enum class TransitionStatus { Committed, NoMatch, Busy, Aborted };

std::string toString(TransitionStatus status);

/**
 * @brief One executed action, in plan order
 */
struct ActionRecord {
    std::string actionName;
    ActionType type = ActionType::Logging;
    ActionPhase phase = ActionPhase::Transition;
    bool isCritical = false;
    ActionOutcome outcome;

    json toJson() const;
};

/**
 * @brief Everything observable about one TransitionEngine::apply call
 */
struct TransitionResult {
    TransitionStatus status = TransitionStatus::NoMatch;
    std::string instanceName;
    std::string eventName;
    std::string transitionName;
    std::string fromState;
    std::string toState;
    uint64_t generation = 0;  // instance generation after the call
    std::string correlationId;
    std::vector<ActionRecord> actions;
    std::vector<ActionRecord> rollbacks;
    std::string abortedBy;  // name of the failing critical action
    std::string errorMessage;

    bool isCommitted() const {
        return status == TransitionStatus::Committed;
    }

    bool isAborted() const {
        return status == TransitionStatus::Aborted;
    }

    /**
     * @brief Failed action records that did not abort the transition
     */
    std::vector<ActionRecord> nonCriticalFailures() const;

    /**
     * @brief Names of executed actions in execution order
     */
    std::vector<std::string> executedActionNames() const;

    json toJson() const;

    /**
     * @brief Compact form kept by FsmInstance as last_transition_result
     */
    json toSummaryJson() const;
};

}  // namespace CLE
