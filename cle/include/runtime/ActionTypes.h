// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include "model/ContractTypes.h"
#include <chrono>
#include <cstdint>
#include <string>

namespace CLE {

/**
 * @brief Everything an action may know about the transition running it
 */
struct ActionContext {
    std::string instanceName;
    std::string contractName;
    std::string eventName;
    json payload = json::object();
    std::string sourceState;
    std::string targetState;
    ActionPhase phase = ActionPhase::Transition;
    std::string correlationId;
    uint64_t generation = 0;  // generation before the transition commits
};

enum class FailureCause { None, Reported, Timeout, Exception, NoHandler };

std::string toString(FailureCause cause);

/**
 * @brief Result of one action execution
 *
 * A timeout is an ordinary failure with cause Timeout; whether it aborts the
 * transition depends only on the action's is_critical flag.
 */
struct ActionOutcome {
    bool success = true;
    FailureCause cause = FailureCause::None;
    std::string message;
    std::chrono::milliseconds duration{0};

    static ActionOutcome ok() {
        return ActionOutcome{};
    }

    static ActionOutcome failure(FailureCause cause, const std::string &message) {
        ActionOutcome outcome;
        outcome.success = false;
        outcome.cause = cause;
        outcome.message = message;
        return outcome;
    }

    bool isSuccess() const {
        return success;
    }

    bool isTimeout() const {
        return cause == FailureCause::Timeout;
    }
};

}  // namespace CLE
