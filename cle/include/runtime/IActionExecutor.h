// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "model/ContractTypes.h"
#include "runtime/ActionTypes.h"

namespace CLE {

/**
 * @brief Interface for executing contract actions
 *
 * Executes exactly one action under its deadline and reports the outcome.
 * The executor never retries and never decides criticality; both belong to
 * the caller (TransitionEngine for classification, handlers for retries).
 */
class IActionExecutor {
public:
    virtual ~IActionExecutor() = default;

    /**
     * @brief Execute an action
     * @param action Action definition from the contract's action table
     * @param context Transition context handed to the handler
     * @return Success, or Failure with cause Reported, Timeout, Exception or NoHandler
     */
    virtual ActionOutcome execute(const ActionDefinition &action, const ActionContext &context) = 0;
};

}  // namespace CLE
