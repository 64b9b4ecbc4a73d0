// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "model/ContractTypes.h"
#include "runtime/ActionTypes.h"

namespace CLE {

/**
 * @brief Side effect behind one action_type
 *
 * Handlers run on an executor worker thread and may outlive a timed-out
 * transition, so they must not keep references into the context after
 * returning. Retry policy, if any, lives inside the handler.
 */
class IActionHandler {
public:
    virtual ~IActionHandler() = default;

    /**
     * @brief Perform the effect
     * @return Success, or failure with cause Reported and a message
     */
    virtual ActionOutcome execute(const ActionDefinition &action, const ActionContext &context) = 0;
};

}  // namespace CLE
