// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "actions/ActionHandlerRegistry.h"
#include "runtime/IActionExecutor.h"
#include <memory>

namespace CLE {

/**
 * @brief Deadline-enforcing executor dispatching by action_type
 *
 * The handler runs on its own worker thread while the calling thread waits at
 * most timeout_ms. A handler still running at the deadline is abandoned, not
 * interrupted: it keeps its own copies of the action and context and its
 * result is discarded.
 */
class ActionExecutorImpl : public IActionExecutor {
public:
    /**
     * @throws std::invalid_argument if handlers is null
     */
    explicit ActionExecutorImpl(std::shared_ptr<ActionHandlerRegistry> handlers);

    ActionOutcome execute(const ActionDefinition &action, const ActionContext &context) override;

    const std::shared_ptr<ActionHandlerRegistry> &getHandlers() const {
        return handlers_;
    }

private:
    std::shared_ptr<ActionHandlerRegistry> handlers_;
};

}  // namespace CLE
