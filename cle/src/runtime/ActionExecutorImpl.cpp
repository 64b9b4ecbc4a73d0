// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/ActionExecutorImpl.h"
#include "common/Logger.h"
#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

namespace CLE {

ActionExecutorImpl::ActionExecutorImpl(std::shared_ptr<ActionHandlerRegistry> handlers)
    : handlers_(std::move(handlers)) {
    if (!handlers_) {
        throw std::invalid_argument("ActionExecutorImpl: handler registry cannot be null");
    }
    LOG_DEBUG("ActionExecutorImpl created at address: {}", static_cast<void *>(this));
}

ActionOutcome ActionExecutorImpl::execute(const ActionDefinition &action, const ActionContext &context) {
    auto handler = handlers_->find(action.type);
    if (!handler) {
        LOG_WARN("ActionExecutorImpl: no handler for action '{}' of type '{}'", action.name, toString(action.type));
        return ActionOutcome::failure(FailureCause::NoHandler, "no handler registered for action_type '" +
                                                                   toString(action.type) + "'");
    }

    const auto started = std::chrono::steady_clock::now();

    // Captured by value: an abandoned worker must not touch the caller's frame
    std::packaged_task<ActionOutcome()> task([handler, action, context]() -> ActionOutcome {
        try {
            return handler->execute(action, context);
        } catch (const std::exception &e) {
            return ActionOutcome::failure(FailureCause::Exception, e.what());
        }
    });
    auto future = task.get_future();
    std::thread(std::move(task)).detach();

    // wait_for converts to the clock's nanoseconds; larger values overflow
    const auto timeout = std::chrono::milliseconds(std::clamp<int64_t>(action.timeoutMs, 0, MAX_ACTION_TIMEOUT_MS));
    ActionOutcome outcome;
    if (future.wait_for(timeout) == std::future_status::ready) {
        outcome = future.get();
    } else {
        outcome = ActionOutcome::failure(FailureCause::Timeout,
                                         "action '" + action.name + "' exceeded " + std::to_string(action.timeoutMs) +
                                             " ms");
    }
    outcome.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    if (outcome.isSuccess()) {
        LOG_DEBUG("ActionExecutorImpl: '{}' ({}) succeeded in {} ms [{}]", action.name, toString(context.phase),
                  outcome.duration.count(), context.correlationId);
    } else {
        LOG_DEBUG("ActionExecutorImpl: '{}' ({}) failed: {} ({}) [{}]", action.name, toString(context.phase),
                  outcome.message, toString(outcome.cause), context.correlationId);
    }
    return outcome;
}

}  // namespace CLE
