// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "actions/ActionHandlerRegistry.h"
#include "actions/BuiltinActionHandlers.h"
#include "common/Logger.h"
#include <stdexcept>

namespace CLE {

std::shared_ptr<ActionHandlerRegistry> ActionHandlerRegistry::createDefault(const ActionCollaborators &collaborators) {
    auto registry = std::make_shared<ActionHandlerRegistry>();

    registry->registerHandler(ActionType::Logging, std::make_shared<LoggingActionHandler>());

    if (collaborators.eventBus) {
        registry->registerHandler(ActionType::Event, std::make_shared<EventActionHandler>(collaborators.eventBus));
    }
    if (collaborators.snapshotStore) {
        registry->registerHandler(ActionType::Persistence,
                                  std::make_shared<PersistenceActionHandler>(collaborators.snapshotStore));
    }
    if (collaborators.diagnosticStore) {
        registry->registerHandler(ActionType::DataCapture,
                                  std::make_shared<DataCaptureActionHandler>(collaborators.diagnosticStore));
    }
    if (collaborators.alertSink) {
        registry->registerHandler(ActionType::Alert, std::make_shared<AlertActionHandler>(collaborators.alertSink));
    }
    if (collaborators.resources) {
        registry->registerHandler(ActionType::Cleanup, std::make_shared<CleanupActionHandler>(collaborators.resources));
    }

    return registry;
}

void ActionHandlerRegistry::registerHandler(ActionType type, std::shared_ptr<IActionHandler> handler) {
    if (!handler) {
        throw std::invalid_argument("ActionHandlerRegistry: handler for '" + toString(type) + "' cannot be null");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[type] = std::move(handler);
    LOG_DEBUG("ActionHandlerRegistry: handler installed for '{}'", toString(type));
}

std::shared_ptr<IActionHandler> ActionHandlerRegistry::find(ActionType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(type);
    return it != handlers_.end() ? it->second : nullptr;
}

}  // namespace CLE
