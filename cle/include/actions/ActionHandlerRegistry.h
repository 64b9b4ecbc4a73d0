// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "actions/IActionHandler.h"
#include <map>
#include <memory>
#include <mutex>

namespace CLE {

class IEventBus;
class IDocumentStore;
class IAlertSink;
class ResourceRegistry;

/**
 * @brief Collaborator handles passed explicitly to the built-in handlers
 *
 * A null member leaves the corresponding action type without a handler;
 * actions of that type then fail with FailureCause::NoHandler.
 */
struct ActionCollaborators {
    std::shared_ptr<IEventBus> eventBus;
    std::shared_ptr<IDocumentStore> snapshotStore;
    std::shared_ptr<IDocumentStore> diagnosticStore;
    std::shared_ptr<IAlertSink> alertSink;
    std::shared_ptr<ResourceRegistry> resources;
};

/**
 * @brief Maps each ActionType to the handler performing it
 */
class ActionHandlerRegistry {
public:
    /**
     * @brief Registry wired to the built-in handlers
     *
     * The logging handler is always present; the others only when their
     * collaborator is provided.
     */
    static std::shared_ptr<ActionHandlerRegistry> createDefault(const ActionCollaborators &collaborators);

    /**
     * @brief Install or replace the handler for a type
     */
    void registerHandler(ActionType type, std::shared_ptr<IActionHandler> handler);

    std::shared_ptr<IActionHandler> find(ActionType type) const;

    bool hasHandler(ActionType type) const {
        return find(type) != nullptr;
    }

private:
    mutable std::mutex mutex_;
    std::map<ActionType, std::shared_ptr<IActionHandler>> handlers_;
};

}  // namespace CLE
