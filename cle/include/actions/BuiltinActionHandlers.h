// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "actions/IActionHandler.h"
#include <memory>

namespace CLE {

class IEventBus;
class IDocumentStore;
class IAlertSink;
class ResourceRegistry;

/**
 * @brief Publishes an EventEnvelope on the event bus
 *
 * Topic is config.topic when set, otherwise
 * onex.<channel>.<service>.<event>.v<major> where channel is config.channel
 * ("evt" default, or "cmd"), service is config.service or the contract name,
 * event is config.event or the action name and major is the action version.
 * Payload is the transition context merged with config.payload.
 */
class EventActionHandler : public IActionHandler {
public:
    explicit EventActionHandler(std::shared_ptr<IEventBus> bus);

    ActionOutcome execute(const ActionDefinition &action, const ActionContext &context) override;

    /**
     * @brief Topic the action publishes on for the given context
     */
    static std::string resolveTopic(const ActionDefinition &action, const ActionContext &context);

private:
    std::shared_ptr<IEventBus> bus_;
};

/**
 * @brief Emits one structured log line (config.level, config.message)
 */
class LoggingActionHandler : public IActionHandler {
public:
    ActionOutcome execute(const ActionDefinition &action, const ActionContext &context) override;
};

/**
 * @brief Overwrites the instance state snapshot in the document store
 *
 * Key is config.key or "<instance>.state". The stored value only depends on
 * the transition endpoints, so repeated entry into the same state writes the
 * same document.
 */
class PersistenceActionHandler : public IActionHandler {
public:
    explicit PersistenceActionHandler(std::shared_ptr<IDocumentStore> store);

    ActionOutcome execute(const ActionDefinition &action, const ActionContext &context) override;

private:
    std::shared_ptr<IDocumentStore> store_;
};

/**
 * @brief Write-once diagnostic capture; an existing entry counts as success
 */
class DataCaptureActionHandler : public IActionHandler {
public:
    explicit DataCaptureActionHandler(std::shared_ptr<IDocumentStore> store);

    ActionOutcome execute(const ActionDefinition &action, const ActionContext &context) override;

private:
    std::shared_ptr<IDocumentStore> store_;
};

class AlertActionHandler : public IActionHandler {
public:
    explicit AlertActionHandler(std::shared_ptr<IAlertSink> sink);

    ActionOutcome execute(const ActionDefinition &action, const ActionContext &context) override;

private:
    std::shared_ptr<IAlertSink> sink_;
};

/**
 * @brief Releases owned handles: config.resource (one) or config.prefix (group)
 */
class CleanupActionHandler : public IActionHandler {
public:
    explicit CleanupActionHandler(std::shared_ptr<ResourceRegistry> resources);

    ActionOutcome execute(const ActionDefinition &action, const ActionContext &context) override;

private:
    std::shared_ptr<ResourceRegistry> resources_;
};

}  // namespace CLE
