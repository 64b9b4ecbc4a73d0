// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "actions/BuiltinActionHandlers.h"
#include "common/Logger.h"
#include "events/IAlertSink.h"
#include "events/IEventBus.h"
#include "events/TopicNaming.h"
#include "runtime/ResourceRegistry.h"
#include "stores/IDocumentStore.h"
#include <stdexcept>

namespace CLE {

namespace {

json contextToJson(const ActionContext &context) {
    return json{{"instance", context.instanceName},
                {"contract", context.contractName},
                {"event", context.eventName},
                {"from", context.sourceState},
                {"to", context.targetState},
                {"phase", toString(context.phase)},
                {"generation", context.generation}};
}

template <typename T> void requireCollaborator(const std::shared_ptr<T> &collaborator, const char *handlerName) {
    if (!collaborator) {
        throw std::invalid_argument(std::string(handlerName) + ": collaborator cannot be null");
    }
}

}  // anonymous namespace

// ========== Event ==========

EventActionHandler::EventActionHandler(std::shared_ptr<IEventBus> bus) : bus_(std::move(bus)) {
    requireCollaborator(bus_, "EventActionHandler");
}

std::string EventActionHandler::resolveTopic(const ActionDefinition &action, const ActionContext &context) {
    const std::string explicitTopic = JsonUtils::getString(action.config, "topic");
    if (!explicitTopic.empty()) {
        return explicitTopic;
    }

    const std::string channel = JsonUtils::getString(action.config, "channel", "evt");
    const TopicKind kind = channel == "cmd" ? TopicKind::Command : TopicKind::Event;
    const std::string service = JsonUtils::getString(action.config, "service", context.contractName);
    const std::string name = JsonUtils::getString(action.config, "event", action.name);

    return TopicNaming::makeTopic(kind, service, name, action.version.major);
}

ActionOutcome EventActionHandler::execute(const ActionDefinition &action, const ActionContext &context) {
    EventEnvelope envelope;
    envelope.topic = resolveTopic(action, context);
    envelope.eventName = JsonUtils::getString(action.config, "event", action.name);
    envelope.source = context.instanceName;
    envelope.correlationId = context.correlationId;
    envelope.timestampMs = JsonUtils::nowUnixMs();

    json payload = contextToJson(context);
    if (context.payload.is_object() && !context.payload.empty()) {
        payload["data"] = context.payload;
    }
    if (action.config.contains("payload") && action.config["payload"].is_object()) {
        payload = JsonUtils::merge(payload, action.config["payload"]);
    }
    envelope.payload = std::move(payload);

    if (!bus_->publish(envelope)) {
        return ActionOutcome::failure(FailureCause::Reported, "event bus rejected publish on " + envelope.topic);
    }
    return ActionOutcome::ok();
}

// ========== Logging ==========

ActionOutcome LoggingActionHandler::execute(const ActionDefinition &action, const ActionContext &context) {
    const std::string levelName = JsonUtils::getString(action.config, "level", "info");
    auto level = Logger::parseLevel(levelName);
    if (!level) {
        return ActionOutcome::failure(FailureCause::Reported, "unknown log level '" + levelName + "'");
    }

    const std::string message = JsonUtils::getString(action.config, "message", action.name);
    json fields = contextToJson(context);
    fields["action"] = action.name;
    fields["correlation_id"] = context.correlationId;

    Logger::log(level.value(), std::format("{} {}", message, JsonUtils::toCompactString(fields)));
    return ActionOutcome::ok();
}

// ========== Persistence ==========

PersistenceActionHandler::PersistenceActionHandler(std::shared_ptr<IDocumentStore> store) : store_(std::move(store)) {
    requireCollaborator(store_, "PersistenceActionHandler");
}

ActionOutcome PersistenceActionHandler::execute(const ActionDefinition &action, const ActionContext &context) {
    const std::string key = JsonUtils::getString(action.config, "key", context.instanceName + ".state");

    // no generation or timestamp: re-entering a state must write the same document
    json value{{"instance", context.instanceName},
               {"state", context.targetState},
               {"source", context.sourceState},
               {"event", context.eventName}};

    if (!store_->put(key, value)) {
        return ActionOutcome::failure(FailureCause::Reported, "document store rejected put for '" + key + "'");
    }
    return ActionOutcome::ok();
}

// ========== Data capture ==========

DataCaptureActionHandler::DataCaptureActionHandler(std::shared_ptr<IDocumentStore> store) : store_(std::move(store)) {
    requireCollaborator(store_, "DataCaptureActionHandler");
}

ActionOutcome DataCaptureActionHandler::execute(const ActionDefinition &action, const ActionContext &context) {
    const std::string key =
        JsonUtils::getString(action.config, "key", "diagnostics/" + context.instanceName + "/" + action.name);

    json capture = contextToJson(context);
    capture["payload"] = context.payload;
    capture["correlation_id"] = context.correlationId;
    capture["captured_at_ms"] = JsonUtils::nowUnixMs();

    if (!store_->putIfAbsent(key, capture)) {
        LOG_DEBUG("DataCaptureActionHandler: '{}' already captured, keeping first capture", key);
    }
    return ActionOutcome::ok();
}

// ========== Alert ==========

AlertActionHandler::AlertActionHandler(std::shared_ptr<IAlertSink> sink) : sink_(std::move(sink)) {
    requireCollaborator(sink_, "AlertActionHandler");
}

ActionOutcome AlertActionHandler::execute(const ActionDefinition &action, const ActionContext &context) {
    const std::string severityName = JsonUtils::getString(action.config, "severity", "warning");
    auto severity = alertSeverityFromString(severityName);
    if (!severity) {
        return ActionOutcome::failure(FailureCause::Reported, "unknown alert severity '" + severityName + "'");
    }

    Alert alert;
    alert.severity = severity.value();
    alert.summary = JsonUtils::getString(action.config, "summary",
                                         std::format("{}: {} -> {} on '{}'", context.instanceName,
                                                     context.sourceState, context.targetState, context.eventName));
    alert.source = context.instanceName;
    alert.correlationId = context.correlationId;
    alert.details = contextToJson(context);
    alert.details["action"] = action.name;

    if (!sink_->raise(alert)) {
        return ActionOutcome::failure(FailureCause::Reported, "alert sink rejected alert");
    }
    return ActionOutcome::ok();
}

// ========== Cleanup ==========

CleanupActionHandler::CleanupActionHandler(std::shared_ptr<ResourceRegistry> resources)
    : resources_(std::move(resources)) {
    requireCollaborator(resources_, "CleanupActionHandler");
}

ActionOutcome CleanupActionHandler::execute(const ActionDefinition &action, const ActionContext &context) {
    const std::string resource = JsonUtils::getString(action.config, "resource");
    const std::string prefix = JsonUtils::getString(action.config, "prefix");

    if (resource.empty() && prefix.empty()) {
        return ActionOutcome::failure(FailureCause::Reported,
                                      "cleanup action '" + action.name + "' names neither resource nor prefix");
    }

    bool released = true;
    if (!resource.empty()) {
        released = resources_->release(resource) && released;
    }
    if (!prefix.empty()) {
        released = resources_->releasePrefix(prefix) && released;
    }

    if (!released) {
        return ActionOutcome::failure(FailureCause::Reported,
                                      std::format("{}: resource release failed", context.instanceName));
    }
    return ActionOutcome::ok();
}

}  // namespace CLE
