// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include <cstdint>
#include <functional>
#include <string>

namespace CLE {

/**
 * @brief Message published on the event bus
 */
struct EventEnvelope {
    std::string topic;
    std::string eventName;
    std::string source;  // instance or node that produced the event
    std::string correlationId;
    json payload = json::object();
    int64_t timestampMs = 0;
};

using EventHandler = std::function<void(const EventEnvelope &)>;

/**
 * @brief External event bus collaborator
 *
 * Topic access control belongs to the bus; the runtime only chooses topic
 * names (see TopicNaming).
 */
class IEventBus {
public:
    virtual ~IEventBus() = default;

    /**
     * @brief Publish an envelope on envelope.topic
     * @return true if the bus accepted the message
     */
    virtual bool publish(const EventEnvelope &envelope) = 0;

    /**
     * @brief Subscribe a handler to a topic
     * @return Subscription id used for unsubscribe
     */
    virtual std::string subscribe(const std::string &topic, EventHandler handler) = 0;

    /**
     * @return true if the subscription existed
     */
    virtual bool unsubscribe(const std::string &subscriptionId) = 0;
};

}  // namespace CLE
