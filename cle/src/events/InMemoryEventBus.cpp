// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "events/InMemoryEventBus.h"
#include "common/Logger.h"
#include "common/UniqueIdGenerator.h"

namespace CLE {

bool InMemoryEventBus::publish(const EventEnvelope &envelope) {
    if (envelope.topic.empty()) {
        LOG_WARN("InMemoryEventBus: Rejecting event '{}' without topic", envelope.eventName);
        return false;
    }

    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        published_.push_back(envelope);
        for (const auto &[id, subscription] : subscriptions_) {
            if (subscription.topic == envelope.topic) {
                handlers.push_back(subscription.handler);
            }
        }
    }

    LOG_DEBUG("InMemoryEventBus: {} -> {} subscriber(s)", envelope.topic, handlers.size());
    for (const auto &handler : handlers) {
        handler(envelope);
    }
    return true;
}

std::string InMemoryEventBus::subscribe(const std::string &topic, EventHandler handler) {
    std::string id = UniqueIdGenerator::generateSubscriptionId();
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.emplace(id, Subscription{id, topic, std::move(handler)});
    return id;
}

bool InMemoryEventBus::unsubscribe(const std::string &subscriptionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.erase(subscriptionId) > 0;
}

std::vector<EventEnvelope> InMemoryEventBus::getPublished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

std::vector<EventEnvelope> InMemoryEventBus::getPublished(const std::string &topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EventEnvelope> result;
    for (const auto &envelope : published_) {
        if (envelope.topic == topic) {
            result.push_back(envelope);
        }
    }
    return result;
}

size_t InMemoryEventBus::getSubscriptionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

size_t InMemoryEventBus::getSubscriptionCount(const std::string &topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto &[id, subscription] : subscriptions_) {
        if (subscription.topic == topic) {
            ++count;
        }
    }
    return count;
}

}  // namespace CLE
