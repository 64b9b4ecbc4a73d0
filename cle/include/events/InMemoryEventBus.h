// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "events/IEventBus.h"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace CLE {

/**
 * @brief Process-local event bus
 *
 * Delivers synchronously on the publishing thread. Handlers are copied out of
 * the lock before delivery, so a handler may publish or (un)subscribe.
 * Every published envelope is kept for inspection.
 */
class InMemoryEventBus : public IEventBus {
public:
    bool publish(const EventEnvelope &envelope) override;
    std::string subscribe(const std::string &topic, EventHandler handler) override;
    bool unsubscribe(const std::string &subscriptionId) override;

    std::vector<EventEnvelope> getPublished() const;

    std::vector<EventEnvelope> getPublished(const std::string &topic) const;

    size_t getSubscriptionCount() const;

    size_t getSubscriptionCount(const std::string &topic) const;

private:
    struct Subscription {
        std::string id;
        std::string topic;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Subscription> subscriptions_;
    std::vector<EventEnvelope> published_;
};

}  // namespace CLE
