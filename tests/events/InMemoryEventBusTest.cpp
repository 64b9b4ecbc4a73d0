// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "events/InMemoryEventBus.h"
#include <gtest/gtest.h>

using namespace CLE;

namespace {

EventEnvelope envelope(const std::string &topic, const std::string &eventName = "ready") {
    EventEnvelope result;
    result.topic = topic;
    result.eventName = eventName;
    result.source = "test";
    return result;
}

}  // anonymous namespace

class InMemoryEventBusTest : public ::testing::Test {
protected:
    InMemoryEventBus bus_;
};

TEST_F(InMemoryEventBusTest, DeliversSynchronouslyToMatchingTopicOnly) {
    std::vector<std::string> received;
    bus_.subscribe("onex.evt.a.ready.v1", [&](const EventEnvelope &e) { received.push_back("a:" + e.eventName); });
    bus_.subscribe("onex.evt.b.ready.v1", [&](const EventEnvelope &e) { received.push_back("b:" + e.eventName); });

    EXPECT_TRUE(bus_.publish(envelope("onex.evt.a.ready.v1", "first")));

    EXPECT_EQ(received, std::vector<std::string>({"a:first"}));
}

TEST_F(InMemoryEventBusTest, KeepsPublishHistoryPerTopic) {
    bus_.publish(envelope("onex.evt.a.ready.v1"));
    bus_.publish(envelope("onex.evt.b.ready.v1"));
    bus_.publish(envelope("onex.evt.a.ready.v1"));

    EXPECT_EQ(bus_.getPublished().size(), 3u);
    EXPECT_EQ(bus_.getPublished("onex.evt.a.ready.v1").size(), 2u);
    EXPECT_TRUE(bus_.getPublished("onex.evt.c.ready.v1").empty());
}

TEST_F(InMemoryEventBusTest, RejectsEnvelopeWithoutTopic) {
    EXPECT_FALSE(bus_.publish(envelope("")));
    EXPECT_TRUE(bus_.getPublished().empty());
}

TEST_F(InMemoryEventBusTest, UnsubscribeStopsDelivery) {
    int calls = 0;
    std::string id = bus_.subscribe("onex.evt.a.ready.v1", [&](const EventEnvelope &) { ++calls; });
    std::string other = bus_.subscribe("onex.evt.a.ready.v1", [](const EventEnvelope &) {});

    EXPECT_NE(id, other);
    EXPECT_EQ(bus_.getSubscriptionCount("onex.evt.a.ready.v1"), 2u);

    EXPECT_TRUE(bus_.unsubscribe(id));
    EXPECT_FALSE(bus_.unsubscribe(id));
    bus_.publish(envelope("onex.evt.a.ready.v1"));

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(bus_.getSubscriptionCount(), 1u);
}

TEST_F(InMemoryEventBusTest, HandlerMayPublishReentrantly) {
    std::vector<std::string> order;
    bus_.subscribe("onex.evt.a.ping.v1", [&](const EventEnvelope &) {
        order.push_back("ping");
        bus_.publish(envelope("onex.evt.a.pong.v1"));
    });
    bus_.subscribe("onex.evt.a.pong.v1", [&](const EventEnvelope &) { order.push_back("pong"); });

    bus_.publish(envelope("onex.evt.a.ping.v1"));

    EXPECT_EQ(order, std::vector<std::string>({"ping", "pong"}));
}
