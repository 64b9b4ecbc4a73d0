// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/ContractErrors.h"
#include "common/TestContracts.h"
#include "events/InMemoryEventBus.h"
#include "mocks/MockCollaborators.h"
#include "orchestration/NodeGraph.h"
#include "parsing/ContractParser.h"
#include "runtime/ResourceRegistry.h"
#include <gtest/gtest.h>

using namespace CLE;
namespace Contracts = CLE::Test::Contracts;

namespace {

using DependencyList = std::vector<std::pair<std::string, std::string>>;

std::shared_ptr<const Contract> node(const std::string &name, const DependencyList &dependencies = {},
                                     const std::vector<std::string> &subscriptions = {},
                                     const std::string &version = "1.0.0") {
    return ContractParser::parse(Contracts::simpleNode(name, version, dependencies, subscriptions));
}

}  // anonymous namespace

TEST(NodeGraphTest, ResolvesDependenciesFirstWithNameTieBreak) {
    NodeGraph graph({node("gateway", {{"store", "1.0.0"}, {"auth", "1.0.0"}}), node("store"), node("auth"),
                     node("metrics"), node("billing", {{"store", "1.0.0"}})});

    const auto &order = graph.resolve();

    EXPECT_EQ(order, std::vector<std::string>({"auth", "metrics", "store", "billing", "gateway"}));
    EXPECT_TRUE(graph.isResolved());
    EXPECT_EQ(graph.nodeCount(), 5u);
    EXPECT_EQ(graph.dependentsOf("store"), std::vector<std::string>({"billing", "gateway"}));
}

TEST(NodeGraphTest, MissingDependencyNamesTheDependent) {
    NodeGraph graph({node("gateway", {{"store", "1.0.0"}})});

    try {
        graph.resolve();
        FAIL() << "expected DependencyError";
    } catch (const DependencyError &e) {
        EXPECT_EQ(e.getContractName(), "gateway");
        EXPECT_EQ(e.getDetail(), "depends on 'store' which is not registered");
    }
    EXPECT_FALSE(graph.isResolved());
}

TEST(NodeGraphTest, IncompatibleDependencyVersionIsRejected) {
    NodeGraph graph({node("gateway", {{"store", "2.0.0"}}), node("store", {}, {}, "1.9.0")});

    try {
        graph.resolve();
        FAIL() << "expected VersionMismatchError";
    } catch (const VersionMismatchError &e) {
        EXPECT_EQ(e.getContractName(), "store");
        EXPECT_EQ(e.getRequired(), "2.0.0");
        EXPECT_EQ(e.getLoaded(), "1.9.0");
    }
}

TEST(NodeGraphTest, CycleIsReported) {
    NodeGraph graph({node("a", {{"b", "1.0.0"}}), node("b", {{"a", "1.0.0"}}), node("c")});

    try {
        graph.resolve();
        FAIL() << "expected DependencyError";
    } catch (const DependencyError &e) {
        EXPECT_EQ(e.getDetail(), "dependency cycle among: a, b");
    }
}

TEST(NodeGraphTest, ConstructionRejectsNullAndDuplicates) {
    EXPECT_THROW(NodeGraph({nullptr}), std::invalid_argument);
    EXPECT_THROW(NodeGraph({node("a"), node("a")}), std::invalid_argument);
}

TEST(NodeGraphTest, WireBeforeResolveIsLogicError) {
    NodeGraph graph({node("a")});
    auto bus = std::make_shared<InMemoryEventBus>();
    ResourceRegistry resources;

    EXPECT_THROW(graph.wire(bus, resources), std::logic_error);
}

TEST(NodeGraphTest, WireSubscribesAndRegistersReleasableHandles) {
    NodeGraph graph({node("consumer", {{"producer", "1.0.0"}}, {"onex.evt.producer.ready.v1", "legacy_topic"}),
                     node("producer")});
    graph.resolve();
    auto bus = std::make_shared<InMemoryEventBus>();
    ResourceRegistry resources;
    std::vector<std::string> deliveries;

    size_t created = graph.wire(bus, resources, [&](const std::string &nodeName, const EventEnvelope &envelope) {
        deliveries.push_back(nodeName + ":" + envelope.eventName);
    });

    EXPECT_EQ(created, 2u);
    EXPECT_EQ(graph.wiredSubscriptionCount(), 2u);
    EXPECT_EQ(bus->getSubscriptionCount(), 2u);
    EXPECT_TRUE(resources.contains(NodeGraph::subscriptionResourceName("consumer", "onex.evt.producer.ready.v1")));
    EXPECT_TRUE(resources.contains("subscription/consumer/legacy_topic"));

    EventEnvelope envelope;
    envelope.topic = "onex.evt.producer.ready.v1";
    envelope.eventName = "ready";
    bus->publish(envelope);
    EXPECT_EQ(deliveries, std::vector<std::string>({"consumer:ready"}));

    EXPECT_TRUE(resources.releasePrefix(NodeGraph::SUBSCRIPTION_PREFIX));
    EXPECT_EQ(bus->getSubscriptionCount(), 0u);
    EXPECT_EQ(resources.size(), 0u);
}

TEST(NodeGraphTest, ReleasersKeepTheBusAlive) {
    NodeGraph graph({node("consumer", {}, {"onex.evt.producer.ready.v1"})});
    graph.resolve();
    ResourceRegistry resources;
    auto bus = std::make_shared<InMemoryEventBus>();
    std::weak_ptr<InMemoryEventBus> observed = bus;

    graph.wire(bus, resources);
    bus.reset();

    ASSERT_FALSE(observed.expired());
    EXPECT_TRUE(resources.releasePrefix(NodeGraph::SUBSCRIPTION_PREFIX));
    EXPECT_TRUE(observed.expired());
}

TEST(NodeGraphTest, RefusedSubscriptionFailsWiring) {
    NodeGraph graph({node("consumer", {}, {"onex.evt.producer.ready.v1"})});
    graph.resolve();
    auto bus = std::make_shared<CLE::Test::MockEventBus>();
    ResourceRegistry resources;
    EXPECT_CALL(*bus, subscribe(::testing::_, ::testing::_)).WillOnce(::testing::Return(""));

    EXPECT_THROW(graph.wire(bus, resources), std::runtime_error);
    EXPECT_EQ(resources.size(), 0u);
}
