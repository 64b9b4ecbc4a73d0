// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/TestContracts.h"
#include "common/TestUtils.h"
#include "mocks/MockActionExecutor.h"
#include "parsing/ContractParser.h"
#include "runtime/FsmInstance.h"
#include "runtime/TransitionEngine.h"
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

using namespace CLE;
using CLE::Test::MockActionExecutor;
namespace Contracts = CLE::Test::Contracts;
namespace Utils = CLE::Test::Utils;

namespace {

class RecordingObserver : public IStateObserver {
public:
    void onStateChanged(const StateChangedEvent &event) override {
        events.push_back(event);
    }

    std::vector<StateChangedEvent> events;
};

class ThrowingObserver : public IStateObserver {
public:
    void onStateChanged(const StateChangedEvent &) override {
        throw std::runtime_error("observer failure");
    }
};

// Drives wiring -> running from inside the notification
class ChainingObserver : public IStateObserver {
public:
    explicit ChainingObserver(FsmInstance &instance) : instance_(instance) {}

    void onStateChanged(const StateChangedEvent &event) override {
        if (event.toState == "wiring") {
            chained = instance_.handle("wired");
        }
    }

    TransitionResult chained;

private:
    FsmInstance &instance_;
};

}  // anonymous namespace

class FsmInstanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor_ = std::make_shared<MockActionExecutor>();
        engine_ = std::make_shared<TransitionEngine>(executor_);
        instance_ = std::make_unique<FsmInstance>("scenario", ContractParser::parse(Contracts::lifecycleNode()),
                                                  engine_);
    }

    std::shared_ptr<MockActionExecutor> executor_;
    std::shared_ptr<TransitionEngine> engine_;
    std::unique_ptr<FsmInstance> instance_;
};

TEST_F(FsmInstanceTest, StartsInInitialStateAtGenerationZero) {
    InstanceSnapshot snapshot = instance_->snapshot();

    EXPECT_EQ(snapshot.name, "scenario");
    EXPECT_EQ(snapshot.contractName, "scenario_node");
    EXPECT_EQ(snapshot.nodeType, NodeType::EffectGeneric);
    EXPECT_EQ(snapshot.currentState, "initializing");
    EXPECT_EQ(snapshot.generation, 0u);
    EXPECT_FALSE(snapshot.inTransition);
    EXPECT_FALSE(snapshot.isTerminal);
    EXPECT_TRUE(snapshot.lastTransitionResult.is_null());
}

TEST_F(FsmInstanceTest, SnapshotRecordsLastResult) {
    instance_->handle("start");
    instance_->handle("bogus");

    json snapshot = instance_->snapshot().toJson();

    EXPECT_EQ(snapshot["current_state"], "wiring");
    EXPECT_EQ(snapshot["generation"], 1);
    EXPECT_EQ(snapshot["node_type"], "EFFECT_GENERIC");
    EXPECT_EQ(snapshot["contract_version"], "1.0.0");
    EXPECT_EQ(snapshot["last_transition_result"]["status"], "no_match");
    EXPECT_EQ(snapshot["last_transition_result"]["event"], "bogus");
}

TEST_F(FsmInstanceTest, ObserversSeeCommittedTransitionsOnly) {
    auto observer = std::make_shared<RecordingObserver>();
    instance_->addObserver(observer);

    executor_->failAction("exit_check");
    instance_->handle("start");
    instance_->handle("bogus");
    executor_->succeedAction("exit_check");
    instance_->handle("start");

    ASSERT_EQ(observer->events.size(), 1u);
    EXPECT_EQ(observer->events[0].instanceName, "scenario");
    EXPECT_EQ(observer->events[0].fromState, "initializing");
    EXPECT_EQ(observer->events[0].toState, "wiring");
    EXPECT_EQ(observer->events[0].eventName, "start");
    EXPECT_EQ(observer->events[0].generation, 1u);
}

TEST_F(FsmInstanceTest, ObserverMayDeliverFollowUpEvent) {
    auto observer = std::make_shared<ChainingObserver>(*instance_);
    instance_->addObserver(observer);

    EXPECT_TRUE(instance_->handle("start").isCommitted());

    EXPECT_TRUE(observer->chained.isCommitted());
    EXPECT_EQ(instance_->getCurrentState(), "running");
    EXPECT_EQ(instance_->getGeneration(), 2u);
}

TEST_F(FsmInstanceTest, ThrowingObserverDoesNotAffectOthers) {
    auto recording = std::make_shared<RecordingObserver>();
    instance_->addObserver(std::make_shared<ThrowingObserver>());
    instance_->addObserver(recording);

    EXPECT_TRUE(instance_->handle("start").isCommitted());
    EXPECT_EQ(recording->events.size(), 1u);
}

TEST_F(FsmInstanceTest, ConcurrentDeliveryDuringTransitionIsBusy) {
    executor_->gateAction("enter_wiring");

    TransitionResult first;
    std::thread worker([&] { first = instance_->handle("start"); });
    ASSERT_TRUE(Utils::waitUntil([&] { return instance_->isInTransition(); }));

    TransitionResult rejected = instance_->handle("fatal_error");

    EXPECT_EQ(rejected.status, TransitionStatus::Busy);
    EXPECT_EQ(rejected.fromState, "initializing");
    EXPECT_EQ(rejected.generation, 0u);
    EXPECT_TRUE(instance_->snapshot().inTransition);

    executor_->openGate();
    worker.join();

    EXPECT_TRUE(first.isCommitted());
    EXPECT_FALSE(instance_->isInTransition());
    EXPECT_EQ(instance_->getGeneration(), 1u);
}

TEST_F(FsmInstanceTest, ConstructionRejectsMissingParts) {
    auto contract = ContractParser::parse(Contracts::lifecycleNode());

    EXPECT_THROW(FsmInstance("", contract, engine_), std::invalid_argument);
    EXPECT_THROW(FsmInstance("x", nullptr, engine_), std::invalid_argument);
    EXPECT_THROW(FsmInstance("x", contract, nullptr), std::invalid_argument);
    EXPECT_THROW(instance_->addObserver(nullptr), std::invalid_argument);
}
