// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/TestContracts.h"
#include "common/TestUtils.h"
#include "events/InMemoryEventBus.h"
#include "mocks/MockActionExecutor.h"
#include "orchestration/LifecycleContracts.h"
#include "orchestration/Orchestrator.h"
#include "parsing/ContractParser.h"
#include "runtime/FsmInstance.h"
#include "runtime/ResourceRegistry.h"
#include "runtime/TransitionEngine.h"
#include "stores/InMemoryDocumentStore.h"
#include <atomic>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace CLE;
using CLE::Test::MockActionExecutor;
namespace Contracts = CLE::Test::Contracts;
namespace Utils = CLE::Test::Utils;

class ConcurrentDeliveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor_ = std::make_shared<MockActionExecutor>();
        engine_ = std::make_shared<TransitionEngine>(executor_);
    }

    std::shared_ptr<MockActionExecutor> executor_;
    std::shared_ptr<TransitionEngine> engine_;
};

TEST_F(ConcurrentDeliveryTest, RacingFatalEventsCommitExactlyOnce) {
    constexpr int THREADS = 16;
    FsmInstance instance("racer", ContractParser::parse(Contracts::lifecycleNode()), engine_);

    std::atomic<bool> go{false};
    std::vector<TransitionResult> results(THREADS);
    std::vector<std::thread> threads;
    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            results[i] = instance.handle("fatal_error");
        });
    }
    go.store(true);
    for (auto &thread : threads) {
        thread.join();
    }

    int committed = 0;
    for (const auto &result : results) {
        if (result.isCommitted()) {
            ++committed;
            EXPECT_EQ(result.generation, 1u);
        } else {
            EXPECT_TRUE(result.status == TransitionStatus::Busy || result.status == TransitionStatus::NoMatch)
                << toString(result.status);
        }
    }
    EXPECT_EQ(committed, 1);
    EXPECT_EQ(instance.getCurrentState(), "stopped");
    EXPECT_EQ(instance.getGeneration(), 1u);
    EXPECT_FALSE(instance.isInTransition());
}

TEST_F(ConcurrentDeliveryTest, GenerationMatchesCommittedCount) {
    constexpr int THREADS = 8;
    FsmInstance instance("counter", ContractParser::parse(Contracts::wildcardNode()), engine_);

    std::atomic<int> committed{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&] {
            for (int attempt = 0; attempt < 20; ++attempt) {
                if (instance.handle("go").isCommitted()) {
                    committed.fetch_add(1);
                }
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(committed.load(), 2);
    EXPECT_EQ(instance.getGeneration(), 2u);
    EXPECT_EQ(instance.getCurrentState(), "c");
}

TEST_F(ConcurrentDeliveryTest, BusyDeliveryIsRetriedUntilInstanceFrees) {
    Utils::TempDirectory contracts;
    RuntimeConfig config;
    config.contractDirectory = contracts.path().string();
    config.busyRetryLimit = 200;
    config.busyRetryDelayMs = 2;

    OrchestratorDependencies dependencies;
    dependencies.eventBus = std::make_shared<InMemoryEventBus>();
    dependencies.documentStore = std::make_shared<InMemoryDocumentStore>();
    dependencies.resources = std::make_shared<ResourceRegistry>();
    dependencies.executor = executor_;
    Orchestrator orchestrator(config, dependencies);
    FsmInstance &loader = orchestrator.getInstance(LifecycleContracts::LOADER);

    executor_->gateAction("log_discovery_started");
    TransitionResult first;
    std::thread worker([&] { first = orchestrator.deliver(LifecycleContracts::LOADER, "discover_requested"); });
    ASSERT_TRUE(Utils::waitUntil([&] { return loader.isInTransition(); }));

    std::thread opener([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        executor_->openGate();
    });
    TransitionResult second = orchestrator.deliver(LifecycleContracts::LOADER, "contracts_discovered");
    worker.join();
    opener.join();

    EXPECT_TRUE(first.isCommitted());
    EXPECT_TRUE(second.isCommitted()) << toString(second.status);
    EXPECT_EQ(loader.getCurrentState(), "ready");
    EXPECT_EQ(loader.getGeneration(), 2u);
}

TEST_F(ConcurrentDeliveryTest, BusyIsReturnedWhenRetriesAreExhausted) {
    Utils::TempDirectory contracts;
    RuntimeConfig config;
    config.contractDirectory = contracts.path().string();
    config.busyRetryLimit = 0;

    OrchestratorDependencies dependencies;
    dependencies.eventBus = std::make_shared<InMemoryEventBus>();
    dependencies.documentStore = std::make_shared<InMemoryDocumentStore>();
    dependencies.resources = std::make_shared<ResourceRegistry>();
    dependencies.executor = executor_;
    Orchestrator orchestrator(config, dependencies);
    FsmInstance &loader = orchestrator.getInstance(LifecycleContracts::LOADER);

    executor_->gateAction("log_discovery_started");
    std::thread worker([&] { orchestrator.deliver(LifecycleContracts::LOADER, "discover_requested"); });
    ASSERT_TRUE(Utils::waitUntil([&] { return loader.isInTransition(); }));

    TransitionResult rejected = orchestrator.deliver(LifecycleContracts::LOADER, "contracts_discovered");

    executor_->openGate();
    worker.join();
    EXPECT_EQ(rejected.status, TransitionStatus::Busy);
    EXPECT_EQ(loader.getCurrentState(), "discovering");
}
