// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/Logger.h"
#include "events/InMemoryEventBus.h"
#include "orchestration/Orchestrator.h"
#include "orchestration/RuntimeConfig.h"
#include "runtime/ResourceRegistry.h"
#include "stores/InMemoryDocumentStore.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> stopRequested{false};

void onSignal(int /*signal*/) {
    stopRequested.store(true);
}

}  // anonymous namespace

int main(int argc, char *argv[]) {
    using namespace CLE;

    const std::string configPath = argc > 1 ? argv[1] : "examples/node_runtime/runtime.yaml";

    RuntimeConfig config;
    try {
        config = RuntimeConfig::loadFile(configPath);
    } catch (const std::exception &e) {
        std::cerr << "Failed to load " << configPath << ": " << e.what() << "\n";
        return 2;
    }
    config.applyLogging();

    auto bus = std::make_shared<InMemoryEventBus>();

    OrchestratorDependencies dependencies;
    dependencies.eventBus = bus;
    dependencies.documentStore = std::make_shared<InMemoryDocumentStore>();
    dependencies.resources = std::make_shared<ResourceRegistry>();

    std::unique_ptr<Orchestrator> runtime;
    try {
        runtime = std::make_unique<Orchestrator>(config, dependencies);
    } catch (const std::exception &e) {
        LOG_ERROR("node_runtime: cannot build lifecycle contracts: {}", e.what());
        return 2;
    }
    Orchestrator &orchestrator = *runtime;
    orchestrator.setNodeDispatcher([](const std::string &node, const EventEnvelope &envelope) {
        LOG_INFO("node_runtime: '{}' received {} from {}", node, envelope.topic, envelope.source);
    });

    StartupReport report = orchestrator.start();
    std::cout << report.toJson().dump(2) << "\n";
    if (!report.success) {
        std::cout << orchestrator.health().toJson().dump(2) << "\n";
        return 1;
    }

    // Let the wired nodes hear each other once
    bus->publish(EventEnvelope{"onex.evt.inventory.stock-changed.v1", "stock_changed", "node_runtime", "demo-1",
                               json{{"sku", "A-100"}, {"delta", -3}}, 0});

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    LOG_INFO("node_runtime: running with {} contracts, Ctrl+C to stop", report.contracts.size());
    while (!stopRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    ShutdownReport shutdown = orchestrator.shutdown();
    std::cout << shutdown.toJson().dump(2) << "\n";
    std::cout << orchestrator.health().toJson().dump(2) << "\n";
    return shutdown.clean ? 0 : 1;
}
