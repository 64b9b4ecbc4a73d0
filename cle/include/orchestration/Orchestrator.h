// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include "orchestration/ContractRegistry.h"
#include "orchestration/DrainTracker.h"
#include "orchestration/NodeGraph.h"
#include "orchestration/RuntimeConfig.h"
#include "runtime/FsmInstance.h"
#include "runtime/IActionExecutor.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace CLE {

class IEventBus;
class IDocumentStore;
class IAlertSink;
class ResourceRegistry;
class TransitionEngine;

/**
 * @brief Collaborators handed to the orchestrator explicitly
 *
 * eventBus, documentStore and resources are required. diagnosticStore falls
 * back to documentStore, alertSink to a LoggingAlertSink and executor to an
 * ActionExecutorImpl over the built-in handlers.
 */
struct OrchestratorDependencies {
    std::shared_ptr<IEventBus> eventBus;
    std::shared_ptr<IDocumentStore> documentStore;
    std::shared_ptr<IDocumentStore> diagnosticStore;
    std::shared_ptr<IAlertSink> alertSink;
    std::shared_ptr<ResourceRegistry> resources;
    std::shared_ptr<IActionExecutor> executor;
};

/**
 * @brief Outcome of Orchestrator::start()
 *
 * On failure, failedStep/contractName/instanceName/actionName identify the
 * single actionable cause.
 */
struct StartupReport {
    bool success = false;
    std::string failedStep;
    std::string contractName;
    std::string instanceName;
    std::string actionName;
    std::string errorMessage;
    std::vector<std::string> contracts;  // registered contract names
    std::vector<std::string> nodeOrder;
    size_t subscriptions = 0;
    std::vector<TransitionResult> transitions;

    json toJson() const;
};

struct ShutdownReport {
    bool clean = true;
    bool drainTimedOut = false;
    size_t inFlightAtDeadline = 0;
    std::vector<std::string> failures;  // non-critical, never block shutdown
    std::vector<TransitionResult> transitions;

    json toJson() const;
};

/**
 * @brief Aggregated health view handed to an external health endpoint
 */
struct HealthSummary {
    std::string status;  // starting | ready | failed | stopping | stopped
    std::string fatalReason;
    size_t contractCount = 0;
    size_t subscriptionCount = 0;
    std::vector<InstanceSnapshot> instances;

    json toJson() const;
};

/**
 * @brief Owns the lifecycle FSM instances and sequences startup and shutdown
 *
 * Startup: contract_loader discovers, contract_registry validates,
 * node_graph resolves and wires, then runtime.ready is published.
 * Any lifecycle instance committing into a terminal state outside of
 * shutdown is fatal: fatal_error is injected into every instance, once.
 *
 * @code
 * Orchestrator orchestrator(config, dependencies);
 * auto report = orchestrator.start();
 * if (!report.success) {
 *     LOG_ERROR("{}", report.errorMessage);
 * }
 * ...
 * orchestrator.shutdown();
 * @endcode
 */
class Orchestrator {
public:
    using ReadyCallback = std::function<void(const StartupReport &)>;

    static constexpr const char *READY_TOPIC = "onex.evt.runtime.ready.v1";

    /**
     * @throws std::invalid_argument if a required collaborator is missing
     * @throws SchemaError / ContractLoadError if a configured lifecycle contract is invalid
     */
    Orchestrator(RuntimeConfig config, OrchestratorDependencies dependencies);

    ~Orchestrator();

    Orchestrator(const Orchestrator &) = delete;
    Orchestrator &operator=(const Orchestrator &) = delete;

    /**
     * @brief Run the startup sequence; a second call returns the first report
     */
    StartupReport start();

    /**
     * @brief Drain and stop; a second call returns the first report
     */
    ShutdownReport shutdown();

    HealthSummary health() const;

    /**
     * @brief Invoked once after a successful start(), with no lifecycle lock held
     */
    void setReadyCallback(ReadyCallback callback);

    /**
     * @brief Handler for bus messages delivered to wired nodes
     *
     * Each delivery holds a DrainTracker work token; deliveries arriving
     * after draining began are dropped.
     */
    void setNodeDispatcher(NodeGraph::NodeDispatcher dispatcher);

    /**
     * @brief Deliver an event to a lifecycle instance, retrying Busy answers
     * @throws std::invalid_argument for an unknown instance name
     */
    TransitionResult deliver(const std::string &instanceName, const std::string &event,
                             const json &payload = json::object());

    FsmInstance &getInstance(const std::string &instanceName);

    ContractRegistry &getRegistry() {
        return registry_;
    }

    DrainTracker &getDrainTracker() {
        return drainTracker_;
    }

    bool isFatal() const {
        return fatalRaised_.load();
    }

    std::string getFatalReason() const;

private:
    enum class Phase { Created, Starting, Ready, Failed, Stopping, Stopped };

    class TerminalStateObserver;

    std::shared_ptr<const Contract> loadLifecycleContract(const std::string &path, json builtin) const;

    TransitionResult deliverWithRetry(FsmInstance &instance, const std::string &event, const json &payload);

    bool runStartupEvent(FsmInstance &instance, const std::string &event, const json &payload,
                         StartupReport &report, const std::string &step);

    void failStartup(StartupReport &report, const std::string &step, FsmInstance &instance,
                     const std::string &contractName, const std::string &actionName, const std::string &message,
                     const std::string &failureEvent = "");

    /**
     * @brief Startup steps; runs with lifecycleMutex_ held
     */
    StartupReport runStartup();

    StartupReport finishStartup(StartupReport report);

    void onStateChanged(const StateChangedEvent &event);

    void raiseFatal(const std::string &reason);

    void dispatchToNode(const std::string &node, const EventEnvelope &envelope);

    Phase getPhase() const;

    void setPhase(Phase phase);

    RuntimeConfig config_;
    OrchestratorDependencies dependencies_;
    std::shared_ptr<TransitionEngine> engine_;

    std::unique_ptr<FsmInstance> loader_;
    std::unique_ptr<FsmInstance> registryInstance_;
    std::unique_ptr<FsmInstance> graphInstance_;

    ContractRegistry registry_;
    std::unique_ptr<NodeGraph> graph_;
    DrainTracker drainTracker_;

    std::mutex lifecycleMutex_;  // serializes start() and shutdown()
    mutable std::mutex mutex_;
    Phase phase_ = Phase::Created;
    std::string fatalReason_;
    std::string startupError_;
    size_t subscriptionCount_ = 0;
    std::optional<StartupReport> startupReport_;
    std::optional<ShutdownReport> shutdownReport_;
    ReadyCallback readyCallback_;
    NodeGraph::NodeDispatcher nodeDispatcher_;

    std::atomic<bool> fatalRaised_{false};
};

}  // namespace CLE
