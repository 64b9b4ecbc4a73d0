// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "orchestration/Orchestrator.h"
#include "actions/ActionHandlerRegistry.h"
#include "common/ContractErrors.h"
#include "common/Logger.h"
#include "common/UniqueIdGenerator.h"
#include "events/IAlertSink.h"
#include "events/IEventBus.h"
#include "orchestration/LifecycleContracts.h"
#include "parsing/ContractLoader.h"
#include "parsing/ContractParser.h"
#include "runtime/ActionExecutorImpl.h"
#include "runtime/ResourceRegistry.h"
#include "runtime/TransitionEngine.h"
#include "stores/IDocumentStore.h"
#include <chrono>
#include <stdexcept>
#include <thread>

namespace CLE {

namespace {

json resultsToJson(const std::vector<TransitionResult> &results) {
    json list = json::array();
    for (const auto &result : results) {
        json entry = result.toSummaryJson();
        entry["instance"] = result.instanceName;
        list.push_back(std::move(entry));
    }
    return list;
}

}  // anonymous namespace

// ========== Reports ==========

json StartupReport::toJson() const {
    json document{{"success", success},
                  {"contracts", contracts},
                  {"node_order", nodeOrder},
                  {"subscriptions", subscriptions},
                  {"transitions", resultsToJson(transitions)}};
    if (!success) {
        document["failed_step"] = failedStep;
        document["contract"] = contractName;
        document["instance"] = instanceName;
        document["action"] = actionName;
        document["error"] = errorMessage;
    }
    return document;
}

json ShutdownReport::toJson() const {
    return json{{"clean", clean},
                {"drain_timed_out", drainTimedOut},
                {"in_flight_at_deadline", inFlightAtDeadline},
                {"failures", failures},
                {"transitions", resultsToJson(transitions)}};
}

json HealthSummary::toJson() const {
    json instanceList = json::array();
    for (const auto &instance : instances) {
        instanceList.push_back(instance.toJson());
    }
    json document{{"status", status},
                  {"contracts", contractCount},
                  {"subscriptions", subscriptionCount},
                  {"instances", instanceList}};
    if (!fatalReason.empty()) {
        document["fatal_reason"] = fatalReason;
    }
    return document;
}

// ========== Observer ==========

class Orchestrator::TerminalStateObserver : public IStateObserver {
public:
    explicit TerminalStateObserver(Orchestrator &owner) : owner_(owner) {}

    void onStateChanged(const StateChangedEvent &event) override {
        owner_.onStateChanged(event);
    }

private:
    Orchestrator &owner_;
};

// ========== Construction ==========

Orchestrator::Orchestrator(RuntimeConfig config, OrchestratorDependencies dependencies)
    : config_(std::move(config)), dependencies_(std::move(dependencies)), registry_(config_.strictAnalysis) {
    if (!dependencies_.eventBus) {
        throw std::invalid_argument("Orchestrator: event bus cannot be null");
    }
    if (!dependencies_.documentStore) {
        throw std::invalid_argument("Orchestrator: document store cannot be null");
    }
    if (!dependencies_.resources) {
        throw std::invalid_argument("Orchestrator: resource registry cannot be null");
    }
    if (!dependencies_.diagnosticStore) {
        dependencies_.diagnosticStore = dependencies_.documentStore;
    }
    if (!dependencies_.alertSink) {
        dependencies_.alertSink = std::make_shared<LoggingAlertSink>();
    }
    if (!dependencies_.executor) {
        ActionCollaborators collaborators{dependencies_.eventBus, dependencies_.documentStore,
                                          dependencies_.diagnosticStore, dependencies_.alertSink,
                                          dependencies_.resources};
        dependencies_.executor =
            std::make_shared<ActionExecutorImpl>(ActionHandlerRegistry::createDefault(collaborators));
    }

    engine_ = std::make_shared<TransitionEngine>(dependencies_.executor);

    loader_ = std::make_unique<FsmInstance>(
        LifecycleContracts::LOADER,
        loadLifecycleContract(config_.loaderContractPath, LifecycleContracts::loaderDocument()), engine_);
    registryInstance_ = std::make_unique<FsmInstance>(
        LifecycleContracts::REGISTRY,
        loadLifecycleContract(config_.registryContractPath, LifecycleContracts::registryDocument()), engine_);
    graphInstance_ = std::make_unique<FsmInstance>(
        LifecycleContracts::GRAPH,
        loadLifecycleContract(config_.graphContractPath, LifecycleContracts::graphDocument()), engine_);

    auto observer = std::make_shared<TerminalStateObserver>(*this);
    loader_->addObserver(observer);
    registryInstance_->addObserver(observer);
    graphInstance_->addObserver(observer);

    LOG_DEBUG("Orchestrator: created (contracts in '{}')", config_.contractDirectory);
}

Orchestrator::~Orchestrator() {
    const Phase phase = getPhase();
    if (phase == Phase::Created || phase == Phase::Stopped) {
        return;
    }
    try {
        shutdown();
    } catch (const std::exception &e) {
        LOG_ERROR("Orchestrator: shutdown during destruction failed: {}", e.what());
    }
}

std::shared_ptr<const Contract> Orchestrator::loadLifecycleContract(const std::string &path, json builtin) const {
    if (path.empty()) {
        return ContractParser::parse(builtin);
    }
    ContractLoader loader(config_.maxContractBytes);
    LOG_INFO("Orchestrator: lifecycle contract from '{}'", path);
    return ContractParser::parse(loader.loadFile(path).document);
}

// ========== Startup ==========

StartupReport Orchestrator::start() {
    StartupReport report;
    {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (startupReport_) {
                return *startupReport_;
            }
            if (phase_ != Phase::Created) {
                StartupReport rejected;
                rejected.failedStep = "start";
                rejected.errorMessage = "orchestrator was shut down before start";
                return rejected;
            }
            phase_ = Phase::Starting;
        }
        report = runStartup();
    }

    // Outside lifecycleMutex_: the callback may call shutdown()
    ReadyCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (report.success) {
            callback = readyCallback_;
        }
    }
    if (callback) {
        callback(report);
    }
    return report;
}

StartupReport Orchestrator::runStartup() {
    StartupReport report;
    const std::string &directory = config_.contractDirectory;
    LOG_INFO("Orchestrator: starting (contracts in '{}')", directory);

    // 1. Discovery
    if (!runStartupEvent(*loader_, "discover_requested", json{{"directory", directory}}, report, "discover")) {
        return finishStartup(std::move(report));
    }

    std::vector<LoadedDocument> documents;
    try {
        ContractLoader contractLoader(config_.maxContractBytes);
        documents = contractLoader.discover(directory);
    } catch (const ContractError &e) {
        failStartup(report, "discover", *loader_, loader_->getContract().getName(), "", e.what(),
                    "discovery_failed");
        return finishStartup(std::move(report));
    }

    if (!runStartupEvent(*loader_, "contracts_discovered", json{{"count", documents.size()}}, report, "discover")) {
        return finishStartup(std::move(report));
    }

    // 2. Validation
    if (!runStartupEvent(*registryInstance_, "validate_requested", json{{"count", documents.size()}}, report,
                         "validate")) {
        return finishStartup(std::move(report));
    }

    ValidationReport validation = registry_.validateAll(documents);
    if (!validation.isValid()) {
        failStartup(report, "validate", *registryInstance_, validation.failures.front().contractName, "",
                    validation.firstError(), "validation_failed");
        return finishStartup(std::move(report));
    }

    if (!runStartupEvent(*registryInstance_, "validation_passed", json{{"contracts", validation.registered}}, report,
                         "validate")) {
        return finishStartup(std::move(report));
    }
    report.contracts = registry_.names();

    // 3. Dependency resolution and wiring
    try {
        graph_ = std::make_unique<NodeGraph>(registry_.contracts());
        report.nodeOrder = graph_->resolve();
    } catch (const ContractError &e) {
        failStartup(report, "resolve", *graphInstance_, e.getContractName(), "", e.what(), "resolution_failed");
        return finishStartup(std::move(report));
    }

    if (!runStartupEvent(*graphInstance_, "dependencies_resolved", json{{"order", report.nodeOrder}}, report,
                         "resolve")) {
        return finishStartup(std::move(report));
    }

    try {
        auto dispatcher = [this](const std::string &node, const EventEnvelope &envelope) {
            dispatchToNode(node, envelope);
        };
        report.subscriptions = graph_->wire(dependencies_.eventBus, *dependencies_.resources, dispatcher);
    } catch (const std::exception &e) {
        failStartup(report, "wire", *graphInstance_, graphInstance_->getContract().getName(), "", e.what(),
                    "wiring_failed");
        return finishStartup(std::move(report));
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptionCount_ = report.subscriptions;
    }

    if (!runStartupEvent(*graphInstance_, "wiring_complete", json{{"subscriptions", report.subscriptions}}, report,
                         "wire")) {
        return finishStartup(std::move(report));
    }

    // 4. Ready
    EventEnvelope ready;
    ready.topic = READY_TOPIC;
    ready.eventName = "runtime.ready";
    ready.source = "orchestrator";
    ready.correlationId = UniqueIdGenerator::generateCorrelationId();
    ready.payload = json{{"contracts", report.contracts}, {"node_order", report.nodeOrder},
                         {"subscriptions", report.subscriptions}};
    ready.timestampMs = JsonUtils::nowUnixMs();
    if (!dependencies_.eventBus->publish(ready)) {
        LOG_WARN("Orchestrator: event bus rejected {}", READY_TOPIC);
    }

    if (isFatal()) {
        report.failedStep = "ready";
        report.errorMessage = getFatalReason();
        return finishStartup(std::move(report));
    }

    report.success = true;
    setPhase(Phase::Ready);
    LOG_INFO("Orchestrator: ready ({} contracts, {} subscriptions)", report.contracts.size(), report.subscriptions);
    return finishStartup(std::move(report));
}

StartupReport Orchestrator::finishStartup(StartupReport report) {
    std::lock_guard<std::mutex> lock(mutex_);
    startupReport_ = report;
    return report;
}

bool Orchestrator::runStartupEvent(FsmInstance &instance, const std::string &event, const json &payload,
                                   StartupReport &report, const std::string &step) {
    TransitionResult result = deliverWithRetry(instance, event, payload);
    report.transitions.push_back(result);
    if (result.isCommitted()) {
        return true;
    }

    failStartup(report, step, instance, instance.getContract().getName(), result.abortedBy,
                toString(result.status) + " on '" + event + "': " + result.errorMessage);
    return false;
}

void Orchestrator::failStartup(StartupReport &report, const std::string &step, FsmInstance &instance,
                               const std::string &contractName, const std::string &actionName,
                               const std::string &message, const std::string &failureEvent) {
    report.success = false;
    report.failedStep = step;
    report.contractName = contractName;
    report.instanceName = instance.getName();
    report.actionName = actionName;

    std::string description = "startup failed at '" + step + "': instance '" + instance.getName() + "'";
    if (!contractName.empty()) {
        description += ", contract '" + contractName + "'";
    }
    if (!actionName.empty()) {
        description += ", action '" + actionName + "'";
    }
    report.errorMessage = description + ": " + message;
    LOG_ERROR("Orchestrator: {}", report.errorMessage);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        startupError_ = report.errorMessage;
    }

    if (!failureEvent.empty()) {
        report.transitions.push_back(deliverWithRetry(instance, failureEvent, json{{"error", message}}));
    }

    raiseFatal(report.errorMessage);
    setPhase(Phase::Failed);
}

// ========== Event delivery ==========

TransitionResult Orchestrator::deliver(const std::string &instanceName, const std::string &event,
                                       const json &payload) {
    return deliverWithRetry(getInstance(instanceName), event, payload);
}

FsmInstance &Orchestrator::getInstance(const std::string &instanceName) {
    if (instanceName == loader_->getName()) {
        return *loader_;
    }
    if (instanceName == registryInstance_->getName()) {
        return *registryInstance_;
    }
    if (instanceName == graphInstance_->getName()) {
        return *graphInstance_;
    }
    throw std::invalid_argument("Orchestrator: unknown instance '" + instanceName + "'");
}

TransitionResult Orchestrator::deliverWithRetry(FsmInstance &instance, const std::string &event,
                                                const json &payload) {
    TransitionResult result = instance.handle(event, payload);
    for (int64_t attempt = 0; result.status == TransitionStatus::Busy && attempt < config_.busyRetryLimit;
         ++attempt) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.busyRetryDelayMs));
        result = instance.handle(event, payload);
    }
    if (result.status == TransitionStatus::Busy) {
        LOG_WARN("Orchestrator: '{}' still busy after {} retries of '{}'", instance.getName(),
                 config_.busyRetryLimit, event);
    }
    return result;
}

void Orchestrator::dispatchToNode(const std::string &node, const EventEnvelope &envelope) {
    auto token = drainTracker_.tryAcquire();
    if (!token) {
        LOG_DEBUG("Orchestrator: draining, dropped '{}' for node '{}'", envelope.topic, node);
        return;
    }

    NodeGraph::NodeDispatcher dispatcher;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dispatcher = nodeDispatcher_;
    }
    if (dispatcher) {
        dispatcher(node, envelope);
    } else {
        LOG_DEBUG("Orchestrator: node '{}' received '{}'", node, envelope.topic);
    }
}

void Orchestrator::setReadyCallback(ReadyCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    readyCallback_ = std::move(callback);
}

void Orchestrator::setNodeDispatcher(NodeGraph::NodeDispatcher dispatcher) {
    std::lock_guard<std::mutex> lock(mutex_);
    nodeDispatcher_ = std::move(dispatcher);
}

// ========== Fatal propagation ==========

void Orchestrator::onStateChanged(const StateChangedEvent &event) {
    const FsmInstance &instance = getInstance(event.instanceName);
    if (!instance.getContract().isTerminal(event.toState)) {
        return;
    }

    const Phase phase = getPhase();
    if (phase == Phase::Stopping || phase == Phase::Stopped) {
        return;
    }

    raiseFatal("instance '" + event.instanceName + "' entered terminal state '" + event.toState + "' on '" +
               event.eventName + "'");
}

void Orchestrator::raiseFatal(const std::string &reason) {
    bool expected = false;
    if (!fatalRaised_.compare_exchange_strong(expected, true)) {
        return;
    }

    std::string fatalReason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fatalReason_ = startupError_.empty() ? reason : startupError_;
        fatalReason = fatalReason_;
        if (phase_ != Phase::Stopping && phase_ != Phase::Stopped) {
            phase_ = Phase::Failed;
        }
    }
    LOG_ERROR("Orchestrator: fatal: {}", fatalReason);

    for (FsmInstance *instance : {loader_.get(), registryInstance_.get(), graphInstance_.get()}) {
        TransitionResult result =
            deliverWithRetry(*instance, LifecycleContracts::FATAL_EVENT, json{{"reason", fatalReason}});
        LOG_DEBUG("Orchestrator: {} -> '{}': {} (state '{}')", LifecycleContracts::FATAL_EVENT, instance->getName(),
                  toString(result.status), instance->getCurrentState());
    }
}

std::string Orchestrator::getFatalReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fatalReason_;
}

// ========== Shutdown ==========

ShutdownReport Orchestrator::shutdown() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdownReport_) {
            return *shutdownReport_;
        }
        phase_ = Phase::Stopping;
    }

    ShutdownReport report;
    LOG_INFO("Orchestrator: shutting down (drain timeout {} ms)", config_.drainTimeoutMs);

    drainTracker_.beginDrain();
    report.transitions.push_back(deliverWithRetry(*graphInstance_, LifecycleContracts::SHUTDOWN_EVENT, json::object()));

    const bool drained = drainTracker_.waitForDrain(std::chrono::milliseconds(config_.drainTimeoutMs));
    if (!drained) {
        report.drainTimedOut = true;
        report.inFlightAtDeadline = drainTracker_.inFlight();
        report.failures.push_back("drain timed out after " + std::to_string(config_.drainTimeoutMs) + " ms with " +
                                  std::to_string(report.inFlightAtDeadline) + " units of work in flight");
        LOG_WARN("Orchestrator: {}", report.failures.back());
    }

    report.transitions.push_back(deliverWithRetry(*graphInstance_, "drain_complete", json{{"drained", drained}}));

    // The graph contract may not declare a cleanup for its subscriptions; their handlers capture this
    if (!dependencies_.resources->releasePrefix(NodeGraph::SUBSCRIPTION_PREFIX)) {
        report.failures.push_back("releasing remaining bus subscriptions reported failure");
        LOG_WARN("Orchestrator: {}", report.failures.back());
    }
    report.transitions.push_back(deliverWithRetry(*loader_, LifecycleContracts::SHUTDOWN_EVENT, json::object()));
    report.transitions.push_back(
        deliverWithRetry(*registryInstance_, LifecycleContracts::SHUTDOWN_EVENT, json::object()));

    for (const auto &result : report.transitions) {
        if (result.isAborted()) {
            report.failures.push_back(result.instanceName + ": " + result.errorMessage);
        }
        for (const auto &failure : result.nonCriticalFailures()) {
            report.failures.push_back(result.instanceName + ": action '" + failure.actionName +
                                      "' failed: " + failure.outcome.message);
        }
    }
    report.clean = report.failures.empty();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        phase_ = Phase::Stopped;
        shutdownReport_ = report;
    }
    LOG_INFO("Orchestrator: stopped ({})", report.clean ? "clean" : "with failures");
    Logger::flush();
    return report;
}

// ========== Health ==========

HealthSummary Orchestrator::health() const {
    HealthSummary summary;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (phase_) {
        case Phase::Created:
        case Phase::Starting:
            summary.status = "starting";
            break;
        case Phase::Ready:
            summary.status = "ready";
            break;
        case Phase::Failed:
            summary.status = "failed";
            break;
        case Phase::Stopping:
            summary.status = "stopping";
            break;
        case Phase::Stopped:
            summary.status = "stopped";
            break;
        }
        summary.fatalReason = fatalReason_;
        summary.subscriptionCount = subscriptionCount_;
    }

    summary.contractCount = registry_.size();
    summary.instances.push_back(loader_->snapshot());
    summary.instances.push_back(registryInstance_->snapshot());
    summary.instances.push_back(graphInstance_->snapshot());
    return summary;
}

Orchestrator::Phase Orchestrator::getPhase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

void Orchestrator::setPhase(Phase phase) {
    std::lock_guard<std::mutex> lock(mutex_);
    phase_ = phase;
}

}  // namespace CLE
