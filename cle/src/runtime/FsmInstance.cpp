// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/FsmInstance.h"
#include "common/Logger.h"
#include "runtime/TransitionEngine.h"
#include <stdexcept>

namespace CLE {

json InstanceSnapshot::toJson() const {
    return json{{"name", name},
                {"node_type", toString(nodeType)},
                {"contract", contractName},
                {"contract_version", contractVersion.toString()},
                {"current_state", currentState},
                {"generation", generation},
                {"in_transition", inTransition},
                {"is_terminal", isTerminal},
                {"last_transition_result", lastTransitionResult}};
}

FsmInstance::FsmInstance(std::string name, std::shared_ptr<const Contract> contract,
                         std::shared_ptr<TransitionEngine> engine)
    : name_(std::move(name)), contract_(std::move(contract)), engine_(std::move(engine)) {
    if (name_.empty()) {
        throw std::invalid_argument("FsmInstance: name cannot be empty");
    }
    if (!contract_) {
        throw std::invalid_argument("FsmInstance '" + name_ + "': contract cannot be null");
    }
    if (!engine_) {
        throw std::invalid_argument("FsmInstance '" + name_ + "': transition engine cannot be null");
    }

    currentState_ = contract_->getInitialState().name;
    LOG_DEBUG("FsmInstance: '{}' created from contract '{}' v{} in state '{}'", name_, contract_->getName(),
              contract_->getVersion().toString(), currentState_);
}

TransitionResult FsmInstance::handle(const std::string &event, const json &payload) {
    return engine_->apply(*this, event, payload);
}

InstanceSnapshot FsmInstance::snapshot() const {
    InstanceSnapshot snapshot;
    snapshot.name = name_;
    snapshot.nodeType = contract_->getNodeType();
    snapshot.contractName = contract_->getName();
    snapshot.contractVersion = contract_->getVersion();
    snapshot.inTransition = inTransition_.load();

    std::lock_guard<std::mutex> lock(stateMutex_);
    snapshot.currentState = currentState_;
    snapshot.generation = generation_;
    snapshot.isTerminal = contract_->isTerminal(currentState_);
    snapshot.lastTransitionResult = lastResult_;
    return snapshot;
}

void FsmInstance::addObserver(std::shared_ptr<IStateObserver> observer) {
    if (!observer) {
        throw std::invalid_argument("FsmInstance '" + name_ + "': observer cannot be null");
    }
    std::lock_guard<std::mutex> lock(observersMutex_);
    observers_.push_back(std::move(observer));
}

std::string FsmInstance::getCurrentState() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return currentState_;
}

uint64_t FsmInstance::getGeneration() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return generation_;
}

bool FsmInstance::isInTerminalState() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return contract_->isTerminal(currentState_);
}

bool FsmInstance::tryBeginTransition() {
    bool expected = false;
    return inTransition_.compare_exchange_strong(expected, true);
}

uint64_t FsmInstance::commitTransition(const std::string &targetState) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    currentState_ = targetState;
    return ++generation_;
}

void FsmInstance::recordResult(const TransitionResult &result) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    lastResult_ = result.toSummaryJson();
}

void FsmInstance::notifyObservers(const StateChangedEvent &event) {
    std::vector<std::shared_ptr<IStateObserver>> observers;
    {
        std::lock_guard<std::mutex> lock(observersMutex_);
        observers = observers_;
    }

    for (const auto &observer : observers) {
        try {
            observer->onStateChanged(event);
        } catch (const std::exception &e) {
            LOG_ERROR("FsmInstance: observer of '{}' threw on {} -> {}: {}", name_, event.fromState, event.toState,
                      e.what());
        }
    }
}

}  // namespace CLE
