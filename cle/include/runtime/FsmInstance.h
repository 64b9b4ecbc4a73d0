// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include "model/Contract.h"
#include "runtime/IStateObserver.h"
#include "runtime/TransitionResult.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace CLE {

class TransitionEngine;

/**
 * @brief Read-only point-in-time view of an instance
 */
struct InstanceSnapshot {
    std::string name;
    NodeType nodeType = NodeType::OrchestratorGeneric;
    std::string contractName;
    SemanticVersion contractVersion;
    std::string currentState;
    uint64_t generation = 0;
    bool inTransition = false;
    bool isTerminal = false;
    json lastTransitionResult;  // null until the first non-Busy delivery

    json toJson() const;
};

/**
 * @brief Live execution of one contract
 *
 * Starts in the contract's initial state with generation 0. The in-transition
 * flag makes the instance single-writer: a second concurrent delivery gets
 * Busy instead of waiting. State and generation are only written by the
 * TransitionEngine while it holds the flag; snapshot() may be called from any
 * thread at any time.
 */
class FsmInstance {
public:
    /**
     * @throws std::invalid_argument if name is empty or contract/engine is null
     */
    FsmInstance(std::string name, std::shared_ptr<const Contract> contract, std::shared_ptr<TransitionEngine> engine);

    FsmInstance(const FsmInstance &) = delete;
    FsmInstance &operator=(const FsmInstance &) = delete;

    /**
     * @brief Deliver an event through the engine
     */
    TransitionResult handle(const std::string &event, const json &payload = json::object());

    InstanceSnapshot snapshot() const;

    void addObserver(std::shared_ptr<IStateObserver> observer);

    const std::string &getName() const {
        return name_;
    }

    const Contract &getContract() const {
        return *contract_;
    }

    const std::shared_ptr<const Contract> &getContractPtr() const {
        return contract_;
    }

    std::string getCurrentState() const;

    uint64_t getGeneration() const;

    bool isInTransition() const {
        return inTransition_.load();
    }

    bool isInTerminalState() const;

private:
    friend class TransitionEngine;

    /**
     * @brief RAII owner of the in-transition flag
     */
    class TransitionFlagGuard {
    public:
        explicit TransitionFlagGuard(FsmInstance &instance) : instance_(instance) {}

        ~TransitionFlagGuard() {
            instance_.inTransition_.store(false);
        }

        TransitionFlagGuard(const TransitionFlagGuard &) = delete;
        TransitionFlagGuard &operator=(const TransitionFlagGuard &) = delete;

    private:
        FsmInstance &instance_;
    };

    // Atomic test-and-set; exactly one concurrent caller gets true
    bool tryBeginTransition();

    // Returns the new generation
    uint64_t commitTransition(const std::string &targetState);

    void recordResult(const TransitionResult &result);

    void notifyObservers(const StateChangedEvent &event);

    std::string name_;
    std::shared_ptr<const Contract> contract_;
    std::shared_ptr<TransitionEngine> engine_;

    mutable std::mutex stateMutex_;
    std::string currentState_;
    uint64_t generation_ = 0;
    json lastResult_;
    std::atomic<bool> inTransition_{false};

    std::mutex observersMutex_;
    std::vector<std::shared_ptr<IStateObserver>> observers_;
};

}  // namespace CLE
