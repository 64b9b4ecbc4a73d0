// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "runtime/IActionExecutor.h"
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace CLE {
namespace Test {

/**
 * @brief Scriptable IActionExecutor for engine tests
 *
 * Records every execution (name, phase, context) and returns success unless
 * an outcome was scripted for the action name. An action can also be gated:
 * its execution blocks until openGate() is called.
 */
class MockActionExecutor : public IActionExecutor {
public:
    struct Execution {
        std::string actionName;
        ActionPhase phase;
        ActionContext context;
    };

    ActionOutcome execute(const ActionDefinition &action, const ActionContext &context) override;

    // Test configuration

    void failAction(const std::string &actionName, FailureCause cause = FailureCause::Reported,
                    const std::string &message = "scripted failure");

    void succeedAction(const std::string &actionName);

    void gateAction(const std::string &actionName);

    void openGate();

    // Test verification

    std::vector<Execution> getExecutions() const;

    std::vector<std::string> getExecutedNames() const;

    /**
     * @brief Names of actions executed in the given phase
     */
    std::vector<std::string> getExecutedNames(ActionPhase phase) const;

    size_t getExecutionCount() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::condition_variable gateOpened_;
    std::vector<Execution> executions_;
    std::map<std::string, ActionOutcome> scripted_;
    std::string gatedAction_;
    bool gateOpen_ = true;
};

}  // namespace Test
}  // namespace CLE
