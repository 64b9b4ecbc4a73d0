// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "validation/ContractAnalyzer.h"
#include "common/Logger.h"

#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace CLE {

std::vector<std::string> AnalysisResult::describe() const {
    std::vector<std::string> lines;
    for (const auto &state : unreachableStates) {
        lines.push_back("state '" + state + "' is unreachable from the initial state");
    }
    for (const auto &state : deadEndStates) {
        lines.push_back("non-terminal state '" + state + "' has no outgoing transition");
    }
    for (const auto &state : trappedStates) {
        lines.push_back("state '" + state + "' cannot reach any terminal state");
    }
    return lines;
}

AnalysisResult ContractAnalyzer::analyze(const Contract &contract) {
    AnalysisResult result;
    result.contractName = contract.getName();

    // Forward adjacency and its reverse
    std::unordered_map<std::string, std::vector<std::string>> successors;
    std::unordered_map<std::string, std::vector<std::string>> predecessors;
    for (const auto &state : contract.getStates()) {
        for (const TransitionDefinition *transition : contract.outgoingTransitions(state.name)) {
            successors[state.name].push_back(transition->toState);
            predecessors[transition->toState].push_back(state.name);
        }
    }

    auto walk = [](const std::vector<std::string> &seeds,
                   std::unordered_map<std::string, std::vector<std::string>> &edges) {
        std::unordered_set<std::string> visited(seeds.begin(), seeds.end());
        std::deque<std::string> pending(seeds.begin(), seeds.end());
        while (!pending.empty()) {
            std::string current = pending.front();
            pending.pop_front();
            for (const auto &next : edges[current]) {
                if (visited.insert(next).second) {
                    pending.push_back(next);
                }
            }
        }
        return visited;
    };

    std::unordered_set<std::string> reachable = walk({contract.getInitialState().name}, successors);

    std::vector<std::string> terminals;
    for (const auto &state : contract.getStates()) {
        if (state.isTerminal) {
            terminals.push_back(state.name);
        }
    }
    std::unordered_set<std::string> canFinish = walk(terminals, predecessors);

    // Declaration order keeps the report stable
    for (const auto &state : contract.getStates()) {
        if (!reachable.count(state.name)) {
            result.unreachableStates.push_back(state.name);
            continue;
        }
        if (!state.isTerminal && successors[state.name].empty()) {
            result.deadEndStates.push_back(state.name);
        } else if (!canFinish.count(state.name)) {
            result.trappedStates.push_back(state.name);
        }
    }

    if (!result.isClean()) {
        LOG_DEBUG("ContractAnalyzer: '{}' has {} finding(s)", contract.getName(), result.describe().size());
    }
    return result;
}

}  // namespace CLE
