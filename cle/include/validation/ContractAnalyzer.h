// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "model/Contract.h"
#include <string>
#include <vector>

namespace CLE {

/**
 * @brief Graph findings for one contract
 *
 * None of these break the runtime (the engine only ever follows matched
 * transitions), but each usually points at an authoring mistake.
 */
struct AnalysisResult {
    std::string contractName;
    std::vector<std::string> unreachableStates;  // no path from the initial state
    std::vector<std::string> deadEndStates;      // non-terminal without any outgoing transition
    std::vector<std::string> trappedStates;      // reachable but no path to a terminal state

    bool isClean() const {
        return unreachableStates.empty() && deadEndStates.empty() && trappedStates.empty();
    }

    /**
     * @brief One human-readable line per finding
     */
    std::vector<std::string> describe() const;
};

class ContractAnalyzer {
public:
    /**
     * @brief Analyze the state graph of a validated contract
     *
     * Wildcard transitions are expanded to every non-terminal state that has no
     * exact transition on the same event.
     */
    static AnalysisResult analyze(const Contract &contract);
};

}  // namespace CLE
