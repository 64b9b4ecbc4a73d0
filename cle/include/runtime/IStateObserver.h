// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <cstdint>
#include <string>

namespace CLE {

/**
 * @brief state_changed notification payload
 */
struct StateChangedEvent {
    std::string instanceName;
    std::string fromState;
    std::string toState;
    std::string eventName;
    uint64_t generation = 0;  // generation after the commit
};

/**
 * @brief Observer interface for committed transitions
 *
 * Called on the thread that delivered the event, after the commit and after
 * the instance accepts events again. Never called for NoMatch, Busy or
 * aborted transitions, so observers never see an intermediate state.
 */
class IStateObserver {
public:
    virtual ~IStateObserver() = default;

    /**
     * @brief Called once per committed transition
     * @param event Transition that was committed
     */
    virtual void onStateChanged(const StateChangedEvent &event) = 0;
};

}  // namespace CLE
