// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"

namespace CLE {

/**
 * @brief Built-in contracts driving the runtime's own lifecycle instances
 *
 * Events understood by every lifecycle contract: fatal_error (wildcard to
 * error) and shutdown_requested.
 *
 * contract_loader:   idle -discover_requested-> discovering
 *                    -contracts_discovered-> ready | -discovery_failed-> error
 * contract_registry: idle -validate_requested-> validating
 *                    -validation_passed-> ready | -validation_failed-> error
 * node_graph:        initializing -dependencies_resolved-> wiring
 *                    -wiring_complete-> running -shutdown_requested-> draining
 *                    -drain_complete-> stopped
 */
class LifecycleContracts {
public:
    static constexpr const char *LOADER = "contract_loader";
    static constexpr const char *REGISTRY = "contract_registry";
    static constexpr const char *GRAPH = "node_graph";

    static constexpr const char *FATAL_EVENT = "fatal_error";
    static constexpr const char *SHUTDOWN_EVENT = "shutdown_requested";

    static json loaderDocument();
    static json registryDocument();
    static json graphDocument();
};

}  // namespace CLE
