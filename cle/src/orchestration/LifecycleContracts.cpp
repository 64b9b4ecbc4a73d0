// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "orchestration/LifecycleContracts.h"

namespace CLE {

namespace {

// Entry actions of terminal states are idempotent: persistence overwrites the
// same document, data_capture is write-once, cleanup of a released handle succeeds.

constexpr const char *LOADER_CONTRACT = R"json({
  "name": "contract_loader",
  "node_type": "EFFECT_GENERIC",
  "contract_version": {"major": 1, "minor": 0, "patch": 0},
  "description": "Discovers contract documents on the filesystem",
  "initial_state": "idle",
  "actions": [
    {"action_name": "log_discovery_started", "action_type": "logging", "timeout_ms": 1000,
     "config": {"level": "info", "message": "contract discovery started"}},
    {"action_name": "publish_contracts_discovered", "action_type": "event", "timeout_ms": 2000,
     "config": {"event": "contracts.discovered"}},
    {"action_name": "persist_loader_state", "action_type": "persistence", "timeout_ms": 2000},
    {"action_name": "alert_discovery_failed", "action_type": "alert", "timeout_ms": 2000,
     "config": {"severity": "critical", "summary": "contract discovery failed"}},
    {"action_name": "capture_loader_failure", "action_type": "data_capture", "timeout_ms": 2000},
    {"action_name": "log_loader_stopped", "action_type": "logging", "timeout_ms": 1000,
     "config": {"level": "info", "message": "contract loader stopped"}}
  ],
  "states": [
    {"name": "idle"},
    {"name": "discovering", "entry_actions": ["log_discovery_started"]},
    {"name": "ready", "entry_actions": ["persist_loader_state"]},
    {"name": "stopped", "is_terminal": true, "entry_actions": ["persist_loader_state", "log_loader_stopped"]},
    {"name": "error", "is_terminal": true, "entry_actions": ["persist_loader_state", "capture_loader_failure"]}
  ],
  "transitions": [
    {"from_state": "idle", "to_state": "discovering", "event": "discover_requested"},
    {"from_state": "discovering", "to_state": "ready", "event": "contracts_discovered",
     "actions": ["publish_contracts_discovered"]},
    {"from_state": "discovering", "to_state": "error", "event": "discovery_failed",
     "actions": ["alert_discovery_failed"]},
    {"name": "loader_shutdown", "from_state": "*", "to_state": "stopped", "event": "shutdown_requested"},
    {"name": "loader_fatal", "from_state": "*", "to_state": "error", "event": "fatal_error",
     "actions": ["alert_discovery_failed"]}
  ]
})json";

constexpr const char *REGISTRY_CONTRACT = R"json({
  "name": "contract_registry",
  "node_type": "REDUCER_GENERIC",
  "contract_version": {"major": 1, "minor": 0, "patch": 0},
  "description": "Validates discovered contracts and indexes them by name",
  "initial_state": "idle",
  "actions": [
    {"action_name": "log_validation_started", "action_type": "logging", "timeout_ms": 1000,
     "config": {"level": "info", "message": "contract validation started"}},
    {"action_name": "publish_registry_ready", "action_type": "event", "timeout_ms": 2000,
     "config": {"event": "registry.ready"}},
    {"action_name": "persist_registry_state", "action_type": "persistence", "timeout_ms": 2000},
    {"action_name": "alert_validation_failed", "action_type": "alert", "timeout_ms": 2000,
     "config": {"severity": "critical", "summary": "contract validation failed"}},
    {"action_name": "capture_validation_failure", "action_type": "data_capture", "timeout_ms": 2000},
    {"action_name": "log_registry_error", "action_type": "logging", "timeout_ms": 1000,
     "config": {"level": "error", "message": "contract registry in error state"}}
  ],
  "states": [
    {"name": "idle"},
    {"name": "validating", "entry_actions": ["log_validation_started"]},
    {"name": "ready", "entry_actions": ["persist_registry_state"]},
    {"name": "stopped", "is_terminal": true, "entry_actions": ["persist_registry_state"]},
    {"name": "error", "is_terminal": true,
     "entry_actions": ["persist_registry_state", "capture_validation_failure", "log_registry_error"]}
  ],
  "transitions": [
    {"from_state": "idle", "to_state": "validating", "event": "validate_requested"},
    {"from_state": "ready", "to_state": "validating", "event": "validate_requested"},
    {"from_state": "validating", "to_state": "ready", "event": "validation_passed",
     "actions": ["publish_registry_ready"]},
    {"from_state": "validating", "to_state": "error", "event": "validation_failed",
     "actions": ["alert_validation_failed"]},
    {"name": "registry_error_revalidated", "from_state": "error", "to_state": "error",
     "event": "validation_failed"},
    {"name": "registry_error_fatal", "from_state": "error", "to_state": "error", "event": "fatal_error"},
    {"name": "registry_shutdown", "from_state": "*", "to_state": "stopped", "event": "shutdown_requested"},
    {"name": "registry_fatal", "from_state": "*", "to_state": "error", "event": "fatal_error",
     "actions": ["alert_validation_failed"]}
  ]
})json";

constexpr const char *GRAPH_CONTRACT = R"json({
  "name": "node_graph",
  "node_type": "ORCHESTRATOR_GENERIC",
  "contract_version": {"major": 1, "minor": 0, "patch": 0},
  "description": "Resolves node dependencies, wires subscriptions and drains on shutdown",
  "initial_state": "initializing",
  "actions": [
    {"action_name": "log_wiring_started", "action_type": "logging", "timeout_ms": 1000,
     "config": {"level": "info", "message": "node wiring started"}},
    {"action_name": "publish_graph_running", "action_type": "event", "timeout_ms": 2000,
     "config": {"event": "graph.running"}},
    {"action_name": "publish_graph_draining", "action_type": "event", "timeout_ms": 2000,
     "config": {"event": "graph.draining"}},
    {"action_name": "persist_graph_state", "action_type": "persistence", "timeout_ms": 2000},
    {"action_name": "release_subscriptions", "action_type": "cleanup", "timeout_ms": 2000,
     "config": {"prefix": "subscription/"}},
    {"action_name": "capture_graph_failure", "action_type": "data_capture", "timeout_ms": 2000},
    {"action_name": "alert_graph_failed", "action_type": "alert", "timeout_ms": 2000,
     "config": {"severity": "critical", "summary": "node graph failed"}}
  ],
  "states": [
    {"name": "initializing"},
    {"name": "wiring", "entry_actions": ["log_wiring_started"]},
    {"name": "running", "entry_actions": ["persist_graph_state", "publish_graph_running"]},
    {"name": "draining", "entry_actions": ["publish_graph_draining"]},
    {"name": "stopped", "is_terminal": true, "entry_actions": ["release_subscriptions", "persist_graph_state"]},
    {"name": "error", "is_terminal": true,
     "entry_actions": ["release_subscriptions", "persist_graph_state", "capture_graph_failure"]}
  ],
  "transitions": [
    {"from_state": "initializing", "to_state": "wiring", "event": "dependencies_resolved"},
    {"from_state": "initializing", "to_state": "error", "event": "resolution_failed",
     "actions": ["alert_graph_failed"]},
    {"from_state": "wiring", "to_state": "running", "event": "wiring_complete"},
    {"from_state": "wiring", "to_state": "error", "event": "wiring_failed", "actions": ["alert_graph_failed"]},
    {"from_state": "draining", "to_state": "stopped", "event": "drain_complete"},
    {"name": "graph_shutdown", "from_state": "*", "to_state": "draining", "event": "shutdown_requested"},
    {"name": "graph_fatal", "from_state": "*", "to_state": "error", "event": "fatal_error",
     "actions": ["alert_graph_failed"]}
  ]
})json";

}  // anonymous namespace

json LifecycleContracts::loaderDocument() {
    return json::parse(LOADER_CONTRACT);
}

json LifecycleContracts::registryDocument() {
    return json::parse(REGISTRY_CONTRACT);
}

json LifecycleContracts::graphDocument() {
    return json::parse(GRAPH_CONTRACT);
}

}  // namespace CLE
