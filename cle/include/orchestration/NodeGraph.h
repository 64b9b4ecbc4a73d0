// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "events/IEventBus.h"
#include "model/Contract.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace CLE {

class ResourceRegistry;

/**
 * @brief Dependency graph of the registered node contracts
 *
 * resolve() checks that every declared dependency is present at a compatible
 * version and computes a dependency-first start order. wire() then
 * subscribes each node to its declared topics; every subscription is
 * registered in the ResourceRegistry under subscription/<node>/<topic> so a
 * cleanup action with prefix "subscription/" releases them all.
 */
class NodeGraph {
public:
    /**
     * @brief Receives bus messages on behalf of a node
     */
    using NodeDispatcher = std::function<void(const std::string &node, const EventEnvelope &envelope)>;

    static constexpr const char *SUBSCRIPTION_PREFIX = "subscription/";

    explicit NodeGraph(std::vector<std::shared_ptr<const Contract>> contracts);

    /**
     * @brief Validate dependencies and compute the start order
     *
     * Kahn's algorithm; among nodes that are ready at the same time the
     * lexicographically smallest name goes first, so the order is stable.
     *
     * @return Node names, dependencies before dependents
     * @throws DependencyError for a missing dependency or a cycle (naming the nodes involved)
     * @throws VersionMismatchError for an incompatible dependency version
     */
    const std::vector<std::string> &resolve();

    /**
     * @brief Subscribe every node to its declared topics
     *
     * Each releaser registered in resources keeps the bus alive.
     *
     * @return Number of subscriptions created
     * @throws std::logic_error if called before resolve()
     * @throws std::runtime_error if the bus refuses a subscription
     */
    size_t wire(std::shared_ptr<IEventBus> bus, ResourceRegistry &resources, NodeDispatcher dispatcher = nullptr);

    const std::vector<std::string> &order() const {
        return order_;
    }

    bool isResolved() const {
        return resolved_;
    }

    size_t wiredSubscriptionCount() const {
        return wiredSubscriptions_;
    }

    size_t nodeCount() const {
        return nodes_.size();
    }

    /**
     * @brief Nodes that name this node as a dependency, in name order
     */
    std::vector<std::string> dependentsOf(const std::string &name) const;

    static std::string subscriptionResourceName(const std::string &node, const std::string &topic);

private:
    std::map<std::string, std::shared_ptr<const Contract>> nodes_;
    std::vector<std::string> order_;
    bool resolved_ = false;
    size_t wiredSubscriptions_ = 0;
};

}  // namespace CLE
