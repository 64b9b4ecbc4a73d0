// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "orchestration/NodeGraph.h"
#include "common/ContractErrors.h"
#include "common/Logger.h"
#include "events/TopicNaming.h"
#include "runtime/ResourceRegistry.h"
#include <queue>
#include <set>
#include <stdexcept>

namespace CLE {

NodeGraph::NodeGraph(std::vector<std::shared_ptr<const Contract>> contracts) {
    for (auto &contract : contracts) {
        if (!contract) {
            throw std::invalid_argument("NodeGraph: contract cannot be null");
        }
        const std::string name = contract->getName();
        if (!nodes_.emplace(name, std::move(contract)).second) {
            throw std::invalid_argument("NodeGraph: duplicate node '" + name + "'");
        }
    }
}

const std::vector<std::string> &NodeGraph::resolve() {
    // Validate every edge first so the error names the offending node
    std::map<std::string, size_t> inDegree;
    std::map<std::string, std::vector<std::string>> dependents;
    for (const auto &[name, contract] : nodes_) {
        inDegree.emplace(name, 0);
    }

    for (const auto &[name, contract] : nodes_) {
        for (const auto &dependency : contract->getDependencies()) {
            auto target = nodes_.find(dependency.name);
            if (target == nodes_.end()) {
                throw DependencyError(name, "depends on '" + dependency.name + "' which is not registered");
            }
            if (!target->second->getVersion().isCompatibleWith(dependency.version)) {
                throw VersionMismatchError(dependency.name, dependency.version.toString(),
                                           target->second->getVersion().toString());
            }
            dependents[dependency.name].push_back(name);
            ++inDegree[name];
        }
    }

    std::priority_queue<std::string, std::vector<std::string>, std::greater<>> ready;
    for (const auto &[name, degree] : inDegree) {
        if (degree == 0) {
            ready.push(name);
        }
    }

    std::vector<std::string> order;
    order.reserve(nodes_.size());
    while (!ready.empty()) {
        std::string current = ready.top();
        ready.pop();
        order.push_back(current);

        for (const auto &dependent : dependents[current]) {
            if (--inDegree[dependent] == 0) {
                ready.push(dependent);
            }
        }
    }

    if (order.size() != nodes_.size()) {
        std::string involved;
        for (const auto &[name, degree] : inDegree) {
            if (degree > 0) {
                involved += involved.empty() ? name : ", " + name;
            }
        }
        throw DependencyError("", "dependency cycle among: " + involved);
    }

    order_ = std::move(order);
    resolved_ = true;
    LOG_INFO("NodeGraph: resolved {} nodes", order_.size());
    return order_;
}

size_t NodeGraph::wire(std::shared_ptr<IEventBus> bus, ResourceRegistry &resources, NodeDispatcher dispatcher) {
    if (!resolved_) {
        throw std::logic_error("NodeGraph: wire() called before resolve()");
    }
    if (!bus) {
        throw std::invalid_argument("NodeGraph: event bus cannot be null");
    }

    size_t created = 0;
    for (const auto &name : order_) {
        const auto &contract = nodes_.at(name);
        for (const auto &topic : contract->getSubscriptions()) {
            if (!TopicNaming::isValid(topic)) {
                LOG_WARN("NodeGraph: node '{}' subscribes to '{}' outside the onex topic convention", name, topic);
            }

            EventHandler handler = [name, dispatcher](const EventEnvelope &envelope) {
                if (dispatcher) {
                    dispatcher(name, envelope);
                } else {
                    LOG_DEBUG("NodeGraph: '{}' received '{}' on '{}'", name, envelope.eventName, envelope.topic);
                }
            };

            const std::string subscriptionId = bus->subscribe(topic, std::move(handler));
            if (subscriptionId.empty()) {
                throw std::runtime_error("NodeGraph: event bus refused subscription of '" + name + "' to '" + topic +
                                         "'");
            }

            resources.add(subscriptionResourceName(name, topic),
                          [bus, subscriptionId]() { return bus->unsubscribe(subscriptionId); });
            ++created;
        }
    }

    wiredSubscriptions_ += created;
    LOG_INFO("NodeGraph: wired {} subscriptions across {} nodes", created, order_.size());
    return created;
}

std::vector<std::string> NodeGraph::dependentsOf(const std::string &name) const {
    std::vector<std::string> result;
    for (const auto &[nodeName, contract] : nodes_) {
        for (const auto &dependency : contract->getDependencies()) {
            if (dependency.name == name) {
                result.push_back(nodeName);
                break;
            }
        }
    }
    return result;
}

std::string NodeGraph::subscriptionResourceName(const std::string &node, const std::string &topic) {
    return std::string(SUBSCRIPTION_PREFIX) + node + "/" + topic;
}

}  // namespace CLE
