// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "parsing/ContractParser.h"
#include "common/ContractErrors.h"
#include "common/Logger.h"

namespace CLE {

namespace {

/**
 * @brief Field accessors that report the full path of a bad field
 */
class FieldReader {
public:
    FieldReader(const std::string &contractName, const json &object, std::string path)
        : contractName_(contractName), object_(object), path_(std::move(path)) {
        if (!object_.is_object()) {
            throw SchemaError(contractName_, path_, "expected an object");
        }
    }

    const json &require(const std::string &key) const {
        auto it = object_.find(key);
        if (it == object_.end() || it->is_null()) {
            throw SchemaError(contractName_, fieldPath(key), "required field is missing");
        }
        return *it;
    }

    std::string requireString(const std::string &key) const {
        const json &value = require(key);
        if (!value.is_string() || value.get<std::string>().empty()) {
            throw SchemaError(contractName_, fieldPath(key), "expected a non-empty string");
        }
        return value.get<std::string>();
    }

    std::string optionalString(const std::string &key) const {
        auto it = object_.find(key);
        if (it == object_.end() || it->is_null()) {
            return "";
        }
        if (!it->is_string()) {
            throw SchemaError(contractName_, fieldPath(key), "expected a string");
        }
        return it->get<std::string>();
    }

    bool optionalBool(const std::string &key, bool defaultValue) const {
        auto it = object_.find(key);
        if (it == object_.end() || it->is_null()) {
            return defaultValue;
        }
        if (!it->is_boolean()) {
            throw SchemaError(contractName_, fieldPath(key), "expected a boolean");
        }
        return it->get<bool>();
    }

    int64_t requireInt(const std::string &key) const {
        const json &value = require(key);
        if (!value.is_number_integer()) {
            throw SchemaError(contractName_, fieldPath(key), "expected an integer");
        }
        return value.get<int64_t>();
    }

    std::vector<std::string> stringList(const std::string &key) const {
        std::vector<std::string> result;
        auto it = object_.find(key);
        if (it == object_.end() || it->is_null()) {
            return result;
        }
        if (!it->is_array()) {
            throw SchemaError(contractName_, fieldPath(key), "expected a list");
        }
        for (size_t i = 0; i < it->size(); ++i) {
            const json &item = (*it)[i];
            if (!item.is_string() || item.get<std::string>().empty()) {
                throw SchemaError(contractName_, fieldPath(key) + "[" + std::to_string(i) + "]",
                                  "expected a non-empty string");
            }
            result.push_back(item.get<std::string>());
        }
        return result;
    }

    const json *optionalList(const std::string &key) const {
        auto it = object_.find(key);
        if (it == object_.end() || it->is_null()) {
            return nullptr;
        }
        if (!it->is_array()) {
            throw SchemaError(contractName_, fieldPath(key), "expected a list");
        }
        return &(*it);
    }

    const json &requireList(const std::string &key) const {
        const json &value = require(key);
        if (!value.is_array()) {
            throw SchemaError(contractName_, fieldPath(key), "expected a list");
        }
        return value;
    }

    SemanticVersion requireVersion(const std::string &key) const {
        auto version = SemanticVersion::fromDocument(require(key));
        if (!version) {
            throw SchemaError(contractName_, fieldPath(key), "not a well-formed major.minor.patch version");
        }
        return *version;
    }

    std::string fieldPath(const std::string &key) const {
        return path_.empty() ? key : path_ + "." + key;
    }

    const json &object() const {
        return object_;
    }

private:
    const std::string &contractName_;
    const json &object_;
    std::string path_;
};

std::string itemPath(const std::string &list, size_t index) {
    return list + "[" + std::to_string(index) + "]";
}

ActionDefinition parseAction(const std::string &contractName, const json &node, const std::string &path,
                             const SemanticVersion &contractVersion) {
    FieldReader reader(contractName, node, path);

    ActionDefinition action;
    action.name = reader.requireString("action_name");

    std::string typeName = reader.requireString("action_type");
    auto type = actionTypeFromString(typeName);
    if (!type) {
        throw SchemaError(contractName, reader.fieldPath("action_type"), "unknown action type '" + typeName + "'");
    }
    action.type = *type;
    action.isCritical = reader.optionalBool("is_critical", false);
    action.timeoutMs = reader.requireInt("timeout_ms");
    action.version = JsonUtils::hasKey(node, "version") ? reader.requireVersion("version") : contractVersion;
    action.rollbackAction = reader.optionalString("rollback_action");

    if (JsonUtils::hasKey(node, "config")) {
        const json &config = node.at("config");
        if (!config.is_object()) {
            throw SchemaError(contractName, reader.fieldPath("config"), "expected an object");
        }
        action.config = config;
    }
    return action;
}

StateDefinition parseState(const std::string &contractName, const json &node, const std::string &path) {
    FieldReader reader(contractName, node, path);

    StateDefinition state;
    state.name = reader.requireString("name");
    state.isInitial = reader.optionalBool("is_initial", false);
    state.isTerminal = reader.optionalBool("is_terminal", false);
    state.entryActions = reader.stringList("entry_actions");
    state.exitActions = reader.stringList("exit_actions");
    return state;
}

TransitionDefinition parseTransition(const std::string &contractName, const json &node, const std::string &path) {
    FieldReader reader(contractName, node, path);

    TransitionDefinition transition;
    transition.name = reader.optionalString("name");
    transition.fromState = reader.requireString("from_state");
    transition.toState = reader.requireString("to_state");
    transition.event = reader.requireString("event");
    transition.actions = reader.stringList("actions");
    return transition;
}

}  // namespace

ContractDefinition ContractParser::parseDefinition(const json &document) {
    std::string contractName = JsonUtils::getString(document, "name");
    FieldReader root(contractName, document, "");

    ContractDefinition definition;
    definition.name = root.requireString("name");
    definition.description = root.optionalString("description");

    std::string nodeTypeName = root.requireString("node_type");
    auto nodeType = nodeTypeFromString(nodeTypeName);
    if (!nodeType) {
        throw SchemaError(contractName, "node_type", "unknown node type '" + nodeTypeName + "'");
    }
    definition.nodeType = *nodeType;
    definition.version = root.requireVersion("contract_version");

    if (const json *actions = root.optionalList("actions")) {
        for (size_t i = 0; i < actions->size(); ++i) {
            definition.actions.push_back(
                parseAction(contractName, (*actions)[i], itemPath("actions", i), definition.version));
        }
    }

    const json &states = root.requireList("states");
    for (size_t i = 0; i < states.size(); ++i) {
        definition.states.push_back(parseState(contractName, states[i], itemPath("states", i)));
    }

    // initial_state at the top level marks the named state; it must agree with any is_initial flag
    std::string initialState = root.optionalString("initial_state");
    if (!initialState.empty()) {
        bool found = false;
        for (auto &state : definition.states) {
            if (state.name == initialState) {
                state.isInitial = true;
                found = true;
            } else if (state.isInitial) {
                throw SchemaError(contractName, "initial_state",
                                  "conflicts with is_initial on state '" + state.name + "'");
            }
        }
        if (!found) {
            throw SchemaError(contractName, "initial_state", "unknown state '" + initialState + "'");
        }
    }

    const json &transitions = root.requireList("transitions");
    for (size_t i = 0; i < transitions.size(); ++i) {
        definition.transitions.push_back(
            parseTransition(contractName, transitions[i], itemPath("transitions", i)));
    }

    if (const json *dependencies = root.optionalList("dependencies")) {
        for (size_t i = 0; i < dependencies->size(); ++i) {
            FieldReader reader(contractName, (*dependencies)[i], itemPath("dependencies", i));
            DependencySpec dependency;
            dependency.name = reader.requireString("name");
            dependency.version = reader.requireVersion("version");
            definition.dependencies.push_back(std::move(dependency));
        }
    }
    definition.subscriptions = root.stringList("subscriptions");

    return definition;
}

std::shared_ptr<const Contract> ContractParser::parse(const json &document) {
    try {
        return Contract::create(parseDefinition(document));
    } catch (const SchemaError &e) {
        LOG_DEBUG("ContractParser: {}", e.what());
        throw;
    }
}

}  // namespace CLE
