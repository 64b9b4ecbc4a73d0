// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <stdexcept>
#include <string>

namespace CLE {

/**
 * @brief Base of every load-time contract error
 *
 * Load-time errors are exceptions: a contract that fails any of these checks
 * never reaches an FSM instance. Runtime outcomes (NoMatch, Busy, aborted
 * transitions) are values in TransitionResult instead.
 */
class ContractError : public std::runtime_error {
public:
    ContractError(const std::string &contractName, const std::string &message)
        : std::runtime_error(contractName.empty() ? message : "contract '" + contractName + "': " + message),
          contractName_(contractName), detail_(message) {}

    const std::string &getContractName() const {
        return contractName_;
    }

    /**
     * @brief Message without the contract prefix
     */
    const std::string &getDetail() const {
        return detail_;
    }

private:
    std::string contractName_;
    std::string detail_;
};

/**
 * @brief Structural or cross-reference validation failure
 *
 * The field path points at the offending element, e.g. "transitions[2].to_state".
 */
class SchemaError : public ContractError {
public:
    SchemaError(const std::string &contractName, const std::string &fieldPath, const std::string &message)
        : ContractError(contractName, fieldPath.empty() ? message : fieldPath + ": " + message),
          fieldPath_(fieldPath), message_(message) {}

    const std::string &getFieldPath() const {
        return fieldPath_;
    }

    /**
     * @brief Message without contract or field path
     */
    const std::string &getMessage() const {
        return message_;
    }

private:
    std::string fieldPath_;
    std::string message_;
};

/**
 * @brief File could not be read or decoded into a document
 */
class ContractLoadError : public ContractError {
public:
    ContractLoadError(const std::string &path, const std::string &message)
        : ContractError("", path + ": " + message), path_(path) {}

    const std::string &getPath() const {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Loaded contract version is not compatible with the requested one
 */
class VersionMismatchError : public ContractError {
public:
    VersionMismatchError(const std::string &contractName, const std::string &required, const std::string &loaded)
        : ContractError(contractName, "version " + loaded + " is not compatible with required " + required),
          required_(required), loaded_(loaded) {}

    const std::string &getRequired() const {
        return required_;
    }

    const std::string &getLoaded() const {
        return loaded_;
    }

private:
    std::string required_;
    std::string loaded_;
};

/**
 * @brief Node graph dependency could not be resolved (missing node or cycle)
 */
class DependencyError : public ContractError {
public:
    DependencyError(const std::string &contractName, const std::string &message)
        : ContractError(contractName, message) {}
};

}  // namespace CLE
