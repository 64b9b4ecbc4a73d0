// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/ILoggerBackend.h"
#include "common/JsonUtils.h"
#include <cstdint>
#include <string>

namespace CLE {

/**
 * @brief Orchestrator settings
 *
 * Loaded from a YAML or JSON document:
 * @code
 * contract_directory: contracts
 * drain_timeout_ms: 5000
 * busy_retry_limit: 3
 * busy_retry_delay_ms: 10
 * strict_analysis: false
 * max_contract_bytes: 1048576
 * log:
 *   level: info
 *   directory: /var/log/cle
 *   to_file: true
 * lifecycle_contracts:
 *   loader: lifecycle/contract_loader.yaml
 * @endcode
 * Every key is optional.
 */
struct RuntimeConfig {
    std::string contractDirectory = "contracts";
    int64_t drainTimeoutMs = 5000;
    int64_t busyRetryLimit = 3;
    int64_t busyRetryDelayMs = 10;
    bool strictAnalysis = false;
    uintmax_t maxContractBytes = 1024 * 1024;

    LogLevel logLevel = LogLevel::Info;
    std::string logDirectory;
    bool logToFile = false;

    // Empty = built-in lifecycle contract
    std::string loaderContractPath;
    std::string registryContractPath;
    std::string graphContractPath;

    /**
     * @brief Build from a parsed document
     * @throws std::invalid_argument naming the offending key
     */
    static RuntimeConfig fromDocument(const json &document);

    /**
     * @brief Read a .yaml/.yml/.json file; relative paths inside it resolve
     *        against the file's directory
     * @throws std::runtime_error if the file cannot be read or decoded
     * @throws std::invalid_argument for invalid values
     */
    static RuntimeConfig loadFile(const std::string &path);

    /**
     * @brief Install the configured level and sinks on the Logger facade
     */
    void applyLogging() const;

    json toJson() const;
};

}  // namespace CLE
