// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "orchestration/RuntimeConfig.h"
#include "backends/SpdlogBackend.h"
#include "common/Logger.h"
#include "parsing/ContractLoader.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace CLE {

namespace {

std::string levelName(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Off:
        return "off";
    }
    return "info";
}

int64_t readInteger(const json &document, const std::string &key, int64_t current, int64_t minimum) {
    if (!JsonUtils::hasKey(document, key)) {
        return current;
    }
    const json &value = document[key];
    if (!value.is_number_integer()) {
        throw std::invalid_argument("RuntimeConfig: '" + key + "' must be an integer");
    }
    const int64_t number = value.get<int64_t>();
    if (number < minimum) {
        throw std::invalid_argument("RuntimeConfig: '" + key + "' must be >= " + std::to_string(minimum) + ", got " +
                                    std::to_string(number));
    }
    return number;
}

std::string readString(const json &document, const std::string &key, const std::string &current,
                       const std::string &keyPath) {
    if (!JsonUtils::hasKey(document, key)) {
        return current;
    }
    const json &value = document[key];
    if (!value.is_string()) {
        throw std::invalid_argument("RuntimeConfig: '" + keyPath + "' must be a string");
    }
    return value.get<std::string>();
}

bool readBool(const json &document, const std::string &key, bool current, const std::string &keyPath) {
    if (!JsonUtils::hasKey(document, key)) {
        return current;
    }
    const json &value = document[key];
    if (!value.is_boolean()) {
        throw std::invalid_argument("RuntimeConfig: '" + keyPath + "' must be a boolean");
    }
    return value.get<bool>();
}

void resolveRelative(std::string &path, const std::filesystem::path &base) {
    if (!path.empty() && std::filesystem::path(path).is_relative()) {
        path = (base / path).lexically_normal().string();
    }
}

}  // anonymous namespace

RuntimeConfig RuntimeConfig::fromDocument(const json &document) {
    RuntimeConfig config;
    if (document.is_null()) {
        return config;
    }
    if (!document.is_object()) {
        throw std::invalid_argument("RuntimeConfig: document must be a mapping");
    }

    config.contractDirectory =
        readString(document, "contract_directory", config.contractDirectory, "contract_directory");
    if (config.contractDirectory.empty()) {
        throw std::invalid_argument("RuntimeConfig: 'contract_directory' cannot be empty");
    }

    config.drainTimeoutMs = readInteger(document, "drain_timeout_ms", config.drainTimeoutMs, 1);
    config.busyRetryLimit = readInteger(document, "busy_retry_limit", config.busyRetryLimit, 0);
    config.busyRetryDelayMs = readInteger(document, "busy_retry_delay_ms", config.busyRetryDelayMs, 0);
    config.maxContractBytes = static_cast<uintmax_t>(
        readInteger(document, "max_contract_bytes", static_cast<int64_t>(config.maxContractBytes), 1));
    config.strictAnalysis = readBool(document, "strict_analysis", config.strictAnalysis, "strict_analysis");

    if (JsonUtils::hasKey(document, "log")) {
        const json &log = document["log"];
        if (!log.is_object()) {
            throw std::invalid_argument("RuntimeConfig: 'log' must be a mapping");
        }
        const std::string level = readString(log, "level", levelName(config.logLevel), "log.level");
        auto parsed = Logger::parseLevel(level);
        if (!parsed) {
            throw std::invalid_argument("RuntimeConfig: 'log.level' has unknown value '" + level + "'");
        }
        config.logLevel = parsed.value();
        config.logDirectory = readString(log, "directory", config.logDirectory, "log.directory");
        config.logToFile = readBool(log, "to_file", config.logToFile, "log.to_file");
        if (config.logToFile && config.logDirectory.empty()) {
            throw std::invalid_argument("RuntimeConfig: 'log.to_file' requires 'log.directory'");
        }
    }

    if (JsonUtils::hasKey(document, "lifecycle_contracts")) {
        const json &lifecycle = document["lifecycle_contracts"];
        if (!lifecycle.is_object()) {
            throw std::invalid_argument("RuntimeConfig: 'lifecycle_contracts' must be a mapping");
        }
        config.loaderContractPath = readString(lifecycle, "loader", "", "lifecycle_contracts.loader");
        config.registryContractPath = readString(lifecycle, "registry", "", "lifecycle_contracts.registry");
        config.graphContractPath = readString(lifecycle, "graph", "", "lifecycle_contracts.graph");
    }

    return config;
}

RuntimeConfig RuntimeConfig::loadFile(const std::string &path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("RuntimeConfig: cannot open '" + path + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    const std::filesystem::path filePath(path);
    json document;
    if (filePath.extension() == ".json") {
        std::string error;
        auto parsed = JsonUtils::parseJson(buffer.str(), &error);
        if (!parsed) {
            throw std::runtime_error("RuntimeConfig: '" + path + "' is not valid JSON: " + error);
        }
        document = std::move(parsed.value());
    } else {
        document = ContractLoader::decodeYaml(buffer.str(), path);
    }

    RuntimeConfig config = fromDocument(document);

    const auto base = filePath.parent_path();
    resolveRelative(config.contractDirectory, base);
    resolveRelative(config.logDirectory, base);
    resolveRelative(config.loaderContractPath, base);
    resolveRelative(config.registryContractPath, base);
    resolveRelative(config.graphContractPath, base);

    LOG_INFO("RuntimeConfig: loaded '{}' (contracts in '{}')", path, config.contractDirectory);
    return config;
}

void RuntimeConfig::applyLogging() const {
    if (logToFile) {
        // Replaces a console-only backend created by earlier log calls
        Logger::setBackend(std::make_unique<SpdlogBackend>(logDirectory, true));
    } else {
        Logger::initialize();
    }

    // SPDLOG_LEVEL wins over the configured level
    const char *envLevel = std::getenv("SPDLOG_LEVEL");
    if (envLevel && Logger::parseLevel(envLevel)) {
        return;
    }
    Logger::setLevel(logLevel);
}

json RuntimeConfig::toJson() const {
    return json{{"contract_directory", contractDirectory},
                {"drain_timeout_ms", drainTimeoutMs},
                {"busy_retry_limit", busyRetryLimit},
                {"busy_retry_delay_ms", busyRetryDelayMs},
                {"strict_analysis", strictAnalysis},
                {"max_contract_bytes", maxContractBytes},
                {"log", {{"level", levelName(logLevel)}, {"directory", logDirectory}, {"to_file", logToFile}}},
                {"lifecycle_contracts",
                 {{"loader", loaderContractPath}, {"registry", registryContractPath}, {"graph", graphContractPath}}}};
}

}  // namespace CLE
