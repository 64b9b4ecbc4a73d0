// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <source_location>
#include <string>

namespace CLE {

/**
 * @brief Log level enumeration
 *
 * Ordered so that a numeric comparison against the configured minimum decides
 * whether a message is emitted.
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Logger backend interface for dependency injection
 *
 * The runtime never talks to a logging library directly; the Logger facade
 * forwards every record to the installed backend. Tests install a capturing
 * backend, the runtime executable installs SpdlogBackend.
 *
 * @code
 * class CapturingBackend : public CLE::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message, const std::source_location &) override {
 *         records.emplace_back(level, message);
 *     }
 *     void setLevel(LogLevel) override {}
 *     void flush() override {}
 *     std::vector<std::pair<LogLevel, std::string>> records;
 * };
 *
 * CLE::Logger::setBackend(std::make_unique<CapturingBackend>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     *
     * @param level Log level
     * @param message Pre-formatted message (function name already included)
     * @param loc Source location of the LOG_* call site
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /**
     * @brief Set minimum log level; messages below it are dropped
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush pending records
     */
    virtual void flush() = 0;
};

}  // namespace CLE
