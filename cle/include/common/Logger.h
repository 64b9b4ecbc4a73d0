// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>

namespace CLE {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * Every component of the lifecycle engine logs through this facade:
 *
 * 1. Default mode: SpdlogBackend is created lazily on first use
 * 2. Custom mode: callers inject their own ILoggerBackend
 *
 * Thread-safe: backend replacement is serialized, record emission is
 * delegated to the backend which must be thread-safe itself.
 *
 * @code
 * CLE::Logger::initialize("/var/log/cle", true);
 * LOG_INFO("Orchestrator: {} contracts discovered", count);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default backend (console only) unless one is installed
     */
    static void initialize();

    /**
     * @brief Initialize default backend with optional file output
     *
     * @param logDir Directory for cle.log
     * @param logToFile Enable the file sink
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    /**
     * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
     * @return Level or nullopt when the name is not recognized
     */
    static std::optional<LogLevel> parseLevel(const std::string &name);

    static void log(LogLevel level, const std::string &message,
                    const std::source_location &loc = std::source_location::current());

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static std::string extractCleanFunctionName(const std::source_location &loc);
};

}  // namespace CLE

// std::format based macros; the call site's source_location is captured here
#define LOG_TRACE(...) CLE::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) CLE::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) CLE::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) CLE::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) CLE::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
