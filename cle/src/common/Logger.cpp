// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/Logger.h"
#include "backends/SpdlogBackend.h"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace CLE {

std::unique_ptr<ILoggerBackend> Logger::backend_;

// Serializes backend installation; emission goes straight to the backend
static std::mutex backend_mutex;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

std::optional<LogLevel> Logger::parseLevel(const std::string &name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") {
        return LogLevel::Trace;
    }
    if (lowered == "debug") {
        return LogLevel::Debug;
    }
    if (lowered == "info") {
        return LogLevel::Info;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::Warn;
    }
    if (lowered == "err" || lowered == "error") {
        return LogLevel::Error;
    }
    if (lowered == "critical") {
        return LogLevel::Critical;
    }
    if (lowered == "off") {
        return LogLevel::Off;
    }
    return std::nullopt;
}

void Logger::log(LogLevel level, const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(level, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    log(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    log(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    log(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    log(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    log(LogLevel::Error, message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    std::string full_name = loc.function_name();

    size_t paren_pos = full_name.find('(');
    if (paren_pos == std::string::npos) {
        return full_name.empty() ? "UnknownFunction" : full_name;
    }

    // Last space outside template brackets separates the return type from the name
    size_t name_start = 0;
    int angle_depth = 0;
    for (size_t i = 0; i < paren_pos; ++i) {
        char c = full_name[i];
        if (c == '<') {
            ++angle_depth;
        } else if (c == '>') {
            --angle_depth;
        } else if (c == ' ' && angle_depth == 0) {
            name_start = i + 1;
        }
    }

    std::string result;
    angle_depth = 0;
    for (size_t i = name_start; i < paren_pos; ++i) {
        char c = full_name[i];
        if (c == '<') {
            ++angle_depth;
        } else if (c == '>') {
            --angle_depth;
        } else if (angle_depth == 0 && c != '*' && c != '&') {
            result += c;
        }
    }

    return result.empty() ? "UnknownFunction" : result;
}

}  // namespace CLE
