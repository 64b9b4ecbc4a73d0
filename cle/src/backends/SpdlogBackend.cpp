// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "backends/SpdlogBackend.h"
#include "common/Logger.h"

#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace CLE {

namespace {
constexpr const char *LOGGER_NAME = "CLE";
constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
}  // namespace

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(console_sink);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / "cle.log";

        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
        file_sink->set_pattern(FILE_PATTERN);
        sinks.push_back(file_sink);
    }

    // A previous backend may have registered the same name (tests re-initialize)
    spdlog::drop(LOGGER_NAME);
    logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    spdlog::register_logger(logger_);

    logger_->set_level(spdlog::level::info);

    const char *env_level = std::getenv("SPDLOG_LEVEL");
    if (env_level) {
        if (auto level = Logger::parseLevel(env_level)) {
            logger_->set_level(convertLevel(*level));
        }
    }
}

void SpdlogBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    if (logger_) {
        logger_->log(convertLevel(level), message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(convertLevel(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    default:
        return spdlog::level::info;
    }
}

}  // namespace CLE
