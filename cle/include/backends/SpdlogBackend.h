// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace CLE {

/**
 * @brief spdlog-based logger backend
 *
 * Default backend of the runtime:
 * - colored console sink
 * - optional basic file sink (<logDir>/cle.log)
 * - SPDLOG_LEVEL environment variable overrides the initial level
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;

    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace CLE
