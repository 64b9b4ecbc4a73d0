// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/Logger.h"
#include "events/IAlertSink.h"

namespace CLE {

std::string toString(AlertSeverity severity) {
    switch (severity) {
    case AlertSeverity::Info:
        return "info";
    case AlertSeverity::Warning:
        return "warning";
    case AlertSeverity::Critical:
        return "critical";
    }
    return "warning";
}

std::optional<AlertSeverity> alertSeverityFromString(const std::string &text) {
    if (text == "info") {
        return AlertSeverity::Info;
    }
    if (text == "warning" || text == "warn") {
        return AlertSeverity::Warning;
    }
    if (text == "critical") {
        return AlertSeverity::Critical;
    }
    return std::nullopt;
}

bool LoggingAlertSink::raise(const Alert &alert) {
    std::string line = std::format("ALERT [{}] {} (source={}, correlation={}) {}", toString(alert.severity),
                                   alert.summary, alert.source, alert.correlationId,
                                   JsonUtils::toCompactString(alert.details));
    if (alert.severity == AlertSeverity::Info) {
        LOG_INFO("{}", line);
    } else if (alert.severity == AlertSeverity::Warning) {
        LOG_WARN("{}", line);
    } else {
        LOG_ERROR("{}", line);
    }
    return true;
}

}  // namespace CLE
