// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include <optional>
#include <string>

namespace CLE {

enum class AlertSeverity { Info, Warning, Critical };

std::string toString(AlertSeverity severity);
std::optional<AlertSeverity> alertSeverityFromString(const std::string &text);

struct Alert {
    AlertSeverity severity = AlertSeverity::Warning;
    std::string summary;
    std::string source;
    std::string correlationId;
    json details = json::object();
};

/**
 * @brief Paging / alerting endpoint collaborator
 */
class IAlertSink {
public:
    virtual ~IAlertSink() = default;

    /**
     * @return true if the alert was accepted
     */
    virtual bool raise(const Alert &alert) = 0;
};

/**
 * @brief Alert sink that writes alerts to the log
 *
 * Used when no paging endpoint is configured.
 */
class LoggingAlertSink : public IAlertSink {
public:
    bool raise(const Alert &alert) override;
};

}  // namespace CLE
