// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/TransitionResult.h"

namespace CLE {

std::string toString(TransitionStatus status) {
    switch (status) {
    case TransitionStatus::Committed:
        return "committed";
    case TransitionStatus::NoMatch:
        return "no_match";
    case TransitionStatus::Busy:
        return "busy";
    case TransitionStatus::Aborted:
        return "aborted";
    }
    return "unknown";
}

json ActionRecord::toJson() const {
    json record{{"action", actionName},
                {"type", toString(type)},
                {"phase", toString(phase)},
                {"critical", isCritical},
                {"success", outcome.success},
                {"duration_ms", outcome.duration.count()}};
    if (!outcome.success) {
        record["cause"] = toString(outcome.cause);
        record["message"] = outcome.message;
    }
    return record;
}

std::vector<ActionRecord> TransitionResult::nonCriticalFailures() const {
    std::vector<ActionRecord> failures;
    for (const auto &record : actions) {
        if (!record.outcome.success && !record.isCritical) {
            failures.push_back(record);
        }
    }
    return failures;
}

std::vector<std::string> TransitionResult::executedActionNames() const {
    std::vector<std::string> names;
    names.reserve(actions.size());
    for (const auto &record : actions) {
        names.push_back(record.actionName);
    }
    return names;
}

json TransitionResult::toJson() const {
    json document = toSummaryJson();
    document["correlation_id"] = correlationId;

    json records = json::array();
    for (const auto &record : actions) {
        records.push_back(record.toJson());
    }
    document["actions"] = std::move(records);

    if (!rollbacks.empty()) {
        json rollbackRecords = json::array();
        for (const auto &record : rollbacks) {
            rollbackRecords.push_back(record.toJson());
        }
        document["rollbacks"] = std::move(rollbackRecords);
    }
    return document;
}

json TransitionResult::toSummaryJson() const {
    json summary{{"status", toString(status)},
                 {"event", eventName},
                 {"from", fromState},
                 {"to", toState},
                 {"generation", generation},
                 {"failures", nonCriticalFailures().size()}};
    if (!transitionName.empty()) {
        summary["transition"] = transitionName;
    }
    if (!abortedBy.empty()) {
        summary["aborted_by"] = abortedBy;
    }
    if (!errorMessage.empty()) {
        summary["error"] = errorMessage;
    }
    return summary;
}

}  // namespace CLE
