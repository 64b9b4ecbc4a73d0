// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "events/TopicNaming.h"

#include <cctype>
#include <vector>

namespace CLE {

namespace {

constexpr const char *TOPIC_PREFIX = "onex";

std::vector<std::string> split(const std::string &text, char separator) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(separator, start);
        parts.push_back(text.substr(start, pos - start));
        if (pos == std::string::npos) {
            break;
        }
        start = pos + 1;
    }
    return parts;
}

bool isSegment(const std::string &segment) {
    if (segment.empty()) {
        return false;
    }
    for (char c : segment) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!(std::islower(uc) || std::isdigit(uc) || c == '-')) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string TopicNaming::normalizeSegment(const std::string &segment) {
    std::string result;
    result.reserve(segment.size());
    for (char c : segment) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '_' || c == ' ' || c == '.') {
            result += '-';
        } else {
            result += static_cast<char>(std::tolower(uc));
        }
    }
    return result;
}

std::string TopicNaming::makeTopic(TopicKind kind, const std::string &service, const std::string &name,
                                   uint32_t version) {
    return std::string(TOPIC_PREFIX) + (kind == TopicKind::Event ? ".evt." : ".cmd.") + normalizeSegment(service) +
           "." + normalizeSegment(name) + ".v" + std::to_string(version);
}

std::optional<TopicKind> TopicNaming::kindOf(const std::string &topic) {
    auto parts = split(topic, '.');
    if (parts.size() != 5 || parts[0] != TOPIC_PREFIX) {
        return std::nullopt;
    }

    std::optional<TopicKind> kind;
    if (parts[1] == "evt") {
        kind = TopicKind::Event;
    } else if (parts[1] == "cmd") {
        kind = TopicKind::Command;
    } else {
        return std::nullopt;
    }

    if (!isSegment(parts[2]) || !isSegment(parts[3])) {
        return std::nullopt;
    }

    const std::string &version = parts[4];
    if (version.size() < 2 || version[0] != 'v') {
        return std::nullopt;
    }
    for (size_t i = 1; i < version.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(version[i]))) {
            return std::nullopt;
        }
    }
    return kind;
}

}  // namespace CLE
