// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/SemanticVersion.h"

#include <cctype>
#include <limits>

namespace CLE {

namespace {

std::optional<uint32_t> parseComponent(const std::string &text) {
    if (text.empty() || text.size() > 9) {
        return std::nullopt;
    }
    if (text.size() > 1 && text.front() == '0') {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    return value;
}

std::optional<uint32_t> componentFromJson(const json &object, const char *key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    int64_t value = it->get<int64_t>();
    if (value < 0 || value > std::numeric_limits<int32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(value);
}

}  // namespace

std::optional<SemanticVersion> SemanticVersion::parse(const std::string &text) {
    size_t first = text.find('.');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    size_t second = text.find('.', first + 1);
    if (second == std::string::npos || text.find('.', second + 1) != std::string::npos) {
        return std::nullopt;
    }

    auto major = parseComponent(text.substr(0, first));
    auto minor = parseComponent(text.substr(first + 1, second - first - 1));
    auto patch = parseComponent(text.substr(second + 1));
    if (!major || !minor || !patch) {
        return std::nullopt;
    }
    return SemanticVersion(*major, *minor, *patch);
}

std::optional<SemanticVersion> SemanticVersion::fromDocument(const json &value) {
    if (value.is_string()) {
        return parse(value.get<std::string>());
    }
    if (!value.is_object()) {
        return std::nullopt;
    }

    auto major = componentFromJson(value, "major");
    auto minor = componentFromJson(value, "minor");
    auto patch = componentFromJson(value, "patch");
    if (!major || !minor || !patch) {
        return std::nullopt;
    }
    return SemanticVersion(*major, *minor, *patch);
}

bool SemanticVersion::isCompatibleWith(const SemanticVersion &required) const {
    return major == required.major && *this >= required;
}

std::string SemanticVersion::toString() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

json SemanticVersion::toJson() const {
    return json{{"major", major}, {"minor", minor}, {"patch", patch}};
}

}  // namespace CLE
