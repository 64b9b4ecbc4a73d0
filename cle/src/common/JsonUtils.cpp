// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <chrono>

namespace CLE {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.empty()) {
        if (errorOut) {
            *errorOut = "Empty JSON string";
        }
        return std::nullopt;
    }

    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        if (errorOut) {
            *errorOut = e.what();
        }
        LOG_DEBUG("JsonUtils: Failed to parse JSON: {}", e.what());
        return std::nullopt;
    }
}

std::string JsonUtils::toCompactString(const json &value) {
    return value.dump();
}

std::string JsonUtils::toPrettyString(const json &value) {
    return value.dump(2);
}

std::string JsonUtils::getString(const json &object, const std::string &key, const std::string &defaultValue) {
    if (!object.is_object()) {
        return defaultValue;
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return defaultValue;
    }
    return it->get<std::string>();
}

int64_t JsonUtils::getInt(const json &object, const std::string &key, int64_t defaultValue) {
    if (!object.is_object()) {
        return defaultValue;
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer()) {
        return defaultValue;
    }
    return it->get<int64_t>();
}

bool JsonUtils::getBool(const json &object, const std::string &key, bool defaultValue) {
    if (!object.is_object()) {
        return defaultValue;
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_boolean()) {
        return defaultValue;
    }
    return it->get<bool>();
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    if (!object.is_object()) {
        return false;
    }
    auto it = object.find(key);
    return it != object.end() && !it->is_null();
}

json JsonUtils::merge(const json &base, const json &overlay) {
    json result = base.is_object() ? base : json::object();
    if (overlay.is_object()) {
        for (auto it = overlay.begin(); it != overlay.end(); ++it) {
            result[it.key()] = it.value();
        }
    }
    return result;
}

int64_t JsonUtils::nowUnixMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace CLE
