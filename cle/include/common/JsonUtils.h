// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace CLE {

using json = nlohmann::json;

/**
 * @brief JSON helpers shared by the contract parser, the configuration layer
 *        and the built-in action handlers
 *
 * Lookups are lenient (return a default) so that callers decide whether an
 * absent field is an error.
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON string with error capture instead of throwing
     * @param jsonString Input text
     * @param errorOut Optional parse error message
     * @return Parsed value or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    static std::string toCompactString(const json &value);

    static std::string toPrettyString(const json &value);

    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");

    static int64_t getInt(const json &object, const std::string &key, int64_t defaultValue = 0);

    static bool getBool(const json &object, const std::string &key, bool defaultValue = false);

    /**
     * @brief True if key exists and is not null
     */
    static bool hasKey(const json &object, const std::string &key);

    /**
     * @brief Shallow merge: keys of overlay replace keys of base (both must be objects)
     */
    static json merge(const json &base, const json &overlay);

    /**
     * @brief Milliseconds since the Unix epoch, for record timestamps
     */
    static int64_t nowUnixMs();
};

}  // namespace CLE
