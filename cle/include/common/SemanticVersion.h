// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include <compare>
#include <cstdint>
#include <optional>
#include <string>

namespace CLE {

/**
 * @brief major.minor.patch version of a contract or action
 */
struct SemanticVersion {
    uint32_t major = 0;
    uint32_t minor = 0;
    uint32_t patch = 0;

    SemanticVersion() = default;

    SemanticVersion(uint32_t ma, uint32_t mi, uint32_t pa) : major(ma), minor(mi), patch(pa) {}

    /**
     * @brief Strict "MAJOR.MINOR.PATCH" parse (digits only, no sign, no suffix)
     */
    static std::optional<SemanticVersion> parse(const std::string &text);

    /**
     * @brief Accepts "1.2.3" or {"major": 1, "minor": 2, "patch": 3}
     */
    static std::optional<SemanticVersion> fromDocument(const json &value);

    /**
     * @brief Versions change additively: same major and this >= required
     */
    bool isCompatibleWith(const SemanticVersion &required) const;

    std::string toString() const;

    json toJson() const;

    auto operator<=>(const SemanticVersion &) const = default;
};

}  // namespace CLE
