// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace CLE {

/**
 * @brief Observability topics (evt) versus access-restricted command topics (cmd)
 */
enum class TopicKind { Event, Command };

/**
 * @brief Topic naming convention: onex.<evt|cmd>.<service>.<name>.v<N>
 */
class TopicNaming {
public:
    /**
     * @brief Build a topic; service and name are normalized (lowercase, '_' and ' ' become '-')
     */
    static std::string makeTopic(TopicKind kind, const std::string &service, const std::string &name,
                                 uint32_t version = 1);

    static std::string normalizeSegment(const std::string &segment);

    /**
     * @brief Kind of a well-formed topic, nullopt if the topic does not follow the convention
     */
    static std::optional<TopicKind> kindOf(const std::string &topic);

    static bool isValid(const std::string &topic) {
        return kindOf(topic).has_value();
    }
};

}  // namespace CLE
