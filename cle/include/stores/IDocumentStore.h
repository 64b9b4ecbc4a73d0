// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include <optional>
#include <string>

namespace CLE {

/**
 * @brief Key/document store collaborator
 *
 * Backs both persistence actions (state snapshots, overwritten) and
 * data_capture actions (diagnostics, write-once).
 */
class IDocumentStore {
public:
    virtual ~IDocumentStore() = default;

    /**
     * @brief Insert or overwrite
     * @return true on success
     */
    virtual bool put(const std::string &key, const json &document) = 0;

    /**
     * @brief Insert only if key is absent
     * @return true if the document was stored, false if key already existed
     */
    virtual bool putIfAbsent(const std::string &key, const json &document) = 0;

    virtual std::optional<json> get(const std::string &key) const = 0;
};

}  // namespace CLE
