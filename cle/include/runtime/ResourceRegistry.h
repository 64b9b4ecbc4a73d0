// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace CLE {

/**
 * @brief Owned handles (subscriptions, sockets, files) released by cleanup actions
 *
 * Release is idempotent: releasing a handle that is already gone succeeds
 * without calling anything, which keeps terminal-state cleanup safe to repeat.
 */
class ResourceRegistry {
public:
    using Releaser = std::function<bool()>;

    /**
     * @brief Register a handle; replaces (without releasing) an existing one of the same name
     */
    void add(const std::string &name, Releaser releaser);

    /**
     * @brief Release one handle
     * @return false only if the releaser itself reported failure
     */
    bool release(const std::string &name);

    /**
     * @brief Release every handle whose name starts with prefix (in name order)
     * @return false if any releaser reported failure
     */
    bool releasePrefix(const std::string &prefix);

    bool contains(const std::string &name) const;

    std::vector<std::string> names() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Releaser> handles_;
};

}  // namespace CLE
