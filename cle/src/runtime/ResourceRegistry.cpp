// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/ResourceRegistry.h"
#include "common/Logger.h"

namespace CLE {

void ResourceRegistry::add(const std::string &name, Releaser releaser) {
    std::lock_guard<std::mutex> lock(mutex_);
    handles_[name] = std::move(releaser);
}

bool ResourceRegistry::release(const std::string &name) {
    Releaser releaser;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handles_.find(name);
        if (it == handles_.end()) {
            LOG_DEBUG("ResourceRegistry: '{}' already released", name);
            return true;
        }
        releaser = std::move(it->second);
        handles_.erase(it);
    }

    // Called outside the lock; a releaser may register or release other handles
    bool ok = !releaser || releaser();
    if (!ok) {
        LOG_WARN("ResourceRegistry: Releasing '{}' reported failure", name);
    }
    return ok;
}

bool ResourceRegistry::releasePrefix(const std::string &prefix) {
    std::vector<std::string> matching;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = handles_.lower_bound(prefix); it != handles_.end() && it->first.starts_with(prefix); ++it) {
            matching.push_back(it->first);
        }
    }

    bool allOk = true;
    for (const auto &name : matching) {
        allOk = release(name) && allOk;
    }
    return allOk;
}

bool ResourceRegistry::contains(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.count(name) > 0;
}

std::vector<std::string> ResourceRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto &[name, releaser] : handles_) {
        result.push_back(name);
    }
    return result;
}

size_t ResourceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

}  // namespace CLE
