// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "stores/InMemoryDocumentStore.h"

namespace CLE {

bool InMemoryDocumentStore::put(const std::string &key, const json &document) {
    std::lock_guard<std::mutex> lock(mutex_);
    documents_[key] = document;
    ++writeCount_;
    return true;
}

bool InMemoryDocumentStore::putIfAbsent(const std::string &key, const json &document) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!documents_.emplace(key, document).second) {
        return false;
    }
    ++writeCount_;
    return true;
}

std::optional<json> InMemoryDocumentStore::get(const std::string &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(key);
    if (it == documents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> InMemoryDocumentStore::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(documents_.size());
    for (const auto &[key, document] : documents_) {
        result.push_back(key);
    }
    return result;
}

size_t InMemoryDocumentStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return documents_.size();
}

uint64_t InMemoryDocumentStore::getWriteCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writeCount_;
}

}  // namespace CLE
