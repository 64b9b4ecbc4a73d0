// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "stores/IDocumentStore.h"
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace CLE {

/**
 * @brief Mutex-protected map store; counts writes so tests can check idempotence
 */
class InMemoryDocumentStore : public IDocumentStore {
public:
    bool put(const std::string &key, const json &document) override;
    bool putIfAbsent(const std::string &key, const json &document) override;
    std::optional<json> get(const std::string &key) const override;

    std::vector<std::string> keys() const;

    size_t size() const;

    uint64_t getWriteCount() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, json> documents_;
    uint64_t writeCount_ = 0;
};

}  // namespace CLE
