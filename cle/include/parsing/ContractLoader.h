// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace CLE {

/**
 * @brief Raw contract document together with the file it came from
 */
struct LoadedDocument {
    std::string path;
    json document;
};

/**
 * @brief Opt-in cache of decoded documents keyed by path and modification time
 *
 * A file whose modification time changed is decoded again, so a cached entry
 * is never served stale.
 */
class ContractLoaderCache {
public:
    struct Statistics {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        size_t entries = 0;
    };

    /**
     * @brief Cached document for path if its modification time still matches
     */
    std::shared_ptr<const json> lookup(const std::string &path, std::filesystem::file_time_type modified);

    void store(const std::string &path, std::filesystem::file_time_type modified, std::shared_ptr<const json> doc);

    /**
     * @brief Drop one entry
     * @return true if an entry was removed
     */
    bool invalidate(const std::string &path);

    void clear();

    Statistics getStatistics() const;

private:
    struct Entry {
        std::filesystem::file_time_type modified;
        std::shared_ptr<const json> document;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    Statistics stats_;
};

/**
 * @brief Reads contract files from disk and decodes them into documents
 *
 * Supports .yaml/.yml (yaml-cpp) and .json (nlohmann). Structural validation
 * is ContractParser's job; the loader only guarantees a well-formed document.
 */
class ContractLoader {
public:
    static constexpr uintmax_t DEFAULT_MAX_FILE_BYTES = 1024 * 1024;

    explicit ContractLoader(uintmax_t maxFileBytes = DEFAULT_MAX_FILE_BYTES,
                            std::shared_ptr<ContractLoaderCache> cache = nullptr);

    /**
     * @brief Load one file
     *
     * A document without a "name" field is named after the file stem.
     *
     * @throws ContractLoadError when the file is missing, too large, has an
     *         unsupported extension or cannot be decoded
     */
    LoadedDocument loadFile(const std::string &path) const;

    /**
     * @brief Load every contract file directly inside directory, sorted by path
     * @throws ContractLoadError when the directory is missing or any file fails
     */
    std::vector<LoadedDocument> discover(const std::string &directory) const;

    /**
     * @brief Decode YAML text into the document representation
     * @throws ContractLoadError on YAML syntax errors
     */
    static json decodeYaml(const std::string &text, const std::string &origin = "<memory>");

    static bool isContractFile(const std::filesystem::path &path);

private:
    json decodeFile(const std::filesystem::path &path) const;

    uintmax_t maxFileBytes_;
    std::shared_ptr<ContractLoaderCache> cache_;
};

}  // namespace CLE
