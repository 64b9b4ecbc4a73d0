// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "parsing/ContractLoader.h"
#include "common/ContractErrors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace CLE {

namespace {

std::string lowerExtension(const std::filesystem::path &path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool isYamlExtension(const std::string &ext) {
    return ext == ".yaml" || ext == ".yml";
}

json scalarToJson(const YAML::Node &node) {
    // Quoted scalars carry the non-specific "!" tag and always stay strings
    if (node.Tag() == "!") {
        return node.Scalar();
    }

    int64_t integer = 0;
    if (YAML::convert<int64_t>::decode(node, integer)) {
        return integer;
    }
    double number = 0.0;
    if (YAML::convert<double>::decode(node, number)) {
        return number;
    }
    bool flag = false;
    if (YAML::convert<bool>::decode(node, flag)) {
        return flag;
    }
    return node.Scalar();
}

json yamlToJson(const YAML::Node &node) {
    switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
        return nullptr;
    case YAML::NodeType::Scalar:
        return scalarToJson(node);
    case YAML::NodeType::Sequence: {
        json array = json::array();
        for (const auto &item : node) {
            array.push_back(yamlToJson(item));
        }
        return array;
    }
    case YAML::NodeType::Map: {
        json object = json::object();
        for (const auto &entry : node) {
            object[entry.first.as<std::string>()] = yamlToJson(entry.second);
        }
        return object;
    }
    }
    return nullptr;
}

}  // namespace

std::shared_ptr<const json> ContractLoaderCache::lookup(const std::string &path,
                                                        std::filesystem::file_time_type modified) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(path);
    if (it == entries_.end()) {
        ++stats_.misses;
        return nullptr;
    }
    if (it->second.modified != modified) {
        entries_.erase(it);
        ++stats_.evictions;
        ++stats_.misses;
        return nullptr;
    }
    ++stats_.hits;
    return it->second.document;
}

void ContractLoaderCache::store(const std::string &path, std::filesystem::file_time_type modified,
                                std::shared_ptr<const json> doc) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[path] = Entry{modified, std::move(doc)};
}

bool ContractLoaderCache::invalidate(const std::string &path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(path) > 0) {
        ++stats_.evictions;
        return true;
    }
    return false;
}

void ContractLoaderCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.evictions += entries_.size();
    entries_.clear();
}

ContractLoaderCache::Statistics ContractLoaderCache::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statistics stats = stats_;
    stats.entries = entries_.size();
    return stats;
}

ContractLoader::ContractLoader(uintmax_t maxFileBytes, std::shared_ptr<ContractLoaderCache> cache)
    : maxFileBytes_(maxFileBytes), cache_(std::move(cache)) {
    if (maxFileBytes_ == 0) {
        throw std::invalid_argument("ContractLoader: maxFileBytes must be greater than zero");
    }
}

bool ContractLoader::isContractFile(const std::filesystem::path &path) {
    std::string ext = lowerExtension(path);
    return isYamlExtension(ext) || ext == ".json";
}

json ContractLoader::decodeYaml(const std::string &text, const std::string &origin) {
    try {
        return yamlToJson(YAML::Load(text));
    } catch (const YAML::Exception &e) {
        throw ContractLoadError(origin, std::string("YAML parse error: ") + e.what());
    }
}

json ContractLoader::decodeFile(const std::filesystem::path &path) const {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ContractLoadError(path.string(), "cannot open file");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    const std::string text = buffer.str();

    if (isYamlExtension(lowerExtension(path))) {
        return decodeYaml(text, path.string());
    }

    std::string error;
    auto document = JsonUtils::parseJson(text, &error);
    if (!document) {
        throw ContractLoadError(path.string(), "JSON parse error: " + error);
    }
    return *document;
}

LoadedDocument ContractLoader::loadFile(const std::string &path) const {
    std::filesystem::path filePath(path);
    std::error_code ec;

    if (!std::filesystem::is_regular_file(filePath, ec)) {
        throw ContractLoadError(path, "not a regular file");
    }
    if (!isContractFile(filePath)) {
        throw ContractLoadError(path, "unsupported extension '" + filePath.extension().string() + "'");
    }

    uintmax_t size = std::filesystem::file_size(filePath, ec);
    if (ec) {
        throw ContractLoadError(path, "cannot stat file: " + ec.message());
    }
    if (size > maxFileBytes_) {
        throw ContractLoadError(path, "file size " + std::to_string(size) + " exceeds limit of " +
                                          std::to_string(maxFileBytes_) + " bytes");
    }

    auto modified = std::filesystem::last_write_time(filePath, ec);
    if (cache_ && !ec) {
        if (auto cached = cache_->lookup(path, modified)) {
            LOG_DEBUG("ContractLoader: Cache hit for {}", path);
            return LoadedDocument{path, *cached};
        }
    }

    json document = decodeFile(filePath);
    if (!document.is_object()) {
        throw ContractLoadError(path, "top-level value must be a mapping");
    }
    if (!JsonUtils::hasKey(document, "name")) {
        document["name"] = filePath.stem().string();
    }

    if (cache_ && !ec) {
        cache_->store(path, modified, std::make_shared<const json>(document));
    }

    LOG_DEBUG("ContractLoader: Loaded {} ({} bytes)", path, size);
    return LoadedDocument{path, std::move(document)};
}

std::vector<LoadedDocument> ContractLoader::discover(const std::string &directory) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        throw ContractLoadError(directory, "contract directory does not exist");
    }

    std::vector<std::filesystem::path> files;
    for (const auto &entry : std::filesystem::directory_iterator(directory, ec)) {
        if (entry.is_regular_file() && isContractFile(entry.path())) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        throw ContractLoadError(directory, "cannot list directory: " + ec.message());
    }
    std::sort(files.begin(), files.end());

    std::vector<LoadedDocument> documents;
    documents.reserve(files.size());
    for (const auto &file : files) {
        documents.push_back(loadFile(file.string()));
    }

    LOG_INFO("ContractLoader: Discovered {} contract(s) in {}", documents.size(), directory);
    return documents;
}

}  // namespace CLE
