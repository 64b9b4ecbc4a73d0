// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/ContractErrors.h"
#include "common/TestUtils.h"
#include "parsing/ContractLoader.h"
#include "parsing/ContractParser.h"
#include <gtest/gtest.h>

using namespace CLE;
using CLE::Test::Utils::TempDirectory;

namespace {

const char *YAML_CONTRACT = R"(
name: yaml_node
node_type: COMPUTE_GENERIC
contract_version: "1.2.3"
actions:
  - action_name: note
    action_type: logging
    timeout_ms: 250
    config:
      level: info
      message: "00123"
states:
  - name: idle
    is_initial: true
    exit_actions: [note]
  - name: done
    is_terminal: true
transitions:
  - from_state: idle
    to_state: done
    event: finish
)";

const char *JSON_CONTRACT = R"({
  "node_type": "COMPUTE_GENERIC",
  "contract_version": "1.0.0",
  "states": [{"name": "idle", "is_initial": true}, {"name": "done", "is_terminal": true}],
  "transitions": [{"from_state": "idle", "to_state": "done", "event": "finish"}]
})";

}  // anonymous namespace

class ContractLoaderTest : public ::testing::Test {
protected:
    TempDirectory directory_;
};

TEST_F(ContractLoaderTest, LoadsYamlWithTypedScalars) {
    std::string path = directory_.write("yaml_node.yaml", YAML_CONTRACT);

    LoadedDocument loaded = ContractLoader().loadFile(path);

    EXPECT_EQ(loaded.path, path);
    EXPECT_EQ(loaded.document["name"], "yaml_node");
    EXPECT_TRUE(loaded.document["actions"][0]["timeout_ms"].is_number_integer());
    EXPECT_TRUE(loaded.document["states"][0]["is_initial"].is_boolean());
    EXPECT_EQ(loaded.document["actions"][0]["config"]["message"], "00123");

    auto contract = ContractParser::parse(loaded.document);
    EXPECT_EQ(contract->getVersion(), SemanticVersion(1, 2, 3));
    EXPECT_EQ(contract->findAction("note")->timeoutMs, 250);
}

TEST_F(ContractLoaderTest, JsonWithoutNameTakesFileStem) {
    std::string path = directory_.write("stem_named.json", JSON_CONTRACT);

    LoadedDocument loaded = ContractLoader().loadFile(path);
    EXPECT_EQ(loaded.document["name"], "stem_named");
}

TEST_F(ContractLoaderTest, RejectsOversizedFile) {
    std::string path = directory_.write("big.yaml", YAML_CONTRACT);

    try {
        ContractLoader(16).loadFile(path);
        FAIL() << "expected ContractLoadError";
    } catch (const ContractLoadError &e) {
        EXPECT_EQ(e.getPath(), path);
        EXPECT_NE(std::string(e.what()).find("exceeds limit of 16 bytes"), std::string::npos);
    }
}

TEST_F(ContractLoaderTest, RejectsUndecodableAndNonMappingFiles) {
    ContractLoader loader;
    EXPECT_THROW(loader.loadFile(directory_.write("broken.json", "{\"name\": ")), ContractLoadError);
    EXPECT_THROW(loader.loadFile(directory_.write("broken.yaml", "name: [unclosed")), ContractLoadError);
    EXPECT_THROW(loader.loadFile(directory_.write("list.yaml", "- a\n- b\n")), ContractLoadError);
    EXPECT_THROW(loader.loadFile(directory_.write("notes.txt", "name: x")), ContractLoadError);
    EXPECT_THROW(loader.loadFile(directory_.file("missing.yaml")), ContractLoadError);
}

TEST_F(ContractLoaderTest, ZeroSizeLimitIsRejected) {
    EXPECT_THROW(ContractLoader(0), std::invalid_argument);
}

TEST_F(ContractLoaderTest, DiscoverReturnsContractFilesInNameOrder) {
    directory_.write("b_node.yml", YAML_CONTRACT);
    directory_.write("a_node.json", JSON_CONTRACT);
    directory_.write("README.md", "not a contract");
    std::filesystem::create_directories(directory_.path() / "nested.yaml");

    auto documents = ContractLoader().discover(directory_.path().string());

    ASSERT_EQ(documents.size(), 2u);
    EXPECT_EQ(std::filesystem::path(documents[0].path).filename(), "a_node.json");
    EXPECT_EQ(std::filesystem::path(documents[1].path).filename(), "b_node.yml");
}

TEST_F(ContractLoaderTest, DiscoverFailsForMissingDirectory) {
    EXPECT_THROW(ContractLoader().discover(directory_.file("absent")), ContractLoadError);
}

TEST_F(ContractLoaderTest, CacheServesUnchangedFiles) {
    auto cache = std::make_shared<ContractLoaderCache>();
    ContractLoader loader(ContractLoader::DEFAULT_MAX_FILE_BYTES, cache);
    std::string path = directory_.write("cached.yaml", YAML_CONTRACT);

    loader.loadFile(path);
    loader.loadFile(path);

    auto stats = cache->getStatistics();
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.entries, 1u);

    EXPECT_TRUE(cache->invalidate(path));
    EXPECT_FALSE(cache->invalidate(path));
    loader.loadFile(path);

    stats = cache->getStatistics();
    EXPECT_EQ(stats.misses, 2u);
    EXPECT_EQ(stats.evictions, 1u);
}

TEST_F(ContractLoaderTest, CacheEvictsOnModificationTimeChange) {
    auto cache = std::make_shared<ContractLoaderCache>();
    ContractLoader loader(ContractLoader::DEFAULT_MAX_FILE_BYTES, cache);
    std::string path = directory_.write("changing.yaml", YAML_CONTRACT);
    loader.loadFile(path);

    auto modified = std::filesystem::last_write_time(path);
    std::filesystem::last_write_time(path, modified + std::chrono::seconds(5));
    loader.loadFile(path);

    auto stats = cache->getStatistics();
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 2u);
    EXPECT_EQ(stats.evictions, 1u);
}

TEST(ContractLoaderYamlTest, DecodeYamlMapsNullsAndQuotedNumbers) {
    json document = ContractLoader::decodeYaml("a: ~\nb: '42'\nc: 42\nd: 1.5\ne: false\n");

    EXPECT_TRUE(document["a"].is_null());
    EXPECT_EQ(document["b"], "42");
    EXPECT_EQ(document["c"], 42);
    EXPECT_DOUBLE_EQ(document["d"].get<double>(), 1.5);
    EXPECT_EQ(document["e"], false);
}
