// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/ContractErrors.h"
#include "common/TestContracts.h"
#include "orchestration/ContractRegistry.h"
#include "parsing/ContractParser.h"
#include <gtest/gtest.h>

using namespace CLE;
namespace Contracts = CLE::Test::Contracts;

namespace {

LoadedDocument loaded(const std::string &path, json document) {
    return LoadedDocument{path, std::move(document)};
}

// Has a trapped pair of states; valid but not clean
json trappedNode(const std::string &name) {
    json document = Contracts::simpleNode(name);
    document["states"].push_back(json{{"name", "spin_a"}});
    document["states"].push_back(json{{"name", "spin_b"}});
    document["transitions"].push_back(Contracts::transition("idle", "spin_a", "spin"));
    document["transitions"].push_back(Contracts::transition("spin_a", "spin_b", "next"));
    document["transitions"].push_back(Contracts::transition("spin_b", "spin_a", "next"));
    return document;
}

}  // anonymous namespace

TEST(ContractRegistryTest, ValidateAllRegistersEveryValidDocument) {
    ContractRegistry registry;

    ValidationReport report = registry.validateAll(
        {loaded("b.yaml", Contracts::simpleNode("beta")), loaded("a.yaml", Contracts::simpleNode("alpha"))});

    EXPECT_TRUE(report.isValid());
    EXPECT_EQ(report.registered, std::vector<std::string>({"beta", "alpha"}));
    EXPECT_EQ(registry.names(), std::vector<std::string>({"alpha", "beta"}));
    EXPECT_EQ(registry.originOf("alpha"), "a.yaml");
    EXPECT_EQ(registry.contracts().front()->getName(), "alpha");
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(report.firstError(), "");
}

TEST(ContractRegistryTest, ValidateAllCollectsEveryFailure) {
    ContractRegistry registry;
    json undeclared = Contracts::lifecycleNode("broken_node");
    undeclared["transitions"].push_back(Contracts::transition("running", "z", "jump"));
    json badVersion = Contracts::simpleNode("versionless", "one");

    ValidationReport report = registry.validateAll({loaded("ok.yaml", Contracts::simpleNode("fine")),
                                                    loaded("broken.yaml", undeclared),
                                                    loaded("version.yaml", badVersion)});

    EXPECT_FALSE(report.isValid());
    EXPECT_EQ(report.registered, std::vector<std::string>({"fine"}));
    ASSERT_EQ(report.failures.size(), 2u);
    EXPECT_EQ(report.failures[0].path, "broken.yaml");
    EXPECT_EQ(report.failures[0].contractName, "broken_node");
    EXPECT_EQ(report.failures[0].fieldPath, "transitions[4].to_state");
    EXPECT_EQ(report.failures[0].message, "unknown state 'z'");
    EXPECT_EQ(report.failures[1].fieldPath, "contract_version");
    EXPECT_EQ(report.firstError(),
              "contract 'broken_node' (broken.yaml) at transitions[4].to_state: unknown state 'z'");
    EXPECT_FALSE(registry.find("broken_node"));

    json summary = report.toJson();
    EXPECT_EQ(summary["valid"], false);
    EXPECT_EQ(summary["failures"].size(), 2u);
}

TEST(ContractRegistryTest, DuplicateNameInBatchIsRejected) {
    ContractRegistry registry;

    ValidationReport report = registry.validateAll({loaded("first.yaml", Contracts::simpleNode("twin")),
                                                    loaded("second.yaml", Contracts::simpleNode("twin", "2.0.0"))});

    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].path, "second.yaml");
    EXPECT_EQ(report.failures[0].fieldPath, "name");
    EXPECT_EQ(registry.find("twin")->getVersion(), SemanticVersion(1, 0, 0));
}

TEST(ContractRegistryTest, AnalysisFindingsWarnUnlessStrict) {
    ContractRegistry lenient;
    ValidationReport lenientReport = lenient.validateAll({loaded("t.yaml", trappedNode("trapped"))});
    EXPECT_TRUE(lenientReport.isValid());
    ASSERT_EQ(lenientReport.findings.size(), 1u);
    EXPECT_EQ(lenientReport.findings[0].trappedStates, std::vector<std::string>({"spin_a", "spin_b"}));

    ContractRegistry strict(true);
    EXPECT_TRUE(strict.isStrict());
    ValidationReport strictReport = strict.validateAll({loaded("t.yaml", trappedNode("trapped"))});
    ASSERT_EQ(strictReport.failures.size(), 1u);
    EXPECT_EQ(strictReport.failures[0].fieldPath, "states");
    EXPECT_EQ(strictReport.failures[0].message, "state 'spin_a' cannot reach any terminal state");
    EXPECT_EQ(strict.size(), 0u);
}

TEST(ContractRegistryTest, RequireChecksPresenceAndCompatibility) {
    ContractRegistry registry;
    registry.registerContract(ContractParser::parse(Contracts::simpleNode("store", "1.4.0")));

    EXPECT_EQ(registry.require("store", SemanticVersion(1, 2, 0))->getName(), "store");
    EXPECT_EQ(registry.originOf("store"), "<memory>");
    EXPECT_THROW(registry.require("missing", SemanticVersion(1, 0, 0)), DependencyError);

    try {
        registry.require("store", SemanticVersion(2, 0, 0));
        FAIL() << "expected VersionMismatchError";
    } catch (const VersionMismatchError &e) {
        EXPECT_EQ(e.getRequired(), "2.0.0");
        EXPECT_EQ(e.getLoaded(), "1.4.0");
    }
}

TEST(ContractRegistryTest, RegisterReplacesSameName) {
    ContractRegistry registry;
    registry.registerContract(ContractParser::parse(Contracts::simpleNode("store", "1.0.0")));
    registry.registerDocument(loaded("store.yaml", Contracts::simpleNode("store", "1.1.0")));

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find("store")->getVersion(), SemanticVersion(1, 1, 0));
    EXPECT_EQ(registry.originOf("store"), "store.yaml");
    EXPECT_THROW(registry.registerContract(nullptr), std::invalid_argument);
}
