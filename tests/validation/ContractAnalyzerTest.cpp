// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/TestContracts.h"
#include "parsing/ContractParser.h"
#include "validation/ContractAnalyzer.h"
#include <gtest/gtest.h>

using namespace CLE;
namespace Contracts = CLE::Test::Contracts;

TEST(ContractAnalyzerTest, WellFormedContractIsClean) {
    auto result = ContractAnalyzer::analyze(*ContractParser::parse(Contracts::lifecycleNode()));

    EXPECT_EQ(result.contractName, "scenario_node");
    EXPECT_TRUE(result.isClean());
    EXPECT_TRUE(result.describe().empty());
}

TEST(ContractAnalyzerTest, WildcardsCountAsOutgoingEdges) {
    json document = Contracts::lifecycleNode();
    // running only leaves through the wildcard
    document["transitions"].erase(2);

    EXPECT_TRUE(ContractAnalyzer::analyze(*ContractParser::parse(document)).isClean());
}

TEST(ContractAnalyzerTest, ReportsUnreachableDeadEndAndTrappedStates) {
    json document{{"name", "messy_node"},
                  {"node_type", "COMPUTE_GENERIC"},
                  {"contract_version", "1.0.0"},
                  {"states",
                   json::array({json{{"name", "start"}, {"is_initial", true}}, json{{"name", "stuck"}},
                                json{{"name", "loop_a"}}, json{{"name", "loop_b"}}, json{{"name", "orphan"}},
                                json{{"name", "end"}, {"is_terminal", true}}})},
                  {"transitions",
                   json::array({Contracts::transition("start", "stuck", "wedge"),
                                Contracts::transition("start", "loop_a", "spin"),
                                Contracts::transition("loop_a", "loop_b", "next"),
                                Contracts::transition("loop_b", "loop_a", "back"),
                                Contracts::transition("start", "end", "finish"),
                                Contracts::transition("orphan", "end", "finish")})}};

    auto result = ContractAnalyzer::analyze(*ContractParser::parse(document));

    EXPECT_FALSE(result.isClean());
    EXPECT_EQ(result.unreachableStates, std::vector<std::string>({"orphan"}));
    EXPECT_EQ(result.deadEndStates, std::vector<std::string>({"stuck"}));
    EXPECT_EQ(result.trappedStates, std::vector<std::string>({"loop_a", "loop_b"}));

    auto lines = result.describe();
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "state 'orphan' is unreachable from the initial state");
    EXPECT_EQ(lines[1], "non-terminal state 'stuck' has no outgoing transition");
    EXPECT_EQ(lines[2], "state 'loop_a' cannot reach any terminal state");
}
