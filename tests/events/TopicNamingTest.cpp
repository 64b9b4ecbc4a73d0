// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "events/TopicNaming.h"
#include <gtest/gtest.h>

using namespace CLE;

TEST(TopicNamingTest, MakeTopicNormalizesSegments) {
    EXPECT_EQ(TopicNaming::makeTopic(TopicKind::Event, "Node_Graph", "graph running", 2),
              "onex.evt.node-graph.graph-running.v2");
    EXPECT_EQ(TopicNaming::makeTopic(TopicKind::Command, "runtime", "shutdown.now"),
              "onex.cmd.runtime.shutdown-now.v1");
}

TEST(TopicNamingTest, KindOfRecognizesEventsAndCommands) {
    EXPECT_EQ(TopicNaming::kindOf("onex.evt.runtime.ready.v1"), TopicKind::Event);
    EXPECT_EQ(TopicNaming::kindOf("onex.cmd.contract-loader.reload.v12"), TopicKind::Command);
}

TEST(TopicNamingTest, RejectsOffConventionTopics) {
    for (const char *topic :
         {"", "onex.evt.runtime.ready", "onex.evt.runtime.ready.v1.extra", "acme.evt.runtime.ready.v1",
          "onex.msg.runtime.ready.v1", "onex.evt.Runtime.ready.v1", "onex.evt.run_time.ready.v1", "onex.evt..ready.v1",
          "onex.evt.runtime.ready.1", "onex.evt.runtime.ready.v", "onex.evt.runtime.ready.v1a"}) {
        EXPECT_FALSE(TopicNaming::isValid(topic)) << "accepted '" << topic << "'";
    }
}

TEST(TopicNamingTest, GeneratedTopicsAreValid) {
    EXPECT_TRUE(TopicNaming::isValid(TopicNaming::makeTopic(TopicKind::Event, "Contract Registry", "REGISTRY_READY")));
}
