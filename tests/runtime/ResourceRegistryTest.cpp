// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/ResourceRegistry.h"
#include "stores/InMemoryDocumentStore.h"
#include <gtest/gtest.h>

using namespace CLE;

TEST(ResourceRegistryTest, ReleaseRunsReleaserOnce) {
    ResourceRegistry registry;
    int released = 0;
    registry.add("channel/a", [&] {
        ++released;
        return true;
    });

    EXPECT_TRUE(registry.contains("channel/a"));
    EXPECT_TRUE(registry.release("channel/a"));
    EXPECT_TRUE(registry.release("channel/a"));
    EXPECT_EQ(released, 1);
    EXPECT_FALSE(registry.contains("channel/a"));
}

TEST(ResourceRegistryTest, ReleaseReportsReleaserFailure) {
    ResourceRegistry registry;
    registry.add("lock", [] { return false; });

    EXPECT_FALSE(registry.release("lock"));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(ResourceRegistryTest, ReleasePrefixReleasesMatchingInNameOrder) {
    ResourceRegistry registry;
    std::vector<std::string> order;
    auto track = [&order](const std::string &name) {
        return [&order, name] {
            order.push_back(name);
            return true;
        };
    };
    registry.add("subscription/b", track("subscription/b"));
    registry.add("subscription/a", track("subscription/a"));
    registry.add("timer/a", track("timer/a"));

    EXPECT_TRUE(registry.releasePrefix("subscription/"));

    EXPECT_EQ(order, std::vector<std::string>({"subscription/a", "subscription/b"}));
    EXPECT_EQ(registry.names(), std::vector<std::string>({"timer/a"}));
    EXPECT_TRUE(registry.releasePrefix("subscription/"));
}

TEST(ResourceRegistryTest, ReleaserMayTouchRegistry) {
    ResourceRegistry registry;
    registry.add("child", [] { return true; });
    registry.add("parent", [&registry] { return registry.release("child"); });

    EXPECT_TRUE(registry.release("parent"));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(InMemoryDocumentStoreTest, PutOverwritesAndPutIfAbsentDoesNot) {
    InMemoryDocumentStore store;

    EXPECT_TRUE(store.put("k", json{{"v", 1}}));
    EXPECT_TRUE(store.put("k", json{{"v", 2}}));
    EXPECT_FALSE(store.putIfAbsent("k", json{{"v", 3}}));
    EXPECT_TRUE(store.putIfAbsent("other", json{{"v", 4}}));

    ASSERT_TRUE(store.get("k").has_value());
    EXPECT_EQ((*store.get("k"))["v"], 2);
    EXPECT_FALSE(store.get("missing").has_value());
    EXPECT_EQ(store.keys(), std::vector<std::string>({"k", "other"}));
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.getWriteCount(), 3u);
}
