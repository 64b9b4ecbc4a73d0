// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/SemanticVersion.h"
#include <gtest/gtest.h>

using namespace CLE;

TEST(SemanticVersionTest, ParsesWellFormedVersion) {
    auto version = SemanticVersion::parse("1.12.3");
    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(version->major, 1u);
    EXPECT_EQ(version->minor, 12u);
    EXPECT_EQ(version->patch, 3u);
    EXPECT_EQ(version->toString(), "1.12.3");
}

TEST(SemanticVersionTest, RejectsMalformedVersions) {
    for (const char *text : {"", "1", "1.2", "1.2.3.4", "-1.2.3", "+1.2.3", "1.2.3-beta", "a.b.c", "1..3", " 1.2.3",
                             "1.2.3 ", "1234567890.0.0"}) {
        EXPECT_FALSE(SemanticVersion::parse(text).has_value()) << "accepted '" << text << "'";
    }
}

TEST(SemanticVersionTest, RejectsLeadingZeros) {
    for (const char *text : {"01.0.0", "1.00.0", "1.0.007"}) {
        EXPECT_FALSE(SemanticVersion::parse(text).has_value()) << "accepted '" << text << "'";
    }
    ASSERT_TRUE(SemanticVersion::parse("0.10.0").has_value());
    EXPECT_EQ(*SemanticVersion::parse("0.10.0"), SemanticVersion(0, 10, 0));
}

TEST(SemanticVersionTest, FromDocumentAcceptsStringAndObject) {
    auto fromString = SemanticVersion::fromDocument(json("2.0.1"));
    auto fromObject = SemanticVersion::fromDocument(json{{"major", 2}, {"minor", 0}, {"patch", 1}});
    ASSERT_TRUE(fromString.has_value());
    ASSERT_TRUE(fromObject.has_value());
    EXPECT_EQ(*fromString, *fromObject);
    EXPECT_EQ(fromObject->toJson(), (json{{"major", 2}, {"minor", 0}, {"patch", 1}}));
}

TEST(SemanticVersionTest, FromDocumentRejectsIncompleteOrNegativeObjects) {
    EXPECT_FALSE(SemanticVersion::fromDocument(json{{"major", 1}, {"minor", 0}}).has_value());
    EXPECT_FALSE(SemanticVersion::fromDocument(json{{"major", -1}, {"minor", 0}, {"patch", 0}}).has_value());
    EXPECT_FALSE(SemanticVersion::fromDocument(json{{"major", "1"}, {"minor", 0}, {"patch", 0}}).has_value());
    EXPECT_FALSE(SemanticVersion::fromDocument(json(1)).has_value());
}

TEST(SemanticVersionTest, CompatibilityRequiresSameMajorAndNotOlder) {
    const SemanticVersion loaded(1, 4, 2);
    EXPECT_TRUE(loaded.isCompatibleWith(SemanticVersion(1, 0, 0)));
    EXPECT_TRUE(loaded.isCompatibleWith(SemanticVersion(1, 4, 2)));
    EXPECT_FALSE(loaded.isCompatibleWith(SemanticVersion(1, 5, 0)));
    EXPECT_FALSE(loaded.isCompatibleWith(SemanticVersion(2, 0, 0)));
    EXPECT_FALSE(SemanticVersion(2, 0, 0).isCompatibleWith(SemanticVersion(1, 9, 9)));
}

TEST(SemanticVersionTest, OrderingIsLexicographicByComponent) {
    EXPECT_LT(SemanticVersion(1, 2, 3), SemanticVersion(1, 10, 0));
    EXPECT_LT(SemanticVersion(0, 9, 9), SemanticVersion(1, 0, 0));
    EXPECT_GT(SemanticVersion(1, 0, 1), SemanticVersion(1, 0, 0));
}
