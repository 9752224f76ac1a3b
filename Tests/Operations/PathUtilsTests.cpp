#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "Operations/PathUtils.h"

using namespace Stevedore::Core::Operations;

TEST(PathUtils, Prefixes_ShortestFirst) {
    EXPECT_EQ(PathUtils::prefixes("a/b/c"), (std::vector<std::string>{"a", "a/b", "a/b/c"}));
    EXPECT_EQ(PathUtils::prefixes("/tmp/x"), (std::vector<std::string>{"/tmp", "/tmp/x"}));
    EXPECT_EQ(PathUtils::prefixes("a//b/"), (std::vector<std::string>{"a", "a/b"}));
    EXPECT_TRUE(PathUtils::prefixes("").empty());
}

TEST(PathUtils, TrimTrailingSeparators_KeepsLoneRoot) {
    EXPECT_EQ(PathUtils::trimTrailingSeparators("a/b//"), "a/b");
    EXPECT_EQ(PathUtils::trimTrailingSeparators("/"), "/");
    EXPECT_EQ(PathUtils::trimTrailingSeparators(""), "");
}

TEST(PathUtils, TranslatePath_RebasesUnderDestination) {
    EXPECT_EQ(PathUtils::translatePath("src/a/f", "src", "dst"), std::optional<std::string>("dst/a/f"));
    EXPECT_EQ(PathUtils::translatePath("src", "src/", "dst"), std::optional<std::string>("dst"));
    EXPECT_EQ(PathUtils::translatePath("src/a", "src", ""), std::optional<std::string>("a"));
    EXPECT_EQ(PathUtils::translatePath("a/b", "", "out"), std::optional<std::string>("out/a/b"));
    EXPECT_EQ(PathUtils::translatePath("/data/x", "/data", "/"), std::optional<std::string>("/x"));
}

TEST(PathUtils, TranslatePath_RejectsPathsOutsideRoot) {
    EXPECT_FALSE(PathUtils::translatePath("other/f", "src", "dst").has_value());
    // Shared prefix without a separator is not containment
    EXPECT_FALSE(PathUtils::translatePath("srcfoo/f", "src", "dst").has_value());
}

TEST(PathUtils, IsSameOrAncestor_ComponentWise) {
    EXPECT_TRUE(PathUtils::isSameOrAncestor("a", "a/b"));
    EXPECT_TRUE(PathUtils::isSameOrAncestor("a/b", "a/b/"));
    EXPECT_TRUE(PathUtils::isSameOrAncestor("", "anything"));
    EXPECT_TRUE(PathUtils::isSameOrAncestor("/", "/tmp"));
    EXPECT_FALSE(PathUtils::isSameOrAncestor("a/b", "a"));
    EXPECT_FALSE(PathUtils::isSameOrAncestor("ab", "abc/d"));
}
