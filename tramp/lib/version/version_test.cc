#include <gtest/gtest.h>
#include <version/version.h>
#include <sstream>

namespace {

TEST(Version, Print) {
  EXPECT_EQ(version::t({1, 2, 3}).to_string(), "1.2.3");
  EXPECT_EQ(version::t({1, 2, 3}, {"beta", "rc1"}).to_string(), "1.2.3-beta-rc1");
  EXPECT_EQ(version::t({10}, {"x86_64"}).to_string(), "10-x86_64");
  EXPECT_EQ(version::t({}, {"nightly"}).to_string(), "-nightly");
  EXPECT_EQ(version::t(std::vector<int>{}).to_string(), "");
  std::stringstream s;
  s << version::t({0, 9});
  EXPECT_EQ(s.str(), "0.9");
}

TEST(Version, TagsAreUnordered) {
  EXPECT_EQ(version::t({1, 0}, {"a", "b"}), version::t({1, 0}, {"b", "a"}));
  EXPECT_NE(version::t({1, 0}, {"a", "b"}), version::t({1, 0}, {"a"}));
  EXPECT_NE(version::t({1, 0}, {"a", "a"}), version::t({1, 0}, {"a", "b"}));
}

TEST(Version, BranchIsOrdered) {
  EXPECT_EQ(version::t({1, 2}), version::t({1, 2}));
  EXPECT_NE(version::t({1, 2}), version::t({2, 1}));
  EXPECT_NE(version::t({1, 2}), version::t({1, 2, 0}));
}

}
