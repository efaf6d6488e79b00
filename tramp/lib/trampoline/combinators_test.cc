#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <trampoline/combinators.h>
#include <version/version.h>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using tramp::computation;
using tramp::now;
using tramp::later;
using testing::ElementsAre;

// a computation that records its name when the driver reaches it
template<typename T>
computation<T> effect(std::vector<std::string> &log, std::string name, T value) {
  return later([&log, name, value] {
    log.push_back(name);
    return now(value);
  });
}

TEST(Functor, Fmap) {
  auto c = tramp::fmap(now(20), [](int x) { return x + 1; });
  EXPECT_EQ(tramp::run(c), 21);
  auto s = tramp::fmap(later([] { return now(3); }), [](int x) { return std::string(x, '*'); });
  EXPECT_EQ(tramp::run(s), "***");
}

TEST(Applicative, ApAndLift2) {
  std::vector<std::string> log;
  computation<std::function<int(int)>> cf = effect<std::function<int(int)>>(log, "f", [](int x) { return x * 3; });
  auto c = tramp::ap(cf, effect(log, "a", 14));
  EXPECT_EQ(tramp::run(c), 42);
  EXPECT_THAT(log, ElementsAre("f", "a"));

  log.clear();
  auto sum = tramp::lift2([](int a, const std::string &b) { return b + std::to_string(a); },
                          effect(log, "x", 7), effect(log, "y", std::string("n=")));
  EXPECT_EQ(tramp::run(sum), "n=7");
  EXPECT_THAT(log, ElementsAre("x", "y"));
}

TEST(Applicative, ThenAndDiscardThenKeepEffectOrder) {
  std::vector<std::string> log;
  auto a = effect(log, "a", 1);
  auto b = effect(log, "b", std::string("two"));

  EXPECT_EQ(tramp::run(tramp::then(a, b)), "two");
  EXPECT_THAT(log, ElementsAre("a", "b"));

  log.clear();
  EXPECT_EQ(tramp::run(tramp::discard_then(a, b)), 1);
  EXPECT_THAT(log, ElementsAre("a", "b"));

  log.clear();
  EXPECT_EQ(tramp::run(a >> b >> a), 1);
  EXPECT_THAT(log, ElementsAre("a", "b", "a"));

  log.clear();
  EXPECT_EQ(tramp::run(tramp::replace(std::string("done"), a)), "done");
  EXPECT_THAT(log, ElementsAre("a"));
}

TEST(Sequence, CollectsInInputOrder) {
  auto t1 = now(1);
  auto t2 = later([] { return now(2); });
  auto t3 = tramp::fmap(now(1), [](int x) { return x + 2; });
  auto all = tramp::sequence(std::vector{t1, t2, t3});
  EXPECT_THAT(tramp::run(all), ElementsAre(tramp::run(t1), tramp::run(t2), tramp::run(t3)));
}

TEST(Sequence, EffectsFollowListOrder) {
  std::vector<std::string> log;
  auto all = tramp::sequence(std::vector{effect(log, "t1", 'a'), effect(log, "t2", 'b'), effect(log, "t3", 'c')});
  EXPECT_TRUE(log.empty());
  EXPECT_THAT(tramp::run(all), ElementsAre('a', 'b', 'c'));
  EXPECT_THAT(log, ElementsAre("t1", "t2", "t3"));
}

TEST(Sequence, Empty) {
  EXPECT_TRUE(tramp::run(tramp::sequence(std::vector<computation<int>>{})).empty());
  EXPECT_EQ(tramp::run(tramp::sequence_(std::vector<computation<int>>{})), tramp::unit{});
}

TEST(Sequence, EachRunCollectsAfresh) {
  int counter = 0;
  auto tick = later([&counter] { return now(++counter); });
  auto all = tramp::sequence(std::vector{tick, tick});
  EXPECT_THAT(tramp::run(all), ElementsAre(1, 2));
  EXPECT_THAT(tramp::run(all), ElementsAre(3, 4));
}

TEST(Sequence, LongListIsStackSafe) {
  std::vector<computation<int>> ts;
  for (int i = 0; i < 200000; ++i)ts.push_back(i % 2 ? now(i) : later([i] { return now(i); }));
  std::vector<int> result = tramp::run(tramp::sequence(ts));
  ASSERT_EQ(result.size(), 200000);
  EXPECT_EQ(result.front(), 0);
  EXPECT_EQ(result[12345], 12345);
  EXPECT_EQ(result.back(), 199999);
}

TEST(Sequence, DiscardingResultsKeepsEffects) {
  std::vector<std::string> log;
  auto all = tramp::sequence_(std::vector{effect(log, "x", 1), effect(log, "y", 2)});
  EXPECT_EQ(tramp::run(all), tramp::unit{});
  EXPECT_THAT(log, ElementsAre("x", "y"));
}

TEST(Traverse, MapMAppliesInOrderWhenReached) {
  std::vector<std::string> log;
  auto f = [&log](int x) {
    log.push_back("apply " + std::to_string(x));
    return effect(log, "run " + std::to_string(x), x * x);
  };
  auto squares = tramp::map_m(f, std::vector{1, 2, 3});
  EXPECT_TRUE(log.empty());
  EXPECT_THAT(tramp::run(squares), ElementsAre(1, 4, 9));
  EXPECT_THAT(log, ElementsAre("apply 1", "run 1", "apply 2", "run 2", "apply 3", "run 3"));
}

TEST(Traverse, ForMIsFlippedMapM) {
  auto lengths = tramp::for_m(std::vector<std::string>{"a", "bcd", ""}, [](const std::string &s) {
    return now(s.size());
  });
  EXPECT_THAT(tramp::run(lengths), ElementsAre(1, 3, 0));

  std::vector<std::string> log;
  auto all = tramp::for_m_(std::vector<std::string>{"p", "q"}, [&log](const std::string &s) {
    return effect(log, s, 0);
  });
  EXPECT_EQ(tramp::run(all), tramp::unit{});
  EXPECT_THAT(log, ElementsAre("p", "q"));
}

TEST(Traverse, FailureStopsTheTraversal) {
  std::vector<int> visited;
  auto all = tramp::map_m([&visited](int x) -> computation<int> {
    visited.push_back(x);
    if (x == 3)throw std::out_of_range("three");
    return now(x);
  }, std::vector{1, 2, 3, 4, 5});
  EXPECT_THROW(tramp::run(all), std::out_of_range);
  EXPECT_THAT(visited, ElementsAre(1, 2, 3));
}

TEST(Collaborators, VersionsThroughCombinators) {
  auto releases = tramp::map_m([](int minor) {
    return now(version::t({1, minor}, {"stable"}));
  }, std::vector{0, 1, 2});
  auto rendered = tramp::fmap(releases, [](const std::vector<version::t> &vs) {
    std::string out;
    for (const auto &v : vs)out += v.to_string() + " ";
    return out;
  });
  EXPECT_EQ(tramp::run(rendered), "1.0-stable 1.1-stable 1.2-stable ");
  auto bumped = tramp::bind(now(version::t({2, 0}, {"rc1", "beta"})), [](const version::t &v) {
    return now(version::t({v.branch[0] + 1, 0}, v.tags));
  });
  EXPECT_EQ(tramp::run(bumped), version::t({3, 0}, {"beta", "rc1"}));
}

}
