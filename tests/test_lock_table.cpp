#include <gtest/gtest.h>
#include "authority.hpp"
#include "errors.hpp"
#include "lock_table.hpp"
#include <atomic>
#include <chrono>
#include <regex>
#include <set>
#include <thread>
#include <yaml-cpp/yaml.h>

using namespace locksmith;
using namespace std::chrono_literals;

class LockTableTest : public ::testing::Test {
protected:
  LockTable table;
};

TEST_F(LockTableTest, GrantsFreeName) {
  auto uid = table.acquire("foo", 60, 0.0);
  ASSERT_TRUE(uid.has_value());
  EXPECT_FALSE(table.acquire("foo", 60, 0.0).has_value());
  EXPECT_TRUE(table.acquire("bar", 60, 0.0).has_value());
}

TEST(LockTableClock, DurationsRoundUp) {
  using std::chrono::steady_clock;
  EXPECT_GT(to_clock_duration(1e-12), steady_clock::duration::zero());
  EXPECT_GE(to_clock_duration(1e-12), steady_clock::duration(1));
  EXPECT_EQ(to_clock_duration(1.5), std::chrono::milliseconds(1500));
  EXPECT_EQ(to_clock_duration(0), steady_clock::duration::zero());
}

TEST_F(LockTableTest, TinyValidityStillGrants) {
  auto uid = table.acquire("foo", 1e-12, 0.0);
  ASSERT_TRUE(uid.has_value());
  EXPECT_EQ(table.statistics().acquired, 1u);
}

TEST_F(LockTableTest, UidsAreVersion4Uuids) {
  auto uid = table.acquire("foo", 60, 0.0);
  ASSERT_TRUE(uid.has_value());
  std::regex uuid4(
      "[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}");
  EXPECT_TRUE(std::regex_match(*uid, uuid4)) << *uid;
}

TEST_F(LockTableTest, RepeatedGrantsOfOneNameGetFreshUids) {
  std::set<std::string> seen;
  for (int i = 0; i < 500; ++i) {
    auto uid = table.acquire("foo", 60, 0.0);
    ASSERT_TRUE(uid.has_value());
    EXPECT_TRUE(seen.insert(*uid).second);
    ASSERT_TRUE(table.release(*uid));
  }
}

TEST_F(LockTableTest, ReleaseOnlyOnce) {
  auto uid = table.acquire("foo", 60, 0.0);
  ASSERT_TRUE(uid.has_value());
  EXPECT_TRUE(table.release(*uid));
  EXPECT_FALSE(table.release(*uid));
  EXPECT_FALSE(table.release("unknown"));
  EXPECT_TRUE(table.acquire("foo", 60, 0.0).has_value());
}

TEST_F(LockTableTest, ExpiredLeaseFreesName) {
  auto first = table.acquire("foo", 0.1, 0.0);
  ASSERT_TRUE(first.has_value());
  std::this_thread::sleep_for(200ms);

  EXPECT_FALSE(table.update(*first, 60));
  auto second = table.acquire("foo", 60, 0.0);
  ASSERT_TRUE(second.has_value());
  EXPECT_NE(*first, *second);
  EXPECT_FALSE(table.release(*first));
}

TEST_F(LockTableTest, UpdateRestartsValidityWindow) {
  auto uid = table.acquire("foo", 0.3, 0.0);
  ASSERT_TRUE(uid.has_value());
  std::this_thread::sleep_for(200ms);
  EXPECT_TRUE(table.update(*uid, 0.5));
  std::this_thread::sleep_for(200ms);

  // 0.4s since acquire: only the update keeps it alive.
  EXPECT_FALSE(table.acquire("foo", 60, 0.0).has_value());
  EXPECT_TRUE(table.release(*uid));
  EXPECT_FALSE(table.update(*uid, 1));
}

TEST_F(LockTableTest, BoundedAcquireGivesUp) {
  ASSERT_TRUE(table.acquire("foo", 60, 0.0).has_value());
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(table.acquire("foo", 60, 0.2).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - start, 200ms);
}

TEST_F(LockTableTest, BoundedAcquireWakesOnRelease) {
  auto held = table.acquire("foo", 60, 0.0);
  ASSERT_TRUE(held.has_value());

  std::thread releaser([&] {
    std::this_thread::sleep_for(100ms);
    table.release(*held);
  });
  auto start = std::chrono::steady_clock::now();
  auto uid = table.acquire("foo", 60, 5.0);
  auto waited = std::chrono::steady_clock::now() - start;
  releaser.join();

  ASSERT_TRUE(uid.has_value());
  EXPECT_NE(*uid, *held);
  EXPECT_LT(waited, 2s);
}

TEST_F(LockTableTest, UnboundedAcquireWaitsForExpiry) {
  ASSERT_TRUE(table.acquire("foo", 0.2, 0.0).has_value());
  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(table.acquire("foo", 60, std::nullopt).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - start, 150ms);
}

TEST_F(LockTableTest, ShutdownFailsBlockedAcquire) {
  ASSERT_TRUE(table.acquire("foo", 60, 0.0).has_value());

  std::atomic<bool> returned{false};
  std::optional<std::string> result = std::string("unset");
  std::thread waiter([&] {
    result = table.acquire("foo", 60, std::nullopt);
    returned = true;
  });
  std::this_thread::sleep_for(100ms);
  EXPECT_FALSE(returned.load());

  table.shutdown();
  waiter.join();
  EXPECT_FALSE(result.has_value());
}

TEST_F(LockTableTest, StatisticsCountOperations) {
  auto a = table.acquire("a", 60, 0.0);
  auto b = table.acquire("b", 0.05, 0.0);
  ASSERT_TRUE(a && b);
  EXPECT_FALSE(table.acquire("a", 60, 0.0).has_value());
  EXPECT_TRUE(table.update(*a, 60));
  std::this_thread::sleep_for(100ms);
  EXPECT_TRUE(table.release(*a));

  LockStatistics stats = table.statistics();
  EXPECT_EQ(stats.active, 0u);
  EXPECT_EQ(stats.waiting, 0u);
  EXPECT_EQ(stats.acquired, 2u);
  EXPECT_EQ(stats.failed, 1u);
  EXPECT_EQ(stats.updated, 1u);
  EXPECT_EQ(stats.released, 1u);
  EXPECT_EQ(stats.expired, 1u);
}

TEST(AuthorityTest, AcquireReplyShapes) {
  Authority authority;
  Protocol::Reply granted =
      authority.handle({"locksmith:acquire", {"foo", "60"}});
  ASSERT_EQ(granted.tuples.size(), 1u);
  ASSERT_EQ(granted.tuples[0].size(), 3u);
  ASSERT_TRUE(granted.tuples[0][0].has_value());
  EXPECT_EQ(granted.tuples[0][1], Protocol::Field("foo"));
  EXPECT_EQ(granted.tuples[0][0], granted.tuples[0][2]);

  Protocol::Reply denied =
      authority.handle({"locksmith:acquire", {"foo", "60", "0"}});
  ASSERT_EQ(denied.tuples.size(), 1u);
  EXPECT_FALSE(denied.tuples[0][0].has_value());

  Protocol::Reply released =
      authority.handle({"locksmith:release", {*granted.tuples[0][2]}});
  EXPECT_EQ(released.tuples[0][0], granted.tuples[0][2]);
}

TEST(AuthorityTest, RejectsBadCalls) {
  Authority authority;
  EXPECT_THROW(authority.handle({"locksmith:explode", {}}), RemoteError);
  EXPECT_THROW(authority.handle({"locksmith:acquire", {"foo"}}), RemoteError);
  EXPECT_THROW(authority.handle({"locksmith:acquire", {"foo", "60", "1", "2"}}),
               RemoteError);
  EXPECT_THROW(authority.handle({"locksmith:acquire", {"foo", "soon"}}),
               RemoteError);
  EXPECT_THROW(authority.handle({"locksmith:acquire", {"foo", "0"}}),
               RemoteError);
  EXPECT_THROW(authority.handle({"locksmith:acquire", {"foo", "60", "-1"}}),
               RemoteError);
  EXPECT_THROW(authority.handle({"locksmith:acquire", {"", "60"}}),
               RemoteError);
  EXPECT_THROW(authority.handle({"locksmith:update", {"uid"}}), RemoteError);
  EXPECT_THROW(authority.handle({"locksmith:statistics", {"x"}}), RemoteError);
}

TEST(AuthorityTest, StatisticsIsYamlMapping) {
  Authority authority;
  authority.handle({"locksmith:acquire", {"foo", "60"}});

  Protocol::Reply reply = authority.handle({"locksmith:statistics", {}});
  ASSERT_EQ(reply.tuples.size(), 1u);
  ASSERT_TRUE(reply.tuples[0][0].has_value());

  YAML::Node stats = YAML::Load(*reply.tuples[0][0]);
  EXPECT_EQ(stats["locks"]["active"].as<int>(), 1);
  EXPECT_EQ(stats["calls"]["acquired"].as<int>(), 1);
  EXPECT_EQ(stats["calls"]["released"].as<int>(), 0);
}
