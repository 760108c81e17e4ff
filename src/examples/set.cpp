#include <format>
#include <print>

#include "redisconn.hpp"

int main() {
  RedisConn::RedisConnectionFactory factory(RedisConn::Config("localhost", 6379));
  auto connection = factory.getConnection();

  // tidy up
  (void)connection->del("fooset", "barset", "unionset", "fooscores");

  /**
   * sAdd takes a key and a list of members. It returns the number of members added, which excludes any
   * that were already present.
   *
   */
  auto added = connection->sAdd("fooset", "one", "two", "three", "two");
  std::println("sAdd count {}", added);
  (void)connection->sAdd("barset", "three", "four");

  std::println("sMembers {}", connection->sMembers("fooset"));
  std::println("sIsMember two {}, sIsMember nine {}", connection->sIsMember("fooset", "two"),
               connection->sIsMember("fooset", "nine"));
  std::println("sMIsMember {}", connection->sMIsMember("fooset", {"one", "nine"}));

  // set algebra
  std::println("sInter {}", connection->sInter({"fooset", "barset"}));
  std::println("sDiff {}", connection->sDiff({"fooset", "barset"}));
  std::println("sUnionStore {}", connection->sUnionStore("unionset", {"fooset", "barset"}));

  auto removed = connection->sRem("fooset", "one");
  std::println("sRem count {}, sCard {}", removed, connection->sCard("fooset"));

  /**
   * Sorted sets keep their members ordered by score
   *
   */
  (void)connection->zAdd("fooscores", {{"alice", 3.0}, {"bob", 1.5}, {"carol", 2.0}});
  std::println("zRange {}", connection->zRange("fooscores", 0, -1));
  std::println("zRangeByScore 1.8..3 {}", connection->zRangeByScore("fooscores", 1.8, 3.0));
  std::println("zIncrBy bob {}", connection->zIncrBy("fooscores", 5.0, "bob"));

  for (const auto &tuple : connection->zRevRangeWithScores("fooscores", 0, -1)) {
    std::println("{} {}", tuple.value, tuple.score);
  }

  auto rank = connection->zRank("fooscores", "carol");
  if (rank.has_value()) {
    std::println("zRank carol {}", rank.value());
  }

  (void)connection->del("fooset", "barset", "unionset", "fooscores");
  return 0;
}
