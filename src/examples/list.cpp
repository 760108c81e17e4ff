#include <format>
#include <print>

#include "redisconn.hpp"

using namespace std::chrono_literals;

int main() {
  RedisConn::RedisConnectionFactory factory(RedisConn::Config("localhost", 6379));
  auto connection = factory.getConnection();

  // tidy up
  (void)connection->del("foolist", "barlist");

  /**
   * rPush appends values to the tail of a list, lPush prepends them to the head. Both return the new
   * length of the list.
   *
   */
  auto len = connection->rPush("foolist", "b", "c", "d");
  std::println("rPush length {}", len);
  len = connection->lPush("foolist", "a");
  std::println("lPush length {}", len);

  std::println("lRange {}", connection->lRange("foolist", 0, -1));

  // insert relative to an existing element
  (void)connection->lInsert("foolist", RedisConn::Position::AFTER, "b", "b2");
  std::println("lRange after lInsert {}", connection->lRange("foolist", 0, -1));

  /**
   * lIndex returns std::nullopt for an index outside the list
   *
   */
  std::println("lIndex 1: {}", connection->lIndex("foolist", 1).value_or("(nil)"));
  std::println("lIndex 99: {}", connection->lIndex("foolist", 99).value_or("(nil)"));

  auto pos = connection->lPos("foolist", "c");
  if (pos.has_value()) {
    std::println("lPos c: {}", pos.value());
  }

  // pop from both ends
  std::println("lPop {}", connection->lPop("foolist").value_or("(nil)"));
  std::println("rPop {}", connection->rPop("foolist").value_or("(nil)"));

  /**
   * rPopLPush moves the tail of one list to the head of another
   *
   */
  auto moved = connection->rPopLPush("foolist", "barlist");
  std::println("moved {} barlist {}", moved.value_or("(nil)"), connection->lRange("barlist", 0, -1));

  /**
   * bLPop waits for a value. It returns {key, value}, or nothing if the timeout expired.
   *
   */
  auto popped = connection->bLPop(1s, {"emptylist", "barlist"});
  std::println("bLPop {}", popped);
  popped = connection->bLPop(1s, {"emptylist"});
  std::println("bLPop timed out: {}", popped.empty());

  connection->lTrim("foolist", 0, 0);
  std::println("lLen after lTrim {}", connection->lLen("foolist"));

  (void)connection->del("foolist", "barlist");
  return 0;
}
