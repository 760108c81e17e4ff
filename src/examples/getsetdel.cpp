#include <print>

#include "redisconn.hpp"

using namespace std::chrono_literals;

int main() {
  RedisConn::RedisConnectionFactory factory(RedisConn::Config("localhost", 6379));
  auto connection = factory.getConnection();

  /**
   * Delete an item or items
   *
   * Returns how many items were deleted
   *
   */
  auto del = connection->del("fooitem");
  std::println("DEL fooitem {}", del);

  // del takes an arbitrary number of arguments
  (void)connection->del("foo_a", "foo_b", "foo_c", "foo_d", "foo_e");

  /**
   * get returns either a string or std::nullopt to indicate no such key exists
   *
   * This call will return nullopt as we previously deleted the key
   */
  auto item = connection->get("fooitem");
  std::println("fooitem {}", item.value_or("does not exist"));

  std::println("fooitem exists {}", connection->exists("fooitem"));

  /**
   * Set a simple string item. set returns true if the value was stored.
   *
   */
  auto set = connection->set("fooitem", "some value");
  std::println("SET fooitem {}", set);

  item = connection->get("fooitem");
  std::println("fooitem {}", item.value_or("does not exist"));

  // delete again
  del = connection->del("fooitem");
  std::println("DEL fooitem {}", del);

  /**
   * SET_IF_PRESENT (XX) only stores the value if the key already exists. It doesn't, so nothing happens and
   * set returns false.
   *
   */
  set = connection->set("fooitem", "some value", RedisConn::Expiration::persistent(),
                        RedisConn::SetOption::SET_IF_PRESENT);
  std::println("SET XX fooitem {}", set);

  // SET_IF_ABSENT (NX) means "set if does not exist"; the key also expires after 30 seconds
  set = connection->set("fooitem", "another value", RedisConn::Expiration::from(30s),
                        RedisConn::SetOption::SET_IF_ABSENT);
  std::println("SET NX fooitem {} ttl {}", set, connection->ttl("fooitem"));

  // counters
  (void)connection->set("counter", "10");
  std::println("INCRBY counter {}", connection->incrBy("counter", 5));
  std::println("INCRBYFLOAT counter {}", connection->incrByFloat("counter", 0.5));

  // several keys at once
  connection->mSet({{"k1", "v1"}, {"k2", "v2"}});
  for (const auto &value : connection->mGet("k1", "k2", "k3")) {
    std::println("MGET {}", value.value_or("(nil)"));
  }

  (void)connection->del("fooitem", "counter", "k1", "k2");
  return 0;
}
