#include <format>
#include <print>

#include "redisconn.hpp"

int main() {
  RedisConn::RedisConnectionFactory factory(RedisConn::Config("localhost", 6379));
  auto connection = factory.getConnection();

  // tidy up
  (void)connection->del("foohash", "person");

  /**
   * hSet sets one field. It returns true if the field is new and false if an existing value was overwritten.
   *
   */
  auto hset = connection->hSet("foohash", "foo", "bar");
  std::println("hSet new field: {}", hset);

  // hMSet sets several fields at once
  connection->hMSet("foohash", {{"baz", "bop"}, {"omg", "bbq"}});

  /**
   * hGetAll gets all the field/value pairs for a given hash. A missing hash gives an empty vector.
   *
   */
  auto hvec = connection->hGetAll("foohash");
  std::println("hvec size: {}, items: {}", hvec.size(), hvec);

  /**
   * hGet queries a hash by field. If the field is found it is returned as a string, otherwise std::nullopt
   * is returned.
   *
   */
  auto hget = connection->hGet("foohash", "foo");
  if (hget.has_value()) {
    std::println("hGet foohash::foo value: {}", hget.value());
  }

  // hSetNX leaves existing fields alone
  std::println("hSetNX foo: {}", connection->hSetNX("foohash", "foo", "ignored"));

  /**
   * hDel removes fields. It returns the number of fields deleted.
   *
   */
  auto hdel = connection->hDel("foohash", "baz");
  std::println("hDel, count {}", hdel);

  std::println("hLen {} hKeys {} hVals {}", connection->hLen("foohash"), connection->hKeys("foohash"),
               connection->hVals("foohash"));

  // counters inside a hash
  std::println("hIncrBy {}", connection->hIncrBy("foohash", "hits", 3));
  std::println("hIncrByFloat {}", connection->hIncrByFloat("foohash", "ratio", 0.25));

  /**
   * A JSON document can be stored as a flat hash through JsonHashMapper. Nested members become dotted
   * field names.
   *
   */
  Json::Value person;
  person["name"] = "ada";
  person["age"] = 36;
  person["address"]["city"] = "London";
  person["tags"].append("math");
  person["tags"].append("engines");

  RedisConn::JsonHashMapper mapper;
  auto fields = mapper.toHash(person);
  connection->hMSet("person", fields);
  std::println("person fields: {}", connection->hKeys("person"));

  auto restored = mapper.fromHash(connection->hGetAll("person"));
  std::println("person restored: {}", restored.toStyledString());

  (void)connection->del("foohash", "person");
  return 0;
}
