#include <fstream>
#include <print>
#include <sstream>
#include <string_view>

#include "redisconn.hpp"

constexpr std::string_view script = "return redis.call('EXISTS', KEYS[1])";
constexpr std::string_view key = "fooitem";

int main() {
  RedisConn::RedisConnectionFactory factory(RedisConn::Config("localhost", 6379));
  auto connection = factory.getConnection();

  // make sure a value exists
  (void)connection->set(key, "some value");

  /**
   * Run a script directly. The third argument is the number of keys in the list of parameters following,
   * which are passed to the script in the KEYS array; the remainder are passed in the ARGV array. The
   * ReturnType says how the result should be read.
   *
   */
  auto result = connection->eval(script, RedisConn::ReturnType::BOOLEAN, 1, {std::string(key)});
  std::println("'{}' exists: {}", key, result.integer != 0);

  /**
   * Load a script from a file containing a Lua program into the script cache. scriptLoad returns its SHA1
   * hash, which is used to run it later.
   *
   */
  std::ifstream luaFile("scripts/setkey.lua");
  if (!luaFile) {
    std::println("scripts/setkey.lua not found");
    return 1;
  }
  std::stringstream source;
  source << luaFile.rdbuf();

  auto scriptHash = connection->scriptLoad(source.str());
  std::println("SHA {}", scriptHash);

  /**
   * Evaluate a script based on its SHA hash. The remaining arguments are identical to eval().
   *
   */
  auto status = connection->evalSha(scriptHash, RedisConn::ReturnType::STATUS, 1, {std::string(key), "another value"});
  std::println("evalSha: {}", status.str);

  // check that the item has the new value
  auto item = connection->get(key);
  std::println("'{}': {}", key, item.value_or("does not exist"));

  /**
   * scriptExists takes several hashes and returns a bool for each of them
   *
   */
  std::println("setkey exists: {}", connection->scriptExists({scriptHash}));

  // destroy all cached scripts (caution!)
  connection->scriptFlush();

  std::println("setkey exists: {}", connection->scriptExists({scriptHash}));

  return 0;
}
