#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <stdexcept>
#include <utility>

#include "redisconn.hpp"

int main(int argc, char *argv[]) {
  std::filesystem::path path = argc > 1 ? argv[1] : "config/config_example.toml";

  /**
   * Settings normally come from a TOML file. A missing file or a file without a [redis] table is reported
   * with std::runtime_error.
   *
   */
  auto loaded = [&]() -> std::optional<RedisConn::Config> {
    try {
      return RedisConn::Config(path);
    } catch (const std::runtime_error &e) {
      std::println("cannot load {}: {}", path.string(), e.what());
      return std::nullopt;
    }
  }();
  if (!loaded) return 1;

  std::println("{} -> {}:{} db {} RESP{}", path.string(), loaded->host(), loaded->portNumber(), loaded->database(),
               loaded->resp3() ? 3 : 2);

  /**
   * Anything in the file can be overridden before the factory takes its copy. The setters chain on a
   * temporary as well as on a named Config.
   *
   */
  auto config = RedisConn::Config(*loaded).withCommandTimeout(500).withClientName("config-example");
  std::println("\n{}", config);

  /**
   * The factory applies the [logging] level and opens one connection per getConnection() call, each with the
   * connect and command timeouts and announcing the client name
   *
   */
  RedisConn::RedisConnectionFactory factory(std::move(config));
  try {
    auto connection = factory.getConnection();
    std::println("\nPING {}", connection->ping());
    std::println("announced as {}", connection->clientGetName().value_or("(no name)"));
    std::println("protocol {}", connection->execute("HELLO", {}).type == RedisConn::ReplyType::MAP ? "RESP3" : "RESP2");
    for (const auto &[name, value] : connection->getConfig("timeout")) std::println("server {} = {}", name, value);
  } catch (const RedisConn::RedisError &e) {
    std::println("\nfailed talking to {}:{}: {}", factory.getConfig().host(), factory.getConfig().portNumber(), e.what());
    return 1;
  }

  return 0;
}
