#include <iostream>
#include <print>
#include <sstream>
#include <string>
#include <vector>

#include "redisconn.hpp"

/**
 * Split a command line on whitespace. Double quotes group words into one argument.
 *
 */
std::vector<std::string> tokenize(const std::string &line) {
  std::vector<std::string> words;
  std::string word;
  bool quoted{false}, pending{false};
  for (auto c : line) {
    if (c == '"') {
      quoted = !quoted;
      pending = true;
    } else if (!quoted && (c == ' ' || c == '\t')) {
      if (pending) words.push_back(std::move(word));
      word.clear();
      pending = false;
    } else {
      word += c;
      pending = true;
    }
  }
  if (pending) words.push_back(std::move(word));
  return words;
}

int run(RedisConn::RedisConnection &connection, const std::vector<std::string> &words) {
  if (words.empty()) return 0;
  try {
    auto reply = connection.execute(words[0], RedisConn::Values(words.begin() + 1, words.end()));
    std::print("{}", reply.dump());
    return 0;
  } catch (const RedisConn::CommandError &e) {
    std::println("(error) {}", e.reply());
  } catch (const RedisConn::RedisError &e) {
    std::println("(failed) {}", e.what());
  } catch (const std::invalid_argument &e) {
    std::println("(invalid) {}", e.what());
  }
  return 1;
}

/**
 * redisconncli [config.toml] [COMMAND args...]
 *
 * With a command on the command line it is run once; otherwise commands are read from stdin, one per line.
 *
 */
int main(int argc, char *argv[]) {
  std::string configPath{argc > 1 ? argv[1] : "config/config_example.toml"};

  try {
    RedisConn::RedisConnectionFactory factory{RedisConn::Config(configPath)};
    auto connection = factory.getConnection();

    if (argc > 2) {
      return run(*connection, std::vector<std::string>(argv + 2, argv + argc));
    }

    int failures{0};
    std::string line;
    while (std::getline(std::cin, line)) {
      auto words = tokenize(line);
      if (!words.empty() && (words[0] == "quit" || words[0] == "QUIT")) break;
      failures += run(*connection, words);
    }
    connection->close();
    return failures == 0 ? 0 : 1;
  } catch (const std::exception &e) {
    std::println(stderr, "redisconncli: {}", e.what());
    return 2;
  }
}
