#pragma once
#include <algorithm>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <toml++/toml.hpp>
#include <utility>

namespace RedisConn {
  namespace fs = std::filesystem;

  constexpr const char *const DEFAULT_HOST = "localhost";
  constexpr int DEFAULT_PORT = 6379;
  constexpr unsigned DEFAULT_CONNECT_TIMEOUT_MILLIS = 2000;
  constexpr unsigned DEFAULT_COMMAND_TIMEOUT_MILLIS = 0;  // 0 = block indefinitely
  constexpr const char *const DEFAULT_LOG_LEVEL = "info";

  /**
   * @brief A class to handle Redis connection configuration options
   *
   * @details The configuration object has the following fields:
   * * `hostname` The Redis server host
   * * `port` The Redis server port
   * * `db` The database to be used (default 0)
   * * `useAuth` Whether basic (AUTH) authentication should be used (default false)
   * * `username` The username to be used if AUTH authentication is required
   * * `password` The password to be used if AUTH authentication is required
   * * `useResp3` Whether the RESP3 reply format should be used (default true)
   * * `unixSocket` A unix domain socket path; when set it takes precedence over hostname/port
   * * `connectTimeoutMillis` Timeout for establishing the connection
   * * `commandTimeoutMillis` Socket timeout for individual commands (0 disables it)
   * * `clientName` A name announced to the server with `CLIENT SETNAME`
   * * `logLevel` The level for the library logger
   */
  class Config {
    friend class HiredisClient;
    friend class RedisConnectionFactory;

   public:
    explicit Config(const std::string &hostname_, int port_, int db_ = 0,
                    std::optional<std::string> un_ = std::nullopt,
                    std::optional<std::string> pw_ = std::nullopt, bool ur3_ = true)
        : hostname{hostname_}, port{port_}, db{db_}, username(un_), password(pw_), useResp3(ur3_) {
      useAuth = password.has_value();
    };
    Config(const Config &config) = default;
    Config(Config &&config) = default;

    /**
     * @brief Construct a new Config object from a file containing TOML
     *
     * @param configFilePath The path to the configuration file
     *
     * @details The file has the following shape (note keys are lowercase):
     * ```toml
     * [redis]
     * hostname = "localhost"
     * port = 6379
     * db = 0
     * useauth = false
     * username = "default"
     * password = "secret"
     * useresp3 = true
     * unixsocket = "/run/redis.sock"
     * connecttimeoutms = 2000
     * commandtimeoutms = 0
     * clientname = "app"
     *
     * [logging]
     * level = "info"
     * ```
     * Only the `[redis]` table is mandatory. Missing keys take their default value.
     */
    explicit Config(const fs::path &configFilePath)
        : db(std::nullopt), useAuth{false}, username(std::nullopt), password(std::nullopt), useResp3{true} {
      auto filepath = fs::weakly_canonical(fs::absolute(configFilePath));
      if (!fs::exists(filepath))
        throw std::runtime_error(std::format("Configuration file not found at: {}", filepath.string()));

      toml::table config;

      try {
        config = toml::parse_file(filepath.string());
      } catch (const toml::parse_error &err) {
        throw std::runtime_error(
            std::format("Failed to parse configuration file {}:\n{}", filepath.string(), err.description()));
      }

      auto redis = config["redis"];

      if (!redis.is_table()) {
        throw std::runtime_error(std::format("Missing [redis] section in {}", filepath.string()));
      }

      hostname = redis["hostname"].value_or(DEFAULT_HOST);
      port = redis["port"].value_or(DEFAULT_PORT);
      db = redis["db"].value<int>();
      if (db.has_value()) {
        db = std::clamp(db.value(), 0, 15);
      }
      useResp3 = redis["useresp3"].value_or(true);
      auto auth = redis["useauth"].value_or(false);
      std::optional<std::string> un = redis["username"].value<std::string>();
      std::optional<std::string> pw = redis["password"].value<std::string>();

      if (auth && pw.has_value()) {
        useAuth = true;
        if (un.has_value()) username = un;
        password = pw;
      }

      unixSocket = redis["unixsocket"].value<std::string>();
      connectTimeoutMillis = redis["connecttimeoutms"].value_or(DEFAULT_CONNECT_TIMEOUT_MILLIS);
      commandTimeoutMillis = redis["commandtimeoutms"].value_or(DEFAULT_COMMAND_TIMEOUT_MILLIS);
      clientName = redis["clientname"].value<std::string>();

      logLevel = config["logging"]["level"].value_or(std::string{DEFAULT_LOG_LEVEL});
    }

    Config &operator=(const Config &config) = default;
    Config &operator=(Config &&config) = default;

    /**
     * @brief Builder-style setters for the less common options
     *
     * @details The rvalue overloads let a temporary be configured in place, as in
     * `Config("localhost", 6379).withClientName("worker")`
     *
     */
    Config &withUnixSocket(std::string path) & {
      unixSocket = std::move(path);
      return *this;
    }

    Config &withConnectTimeout(unsigned millis) & {
      connectTimeoutMillis = millis;
      return *this;
    }

    Config &withCommandTimeout(unsigned millis) & {
      commandTimeoutMillis = millis;
      return *this;
    }

    Config &withClientName(std::string name) & {
      clientName = std::move(name);
      return *this;
    }

    Config &withLogLevel(std::string level) & {
      logLevel = std::move(level);
      return *this;
    }

    Config withUnixSocket(std::string path) && {
      withUnixSocket(std::move(path));
      return std::move(*this);
    }

    Config withConnectTimeout(unsigned millis) && {
      withConnectTimeout(millis);
      return std::move(*this);
    }

    Config withCommandTimeout(unsigned millis) && {
      withCommandTimeout(millis);
      return std::move(*this);
    }

    Config withClientName(std::string name) && {
      withClientName(std::move(name));
      return std::move(*this);
    }

    Config withLogLevel(std::string level) && {
      withLogLevel(std::move(level));
      return std::move(*this);
    }

    [[nodiscard]] const std::string &host() const noexcept { return hostname; }
    [[nodiscard]] int portNumber() const noexcept { return port; }
    [[nodiscard]] int database() const noexcept { return db.value_or(0); }
    [[nodiscard]] bool resp3() const noexcept { return useResp3; }
    [[nodiscard]] const std::string &logLevelName() const noexcept { return logLevel; }

   private:
    std::string hostname;
    int port;
    std::optional<int> db;
    bool useAuth;
    std::optional<std::string> username;
    std::optional<std::string> password;
    bool useResp3;
    std::optional<std::string> unixSocket;
    unsigned connectTimeoutMillis{DEFAULT_CONNECT_TIMEOUT_MILLIS};
    unsigned commandTimeoutMillis{DEFAULT_COMMAND_TIMEOUT_MILLIS};
    std::optional<std::string> clientName;
    std::string logLevel{DEFAULT_LOG_LEVEL};

    friend std::string text(Config const &cfg) {
      return std::format(
          "hostname: {}\n    port: {}\n      db: {}\n useAuth: {}\nusername: {}\npassword: {}\nuseResp3: {}\n"
          "  socket: {}\nconnTmo: {}\n cmdTmo: {}\n   name: {}\nlogLevel: {}",
          cfg.hostname, cfg.port, cfg.db.value_or(0), cfg.useAuth, cfg.username.value_or("nil"),
          cfg.password.has_value() ? "********" : "nil", cfg.useResp3, cfg.unixSocket.value_or("nil"),
          cfg.connectTimeoutMillis, cfg.commandTimeoutMillis, cfg.clientName.value_or("nil"), cfg.logLevel);
    }

    friend struct std::formatter<Config, char>;
  };
};  // namespace RedisConn

template <>
struct std::formatter<RedisConn::Config, char> {
  constexpr auto parse(std::format_parse_context &pc) { return pc.begin(); }

  template <typename Ctx>
  auto format(RedisConn::Config const &cfg, Ctx &ctx) const {
    return std::format_to(ctx.out(), "{}", text(cfg));
  }
};
