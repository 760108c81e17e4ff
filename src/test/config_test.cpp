#include <gtest/gtest.h>

#include <filesystem>
#include <format>
#include <fstream>
#include <string>

#include "redisconnconfig.hpp"
#include "redisconnlog.hpp"

using namespace RedisConn;
namespace fs = std::filesystem;

class ConfigFileTest : public ::testing::Test {
 protected:
  void TearDown() override {
    std::error_code ec;
    fs::remove(path, ec);
  }

  fs::path write(const std::string &contents) {
    auto name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
    path = fs::temp_directory_path() / std::format("redisconn-{}.toml", name);
    std::ofstream out(path);
    out << contents;
    return path;
  }

  fs::path path;
};

TEST_F(ConfigFileTest, ReadsAllKeys) {
  Config config(write(R"(
[redis]
hostname = "cache.internal"
port = 6380
db = 3
useauth = true
username = "app"
password = "hunter2"
useresp3 = false
unixsocket = "/run/redis.sock"
connecttimeoutms = 500
commandtimeoutms = 250
clientname = "worker"

[logging]
level = "debug"
)"));

  EXPECT_EQ(config.host(), "cache.internal");
  EXPECT_EQ(config.portNumber(), 6380);
  EXPECT_EQ(config.database(), 3);
  EXPECT_FALSE(config.resp3());
  EXPECT_EQ(config.logLevelName(), "debug");

  auto text = std::format("{}", config);
  EXPECT_NE(text.find("useAuth: true"), std::string::npos);
  EXPECT_NE(text.find("username: app"), std::string::npos);
  EXPECT_NE(text.find("socket: /run/redis.sock"), std::string::npos);
  EXPECT_NE(text.find("connTmo: 500"), std::string::npos);
  EXPECT_NE(text.find("cmdTmo: 250"), std::string::npos);
  EXPECT_NE(text.find("name: worker"), std::string::npos);
}

TEST_F(ConfigFileTest, MissingKeysTakeDefaults) {
  Config config(write("[redis]\n"));
  EXPECT_EQ(config.host(), DEFAULT_HOST);
  EXPECT_EQ(config.portNumber(), DEFAULT_PORT);
  EXPECT_EQ(config.database(), 0);
  EXPECT_TRUE(config.resp3());
  EXPECT_EQ(config.logLevelName(), DEFAULT_LOG_LEVEL);
  EXPECT_NE(std::format("{}", config).find("useAuth: false"), std::string::npos);
}

TEST_F(ConfigFileTest, DatabaseIsClamped) {
  Config high(write("[redis]\ndb = 42\n"));
  EXPECT_EQ(high.database(), 15);
}

TEST_F(ConfigFileTest, AuthNeedsPassword) {
  Config config(write("[redis]\nuseauth = true\nusername = \"app\"\n"));
  EXPECT_NE(std::format("{}", config).find("useAuth: false"), std::string::npos);
}

TEST_F(ConfigFileTest, MissingRedisSectionFails) {
  EXPECT_THROW(Config(write("[logging]\nlevel = \"info\"\n")), std::runtime_error);
}

TEST_F(ConfigFileTest, ParseErrorFails) {
  EXPECT_THROW(Config(write("[redis\nport = \n")), std::runtime_error);
}

TEST(ConfigTest, MissingFileFails) {
  EXPECT_THROW(Config(fs::path("/nonexistent/redisconn.toml")), std::runtime_error);
}

TEST(ConfigTest, FormatterMasksPassword) {
  Config config("localhost", 6379, 0, "app", "s3cret");
  auto text = std::format("{}", config);
  EXPECT_EQ(text.find("s3cret"), std::string::npos);
  EXPECT_NE(text.find("password: ********"), std::string::npos);
  EXPECT_NE(text.find("useAuth: true"), std::string::npos);
}

TEST(ConfigTest, BuildersSetOptionalFields) {
  Config config("localhost", 6379);
  config.withUnixSocket("/tmp/redis.sock").withConnectTimeout(100).withClientName("cli").withLogLevel("warn");
  auto text = std::format("{}", config);
  EXPECT_NE(text.find("socket: /tmp/redis.sock"), std::string::npos);
  EXPECT_NE(text.find("connTmo: 100"), std::string::npos);
  EXPECT_NE(text.find("name: cli"), std::string::npos);
  EXPECT_EQ(config.logLevelName(), "warn");
  EXPECT_NE(text.find("password: nil"), std::string::npos);
}

TEST(ConfigTest, BuildersChainOnTemporary) {
  const Config config = Config("localhost", 6379).withCommandTimeout(250).withClientName("worker").withLogLevel("error");
  auto text = std::format("{}", config);
  EXPECT_NE(text.find("cmdTmo: 250"), std::string::npos);
  EXPECT_NE(text.find("name: worker"), std::string::npos);
  EXPECT_EQ(config.host(), "localhost");
  EXPECT_EQ(config.logLevelName(), "error");
}

TEST(LogTest, SetLogLevelByName) {
  auto previous = log()->level();
  setLogLevel("debug");
  EXPECT_EQ(log()->level(), spdlog::level::debug);

  setLogLevel("verbose");
  EXPECT_EQ(log()->level(), spdlog::level::debug);

  setLogLevel("off");
  EXPECT_EQ(log()->level(), spdlog::level::off);

  log()->set_level(previous);
}
