#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <future>
#include <memory>
#include <thread>

#include "redisconnconnection.hpp"
#include "redisconnreactive.hpp"
#include "testclients.hpp"

using namespace RedisConn;
using namespace std::chrono_literals;
using RedisConn::Testing::eventually;
using RedisConn::Testing::MockNativeClient;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;

class ReactiveTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto mock = std::make_unique<NiceMock<MockNativeClient>>();
    client = mock.get();
    reactive = std::make_unique<ReactiveRedisConnection>(std::make_unique<DefaultRedisConnection>(std::move(mock)));
  }

  void expect(const Argv &argv, const Reply &reply) { EXPECT_CALL(*client, execute(argv)).WillOnce(Return(reply)); }

  NiceMock<MockNativeClient> *client{nullptr};
  std::unique_ptr<ReactiveRedisConnection> reactive;
};

TEST_F(ReactiveTest, RejectsNullConnection) {
  EXPECT_THROW(ReactiveRedisConnection(nullptr), std::invalid_argument);
}

TEST_F(ReactiveTest, SingleCommandCompletesFuture) {
  expect({"GET", "k"}, Reply::string("v"));
  EXPECT_EQ(reactive->stringCommands().get("k").get(), "v");

  expect({"SET", "k", "v", "EX", "10"}, Reply::status("OK"));
  EXPECT_TRUE(reactive->stringCommands().set("k", "v", Expiration::seconds(10), SetOption::UPSERT).get());
}

TEST_F(ReactiveTest, CommandsRunInSubmissionOrder) {
  {
    InSequence seq;
    expect({"SET", "k", "1"}, Reply::status("OK"));
    expect({"INCR", "k"}, Reply::integerValue(2));
    expect({"GET", "k"}, Reply::string("2"));
  }
  auto set = reactive->stringCommands().set("k", "1");
  auto incr = reactive->submit([](RedisConnection &c) { return c.incr("k"); });
  auto get = reactive->stringCommands().get("k");

  EXPECT_TRUE(set.get());
  EXPECT_EQ(incr.get(), 2);
  EXPECT_EQ(get.get(), "2");
}

TEST_F(ReactiveTest, ErrorsAreDeliveredThroughFuture) {
  expect({"INCR", "k"}, Reply::error("ERR value is not an integer or out of range"));
  expect({"GET", "k"}, Reply::string("abc"));

  auto failed = reactive->submit([](RedisConnection &c) { return c.incr("k"); });
  auto next = reactive->stringCommands().get("k");
  EXPECT_THROW(failed.get(), CommandError);
  EXPECT_EQ(next.get(), "abc");
}

TEST_F(ReactiveTest, BatchXAddReturnsResponsePerCommand) {
  expect({"XADD", "s", "*", "f", "1"}, Reply::string("1-0"));
  expect({"XADD", "s", "MAXLEN", "5", "*", "f", "2"}, Reply::string("2-0"));

  auto responses = reactive->streamCommands()
                       .xAdd({AddStreamRecord::body({{"f", "1"}}).to("s"),
                              AddStreamRecord::body({{"f", "2"}}).to("s").maxlen(5)})
                       .get();
  ASSERT_EQ(responses.size(), 2u);
  EXPECT_EQ(responses[0].getInput().getKey(), "s");
  EXPECT_EQ(responses[0].getOutput(), RecordId::of("1-0"));
  EXPECT_EQ(responses[1].getInput().getOptions().getMaxlen(), 5);
  EXPECT_EQ(responses[1].getOutput(), RecordId::of("2-0"));
}

TEST_F(ReactiveTest, StreamReadAndAcknowledge) {
  expect({"XREADGROUP", "GROUP", "g", "c", "COUNT", "1", "STREAMS", "s", ">"},
         Reply::map({Reply::string("s"),
                     Reply::array({Reply::array({Reply::string("1-0"), Reply::strings({"f", "v"})})})}));
  expect({"XACK", "s", "g", "1-0"}, Reply::integerValue(1));

  auto read = reactive->streamCommands().read(
      {ReadCommand::from(StreamOffset::create("s", ReadOffset::lastConsumed()))
           .as(Consumer::from("g", "c"))
           .withOptions(StreamReadOptions::empty().count(1))});
  auto records = read.get();
  ASSERT_EQ(records.size(), 1u);
  ASSERT_EQ(records[0].getOutput().size(), 1u);
  EXPECT_EQ(records[0].getOutput()[0].id().value(), "1-0");

  auto acked = reactive->streamCommands().xAck("s", "g", {records[0].getOutput()[0].id()});
  EXPECT_EQ(acked.get(), 1);
}

TEST_F(ReactiveTest, InvalidCommandsFailThroughFuture) {
  auto noGroup = reactive->streamCommands().xAck({AcknowledgeCommand::stream("s").forRecords({"1-0"})});
  EXPECT_THROW(noGroup.get(), std::invalid_argument);

  auto noIds = reactive->streamCommands().xAck({AcknowledgeCommand::stream("s").inGroup("g")});
  EXPECT_THROW(noIds.get(), std::invalid_argument);

  auto noCount = reactive->streamCommands().xTrim({TrimCommand::stream("s")});
  EXPECT_THROW(noCount.get(), std::invalid_argument);

  auto noKey = reactive->streamCommands().xAdd({AddStreamRecord::body({{"f", "v"}})});
  EXPECT_THROW(noKey.get(), std::invalid_argument);

  EXPECT_THROW(ReadCommand::from(std::vector<StreamOffset>{}), std::invalid_argument);
  EXPECT_THROW(GroupCommand::createGroup(""), std::invalid_argument);
}

TEST_F(ReactiveTest, GroupCommandsReportStatus) {
  expect({"XGROUP", "CREATE", "s", "g", "0-0", "MKSTREAM"}, Reply::status("OK"));
  expect({"XGROUP", "DELCONSUMER", "s", "g", "c"}, Reply::integerValue(2));
  expect({"XGROUP", "DESTROY", "s", "g"}, Reply::integerValue(0));

  auto responses =
      reactive->streamCommands()
          .xGroup({GroupCommand::createGroup("g").forStream("s").at(ReadOffset::from("0-0")).makeStream(true),
                   GroupCommand::deleteConsumer(Consumer::from("g", "c")).forStream("s"),
                   GroupCommand::destroyGroup("g").forStream("s")})
          .get();
  ASSERT_EQ(responses.size(), 3u);
  EXPECT_EQ(responses[0].getOutput(), "OK");
  EXPECT_EQ(responses[1].getOutput(), "OK");
  EXPECT_EQ(responses[2].getOutput(), "Error");
}

TEST_F(ReactiveTest, PendingRecordsWithConsumer) {
  expect({"XPENDING", "s", "g", "1-0", "2-0", "10", "c"},
         Reply::array({Reply::array({Reply::string("1-0"), Reply::string("c"), Reply::integerValue(20),
                                     Reply::integerValue(1)})}));
  auto responses =
      reactive->streamCommands()
          .xPending({PendingRecordsCommand::pending("s", "g").consumer("c").range(
              Range<std::string>::closed("1-0", "2-0"), 10)})
          .get();
  ASSERT_EQ(responses.size(), 1u);
  EXPECT_EQ(responses[0].getOutput().size(), 1u);
  EXPECT_EQ(responses[0].getOutput().get(0).consumerName, "c");
}

TEST_F(ReactiveTest, HashSetPicksCommandByFieldCount) {
  expect({"HSET", "h", "f", "v"}, Reply::integerValue(1));
  expect({"HMSET", "h", "a", "1", "b", "2"}, Reply::status("OK"));
  expect({"HSETNX", "h", "f", "w"}, Reply::integerValue(0));

  auto responses = reactive->hashCommands()
                       .hSet({HSetCommand::value("f", "v").forKey("h"),
                              HSetCommand::fieldValues({{"a", "1"}, {"b", "2"}}).forKey("h")})
                       .get();
  ASSERT_EQ(responses.size(), 2u);
  EXPECT_TRUE(responses[0].getOutput());
  EXPECT_TRUE(responses[1].getOutput());

  EXPECT_FALSE(reactive->hashCommands().hSetNX("h", "f", "w").get());

  auto multiNx =
      reactive->hashCommands().hSet({HSetCommand::fieldValues({{"a", "1"}, {"b", "2"}}).forKey("h").ifValueNotExists()});
  EXPECT_THROW(multiNx.get(), std::invalid_argument);
  EXPECT_THROW(HSetCommand::fieldValues({}), std::invalid_argument);
}

TEST_F(ReactiveTest, HashReads) {
  expect({"HMGET", "h", "a", "z"}, Reply::array({Reply::string("1"), Reply::nil()}));
  expect({"HEXISTS", "h", "a"}, Reply::integerValue(1));
  expect({"HMSET", "h", "x", "9"}, Reply::status("OK"));

  auto values = reactive->hashCommands().hMGet("h", {"a", "z"}).get();
  ASSERT_EQ(values.size(), 2u);
  EXPECT_EQ(values[0], "1");
  EXPECT_FALSE(values[1].has_value());
  EXPECT_TRUE(reactive->hashCommands().hExists("h", "a").get());
  reactive->hashCommands().hMSet("h", {{"x", "9"}}).get();
}

TEST_F(ReactiveTest, SetCommands) {
  expect({"SADD", "s", "a", "b"}, Reply::integerValue(2));
  expect({"SISMEMBER", "s", "a"}, Reply::integerValue(1));
  expect({"SREM", "s", "b"}, Reply::integerValue(1));

  auto added = reactive->setCommands().sAdd({SAddCommand::values({"a", "b"}).to("s")}).get();
  EXPECT_EQ(added[0].getOutput(), 2);
  EXPECT_TRUE(reactive->setCommands().sIsMember("s", "a").get());
  EXPECT_EQ(reactive->setCommands().sRem("s", {"b"}).get(), 1);
}

TEST_F(ReactiveTest, KeyExistenceBatch) {
  expect({"EXISTS", "a"}, Reply::integerValue(1));
  expect({"EXISTS", "b"}, Reply::integerValue(0));

  auto responses = reactive->keyCommands().exists({KeyCommand("a"), KeyCommand("b")}).get();
  ASSERT_EQ(responses.size(), 2u);
  EXPECT_EQ(responses[0].getInput().getKey(), "a");
  EXPECT_TRUE(responses[0].getOutput());
  EXPECT_FALSE(responses[1].getOutput());

  EXPECT_THROW(reactive->keyCommands().del(Keys{}), std::invalid_argument);
}

TEST_F(ReactiveTest, CloseFailsCommandsThatHaveNotStarted) {
  std::promise<void> gate;
  auto released = gate.get_future().share();

  auto first = reactive->submit([released](RedisConnection &) {
    released.wait();
    return 1;
  });
  auto second = reactive->submit([](RedisConnection &) { return 2; });
  ASSERT_TRUE(eventually([&] { return reactive->pending() == 1; }));

  EXPECT_CALL(*client, close()).Times(1);
  std::jthread closer([this] { reactive->close(); });
  ASSERT_TRUE(eventually([&] { return reactive->isClosed(); }));
  gate.set_value();
  closer.join();

  EXPECT_EQ(first.get(), 1);
  EXPECT_THROW(second.get(), RedisError);
  EXPECT_EQ(reactive->pending(), 0u);

  auto late = reactive->stringCommands().get("k");
  EXPECT_THROW(late.get(), ConnectionError);
}

TEST_F(ReactiveTest, CommandCanCloseItsOwnConnection) {
  std::promise<void> gate;
  auto released = gate.get_future().share();

  EXPECT_CALL(*client, close()).Times(1);
  auto closing = reactive->submit([this, released](RedisConnection &) {
    released.wait();
    reactive->close();
    return 7;
  });
  auto queued = reactive->submit([](RedisConnection &) { return 8; });
  gate.set_value();

  EXPECT_EQ(closing.get(), 7);
  EXPECT_THROW(queued.get(), RedisError);
  EXPECT_TRUE(reactive->isClosed());
  reactive.reset();
}

TEST_F(ReactiveTest, ListPushAndPopByDirection) {
  expect({"RPUSH", "l", "a", "b"}, Reply::integerValue(2));
  expect({"LPUSH", "l", "z"}, Reply::integerValue(3));
  expect({"LPOP", "l"}, Reply::string("z"));
  expect({"RPOP", "l"}, Reply::nil());

  auto pushed = reactive->listCommands()
                    .push({PushCommand::right().values({"a", "b"}).to("l"), PushCommand::left().value("z").to("l")})
                    .get();
  ASSERT_EQ(pushed.size(), 2u);
  EXPECT_EQ(pushed[0].getOutput(), 2);
  EXPECT_EQ(pushed[1].getInput().getDirection(), PushCommand::Direction::LEFT);
  EXPECT_EQ(pushed[1].getOutput(), 3);

  auto popped = reactive->listCommands().pop({PopCommand::left().from("l"), PopCommand::right().from("l")}).get();
  ASSERT_EQ(popped.size(), 2u);
  EXPECT_EQ(popped[0].getOutput(), "z");
  EXPECT_FALSE(popped[1].getOutput().has_value());
}

TEST_F(ReactiveTest, ListSingleForms) {
  expect({"LPUSH", "l", "x"}, Reply::integerValue(1));
  expect({"LRANGE", "l", "0", "-1"}, Reply::strings({"x"}));
  expect({"LLEN", "l"}, Reply::integerValue(1));
  expect({"LINDEX", "l", "0"}, Reply::string("x"));
  expect({"LTRIM", "l", "0", "0"}, Reply::status("OK"));

  EXPECT_EQ(reactive->listCommands().lPush("l", {"x"}).get(), 1);
  EXPECT_EQ(reactive->listCommands().lRange("l", 0, -1).get(), (std::vector<std::string>{"x"}));
  EXPECT_EQ(reactive->listCommands().lLen("l").get(), 1);
  EXPECT_EQ(reactive->listCommands().lIndex("l", 0).get(), "x");
  reactive->listCommands().lTrim("l", 0, 0).get();

  auto noKey = reactive->listCommands().push({PushCommand::right().value("v")});
  EXPECT_THROW(noKey.get(), std::invalid_argument);
  auto noValues = reactive->listCommands().push({PushCommand::right().to("l")});
  EXPECT_THROW(noValues.get(), std::invalid_argument);
  EXPECT_THROW(PushCommand::left().values({}), std::invalid_argument);
}

TEST_F(ReactiveTest, SortedSetCommandObjects) {
  expect({"ZADD", "z", "NX", "1", "a", "2", "b"}, Reply::integerValue(2));
  expect({"ZINCRBY", "z", "1.5", "a"}, Reply::string("2.5"));
  expect({"ZRANGEBYSCORE", "z", "2", "+inf", "LIMIT", "0", "1"}, Reply::strings({"a"}));
  expect({"ZREM", "z", "b"}, Reply::integerValue(1));

  auto added = reactive->zSetCommands()
                   .zAdd({ZAddCommand::tuples({{"a", 1.0}, {"b", 2.0}}).to("z").withFlag(ZAddFlag::NX)})
                   .get();
  ASSERT_EQ(added.size(), 1u);
  EXPECT_EQ(added[0].getOutput(), 2);

  auto incremented = reactive->zSetCommands().zIncrBy({ZIncrByCommand::scoreOf("a").by(1.5).storedWithin("z")}).get();
  EXPECT_DOUBLE_EQ(incremented[0].getOutput(), 2.5);

  auto ranged =
      reactive->zSetCommands()
          .zRangeByScore({ZRangeByScoreCommand::scoresWithin(Range<double>::rightUnbounded(Bound<double>::inclusiveOf(2)))
                              .from("z")
                              .limitTo(Limit::limit().count(1))})
          .get();
  EXPECT_EQ(ranged[0].getOutput(), (std::vector<std::string>{"a"}));

  EXPECT_EQ(reactive->zSetCommands().zRem("z", {"b"}).get(), 1);
}

TEST_F(ReactiveTest, SortedSetSingleForms) {
  expect({"ZADD", "z", "3", "c"}, Reply::integerValue(1));
  expect({"ZSCORE", "z", "c"}, Reply::string("3"));
  expect({"ZSCORE", "z", "missing"}, Reply::nil());
  expect({"ZRANK", "z", "c"}, Reply::integerValue(0));
  expect({"ZCARD", "z"}, Reply::integerValue(1));
  expect({"ZRANGE", "z", "0", "-1", "WITHSCORES"}, Reply::strings({"c", "3"}));

  EXPECT_TRUE(reactive->zSetCommands().zAdd("z", 3.0, "c").get());
  EXPECT_EQ(reactive->zSetCommands().zScore("z", "c").get(), 3.0);
  EXPECT_FALSE(reactive->zSetCommands().zScore("z", "missing").get().has_value());
  EXPECT_EQ(reactive->zSetCommands().zRank("z", "c").get(), 0);
  EXPECT_EQ(reactive->zSetCommands().zCard("z").get(), 1);
  auto tuples = reactive->zSetCommands().zRangeWithScores("z", 0, -1).get();
  ASSERT_EQ(tuples.size(), 1u);
  EXPECT_EQ(tuples[0], (Tuple{"c", 3.0}));
}

TEST_F(ReactiveTest, NumberCommands) {
  expect({"INCRBY", "a", "5"}, Reply::integerValue(5));
  expect({"INCRBY", "b", "-2"}, Reply::integerValue(-2));
  expect({"INCRBYFLOAT", "f", "0.5"}, Reply::string("1.5"));
  expect({"DECRBY", "a", "3"}, Reply::integerValue(2));
  expect({"INCR", "a"}, Reply::integerValue(3));
  expect({"DECR", "a"}, Reply::integerValue(2));

  auto responses = reactive->numberCommands()
                       .incrBy({IncrByCommand<long long>::incr("a").by(5), IncrByCommand<long long>::incr("b").by(-2)})
                       .get();
  ASSERT_EQ(responses.size(), 2u);
  EXPECT_EQ(responses[0].getInput().getKey(), "a");
  EXPECT_EQ(responses[0].getOutput(), 5);
  EXPECT_EQ(responses[1].getOutput(), -2);

  EXPECT_DOUBLE_EQ(reactive->numberCommands().incrByFloat("f", 0.5).get(), 1.5);
  EXPECT_EQ(reactive->numberCommands().decrBy("a", 3).get(), 2);
  EXPECT_EQ(reactive->numberCommands().incr("a").get(), 3);
  EXPECT_EQ(reactive->numberCommands().decr("a").get(), 2);

  auto noAmount = reactive->numberCommands().incrBy({IncrByCommand<long long>::incr("a")});
  EXPECT_THROW(noAmount.get(), std::invalid_argument);
}
