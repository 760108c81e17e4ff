#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <string>

#include "redisconnconnection.hpp"
#include "testclients.hpp"

using namespace RedisConn;
using namespace std::chrono_literals;
using RedisConn::Testing::MockNativeClient;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class ConnectionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto mock = std::make_unique<NiceMock<MockNativeClient>>();
    client = mock.get();
    connection = std::make_unique<DefaultRedisConnection>(std::move(mock));
  }

  void expect(const Argv &argv, const Reply &reply) { EXPECT_CALL(*client, execute(argv)).WillOnce(Return(reply)); }

  NiceMock<MockNativeClient> *client{nullptr};
  std::unique_ptr<DefaultRedisConnection> connection;
};

TEST_F(ConnectionTest, NullClientIsRejected) {
  EXPECT_THROW(DefaultRedisConnection(nullptr), std::invalid_argument);
}

TEST_F(ConnectionTest, ErrorReplyThrowsCommandError) {
  expect({"INCR", "counter"}, Reply::error("ERR value is not an integer or out of range"));
  try {
    connection->incr("counter");
    FAIL() << "expected CommandError";
  } catch (const CommandError &e) {
    EXPECT_EQ(e.commandName(), "INCR");
    EXPECT_EQ(e.reply(), "ERR value is not an integer or out of range");
  }
}

TEST_F(ConnectionTest, ClosedConnectionRejectsCommands) {
  EXPECT_CALL(*client, close()).Times(1);
  connection->close();
  EXPECT_TRUE(connection->isClosed());
  EXPECT_THROW(connection->get("k"), ConnectionError);
  connection->close();
}

TEST_F(ConnectionTest, ExecuteSendsRawCommand) {
  expect({"OBJECT", "ENCODING", "k"}, Reply::string("embstr"));
  EXPECT_EQ(connection->execute("OBJECT", {"ENCODING", "k"}), Reply::string("embstr"));
  EXPECT_THROW(connection->execute("", {}), std::invalid_argument);
}

TEST_F(ConnectionTest, KeyCommands) {
  expect({"EXISTS", "a", "b"}, Reply::integerValue(1));
  EXPECT_EQ(connection->exists("a", "b"), 1);

  expect({"DEL", "a"}, Reply::integerValue(1));
  EXPECT_EQ(connection->del("a"), 1);

  expect({"TYPE", "h"}, Reply::status("hash"));
  EXPECT_EQ(connection->type("h"), DataType::HASH);

  expect({"EXPIRE", "a", "10"}, Reply::integerValue(1));
  EXPECT_TRUE(connection->expire("a", 10));

  expect({"TTL", "a"}, Reply::integerValue(-2));
  EXPECT_EQ(connection->ttl("a"), -2);

  EXPECT_THROW(connection->del(Keys{}), std::invalid_argument);
}

TEST_F(ConnectionTest, ScanAppendsOptions) {
  expect({"SCAN", "0", "MATCH", "user:*", "COUNT", "100", "TYPE", "hash"},
         Reply::array({Reply::string("0"), Reply::strings({"user:1"})}));
  auto cursor = connection->scan(0, ScanOptions::none().match("user:*").withCount(100).withType(DataType::HASH));
  EXPECT_TRUE(cursor.finished());
  EXPECT_EQ(cursor.items, (std::vector<std::string>{"user:1"}));
}

TEST_F(ConnectionTest, SetVariants) {
  expect({"SET", "k", "v"}, Reply::status("OK"));
  EXPECT_TRUE(connection->set("k", "v"));

  expect({"SET", "k", "v", "PX", "1500", "NX"}, Reply::nil());
  EXPECT_FALSE(connection->set("k", "v", Expiration::milliseconds(1500), SetOption::SET_IF_ABSENT));

  expect({"SET", "k", "v", "KEEPTTL", "XX"}, Reply::status("OK"));
  EXPECT_TRUE(connection->set("k", "v", Expiration::keepTtl(), SetOption::SET_IF_PRESENT));

  expect({"SETEX", "k", "30", "v"}, Reply::status("OK"));
  connection->setEx("k", 30, "v");
  EXPECT_THROW(connection->setEx("k", 0, "v"), std::invalid_argument);

  EXPECT_THROW(connection->set("", "v"), std::invalid_argument);
}

TEST_F(ConnectionTest, GetAndMGet) {
  expect({"GET", "missing"}, Reply::nil());
  EXPECT_FALSE(connection->get("missing").has_value());

  expect({"MGET", "a", "b"}, Reply::array({Reply::string("1"), Reply::nil()}));
  auto values = connection->mGet("a", "b");
  ASSERT_EQ(values.size(), 2u);
  EXPECT_EQ(values[0], "1");
  EXPECT_FALSE(values[1].has_value());
}

TEST_F(ConnectionTest, NumericCommands) {
  expect({"INCRBY", "n", "5"}, Reply::integerValue(15));
  EXPECT_EQ(connection->incrBy("n", 5), 15);

  expect({"INCRBYFLOAT", "f", "1.5"}, Reply::string("3.5"));
  EXPECT_DOUBLE_EQ(connection->incrByFloat("f", 1.5), 3.5);

  expect({"SETBIT", "bits", "7", "1"}, Reply::integerValue(0));
  EXPECT_FALSE(connection->setBit("bits", 7, true));
}

TEST_F(ConnectionTest, ListCommands) {
  expect({"RPUSH", "l", "a", "b"}, Reply::integerValue(2));
  EXPECT_EQ(connection->rPush("l", "a", "b"), 2);

  expect({"LINSERT", "l", "BEFORE", "b", "x"}, Reply::integerValue(3));
  EXPECT_EQ(connection->lInsert("l", Position::BEFORE, "b", "x"), 3);

  expect({"BLPOP", "l1", "l2", "5"}, Reply::strings({"l2", "v"}));
  EXPECT_EQ(connection->bLPop(5s, {"l1", "l2"}), (std::vector<std::string>{"l2", "v"}));

  expect({"LPOS", "l", "x", "RANK", "2", "COUNT", "0"}, Reply::array({Reply::integerValue(4)}));
  EXPECT_EQ(connection->lPos("l", "x", 2, 0), (std::vector<long long>{4}));
}

TEST_F(ConnectionTest, SortedSetCommands) {
  expect({"ZADD", "z", "NX", "1.5", "m"}, Reply::integerValue(1));
  EXPECT_TRUE(connection->zAdd("z", 1.5, "m", ZAddFlag::NX));

  expect({"ZRANGE", "z", "0", "-1", "WITHSCORES"}, Reply::strings({"m", "1.5"}));
  auto tuples = connection->zRangeWithScores("z", 0, -1);
  ASSERT_EQ(tuples.size(), 1u);
  EXPECT_EQ(tuples[0], (Tuple{"m", 1.5}));

  expect({"ZRANGEBYSCORE", "z", "(1", "5", "LIMIT", "0", "3"}, Reply::strings({"m"}));
  EXPECT_EQ(connection->zRangeByScore("z", Range<double>::leftOpen(1.0, 5.0), Limit::limit().count(3)),
            (std::vector<std::string>{"m"}));

  expect({"ZREVRANGEBYSCORE", "z", "+inf", "-inf"}, Reply::strings({}));
  EXPECT_TRUE(connection->zRevRangeByScore("z", Range<double>::unbounded(), Limit::unlimited()).empty());

  expect({"ZUNIONSTORE", "dest", "2", "z1", "z2", "WEIGHTS", "1", "2", "AGGREGATE", "MAX"}, Reply::integerValue(3));
  EXPECT_EQ(connection->zUnionStore("dest", Aggregate::MAX, {1.0, 2.0}, {"z1", "z2"}), 3);
  EXPECT_THROW(connection->zUnionStore("dest", Aggregate::SUM, {1.0}, {"z1", "z2"}), std::invalid_argument);

  expect({"ZSCORE", "z", "none"}, Reply::nil());
  EXPECT_FALSE(connection->zScore("z", "none").has_value());
}

TEST_F(ConnectionTest, HashCommands) {
  expect({"HSET", "h", "f", "v"}, Reply::integerValue(1));
  EXPECT_TRUE(connection->hSet("h", "f", "v"));

  expect({"HMSET", "h", "a", "1", "b", "2"}, Reply::status("OK"));
  connection->hMSet("h", {{"a", "1"}, {"b", "2"}});

  expect({"HGETALL", "h"}, Reply::map({Reply::string("a"), Reply::string("1")}));
  EXPECT_EQ(connection->hGetAll("h"), (KeyValues{{"a", "1"}}));

  expect({"HDEL", "h", "a", "b"}, Reply::integerValue(2));
  EXPECT_EQ(connection->hDel("h", "a", "b"), 2);

  EXPECT_THROW(connection->hMSet("h", {}), std::invalid_argument);
}

TEST_F(ConnectionTest, XAddWithOptions) {
  expect({"XADD", "s", "NOMKSTREAM", "MAXLEN", "~", "10", "*", "f", "v"}, Reply::string("1-0"));
  auto record = StreamRecords::newRecord().in("s").ofStrings({{"f", "v"}});
  auto id = connection->xAdd(record, XAddOptions::none().maxlen(10).approximateTrimming(true).makeNoStream());
  EXPECT_EQ(id, RecordId::of("1-0"));
}

TEST_F(ConnectionTest, XAddWithExplicitId) {
  expect({"XADD", "s", "5-1", "a", "1", "b", "2"}, Reply::string("5-1"));
  auto record = StreamRecords::newRecord().in("s").withId("5-1").ofStrings({{"a", "1"}, {"b", "2"}});
  EXPECT_EQ(connection->xAdd(record).value(), "5-1");
}

TEST_F(ConnectionTest, XAddValidatesRecord) {
  EXPECT_THROW(connection->xAdd(StreamRecords::newRecord().in("s").ofStrings({})), std::invalid_argument);
  EXPECT_THROW(connection->xAdd(StreamRecords::newRecord().ofStrings({{"f", "v"}})), std::invalid_argument);
}

TEST_F(ConnectionTest, XAckAndXDel) {
  expect({"XACK", "s", "g", "1-0", "2-0"}, Reply::integerValue(2));
  EXPECT_EQ(connection->xAck("s", "g", "1-0", "2-0"), 2);

  expect({"XDEL", "s", "1-0"}, Reply::integerValue(1));
  EXPECT_EQ(connection->xDel("s", "1-0"), 1);

  EXPECT_THROW(connection->xAck("s", "g", std::vector<RecordId>{}), std::invalid_argument);
  EXPECT_THROW(connection->xAck("s", "", "1-0"), std::invalid_argument);
}

TEST_F(ConnectionTest, XRangeMapsBoundsAndCount) {
  expect({"XRANGE", "s", "1-0", "2-0", "COUNT", "5"},
         Reply::array({Reply::array({Reply::string("1-0"), Reply::strings({"f", "v"})})}));
  auto records = connection->xRange("s", Range<std::string>::closed("1-0", "2-0"), Limit::limit().count(5));
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].stream(), "s");
  EXPECT_EQ(records[0].id().value(), "1-0");
  EXPECT_EQ(records[0].get("f"), "v");
}

TEST_F(ConnectionTest, XRevRangeSwapsBounds) {
  expect({"XREVRANGE", "s", "+", "-"}, Reply::array({}));
  EXPECT_TRUE(connection->xRevRange("s", Range<std::string>::unbounded()).empty());
}

TEST_F(ConnectionTest, XReadListsKeysThenOffsets) {
  expect({"XREAD", "COUNT", "2", "BLOCK", "100", "STREAMS", "a", "b", "0-0", "$"},
         Reply::map({Reply::string("a"),
                     Reply::array({Reply::array({Reply::string("1-0"), Reply::strings({"f", "v"})})})}));
  auto records = connection->xRead(StreamReadOptions::empty().count(2).block(100ms),
                                   {StreamOffset::fromStart("a"), StreamOffset::latest("b")});
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].stream(), "a");

  expect({"XREAD", "STREAMS", "a", "$"}, Reply::nil());
  EXPECT_TRUE(connection->xRead({StreamOffset::latest("a")}).empty());

  EXPECT_THROW(connection->xRead(std::vector<StreamOffset>{}), std::invalid_argument);
}

TEST_F(ConnectionTest, XReadGroupSendsConsumerAndNoack) {
  expect({"XREADGROUP", "GROUP", "g", "c", "NOACK", "STREAMS", "s", ">"}, Reply::nil());
  auto records = connection->xReadGroup(Consumer::from("g", "c"), StreamReadOptions::empty().noack(),
                                        {StreamOffset::create("s", ReadOffset::lastConsumed())});
  EXPECT_TRUE(records.empty());
}

TEST_F(ConnectionTest, XGroupCommands) {
  expect({"XGROUP", "CREATE", "s", "g", "$", "MKSTREAM"}, Reply::status("OK"));
  EXPECT_EQ(connection->xGroupCreate("s", "g", ReadOffset::latest(), true), "OK");

  expect({"XGROUP", "CREATE", "s", "g2", "0-0"}, Reply::status("OK"));
  EXPECT_EQ(connection->xGroupCreate("s", "g2", ReadOffset::from("0-0")), "OK");

  expect({"XGROUP", "DELCONSUMER", "s", "g", "c"}, Reply::integerValue(0));
  EXPECT_TRUE(connection->xGroupDelConsumer("s", Consumer::from("g", "c")));

  expect({"XGROUP", "DESTROY", "s", "g"}, Reply::integerValue(1));
  EXPECT_TRUE(connection->xGroupDestroy("s", "g"));
}

TEST_F(ConnectionTest, XPendingSummary) {
  expect({"XPENDING", "s", "g"}, Reply::array({Reply::integerValue(1), Reply::string("1-0"), Reply::string("1-0"),
                                               Reply::array({Reply::strings({"c", "1"})})}));
  auto summary = connection->xPending("s", "g");
  EXPECT_EQ(summary.groupName, "g");
  EXPECT_EQ(summary.totalPendingMessages, 1);
}

TEST_F(ConnectionTest, XPendingExtendedForm) {
  expect({"XPENDING", "s", "g", "IDLE", "1000", "-", "+", "10", "c"}, Reply::array({}));
  auto pending = connection->xPending("s", "g", XPendingOptions::unbounded(10).consumer("c").minIdle(1s));
  EXPECT_TRUE(pending.isEmpty());

  expect({"XPENDING", "s", "g", "-", "+", std::to_string(std::numeric_limits<long long>::max()), "c"},
         Reply::array({}));
  connection->xPending("s", Consumer::from("g", "c"));
}

TEST_F(ConnectionTest, XClaimOptionsOnTheWire) {
  expect({"XCLAIM", "s", "g", "c2", "60000", "1-0", "RETRYCOUNT", "3", "FORCE"},
         Reply::array({Reply::array({Reply::string("1-0"), Reply::strings({"f", "v"})})}));
  auto claimed = connection->xClaim("s", "g", "c2", XClaimOptions::minIdle(60s).ids({"1-0"}).retryCount(3).force());
  ASSERT_EQ(claimed.size(), 1u);
  EXPECT_EQ(claimed[0].stream(), "s");

  expect({"XCLAIM", "s", "g", "c2", "0", "1-0", "JUSTID"}, Reply::strings({"1-0"}));
  EXPECT_EQ(connection->xClaimJustId("s", "g", "c2", XClaimOptions::minIdle(0ms).ids({"1-0"})),
            (std::vector<RecordId>{RecordId::of("1-0")}));

  EXPECT_THROW(connection->xClaim("s", "g", "c2", XClaimOptions::minIdle(0ms)), std::invalid_argument);
}

TEST_F(ConnectionTest, XTrimAndXLen) {
  expect({"XTRIM", "s", "MAXLEN", "~", "100"}, Reply::integerValue(4));
  EXPECT_EQ(connection->xTrim("s", 100, true), 4);

  expect({"XTRIM", "s", "MAXLEN", "0"}, Reply::integerValue(1));
  EXPECT_EQ(connection->xTrim("s", 0), 1);
  EXPECT_THROW(connection->xTrim("s", -1), std::invalid_argument);

  expect({"XLEN", "s"}, Reply::integerValue(7));
  EXPECT_EQ(connection->xLen("s"), 7);
}

TEST_F(ConnectionTest, XInfoStream) {
  expect({"XINFO", "STREAM", "s"}, Reply::map({Reply::string("length"), Reply::integerValue(3)}));
  EXPECT_EQ(connection->xInfo("s").streamLength(), 3);
}

TEST_F(ConnectionTest, ScriptingAndServer) {
  expect({"EVAL", "return 1", "1", "k", "arg"}, Reply::integerValue(1));
  EXPECT_EQ(connection->eval("return 1", ReturnType::BOOLEAN, 1, {"k", "arg"}), Reply::boolean(true));
  EXPECT_THROW(connection->eval("return 1", ReturnType::VALUE, 3, {"k"}), std::invalid_argument);

  expect({"PING"}, Reply::status("PONG"));
  EXPECT_EQ(connection->ping(), "PONG");

  expect({"CONFIG", "GET", "maxmemory"}, Reply::strings({"maxmemory", "0"}));
  EXPECT_EQ(connection->getConfig("maxmemory"), (Properties{{"maxmemory", "0"}}));

  expect({"CLIENT", "SETNAME", "worker"}, Reply::status("OK"));
  connection->clientSetName("worker");
  EXPECT_THROW(connection->clientSetName("two words"), std::invalid_argument);

  EXPECT_THROW(connection->select(-1), std::invalid_argument);
}

TEST_F(ConnectionTest, ShutdownTreatsDisconnectAsSuccess) {
  EXPECT_CALL(*client, execute(Argv{"SHUTDOWN"})).WillOnce(::testing::Throw(ConnectionError("connection lost")));
  connection->shutdown();
  EXPECT_TRUE(connection->isClosed());
}

TEST_F(ConnectionTest, PublishSendsChannelAndMessage) {
  expect({"PUBLISH", "news", "hello"}, Reply::integerValue(2));
  EXPECT_EQ(connection->publish("news", "hello"), 2);
  EXPECT_THROW(connection->publish("", "hello"), std::invalid_argument);
}

TEST_F(ConnectionTest, SortWithParameters) {
  expect({"SORT", "ids", "BY", "weight_*", "LIMIT", "0", "10", "GET", "#", "GET", "name_*", "DESC", "ALPHA"},
         Reply::strings({"3", "c", "1", "a"}));
  auto params = SortParameters{}.by("weight_*").limitTo(0, 10).get("#").get("name_*").desc().alphabetical();
  EXPECT_EQ(connection->sort("ids", params), (std::vector<std::string>{"3", "c", "1", "a"}));

  expect({"SORT", "ids", "ASC", "STORE", "sorted"}, Reply::integerValue(4));
  EXPECT_EQ(connection->sort("ids", SortParameters{}.asc(), "sorted"), 4);
  EXPECT_THROW(connection->sort("ids", SortParameters{}, ""), std::invalid_argument);
}

TEST_F(ConnectionTest, SetScanFollowsCursor) {
  expect({"SSCAN", "s", "0", "MATCH", "a*", "COUNT", "2"}, Reply::array({Reply::string("5"), Reply::strings({"a1", "a2"})}));
  expect({"SSCAN", "s", "5", "MATCH", "a*", "COUNT", "2"}, Reply::array({Reply::string("0"), Reply::strings({"a3"})}));

  auto options = ScanOptions::none().match("a*").withCount(2).withType(DataType::SET);
  std::vector<std::string> members;
  uint64_t cursor{0};
  do {
    auto step = connection->sScan("s", cursor, options);
    members.insert(members.end(), step.items.begin(), step.items.end());
    cursor = step.cursorId;
  } while (cursor != 0);
  EXPECT_EQ(members, (std::vector<std::string>{"a1", "a2", "a3"}));
}

TEST_F(ConnectionTest, HashScanReturnsFieldValuePairs) {
  expect({"HSCAN", "h", "0"}, Reply::array({Reply::string("9"), Reply::strings({"f1", "v1"})}));
  expect({"HSCAN", "h", "9", "COUNT", "100"}, Reply::array({Reply::string("0"), Reply::strings({"f2", "v2"})}));

  auto first = connection->hScan("h", 0, ScanOptions::none());
  EXPECT_FALSE(first.finished());
  EXPECT_EQ(first.items, (KeyValues{{"f1", "v1"}}));

  auto second = connection->hScan("h", first.cursorId, ScanOptions::none().withCount(100));
  EXPECT_TRUE(second.finished());
  EXPECT_EQ(second.items, (KeyValues{{"f2", "v2"}}));
}

TEST_F(ConnectionTest, EvalShaAndScriptExists) {
  expect({"EVALSHA", "abc123", "1", "k", "v"}, Reply::status("OK"));
  EXPECT_EQ(connection->evalSha("abc123", ReturnType::STATUS, 1, {"k", "v"}), Reply::status("OK"));

  expect({"EVALSHA", "abc123", "0"}, Reply::string("17"));
  EXPECT_EQ(connection->evalSha("abc123", ReturnType::INTEGER, 0, {}), Reply::integerValue(17));

  expect({"SCRIPT", "EXISTS", "abc123", "def456"}, Reply::array({Reply::integerValue(1), Reply::integerValue(0)}));
  EXPECT_EQ(connection->scriptExists({"abc123", "def456"}), (std::vector<bool>{true, false}));

  EXPECT_THROW(connection->evalSha("", ReturnType::VALUE, 0, {}), std::invalid_argument);
  EXPECT_THROW(connection->scriptExists({}), std::invalid_argument);
}

TEST_F(ConnectionTest, ClientListAndTime) {
  expect({"CLIENT", "LIST"},
         Reply::string("id=7 addr=127.0.0.1:50312 name=worker db=0\r\nid=8 addr=127.0.0.1:50313 name= db=2\r\n"));
  auto clients = connection->clientList();
  ASSERT_EQ(clients.size(), 2u);
  EXPECT_EQ(clients[0].front(), (KeyValue{"id", "7"}));
  EXPECT_EQ(clients[0][2], (KeyValue{"name", "worker"}));
  EXPECT_EQ(clients[1][3], (KeyValue{"db", "2"}));

  expect({"TIME"}, Reply::strings({"1700000000", "999999"}));
  EXPECT_EQ(connection->time(), 1700000000999ms);
}

TEST_F(ConnectionTest, BlockingRotateBetweenLists) {
  expect({"BRPOPLPUSH", "src", "dst", "3"}, Reply::string("job"));
  EXPECT_EQ(connection->bRPopLPush(3s, "src", "dst"), "job");

  expect({"BRPOPLPUSH", "src", "dst", "0"}, Reply::nil());
  EXPECT_FALSE(connection->bRPopLPush(0s, "src", "dst").has_value());

  EXPECT_THROW(connection->bRPopLPush(1s, "", "dst"), std::invalid_argument);
}

TEST_F(ConnectionTest, ZMScoreKeepsMissingMembers) {
  expect({"ZMSCORE", "z", "a", "missing", "b"}, Reply::array({Reply::string("1.5"), Reply::nil(), Reply::doubleValue(-2)}));
  auto scores = connection->zMScore("z", {"a", "missing", "b"});
  ASSERT_EQ(scores.size(), 3u);
  EXPECT_EQ(scores[0], 1.5);
  EXPECT_FALSE(scores[1].has_value());
  EXPECT_EQ(scores[2], -2.0);
  EXPECT_THROW(connection->zMScore("z", {}), std::invalid_argument);
}

TEST_F(ConnectionTest, SetConfig) {
  expect({"CONFIG", "SET", "maxmemory-policy", "allkeys-lru"}, Reply::status("OK"));
  connection->setConfig("maxmemory-policy", "allkeys-lru");

  expect({"CONFIG", "SET", "nosuch", "1"}, Reply::error("ERR Unknown option or number of arguments for CONFIG SET"));
  EXPECT_THROW(connection->setConfig("nosuch", "1"), CommandError);
  EXPECT_THROW(connection->setConfig("", "1"), std::invalid_argument);
}

TEST_F(ConnectionTest, HyperLogLogCommands) {
  expect({"PFADD", "visitors", "ada", "bob"}, Reply::integerValue(1));
  EXPECT_EQ(connection->pfAdd("visitors", "ada", "bob"), 1);

  expect({"PFCOUNT", "visitors", "visitors:yesterday"}, Reply::integerValue(3));
  EXPECT_EQ(connection->pfCount({"visitors", "visitors:yesterday"}), 3);

  expect({"PFMERGE", "all", "visitors", "visitors:yesterday"}, Reply::status("OK"));
  connection->pfMerge("all", {"visitors", "visitors:yesterday"});

  EXPECT_THROW(connection->pfAdd("visitors", Values{}), std::invalid_argument);
  EXPECT_THROW(connection->pfCount({}), std::invalid_argument);
  EXPECT_THROW(connection->pfMerge("", {"visitors"}), std::invalid_argument);
}

TEST_F(ConnectionTest, GeoAddDistAndPos) {
  expect({"GEOADD", "cities", "13.361389", "38.115556", "Palermo", "15.087269", "37.502669", "Catania"},
         Reply::integerValue(2));
  EXPECT_EQ(connection->geoAdd("cities", {GeoLocation{"Palermo", {13.361389, 38.115556}},
                                          GeoLocation{"Catania", {15.087269, 37.502669}}}),
            2);

  expect({"GEODIST", "cities", "Palermo", "Catania", "km"}, Reply::string("166.2742"));
  EXPECT_EQ(connection->geoDist("cities", "Palermo", "Catania", GeoUnit::KILOMETERS),
            (Distance{166.2742, GeoUnit::KILOMETERS}));

  expect({"GEODIST", "cities", "Palermo", "Atlantis", "m"}, Reply::nil());
  EXPECT_FALSE(connection->geoDist("cities", "Palermo", "Atlantis").has_value());

  expect({"GEOPOS", "cities", "Palermo", "Atlantis"},
         Reply::array({Reply::strings({"13.361389", "38.115556"}), Reply::nil()}));
  auto positions = connection->geoPos("cities", {"Palermo", "Atlantis"});
  ASSERT_EQ(positions.size(), 2u);
  EXPECT_EQ(positions[0], (Point{13.361389, 38.115556}));
  EXPECT_FALSE(positions[1].has_value());

  EXPECT_THROW(connection->geoAdd("cities", std::vector<GeoLocation>{}), std::invalid_argument);
}

TEST_F(ConnectionTest, GeoSearchReadsRequestedExtras) {
  expect({"GEOSEARCH", "cities", "FROMLONLAT", "15", "37", "BYRADIUS", "200", "km", "ASC", "COUNT", "2", "WITHCOORD",
          "WITHDIST"},
         Reply::array({Reply::array({Reply::string("Catania"), Reply::string("56.4413"),
                                     Reply::strings({"15.087269", "37.502669"})}),
                       Reply::array({Reply::string("Palermo"), Reply::string("190.4424"),
                                     Reply::strings({"13.361389", "38.115556"})})}));
  auto args = GeoSearchArgs::fromLonLat({15, 37})
                  .byRadius(200, GeoUnit::KILOMETERS)
                  .sortAscending()
                  .limit(2)
                  .includeCoordinates()
                  .includeDistance();
  auto results = connection->geoSearch("cities", args);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].name, "Catania");
  EXPECT_EQ(results[0].distance, (Distance{56.4413, GeoUnit::KILOMETERS}));
  EXPECT_EQ(results[1].point, (Point{13.361389, 38.115556}));

  expect({"GEOSEARCH", "cities", "FROMMEMBER", "Palermo", "BYBOX", "400", "400", "km"},
         Reply::strings({"Palermo", "Catania"}));
  auto names = connection->geoSearch("cities", GeoSearchArgs::fromMember("Palermo").byBox(400, 400, GeoUnit::KILOMETERS));
  ASSERT_EQ(names.size(), 2u);
  EXPECT_EQ(names[1].name, "Catania");
  EXPECT_FALSE(names[1].distance.has_value());

  EXPECT_THROW(connection->geoSearch("cities", GeoSearchArgs::fromMember("Palermo")), std::invalid_argument);
  EXPECT_THROW((void)GeoSearchArgs::fromMember("Palermo").limit(0), std::invalid_argument);
}

TEST(ConnectionFactoryTest, KeepsConfig) {
  RedisConnectionFactory factory(Config("redis.local", 6380, 2));
  EXPECT_EQ(factory.getConfig().host(), "redis.local");
  EXPECT_EQ(factory.getConfig().portNumber(), 6380);
  EXPECT_EQ(factory.getConfig().database(), 2);
}
