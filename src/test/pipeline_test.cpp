#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>

#include "redisconnconnection.hpp"
#include "testclients.hpp"

using namespace RedisConn;
using RedisConn::Testing::MockNativeClient;
using ::testing::_;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;

class PipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto mock = std::make_unique<NiceMock<MockNativeClient>>();
    client = mock.get();
    connection = std::make_unique<DefaultRedisConnection>(std::move(mock));
  }

  NiceMock<MockNativeClient> *client{nullptr};
  std::unique_ptr<DefaultRedisConnection> connection;
};

TEST_F(PipelineTest, CommandsAreBufferedUntilClose) {
  {
    InSequence seq;
    EXPECT_CALL(*client, append(Argv{"SET", "k", "v"}));
    EXPECT_CALL(*client, append(Argv{"INCR", "n"}));
    EXPECT_CALL(*client, append(Argv{"GET", "k"}));
    EXPECT_CALL(*client, flush());
    EXPECT_CALL(*client, readReply()).WillOnce(Return(Reply::status("OK")));
    EXPECT_CALL(*client, readReply()).WillOnce(Return(Reply::integerValue(3)));
    EXPECT_CALL(*client, readReply()).WillOnce(Return(Reply::string("v")));
  }
  EXPECT_CALL(*client, execute(_)).Times(0);

  connection->openPipeline();
  EXPECT_TRUE(connection->isPipelined());
  EXPECT_FALSE(connection->set("k", "v"));
  EXPECT_EQ(connection->incr("n"), 0);
  EXPECT_FALSE(connection->get("k").has_value());

  auto results = connection->closePipeline();
  EXPECT_FALSE(connection->isPipelined());
  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0], Reply::boolean(true));
  EXPECT_EQ(results[1], Reply::integerValue(3));
  EXPECT_EQ(results[2], Reply::string("v"));
}

TEST_F(PipelineTest, DeferredResultsAreNormalized) {
  EXPECT_CALL(*client, readReply())
      .WillOnce(Return(Reply::string("2.5")))
      .WillOnce(Return(Reply::integerValue(0)));

  connection->openPipeline();
  connection->incrByFloat("f", 1.0);
  connection->hSetNX("h", "f", "v");
  auto results = connection->closePipeline();

  ASSERT_EQ(results.size(), 2u);
  EXPECT_DOUBLE_EQ(results[0].dval, 2.5);
  EXPECT_EQ(results[1], Reply::boolean(false));
}

TEST_F(PipelineTest, EmptyPipelineDoesNotFlush) {
  EXPECT_CALL(*client, flush()).Times(0);
  EXPECT_CALL(*client, readReply()).Times(0);
  connection->openPipeline();
  EXPECT_TRUE(connection->closePipeline().empty());
}

TEST_F(PipelineTest, ClosingWithoutPipelineReturnsNothing) {
  EXPECT_CALL(*client, flush()).Times(0);
  EXPECT_TRUE(connection->closePipeline().empty());
}

TEST_F(PipelineTest, ErrorRepliesRaisePipelineErrorWithAllResults) {
  EXPECT_CALL(*client, readReply())
      .WillOnce(Return(Reply::integerValue(1)))
      .WillOnce(Return(Reply::error("WRONGTYPE Operation against a key holding the wrong kind of value")))
      .WillOnce(Return(Reply::integerValue(2)));

  connection->openPipeline();
  connection->incr("a");
  connection->incr("b");
  connection->incr("c");

  try {
    connection->closePipeline();
    FAIL() << "expected PipelineError";
  } catch (const PipelineError &e) {
    ASSERT_EQ(e.results().size(), 3u);
    EXPECT_EQ(e.results()[0], Reply::integerValue(1));
    EXPECT_TRUE(e.results()[1].isError());
    EXPECT_EQ(e.results()[2], Reply::integerValue(2));
    EXPECT_STREQ(e.what(), "1 of 3 pipelined commands failed");
  }
  EXPECT_FALSE(connection->isPipelined());
}

TEST_F(PipelineTest, FailedConversionStillReadsEveryReply) {
  EXPECT_CALL(*client, readReply())
      .Times(3)
      .WillOnce(Return(Reply::string("abc")))
      .WillOnce(Return(Reply::integerValue(4)))
      .WillOnce(Return(Reply::string("v")));
  EXPECT_CALL(*client, execute(Argv{"GET", "after"})).WillOnce(Return(Reply::string("own reply")));

  connection->openPipeline();
  connection->eval("return 'abc'", ReturnType::INTEGER, 0, {});
  connection->incr("n");
  connection->get("k");

  try {
    connection->closePipeline();
    FAIL() << "expected PipelineError";
  } catch (const PipelineError &e) {
    ASSERT_EQ(e.results().size(), 3u);
    EXPECT_TRUE(e.results()[0].isError());
    EXPECT_NE(e.results()[0].str.find("EVAL"), std::string::npos);
    EXPECT_EQ(e.results()[1], Reply::integerValue(4));
    EXPECT_EQ(e.results()[2], Reply::string("v"));
    EXPECT_STREQ(e.what(), "1 of 3 pipelined commands failed");
  }

  EXPECT_EQ(connection->get("after"), std::optional<std::string>("own reply"));
}

TEST_F(PipelineTest, XInfoIsRejectedInPipeline) {
  connection->openPipeline();
  EXPECT_THROW(connection->xInfo("s"), UnsupportedOperation);
  EXPECT_THROW(connection->xInfoGroups("s"), UnsupportedOperation);
  EXPECT_THROW(connection->xInfoConsumers("s", "g"), UnsupportedOperation);
  EXPECT_THROW(connection->multi(), UnsupportedOperation);
  EXPECT_THROW(connection->subscribe([](const Message &) {}, {"ch"}), UnsupportedOperation);
}

TEST_F(PipelineTest, XAddInPipelineReturnsAutoGenerateSentinel) {
  EXPECT_CALL(*client, readReply()).WillOnce(Return(Reply::string("7-0")));
  connection->openPipeline();
  auto id = connection->xAdd("s", KeyValues{{"f", "v"}});
  EXPECT_TRUE(id.shouldBeAutoGenerated());
  auto results = connection->closePipeline();
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0], Reply::string("7-0"));
}

class TransactionTest : public PipelineTest {};

TEST_F(TransactionTest, QueuedCommandsAreReturnedByExec) {
  {
    InSequence seq;
    EXPECT_CALL(*client, execute(Argv{"MULTI"})).WillOnce(Return(Reply::status("OK")));
    EXPECT_CALL(*client, execute(Argv{"SET", "k", "v"})).WillOnce(Return(Reply::status("QUEUED")));
    EXPECT_CALL(*client, execute(Argv{"INCR", "n"})).WillOnce(Return(Reply::status("QUEUED")));
    EXPECT_CALL(*client, execute(Argv{"EXEC"}))
        .WillOnce(Return(Reply::array({Reply::status("OK"), Reply::integerValue(5)})));
  }

  connection->multi();
  EXPECT_TRUE(connection->isQueueing());
  connection->multi();
  EXPECT_FALSE(connection->set("k", "v"));
  EXPECT_EQ(connection->incr("n"), 0);

  auto results = connection->exec();
  EXPECT_FALSE(connection->isQueueing());
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0], Reply::boolean(true));
  EXPECT_EQ(results[1], Reply::integerValue(5));
}

TEST_F(TransactionTest, AbortedTransactionReturnsEmpty) {
  EXPECT_CALL(*client, execute(Argv{"MULTI"})).WillOnce(Return(Reply::status("OK")));
  EXPECT_CALL(*client, execute(Argv{"INCR", "n"})).WillOnce(Return(Reply::status("QUEUED")));
  EXPECT_CALL(*client, execute(Argv{"EXEC"})).WillOnce(Return(Reply::nil()));

  connection->multi();
  connection->incr("n");
  EXPECT_TRUE(connection->exec().empty());
}

TEST_F(TransactionTest, ExecWithoutMultiFails) {
  EXPECT_THROW(connection->exec(), RedisError);
  EXPECT_THROW(connection->discard(), RedisError);
}

TEST_F(TransactionTest, ResultCountMismatchFails) {
  EXPECT_CALL(*client, execute(Argv{"MULTI"})).WillOnce(Return(Reply::status("OK")));
  EXPECT_CALL(*client, execute(Argv{"INCR", "n"})).WillOnce(Return(Reply::status("QUEUED")));
  EXPECT_CALL(*client, execute(Argv{"EXEC"})).WillOnce(Return(Reply::array({})));

  connection->multi();
  connection->incr("n");
  EXPECT_THROW(connection->exec(), RedisError);
}

TEST_F(TransactionTest, FailedElementRaisesPipelineError) {
  EXPECT_CALL(*client, execute(Argv{"MULTI"})).WillOnce(Return(Reply::status("OK")));
  EXPECT_CALL(*client, execute(Argv{"INCR", "n"})).WillOnce(Return(Reply::status("QUEUED")));
  EXPECT_CALL(*client, execute(Argv{"EXEC"}))
      .WillOnce(Return(Reply::array({Reply::error("ERR value is not an integer or out of range")})));

  connection->multi();
  connection->incr("n");
  try {
    connection->exec();
    FAIL() << "expected PipelineError";
  } catch (const PipelineError &e) {
    ASSERT_EQ(e.results().size(), 1u);
    EXPECT_TRUE(e.results()[0].isError());
  }
}

TEST_F(TransactionTest, FailedConversionIsRecordedAsError) {
  EXPECT_CALL(*client, execute(Argv{"MULTI"})).WillOnce(Return(Reply::status("OK")));
  EXPECT_CALL(*client, execute(Argv{"EVAL", "return 'abc'", "0"})).WillOnce(Return(Reply::status("QUEUED")));
  EXPECT_CALL(*client, execute(Argv{"INCR", "n"})).WillOnce(Return(Reply::status("QUEUED")));
  EXPECT_CALL(*client, execute(Argv{"EXEC"}))
      .WillOnce(Return(Reply::array({Reply::string("abc"), Reply::integerValue(2)})));

  connection->multi();
  connection->eval("return 'abc'", ReturnType::INTEGER, 0, {});
  connection->incr("n");
  try {
    connection->exec();
    FAIL() << "expected PipelineError";
  } catch (const PipelineError &e) {
    ASSERT_EQ(e.results().size(), 2u);
    EXPECT_TRUE(e.results()[0].isError());
    EXPECT_EQ(e.results()[1], Reply::integerValue(2));
  }
  EXPECT_FALSE(connection->isQueueing());
}

TEST_F(TransactionTest, DiscardDropsQueuedCommands) {
  EXPECT_CALL(*client, execute(Argv{"MULTI"})).WillOnce(Return(Reply::status("OK")));
  EXPECT_CALL(*client, execute(Argv{"INCR", "n"})).WillOnce(Return(Reply::status("QUEUED")));
  EXPECT_CALL(*client, execute(Argv{"DISCARD"})).WillOnce(Return(Reply::status("OK")));

  connection->multi();
  connection->incr("n");
  connection->discard();
  EXPECT_FALSE(connection->isQueueing());
}

TEST_F(TransactionTest, WatchIsRejectedDuringTransaction) {
  EXPECT_CALL(*client, execute(Argv{"WATCH", "k"})).WillOnce(Return(Reply::status("OK")));
  EXPECT_CALL(*client, execute(Argv{"MULTI"})).WillOnce(Return(Reply::status("OK")));

  connection->watch({"k"});
  connection->multi();
  EXPECT_THROW(connection->watch({"k"}), UnsupportedOperation);
  EXPECT_THROW(connection->xInfo("s"), UnsupportedOperation);
  EXPECT_THROW(connection->openPipeline(), UnsupportedOperation);
}

TEST_F(TransactionTest, QueueingErrorThrowsImmediately) {
  EXPECT_CALL(*client, execute(Argv{"MULTI"})).WillOnce(Return(Reply::status("OK")));
  EXPECT_CALL(*client, execute(Argv{"NOSUCH"})).WillOnce(Return(Reply::error("ERR unknown command 'NOSUCH'")));

  connection->multi();
  EXPECT_THROW(connection->execute("NOSUCH", {}), CommandError);
}
