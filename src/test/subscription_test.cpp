#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "redisconnconnection.hpp"
#include "testclients.hpp"

using namespace RedisConn;
using namespace std::chrono_literals;
using RedisConn::Testing::eventually;
using RedisConn::Testing::PubSubClient;

class SubscriptionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto pubsub = std::make_unique<PubSubClient>();
    client = pubsub.get();
    connection = std::make_unique<DefaultRedisConnection>(std::move(pubsub));
  }

  MessageListener collector() {
    return [this](const Message &message) {
      auto lock = std::scoped_lock(mutex);
      received.push_back(message);
    };
  }

  std::vector<Message> messages() {
    auto lock = std::scoped_lock(mutex);
    return received;
  }

  bool channelsAre(const std::vector<std::string> &expected) {
    return eventually([&] { return connection->getSubscription()->getChannels() == expected; });
  }

  PubSubClient *client{nullptr};
  std::unique_ptr<DefaultRedisConnection> connection;
  std::mutex mutex;
  std::vector<Message> received;
};

TEST_F(SubscriptionTest, DeliversChannelMessages) {
  connection->subscribe(collector(), {"news"});
  ASSERT_TRUE(connection->isSubscribed());
  ASSERT_TRUE(channelsAre({"news"}));

  client->publish("news", "hello");
  client->publish("weather", "ignored");
  ASSERT_TRUE(eventually([&] { return messages().size() == 1; }));

  auto message = messages().front();
  EXPECT_EQ(message.channel, "news");
  EXPECT_EQ(message.body, "hello");
  EXPECT_FALSE(message.pattern.has_value());
}

TEST_F(SubscriptionTest, DeliversPatternMessages) {
  connection->pSubscribe(collector(), {"news.*"});
  ASSERT_TRUE(eventually([&] { return connection->getSubscription()->getPatterns().size() == 1; }));

  client->publish("news.sport", "goal");
  ASSERT_TRUE(eventually([&] { return messages().size() == 1; }));

  auto message = messages().front();
  EXPECT_EQ(message.channel, "news.sport");
  EXPECT_EQ(message.body, "goal");
  EXPECT_EQ(message.pattern, "news.*");
}

TEST_F(SubscriptionTest, OtherCommandsAreRejectedWhileSubscribed) {
  connection->subscribe(collector(), {"news"});
  EXPECT_THROW(connection->get("k"), RedisError);
  EXPECT_THROW(connection->publish("news", "x"), RedisError);
  EXPECT_THROW(connection->subscribe(collector(), {"other"}), RedisError);
  EXPECT_THROW(connection->multi(), RedisError);
  EXPECT_TRUE(client->executedCommands().empty());
}

TEST_F(SubscriptionTest, AddsAndDropsChannels) {
  connection->subscribe(collector(), {"a"});
  auto subscription = connection->getSubscription();
  ASSERT_TRUE(channelsAre({"a"}));

  subscription->subscribe({"b", "c"});
  ASSERT_TRUE(channelsAre({"a", "b", "c"}));

  subscription->unsubscribe({"b"});
  ASSERT_TRUE(channelsAre({"a", "c"}));
  EXPECT_TRUE(subscription->isAlive());
}

TEST_F(SubscriptionTest, UnsubscribingFromEverythingEndsSubscription) {
  connection->subscribe(collector(), {"news"});
  auto subscription = connection->getSubscription();
  ASSERT_TRUE(channelsAre({"news"}));

  subscription->unsubscribe();
  ASSERT_TRUE(subscription->awaitTermination(2s));
  EXPECT_FALSE(subscription->isAlive());
  EXPECT_FALSE(connection->isSubscribed());
  EXPECT_THROW(subscription->subscribe({"again"}), RedisError);

  EXPECT_EQ(connection->ping(), "OK");
  EXPECT_EQ(client->executedCommands().back(), (Argv{"PING"}));
}

TEST_F(SubscriptionTest, DroppingLastChannelWhileSubscribingAnotherKeepsSubscription) {
  connection->subscribe(collector(), {"a"});
  auto subscription = connection->getSubscription();
  ASSERT_TRUE(channelsAre({"a"}));

  // both requests are normally picked up by the same send, so "unsubscribe a 0" arrives with "subscribe b"
  // still unconfirmed
  subscription->unsubscribe({"a"});
  subscription->subscribe({"b"});
  ASSERT_TRUE(channelsAre({"b"}));
  EXPECT_TRUE(subscription->isAlive());
  EXPECT_TRUE(connection->isSubscribed());

  client->publish("b", "still here");
  ASSERT_TRUE(eventually([&] { return messages().size() == 1; }));
  EXPECT_EQ(messages().front().channel, "b");

  subscription->unsubscribe();
  ASSERT_TRUE(subscription->awaitTermination(2s));
  EXPECT_EQ(client->unreadReplies(), 0u);
  EXPECT_FALSE(connection->isSubscribed());
}

TEST_F(SubscriptionTest, EndingSubscriptionConsumesEveryConfirmation) {
  connection->subscribe(collector(), {"a", "b"});
  auto subscription = connection->getSubscription();
  ASSERT_TRUE(channelsAre({"a", "b"}));

  subscription->pSubscribe({"x.*"});
  subscription->unsubscribe();
  subscription->pUnsubscribe();
  ASSERT_TRUE(subscription->awaitTermination(2s));
  EXPECT_EQ(client->unreadReplies(), 0u);
  EXPECT_TRUE(subscription->getChannels().empty());
  EXPECT_TRUE(subscription->getPatterns().empty());
}

TEST_F(SubscriptionTest, ListenerCanCloseItsOwnSubscription) {
  connection->subscribe(
      [this](const Message &message) {
        {
          auto lock = std::scoped_lock(mutex);
          received.push_back(message);
        }
        if (message.body == "stop") connection->getSubscription()->close();
      },
      {"control"});
  auto subscription = connection->getSubscription();
  ASSERT_TRUE(channelsAre({"control"}));

  client->publish("control", "stop");
  ASSERT_TRUE(subscription->awaitTermination(2s));
  EXPECT_FALSE(connection->isSubscribed());
  EXPECT_EQ(client->unreadReplies(), 0u);
  EXPECT_EQ(client->sentCommands().back(), (Argv{"PUNSUBSCRIBE"}));
}

TEST_F(SubscriptionTest, ListenerFailureDoesNotEndSubscription) {
  connection->subscribe(
      [this](const Message &message) {
        if (message.body == "bad") throw std::runtime_error("cannot handle message");
        auto lock = std::scoped_lock(mutex);
        received.push_back(message);
      },
      {"news"});
  ASSERT_TRUE(channelsAre({"news"}));

  client->publish("news", "bad");
  client->publish("news", "good");
  ASSERT_TRUE(eventually([&] { return messages().size() == 1; }));
  EXPECT_EQ(messages().front().body, "good");
  EXPECT_TRUE(connection->isSubscribed());
}

TEST_F(SubscriptionTest, CloseUnsubscribesAndClosesClient) {
  connection->subscribe(collector(), {"news"});
  ASSERT_TRUE(channelsAre({"news"}));

  connection->close();
  EXPECT_FALSE(client->isOpen());

  auto sent = client->sentCommands();
  ASSERT_GE(sent.size(), 3u);
  EXPECT_EQ(sent.front(), (Argv{"SUBSCRIBE", "news"}));
  EXPECT_EQ(sent[sent.size() - 2], (Argv{"UNSUBSCRIBE"}));
  EXPECT_EQ(sent.back(), (Argv{"PUNSUBSCRIBE"}));
}

TEST(SubscriptionValidationTest, RequiresListenerAndChannels) {
  PubSubClient client;
  EXPECT_THROW(Subscription(client, MessageListener{}), std::invalid_argument);

  Subscription subscription(client, [](const Message &) {});
  EXPECT_THROW(subscription.start({}, {}), std::invalid_argument);
  EXPECT_FALSE(subscription.isAlive());
}
