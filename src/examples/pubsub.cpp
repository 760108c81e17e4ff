#include <atomic>
#include <chrono>
#include <format>
#include <print>
#include <thread>

#include "redisconn.hpp"

using namespace std::chrono_literals;

int main() {
  /**
   * A subscribed connection cannot run any other command, so messages are published on a second
   * connection
   *
   */
  RedisConn::RedisConnectionFactory factory(RedisConn::Config("localhost", 6379));
  auto subscriber = factory.getConnection();
  auto publisher = factory.getConnection();

  std::atomic<int> received{0};

  /**
   * The listener runs on the subscription's own thread. Exceptions thrown from it are logged and dropped.
   *
   */
  auto listener = [&received](const RedisConn::Message &message) {
    std::println("[{}{}] {}", message.channel, message.pattern.has_value() ? " via " + message.pattern.value() : "",
                 message.body);
    received++;
  };

  subscriber->subscribe(listener, {"news", "weather"});
  auto subscription = subscriber->getSubscription();

  // subscribing is asynchronous; wait until the server has confirmed the channels
  while (subscription->getChannels().size() < 2) std::this_thread::sleep_for(10ms);
  std::println("subscribed to {}", subscription->getChannels());

  (void)publisher->publish("news", "first headline");
  (void)publisher->publish("weather", "sunny");

  /**
   * Channels and patterns can be added to a live subscription
   *
   */
  subscription->pSubscribe({"sport.*"});
  while (subscription->getPatterns().empty()) std::this_thread::sleep_for(10ms);

  auto listeners = publisher->publish("sport.tennis", "match point");
  std::println("sport.tennis had {} listener(s)", listeners);

  subscription->unsubscribe({"weather"});
  while (subscription->getChannels().size() > 1) std::this_thread::sleep_for(10ms);
  (void)publisher->publish("weather", "nobody hears this");

  while (received.load() < 3) std::this_thread::sleep_for(10ms);

  /**
   * Dropping every channel and pattern ends the subscription and hands the connection back for ordinary
   * commands
   *
   */
  subscription->unsubscribe();
  subscription->pUnsubscribe();
  if (subscription->awaitTermination(2s)) {
    std::println("subscription ended, PING {}", subscriber->ping());
  }

  std::println("received {} messages", received.load());
  return 0;
}
