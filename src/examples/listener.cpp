#include <print>
#include <thread>

#include "redisconn.hpp"

using namespace std::chrono_literals;

/**
 * A callable object to handle records as they arrive. Any callable with an appropriate signature can be used
 * with std::async or a thread: a class or struct such as this one, a lambda, a free function or a class member
 * function.
 *
 */
struct RecordHandler {
  void operator()(const RedisConn::ByteRecord &record) {
    std::println("RecordHandler: stream |{}| id |{}| fields |{}|", record.stream(), record.id().value(),
                 record.value());
  }
};

int main() {
  RedisConn::RedisConnectionFactory factory(RedisConn::Config("localhost", 6379));

  /**
   * A ReactiveRedisConnection owns a connection and runs every command on its own worker thread. Commands
   * return std::futures and are executed in the order they were submitted.
   *
   */
  RedisConn::ReactiveRedisConnection reactive(factory.getConnection());
  auto &streams = reactive.streamCommands();

  (void)reactive.keyCommands().del("events").get();

  /**
   * Batch commands take a list of command objects and return one CommandResponse per command, pairing the
   * input with its result
   *
   */
  auto added = streams
                   .xAdd({RedisConn::AddStreamRecord::body({{"type", "login"}, {"user", "ada"}}).to("events"),
                          RedisConn::AddStreamRecord::body({{"type", "logout"}, {"user", "ada"}}).to("events"),
                          RedisConn::AddStreamRecord::body({{"type", "login"}, {"user", "bob"}}).to("events").maxlen(100)})
                   .get();
  for (const auto &response : added) {
    std::println("added {} to {}", response.getOutput().value(), response.getInput().getKey());
  }

  // the single forms return the plain result
  auto length = streams.xLen("events");
  std::println("xLen {}", length.get());

  /**
   * Futures let the caller get on with something else while the worker runs the command
   *
   */
  auto records = streams.xRange("events", RedisConn::Range<std::string>::unbounded());
  std::this_thread::sleep_for(10ms);
  RecordHandler handler;
  for (const auto &record : records.get()) handler(record);

  /**
   * Errors are delivered through the future
   *
   */
  (void)reactive.stringCommands().set("notastream", "value").get();
  auto failed = streams.xLen("notastream");
  try {
    (void)failed.get();
  } catch (const RedisConn::CommandError &e) {
    std::println("xLen failed: {}", e.what());
  }

  // anything else can be submitted as a callable taking the connection
  auto info = reactive.submit([](RedisConn::RedisConnection &c) { return c.xInfo("events"); });
  std::println("events length {}", info.get().streamLength().value_or(0));

  (void)reactive.keyCommands().del(RedisConn::Keys{"events", "notastream"}).get();

  /**
   * close() waits for the running command and fails anything not yet started
   *
   */
  reactive.close();
  return 0;
}
