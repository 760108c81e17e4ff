#include <chrono>
#include <format>
#include <print>
#include <thread>

#include "redisconn.hpp"

using namespace std::chrono_literals;

constexpr int N_MESSAGES = 10;

/**
 * The producer appends records to a stream on its own connection. Each record is capped to the most recent
 * 1000 entries.
 *
 */
void producer(RedisConn::RedisConnectionFactory &factory) {
  auto connection = factory.getConnection();
  for (int i = 0; i < N_MESSAGES; i++) {
    auto record = RedisConn::StreamRecords::newRecord().in("orders").ofMap(
        RedisConn::ByteRecord::Fields{{"order", std::to_string(i)}, {"qty", std::to_string(i * 3)}});
    auto id = connection->xAdd(record, RedisConn::XAddOptions::none().maxlen(1000).approximateTrimming(true));
    std::println("produced {}", id.value());
    std::this_thread::sleep_for(50ms);
  }
}

int main() {
  RedisConn::RedisConnectionFactory factory(RedisConn::Config("localhost", 6379));
  auto connection = factory.getConnection();

  // tidy up
  (void)connection->del("orders");

  /**
   * Create a consumer group. MKSTREAM creates the stream if it does not exist yet; the group starts at the
   * end of the stream.
   *
   */
  auto status = connection->xGroupCreate("orders", "billing", RedisConn::ReadOffset::latest(), true);
  std::println("xGroupCreate {}", status);

  std::jthread producerThread(producer, std::ref(factory));

  /**
   * Read new records as a member of the group, blocking up to a second for each batch, and acknowledge them
   * once they are handled
   *
   */
  auto consumer = RedisConn::Consumer::from("billing", "worker-1");
  auto options = RedisConn::StreamReadOptions::empty().count(4).block(1000ms);
  int consumed{0};
  while (consumed < N_MESSAGES) {
    auto records =
        connection->xReadGroup(consumer, options, {RedisConn::StreamOffset::create("orders",
                                                                                  RedisConn::ReadOffset::lastConsumed())});
    for (const auto &record : records) {
      std::println("consumed {} order {} qty {}", record.id().value(), record.get("order").value_or("?"),
                   record.get("qty").value_or("?"));
      (void)connection->xAck("orders", "billing", {record.id()});
      consumed++;
    }
  }

  producerThread.join();

  /**
   * Everything was acknowledged so nothing is pending
   *
   */
  auto summary = connection->xPending("orders", "billing");
  std::println("pending after ack: {}", summary.totalPendingMessages);

  // read the whole stream back without a group
  auto all = connection->xRange("orders", RedisConn::Range<std::string>::unbounded(), RedisConn::Limit::limit().count(3));
  std::println("first {} records of {}", all.size(), connection->xLen("orders"));

  auto info = connection->xInfo("orders");
  std::println("stream length {}, groups {}", info.streamLength().value_or(0), info.groupCount().value_or(0));

  (void)connection->xGroupDestroy("orders", "billing");
  (void)connection->del("orders");
  return 0;
}
