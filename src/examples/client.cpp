#include <format>
#include <print>

#include "redisconn.hpp"

int main() {
  /**
   * A RedisConnectionFactory needs a Config. Each call to getConnection() opens a new connection.
   *
   */
  RedisConn::RedisConnectionFactory factory(RedisConn::Config("localhost", 6379));
  auto connection = factory.getConnection();

  /**
   * A connection cannot be copied; it is owned through a std::unique_ptr and closed when it goes out of
   * scope, or explicitly
   *
   */
  std::println("PING {}", connection->ping());

  /**
   * In pipeline mode commands are buffered and every command returns a default value. closePipeline() sends
   * them all at once and returns one Reply per command in order.
   *
   */
  connection->openPipeline();
  (void)connection->set("pipekey", "1");
  (void)connection->incr("pipekey");
  (void)connection->get("pipekey");
  for (const auto &reply : connection->closePipeline()) {
    std::println("pipelined: {}", reply.dump());
  }

  /**
   * If any pipelined command fails a PipelineError is thrown. It still carries every result.
   *
   */
  connection->openPipeline();
  (void)connection->set("pipelist", "not a list");
  (void)connection->lLen("pipelist");
  try {
    (void)connection->closePipeline();
  } catch (const RedisConn::PipelineError &e) {
    std::println("{}", e.what());
    for (const auto &reply : e.results()) std::println("  {}", reply.dump());
  }

  /**
   * A transaction queues commands on the server between multi() and exec()
   *
   */
  connection->watch({"pipekey"});
  connection->multi();
  (void)connection->incrBy("pipekey", 10);
  (void)connection->get("pipekey");
  auto results = connection->exec();
  if (results.empty()) {
    std::println("transaction aborted: pipekey changed");
  } else {
    for (const auto &reply : results) std::println("exec: {}", reply.dump());
  }

  // discard throws away everything queued
  connection->multi();
  (void)connection->del("pipekey");
  connection->discard();
  std::println("pipekey still exists: {}", connection->exists("pipekey"));

  // any command can be run through execute()
  std::println("{}", connection->execute("OBJECT", {"ENCODING", "pipekey"}).dump());

  (void)connection->del("pipekey", "pipelist");
  connection->close();
  std::println("closed: {}", connection->isClosed());
  return 0;
}
