#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "redisconnreply.hpp"

namespace RedisConn {

  /**
   * @brief Base class for every failure reported by the connection layer
   *
   */
  class RedisError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
  };

  /**
   * @brief The native client could not connect, authenticate, or lost its socket
   *
   */
  class ConnectionError : public RedisError {
   public:
    using RedisError::RedisError;
  };

  /**
   * @brief The server answered a command with an error reply
   *
   */
  class CommandError : public RedisError {
   public:
    CommandError(const std::string &command_, const std::string &message)
        : RedisError(command_ + " failed: " + message), command{command_}, serverMessage{message} {}

    [[nodiscard]] const std::string &commandName() const noexcept { return command; }
    [[nodiscard]] const std::string &reply() const noexcept { return serverMessage; }

   private:
    std::string command;
    std::string serverMessage;
  };

  /**
   * @brief One or more commands in a pipeline failed
   *
   * @details The exception carries every reply read when the pipeline was closed, in the order the
   * commands were issued, so that callers can find out which ones succeeded.
   *
   */
  class PipelineError : public RedisError {
   public:
    PipelineError(const std::string &message, std::vector<Reply> results_)
        : RedisError(message), pipelineResults{std::move(results_)} {}

    [[nodiscard]] const std::vector<Reply> &results() const noexcept { return pipelineResults; }

   private:
    std::vector<Reply> pipelineResults;
  };

  class UnsupportedOperation : public RedisError {
   public:
    using RedisError::RedisError;
  };

  class SerializationError : public RedisError {
   public:
    using RedisError::RedisError;
  };
};  // namespace RedisConn
