#pragma once
#include <gmock/gmock.h>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "redisconndriver.hpp"
#include "redisconnreply.hpp"

namespace RedisConn::Testing {
  using namespace std::chrono_literals;

  class MockNativeClient : public NativeClient {
   public:
    MOCK_METHOD(Reply, execute, (const Argv &argv), (override));
    MOCK_METHOD(void, append, (const Argv &argv), (override));
    MOCK_METHOD(void, flush, (), (override));
    MOCK_METHOD(Reply, readReply, (), (override));
    MOCK_METHOD(std::optional<Reply>, pollReply, (std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(bool, isOpen, (), (const, override));
  };

  /**
   * @brief An in-memory stand-in for a server connection in pub/sub mode
   *
   * @details Appended `SUBSCRIBE`, `PSUBSCRIBE`, `UNSUBSCRIBE` and `PUNSUBSCRIBE` commands are answered on
   * `flush()` with the confirmations a server would push, and `publish()` queues a message for every
   * matching subscription. Ordinary commands sent through `execute()` answer `OK`.
   *
   */
  class PubSubClient : public NativeClient {
   public:
    Reply execute(const Argv &argv) override {
      auto lock = std::scoped_lock(mutex);
      executed.push_back(argv);
      return Reply::status("OK");
    }

    void append(const Argv &argv) override {
      auto lock = std::scoped_lock(mutex);
      outbox.push_back(argv);
    }

    void flush() override {
      {
        auto lock = std::scoped_lock(mutex);
        for (const auto &argv : outbox) answer(argv);
        sent.insert(sent.end(), outbox.begin(), outbox.end());
        outbox.clear();
      }
      ready.notify_all();
    }

    Reply readReply() override { return pollReply(1s).value_or(Reply::nil()); }

    std::optional<Reply> pollReply(std::chrono::milliseconds timeout) override {
      auto lock = std::unique_lock(mutex);
      if (!ready.wait_for(lock, timeout, [this] { return !inbox.empty(); })) return std::nullopt;
      auto reply = std::move(inbox.front());
      inbox.pop_front();
      return reply;
    }

    void close() override {
      auto lock = std::scoped_lock(mutex);
      open = false;
    }

    [[nodiscard]] bool isOpen() const override {
      auto lock = std::scoped_lock(mutex);
      return open;
    }

    /**
     * @brief Deliver `body` to every subscription matching `channel`; a pattern matches by prefix before `*`
     *
     */
    void publish(const std::string &channel, const std::string &body) {
      {
        auto lock = std::scoped_lock(mutex);
        if (channels.contains(channel)) {
          inbox.push_back(Reply::push({Reply::string("message"), Reply::string(channel), Reply::string(body)}));
        }
        for (const auto &pattern : patterns) {
          auto prefix = pattern.substr(0, pattern.find('*'));
          if (channel.starts_with(prefix)) {
            inbox.push_back(Reply::push({Reply::string("pmessage"), Reply::string(pattern), Reply::string(channel),
                                         Reply::string(body)}));
          }
        }
      }
      ready.notify_all();
    }

    std::vector<Argv> sentCommands() const {
      auto lock = std::scoped_lock(mutex);
      return sent;
    }

    std::vector<Argv> executedCommands() const {
      auto lock = std::scoped_lock(mutex);
      return executed;
    }

    /**
     * @brief Replies pushed by the "server" that nobody has read yet
     *
     */
    std::size_t unreadReplies() const {
      auto lock = std::scoped_lock(mutex);
      return inbox.size();
    }

   private:
    mutable std::mutex mutex;
    std::condition_variable ready;
    std::deque<Reply> inbox;
    std::vector<Argv> outbox;
    std::vector<Argv> sent;
    std::vector<Argv> executed;
    std::set<std::string> channels;
    std::set<std::string> patterns;
    bool open{true};

    long long active() const { return static_cast<long long>(channels.size() + patterns.size()); }

    void confirm(const std::string &kind, std::optional<std::string> name) {
      inbox.push_back(Reply::push({Reply::string(kind), name.has_value() ? Reply::string(*name) : Reply::nil(),
                                   Reply::integerValue(active())}));
    }

    void answer(const Argv &argv) {
      const auto &command = argv.front();
      std::vector<std::string> names(argv.begin() + 1, argv.end());
      if (command == "SUBSCRIBE" || command == "PSUBSCRIBE") {
        auto &target = command == "SUBSCRIBE" ? channels : patterns;
        for (const auto &name : names) {
          target.insert(name);
          confirm(command == "SUBSCRIBE" ? "subscribe" : "psubscribe", name);
        }
        return;
      }
      auto &target = command == "UNSUBSCRIBE" ? channels : patterns;
      auto kind = command == "UNSUBSCRIBE" ? "unsubscribe" : "punsubscribe";
      if (names.empty()) names.assign(target.begin(), target.end());
      if (names.empty()) {
        confirm(kind, std::nullopt);
        return;
      }
      for (const auto &name : names) {
        target.erase(name);
        confirm(kind, name);
      }
    }
  };

  /**
   * @brief Poll `condition` until it holds or `timeout` expires
   *
   */
  inline bool eventually(const std::function<bool()> &condition, std::chrono::milliseconds timeout = 2s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (condition()) return true;
      std::this_thread::sleep_for(5ms);
    }
    return condition();
  }
};  // namespace RedisConn::Testing
