#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "redisconndriver.hpp"
#include "redisconnerrors.hpp"
#include "redisconnlog.hpp"
#include "redisconnreply.hpp"

namespace RedisConn {
  using namespace std::chrono_literals;

  /**
   * @brief A message received on a subscribed channel
   *
   * @struct Message
   */
  struct Message {
    std::string channel;                /**< The channel the message was published to */
    std::string body;                   /**< The message payload */
    std::optional<std::string> pattern; /**< The matching pattern for messages received through `PSUBSCRIBE` */
  };

  using MessageListener = std::function<void(const Message &)>;

  /**
   * @brief Command words for communication with a running subscription
   *
   */
  enum class SubscriptionCommand { SUBSCRIBE, PSUBSCRIBE, UNSUBSCRIBE, PUNSUBSCRIBE };

  /**
   * @brief A request queued by the application for the subscription thread
   *
   */
  struct SubscriptionRequest {
    SubscriptionCommand command;
    std::vector<std::string> channels;
  };

  /**
   * @class Subscription
   *
   * @brief The pub/sub state of a subscribed connection
   *
   * @details A `Subscription` owns all reads on its `NativeClient` for as long as it is alive. It runs one
   * thread which sends the channel and pattern changes requested through `subscribe()`, `pSubscribe()`,
   * `unsubscribe()` and `pUnsubscribe()`, polls the client for replies and hands every published message to
   * the listener. Requests from the application are placed in a queue guarded by a mutex and picked up
   * by the thread between polls.
   *
   * The active channels and patterns are those the server has confirmed. The thread counts the
   * confirmations still owed for every command it has sent. It stops once the server reports that no
   * channel or pattern is left, nothing is owed and nothing is queued, or when the subscription is closed.
   * The subscription is then no longer alive and the client may be used for ordinary commands again.
   *
   */
  class Subscription {
   public:
    Subscription(NativeClient &client_, MessageListener listener_, std::chrono::milliseconds pollInterval_ = 100ms)
        : client{client_}, listener{std::move(listener_)}, pollInterval{pollInterval_} {
      if (!listener) throw std::invalid_argument("MessageListener must not be empty");
      finished = finishedPromise.get_future().share();
    }

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    ~Subscription() {
      if (onSubscriptionThread()) {
        subThread.request_stop();
        subThread.detach();
        return;
      }
      close();
    }

    /**
     * @brief Start the subscription thread
     *
     * @param channels The initial channels (possibly empty)
     * @param patterns The initial patterns (possibly empty)
     *
     */
    void start(std::vector<std::string> channels, std::vector<std::string> patterns) {
      if (channels.empty() && patterns.empty()) {
        throw std::invalid_argument("At least one channel or pattern is required");
      }
      {
        auto lock = std::scoped_lock(queueMutex);
        if (!channels.empty()) requests.push_back(SubscriptionRequest{SubscriptionCommand::SUBSCRIBE, std::move(channels)});
        if (!patterns.empty()) {
          requests.push_back(SubscriptionRequest{SubscriptionCommand::PSUBSCRIBE, std::move(patterns)});
        }
        alive = true;
      }
      subThread = std::jthread([this](std::stop_token tok) { run(tok); });
    }

    void subscribe(std::vector<std::string> channels) {
      if (channels.empty()) throw std::invalid_argument("At least one channel is required");
      enqueue(SubscriptionCommand::SUBSCRIBE, std::move(channels), true);
    }

    void pSubscribe(std::vector<std::string> patterns) {
      if (patterns.empty()) throw std::invalid_argument("At least one pattern is required");
      enqueue(SubscriptionCommand::PSUBSCRIBE, std::move(patterns), true);
    }

    /**
     * @brief Drop channels; an empty list drops every channel
     *
     */
    void unsubscribe(std::vector<std::string> channels = {}) {
      enqueue(SubscriptionCommand::UNSUBSCRIBE, std::move(channels), false);
    }

    /**
     * @brief Drop patterns; an empty list drops every pattern
     *
     */
    void pUnsubscribe(std::vector<std::string> patterns = {}) {
      enqueue(SubscriptionCommand::PUNSUBSCRIBE, std::move(patterns), false);
    }

    /**
     * @brief Unsubscribe from everything and wait for the subscription thread to finish
     *
     * @details Called from the listener, the thread is only asked to stop; it unsubscribes and ends once the
     * listener has returned.
     *
     */
    void close() {
      if (onSubscriptionThread()) {
        subThread.request_stop();
        return;
      }
      if (subThread.joinable()) {
        subThread.request_stop();
        subThread.join();
      }
      alive = false;
    }

    [[nodiscard]] bool isAlive() const noexcept { return alive; }

    [[nodiscard]] std::vector<std::string> getChannels() const {
      auto lock = std::scoped_lock(stateMutex);
      return {activeChannels.begin(), activeChannels.end()};
    }

    [[nodiscard]] std::vector<std::string> getPatterns() const {
      auto lock = std::scoped_lock(stateMutex);
      return {activePatterns.begin(), activePatterns.end()};
    }

    /**
     * @brief Wait until the subscription has ended
     *
     * @return `true` if the subscription ended within `timeout`. A failure of the subscription thread
     * is rethrown.
     *
     */
    bool awaitTermination(std::chrono::milliseconds timeout) const {
      if (finished.wait_for(timeout) != std::future_status::ready) return false;
      finished.get();
      return true;
    }

   private:
    NativeClient &client;
    MessageListener listener;
    std::chrono::milliseconds pollInterval;

    std::mutex queueMutex;
    std::deque<SubscriptionRequest> requests;

    mutable std::mutex stateMutex;
    std::set<std::string> activeChannels;
    std::set<std::string> activePatterns;

    bool sentAny{false};
    std::set<std::string> serverChannels;
    std::set<std::string> serverPatterns;
    long long owed{0};
    long long lastRemaining{0};
    std::atomic_bool alive{false};
    std::promise<void> finishedPromise;
    std::shared_future<void> finished;
    std::jthread subThread;

    bool onSubscriptionThread() const noexcept {
      return subThread.joinable() && subThread.get_id() == std::this_thread::get_id();
    }

    /**
     * @brief Queue a request for the thread
     *
     * @details The alive check and the push happen under the queue lock, which the thread also holds when it
     * decides to finish, so a request is either seen by the thread or rejected here.
     *
     */
    void enqueue(SubscriptionCommand command, std::vector<std::string> channels, bool requireAlive) {
      auto lock = std::scoped_lock(queueMutex);
      if (!alive) {
        if (requireAlive) throw RedisError("Subscription is no longer alive");
        return;
      }
      requests.push_back(SubscriptionRequest{command, std::move(channels)});
    }

    /**
     * @brief Write one command and add the confirmations the server will send for it to `owed`
     *
     * @details The server answers every named channel once. A bare `UNSUBSCRIBE`/`PUNSUBSCRIBE` answers
     * once per channel or pattern it drops, or once with a nil name if there was none. `serverChannels` and
     * `serverPatterns` follow what the server will hold after every command written so far.
     *
     */
    void send(SubscriptionCommand command, const std::vector<std::string> &channels) {
      Argv argv{std::string(commandWord(command))};
      argv.insert(argv.end(), channels.begin(), channels.end());
      client.append(argv);

      auto &names =
          (command == SubscriptionCommand::SUBSCRIBE || command == SubscriptionCommand::UNSUBSCRIBE) ? serverChannels
                                                                                                      : serverPatterns;
      switch (command) {
        case SubscriptionCommand::SUBSCRIBE:
        case SubscriptionCommand::PSUBSCRIBE:
          names.insert(channels.begin(), channels.end());
          owed += static_cast<long long>(channels.size());
          break;
        case SubscriptionCommand::UNSUBSCRIBE:
        case SubscriptionCommand::PUNSUBSCRIBE:
          if (channels.empty()) {
            owed += std::max<long long>(1, static_cast<long long>(names.size()));
            names.clear();
          } else {
            for (const auto &name : channels) names.erase(name);
            owed += static_cast<long long>(channels.size());
          }
          break;
      }
      sentAny = true;
    }

    /**
     * @brief Whether the server holds nothing and owes nothing; ends the subscription if nothing is queued
     *
     */
    bool finishIfIdle() {
      if (owed > 0 || lastRemaining != 0 || !sentAny) return false;
      auto lock = std::scoped_lock(queueMutex);
      if (!requests.empty()) return false;
      alive = false;
      return true;
    }

    static std::string_view commandWord(SubscriptionCommand command) {
      switch (command) {
        case SubscriptionCommand::SUBSCRIBE:
          return "SUBSCRIBE";
        case SubscriptionCommand::PSUBSCRIBE:
          return "PSUBSCRIBE";
        case SubscriptionCommand::UNSUBSCRIBE:
          return "UNSUBSCRIBE";
        case SubscriptionCommand::PUNSUBSCRIBE:
          break;
      }
      return "PUNSUBSCRIBE";
    }

    void sendPending() {
      std::deque<SubscriptionRequest> pending;
      {
        auto lock = std::scoped_lock(queueMutex);
        pending.swap(requests);
      }
      if (pending.empty()) return;

      for (const auto &req : pending) send(req.command, req.channels);
      client.flush();
    }

    /**
     * @brief Handle one reply from the server
     *
     */
    void dispatch(const Reply &reply) {
      if (!reply.isAggregate() || reply.elements.empty()) {
        if (reply.isError()) log()->warn("subscription received error reply: {}", reply.str);
        return;
      }

      const auto &kind = reply.elements[0].str;
      const auto &elems = reply.elements;

      if (kind == "message" && elems.size() >= 3) {
        deliver(Message{elems[1].str, elems[2].str, std::nullopt});
      } else if (kind == "pmessage" && elems.size() >= 4) {
        deliver(Message{elems[2].str, elems[3].str, elems[1].str});
      } else if ((kind == "subscribe" || kind == "psubscribe" || kind == "unsubscribe" ||
                  kind == "punsubscribe") &&
                 elems.size() >= 3) {
        auto remaining = elems[2].integer;
        {
          auto lock = std::scoped_lock(stateMutex);
          auto &target = (kind == "subscribe" || kind == "unsubscribe") ? activeChannels : activePatterns;
          if (kind == "subscribe" || kind == "psubscribe") {
            target.insert(elems[1].str);
          } else if (!elems[1].isNil()) {
            target.erase(elems[1].str);
          }
        }
        if (owed > 0) owed--;
        lastRemaining = remaining;
        log()->debug("{} {} ({} active, {} unconfirmed)", kind, elems[1].str, remaining, owed);
      }
    }

    void deliver(const Message &message) {
      try {
        listener(message);
      } catch (const std::exception &e) {
        log()->error("message listener failed on channel {}: {}", message.channel, e.what());
      }
    }

    /**
     * @brief Unsubscribe from all channels and patterns and read every confirmation still owed
     *
     * @details Requests queued but not yet sent are dropped. `PUNSUBSCRIBE` is sent last, so once nothing
     * is owed the reply stream is fully consumed.
     *
     */
    void drainOnClose() {
      {
        auto lock = std::scoped_lock(queueMutex);
        alive = false;
        requests.clear();
      }
      if (!sentAny) return;

      send(SubscriptionCommand::UNSUBSCRIBE, {});
      send(SubscriptionCommand::PUNSUBSCRIBE, {});
      client.flush();

      auto deadline = std::chrono::steady_clock::now() + 1s;
      while (owed > 0 && std::chrono::steady_clock::now() < deadline) {
        auto reply = client.pollReply(pollInterval);
        if (reply.has_value()) dispatch(*reply);
      }
      if (owed > 0) log()->warn("subscription closed before the server confirmed every unsubscribe");
    }

    void run(std::stop_token tok) {
      try {
        bool finished{false};
        while (!finished && !tok.stop_requested()) {
          sendPending();
          auto reply = client.pollReply(pollInterval);
          if (reply.has_value()) {
            dispatch(*reply);
            finished = finishIfIdle();
          }
        }
        if (!finished) drainOnClose();
        log()->debug("subscription finished");
        alive = false;
        finishedPromise.set_value();
      } catch (const std::exception &e) {
        log()->error("subscription failed: {}", e.what());
        alive = false;
        finishedPromise.set_exception(std::current_exception());
      }
    }
  };
};  // namespace RedisConn
