#pragma once

#include <hiredis/hiredis.h>
#include <poll.h>
#include <sys/time.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "redisconnconfig.hpp"
#include "redisconnerrors.hpp"
#include "redisconnlog.hpp"
#include "redisconnreply.hpp"

namespace RedisConn {

  inline std::once_flag sigSetup;

  constexpr unsigned tcpTimeoutMillis = 3600 * 1000;

  /**
   * @brief A command and its arguments, each a binary-safe byte string
   *
   */
  using Argv = std::vector<std::string>;

  /**
   * @class NativeClient
   *
   * @brief The seam between the connection layer and a native Redis driver
   *
   * @details Everything below this interface (sockets, RESP framing, reply parsing) belongs to the
   * driver. The connection layer only ever sends an `Argv` and receives a `Reply`. A server error is not an
   * exception at this level: it comes back as a `Reply` of type `ERROR` and the caller decides what to do
   * with it. Failures of the transport itself are reported by throwing `ConnectionError`.
   *
   */
  class NativeClient {
   public:
    virtual ~NativeClient() = default;

    /**
     * @brief Send one command and wait for its reply
     *
     */
    virtual Reply execute(const Argv &argv) = 0;

    /**
     * @brief Queue a command in the output buffer without waiting for the reply (pipelining)
     *
     */
    virtual void append(const Argv &argv) = 0;

    /**
     * @brief Write the output buffer to the socket
     *
     */
    virtual void flush() = 0;

    /**
     * @brief Block until the next pending reply is available
     *
     */
    virtual Reply readReply() = 0;

    /**
     * @brief Wait at most `timeout` for an unsolicited reply (used by subscriptions)
     *
     */
    virtual std::optional<Reply> pollReply(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
    [[nodiscard]] virtual bool isOpen() const = 0;
  };

  /**
   * @brief The custom deleter for the RAII `std::unique_ptr` that encapsulates a `redisReply` pointer
   *
   */
  struct ReplyDeleter {
    void operator()(redisReply *reply) const noexcept {
      if (reply) ::freeReplyObject(reply);
    }
  };

  /**
   * @brief The custom deleter for the RAII `std::unique_ptr` that encapsulates a `redisContext` pointer
   *
   */
  struct ContextDeleter {
    void operator()(redisContext *ctx) const noexcept {
      if (ctx) ::redisFree(ctx);
    }
  };

  using ReplyPointer = std::unique_ptr<redisReply, ReplyDeleter>;
  using ContextPointer = std::unique_ptr<redisContext, ContextDeleter>;

  /**
   * @class HiredisClient
   *
   * @brief A `NativeClient` backed by a synchronous hiredis `redisContext`
   *
   * @details The context is created, authenticated and configured in the constructor; a client that
   * fails any of these steps throws `ConnectionError` and is never half-open. RESP3 push messages are
   * not auto-freed so that a subscribed connection receives them through `pollReply()`.
   *
   */
  class HiredisClient : public NativeClient {
   public:
    explicit HiredisClient() = delete;

    explicit HiredisClient(const Config &cfg) {
      HiredisClient::setSignals();
      context = createContext(cfg);
    }

    HiredisClient(const HiredisClient &) = delete;
    HiredisClient(HiredisClient &&) = delete;
    HiredisClient operator=(const HiredisClient &) = delete;
    HiredisClient &operator=(HiredisClient &&) = delete;

    ~HiredisClient() override = default;

    Reply execute(const Argv &argv) override {
      auto [args, lens] = toArgv(argv);
      ReplyPointer replyPtr(static_cast<redisReply *>(
          ::redisCommandArgv(requireContext(), static_cast<int>(args.size()), args.data(), lens.data())));
      if (!replyOk(replyPtr)) {
        throw ConnectionError(std::format("{} failed: {}", argv.empty() ? "" : argv.front(), errorText()));
      }
      return toReply(replyPtr.get());
    }

    void append(const Argv &argv) override {
      auto [args, lens] = toArgv(argv);
      if (::redisAppendCommandArgv(requireContext(), static_cast<int>(args.size()), args.data(), lens.data()) !=
          REDIS_OK) {
        throw ConnectionError(std::format("append failed: {}", errorText()));
      }
    }

    void flush() override {
      int done{0};
      while (!done) {
        if (::redisBufferWrite(requireContext(), &done) == REDIS_ERR) {
          throw ConnectionError(std::format("flush failed: {}", errorText()));
        }
      }
    }

    Reply readReply() override {
      void *reply{nullptr};
      if (::redisGetReply(requireContext(), &reply) != REDIS_OK) {
        throw ConnectionError(std::format("reading reply failed: {}", errorText()));
      }
      auto replyPtr = ReplyPointer(static_cast<redisReply *>(reply));
      return toReply(replyPtr.get());
    }

    std::optional<Reply> pollReply(std::chrono::milliseconds timeout) override {
      auto *ctx = requireContext();
      void *reply{nullptr};

      // a previous read may already have buffered more than one message
      if (::redisGetReplyFromReader(ctx, &reply) == REDIS_ERR) {
        throw ConnectionError(std::format("reading reply failed: {}", errorText()));
      }
      if (reply != nullptr) {
        auto replyPtr = ReplyPointer(static_cast<redisReply *>(reply));
        return toReply(replyPtr.get());
      }

      pollfd pfd{ctx->fd, POLLIN, 0};
      int pollResult;
      do {
        pollResult = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
      } while (pollResult < 0 && errno == EINTR);

      if (pollResult < 0) throw ConnectionError(std::format("poll failed: errno {}", errno));
      if (pollResult == 0) return std::nullopt;
      if ((pfd.revents & (POLLERR | POLLNVAL)) || ((pfd.revents & POLLHUP) && !(pfd.revents & POLLIN))) {
        throw ConnectionError("connection closed by server");
      }

      if (::redisBufferRead(ctx) == REDIS_ERR) {
        throw ConnectionError(std::format("reading reply failed: {}", errorText()));
      }
      if (::redisGetReplyFromReader(ctx, &reply) == REDIS_ERR) {
        throw ConnectionError(std::format("reading reply failed: {}", errorText()));
      }
      if (reply == nullptr) return std::nullopt;  // partial message, wait for the rest

      auto replyPtr = ReplyPointer(static_cast<redisReply *>(reply));
      return toReply(replyPtr.get());
    }

    void close() override { context.reset(); }

    [[nodiscard]] bool isOpen() const override { return context != nullptr && context->err == 0; }

    /**
     * @brief Deep-copy a hiredis reply tree into a `Reply`
     *
     */
    static Reply toReply(const redisReply *reply) {
      Reply out;
      if (reply == nullptr) return out;

      out.type = static_cast<ReplyType>(reply->type);
      switch (reply->type) {
        case REDIS_REPLY_INTEGER:
        case REDIS_REPLY_BOOL:
          out.integer = reply->integer;
          break;
        case REDIS_REPLY_DOUBLE:
          out.dval = reply->dval;
          if (reply->str) out.str.assign(reply->str, reply->len);
          break;
        case REDIS_REPLY_STRING:
        case REDIS_REPLY_STATUS:
        case REDIS_REPLY_ERROR:
        case REDIS_REPLY_BIGNUM:
        case REDIS_REPLY_VERB:
          if (reply->str) out.str.assign(reply->str, reply->len);
          break;
        case REDIS_REPLY_ARRAY:
        case REDIS_REPLY_MAP:
        case REDIS_REPLY_SET:
        case REDIS_REPLY_ATTR:
        case REDIS_REPLY_PUSH:
          out.elements.reserve(reply->elements);
          for (auto i{0u}; i < reply->elements; i++) {
            out.elements.push_back(toReply(reply->element[i]));
          }
          break;
        default:
          break;
      }
      return out;
    }

   private:
    ContextPointer context;

    redisContext *requireContext() {
      if (!context) throw ConnectionError("connection is closed");
      return context.get();
    }

    std::string errorText() const {
      if (!context) return "connection is closed";
      return std::format("{} ({})", context->errstr, context->err);
    }

    inline bool replyOk(ReplyPointer const &replyPtr) const noexcept {
      return (replyPtr != nullptr && !context->err);
    }

    static std::pair<std::vector<const char *>, std::vector<size_t>> toArgv(const Argv &argv) {
      std::vector<const char *> args;
      args.reserve(argv.size());
      std::vector<size_t> lens;
      lens.reserve(argv.size());
      for (const auto &a : argv) {
        args.push_back(a.data());
        lens.push_back(a.size());
      }
      return {std::move(args), std::move(lens)};
    }

    Reply command(redisContext *ctx, const Argv &argv) {
      auto [args, lens] = toArgv(argv);
      ReplyPointer replyPtr(
          static_cast<redisReply *>(::redisCommandArgv(ctx, static_cast<int>(args.size()), args.data(), lens.data())));
      if (replyPtr == nullptr || ctx->err) {
        throw ConnectionError(std::format("{} failed: {} ({})", argv.front(), ctx->errstr, ctx->err));
      }
      return toReply(replyPtr.get());
    }

    ContextPointer createContext(const Config &cfg) {
      redisOptions options{};
      timeval connectTimeout{};
      timeval commandTimeout{};

      if (cfg.unixSocket.has_value()) {
        REDIS_OPTIONS_SET_UNIX(&options, cfg.unixSocket->c_str());
      } else {
        REDIS_OPTIONS_SET_TCP(&options, cfg.hostname.c_str(), cfg.port);
      }
      if (cfg.connectTimeoutMillis > 0) {
        connectTimeout.tv_sec = cfg.connectTimeoutMillis / 1000;
        connectTimeout.tv_usec = (cfg.connectTimeoutMillis % 1000) * 1000;
        options.connect_timeout = &connectTimeout;
      }
      if (cfg.commandTimeoutMillis > 0) {
        commandTimeout.tv_sec = cfg.commandTimeoutMillis / 1000;
        commandTimeout.tv_usec = (cfg.commandTimeoutMillis % 1000) * 1000;
        options.command_timeout = &commandTimeout;
      }
      options.options |= REDIS_OPT_NO_PUSH_AUTOFREE;

      auto ctx = ContextPointer(::redisConnectWithOptions(&options));
      if (ctx == nullptr) {
        throw ConnectionError("Could not allocate Redis context");
      }
      if (ctx->err != 0) {
        throw ConnectionError(std::format("Could not connect to Redis server: {} ({})", ctx->errstr, ctx->err));
      }

      if (cfg.useAuth && cfg.password.has_value()) {
        auto authReply = command(ctx.get(), {"AUTH", cfg.username.value_or("default"), cfg.password.value()});
        if (!authReply.isOk()) {
          throw ConnectionError(std::format("Could not authenticate: {}", authReply.str));
        }
      }
      if (cfg.db.has_value() && cfg.db.value() != 0) {
        auto selectReply = command(ctx.get(), {"SELECT", std::to_string(std::clamp(cfg.db.value(), 0, 15))});
        if (!selectReply.isOk()) {
          throw ConnectionError(std::format("Could not set database: {}", selectReply.str));
        }
      }
      if (cfg.useResp3) {
        auto helloReply = command(ctx.get(), {"HELLO", "3"});
        if (helloReply.isError()) {
          throw ConnectionError(std::format("Could not upgrade to RESP3: {}", helloReply.str));
        }
      }
      if (cfg.clientName.has_value()) {
        auto nameReply = command(ctx.get(), {"CLIENT", "SETNAME", cfg.clientName.value()});
        if (!nameReply.isOk()) {
          throw ConnectionError(std::format("Could not set client name: {}", nameReply.str));
        }
      }
      if (!cfg.unixSocket.has_value()) {
        if ((::redisEnableKeepAlive(ctx.get())) != REDIS_OK) {
          throw ConnectionError("Enable keep-alive failed");
        }
        if ((::redisSetTcpUserTimeout(ctx.get(), tcpTimeoutMillis)) != REDIS_OK) {
          throw ConnectionError("Set TCP timeout failed");
        }
      }

      log()->debug("connected to {}", cfg.unixSocket.value_or(std::format("{}:{}", cfg.hostname, cfg.port)));
      return ctx;
    }

    static inline void setSignals() {
      std::call_once(sigSetup, [] {
        struct sigaction sigAct{};
        sigAct.sa_flags = 0;
        sigemptyset(&sigAct.sa_mask);
        sigAct.sa_handler = SIG_IGN;
        sigaction(SIGPIPE, &sigAct, nullptr);
      });
    }
  };
};  // namespace RedisConn
