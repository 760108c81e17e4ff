#pragma once
#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "redisconncommands.hpp"
#include "redisconnconfig.hpp"
#include "redisconnconverters.hpp"
#include "redisconndriver.hpp"
#include "redisconnerrors.hpp"
#include "redisconnlog.hpp"
#include "redisconnreply.hpp"
#include "redisconnstream.hpp"
#include "redisconnsubscription.hpp"
#include "redisconntypes.hpp"

namespace RedisConn {

  /**
   * @brief A normalization applied to a reply that is read back after a pipeline or a transaction
   *
   */
  using ReplyTransform = std::function<Reply(const Reply &)>;

  /**
   * @brief A deferred command: its name (for error messages) and the transform for its reply
   *
   */
  struct QueuedResult {
    std::string command;
    ReplyTransform transform;
  };

  /**
   * @class DefaultRedisConnection
   *
   * @brief The `RedisConnection` implementation on top of a `NativeClient`
   *
   * @details Every command method validates its arguments, builds the argument vector and hands it to
   * `invoke()` together with a converter for the reply. `invoke()` runs the command in one of three modes:
   * * direct: the command is executed at once; an error reply throws `CommandError`, any other reply is
   *   converted and returned
   * * pipelined (after `openPipeline()`): the command is appended to the client's output buffer and a
   *   value-initialized result is returned; replies are read by `closePipeline()`
   * * queueing (after `multi()`): the command is sent, the server answers `QUEUED` and a value-initialized
   *   result is returned; replies are returned by `exec()`
   *
   * While a `Subscription` started from this connection is alive, every other command throws `RedisError`.
   *
   */
  class DefaultRedisConnection : public RedisConnection {
   public:
    explicit DefaultRedisConnection(std::unique_ptr<NativeClient> client_) : client{std::move(client_)} {
      if (!client) throw std::invalid_argument("NativeClient must not be null");
    }

    DefaultRedisConnection(const DefaultRedisConnection &) = delete;
    DefaultRedisConnection &operator=(const DefaultRedisConnection &) = delete;

    ~DefaultRedisConnection() override {
      try {
        close();
      } catch (const std::exception &e) {
        log()->warn("error while closing connection: {}", e.what());
      }
    }

    using KeyCommands::del;
    using KeyCommands::exists;
    using KeyCommands::scan;
    using KeyCommands::unlink;
    using ListCommands::lPush;
    using ListCommands::rPush;
    using SetCommands::sAdd;
    using SetCommands::sRem;
    using StreamCommands::xAck;
    using StreamCommands::xAdd;
    using StreamCommands::xDel;
    using StreamCommands::xGroupCreate;
    using StreamCommands::xPending;
    using StreamCommands::xRange;
    using StreamCommands::xRead;
    using StreamCommands::xReadGroup;
    using StreamCommands::xRevRange;
    using StreamCommands::xTrim;
    using StringCommands::mGet;
    using StringCommands::set;
    using HashCommands::hDel;
    using HashCommands::hMGet;
    using ZSetCommands::zAdd;
    using ZSetCommands::zInterStore;
    using ZSetCommands::zRangeByScore;
    using ZSetCommands::zRem;
    using ZSetCommands::zUnionStore;
    using HyperLogLogCommands::pfAdd;
    using GeoCommands::geoAdd;
    using GeoCommands::geoDist;

    /*
     * Connection
     */

    void close() override {
      if (closed) return;
      if (subscription) {
        subscription->close();
        subscription.reset();
      }
      if (pipelined || queueing) {
        log()->warn("closing connection with {} unread deferred results", pipelineQueue.size() + txQueue.size());
        pipelineQueue.clear();
        txQueue.clear();
        pipelined = false;
        queueing = false;
      }
      client->close();
      closed = true;
      log()->debug("connection closed");
    }

    [[nodiscard]] bool isClosed() const override { return closed; }

    void openPipeline() override {
      requireOpen();
      if (queueing) throw UnsupportedOperation("Cannot open a pipeline while a transaction is active");
      if (pipelined) return;
      pipelined = true;
      log()->debug("pipeline opened");
    }

    std::vector<Reply> closePipeline() override {
      if (!pipelined) return {};
      pipelined = false;

      auto queue = std::exchange(pipelineQueue, {});
      std::vector<Reply> replies;
      replies.reserve(queue.size());

      // every reply is read before any transform runs so the connection stays in step with the server
      try {
        if (!queue.empty()) client->flush();
        for (auto i{0u}; i < queue.size(); i++) replies.push_back(client->readReply());
      } catch (const ConnectionError &e) {
        log()->error("pipeline aborted after {} of {} replies: {}", replies.size(), queue.size(), e.what());
        throw;
      }

      std::size_t failures{0};
      auto results = transformReplies(queue, replies, failures);

      log()->debug("pipeline closed with {} results", results.size());
      if (failures > 0) {
        throw PipelineError(std::format("{} of {} pipelined commands failed", failures, results.size()),
                            std::move(results));
      }
      return results;
    }

    [[nodiscard]] bool isPipelined() const override { return pipelined; }
    [[nodiscard]] bool isQueueing() const override { return queueing; }

    Reply execute(std::string_view command, const Values &args) override {
      requireNotEmpty(command, "Command");
      Argv argv{std::string(command)};
      argv.insert(argv.end(), args.begin(), args.end());
      return invoke(std::move(argv), &Converters::identity);
    }

    NativeClient &nativeClient() override { return *client; }

    /*
     * Keys
     */

    long long exists(const Keys &keys) override {
      requireNotEmpty(keys, "Keys");
      return invoke(withArgs({"EXISTS"}, keys), &Converters::toLong);
    }

    long long del(const Keys &keys) override {
      requireNotEmpty(keys, "Keys");
      return invoke(withArgs({"DEL"}, keys), &Converters::toLong);
    }

    long long unlink(const Keys &keys) override {
      requireNotEmpty(keys, "Keys");
      return invoke(withArgs({"UNLINK"}, keys), &Converters::toLong);
    }

    DataType type(std::string_view key) override {
      requireKey(key);
      return invoke({"TYPE", std::string(key)}, &Converters::toDataType);
    }

    long long touch(const Keys &keys) override {
      requireNotEmpty(keys, "Keys");
      return invoke(withArgs({"TOUCH"}, keys), &Converters::toLong);
    }

    std::vector<std::string> keys(std::string_view pattern) override {
      requireNotEmpty(pattern, "Pattern");
      return invoke({"KEYS", std::string(pattern)}, &Converters::toStringList);
    }

    ScanCursor<std::string> scan(uint64_t cursor, const ScanOptions &options) override {
      Argv argv{"SCAN", std::to_string(cursor)};
      appendScanOptions(argv, options, true);
      return invoke(std::move(argv), &Converters::toScanCursor);
    }

    std::optional<std::string> randomKey() override {
      return invoke({"RANDOMKEY"}, &Converters::toOptionalString);
    }

    void rename(std::string_view oldKey, std::string_view newKey) override {
      requireKey(oldKey, "Source key");
      requireKey(newKey, "Target key");
      invoke({"RENAME", std::string(oldKey), std::string(newKey)}, &Converters::toVoid);
    }

    bool renameNX(std::string_view oldKey, std::string_view newKey) override {
      requireKey(oldKey, "Source key");
      requireKey(newKey, "Target key");
      return invoke({"RENAMENX", std::string(oldKey), std::string(newKey)}, &Converters::toBoolean,
                    &Converters::asBoolean);
    }

    bool expire(std::string_view key, long long seconds) override {
      requireKey(key);
      return invoke({"EXPIRE", std::string(key), std::to_string(seconds)}, &Converters::toBoolean,
                    &Converters::asBoolean);
    }

    bool pExpire(std::string_view key, long long millis) override {
      requireKey(key);
      return invoke({"PEXPIRE", std::string(key), std::to_string(millis)}, &Converters::toBoolean,
                    &Converters::asBoolean);
    }

    bool expireAt(std::string_view key, long long unixTime) override {
      requireKey(key);
      return invoke({"EXPIREAT", std::string(key), std::to_string(unixTime)}, &Converters::toBoolean,
                    &Converters::asBoolean);
    }

    bool pExpireAt(std::string_view key, long long unixTimeInMillis) override {
      requireKey(key);
      return invoke({"PEXPIREAT", std::string(key), std::to_string(unixTimeInMillis)}, &Converters::toBoolean,
                    &Converters::asBoolean);
    }

    bool persist(std::string_view key) override {
      requireKey(key);
      return invoke({"PERSIST", std::string(key)}, &Converters::toBoolean, &Converters::asBoolean);
    }

    bool move(std::string_view key, int dbIndex) override {
      requireKey(key);
      if (dbIndex < 0) throw std::invalid_argument("Database index must not be negative");
      return invoke({"MOVE", std::string(key), std::to_string(dbIndex)}, &Converters::toBoolean,
                    &Converters::asBoolean);
    }

    long long ttl(std::string_view key) override {
      requireKey(key);
      return invoke({"TTL", std::string(key)}, &Converters::toLong);
    }

    long long pTtl(std::string_view key) override {
      requireKey(key);
      return invoke({"PTTL", std::string(key)}, &Converters::toLong);
    }

    std::vector<std::string> sort(std::string_view key, const SortParameters &params) override {
      requireKey(key);
      return invoke(sortArgs(key, params), &Converters::toStringList);
    }

    long long sort(std::string_view key, const SortParameters &params, std::string_view storeKey) override {
      requireKey(key);
      requireKey(storeKey, "Store key");
      auto argv = sortArgs(key, params);
      argv.emplace_back("STORE");
      argv.emplace_back(storeKey);
      return invoke(std::move(argv), &Converters::toLong);
    }

    /*
     * Strings
     */

    std::optional<std::string> get(std::string_view key) override {
      requireKey(key);
      return invoke({"GET", std::string(key)}, &Converters::toOptionalString);
    }

    std::optional<std::string> getSet(std::string_view key, std::string_view value) override {
      requireKey(key);
      return invoke({"GETSET", std::string(key), std::string(value)}, &Converters::toOptionalString);
    }

    std::optional<std::string> getDel(std::string_view key) override {
      requireKey(key);
      return invoke({"GETDEL", std::string(key)}, &Converters::toOptionalString);
    }

    std::vector<std::optional<std::string>> mGet(const Keys &keys) override {
      requireNotEmpty(keys, "Keys");
      return invoke(withArgs({"MGET"}, keys), &Converters::toOptionalStringList);
    }

    bool set(std::string_view key, std::string_view value, const Expiration &expiration,
             SetOption option) override {
      requireKey(key);
      Argv argv{"SET", std::string(key), std::string(value)};
      switch (expiration.kind()) {
        case Expiration::Kind::SECONDS:
          argv.insert(argv.end(), {"EX", std::to_string(expiration.amount())});
          break;
        case Expiration::Kind::MILLISECONDS:
          argv.insert(argv.end(), {"PX", std::to_string(expiration.amount())});
          break;
        case Expiration::Kind::KEEP_TTL:
          argv.emplace_back("KEEPTTL");
          break;
        case Expiration::Kind::PERSISTENT:
          break;
      }
      if (option == SetOption::SET_IF_ABSENT) argv.emplace_back("NX");
      if (option == SetOption::SET_IF_PRESENT) argv.emplace_back("XX");
      return invoke(std::move(argv), &Converters::toBoolean, &Converters::asBoolean);
    }

    bool setNX(std::string_view key, std::string_view value) override {
      requireKey(key);
      return invoke({"SETNX", std::string(key), std::string(value)}, &Converters::toBoolean, &Converters::asBoolean);
    }

    void setEx(std::string_view key, long long seconds, std::string_view value) override {
      requireKey(key);
      if (seconds <= 0) throw std::invalid_argument("Expiration must be positive");
      invoke({"SETEX", std::string(key), std::to_string(seconds), std::string(value)}, &Converters::toVoid);
    }

    void pSetEx(std::string_view key, long long millis, std::string_view value) override {
      requireKey(key);
      if (millis <= 0) throw std::invalid_argument("Expiration must be positive");
      invoke({"PSETEX", std::string(key), std::to_string(millis), std::string(value)}, &Converters::toVoid);
    }

    void mSet(const KeyValues &tuples) override {
      requireNotEmpty(tuples, "Tuples");
      invoke(withPairs({"MSET"}, tuples), &Converters::toVoid);
    }

    bool mSetNX(const KeyValues &tuples) override {
      requireNotEmpty(tuples, "Tuples");
      return invoke(withPairs({"MSETNX"}, tuples), &Converters::toBoolean, &Converters::asBoolean);
    }

    long long incr(std::string_view key) override {
      requireKey(key);
      return invoke({"INCR", std::string(key)}, &Converters::toLong);
    }

    long long incrBy(std::string_view key, long long value) override {
      requireKey(key);
      return invoke({"INCRBY", std::string(key), std::to_string(value)}, &Converters::toLong);
    }

    double incrByFloat(std::string_view key, double value) override {
      requireKey(key);
      return invoke({"INCRBYFLOAT", std::string(key), formatDouble(value)}, &Converters::toDouble,
                    &Converters::asDouble);
    }

    long long decr(std::string_view key) override {
      requireKey(key);
      return invoke({"DECR", std::string(key)}, &Converters::toLong);
    }

    long long decrBy(std::string_view key, long long value) override {
      requireKey(key);
      return invoke({"DECRBY", std::string(key), std::to_string(value)}, &Converters::toLong);
    }

    long long append(std::string_view key, std::string_view value) override {
      requireKey(key);
      return invoke({"APPEND", std::string(key), std::string(value)}, &Converters::toLong);
    }

    std::string getRange(std::string_view key, long long start, long long end) override {
      requireKey(key);
      return invoke({"GETRANGE", std::string(key), std::to_string(start), std::to_string(end)},
                    &Converters::toString);
    }

    long long setRange(std::string_view key, std::string_view value, long long offset) override {
      requireKey(key);
      if (offset < 0) throw std::invalid_argument("Offset must not be negative");
      return invoke({"SETRANGE", std::string(key), std::to_string(offset), std::string(value)},
                    &Converters::toLong);
    }

    bool getBit(std::string_view key, long long offset) override {
      requireKey(key);
      return invoke({"GETBIT", std::string(key), std::to_string(offset)}, &Converters::toBoolean,
                    &Converters::asBoolean);
    }

    bool setBit(std::string_view key, long long offset, bool value) override {
      requireKey(key);
      return invoke({"SETBIT", std::string(key), std::to_string(offset), value ? "1" : "0"}, &Converters::toBoolean,
                    &Converters::asBoolean);
    }

    long long bitCount(std::string_view key) override {
      requireKey(key);
      return invoke({"BITCOUNT", std::string(key)}, &Converters::toLong);
    }

    long long bitCount(std::string_view key, long long start, long long end) override {
      requireKey(key);
      return invoke({"BITCOUNT", std::string(key), std::to_string(start), std::to_string(end)}, &Converters::toLong);
    }

    long long strLen(std::string_view key) override {
      requireKey(key);
      return invoke({"STRLEN", std::string(key)}, &Converters::toLong);
    }

    /*
     * Lists
     */

    long long rPush(std::string_view key, const Values &values) override {
      requireKey(key);
      requireNotEmpty(values, "Values");
      return invoke(withArgs({"RPUSH", std::string(key)}, values), &Converters::toLong);
    }

    long long lPush(std::string_view key, const Values &values) override {
      requireKey(key);
      requireNotEmpty(values, "Values");
      return invoke(withArgs({"LPUSH", std::string(key)}, values), &Converters::toLong);
    }

    long long rPushX(std::string_view key, std::string_view value) override {
      requireKey(key);
      return invoke({"RPUSHX", std::string(key), std::string(value)}, &Converters::toLong);
    }

    long long lPushX(std::string_view key, std::string_view value) override {
      requireKey(key);
      return invoke({"LPUSHX", std::string(key), std::string(value)}, &Converters::toLong);
    }

    long long lLen(std::string_view key) override {
      requireKey(key);
      return invoke({"LLEN", std::string(key)}, &Converters::toLong);
    }

    std::vector<std::string> lRange(std::string_view key, long long start, long long end) override {
      requireKey(key);
      return invoke({"LRANGE", std::string(key), std::to_string(start), std::to_string(end)},
                    &Converters::toStringList);
    }

    void lTrim(std::string_view key, long long start, long long end) override {
      requireKey(key);
      invoke({"LTRIM", std::string(key), std::to_string(start), std::to_string(end)}, &Converters::toVoid);
    }

    std::optional<std::string> lIndex(std::string_view key, long long index) override {
      requireKey(key);
      return invoke({"LINDEX", std::string(key), std::to_string(index)}, &Converters::toOptionalString);
    }

    long long lInsert(std::string_view key, Position where, std::string_view pivot,
                      std::string_view value) override {
      requireKey(key);
      return invoke({"LINSERT", std::string(key), where == Position::BEFORE ? "BEFORE" : "AFTER", std::string(pivot),
                     std::string(value)},
                    &Converters::toLong);
    }

    void lSet(std::string_view key, long long index, std::string_view value) override {
      requireKey(key);
      invoke({"LSET", std::string(key), std::to_string(index), std::string(value)}, &Converters::toVoid);
    }

    long long lRem(std::string_view key, long long count, std::string_view value) override {
      requireKey(key);
      return invoke({"LREM", std::string(key), std::to_string(count), std::string(value)}, &Converters::toLong);
    }

    std::optional<std::string> lPop(std::string_view key) override {
      requireKey(key);
      return invoke({"LPOP", std::string(key)}, &Converters::toOptionalString);
    }

    std::vector<std::string> lPop(std::string_view key, long long count) override {
      requireKey(key);
      requirePositive(count);
      return invoke({"LPOP", std::string(key), std::to_string(count)}, &Converters::toStringList);
    }

    std::optional<std::string> rPop(std::string_view key) override {
      requireKey(key);
      return invoke({"RPOP", std::string(key)}, &Converters::toOptionalString);
    }

    std::vector<std::string> rPop(std::string_view key, long long count) override {
      requireKey(key);
      requirePositive(count);
      return invoke({"RPOP", std::string(key), std::to_string(count)}, &Converters::toStringList);
    }

    std::vector<std::string> bLPop(std::chrono::seconds timeout, const Keys &keys) override {
      requireNotEmpty(keys, "Keys");
      auto argv = withArgs({"BLPOP"}, keys);
      argv.push_back(std::to_string(timeout.count()));
      return invoke(std::move(argv), &Converters::toStringList);
    }

    std::vector<std::string> bRPop(std::chrono::seconds timeout, const Keys &keys) override {
      requireNotEmpty(keys, "Keys");
      auto argv = withArgs({"BRPOP"}, keys);
      argv.push_back(std::to_string(timeout.count()));
      return invoke(std::move(argv), &Converters::toStringList);
    }

    std::optional<std::string> rPopLPush(std::string_view srcKey, std::string_view dstKey) override {
      requireKey(srcKey, "Source key");
      requireKey(dstKey, "Destination key");
      return invoke({"RPOPLPUSH", std::string(srcKey), std::string(dstKey)}, &Converters::toOptionalString);
    }

    std::optional<std::string> bRPopLPush(std::chrono::seconds timeout, std::string_view srcKey,
                                          std::string_view dstKey) override {
      requireKey(srcKey, "Source key");
      requireKey(dstKey, "Destination key");
      return invoke({"BRPOPLPUSH", std::string(srcKey), std::string(dstKey), std::to_string(timeout.count())},
                    &Converters::toOptionalString);
    }

    std::optional<long long> lPos(std::string_view key, std::string_view element) override {
      requireKey(key);
      return invoke({"LPOS", std::string(key), std::string(element)}, &Converters::toOptionalLong);
    }

    std::vector<long long> lPos(std::string_view key, std::string_view element, std::optional<long long> rank,
                                long long count) override {
      requireKey(key);
      if (count < 0) throw std::invalid_argument("Count must not be negative");
      Argv argv{"LPOS", std::string(key), std::string(element)};
      if (rank.has_value()) argv.insert(argv.end(), {"RANK", std::to_string(*rank)});
      argv.insert(argv.end(), {"COUNT", std::to_string(count)});
      return invoke(std::move(argv), &Converters::toLongList);
    }

    /*
     * Sets
     */

    long long sAdd(std::string_view key, const Values &values) override {
      requireKey(key);
      requireNotEmpty(values, "Values");
      return invoke(withArgs({"SADD", std::string(key)}, values), &Converters::toLong);
    }

    long long sRem(std::string_view key, const Values &values) override {
      requireKey(key);
      requireNotEmpty(values, "Values");
      return invoke(withArgs({"SREM", std::string(key)}, values), &Converters::toLong);
    }

    std::optional<std::string> sPop(std::string_view key) override {
      requireKey(key);
      return invoke({"SPOP", std::string(key)}, &Converters::toOptionalString);
    }

    std::vector<std::string> sPop(std::string_view key, long long count) override {
      requireKey(key);
      requirePositive(count);
      return invoke({"SPOP", std::string(key), std::to_string(count)}, &Converters::toStringList);
    }

    bool sMove(std::string_view srcKey, std::string_view destKey, std::string_view value) override {
      requireKey(srcKey, "Source key");
      requireKey(destKey, "Destination key");
      return invoke({"SMOVE", std::string(srcKey), std::string(destKey), std::string(value)},
                    &Converters::toBoolean, &Converters::asBoolean);
    }

    long long sCard(std::string_view key) override {
      requireKey(key);
      return invoke({"SCARD", std::string(key)}, &Converters::toLong);
    }

    bool sIsMember(std::string_view key, std::string_view value) override {
      requireKey(key);
      return invoke({"SISMEMBER", std::string(key), std::string(value)}, &Converters::toBoolean,
                    &Converters::asBoolean);
    }

    std::vector<bool> sMIsMember(std::string_view key, const Values &values) override {
      requireKey(key);
      requireNotEmpty(values, "Values");
      return invoke(withArgs({"SMISMEMBER", std::string(key)}, values), &Converters::toBooleanList);
    }

    std::vector<std::string> sInter(const Keys &keys) override {
      requireNotEmpty(keys, "Keys");
      return invoke(withArgs({"SINTER"}, keys), &Converters::toStringList);
    }

    long long sInterStore(std::string_view destKey, const Keys &keys) override {
      requireKey(destKey, "Destination key");
      requireNotEmpty(keys, "Keys");
      return invoke(withArgs({"SINTERSTORE", std::string(destKey)}, keys), &Converters::toLong);
    }

    std::vector<std::string> sUnion(const Keys &keys) override {
      requireNotEmpty(keys, "Keys");
      return invoke(withArgs({"SUNION"}, keys), &Converters::toStringList);
    }

    long long sUnionStore(std::string_view destKey, const Keys &keys) override {
      requireKey(destKey, "Destination key");
      requireNotEmpty(keys, "Keys");
      return invoke(withArgs({"SUNIONSTORE", std::string(destKey)}, keys), &Converters::toLong);
    }

    std::vector<std::string> sDiff(const Keys &keys) override {
      requireNotEmpty(keys, "Keys");
      return invoke(withArgs({"SDIFF"}, keys), &Converters::toStringList);
    }

    long long sDiffStore(std::string_view destKey, const Keys &keys) override {
      requireKey(destKey, "Destination key");
      requireNotEmpty(keys, "Keys");
      return invoke(withArgs({"SDIFFSTORE", std::string(destKey)}, keys), &Converters::toLong);
    }

    std::vector<std::string> sMembers(std::string_view key) override {
      requireKey(key);
      return invoke({"SMEMBERS", std::string(key)}, &Converters::toStringList);
    }

    std::optional<std::string> sRandMember(std::string_view key) override {
      requireKey(key);
      return invoke({"SRANDMEMBER", std::string(key)}, &Converters::toOptionalString);
    }

    std::vector<std::string> sRandMember(std::string_view key, long long count) override {
      requireKey(key);
      return invoke({"SRANDMEMBER", std::string(key), std::to_string(count)}, &Converters::toStringList);
    }

    ScanCursor<std::string> sScan(std::string_view key, uint64_t cursor, const ScanOptions &options) override {
      requireKey(key);
      Argv argv{"SSCAN", std::string(key), std::to_string(cursor)};
      appendScanOptions(argv, options, false);
      return invoke(std::move(argv), &Converters::toScanCursor);
    }

    /*
     * Sorted sets
     */

    bool zAdd(std::string_view key, double score, std::string_view value, ZAddFlag flag) override {
      requireKey(key);
      Argv argv{"ZADD", std::string(key)};
      appendZAddFlag(argv, flag);
      argv.insert(argv.end(), {formatDouble(score), std::string(value)});
      return invoke(std::move(argv), &Converters::toBoolean, &Converters::asBoolean);
    }

    long long zAdd(std::string_view key, const std::vector<Tuple> &tuples, ZAddFlag flag) override {
      requireKey(key);
      requireNotEmpty(tuples, "Tuples");
      Argv argv{"ZADD", std::string(key)};
      appendZAddFlag(argv, flag);
      for (const auto &t : tuples) argv.insert(argv.end(), {formatDouble(t.score), t.value});
      return invoke(std::move(argv), &Converters::toLong);
    }

    long long zRem(std::string_view key, const Values &values) override {
      requireKey(key);
      requireNotEmpty(values, "Values");
      return invoke(withArgs({"ZREM", std::string(key)}, values), &Converters::toLong);
    }

    double zIncrBy(std::string_view key, double increment, std::string_view value) override {
      requireKey(key);
      return invoke({"ZINCRBY", std::string(key), formatDouble(increment), std::string(value)},
                    &Converters::toDouble, &Converters::asDouble);
    }

    std::optional<long long> zRank(std::string_view key, std::string_view value) override {
      requireKey(key);
      return invoke({"ZRANK", std::string(key), std::string(value)}, &Converters::toOptionalLong);
    }

    std::optional<long long> zRevRank(std::string_view key, std::string_view value) override {
      requireKey(key);
      return invoke({"ZREVRANK", std::string(key), std::string(value)}, &Converters::toOptionalLong);
    }

    std::vector<std::string> zRange(std::string_view key, long long start, long long end) override {
      requireKey(key);
      return invoke({"ZRANGE", std::string(key), std::to_string(start), std::to_string(end)},
                    &Converters::toStringList);
    }

    std::vector<Tuple> zRangeWithScores(std::string_view key, long long start, long long end) override {
      requireKey(key);
      return invoke({"ZRANGE", std::string(key), std::to_string(start), std::to_string(end), "WITHSCORES"},
                    &Converters::toTuples);
    }

    std::vector<std::string> zRevRange(std::string_view key, long long start, long long end) override {
      requireKey(key);
      return invoke({"ZREVRANGE", std::string(key), std::to_string(start), std::to_string(end)},
                    &Converters::toStringList);
    }

    std::vector<Tuple> zRevRangeWithScores(std::string_view key, long long start, long long end) override {
      requireKey(key);
      return invoke({"ZREVRANGE", std::string(key), std::to_string(start), std::to_string(end), "WITHSCORES"},
                    &Converters::toTuples);
    }

    std::vector<std::string> zRangeByScore(std::string_view key, const Range<double> &range,
                                           const Limit &limit) override {
      requireKey(key);
      return invoke(scoreRangeArgs("ZRANGEBYSCORE", key, range, limit, false, false), &Converters::toStringList);
    }

    std::vector<Tuple> zRangeByScoreWithScores(std::string_view key, const Range<double> &range,
                                               const Limit &limit) override {
      requireKey(key);
      return invoke(scoreRangeArgs("ZRANGEBYSCORE", key, range, limit, true, false), &Converters::toTuples);
    }

    std::vector<std::string> zRevRangeByScore(std::string_view key, const Range<double> &range,
                                              const Limit &limit) override {
      requireKey(key);
      return invoke(scoreRangeArgs("ZREVRANGEBYSCORE", key, range, limit, false, true), &Converters::toStringList);
    }

    std::vector<Tuple> zRevRangeByScoreWithScores(std::string_view key, const Range<double> &range,
                                                  const Limit &limit) override {
      requireKey(key);
      return invoke(scoreRangeArgs("ZREVRANGEBYSCORE", key, range, limit, true, true), &Converters::toTuples);
    }

    long long zCount(std::string_view key, const Range<double> &range) override {
      requireKey(key);
      auto [min, max] = toScoreBounds(range);
      return invoke({"ZCOUNT", std::string(key), min, max}, &Converters::toLong);
    }

    long long zCard(std::string_view key) override {
      requireKey(key);
      return invoke({"ZCARD", std::string(key)}, &Converters::toLong);
    }

    std::optional<double> zScore(std::string_view key, std::string_view value) override {
      requireKey(key);
      return invoke({"ZSCORE", std::string(key), std::string(value)}, &Converters::toOptionalDouble,
                    &Converters::asDouble);
    }

    std::vector<std::optional<double>> zMScore(std::string_view key, const Values &values) override {
      requireKey(key);
      requireNotEmpty(values, "Values");
      return invoke(withArgs({"ZMSCORE", std::string(key)}, values), &Converters::toOptionalDoubleList);
    }

    long long zRemRange(std::string_view key, long long start, long long end) override {
      requireKey(key);
      return invoke({"ZREMRANGEBYRANK", std::string(key), std::to_string(start), std::to_string(end)},
                    &Converters::toLong);
    }

    long long zRemRangeByScore(std::string_view key, const Range<double> &range) override {
      requireKey(key);
      auto [min, max] = toScoreBounds(range);
      return invoke({"ZREMRANGEBYSCORE", std::string(key), min, max}, &Converters::toLong);
    }

    long long zUnionStore(std::string_view destKey, Aggregate aggregate, const Weights &weights,
                          const Keys &sets) override {
      return invoke(setOperationArgs("ZUNIONSTORE", destKey, aggregate, weights, sets), &Converters::toLong);
    }

    long long zInterStore(std::string_view destKey, Aggregate aggregate, const Weights &weights,
                          const Keys &sets) override {
      return invoke(setOperationArgs("ZINTERSTORE", destKey, aggregate, weights, sets), &Converters::toLong);
    }

    /*
     * Hashes
     */

    bool hSet(std::string_view key, std::string_view field, std::string_view value) override {
      requireKey(key);
      return invoke({"HSET", std::string(key), std::string(field), std::string(value)}, &Converters::toBoolean,
                    &Converters::asBoolean);
    }

    bool hSetNX(std::string_view key, std::string_view field, std::string_view value) override {
      requireKey(key);
      return invoke({"HSETNX", std::string(key), std::string(field), std::string(value)}, &Converters::toBoolean,
                    &Converters::asBoolean);
    }

    std::optional<std::string> hGet(std::string_view key, std::string_view field) override {
      requireKey(key);
      return invoke({"HGET", std::string(key), std::string(field)}, &Converters::toOptionalString);
    }

    std::vector<std::optional<std::string>> hMGet(std::string_view key, const Keys &fields) override {
      requireKey(key);
      requireNotEmpty(fields, "Fields");
      return invoke(withArgs({"HMGET", std::string(key)}, fields), &Converters::toOptionalStringList);
    }

    void hMSet(std::string_view key, const KeyValues &hashes) override {
      requireKey(key);
      requireNotEmpty(hashes, "Hashes");
      invoke(withPairs({"HMSET", std::string(key)}, hashes), &Converters::toVoid);
    }

    long long hIncrBy(std::string_view key, std::string_view field, long long delta) override {
      requireKey(key);
      return invoke({"HINCRBY", std::string(key), std::string(field), std::to_string(delta)}, &Converters::toLong);
    }

    double hIncrByFloat(std::string_view key, std::string_view field, double delta) override {
      requireKey(key);
      return invoke({"HINCRBYFLOAT", std::string(key), std::string(field), formatDouble(delta)},
                    &Converters::toDouble, &Converters::asDouble);
    }

    bool hExists(std::string_view key, std::string_view field) override {
      requireKey(key);
      return invoke({"HEXISTS", std::string(key), std::string(field)}, &Converters::toBoolean,
                    &Converters::asBoolean);
    }

    long long hDel(std::string_view key, const Keys &fields) override {
      requireKey(key);
      requireNotEmpty(fields, "Fields");
      return invoke(withArgs({"HDEL", std::string(key)}, fields), &Converters::toLong);
    }

    long long hLen(std::string_view key) override {
      requireKey(key);
      return invoke({"HLEN", std::string(key)}, &Converters::toLong);
    }

    std::vector<std::string> hKeys(std::string_view key) override {
      requireKey(key);
      return invoke({"HKEYS", std::string(key)}, &Converters::toStringList);
    }

    std::vector<std::string> hVals(std::string_view key) override {
      requireKey(key);
      return invoke({"HVALS", std::string(key)}, &Converters::toStringList);
    }

    KeyValues hGetAll(std::string_view key) override {
      requireKey(key);
      return invoke({"HGETALL", std::string(key)}, &Converters::toKeyValues);
    }

    long long hStrLen(std::string_view key, std::string_view field) override {
      requireKey(key);
      return invoke({"HSTRLEN", std::string(key), std::string(field)}, &Converters::toLong);
    }

    std::optional<std::string> hRandField(std::string_view key) override {
      requireKey(key);
      return invoke({"HRANDFIELD", std::string(key)}, &Converters::toOptionalString);
    }

    std::vector<std::string> hRandField(std::string_view key, long long count) override {
      requireKey(key);
      return invoke({"HRANDFIELD", std::string(key), std::to_string(count)}, &Converters::toStringList);
    }

    ScanCursor<KeyValue> hScan(std::string_view key, uint64_t cursor, const ScanOptions &options) override {
      requireKey(key);
      Argv argv{"HSCAN", std::string(key), std::to_string(cursor)};
      appendScanOptions(argv, options, false);
      return invoke(std::move(argv), &Converters::toKeyValueScanCursor);
    }

    /*
     * Streams
     */

    long long xAck(std::string_view key, std::string_view group, const std::vector<RecordId> &recordIds) override {
      requireKey(key);
      requireNotEmpty(group, "Group name");
      requireNotEmpty(recordIds, "Record ids");
      auto argv = withIds({"XACK", std::string(key), std::string(group)}, recordIds);
      return invoke(std::move(argv), &Converters::toLong);
    }

    RecordId xAdd(const ByteRecord &record, const XAddOptions &options) override {
      requireKey(record.stream(), "Stream key");
      requireNotEmpty(record.value(), "Record body");
      Argv argv{"XADD", record.stream()};
      if (options.isNoMkStream()) argv.emplace_back("NOMKSTREAM");
      if (options.hasMaxlen()) {
        argv.emplace_back("MAXLEN");
        if (options.isApproximateTrimming()) argv.emplace_back("~");
        argv.push_back(std::to_string(*options.getMaxlen()));
      }
      argv.push_back(record.id().value());
      for (const auto &[field, value] : record.value()) argv.insert(argv.end(), {field, value});
      return invoke(std::move(argv), &Converters::toRecordId);
    }

    std::vector<ByteRecord> xClaim(std::string_view key, std::string_view group, std::string_view newOwner,
                                   const XClaimOptions &options) override {
      auto streamKey = std::string(key);
      return invoke(claimArgs(key, group, newOwner, options, false),
                    [streamKey](const Reply &reply) { return Converters::toRecords(streamKey, reply); });
    }

    std::vector<RecordId> xClaimJustId(std::string_view key, std::string_view group, std::string_view newOwner,
                                       const XClaimOptions &options) override {
      return invoke(claimArgs(key, group, newOwner, options, true), &Converters::toRecordIds);
    }

    long long xDel(std::string_view key, const std::vector<RecordId> &recordIds) override {
      requireKey(key);
      requireNotEmpty(recordIds, "Record ids");
      return invoke(withIds({"XDEL", std::string(key)}, recordIds), &Converters::toLong);
    }

    std::string xGroupCreate(std::string_view key, std::string_view groupName, const ReadOffset &readOffset,
                             bool mkStream) override {
      requireKey(key);
      requireNotEmpty(groupName, "Group name");
      Argv argv{"XGROUP", "CREATE", std::string(key), std::string(groupName), readOffset.offset()};
      if (mkStream) argv.emplace_back("MKSTREAM");
      return invoke(std::move(argv), &Converters::toString);
    }

    /**
     * @return `true` once the consumer has been removed from the group
     *
     */
    bool xGroupDelConsumer(std::string_view key, const Consumer &consumer) override {
      requireKey(key);
      return invoke({"XGROUP", "DELCONSUMER", std::string(key), consumer.group(), consumer.name()},
                    [](const Reply &) { return true; });
    }

    bool xGroupDestroy(std::string_view key, std::string_view groupName) override {
      requireKey(key);
      requireNotEmpty(groupName, "Group name");
      return invoke({"XGROUP", "DESTROY", std::string(key), std::string(groupName)}, &Converters::toBoolean,
                    &Converters::asBoolean);
    }

    XInfoStream xInfo(std::string_view key) override {
      requireKey(key);
      requireDirect("XINFO STREAM");
      return invoke({"XINFO", "STREAM", std::string(key)}, &Converters::toXInfoStream);
    }

    XInfoGroups xInfoGroups(std::string_view key) override {
      requireKey(key);
      requireDirect("XINFO GROUPS");
      return invoke({"XINFO", "GROUPS", std::string(key)}, &Converters::toXInfoGroups);
    }

    XInfoConsumers xInfoConsumers(std::string_view key, std::string_view groupName) override {
      requireKey(key);
      requireNotEmpty(groupName, "Group name");
      requireDirect("XINFO CONSUMERS");
      auto group = std::string(groupName);
      return invoke({"XINFO", "CONSUMERS", std::string(key), group},
                    [group](const Reply &reply) { return Converters::toXInfoConsumers(group, reply); });
    }

    long long xLen(std::string_view key) override {
      requireKey(key);
      return invoke({"XLEN", std::string(key)}, &Converters::toLong);
    }

    PendingMessagesSummary xPending(std::string_view key, std::string_view groupName) override {
      requireKey(key);
      requireNotEmpty(groupName, "Group name");
      auto group = std::string(groupName);
      return invoke({"XPENDING", std::string(key), group},
                    [group](const Reply &reply) { return Converters::toPendingMessagesSummary(group, reply); });
    }

    PendingMessages xPending(std::string_view key, std::string_view groupName,
                             const XPendingOptions &options) override {
      requireKey(key);
      requireNotEmpty(groupName, "Group name");
      auto group = std::string(groupName);
      auto [start, end] = toStreamBounds(options.getRange());
      Argv argv{"XPENDING", std::string(key), group};
      if (options.getMinIdleTime().has_value()) {
        argv.insert(argv.end(), {"IDLE", std::to_string(options.getMinIdleTime()->count())});
      }
      auto count = options.isLimited() ? options.getCount() : std::numeric_limits<long long>::max();
      argv.insert(argv.end(), {start, end, std::to_string(count)});
      if (options.hasConsumer()) argv.push_back(*options.getConsumerName());
      auto range = options.getRange();
      return invoke(std::move(argv), [group, range](const Reply &reply) {
        return Converters::toPendingMessages(group, range, reply);
      });
    }

    std::vector<ByteRecord> xRange(std::string_view key, const Range<std::string> &range,
                                   const Limit &limit) override {
      requireKey(key);
      auto [start, end] = toStreamBounds(range);
      Argv argv{"XRANGE", std::string(key), start, end};
      if (limit.getCount() >= 0) argv.insert(argv.end(), {"COUNT", std::to_string(limit.getCount())});
      auto streamKey = std::string(key);
      return invoke(std::move(argv),
                    [streamKey](const Reply &reply) { return Converters::toRecords(streamKey, reply); });
    }

    std::vector<ByteRecord> xRead(const StreamReadOptions &readOptions,
                                  const std::vector<StreamOffset> &streams) override {
      requireNotEmpty(streams, "Stream offsets");
      Argv argv{"XREAD"};
      appendReadOptions(argv, readOptions, false);
      appendStreams(argv, streams);
      return invoke(std::move(argv), &Converters::toStreamReadRecords);
    }

    std::vector<ByteRecord> xReadGroup(const Consumer &consumer, const StreamReadOptions &readOptions,
                                       const std::vector<StreamOffset> &streams) override {
      requireNotEmpty(streams, "Stream offsets");
      Argv argv{"XREADGROUP", "GROUP", consumer.group(), consumer.name()};
      appendReadOptions(argv, readOptions, true);
      appendStreams(argv, streams);
      return invoke(std::move(argv), &Converters::toStreamReadRecords);
    }

    std::vector<ByteRecord> xRevRange(std::string_view key, const Range<std::string> &range,
                                      const Limit &limit) override {
      requireKey(key);
      auto [start, end] = toStreamBounds(range);
      Argv argv{"XREVRANGE", std::string(key), end, start};
      if (limit.getCount() >= 0) argv.insert(argv.end(), {"COUNT", std::to_string(limit.getCount())});
      auto streamKey = std::string(key);
      return invoke(std::move(argv),
                    [streamKey](const Reply &reply) { return Converters::toRecords(streamKey, reply); });
    }

    long long xTrim(std::string_view key, long long count, bool approximateTrimming) override {
      requireKey(key);
      if (count < 0) throw std::invalid_argument("Count must not be negative");
      Argv argv{"XTRIM", std::string(key), "MAXLEN"};
      if (approximateTrimming) argv.emplace_back("~");
      argv.push_back(std::to_string(count));
      return invoke(std::move(argv), &Converters::toLong);
    }

    /*
     * HyperLogLog
     */

    long long pfAdd(std::string_view key, const Values &values) override {
      requireKey(key);
      requireNotEmpty(values, "Values");
      return invoke(withArgs({"PFADD", std::string(key)}, values), &Converters::toLong);
    }

    long long pfCount(const Keys &keys) override {
      requireNotEmpty(keys, "Keys");
      return invoke(withArgs({"PFCOUNT"}, keys), &Converters::toLong);
    }

    void pfMerge(std::string_view destKey, const Keys &sourceKeys) override {
      requireKey(destKey, "Destination key");
      requireNotEmpty(sourceKeys, "Source keys");
      invoke(withArgs({"PFMERGE", std::string(destKey)}, sourceKeys), &Converters::toVoid);
    }

    /*
     * Geo
     */

    long long geoAdd(std::string_view key, const std::vector<GeoLocation> &locations) override {
      requireKey(key);
      requireNotEmpty(locations, "Locations");
      Argv argv{"GEOADD", std::string(key)};
      for (const auto &location : locations) {
        argv.insert(argv.end(), {formatDouble(location.point.longitude), formatDouble(location.point.latitude),
                                 location.name});
      }
      return invoke(std::move(argv), &Converters::toLong);
    }

    std::optional<Distance> geoDist(std::string_view key, std::string_view member1, std::string_view member2,
                                    GeoUnit unit) override {
      requireKey(key);
      return invoke({"GEODIST", std::string(key), std::string(member1), std::string(member2),
                     std::string(geoUnitCode(unit))},
                    [unit](const Reply &reply) { return Converters::toOptionalDistance(unit, reply); },
                    &Converters::asDouble);
    }

    std::vector<std::optional<Point>> geoPos(std::string_view key, const Values &members) override {
      requireKey(key);
      requireNotEmpty(members, "Members");
      return invoke(withArgs({"GEOPOS", std::string(key)}, members), &Converters::toOptionalPoints);
    }

    std::vector<GeoResult> geoSearch(std::string_view key, const GeoSearchArgs &args) override {
      requireKey(key);
      return invoke(withArgs({"GEOSEARCH", std::string(key)}, args.toArgs()),
                    [args](const Reply &reply) { return Converters::toGeoResults(args, reply); });
    }

    /*
     * Pub/sub
     */

    long long publish(std::string_view channel, std::string_view message) override {
      requireNotEmpty(channel, "Channel");
      return invoke({"PUBLISH", std::string(channel), std::string(message)}, &Converters::toLong);
    }

    void subscribe(MessageListener listener, const Keys &channels) override {
      requireNotEmpty(channels, "Channels");
      startSubscription(std::move(listener), channels, {});
    }

    void pSubscribe(MessageListener listener, const Keys &patterns) override {
      requireNotEmpty(patterns, "Patterns");
      startSubscription(std::move(listener), {}, patterns);
    }

    [[nodiscard]] bool isSubscribed() const override { return subscription != nullptr && subscription->isAlive(); }

    [[nodiscard]] std::shared_ptr<Subscription> getSubscription() const override { return subscription; }

    /*
     * Scripting
     */

    void scriptFlush() override { invoke({"SCRIPT", "FLUSH"}, &Converters::toVoid); }

    void scriptKill() override { invoke({"SCRIPT", "KILL"}, &Converters::toVoid); }

    std::string scriptLoad(std::string_view script) override {
      requireNotEmpty(script, "Script");
      return invoke({"SCRIPT", "LOAD", std::string(script)}, &Converters::toString);
    }

    std::vector<bool> scriptExists(const std::vector<std::string> &scriptShas) override {
      requireNotEmpty(scriptShas, "Script digests");
      return invoke(withArgs({"SCRIPT", "EXISTS"}, scriptShas), &Converters::toBooleanList);
    }

    Reply eval(std::string_view script, ReturnType returnType, int numKeys, const Values &keysAndArgs) override {
      requireNotEmpty(script, "Script");
      return invoke(scriptArgs("EVAL", script, numKeys, keysAndArgs), scriptConverter(returnType),
                    scriptConverter(returnType));
    }

    Reply evalSha(std::string_view scriptSha, ReturnType returnType, int numKeys,
                  const Values &keysAndArgs) override {
      requireNotEmpty(scriptSha, "Script digest");
      return invoke(scriptArgs("EVALSHA", scriptSha, numKeys, keysAndArgs), scriptConverter(returnType),
                    scriptConverter(returnType));
    }

    /*
     * Server
     */

    std::string ping() override { return invoke({"PING"}, &Converters::toString); }

    std::string echo(std::string_view message) override {
      return invoke({"ECHO", std::string(message)}, &Converters::toString);
    }

    void select(int dbIndex) override {
      if (dbIndex < 0) throw std::invalid_argument("Database index must not be negative");
      invoke({"SELECT", std::to_string(dbIndex)}, &Converters::toVoid);
    }

    long long dbSize() override { return invoke({"DBSIZE"}, &Converters::toLong); }

    void flushDb() override { invoke({"FLUSHDB"}, &Converters::toVoid); }

    void flushAll() override { invoke({"FLUSHALL"}, &Converters::toVoid); }

    Properties info() override { return invoke({"INFO"}, &Converters::toInfo); }

    Properties info(std::string_view section) override {
      requireNotEmpty(section, "Section");
      return invoke({"INFO", std::string(section)}, &Converters::toInfo);
    }

    std::chrono::milliseconds time() override { return invoke({"TIME"}, &Converters::toTime); }

    long long lastSave() override { return invoke({"LASTSAVE"}, &Converters::toLong); }

    void bgSave() override { invoke({"BGSAVE"}, &Converters::toVoid); }

    void bgReWriteAof() override { invoke({"BGREWRITEAOF"}, &Converters::toVoid); }

    void save() override { invoke({"SAVE"}, &Converters::toVoid); }

    Properties getConfig(std::string_view pattern) override {
      requireNotEmpty(pattern, "Pattern");
      return invoke({"CONFIG", "GET", std::string(pattern)}, &Converters::toKeyValues);
    }

    void setConfig(std::string_view param, std::string_view value) override {
      requireNotEmpty(param, "Parameter");
      invoke({"CONFIG", "SET", std::string(param), std::string(value)}, &Converters::toVoid);
    }

    void resetConfigStats() override { invoke({"CONFIG", "RESETSTAT"}, &Converters::toVoid); }

    void clientSetName(std::string_view name) override {
      requireNotEmpty(name, "Client name");
      if (name.find(' ') != std::string_view::npos) throw std::invalid_argument("Client name must not contain spaces");
      invoke({"CLIENT", "SETNAME", std::string(name)}, &Converters::toVoid);
    }

    std::optional<std::string> clientGetName() override {
      return invoke({"CLIENT", "GETNAME"}, &Converters::toOptionalString);
    }

    std::vector<Properties> clientList() override { return invoke({"CLIENT", "LIST"}, &Converters::toClientList); }

    /**
     * @brief Stop the server
     *
     * @details A successful shutdown closes the socket without a reply; the resulting `ConnectionError`
     * is taken as success and the connection is closed.
     *
     */
    void shutdown() override {
      requireOpen();
      requireNotSubscribed();
      if (pipelined || queueing) {
        invoke({"SHUTDOWN"}, &Converters::toVoid);
        return;
      }
      try {
        auto reply = client->execute({"SHUTDOWN"});
        if (reply.isError()) throw CommandError("SHUTDOWN", reply.str);
      } catch (const ConnectionError &e) {
        log()->info("server shut down: {}", e.what());
        close();
      }
    }

    /*
     * Transactions
     */

    void multi() override {
      requireOpen();
      requireNotSubscribed();
      if (queueing) return;
      if (pipelined) throw UnsupportedOperation("MULTI is not supported inside a pipeline");
      auto reply = client->execute({"MULTI"});
      if (reply.isError()) throw CommandError("MULTI", reply.str);
      queueing = true;
      log()->debug("transaction started");
    }

    std::vector<Reply> exec() override {
      requireOpen();
      if (!queueing) throw RedisError("No ongoing transaction; did you forget to call multi?");
      queueing = false;
      auto queue = std::exchange(txQueue, {});

      auto reply = client->execute({"EXEC"});
      if (reply.isError()) throw CommandError("EXEC", reply.str);
      if (reply.isNil()) {
        log()->info("transaction aborted: a watched key was modified");
        return {};
      }
      if (!reply.isAggregate()) throw RedisError("malformed EXEC reply");
      if (reply.elements.size() != queue.size()) {
        throw RedisError(
            std::format("EXEC returned {} results for {} queued commands", reply.elements.size(), queue.size()));
      }

      std::size_t failures{0};
      auto results = transformReplies(queue, reply.elements, failures);
      log()->debug("transaction executed with {} results", results.size());
      if (failures > 0) {
        throw PipelineError(std::format("{} of {} queued commands failed", failures, results.size()),
                            std::move(results));
      }
      return results;
    }

    void discard() override {
      requireOpen();
      if (!queueing) throw RedisError("No ongoing transaction; did you forget to call multi?");
      queueing = false;
      txQueue.clear();
      auto reply = client->execute({"DISCARD"});
      if (reply.isError()) throw CommandError("DISCARD", reply.str);
      log()->debug("transaction discarded");
    }

    void watch(const Keys &keys) override {
      requireNotEmpty(keys, "Keys");
      if (queueing) throw UnsupportedOperation("WATCH is not supported during a transaction");
      invoke(withArgs({"WATCH"}, keys), &Converters::toVoid);
    }

    void unwatch() override { invoke({"UNWATCH"}, &Converters::toVoid); }

   private:
    std::unique_ptr<NativeClient> client;
    std::shared_ptr<Subscription> subscription;
    std::vector<QueuedResult> pipelineQueue;
    std::vector<QueuedResult> txQueue;
    bool pipelined{false};
    bool queueing{false};
    bool closed{false};

    /**
     * @brief Run a command in the current mode and convert its reply
     *
     * @param argv The command and its arguments
     * @param convert Maps the reply to the typed result (direct mode)
     * @param deferred Normalizes the reply read back by `closePipeline()` or `exec()`
     *
     */
    template <typename Convert>
    auto invoke(Argv argv, Convert &&convert, ReplyTransform deferred = &Converters::identity) {
      using Result = std::invoke_result_t<Convert, const Reply &>;

      requireOpen();
      requireNotSubscribed();

      if (pipelined) {
        client->append(argv);
        pipelineQueue.push_back(QueuedResult{std::move(argv.front()), std::move(deferred)});
        if constexpr (std::is_void_v<Result>) {
          return;
        } else {
          return Result{};
        }
      }

      auto reply = client->execute(argv);
      if (reply.isError()) throw CommandError(argv.front(), reply.str);

      if (queueing) {
        txQueue.push_back(QueuedResult{std::move(argv.front()), std::move(deferred)});
        if constexpr (std::is_void_v<Result>) {
          return;
        } else {
          return Result{};
        }
      }

      return convert(reply);
    }

    /**
     * @brief Apply the deferred transforms to replies read back from a pipeline or a transaction
     *
     * @details Error replies are kept as they are. A transform that throws is recorded as an error reply
     * naming the command; both count as failures.
     *
     */
    static std::vector<Reply> transformReplies(const std::vector<QueuedResult> &queue, const std::vector<Reply> &replies,
                                               std::size_t &failures) {
      std::vector<Reply> results;
      results.reserve(queue.size());
      for (auto i{0u}; i < queue.size(); i++) {
        const auto &reply = replies[i];
        if (reply.isError()) {
          failures++;
          results.push_back(reply);
          continue;
        }
        try {
          results.push_back(queue[i].transform(reply));
        } catch (const std::exception &e) {
          log()->warn("cannot convert reply to {}: {}", queue[i].command, e.what());
          failures++;
          results.push_back(Reply::error(std::format("{}: {}", queue[i].command, e.what())));
        }
      }
      return results;
    }

    void requireOpen() const {
      if (closed) throw ConnectionError("Connection is closed");
    }

    void requireNotSubscribed() const {
      if (isSubscribed()) {
        throw RedisError("Connection already subscribed; use the Subscription to cancel or add new channels");
      }
    }

    void requireDirect(std::string_view command) const {
      if (pipelined || queueing) {
        throw UnsupportedOperation(std::format("{} is not supported in pipeline or transaction mode", command));
      }
    }

    static void requireKey(std::string_view key, std::string_view what = "Key") {
      if (key.empty()) throw std::invalid_argument(std::format("{} must not be empty", what));
    }

    static void requireNotEmpty(std::string_view value, std::string_view what) {
      if (value.empty()) throw std::invalid_argument(std::format("{} must not be empty", what));
    }

    template <typename Container>
    static void requireNotEmpty(const Container &values, std::string_view what) {
      if (values.empty()) throw std::invalid_argument(std::format("{} must not be empty", what));
    }

    static void requirePositive(long long count) {
      if (count <= 0) throw std::invalid_argument("Count must be greater than zero");
    }

    static Argv withArgs(Argv argv, const std::vector<std::string> &args) {
      argv.insert(argv.end(), args.begin(), args.end());
      return argv;
    }

    static Argv withPairs(Argv argv, const KeyValues &pairs) {
      for (const auto &[k, v] : pairs) argv.insert(argv.end(), {k, v});
      return argv;
    }

    static Argv withIds(Argv argv, const std::vector<RecordId> &ids) {
      for (const auto &id : ids) argv.push_back(id.value());
      return argv;
    }

    static void appendScanOptions(Argv &argv, const ScanOptions &options, bool allowType) {
      if (options.pattern.has_value()) argv.insert(argv.end(), {"MATCH", *options.pattern});
      if (options.count.has_value()) argv.insert(argv.end(), {"COUNT", std::to_string(*options.count)});
      if (allowType && options.type.has_value()) {
        argv.insert(argv.end(), {"TYPE", std::string(dataTypeCode(*options.type))});
      }
    }

    static void appendZAddFlag(Argv &argv, ZAddFlag flag) {
      switch (flag) {
        case ZAddFlag::NX:
          argv.emplace_back("NX");
          break;
        case ZAddFlag::XX:
          argv.emplace_back("XX");
          break;
        case ZAddFlag::GT:
          argv.emplace_back("GT");
          break;
        case ZAddFlag::LT:
          argv.emplace_back("LT");
          break;
        case ZAddFlag::NONE:
          break;
      }
    }

    static Argv sortArgs(std::string_view key, const SortParameters &params) {
      Argv argv{"SORT", std::string(key)};
      if (params.byPattern.has_value()) argv.insert(argv.end(), {"BY", *params.byPattern});
      if (params.limit.has_value() && params.limit->isLimited()) {
        argv.insert(argv.end(),
                    {"LIMIT", std::to_string(params.limit->getOffset()), std::to_string(params.limit->getCount())});
      }
      for (const auto &pattern : params.getPatterns) argv.insert(argv.end(), {"GET", pattern});
      if (params.order.has_value()) argv.emplace_back(*params.order == SortParameters::Order::ASC ? "ASC" : "DESC");
      if (params.alpha) argv.emplace_back("ALPHA");
      return argv;
    }

    static Argv scoreRangeArgs(std::string_view command, std::string_view key, const Range<double> &range,
                               const Limit &limit, bool withScores, bool reverse) {
      auto [min, max] = toScoreBounds(range);
      Argv argv{std::string(command), std::string(key)};
      if (reverse) {
        argv.insert(argv.end(), {max, min});
      } else {
        argv.insert(argv.end(), {min, max});
      }
      if (withScores) argv.emplace_back("WITHSCORES");
      if (limit.isLimited()) {
        argv.insert(argv.end(), {"LIMIT", std::to_string(limit.getOffset()), std::to_string(limit.getCount())});
      }
      return argv;
    }

    static Argv setOperationArgs(std::string_view command, std::string_view destKey, Aggregate aggregate,
                                 const Weights &weights, const Keys &sets) {
      requireKey(destKey, "Destination key");
      requireNotEmpty(sets, "Source sets");
      if (!weights.empty() && weights.size() != sets.size()) {
        throw std::invalid_argument(
            std::format("The number of weights ({}) must match the number of source sets ({})", weights.size(),
                        sets.size()));
      }
      Argv argv{std::string(command), std::string(destKey), std::to_string(sets.size())};
      argv.insert(argv.end(), sets.begin(), sets.end());
      if (!weights.empty()) {
        argv.emplace_back("WEIGHTS");
        for (auto w : weights) argv.push_back(formatDouble(w));
      }
      argv.emplace_back("AGGREGATE");
      switch (aggregate) {
        case Aggregate::MIN:
          argv.emplace_back("MIN");
          break;
        case Aggregate::MAX:
          argv.emplace_back("MAX");
          break;
        case Aggregate::SUM:
          argv.emplace_back("SUM");
          break;
      }
      return argv;
    }

    static Argv claimArgs(std::string_view key, std::string_view group, std::string_view newOwner,
                          const XClaimOptions &options, bool justId) {
      requireKey(key);
      requireNotEmpty(group, "Group name");
      requireNotEmpty(newOwner, "Consumer name");
      requireNotEmpty(options.getIds(), "Record ids");
      Argv argv{"XCLAIM", std::string(key), std::string(group), std::string(newOwner),
                std::to_string(options.getMinIdleTime().count())};
      for (const auto &id : options.getIds()) argv.push_back(id.value());
      if (options.getIdleTime().has_value()) {
        argv.insert(argv.end(), {"IDLE", std::to_string(options.getIdleTime()->count())});
      }
      if (options.getUnixTime().has_value()) {
        argv.insert(argv.end(), {"TIME", std::to_string(options.getUnixTime()->count())});
      }
      if (options.getRetryCount().has_value()) {
        argv.insert(argv.end(), {"RETRYCOUNT", std::to_string(*options.getRetryCount())});
      }
      if (options.isForce()) argv.emplace_back("FORCE");
      if (justId) argv.emplace_back("JUSTID");
      return argv;
    }

    static void appendReadOptions(Argv &argv, const StreamReadOptions &options, bool allowNoack) {
      if (options.getCount().has_value()) argv.insert(argv.end(), {"COUNT", std::to_string(*options.getCount())});
      if (options.getBlock().has_value()) argv.insert(argv.end(), {"BLOCK", std::to_string(*options.getBlock())});
      if (allowNoack && options.isNoack()) argv.emplace_back("NOACK");
    }

    static void appendStreams(Argv &argv, const std::vector<StreamOffset> &streams) {
      argv.emplace_back("STREAMS");
      for (const auto &s : streams) argv.push_back(s.key());
      for (const auto &s : streams) argv.push_back(s.offset().offset());
    }

    static Argv scriptArgs(std::string_view command, std::string_view script, int numKeys, const Values &keysAndArgs) {
      if (numKeys < 0 || static_cast<std::size_t>(numKeys) > keysAndArgs.size()) {
        throw std::invalid_argument(
            std::format("numKeys must be between 0 and {}, was {}", keysAndArgs.size(), numKeys));
      }
      Argv argv{std::string(command), std::string(script), std::to_string(numKeys)};
      argv.insert(argv.end(), keysAndArgs.begin(), keysAndArgs.end());
      return argv;
    }

    static ReplyTransform scriptConverter(ReturnType returnType) {
      return [returnType](const Reply &reply) {
        if (reply.isError()) return reply;
        return Converters::toScriptResult(returnType, reply);
      };
    }

    void startSubscription(MessageListener listener, const Keys &channels, const Keys &patterns) {
      requireOpen();
      requireNotSubscribed();
      if (pipelined || queueing) {
        throw UnsupportedOperation("Cannot subscribe in pipeline or transaction mode");
      }
      auto sub = std::make_shared<Subscription>(*client, std::move(listener));
      sub->start(channels, patterns);
      subscription = std::move(sub);
      log()->info("subscribed to {} channel(s) and {} pattern(s)", channels.size(), patterns.size());
    }
  };

  /**
   * @class RedisConnectionFactory
   *
   * @brief Creates connections from a `Config`
   *
   * @details The factory applies the configured log level once and then hands out a new, independent
   * connection (with its own hiredis context) on every call to `getConnection()`.
   *
   */
  class RedisConnectionFactory {
   public:
    explicit RedisConnectionFactory(Config cfg) : config{std::move(cfg)} { setLogLevel(config.logLevel); }

    [[nodiscard]] std::unique_ptr<RedisConnection> getConnection() const {
      auto client = std::make_unique<HiredisClient>(config);
      log()->info("opened connection to {}",
                  config.unixSocket.value_or(std::format("{}:{}", config.hostname, config.port)));
      return std::make_unique<DefaultRedisConnection>(std::move(client));
    }

    [[nodiscard]] const Config &getConfig() const noexcept { return config; }

   private:
    Config config;
  };
};  // namespace RedisConn
