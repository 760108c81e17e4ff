#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "redisconncommands.hpp"
#include "redisconnconverters.hpp"
#include "redisconnerrors.hpp"
#include "redisconnreply.hpp"
#include "redisconnserializer.hpp"
#include "redisconnstream.hpp"
#include "redisconnsubscription.hpp"
#include "redisconntypes.hpp"

namespace RedisConn {

  using StringTuple = Tuple;

  /**
   * @class StringRedisConnection
   *
   * @brief A string-typed view of a `RedisConnection`
   *
   * @details Keys, values, hash fields, channel names and stream bodies are passed through a
   * `RedisSerializer<std::string>` on the way to the server, and results are deserialized on the way back.
   * With the default `StringRedisSerializer` this is the identity; an application can plug in a serializer
   * that, for example, adds a key prefix or encrypts values.
   *
   */
  class StringRedisConnection {
   public:
    virtual ~StringRedisConnection() = default;

    /**
     * @brief The wrapped connection
     *
     */
    virtual RedisConnection &delegate() = 0;

    virtual void close() = 0;
    [[nodiscard]] virtual bool isClosed() const = 0;
    virtual void openPipeline() = 0;
    virtual std::vector<Reply> closePipeline() = 0;
    [[nodiscard]] virtual bool isPipelined() const = 0;
    [[nodiscard]] virtual bool isQueueing() const = 0;
    virtual Reply execute(std::string_view command, const Values &args) = 0;

    // keys
    virtual long long exists(const Keys &keys) = 0;
    virtual long long del(const Keys &keys) = 0;
    virtual DataType type(std::string_view key) = 0;
    virtual std::vector<std::string> keys(std::string_view pattern) = 0;
    virtual void rename(std::string_view oldKey, std::string_view newKey) = 0;
    virtual bool expire(std::string_view key, long long seconds) = 0;
    virtual bool pExpire(std::string_view key, long long millis) = 0;
    virtual bool persist(std::string_view key) = 0;
    virtual long long ttl(std::string_view key) = 0;
    virtual long long pTtl(std::string_view key) = 0;

    // strings
    virtual std::optional<std::string> get(std::string_view key) = 0;
    virtual std::optional<std::string> getSet(std::string_view key, std::string_view value) = 0;
    virtual std::vector<std::optional<std::string>> mGet(const Keys &keys) = 0;
    virtual bool set(std::string_view key, std::string_view value) = 0;
    virtual bool set(std::string_view key, std::string_view value, const Expiration &expiration,
                     SetOption option) = 0;
    virtual bool setNX(std::string_view key, std::string_view value) = 0;
    virtual void setEx(std::string_view key, long long seconds, std::string_view value) = 0;
    virtual void mSet(const KeyValues &tuples) = 0;
    virtual long long incr(std::string_view key) = 0;
    virtual long long incrBy(std::string_view key, long long value) = 0;
    virtual double incrByFloat(std::string_view key, double value) = 0;
    virtual long long decr(std::string_view key) = 0;
    virtual long long decrBy(std::string_view key, long long value) = 0;
    virtual long long append(std::string_view key, std::string_view value) = 0;
    virtual long long strLen(std::string_view key) = 0;

    // lists
    virtual long long rPush(std::string_view key, const Values &values) = 0;
    virtual long long lPush(std::string_view key, const Values &values) = 0;
    virtual long long lLen(std::string_view key) = 0;
    virtual std::vector<std::string> lRange(std::string_view key, long long start, long long end) = 0;
    virtual void lTrim(std::string_view key, long long start, long long end) = 0;
    virtual std::optional<std::string> lIndex(std::string_view key, long long index) = 0;
    virtual void lSet(std::string_view key, long long index, std::string_view value) = 0;
    virtual long long lRem(std::string_view key, long long count, std::string_view value) = 0;
    virtual std::optional<std::string> lPop(std::string_view key) = 0;
    virtual std::optional<std::string> rPop(std::string_view key) = 0;
    virtual std::vector<std::string> bLPop(std::chrono::seconds timeout, const Keys &keys) = 0;
    virtual std::vector<std::string> bRPop(std::chrono::seconds timeout, const Keys &keys) = 0;
    virtual std::optional<std::string> rPopLPush(std::string_view srcKey, std::string_view dstKey) = 0;

    // sets
    virtual long long sAdd(std::string_view key, const Values &values) = 0;
    virtual long long sRem(std::string_view key, const Values &values) = 0;
    virtual std::optional<std::string> sPop(std::string_view key) = 0;
    virtual bool sMove(std::string_view srcKey, std::string_view destKey, std::string_view value) = 0;
    virtual long long sCard(std::string_view key) = 0;
    virtual bool sIsMember(std::string_view key, std::string_view value) = 0;
    virtual std::vector<std::string> sInter(const Keys &keys) = 0;
    virtual std::vector<std::string> sUnion(const Keys &keys) = 0;
    virtual std::vector<std::string> sDiff(const Keys &keys) = 0;
    virtual std::vector<std::string> sMembers(std::string_view key) = 0;
    virtual std::optional<std::string> sRandMember(std::string_view key) = 0;

    // sorted sets
    virtual bool zAdd(std::string_view key, double score, std::string_view value) = 0;
    virtual long long zAdd(std::string_view key, const std::vector<StringTuple> &tuples) = 0;
    virtual long long zRem(std::string_view key, const Values &values) = 0;
    virtual double zIncrBy(std::string_view key, double increment, std::string_view value) = 0;
    virtual std::optional<long long> zRank(std::string_view key, std::string_view value) = 0;
    virtual std::optional<long long> zRevRank(std::string_view key, std::string_view value) = 0;
    virtual std::vector<std::string> zRange(std::string_view key, long long start, long long end) = 0;
    virtual std::vector<StringTuple> zRangeWithScores(std::string_view key, long long start, long long end) = 0;
    virtual std::vector<std::string> zRevRange(std::string_view key, long long start, long long end) = 0;
    virtual std::vector<std::string> zRangeByScore(std::string_view key, const Range<double> &range,
                                                   const Limit &limit) = 0;
    virtual long long zCount(std::string_view key, const Range<double> &range) = 0;
    virtual long long zCard(std::string_view key) = 0;
    virtual std::optional<double> zScore(std::string_view key, std::string_view value) = 0;

    // hashes
    virtual bool hSet(std::string_view key, std::string_view field, std::string_view value) = 0;
    virtual bool hSetNX(std::string_view key, std::string_view field, std::string_view value) = 0;
    virtual std::optional<std::string> hGet(std::string_view key, std::string_view field) = 0;
    virtual std::vector<std::optional<std::string>> hMGet(std::string_view key, const Keys &fields) = 0;
    virtual void hMSet(std::string_view key, const KeyValues &hashes) = 0;
    virtual long long hIncrBy(std::string_view key, std::string_view field, long long delta) = 0;
    virtual bool hExists(std::string_view key, std::string_view field) = 0;
    virtual long long hDel(std::string_view key, const Keys &fields) = 0;
    virtual long long hLen(std::string_view key) = 0;
    virtual std::vector<std::string> hKeys(std::string_view key) = 0;
    virtual std::vector<std::string> hVals(std::string_view key) = 0;
    virtual KeyValues hGetAll(std::string_view key) = 0;

    // streams
    virtual long long xAck(std::string_view key, std::string_view group, const std::vector<RecordId> &recordIds) = 0;
    virtual RecordId xAdd(const StringRecord &record, const XAddOptions &options) = 0;
    virtual std::vector<StringRecord> xClaim(std::string_view key, std::string_view group, std::string_view newOwner,
                                             const XClaimOptions &options) = 0;
    virtual long long xDel(std::string_view key, const std::vector<RecordId> &recordIds) = 0;
    virtual std::string xGroupCreate(std::string_view key, const ReadOffset &readOffset, std::string_view group,
                                     bool mkStream) = 0;
    virtual bool xGroupDestroy(std::string_view key, std::string_view group) = 0;
    virtual long long xLen(std::string_view key) = 0;
    virtual PendingMessagesSummary xPending(std::string_view key, std::string_view group) = 0;
    virtual PendingMessages xPending(std::string_view key, std::string_view group,
                                     const XPendingOptions &options) = 0;
    virtual std::vector<StringRecord> xRange(std::string_view key, const Range<std::string> &range,
                                             const Limit &limit) = 0;
    virtual std::vector<StringRecord> xRead(const StreamReadOptions &readOptions,
                                            const std::vector<StreamOffset> &streams) = 0;
    virtual std::vector<StringRecord> xReadGroup(const Consumer &consumer, const StreamReadOptions &readOptions,
                                                 const std::vector<StreamOffset> &streams) = 0;
    virtual std::vector<StringRecord> xRevRange(std::string_view key, const Range<std::string> &range,
                                                const Limit &limit) = 0;
    virtual long long xTrim(std::string_view key, long long count, bool approximateTrimming) = 0;

    // pub/sub
    virtual long long publish(std::string_view channel, std::string_view message) = 0;
    virtual void subscribe(MessageListener listener, const Keys &channels) = 0;
    virtual void pSubscribe(MessageListener listener, const Keys &patterns) = 0;

    // transactions
    virtual void multi() = 0;
    virtual std::vector<Reply> exec() = 0;
    virtual void discard() = 0;
    virtual void watch(const Keys &keys) = 0;
    virtual void unwatch() = 0;

    RecordId xAdd(std::string_view key, const KeyValues &body) {
      return xAdd(StreamRecords::newRecord().in(key).ofMap(body), XAddOptions::none());
    }

    template <satisfies_stringview... Args>
      requires(sizeof...(Args) >= 1)
    long long del(Args &&...keys) {
      return del(toStrings(std::forward<Args>(keys)...));
    }
  };

  /**
   * @class DefaultStringRedisConnection
   *
   * @brief `StringRedisConnection` implemented by delegation to any `RedisConnection`
   *
   */
  class DefaultStringRedisConnection : public StringRedisConnection {
   public:
    explicit DefaultStringRedisConnection(std::unique_ptr<RedisConnection> connection_)
        : DefaultStringRedisConnection(std::move(connection_), std::make_shared<StringRedisSerializer>()) {}

    DefaultStringRedisConnection(std::unique_ptr<RedisConnection> connection_,
                                 std::shared_ptr<const RedisSerializer<std::string>> serializer_)
        : connection{std::move(connection_)}, serializer{std::move(serializer_)} {
      if (!connection) throw std::invalid_argument("RedisConnection must not be null");
      if (!serializer) throw std::invalid_argument("Serializer must not be null");
    }

    using StringRedisConnection::del;
    using StringRedisConnection::xAdd;

    RedisConnection &delegate() override { return *connection; }

    void close() override { connection->close(); }
    [[nodiscard]] bool isClosed() const override { return connection->isClosed(); }
    void openPipeline() override { connection->openPipeline(); }

    std::vector<Reply> closePipeline() override {
      try {
        return deserializeAll(connection->closePipeline());
      } catch (const PipelineError &e) {
        throw PipelineError(e.what(), deserializeAll(e.results()));
      }
    }

    [[nodiscard]] bool isPipelined() const override { return connection->isPipelined(); }
    [[nodiscard]] bool isQueueing() const override { return connection->isQueueing(); }

    Reply execute(std::string_view command, const Values &args) override {
      return deserialize(connection->execute(command, serialize(args)));
    }

    /*
     * Keys
     */

    long long exists(const Keys &keys) override { return connection->exists(serialize(keys)); }
    long long del(const Keys &keys) override { return connection->del(serialize(keys)); }
    DataType type(std::string_view key) override { return connection->type(serialize(key)); }

    std::vector<std::string> keys(std::string_view pattern) override {
      return deserialize(connection->keys(serialize(pattern)));
    }

    void rename(std::string_view oldKey, std::string_view newKey) override {
      connection->rename(serialize(oldKey), serialize(newKey));
    }

    bool expire(std::string_view key, long long seconds) override {
      return connection->expire(serialize(key), seconds);
    }

    bool pExpire(std::string_view key, long long millis) override {
      return connection->pExpire(serialize(key), millis);
    }

    bool persist(std::string_view key) override { return connection->persist(serialize(key)); }
    long long ttl(std::string_view key) override { return connection->ttl(serialize(key)); }
    long long pTtl(std::string_view key) override { return connection->pTtl(serialize(key)); }

    /*
     * Strings
     */

    std::optional<std::string> get(std::string_view key) override {
      return deserialize(connection->get(serialize(key)));
    }

    std::optional<std::string> getSet(std::string_view key, std::string_view value) override {
      return deserialize(connection->getSet(serialize(key), serialize(value)));
    }

    std::vector<std::optional<std::string>> mGet(const Keys &keys) override {
      return deserialize(connection->mGet(serialize(keys)));
    }

    bool set(std::string_view key, std::string_view value) override {
      return connection->set(serialize(key), serialize(value));
    }

    bool set(std::string_view key, std::string_view value, const Expiration &expiration,
             SetOption option) override {
      return connection->set(serialize(key), serialize(value), expiration, option);
    }

    bool setNX(std::string_view key, std::string_view value) override {
      return connection->setNX(serialize(key), serialize(value));
    }

    void setEx(std::string_view key, long long seconds, std::string_view value) override {
      connection->setEx(serialize(key), seconds, serialize(value));
    }

    void mSet(const KeyValues &tuples) override { connection->mSet(serialize(tuples)); }

    long long incr(std::string_view key) override { return connection->incr(serialize(key)); }

    long long incrBy(std::string_view key, long long value) override {
      return connection->incrBy(serialize(key), value);
    }

    double incrByFloat(std::string_view key, double value) override {
      return connection->incrByFloat(serialize(key), value);
    }

    long long decr(std::string_view key) override { return connection->decr(serialize(key)); }

    long long decrBy(std::string_view key, long long value) override {
      return connection->decrBy(serialize(key), value);
    }

    long long append(std::string_view key, std::string_view value) override {
      return connection->append(serialize(key), serialize(value));
    }

    long long strLen(std::string_view key) override { return connection->strLen(serialize(key)); }

    /*
     * Lists
     */

    long long rPush(std::string_view key, const Values &values) override {
      return connection->rPush(serialize(key), serialize(values));
    }

    long long lPush(std::string_view key, const Values &values) override {
      return connection->lPush(serialize(key), serialize(values));
    }

    long long lLen(std::string_view key) override { return connection->lLen(serialize(key)); }

    std::vector<std::string> lRange(std::string_view key, long long start, long long end) override {
      return deserialize(connection->lRange(serialize(key), start, end));
    }

    void lTrim(std::string_view key, long long start, long long end) override {
      connection->lTrim(serialize(key), start, end);
    }

    std::optional<std::string> lIndex(std::string_view key, long long index) override {
      return deserialize(connection->lIndex(serialize(key), index));
    }

    void lSet(std::string_view key, long long index, std::string_view value) override {
      connection->lSet(serialize(key), index, serialize(value));
    }

    long long lRem(std::string_view key, long long count, std::string_view value) override {
      return connection->lRem(serialize(key), count, serialize(value));
    }

    std::optional<std::string> lPop(std::string_view key) override {
      return deserialize(connection->lPop(serialize(key)));
    }

    std::optional<std::string> rPop(std::string_view key) override {
      return deserialize(connection->rPop(serialize(key)));
    }

    std::vector<std::string> bLPop(std::chrono::seconds timeout, const Keys &keys) override {
      return deserialize(connection->bLPop(timeout, serialize(keys)));
    }

    std::vector<std::string> bRPop(std::chrono::seconds timeout, const Keys &keys) override {
      return deserialize(connection->bRPop(timeout, serialize(keys)));
    }

    std::optional<std::string> rPopLPush(std::string_view srcKey, std::string_view dstKey) override {
      return deserialize(connection->rPopLPush(serialize(srcKey), serialize(dstKey)));
    }

    /*
     * Sets
     */

    long long sAdd(std::string_view key, const Values &values) override {
      return connection->sAdd(serialize(key), serialize(values));
    }

    long long sRem(std::string_view key, const Values &values) override {
      return connection->sRem(serialize(key), serialize(values));
    }

    std::optional<std::string> sPop(std::string_view key) override {
      return deserialize(connection->sPop(serialize(key)));
    }

    bool sMove(std::string_view srcKey, std::string_view destKey, std::string_view value) override {
      return connection->sMove(serialize(srcKey), serialize(destKey), serialize(value));
    }

    long long sCard(std::string_view key) override { return connection->sCard(serialize(key)); }

    bool sIsMember(std::string_view key, std::string_view value) override {
      return connection->sIsMember(serialize(key), serialize(value));
    }

    std::vector<std::string> sInter(const Keys &keys) override {
      return deserialize(connection->sInter(serialize(keys)));
    }

    std::vector<std::string> sUnion(const Keys &keys) override {
      return deserialize(connection->sUnion(serialize(keys)));
    }

    std::vector<std::string> sDiff(const Keys &keys) override {
      return deserialize(connection->sDiff(serialize(keys)));
    }

    std::vector<std::string> sMembers(std::string_view key) override {
      return deserialize(connection->sMembers(serialize(key)));
    }

    std::optional<std::string> sRandMember(std::string_view key) override {
      return deserialize(connection->sRandMember(serialize(key)));
    }

    /*
     * Sorted sets
     */

    bool zAdd(std::string_view key, double score, std::string_view value) override {
      return connection->zAdd(serialize(key), score, serialize(value));
    }

    long long zAdd(std::string_view key, const std::vector<StringTuple> &tuples) override {
      std::vector<Tuple> raw;
      raw.reserve(tuples.size());
      for (const auto &t : tuples) raw.push_back(Tuple{serialize(t.value), t.score});
      return connection->zAdd(serialize(key), raw);
    }

    long long zRem(std::string_view key, const Values &values) override {
      return connection->zRem(serialize(key), serialize(values));
    }

    double zIncrBy(std::string_view key, double increment, std::string_view value) override {
      return connection->zIncrBy(serialize(key), increment, serialize(value));
    }

    std::optional<long long> zRank(std::string_view key, std::string_view value) override {
      return connection->zRank(serialize(key), serialize(value));
    }

    std::optional<long long> zRevRank(std::string_view key, std::string_view value) override {
      return connection->zRevRank(serialize(key), serialize(value));
    }

    std::vector<std::string> zRange(std::string_view key, long long start, long long end) override {
      return deserialize(connection->zRange(serialize(key), start, end));
    }

    std::vector<StringTuple> zRangeWithScores(std::string_view key, long long start, long long end) override {
      auto raw = connection->zRangeWithScores(serialize(key), start, end);
      for (auto &t : raw) t.value = serializer->deserialize(t.value);
      return raw;
    }

    std::vector<std::string> zRevRange(std::string_view key, long long start, long long end) override {
      return deserialize(connection->zRevRange(serialize(key), start, end));
    }

    std::vector<std::string> zRangeByScore(std::string_view key, const Range<double> &range,
                                           const Limit &limit) override {
      return deserialize(connection->zRangeByScore(serialize(key), range, limit));
    }

    long long zCount(std::string_view key, const Range<double> &range) override {
      return connection->zCount(serialize(key), range);
    }

    long long zCard(std::string_view key) override { return connection->zCard(serialize(key)); }

    std::optional<double> zScore(std::string_view key, std::string_view value) override {
      return connection->zScore(serialize(key), serialize(value));
    }

    /*
     * Hashes
     */

    bool hSet(std::string_view key, std::string_view field, std::string_view value) override {
      return connection->hSet(serialize(key), serialize(field), serialize(value));
    }

    bool hSetNX(std::string_view key, std::string_view field, std::string_view value) override {
      return connection->hSetNX(serialize(key), serialize(field), serialize(value));
    }

    std::optional<std::string> hGet(std::string_view key, std::string_view field) override {
      return deserialize(connection->hGet(serialize(key), serialize(field)));
    }

    std::vector<std::optional<std::string>> hMGet(std::string_view key, const Keys &fields) override {
      return deserialize(connection->hMGet(serialize(key), serialize(fields)));
    }

    void hMSet(std::string_view key, const KeyValues &hashes) override {
      connection->hMSet(serialize(key), serialize(hashes));
    }

    long long hIncrBy(std::string_view key, std::string_view field, long long delta) override {
      return connection->hIncrBy(serialize(key), serialize(field), delta);
    }

    bool hExists(std::string_view key, std::string_view field) override {
      return connection->hExists(serialize(key), serialize(field));
    }

    long long hDel(std::string_view key, const Keys &fields) override {
      return connection->hDel(serialize(key), serialize(fields));
    }

    long long hLen(std::string_view key) override { return connection->hLen(serialize(key)); }

    std::vector<std::string> hKeys(std::string_view key) override {
      return deserialize(connection->hKeys(serialize(key)));
    }

    std::vector<std::string> hVals(std::string_view key) override {
      return deserialize(connection->hVals(serialize(key)));
    }

    KeyValues hGetAll(std::string_view key) override { return deserialize(connection->hGetAll(serialize(key))); }

    /*
     * Streams
     */

    long long xAck(std::string_view key, std::string_view group, const std::vector<RecordId> &recordIds) override {
      return connection->xAck(serialize(key), group, recordIds);
    }

    RecordId xAdd(const StringRecord &record, const XAddOptions &options) override {
      return connection->xAdd(serializeRecord(record), options);
    }

    std::vector<StringRecord> xClaim(std::string_view key, std::string_view group, std::string_view newOwner,
                                     const XClaimOptions &options) override {
      return deserializeRecords(connection->xClaim(serialize(key), group, newOwner, options));
    }

    long long xDel(std::string_view key, const std::vector<RecordId> &recordIds) override {
      return connection->xDel(serialize(key), recordIds);
    }

    std::string xGroupCreate(std::string_view key, const ReadOffset &readOffset, std::string_view group,
                             bool mkStream) override {
      return connection->xGroupCreate(serialize(key), group, readOffset, mkStream);
    }

    bool xGroupDestroy(std::string_view key, std::string_view group) override {
      return connection->xGroupDestroy(serialize(key), group);
    }

    long long xLen(std::string_view key) override { return connection->xLen(serialize(key)); }

    PendingMessagesSummary xPending(std::string_view key, std::string_view group) override {
      return connection->xPending(serialize(key), group);
    }

    PendingMessages xPending(std::string_view key, std::string_view group, const XPendingOptions &options) override {
      return connection->xPending(serialize(key), group, options);
    }

    std::vector<StringRecord> xRange(std::string_view key, const Range<std::string> &range,
                                     const Limit &limit) override {
      return deserializeRecords(connection->xRange(serialize(key), range, limit));
    }

    std::vector<StringRecord> xRead(const StreamReadOptions &readOptions,
                                    const std::vector<StreamOffset> &streams) override {
      return deserializeRecords(connection->xRead(readOptions, serialize(streams)));
    }

    std::vector<StringRecord> xReadGroup(const Consumer &consumer, const StreamReadOptions &readOptions,
                                         const std::vector<StreamOffset> &streams) override {
      return deserializeRecords(connection->xReadGroup(consumer, readOptions, serialize(streams)));
    }

    std::vector<StringRecord> xRevRange(std::string_view key, const Range<std::string> &range,
                                        const Limit &limit) override {
      return deserializeRecords(connection->xRevRange(serialize(key), range, limit));
    }

    long long xTrim(std::string_view key, long long count, bool approximateTrimming) override {
      return connection->xTrim(serialize(key), count, approximateTrimming);
    }

    /*
     * Pub/sub
     */

    long long publish(std::string_view channel, std::string_view message) override {
      return connection->publish(serialize(channel), serialize(message));
    }

    void subscribe(MessageListener listener, const Keys &channels) override {
      connection->subscribe(deserializingListener(std::move(listener)), serialize(channels));
    }

    void pSubscribe(MessageListener listener, const Keys &patterns) override {
      connection->pSubscribe(deserializingListener(std::move(listener)), serialize(patterns));
    }

    /*
     * Transactions
     */

    void multi() override { connection->multi(); }

    std::vector<Reply> exec() override {
      try {
        return deserializeAll(connection->exec());
      } catch (const PipelineError &e) {
        throw PipelineError(e.what(), deserializeAll(e.results()));
      }
    }

    void discard() override { connection->discard(); }
    void watch(const Keys &keys) override { connection->watch(serialize(keys)); }
    void unwatch() override { connection->unwatch(); }

   private:
    std::unique_ptr<RedisConnection> connection;
    std::shared_ptr<const RedisSerializer<std::string>> serializer;

    std::string serialize(std::string_view value) const { return serializer->serialize(std::string(value)); }

    std::vector<std::string> serialize(const std::vector<std::string> &values) const {
      std::vector<std::string> out;
      out.reserve(values.size());
      for (const auto &v : values) out.push_back(serializer->serialize(v));
      return out;
    }

    KeyValues serialize(const KeyValues &pairs) const {
      KeyValues out;
      out.reserve(pairs.size());
      for (const auto &[k, v] : pairs) out.emplace_back(serializer->serialize(k), serializer->serialize(v));
      return out;
    }

    std::vector<StreamOffset> serialize(const std::vector<StreamOffset> &streams) const {
      std::vector<StreamOffset> out;
      out.reserve(streams.size());
      for (const auto &s : streams) out.push_back(StreamOffset::create(serialize(s.key()), s.offset()));
      return out;
    }

    ByteRecord serializeRecord(const StringRecord &record) const {
      return ByteRecord(serialize(record.stream()), record.id(), serialize(record.value()));
    }

    std::optional<std::string> deserialize(const std::optional<std::string> &value) const {
      if (!value.has_value()) return std::nullopt;
      return serializer->deserialize(*value);
    }

    std::vector<std::string> deserialize(const std::vector<std::string> &values) const {
      std::vector<std::string> out;
      out.reserve(values.size());
      for (const auto &v : values) out.push_back(serializer->deserialize(v));
      return out;
    }

    std::vector<std::optional<std::string>> deserialize(const std::vector<std::optional<std::string>> &values) const {
      std::vector<std::optional<std::string>> out;
      out.reserve(values.size());
      for (const auto &v : values) out.push_back(deserialize(v));
      return out;
    }

    KeyValues deserialize(const KeyValues &pairs) const {
      KeyValues out;
      out.reserve(pairs.size());
      for (const auto &[k, v] : pairs) out.emplace_back(serializer->deserialize(k), serializer->deserialize(v));
      return out;
    }

    /**
     * @brief Deserialize every bulk string in a reply tree; status, error and numeric replies are kept
     *
     */
    Reply deserialize(const Reply &reply) const {
      Reply out = reply;
      if (out.type == ReplyType::STRING) out.str = serializer->deserialize(out.str);
      for (auto &e : out.elements) e = deserialize(e);
      return out;
    }

    std::vector<Reply> deserializeAll(const std::vector<Reply> &replies) const {
      std::vector<Reply> out;
      out.reserve(replies.size());
      for (const auto &r : replies) out.push_back(deserialize(r));
      return out;
    }

    std::vector<StringRecord> deserializeRecords(const std::vector<ByteRecord> &records) const {
      std::vector<StringRecord> out;
      out.reserve(records.size());
      for (const auto &r : records) {
        out.emplace_back(serializer->deserialize(r.stream()), r.id(), deserialize(r.value()));
      }
      return out;
    }

    MessageListener deserializingListener(MessageListener listener) const {
      if (!listener) throw std::invalid_argument("MessageListener must not be empty");
      return [listener = std::move(listener), serializer = serializer](const Message &message) {
        Message converted{serializer->deserialize(message.channel), serializer->deserialize(message.body),
                          std::nullopt};
        if (message.pattern.has_value()) converted.pattern = serializer->deserialize(*message.pattern);
        listener(converted);
      };
    }
  };
};  // namespace RedisConn
