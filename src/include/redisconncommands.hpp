#pragma once
#include <chrono>
#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "redisconnconverters.hpp"
#include "redisconndriver.hpp"
#include "redisconnreply.hpp"
#include "redisconnstream.hpp"
#include "redisconnsubscription.hpp"
#include "redisconntypes.hpp"

namespace RedisConn {

  using Keys = std::vector<std::string>;
  using Values = std::vector<std::string>;

  /**
   * Ensure all elements of a parameter pack are `std::string_view` or capable of being
   * converted to a `std::string_view`.
   */
  template <typename T>
  concept satisfies_stringview = std::constructible_from<std::string_view, T>;

  /**
   * @brief Collect a parameter pack of string-like arguments into owned strings
   *
   */
  template <satisfies_stringview... Args>
  inline std::vector<std::string> toStrings(Args &&...args) {
    return std::vector<std::string>{std::string(std::string_view(std::forward<Args>(args)))...};
  }

  /**
   * @class KeyCommands
   *
   * @brief Commands operating on the keyspace
   *
   */
  class KeyCommands {
   public:
    virtual ~KeyCommands() = default;

    /**
     * @brief Count how many of the given keys exist (a key given twice is counted twice)
     *
     */
    virtual long long exists(const Keys &keys) = 0;
    virtual long long del(const Keys &keys) = 0;
    virtual long long unlink(const Keys &keys) = 0;
    virtual DataType type(std::string_view key) = 0;
    virtual long long touch(const Keys &keys) = 0;
    virtual std::vector<std::string> keys(std::string_view pattern) = 0;
    virtual ScanCursor<std::string> scan(uint64_t cursor, const ScanOptions &options) = 0;
    virtual std::optional<std::string> randomKey() = 0;
    virtual void rename(std::string_view oldKey, std::string_view newKey) = 0;
    virtual bool renameNX(std::string_view oldKey, std::string_view newKey) = 0;
    virtual bool expire(std::string_view key, long long seconds) = 0;
    virtual bool pExpire(std::string_view key, long long millis) = 0;
    virtual bool expireAt(std::string_view key, long long unixTime) = 0;
    virtual bool pExpireAt(std::string_view key, long long unixTimeInMillis) = 0;
    virtual bool persist(std::string_view key) = 0;
    virtual bool move(std::string_view key, int dbIndex) = 0;

    /**
     * @brief Remaining time to live in seconds; `-1` for a key without expiry, `-2` for a missing key
     *
     */
    virtual long long ttl(std::string_view key) = 0;
    virtual long long pTtl(std::string_view key) = 0;
    virtual std::vector<std::string> sort(std::string_view key, const SortParameters &params) = 0;
    virtual long long sort(std::string_view key, const SortParameters &params, std::string_view storeKey) = 0;

    template <satisfies_stringview... Args>
      requires(sizeof...(Args) >= 1)
    long long exists(Args &&...keys) {
      return exists(toStrings(std::forward<Args>(keys)...));
    }

    template <satisfies_stringview... Args>
      requires(sizeof...(Args) >= 1)
    long long del(Args &&...keys) {
      return del(toStrings(std::forward<Args>(keys)...));
    }

    template <satisfies_stringview... Args>
      requires(sizeof...(Args) >= 1)
    long long unlink(Args &&...keys) {
      return unlink(toStrings(std::forward<Args>(keys)...));
    }

    ScanCursor<std::string> scan(uint64_t cursor) { return scan(cursor, ScanOptions::none()); }
  };

  /**
   * @class StringCommands
   *
   * @brief Commands operating on string values
   *
   */
  class StringCommands {
   public:
    virtual ~StringCommands() = default;

    virtual std::optional<std::string> get(std::string_view key) = 0;
    virtual std::optional<std::string> getSet(std::string_view key, std::string_view value) = 0;
    virtual std::optional<std::string> getDel(std::string_view key) = 0;

    /**
     * @brief Get several values at once; missing keys are `std::nullopt` at their position
     *
     */
    virtual std::vector<std::optional<std::string>> mGet(const Keys &keys) = 0;

    /**
     * @brief `SET` with an expiration and a condition
     *
     * @return `true` if the value was set, `false` if the NX/XX condition was not met
     *
     */
    virtual bool set(std::string_view key, std::string_view value, const Expiration &expiration,
                     SetOption option) = 0;
    virtual bool setNX(std::string_view key, std::string_view value) = 0;
    virtual void setEx(std::string_view key, long long seconds, std::string_view value) = 0;
    virtual void pSetEx(std::string_view key, long long millis, std::string_view value) = 0;
    virtual void mSet(const KeyValues &tuples) = 0;
    virtual bool mSetNX(const KeyValues &tuples) = 0;
    virtual long long incr(std::string_view key) = 0;
    virtual long long incrBy(std::string_view key, long long value) = 0;
    virtual double incrByFloat(std::string_view key, double value) = 0;
    virtual long long decr(std::string_view key) = 0;
    virtual long long decrBy(std::string_view key, long long value) = 0;
    virtual long long append(std::string_view key, std::string_view value) = 0;
    virtual std::string getRange(std::string_view key, long long start, long long end) = 0;
    virtual long long setRange(std::string_view key, std::string_view value, long long offset) = 0;
    virtual bool getBit(std::string_view key, long long offset) = 0;

    /**
     * @brief Set or clear a bit
     *
     * @return The original value of the bit
     *
     */
    virtual bool setBit(std::string_view key, long long offset, bool value) = 0;
    virtual long long bitCount(std::string_view key) = 0;
    virtual long long bitCount(std::string_view key, long long start, long long end) = 0;
    virtual long long strLen(std::string_view key) = 0;

    bool set(std::string_view key, std::string_view value) {
      return set(key, value, Expiration::persistent(), SetOption::UPSERT);
    }

    template <satisfies_stringview... Args>
      requires(sizeof...(Args) >= 1)
    std::vector<std::optional<std::string>> mGet(Args &&...keys) {
      return mGet(toStrings(std::forward<Args>(keys)...));
    }
  };

  /**
   * @class ListCommands
   *
   * @brief Commands operating on lists
   *
   */
  class ListCommands {
   public:
    virtual ~ListCommands() = default;

    virtual long long rPush(std::string_view key, const Values &values) = 0;
    virtual long long lPush(std::string_view key, const Values &values) = 0;
    virtual long long rPushX(std::string_view key, std::string_view value) = 0;
    virtual long long lPushX(std::string_view key, std::string_view value) = 0;
    virtual long long lLen(std::string_view key) = 0;
    virtual std::vector<std::string> lRange(std::string_view key, long long start, long long end) = 0;
    virtual void lTrim(std::string_view key, long long start, long long end) = 0;
    virtual std::optional<std::string> lIndex(std::string_view key, long long index) = 0;
    virtual long long lInsert(std::string_view key, Position where, std::string_view pivot,
                              std::string_view value) = 0;
    virtual void lSet(std::string_view key, long long index, std::string_view value) = 0;
    virtual long long lRem(std::string_view key, long long count, std::string_view value) = 0;
    virtual std::optional<std::string> lPop(std::string_view key) = 0;
    virtual std::vector<std::string> lPop(std::string_view key, long long count) = 0;
    virtual std::optional<std::string> rPop(std::string_view key) = 0;
    virtual std::vector<std::string> rPop(std::string_view key, long long count) = 0;

    /**
     * @brief Blocking pop from the first non-empty list
     *
     * @return `{key, value}`, or an empty list if the timeout expired
     *
     */
    virtual std::vector<std::string> bLPop(std::chrono::seconds timeout, const Keys &keys) = 0;
    virtual std::vector<std::string> bRPop(std::chrono::seconds timeout, const Keys &keys) = 0;
    virtual std::optional<std::string> rPopLPush(std::string_view srcKey, std::string_view dstKey) = 0;
    virtual std::optional<std::string> bRPopLPush(std::chrono::seconds timeout, std::string_view srcKey,
                                                  std::string_view dstKey) = 0;
    virtual std::optional<long long> lPos(std::string_view key, std::string_view element) = 0;
    virtual std::vector<long long> lPos(std::string_view key, std::string_view element, std::optional<long long> rank,
                                        long long count) = 0;

    template <satisfies_stringview... Args>
      requires(sizeof...(Args) >= 1)
    long long rPush(std::string_view key, Args &&...values) {
      return rPush(key, toStrings(std::forward<Args>(values)...));
    }

    template <satisfies_stringview... Args>
      requires(sizeof...(Args) >= 1)
    long long lPush(std::string_view key, Args &&...values) {
      return lPush(key, toStrings(std::forward<Args>(values)...));
    }
  };

  /**
   * @class SetCommands
   *
   * @brief Commands operating on sets
   *
   */
  class SetCommands {
   public:
    virtual ~SetCommands() = default;

    virtual long long sAdd(std::string_view key, const Values &values) = 0;
    virtual long long sRem(std::string_view key, const Values &values) = 0;
    virtual std::optional<std::string> sPop(std::string_view key) = 0;
    virtual std::vector<std::string> sPop(std::string_view key, long long count) = 0;
    virtual bool sMove(std::string_view srcKey, std::string_view destKey, std::string_view value) = 0;
    virtual long long sCard(std::string_view key) = 0;
    virtual bool sIsMember(std::string_view key, std::string_view value) = 0;
    virtual std::vector<bool> sMIsMember(std::string_view key, const Values &values) = 0;
    virtual std::vector<std::string> sInter(const Keys &keys) = 0;
    virtual long long sInterStore(std::string_view destKey, const Keys &keys) = 0;
    virtual std::vector<std::string> sUnion(const Keys &keys) = 0;
    virtual long long sUnionStore(std::string_view destKey, const Keys &keys) = 0;
    virtual std::vector<std::string> sDiff(const Keys &keys) = 0;
    virtual long long sDiffStore(std::string_view destKey, const Keys &keys) = 0;
    virtual std::vector<std::string> sMembers(std::string_view key) = 0;
    virtual std::optional<std::string> sRandMember(std::string_view key) = 0;

    /**
     * @brief Random members; a negative count may return the same member more than once
     *
     */
    virtual std::vector<std::string> sRandMember(std::string_view key, long long count) = 0;
    virtual ScanCursor<std::string> sScan(std::string_view key, uint64_t cursor, const ScanOptions &options) = 0;

    template <satisfies_stringview... Args>
      requires(sizeof...(Args) >= 1)
    long long sAdd(std::string_view key, Args &&...values) {
      return sAdd(key, toStrings(std::forward<Args>(values)...));
    }

    template <satisfies_stringview... Args>
      requires(sizeof...(Args) >= 1)
    long long sRem(std::string_view key, Args &&...values) {
      return sRem(key, toStrings(std::forward<Args>(values)...));
    }
  };

  /**
   * @class ZSetCommands
   *
   * @brief Commands operating on sorted sets
   *
   */
  class ZSetCommands {
   public:
    virtual ~ZSetCommands() = default;

    /**
     * @brief Add a member, or update its score
     *
     * @return `true` if the member was added, `false` if only its score was updated
     *
     */
    virtual bool zAdd(std::string_view key, double score, std::string_view value, ZAddFlag flag) = 0;
    virtual long long zAdd(std::string_view key, const std::vector<Tuple> &tuples, ZAddFlag flag) = 0;
    virtual long long zRem(std::string_view key, const Values &values) = 0;
    virtual double zIncrBy(std::string_view key, double increment, std::string_view value) = 0;
    virtual std::optional<long long> zRank(std::string_view key, std::string_view value) = 0;
    virtual std::optional<long long> zRevRank(std::string_view key, std::string_view value) = 0;
    virtual std::vector<std::string> zRange(std::string_view key, long long start, long long end) = 0;
    virtual std::vector<Tuple> zRangeWithScores(std::string_view key, long long start, long long end) = 0;
    virtual std::vector<std::string> zRevRange(std::string_view key, long long start, long long end) = 0;
    virtual std::vector<Tuple> zRevRangeWithScores(std::string_view key, long long start, long long end) = 0;
    virtual std::vector<std::string> zRangeByScore(std::string_view key, const Range<double> &range,
                                                   const Limit &limit) = 0;
    virtual std::vector<Tuple> zRangeByScoreWithScores(std::string_view key, const Range<double> &range,
                                                       const Limit &limit) = 0;
    virtual std::vector<std::string> zRevRangeByScore(std::string_view key, const Range<double> &range,
                                                      const Limit &limit) = 0;
    virtual std::vector<Tuple> zRevRangeByScoreWithScores(std::string_view key, const Range<double> &range,
                                                          const Limit &limit) = 0;
    virtual long long zCount(std::string_view key, const Range<double> &range) = 0;
    virtual long long zCard(std::string_view key) = 0;
    virtual std::optional<double> zScore(std::string_view key, std::string_view value) = 0;
    virtual std::vector<std::optional<double>> zMScore(std::string_view key, const Values &values) = 0;
    virtual long long zRemRange(std::string_view key, long long start, long long end) = 0;
    virtual long long zRemRangeByScore(std::string_view key, const Range<double> &range) = 0;
    virtual long long zUnionStore(std::string_view destKey, Aggregate aggregate, const Weights &weights,
                                  const Keys &sets) = 0;
    virtual long long zInterStore(std::string_view destKey, Aggregate aggregate, const Weights &weights,
                                  const Keys &sets) = 0;

    bool zAdd(std::string_view key, double score, std::string_view value) {
      return zAdd(key, score, value, ZAddFlag::NONE);
    }

    long long zAdd(std::string_view key, const std::vector<Tuple> &tuples) { return zAdd(key, tuples, ZAddFlag::NONE); }

    std::vector<std::string> zRangeByScore(std::string_view key, double min, double max) {
      return zRangeByScore(key, Range<double>::closed(min, max), Limit::unlimited());
    }

    long long zUnionStore(std::string_view destKey, const Keys &sets) {
      return zUnionStore(destKey, Aggregate::SUM, {}, sets);
    }

    long long zInterStore(std::string_view destKey, const Keys &sets) {
      return zInterStore(destKey, Aggregate::SUM, {}, sets);
    }

    template <satisfies_stringview... Args>
      requires(sizeof...(Args) >= 1)
    long long zRem(std::string_view key, Args &&...values) {
      return zRem(key, toStrings(std::forward<Args>(values)...));
    }
  };

  /**
   * @class HashCommands
   *
   * @brief Commands operating on hashes
   *
   */
  class HashCommands {
   public:
    virtual ~HashCommands() = default;

    /**
     * @brief Set one field
     *
     * @return `true` if the field is new, `false` if an existing field was overwritten
     *
     */
    virtual bool hSet(std::string_view key, std::string_view field, std::string_view value) = 0;
    virtual bool hSetNX(std::string_view key, std::string_view field, std::string_view value) = 0;
    virtual std::optional<std::string> hGet(std::string_view key, std::string_view field) = 0;
    virtual std::vector<std::optional<std::string>> hMGet(std::string_view key, const Keys &fields) = 0;
    virtual void hMSet(std::string_view key, const KeyValues &hashes) = 0;
    virtual long long hIncrBy(std::string_view key, std::string_view field, long long delta) = 0;
    virtual double hIncrByFloat(std::string_view key, std::string_view field, double delta) = 0;
    virtual bool hExists(std::string_view key, std::string_view field) = 0;
    virtual long long hDel(std::string_view key, const Keys &fields) = 0;
    virtual long long hLen(std::string_view key) = 0;
    virtual std::vector<std::string> hKeys(std::string_view key) = 0;
    virtual std::vector<std::string> hVals(std::string_view key) = 0;
    virtual KeyValues hGetAll(std::string_view key) = 0;
    virtual long long hStrLen(std::string_view key, std::string_view field) = 0;
    virtual std::optional<std::string> hRandField(std::string_view key) = 0;
    virtual std::vector<std::string> hRandField(std::string_view key, long long count) = 0;
    virtual ScanCursor<KeyValue> hScan(std::string_view key, uint64_t cursor, const ScanOptions &options) = 0;

    template <satisfies_stringview... Args>
      requires(sizeof...(Args) >= 1)
    std::vector<std::optional<std::string>> hMGet(std::string_view key, Args &&...fields) {
      return hMGet(key, toStrings(std::forward<Args>(fields)...));
    }

    template <satisfies_stringview... Args>
      requires(sizeof...(Args) >= 1)
    long long hDel(std::string_view key, Args &&...fields) {
      return hDel(key, toStrings(std::forward<Args>(fields)...));
    }
  };

  /**
   * @class StreamCommands
   *
   * @brief Commands operating on streams
   *
   * @details Records are read and written as `ByteRecord`; the string-typed view in
   * `StringRedisConnection` converts them through its serializer.
   *
   */
  class StreamCommands {
   public:
    virtual ~StreamCommands() = default;

    /**
     * @brief Acknowledge records, removing them from the group's pending entries list
     *
     * @return The number of records acknowledged
     *
     */
    virtual long long xAck(std::string_view key, std::string_view group, const std::vector<RecordId> &recordIds) = 0;

    /**
     * @brief Append a record to the stream named by the record
     *
     * @return The id the record was stored under. In pipeline or transaction mode the id is not known
     * yet and the auto-generate sentinel is returned.
     *
     */
    virtual RecordId xAdd(const ByteRecord &record, const XAddOptions &options) = 0;
    virtual std::vector<ByteRecord> xClaim(std::string_view key, std::string_view group, std::string_view newOwner,
                                           const XClaimOptions &options) = 0;
    virtual std::vector<RecordId> xClaimJustId(std::string_view key, std::string_view group,
                                               std::string_view newOwner, const XClaimOptions &options) = 0;
    virtual long long xDel(std::string_view key, const std::vector<RecordId> &recordIds) = 0;
    virtual std::string xGroupCreate(std::string_view key, std::string_view groupName, const ReadOffset &readOffset,
                                     bool mkStream) = 0;
    virtual bool xGroupDelConsumer(std::string_view key, const Consumer &consumer) = 0;
    virtual bool xGroupDestroy(std::string_view key, std::string_view groupName) = 0;
    virtual XInfoStream xInfo(std::string_view key) = 0;
    virtual XInfoGroups xInfoGroups(std::string_view key) = 0;
    virtual XInfoConsumers xInfoConsumers(std::string_view key, std::string_view groupName) = 0;
    virtual long long xLen(std::string_view key) = 0;
    virtual PendingMessagesSummary xPending(std::string_view key, std::string_view groupName) = 0;
    virtual PendingMessages xPending(std::string_view key, std::string_view groupName,
                                     const XPendingOptions &options) = 0;
    virtual std::vector<ByteRecord> xRange(std::string_view key, const Range<std::string> &range,
                                           const Limit &limit) = 0;
    virtual std::vector<ByteRecord> xRead(const StreamReadOptions &readOptions,
                                          const std::vector<StreamOffset> &streams) = 0;
    virtual std::vector<ByteRecord> xReadGroup(const Consumer &consumer, const StreamReadOptions &readOptions,
                                               const std::vector<StreamOffset> &streams) = 0;
    virtual std::vector<ByteRecord> xRevRange(std::string_view key, const Range<std::string> &range,
                                              const Limit &limit) = 0;
    virtual long long xTrim(std::string_view key, long long count, bool approximateTrimming) = 0;

    RecordId xAdd(const ByteRecord &record) { return xAdd(record, XAddOptions::none()); }

    RecordId xAdd(std::string_view key, const KeyValues &body) {
      return xAdd(StreamRecords::newRecord().in(key).ofMap(body), XAddOptions::none());
    }

    template <satisfies_stringview... Args>
      requires(sizeof...(Args) >= 1)
    long long xAck(std::string_view key, std::string_view group, Args &&...recordIds) {
      return xAck(key, group, std::vector<RecordId>{RecordId::of(std::string_view(recordIds))...});
    }

    template <satisfies_stringview... Args>
      requires(sizeof...(Args) >= 1)
    long long xDel(std::string_view key, Args &&...recordIds) {
      return xDel(key, std::vector<RecordId>{RecordId::of(std::string_view(recordIds))...});
    }

    std::string xGroupCreate(std::string_view key, std::string_view groupName, const ReadOffset &readOffset) {
      return xGroupCreate(key, groupName, readOffset, false);
    }

    PendingMessages xPending(std::string_view key, const Consumer &consumer) {
      return xPending(key, consumer.group(), XPendingOptions::unbounded().consumer(consumer.name()));
    }

    std::vector<ByteRecord> xRange(std::string_view key, const Range<std::string> &range) {
      return xRange(key, range, Limit::unlimited());
    }

    std::vector<ByteRecord> xRevRange(std::string_view key, const Range<std::string> &range) {
      return xRevRange(key, range, Limit::unlimited());
    }

    std::vector<ByteRecord> xRead(const std::vector<StreamOffset> &streams) {
      return xRead(StreamReadOptions::empty(), streams);
    }

    std::vector<ByteRecord> xReadGroup(const Consumer &consumer, const std::vector<StreamOffset> &streams) {
      return xReadGroup(consumer, StreamReadOptions::empty(), streams);
    }

    long long xTrim(std::string_view key, long long count) { return xTrim(key, count, false); }
  };

  /**
   * @class HyperLogLogCommands
   *
   * @brief Probabilistic cardinality counting
   *
   */
  class HyperLogLogCommands {
   public:
    virtual ~HyperLogLogCommands() = default;

    /**
     * @brief Add values to the estimator at `key`
     *
     * @return 1 if the estimated cardinality changed, otherwise 0
     *
     */
    virtual long long pfAdd(std::string_view key, const Values &values) = 0;

    /**
     * @brief The estimated cardinality of the union of the estimators at `keys`
     *
     */
    virtual long long pfCount(const Keys &keys) = 0;
    virtual void pfMerge(std::string_view destKey, const Keys &sourceKeys) = 0;

    template <satisfies_stringview... Args>
      requires(sizeof...(Args) >= 1)
    long long pfAdd(std::string_view key, Args &&...values) {
      return pfAdd(key, toStrings(std::forward<Args>(values)...));
    }
  };

  /**
   * @class GeoCommands
   *
   * @brief Commands operating on geospatial indexes
   *
   */
  class GeoCommands {
   public:
    virtual ~GeoCommands() = default;

    /**
     * @return The number of members added; members whose position was only updated are not counted
     *
     */
    virtual long long geoAdd(std::string_view key, const std::vector<GeoLocation> &locations) = 0;

    /**
     * @return The distance between two members, or empty if either is missing
     *
     */
    virtual std::optional<Distance> geoDist(std::string_view key, std::string_view member1, std::string_view member2,
                                            GeoUnit unit) = 0;
    virtual std::vector<std::optional<Point>> geoPos(std::string_view key, const Values &members) = 0;
    virtual std::vector<GeoResult> geoSearch(std::string_view key, const GeoSearchArgs &args) = 0;

    long long geoAdd(std::string_view key, Point point, std::string_view member) {
      return geoAdd(key, {GeoLocation{std::string(member), point}});
    }

    std::optional<Distance> geoDist(std::string_view key, std::string_view member1, std::string_view member2) {
      return geoDist(key, member1, member2, GeoUnit::METERS);
    }
  };

  /**
   * @class PubSubCommands
   *
   * @brief Publishing and subscribing
   *
   * @details Subscribing turns the connection into a subscribed connection: every other command fails with
   * `RedisError` until the `Subscription` has ended. Further channels and patterns are added or dropped
   * through the `Subscription` returned by `getSubscription()`.
   *
   */
  class PubSubCommands {
   public:
    virtual ~PubSubCommands() = default;

    /**
     * @brief Post a message to a channel
     *
     * @return The number of clients that received the message
     *
     */
    virtual long long publish(std::string_view channel, std::string_view message) = 0;
    virtual void subscribe(MessageListener listener, const Keys &channels) = 0;
    virtual void pSubscribe(MessageListener listener, const Keys &patterns) = 0;
    [[nodiscard]] virtual bool isSubscribed() const = 0;
    [[nodiscard]] virtual std::shared_ptr<Subscription> getSubscription() const = 0;
  };

  /**
   * @class ScriptingCommands
   *
   * @brief Lua scripting
   *
   */
  class ScriptingCommands {
   public:
    virtual ~ScriptingCommands() = default;

    virtual void scriptFlush() = 0;
    virtual void scriptKill() = 0;
    virtual std::string scriptLoad(std::string_view script) = 0;
    virtual std::vector<bool> scriptExists(const std::vector<std::string> &scriptShas) = 0;

    /**
     * @brief Run a script
     *
     * @param script The Lua source
     * @param returnType How the result is to be interpreted
     * @param numKeys How many of `keysAndArgs` are keys
     * @param keysAndArgs Keys followed by arguments
     *
     * @return The script result, normalized to `returnType`
     *
     */
    virtual Reply eval(std::string_view script, ReturnType returnType, int numKeys, const Values &keysAndArgs) = 0;
    virtual Reply evalSha(std::string_view scriptSha, ReturnType returnType, int numKeys,
                          const Values &keysAndArgs) = 0;
  };

  /**
   * @class ServerCommands
   *
   * @brief Server administration
   *
   */
  class ServerCommands {
   public:
    virtual ~ServerCommands() = default;

    virtual std::string ping() = 0;
    virtual std::string echo(std::string_view message) = 0;
    virtual void select(int dbIndex) = 0;
    virtual long long dbSize() = 0;
    virtual void flushDb() = 0;
    virtual void flushAll() = 0;
    virtual Properties info() = 0;
    virtual Properties info(std::string_view section) = 0;

    /**
     * @brief The server clock in milliseconds since the epoch
     *
     */
    virtual std::chrono::milliseconds time() = 0;
    virtual long long lastSave() = 0;
    virtual void bgSave() = 0;
    virtual void bgReWriteAof() = 0;
    virtual void save() = 0;
    virtual Properties getConfig(std::string_view pattern) = 0;
    virtual void setConfig(std::string_view param, std::string_view value) = 0;
    virtual void resetConfigStats() = 0;
    virtual void clientSetName(std::string_view name) = 0;
    virtual std::optional<std::string> clientGetName() = 0;
    virtual std::vector<Properties> clientList() = 0;
    virtual void shutdown() = 0;
  };

  /**
   * @class TxCommands
   *
   * @brief `MULTI`/`EXEC` transactions
   *
   * @details Between `multi()` and `exec()` every command is queued by the server and returns a
   * value-initialized result; the real results are returned by `exec()`, one `Reply` per queued command.
   *
   */
  class TxCommands {
   public:
    virtual ~TxCommands() = default;

    virtual void multi() = 0;

    /**
     * @brief Execute the queued commands
     *
     * @return The results in command order, or an empty list if a watched key changed
     *
     */
    virtual std::vector<Reply> exec() = 0;
    virtual void discard() = 0;
    virtual void watch(const Keys &keys) = 0;
    virtual void unwatch() = 0;
  };

  /**
   * @class RedisConnection
   *
   * @brief A connection to a Redis server exposing every command group
   *
   * @details A connection is not thread-safe; share it between threads only with external locking, or use
   * a `ReactiveRedisConnection`, which serializes all commands on one worker thread.
   *
   */
  class RedisConnection : public KeyCommands,
                          public StringCommands,
                          public ListCommands,
                          public SetCommands,
                          public ZSetCommands,
                          public HashCommands,
                          public StreamCommands,
                          public HyperLogLogCommands,
                          public GeoCommands,
                          public PubSubCommands,
                          public ScriptingCommands,
                          public ServerCommands,
                          public TxCommands {
   public:
    ~RedisConnection() override = default;

    virtual void close() = 0;
    [[nodiscard]] virtual bool isClosed() const = 0;

    /**
     * @brief Start buffering commands instead of sending them one at a time
     *
     */
    virtual void openPipeline() = 0;

    /**
     * @brief Send every buffered command and read the replies
     *
     * @return One `Reply` per pipelined command. Throws `PipelineError`, which still carries every
     * result, if any of the commands failed.
     *
     */
    virtual std::vector<Reply> closePipeline() = 0;
    [[nodiscard]] virtual bool isPipelined() const = 0;
    [[nodiscard]] virtual bool isQueueing() const = 0;

    /**
     * @brief Run an arbitrary command
     *
     */
    virtual Reply execute(std::string_view command, const Values &args) = 0;

    /**
     * @brief The native driver behind this connection
     *
     */
    virtual NativeClient &nativeClient() = 0;
  };
};  // namespace RedisConn
