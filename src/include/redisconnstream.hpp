#pragma once
#include <charconv>
#include <chrono>
#include <cstdint>
#include <format>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "redisconnreply.hpp"
#include "redisconntypes.hpp"

namespace RedisConn {

  /**
   * @class RecordId
   *
   * @brief The id of a stream entry, `<millisecondsTime>-<sequenceNumber>`
   *
   * @details A `RecordId` is either a concrete id whose raw text always contains the `-` delimiter and
   * parses to two unsigned integers, or the auto-generate sentinel `*` which asks the server to assign the
   * id on `XADD`. A default-constructed `RecordId` is the sentinel.
   *
   */
  class RecordId {
   public:
    static constexpr auto GENERATE_ID = "*";
    static constexpr char DELIMITER = '-';

    RecordId() : raw{GENERATE_ID} {}

    /**
     * @brief Parse a record id
     *
     * @param value The raw id. An empty string or `*` gives the auto-generate sentinel
     *
     * @return The parsed `RecordId`. Throws `std::invalid_argument` if the value is malformed
     *
     */
    static RecordId of(std::string_view value) {
      if (value.empty() || value == GENERATE_ID) return autoGenerate();

      auto delim = value.find(DELIMITER);
      if (delim == std::string_view::npos) {
        throw std::invalid_argument(std::format(
            "Invalid id format '{}'. Please use the 'millisecondsTime-sequenceNumber' format.", value));
      }
      if (!parseComponent(value.substr(0, delim)).has_value() || !parseComponent(value.substr(delim + 1)).has_value()) {
        throw std::invalid_argument(std::format("Invalid id '{}': both components must be numeric", value));
      }
      return RecordId(std::string(value));
    }

    static RecordId of(uint64_t millisecondsTime, uint64_t sequenceNumber) {
      return RecordId(std::format("{}{}{}", millisecondsTime, DELIMITER, sequenceNumber));
    }

    static RecordId autoGenerate() { return RecordId(); }

    [[nodiscard]] std::optional<uint64_t> timestamp() const {
      if (shouldBeAutoGenerated()) return std::nullopt;
      return parseComponent(std::string_view(raw).substr(0, raw.find(DELIMITER)));
    }

    [[nodiscard]] std::optional<uint64_t> sequence() const {
      if (shouldBeAutoGenerated()) return std::nullopt;
      return parseComponent(std::string_view(raw).substr(raw.find(DELIMITER) + 1));
    }

    [[nodiscard]] bool shouldBeAutoGenerated() const noexcept { return raw == GENERATE_ID; }

    [[nodiscard]] const std::string &value() const noexcept { return raw; }

    friend bool operator==(const RecordId &, const RecordId &) = default;

   private:
    explicit RecordId(std::string raw_) : raw{std::move(raw_)} {}

    static std::optional<uint64_t> parseComponent(std::string_view part) {
      uint64_t result{0};
      auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), result);
      if (part.empty() || ec != std::errc{} || ptr != part.data() + part.size()) return std::nullopt;
      return result;
    }

    std::string raw;
  };

  /**
   * @class ReadOffset
   *
   * @brief Where a stream read starts: `$` (latest), `>` (last consumed by the group) or an explicit id
   *
   */
  class ReadOffset {
   public:
    static ReadOffset latest() { return ReadOffset("$"); }
    static ReadOffset lastConsumed() { return ReadOffset(">"); }

    static ReadOffset from(std::string_view offset) {
      if (offset.empty()) throw std::invalid_argument("Offset must not be empty");
      return ReadOffset(std::string(offset));
    }

    static ReadOffset from(const RecordId &offset) {
      if (offset.shouldBeAutoGenerated()) return latest();
      return from(offset.value());
    }

    [[nodiscard]] const std::string &offset() const noexcept { return value; }

    friend bool operator==(const ReadOffset &, const ReadOffset &) = default;

   private:
    explicit ReadOffset(std::string value_) : value{std::move(value_)} {}

    std::string value;
  };

  /**
   * @class Consumer
   *
   * @brief A consumer group member, identified by group name and consumer name
   *
   */
  class Consumer {
   public:
    static Consumer from(std::string_view group, std::string_view name) {
      if (group.empty()) throw std::invalid_argument("Group must not be empty");
      if (name.empty()) throw std::invalid_argument("Name must not be empty");
      return Consumer(std::string(group), std::string(name));
    }

    [[nodiscard]] const std::string &group() const noexcept { return groupName; }
    [[nodiscard]] const std::string &name() const noexcept { return consumerName; }

    [[nodiscard]] std::string toString() const { return std::format("{}:{}", groupName, consumerName); }

    friend bool operator==(const Consumer &, const Consumer &) = default;

   private:
    Consumer(std::string group_, std::string name_) : groupName{std::move(group_)}, consumerName{std::move(name_)} {}

    std::string groupName;
    std::string consumerName;
  };

  /**
   * @brief Options for `XREAD` and `XREADGROUP`
   *
   * @details Every modifier returns a new instance; an options object is never changed after
   * construction.
   *
   */
  class StreamReadOptions {
   public:
    static StreamReadOptions empty() { return StreamReadOptions{}; }

    [[nodiscard]] StreamReadOptions noack() const {
      auto o = *this;
      o.noAck = true;
      return o;
    }

    [[nodiscard]] StreamReadOptions block(std::chrono::milliseconds timeout) const {
      if (timeout.count() < 0) throw std::invalid_argument("Block timeout must not be negative");
      auto o = *this;
      o.blockMillis = timeout.count();
      return o;
    }

    [[nodiscard]] StreamReadOptions count(long long n) const {
      if (n <= 0) throw std::invalid_argument("Count must be greater than zero");
      auto o = *this;
      o.countValue = n;
      return o;
    }

    [[nodiscard]] std::optional<long long> getBlock() const noexcept { return blockMillis; }
    [[nodiscard]] std::optional<long long> getCount() const noexcept { return countValue; }
    [[nodiscard]] bool isNoack() const noexcept { return noAck; }
    [[nodiscard]] bool isBlocking() const noexcept { return blockMillis.has_value() && *blockMillis >= 0; }

    friend bool operator==(const StreamReadOptions &, const StreamReadOptions &) = default;

   private:
    std::optional<long long> blockMillis;
    std::optional<long long> countValue;
    bool noAck{false};
  };

  /**
   * @class MapRecord
   *
   * @brief A stream entry: the stream key, the entry id and its ordered field/value pairs
   *
   */
  template <typename K, typename V>
  class MapRecord {
   public:
    using Fields = std::vector<std::pair<K, V>>;

    MapRecord() = default;
    MapRecord(std::string stream_, RecordId id_, Fields fields_)
        : streamKey{std::move(stream_)}, recordId{std::move(id_)}, content{std::move(fields_)} {}

    [[nodiscard]] const std::string &stream() const noexcept { return streamKey; }
    [[nodiscard]] const RecordId &id() const noexcept { return recordId; }
    [[nodiscard]] const Fields &value() const noexcept { return content; }
    [[nodiscard]] std::size_t size() const noexcept { return content.size(); }

    [[nodiscard]] std::optional<V> get(const K &field) const {
      for (const auto &[k, v] : content) {
        if (k == field) return v;
      }
      return std::nullopt;
    }

    [[nodiscard]] MapRecord withId(RecordId id_) const { return MapRecord(streamKey, std::move(id_), content); }
    [[nodiscard]] MapRecord withStreamKey(std::string key) const { return MapRecord(std::move(key), recordId, content); }

    /**
     * @brief Produce a record of another field/value type by applying `fn` to every pair
     *
     */
    template <typename Fn>
    [[nodiscard]] auto mapEntries(Fn &&fn) const {
      using Pair = std::invoke_result_t<Fn, const K &, const V &>;
      typename MapRecord<typename Pair::first_type, typename Pair::second_type>::Fields mapped;
      mapped.reserve(content.size());
      for (const auto &[k, v] : content) mapped.push_back(fn(k, v));
      return MapRecord<typename Pair::first_type, typename Pair::second_type>(streamKey, recordId, std::move(mapped));
    }

    friend bool operator==(const MapRecord &, const MapRecord &) = default;

   private:
    std::string streamKey;
    RecordId recordId;
    Fields content;
  };

  using ByteRecord = MapRecord<std::string, std::string>;
  using StringRecord = MapRecord<std::string, std::string>;

  /**
   * @brief Fluent construction of stream records
   *
   * @details `StreamRecords::newRecord().in("mystream").withId(RecordId::of(1, 0)).ofMap(fields)`
   *
   */
  class StreamRecords {
   public:
    class RecordBuilder {
     public:
      [[nodiscard]] RecordBuilder in(std::string_view stream) const {
        auto b = *this;
        b.streamKey = std::string(stream);
        return b;
      }

      [[nodiscard]] RecordBuilder withId(RecordId id) const {
        auto b = *this;
        b.recordId = std::move(id);
        return b;
      }

      [[nodiscard]] RecordBuilder withId(std::string_view id) const { return withId(RecordId::of(id)); }

      template <typename K, typename V>
      [[nodiscard]] MapRecord<K, V> ofMap(std::vector<std::pair<K, V>> fields) const {
        return MapRecord<K, V>(streamKey, recordId, std::move(fields));
      }

      [[nodiscard]] ByteRecord ofStrings(std::initializer_list<std::pair<std::string, std::string>> fields) const {
        return ByteRecord(streamKey, recordId, ByteRecord::Fields(fields));
      }

     private:
      std::string streamKey;
      RecordId recordId;
    };

    static RecordBuilder newRecord() { return RecordBuilder{}; }
  };

  /**
   * @class StreamOffset
   *
   * @brief A read cursor: a stream key paired with the `ReadOffset` to read from
   *
   */
  class StreamOffset {
   public:
    static StreamOffset create(std::string_view key, ReadOffset offset) {
      if (key.empty()) throw std::invalid_argument("Stream key must not be empty");
      return StreamOffset(std::string(key), std::move(offset));
    }

    static StreamOffset latest(std::string_view key) { return create(key, ReadOffset::latest()); }
    static StreamOffset fromStart(std::string_view key) { return create(key, ReadOffset::from("0-0")); }

    template <typename K, typename V>
    static StreamOffset of(const MapRecord<K, V> &reference) {
      return create(reference.stream(), ReadOffset::from(reference.id()));
    }

    [[nodiscard]] const std::string &key() const noexcept { return streamKey; }
    [[nodiscard]] const ReadOffset &offset() const noexcept { return readOffset; }

    friend bool operator==(const StreamOffset &, const StreamOffset &) = default;

   private:
    StreamOffset(std::string key_, ReadOffset offset_) : streamKey{std::move(key_)}, readOffset{std::move(offset_)} {}

    std::string streamKey;
    ReadOffset readOffset;
  };

  /**
   * @brief Options for `XADD`
   *
   */
  class XAddOptions {
   public:
    static XAddOptions none() { return XAddOptions{}; }

    [[nodiscard]] XAddOptions maxlen(long long n) const {
      if (n < 0) throw std::invalid_argument(std::format("Maxlen must not be negative, was {}", n));
      auto o = *this;
      o.maxLength = n;
      return o;
    }

    [[nodiscard]] XAddOptions approximateTrimming(bool approximate) const {
      auto o = *this;
      o.approximate = approximate;
      return o;
    }

    [[nodiscard]] XAddOptions makeNoStream() const {
      auto o = *this;
      o.noMkStream = true;
      return o;
    }

    [[nodiscard]] bool hasMaxlen() const noexcept { return maxLength.has_value(); }
    [[nodiscard]] std::optional<long long> getMaxlen() const noexcept { return maxLength; }
    [[nodiscard]] bool isApproximateTrimming() const noexcept { return approximate; }
    [[nodiscard]] bool isNoMkStream() const noexcept { return noMkStream; }

   private:
    std::optional<long long> maxLength;
    bool approximate{false};
    bool noMkStream{false};
  };

  /**
   * @brief Options for `XCLAIM`
   *
   */
  class XClaimOptions {
   public:
    static XClaimOptions minIdle(std::chrono::milliseconds minIdleTime) {
      XClaimOptions o;
      o.minIdleTime = minIdleTime;
      return o;
    }

    [[nodiscard]] XClaimOptions ids(std::vector<RecordId> recordIds) const {
      auto o = *this;
      o.recordIds.insert(o.recordIds.end(), recordIds.begin(), recordIds.end());
      return o;
    }

    [[nodiscard]] XClaimOptions ids(std::initializer_list<std::string_view> recordIds) const {
      std::vector<RecordId> parsed;
      for (auto id : recordIds) parsed.push_back(RecordId::of(id));
      return ids(std::move(parsed));
    }

    [[nodiscard]] XClaimOptions idle(std::chrono::milliseconds idleTime) const {
      auto o = *this;
      o.idleTime = idleTime;
      return o;
    }

    [[nodiscard]] XClaimOptions time(std::chrono::milliseconds unixTime) const {
      auto o = *this;
      o.unixTime = unixTime;
      return o;
    }

    [[nodiscard]] XClaimOptions retryCount(long long count) const {
      auto o = *this;
      o.retries = count;
      return o;
    }

    [[nodiscard]] XClaimOptions force() const {
      auto o = *this;
      o.forced = true;
      return o;
    }

    [[nodiscard]] const std::vector<RecordId> &getIds() const noexcept { return recordIds; }
    [[nodiscard]] std::chrono::milliseconds getMinIdleTime() const noexcept { return minIdleTime; }
    [[nodiscard]] std::optional<std::chrono::milliseconds> getIdleTime() const noexcept { return idleTime; }
    [[nodiscard]] std::optional<std::chrono::milliseconds> getUnixTime() const noexcept { return unixTime; }
    [[nodiscard]] std::optional<long long> getRetryCount() const noexcept { return retries; }
    [[nodiscard]] bool isForce() const noexcept { return forced; }

   private:
    std::vector<RecordId> recordIds;
    std::chrono::milliseconds minIdleTime{0};
    std::optional<std::chrono::milliseconds> idleTime;
    std::optional<std::chrono::milliseconds> unixTime;
    std::optional<long long> retries;
    bool forced{false};
  };

  /**
   * @brief Options for the extended form of `XPENDING`
   *
   */
  class XPendingOptions {
   public:
    static XPendingOptions unbounded() { return range(Range<std::string>::unbounded(), -1); }
    static XPendingOptions unbounded(long long count) { return range(Range<std::string>::unbounded(), count); }

    static XPendingOptions range(Range<std::string> idRange, long long count) {
      XPendingOptions o;
      o.idRange = std::move(idRange);
      o.countValue = count;
      return o;
    }

    [[nodiscard]] XPendingOptions consumer(std::string_view name) const {
      auto o = *this;
      o.consumerName = std::string(name);
      return o;
    }

    [[nodiscard]] XPendingOptions minIdle(std::chrono::milliseconds idle) const {
      auto o = *this;
      o.minIdleTime = idle;
      return o;
    }

    [[nodiscard]] const Range<std::string> &getRange() const noexcept { return idRange; }
    [[nodiscard]] long long getCount() const noexcept { return countValue; }
    [[nodiscard]] bool isLimited() const noexcept { return countValue > -1; }
    [[nodiscard]] const std::optional<std::string> &getConsumerName() const noexcept { return consumerName; }
    [[nodiscard]] bool hasConsumer() const noexcept { return consumerName.has_value(); }
    [[nodiscard]] std::optional<std::chrono::milliseconds> getMinIdleTime() const noexcept { return minIdleTime; }

   private:
    XPendingOptions() : idRange{Range<std::string>::unbounded()} {}

    Range<std::string> idRange;
    long long countValue{-1};
    std::optional<std::string> consumerName;
    std::optional<std::chrono::milliseconds> minIdleTime;
  };

  /**
   * @brief The reply of the short form of `XPENDING`
   *
   */
  struct PendingMessagesSummary {
    std::string groupName;
    long long totalPendingMessages{0};
    std::optional<std::string> lowestId;
    std::optional<std::string> highestId;
    std::vector<std::pair<std::string, long long>> pendingMessagesPerConsumer;

    [[nodiscard]] Range<std::string> idRange() const {
      if (!lowestId.has_value() || !highestId.has_value()) return Range<std::string>::unbounded();
      return Range<std::string>::closed(*lowestId, *highestId);
    }
  };

  /**
   * @brief A single entry of the extended `XPENDING` reply
   *
   */
  struct PendingMessage {
    RecordId id;
    std::string consumerName;
    std::string groupName;
    std::chrono::milliseconds elapsedTimeSinceLastDelivery{0};
    long long totalDeliveryCount{0};

    [[nodiscard]] Consumer consumer() const { return Consumer::from(groupName, consumerName); }
  };

  /**
   * @brief The reply of the extended form of `XPENDING`
   *
   */
  class PendingMessages {
   public:
    PendingMessages() : idRange{Range<std::string>::unbounded()} {}
    PendingMessages(std::string group, Range<std::string> range, std::vector<PendingMessage> messages_)
        : groupName{std::move(group)}, idRange{std::move(range)}, messages{std::move(messages_)} {}

    [[nodiscard]] const std::string &group() const noexcept { return groupName; }
    [[nodiscard]] const Range<std::string> &range() const noexcept { return idRange; }
    [[nodiscard]] std::size_t size() const noexcept { return messages.size(); }
    [[nodiscard]] bool isEmpty() const noexcept { return messages.empty(); }
    [[nodiscard]] const PendingMessage &get(std::size_t index) const { return messages.at(index); }
    [[nodiscard]] auto begin() const noexcept { return messages.begin(); }
    [[nodiscard]] auto end() const noexcept { return messages.end(); }

   private:
    std::string groupName;
    Range<std::string> idRange;
    std::vector<PendingMessage> messages;
  };

  /**
   * @brief Common base of the `XINFO` views: the flattened key/value reply
   *
   */
  class XInfoObject {
   public:
    XInfoObject() = default;
    explicit XInfoObject(const Reply &source) {
      for (auto i{0u}; i + 1 < source.elements.size(); i += 2) {
        raw.emplace_back(source.elements[i].str, source.elements[i + 1]);
      }
    }

    [[nodiscard]] const Reply *get(std::string_view key) const {
      for (const auto &[k, v] : raw) {
        if (k == key) return &v;
      }
      return nullptr;
    }

    [[nodiscard]] std::optional<long long> getLong(std::string_view key) const {
      auto *r = get(key);
      if (r == nullptr || r->isNil()) return std::nullopt;
      if (r->isInteger()) return r->integer;
      long long result{0};
      auto [ptr, ec] = std::from_chars(r->str.data(), r->str.data() + r->str.size(), result);
      if (ec != std::errc{}) return std::nullopt;
      return result;
    }

    [[nodiscard]] std::optional<std::string> getString(std::string_view key) const {
      auto *r = get(key);
      if (r == nullptr || r->isNil()) return std::nullopt;
      if (r->isInteger()) return std::to_string(r->integer);
      return r->str;
    }

    [[nodiscard]] const std::vector<std::pair<std::string, Reply>> &getRaw() const noexcept { return raw; }

   protected:
    std::vector<std::pair<std::string, Reply>> raw;
  };

  /**
   * @brief `XINFO STREAM`
   *
   */
  class XInfoStream : public XInfoObject {
   public:
    XInfoStream() = default;
    explicit XInfoStream(const Reply &source) : XInfoObject(source) {}

    [[nodiscard]] std::optional<long long> streamLength() const { return getLong("length"); }
    [[nodiscard]] std::optional<long long> radixTreeKeySize() const { return getLong("radix-tree-keys"); }
    [[nodiscard]] std::optional<long long> radixTreeNodesSize() const { return getLong("radix-tree-nodes"); }
    [[nodiscard]] std::optional<long long> groupCount() const { return getLong("groups"); }
    [[nodiscard]] std::optional<std::string> lastGeneratedId() const { return getString("last-generated-id"); }

    [[nodiscard]] std::optional<std::string> firstEntryId() const { return entryId("first-entry"); }
    [[nodiscard]] std::optional<std::string> lastEntryId() const { return entryId("last-entry"); }
    [[nodiscard]] ByteRecord::Fields firstEntry() const { return entryFields("first-entry"); }
    [[nodiscard]] ByteRecord::Fields lastEntry() const { return entryFields("last-entry"); }

   private:
    std::optional<std::string> entryId(std::string_view key) const {
      auto *entry = get(key);
      if (entry == nullptr || entry->elements.size() < 2) return std::nullopt;
      return entry->elements[0].str;
    }

    ByteRecord::Fields entryFields(std::string_view key) const {
      ByteRecord::Fields fields;
      auto *entry = get(key);
      if (entry == nullptr || entry->elements.size() < 2) return fields;
      const auto &kv = entry->elements[1].elements;
      for (auto i{0u}; i + 1 < kv.size(); i += 2) {
        fields.emplace_back(kv[i].str, kv[i + 1].str);
      }
      return fields;
    }
  };

  /**
   * @brief One element of `XINFO GROUPS`
   *
   */
  class XInfoGroup : public XInfoObject {
   public:
    XInfoGroup() = default;
    explicit XInfoGroup(const Reply &source) : XInfoObject(source) {}

    [[nodiscard]] std::optional<std::string> groupName() const { return getString("name"); }
    [[nodiscard]] std::optional<long long> consumerCount() const { return getLong("consumers"); }
    [[nodiscard]] std::optional<long long> pendingCount() const { return getLong("pending"); }
    [[nodiscard]] std::optional<std::string> lastDeliveredId() const { return getString("last-delivered-id"); }
  };

  class XInfoGroups {
   public:
    XInfoGroups() = default;
    explicit XInfoGroups(const Reply &source) {
      for (const auto &g : source.elements) groups.emplace_back(g);
    }

    [[nodiscard]] std::size_t groupCount() const noexcept { return groups.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return groups.size(); }
    [[nodiscard]] bool isEmpty() const noexcept { return groups.empty(); }
    [[nodiscard]] const XInfoGroup &get(std::size_t index) const { return groups.at(index); }
    [[nodiscard]] auto begin() const noexcept { return groups.begin(); }
    [[nodiscard]] auto end() const noexcept { return groups.end(); }

   private:
    std::vector<XInfoGroup> groups;
  };

  /**
   * @brief One element of `XINFO CONSUMERS`
   *
   */
  class XInfoConsumer : public XInfoObject {
   public:
    XInfoConsumer() = default;
    XInfoConsumer(std::string group, const Reply &source) : XInfoObject(source), group{std::move(group)} {}

    [[nodiscard]] const std::string &groupName() const noexcept { return group; }
    [[nodiscard]] std::optional<std::string> consumerName() const { return getString("name"); }
    [[nodiscard]] std::optional<long long> idleTimeMs() const { return getLong("idle"); }
    [[nodiscard]] std::optional<std::chrono::milliseconds> idleTime() const {
      auto idle = idleTimeMs();
      if (!idle.has_value()) return std::nullopt;
      return std::chrono::milliseconds{*idle};
    }
    [[nodiscard]] std::optional<long long> pendingCount() const { return getLong("pending"); }

   private:
    std::string group;
  };

  class XInfoConsumers {
   public:
    XInfoConsumers() = default;
    XInfoConsumers(std::string group, const Reply &source) : groupName{std::move(group)} {
      for (const auto &c : source.elements) consumers.emplace_back(groupName, c);
    }

    [[nodiscard]] const std::string &group() const noexcept { return groupName; }
    [[nodiscard]] std::size_t consumerCount() const noexcept { return consumers.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return consumers.size(); }
    [[nodiscard]] bool isEmpty() const noexcept { return consumers.empty(); }
    [[nodiscard]] const XInfoConsumer &get(std::size_t index) const { return consumers.at(index); }
    [[nodiscard]] auto begin() const noexcept { return consumers.begin(); }
    [[nodiscard]] auto end() const noexcept { return consumers.end(); }

   private:
    std::string groupName;
    std::vector<XInfoConsumer> consumers;
  };
};  // namespace RedisConn
